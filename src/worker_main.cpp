#include "detection_model.hpp"
#include "worker_server.hpp"
#include <iostream>
#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <random>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_stop{false};

void handle_signal(int) {
    g_stop = true;
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n"
              << "Options:\n"
              << "  --host ADDR        Listen address (default: 0.0.0.0)\n"
              << "  -p, --port NUM     Listen port, 0 for any (default: 8001)\n"
              << "  --path PATH        Detection endpoint path (default: /)\n"
              << "  --seed NUM         Seed for the simulated model\n"
              << "  --max-count NUM    Largest simulated count (default: 5)\n"
              << "  --latency-ms NUM   Simulated inference latency (default: 0)\n"
              << "  -h, --help         Show this help\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string host = "0.0.0.0";
    int port = 8001;
    std::string path = "/";
    unsigned int seed = std::random_device{}();
    int max_count = 5;
    int latency_ms = 0;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--host") {
                if (++i < argc) host = argv[i];
            } else if (arg == "-p" || arg == "--port") {
                if (++i < argc) port = std::stoi(argv[i]);
            } else if (arg == "--path") {
                if (++i < argc) path = argv[i];
            } else if (arg == "--seed") {
                if (++i < argc) seed = static_cast<unsigned int>(std::stoul(argv[i]));
            } else if (arg == "--max-count") {
                if (++i < argc) max_count = std::stoi(argv[i]);
            } else if (arg == "--latency-ms") {
                if (++i < argc) latency_ms = std::stoi(argv[i]);
            } else if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Error: Unknown option " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }

        // No model weights ship with this build; serve simulated counts.
        std::cout << "Warning: no detection model loaded, using simulated counts" << std::endl;
        auto model = std::make_shared<vidcount::SimulatedDetectionModel>(
            seed, max_count, std::chrono::milliseconds(latency_ms));

        vidcount::WorkerServer server(model, host, port, path);
        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        server.start();
        while (!g_stop) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        server.stop();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
