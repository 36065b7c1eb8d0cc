#include "pipeline_config.hpp"
#include "video_pipeline.hpp"
#include <iostream>
#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

std::atomic<bool> g_interrupted{false};

void handle_sigint(int) {
    g_interrupted = true;
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] VIDEO_PATH\n"
              << "Options:\n"
              << "  -s, --step SEC          Seconds between sampled frames (default: 1)\n"
              << "  -f, --max-frames NUM    Stop after NUM frames (default: all)\n"
              << "  -w, --worker URL        Detection worker (default: http://localhost:8001/)\n"
              << "  --count-field NAME      Count field in worker replies (default: garbage_count)\n"
              << "  -c, --concurrency NUM   Requests in flight (default: 2)\n"
              << "  -r, --retries NUM       Retries per frame for unreachable workers (default: 2)\n"
              << "  --timeout-ms NUM        Per-request timeout (default: 30000)\n"
              << "  --tool NAME             Frame extraction: auto, ffmpeg, opencv (default: auto)\n"
              << "  --scratch-dir DIR       Parent for temporary frame directories\n"
              << "  --simulate              Score frames with the built-in simulated model\n"
              << "  --fail-on-total-failure Exit with an error when every frame failed\n"
              << "  --config FILE           JSON configuration file\n"
              << "  --output FILE           Output JSON file\n"
              << "  --info                  Show video information only\n"
              << "  -q, --quiet             Only print the final JSON\n"
              << "  -h, --help              Show this help\n"
              << "Environment: INPUT_PATH, STEP, WORKER_URL, MAX_FRAMES,\n"
              << "             VIDCOUNT_CONCURRENCY, VIDCOUNT_RETRIES\n";
}

void write_output(const json& output, const std::string& output_file) {
    if (output_file.empty()) {
        std::cout << output.dump(2) << std::endl;
        return;
    }
    std::ofstream file(output_file);
    if (!file) {
        throw std::runtime_error("Cannot write output file: " + output_file);
    }
    file << output.dump(2);
    std::cout << "Results saved to: " << output_file << std::endl;
}

json error_json(const std::string& kind, const std::string& message) {
    json j;
    j["ok"] = false;
    j["error_kind"] = kind;
    j["error"] = message;
    return j;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string output_file;
    bool info_only = false;

    try {
        // Config file first, then environment, then command line.
        std::string config_path;
        for (int i = 1; i < argc; ++i) {
            if (std::string(argv[i]) == "--config" && i + 1 < argc) config_path = argv[i + 1];
        }
        vidcount::PipelineConfig config = config_path.empty() ? vidcount::PipelineConfig{}
                                                              : vidcount::load_config_json(config_path);
        vidcount::apply_env_overrides(config);

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-s" || arg == "--step") {
                if (++i < argc) config.sampling.interval_seconds = vidcount::parse_step(argv[i]);
            } else if (arg == "-f" || arg == "--max-frames") {
                if (++i < argc) config.sampling.max_frames = vidcount::parse_count(argv[i], "--max-frames");
            } else if (arg == "-w" || arg == "--worker") {
                if (++i < argc) {
                    const std::string field = config.worker.count_field;
                    config.worker = vidcount::WorkerEndpoint::parse(argv[i]);
                    config.worker.count_field = field;
                }
            } else if (arg == "--count-field") {
                if (++i < argc) config.worker.count_field = argv[i];
            } else if (arg == "-c" || arg == "--concurrency") {
                if (++i < argc) config.dispatch.concurrency_limit = vidcount::parse_count(argv[i], "--concurrency");
            } else if (arg == "-r" || arg == "--retries") {
                if (++i < argc) config.dispatch.retry.per_frame_retries = vidcount::parse_count(argv[i], "--retries");
            } else if (arg == "--timeout-ms") {
                if (++i < argc) {
                    config.dispatch.timeout =
                        std::chrono::milliseconds(vidcount::parse_count(argv[i], "--timeout-ms"));
                }
            } else if (arg == "--tool") {
                if (++i < argc) config.extraction_tool = argv[i];
            } else if (arg == "--scratch-dir") {
                if (++i < argc) config.scratch_root = argv[i];
            } else if (arg == "--simulate") {
                config.simulate = true;
            } else if (arg == "--fail-on-total-failure") {
                config.fail_on_total_failure = true;
            } else if (arg == "--config") {
                ++i;
            } else if (arg == "--output") {
                if (++i < argc) output_file = argv[i];
            } else if (arg == "--info") {
                info_only = true;
            } else if (arg == "-q" || arg == "--quiet") {
                config.quiet = true;
            } else if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if (!arg.empty() && arg[0] == '-') {
                std::cerr << "Error: Unknown option " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            } else {
                config.video_path = arg;
            }
        }

        if (config.video_path.empty()) {
            std::cerr << "Error: No video path provided\n";
            print_usage(argv[0]);
            return 1;
        }

        if (info_only) {
            auto info = vidcount::get_video_info(config.video_path);

            json info_json;
            info_json["video_path"] = config.video_path;
            info_json["total_frames"] = info.total_frames;
            info_json["fps"] = info.fps;
            info_json["duration"] = info.duration;
            info_json["frame_size"] = {info.frame_size.width, info.frame_size.height};
            info_json["codec"] = info.codec;
            info_json["expected_samples"] =
                vidcount::expected_sample_count(info.duration, config.sampling.interval_seconds);

            write_output(info_json, output_file);
            return 0;
        }

        config.validate();
        if (!config.quiet) {
            std::cout << "Configuration: " << vidcount::config_to_json(config).dump() << std::endl;
        }

        auto video = vidcount::VideoSource::open(config.video_path);
        vidcount::VideoPipeline pipeline(config);

        // Ctrl-C cancels the run; frames already scored still make the report.
        vidcount::CancellationToken cancel;
        std::signal(SIGINT, handle_sigint);
        std::atomic<bool> finished{false};
        std::thread watcher([&] {
            while (!finished) {
                if (g_interrupted) {
                    cancel.cancel();
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });

        auto start_time = std::chrono::high_resolution_clock::now();
        json output_json;
        try {
            auto report = pipeline.run(video, vidcount::make_request(config), cancel);
            output_json = vidcount::report_to_json(report);
        } catch (...) {
            finished = true;
            watcher.join();
            throw;
        }
        finished = true;
        watcher.join();

        auto total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::high_resolution_clock::now() - start_time);
        output_json["video_path"] = config.video_path;
        output_json["total_time_ms"] = total_time.count();

        write_output(output_json, output_file);

    } catch (const vidcount::PipelineError& e) {
        std::cout << error_json(vidcount::to_string(e.kind()), e.what()).dump(2) << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
