#include "worker_server.hpp"
#include "base64.hpp"
#include "console.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace vidcount {

struct WorkerServer::Impl {
    httplib::Server svr;
};

WorkerServer::WorkerServer(std::shared_ptr<DetectionModel> model,
                           std::string host,
                           int port,
                           std::string path)
    : impl_(std::make_unique<Impl>()),
      model_(std::move(model)),
      host_(std::move(host)),
      port_(port),
      path_(std::move(path)) {
    if (!model_) {
        throw std::invalid_argument("WorkerServer requires a detection model");
    }
}

WorkerServer::~WorkerServer() {
    stop();
}

int WorkerServer::handle_detect(const std::string& request_body, std::string& response_body) {
    json request = json::parse(request_body, nullptr, false);
    if (request.is_discarded() || !request.is_object()) {
        response_body = json{{"error", "invalid json"}}.dump();
        return 400;
    }
    if (!request.contains("image_data") || !request["image_data"].is_string()) {
        response_body = json{{"error", "missing image_data"}}.dump();
        return 400;
    }

    std::string filename = "frame.jpg";
    if (request.contains("filename") && request["filename"].is_string()) {
        filename = request["filename"].get<std::string>();
    }

    auto image = base64_decode(request["image_data"].get<std::string>());
    if (!image || image->empty()) {
        response_body = json{{"error", "Invalid base64 image data"}, {"filename", filename}}.dump();
        return 400;
    }

    try {
        const int count = model_->count_objects(*image);
        log_info("worker", filename + ": " + std::to_string(count) + " objects");
        response_body = json{{"garbage_count", count},
                             {"filename", filename},
                             {"message", "Processed " + filename}}.dump();
    } catch (const std::exception& e) {
        log_error("worker", "Prediction failed for " + filename + ": " + e.what());
        response_body = json{{"error", std::string("Prediction failed: ") + e.what()},
                             {"filename", filename}}.dump();
    }
    return 200;
}

int WorkerServer::start() {
    if (running_) return port_;

    impl_->svr.Post(path_, [this](const httplib::Request& req, httplib::Response& res) {
        std::string body;
        res.status = handle_detect(req.body, body);
        res.set_content(body, "application/json");
    });

    impl_->svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(json{{"status", "healthy"}}.dump(), "application/json");
    });

    impl_->svr.Get("/", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(json{{"status", "running"},
                             {"service", "vidcount_worker"},
                             {"model", model_->name()},
                             {"model_available", !model_->is_simulated()}}.dump(),
                        "application/json");
    });

    if (port_ == 0) {
        port_ = impl_->svr.bind_to_any_port(host_.c_str());
        if (port_ < 0) {
            throw std::runtime_error("Cannot bind worker server on " + host_);
        }
    } else if (!impl_->svr.bind_to_port(host_.c_str(), port_)) {
        throw std::runtime_error("Cannot bind worker server on " + host_ + ":" + std::to_string(port_));
    }

    running_ = true;
    server_thread_ = std::thread([this] {
        log_info("worker", "Serving " + model_->name() + " model on http://" + host_ + ":" +
                               std::to_string(port_) + path_);
        impl_->svr.listen_after_bind();
    });
    impl_->svr.wait_until_ready();
    return port_;
}

void WorkerServer::stop() {
    if (!running_) return;
    running_ = false;

    impl_->svr.stop();
    if (server_thread_.joinable()) server_thread_.join();
    log_info("worker", "Server stopped.");
}

} // namespace vidcount
