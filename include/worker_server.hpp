#pragma once

#include "detection_model.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace vidcount {

// HTTP front end for a DetectionModel speaking the worker protocol:
//   POST <path>   {"image_data": <base64>, "filename": <name>}
//                 -> {"garbage_count": n, "filename": ..., "message": ...}
//   GET  /health  -> {"status": "healthy"}
//   GET  /        -> service status
class WorkerServer {
public:
    WorkerServer(std::shared_ptr<DetectionModel> model,
                 std::string host = "0.0.0.0",
                 int port = 8001,
                 std::string path = "/");
    ~WorkerServer();

    WorkerServer(const WorkerServer&) = delete;
    WorkerServer& operator=(const WorkerServer&) = delete;

    // Binds and serves on a background thread. Port 0 picks a free port.
    // Returns the bound port; throws std::runtime_error if binding fails.
    int start();
    void stop();

    bool running() const { return running_; }
    int port() const { return port_; }
    const std::string& host() const { return host_; }

    // Handles one request body; exposed so the protocol can be exercised
    // without sockets. Returns the HTTP status and fills response_body.
    int handle_detect(const std::string& request_body, std::string& response_body);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    std::shared_ptr<DetectionModel> model_;
    std::string host_;
    int port_;
    std::string path_;
    std::atomic<bool> running_{false};
    std::thread server_thread_;
};

} // namespace vidcount
