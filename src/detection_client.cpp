#include "detection_client.hpp"
#include "base64.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

using json = nlohmann::json;

namespace vidcount {

namespace {

bool is_gateway_status(int status) {
    return status == 502 || status == 503 || status == 504;
}

std::string snippet(const std::string& body) {
    constexpr size_t kMax = 120;
    if (body.size() <= kMax) return body;
    return body.substr(0, kMax) + "...";
}

} // namespace

std::string build_worker_request(const Frame& frame) {
    json payload;
    payload["image_data"] = base64_encode(load_frame_bytes(frame));
    payload["filename"] = frame.name;
    return payload.dump();
}

FrameOutcome parse_worker_response(const Frame& frame,
                                   int http_status,
                                   const std::string& body,
                                   const std::string& count_field) {
    const std::string status_text = "HTTP " + std::to_string(http_status);

    json reply = json::parse(body, nullptr, false);
    if (reply.is_discarded() || !reply.is_object()) {
        if (is_gateway_status(http_status)) {
            return FrameOutcome::failure(frame, ErrorKind::WorkerUnreachable,
                                         "worker unavailable (" + status_text + ")");
        }
        return FrameOutcome::failure(frame, ErrorKind::MalformedWorkerResponse,
                                     "non-JSON response from worker (" + status_text + "): " +
                                     snippet(body));
    }

    if (reply.contains("error") && !reply["error"].is_null()) {
        if (reply["error"].is_string()) {
            return FrameOutcome::failure(frame, ErrorKind::WorkerRejectedFrame,
                                         reply["error"].get<std::string>());
        }
        return FrameOutcome::failure(frame, ErrorKind::MalformedWorkerResponse,
                                     "error field is not a string (" + status_text + ")");
    }

    if (is_gateway_status(http_status)) {
        return FrameOutcome::failure(frame, ErrorKind::WorkerUnreachable,
                                     "worker unavailable (" + status_text + ")");
    }
    if (http_status < 200 || http_status >= 300) {
        return FrameOutcome::failure(frame, ErrorKind::MalformedWorkerResponse,
                                     status_text + " without an error payload");
    }

    if (!reply.contains(count_field)) {
        return FrameOutcome::failure(frame, ErrorKind::MalformedWorkerResponse,
                                     "response has no '" + count_field + "' field");
    }

    const json& value = reply[count_field];
    if (!value.is_number_integer()) {
        return FrameOutcome::failure(frame, ErrorKind::MalformedWorkerResponse,
                                     "'" + count_field + "' is not an integer: " + value.dump());
    }

    const int64_t kMaxCount = std::numeric_limits<int>::max();
    if (value.is_number_unsigned()) {
        const uint64_t count = value.get<uint64_t>();
        if (count > static_cast<uint64_t>(kMaxCount)) {
            return FrameOutcome::failure(frame, ErrorKind::MalformedWorkerResponse,
                                         "'" + count_field + "' out of range: " + value.dump());
        }
        return FrameOutcome::success(frame, static_cast<int>(count));
    }

    const int64_t count = value.get<int64_t>();
    if (count < 0 || count > kMaxCount) {
        return FrameOutcome::failure(frame, ErrorKind::MalformedWorkerResponse,
                                     "'" + count_field + "' must be a non-negative count: " +
                                     value.dump());
    }
    return FrameOutcome::success(frame, static_cast<int>(count));
}

// Reading waits on the model, so it gets half; connect and write split the rest.
TimeoutBudget split_timeout(std::chrono::milliseconds timeout) {
    using std::chrono::milliseconds;
    TimeoutBudget budget;
    if (timeout.count() < 3) {
        budget.connect = budget.write = budget.read = milliseconds(1);
        return budget;
    }
    budget.connect = milliseconds(timeout.count() / 4);
    budget.write = milliseconds(timeout.count() / 4);
    budget.read = timeout - budget.connect - budget.write;
    return budget;
}

FrameOutcome HttpDetectionClient::detect(const Frame& frame,
                                         const WorkerEndpoint& endpoint,
                                         std::chrono::milliseconds timeout) {
    std::string body;
    try {
        body = build_worker_request(frame);
    } catch (const PipelineError& e) {
        return FrameOutcome::failure(frame, e.kind(), e.what());
    }

    const TimeoutBudget budget = split_timeout(timeout);
    httplib::Client cli(endpoint.host, endpoint.port);
    cli.set_connection_timeout(budget.connect);
    cli.set_write_timeout(budget.write);
    cli.set_read_timeout(budget.read);
    cli.set_keep_alive(false);

    auto res = cli.Post(endpoint.path, body, "application/json");
    if (!res) {
        return FrameOutcome::failure(frame, ErrorKind::WorkerUnreachable,
                                     "request to " + endpoint.to_string() + " failed: " +
                                     httplib::to_string(res.error()));
    }
    return parse_worker_response(frame, res->status, res->body, endpoint.count_field);
}

LocalDetectionClient::LocalDetectionClient(std::shared_ptr<DetectionModel> model)
    : model_(std::move(model)) {
    if (!model_) {
        throw std::invalid_argument("LocalDetectionClient requires a model");
    }
}

FrameOutcome LocalDetectionClient::detect(const Frame& frame,
                                          const WorkerEndpoint& /*endpoint*/,
                                          std::chrono::milliseconds /*timeout*/) {
    std::vector<unsigned char> bytes;
    try {
        bytes = load_frame_bytes(frame);
    } catch (const PipelineError& e) {
        return FrameOutcome::failure(frame, e.kind(), e.what());
    }

    try {
        const int count = model_->count_objects(bytes);
        if (count < 0) {
            return FrameOutcome::failure(frame, ErrorKind::MalformedWorkerResponse,
                                         "model returned a negative count: " + std::to_string(count));
        }
        return FrameOutcome::success(frame, count);
    } catch (const std::exception& e) {
        return FrameOutcome::failure(frame, ErrorKind::WorkerRejectedFrame,
                                     "Prediction failed: " + std::string(e.what()));
    }
}

} // namespace vidcount
