#pragma once

#include "detection_model.hpp"
#include "frame_types.hpp"
#include "worker_endpoint.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace vidcount {

// Scores one frame with one attempt. Frame-level failures are returned in
// the outcome, never thrown. That includes ExtractionFailed when the frame
// image cannot be read at dispatch time. Calls are idempotent and may be
// issued concurrently from several threads.
class DetectionClient {
public:
    virtual ~DetectionClient() = default;

    virtual FrameOutcome detect(const Frame& frame,
                                const WorkerEndpoint& endpoint,
                                std::chrono::milliseconds timeout) = 0;
};

// Per-phase httplib timeouts carved out of one attempt budget. The three
// phases together never exceed the budget.
struct TimeoutBudget {
    std::chrono::milliseconds connect{0};
    std::chrono::milliseconds write{0};
    std::chrono::milliseconds read{0};
};

TimeoutBudget split_timeout(std::chrono::milliseconds timeout);

// POSTs {"image_data": <base64>, "filename": <name>} to the worker.
class HttpDetectionClient : public DetectionClient {
public:
    HttpDetectionClient() = default;
    ~HttpDetectionClient() override = default;

    FrameOutcome detect(const Frame& frame,
                        const WorkerEndpoint& endpoint,
                        std::chrono::milliseconds timeout) override;
};

// Calls a model in-process; the endpoint and timeout are not used.
class LocalDetectionClient : public DetectionClient {
public:
    explicit LocalDetectionClient(std::shared_ptr<DetectionModel> model);
    ~LocalDetectionClient() override = default;

    FrameOutcome detect(const Frame& frame,
                        const WorkerEndpoint& endpoint,
                        std::chrono::milliseconds timeout) override;

private:
    std::shared_ptr<DetectionModel> model_;
};

// Worker protocol request body for one frame. Reads the image through
// load_frame_bytes(), so it throws PipelineError(ExtractionFailed) for a
// missing file.
std::string build_worker_request(const Frame& frame);

// Maps one worker reply to an outcome:
//   {"error": "..."}                       -> WorkerRejectedFrame
//   2xx with a non-negative integer count  -> success
//   502/503/504 without an error payload   -> WorkerUnreachable
//   anything else                          -> MalformedWorkerResponse
FrameOutcome parse_worker_response(const Frame& frame,
                                   int http_status,
                                   const std::string& body,
                                   const std::string& count_field);

} // namespace vidcount
