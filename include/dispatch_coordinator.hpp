#pragma once

#include "cancellation.hpp"
#include "detection_client.hpp"
#include "frame_types.hpp"
#include "worker_endpoint.hpp"

#include <chrono>
#include <memory>
#include <vector>

namespace vidcount {

struct RetryPolicy {
    int per_frame_retries = 2;
    std::chrono::milliseconds initial_backoff{200};
    double backoff_multiplier = 2.0;
    std::chrono::milliseconds max_backoff{5000};

    // Delay after the given failed attempt (1-based) before the next one.
    std::chrono::milliseconds backoff_after(int attempt) const;
};

struct DispatchOptions {
    // The worker is usually a single GPU-bound process.
    int concurrency_limit = 2;
    RetryPolicy retry;
    std::chrono::milliseconds timeout{30000};
    bool verbose = true;

    // Throws PipelineError(InvalidConfiguration).
    void validate() const;
};

struct DispatchResult {
    // One outcome per input frame, in input order. Frames never dispatched
    // because of cancellation carry ErrorKind::Cancelled.
    std::vector<FrameOutcome> outcomes;
    bool cancelled = false;
    int total_attempts = 0;
};

// Fans frames out to a DetectionClient with at most concurrency_limit
// requests in flight. Dispatch tasks pull frame positions from a shared
// queue and send (position, outcome) messages to a collector that stores
// them by position, so output order never depends on completion order.
class DispatchCoordinator {
public:
    DispatchCoordinator(std::shared_ptr<DetectionClient> client, DispatchOptions options = {});
    ~DispatchCoordinator();

    DispatchResult run(const std::vector<Frame>& frames,
                       const WorkerEndpoint& endpoint,
                       CancellationToken& cancel);

    DispatchResult run(const std::vector<Frame>& frames, const WorkerEndpoint& endpoint);

    const DispatchOptions& options() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace vidcount
