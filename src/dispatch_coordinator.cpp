#include "dispatch_coordinator.hpp"
#include "bounded_queue.hpp"
#include "console.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <optional>
#include <utility>

namespace vidcount {

std::chrono::milliseconds RetryPolicy::backoff_after(int attempt) const {
    if (attempt < 1) attempt = 1;
    const double scaled = static_cast<double>(initial_backoff.count()) *
                          std::pow(backoff_multiplier, attempt - 1);
    const double capped = std::min(scaled, static_cast<double>(max_backoff.count()));
    return std::chrono::milliseconds(static_cast<long long>(capped));
}

void DispatchOptions::validate() const {
    if (concurrency_limit < 1) {
        throw PipelineError(ErrorKind::InvalidConfiguration,
                            "concurrency_limit must be at least 1 (got " +
                            std::to_string(concurrency_limit) + ")");
    }
    if (retry.per_frame_retries < 0) {
        throw PipelineError(ErrorKind::InvalidConfiguration,
                            "per_frame_retries must not be negative (got " +
                            std::to_string(retry.per_frame_retries) + ")");
    }
    if (timeout.count() <= 0) {
        throw PipelineError(ErrorKind::InvalidConfiguration, "per-attempt timeout must be positive");
    }
    if (retry.initial_backoff.count() < 0 || retry.max_backoff.count() < 0 ||
        retry.backoff_multiplier < 1.0) {
        throw PipelineError(ErrorKind::InvalidConfiguration,
                            "backoff must be non-negative with a multiplier of at least 1");
    }
}

namespace {

// Message from a dispatch task to the collector. An empty outcome means the
// sending task has finished.
struct OutcomeMessage {
    size_t position = 0;
    std::optional<FrameOutcome> outcome;
};

FrameOutcome skipped_outcome(const Frame& frame) {
    FrameOutcome outcome = FrameOutcome::failure(frame, ErrorKind::Cancelled,
                                                 "not dispatched: run cancelled");
    outcome.attempts = 0;
    return outcome;
}

} // namespace

class DispatchCoordinator::Impl {
public:
    Impl(std::shared_ptr<DetectionClient> client, DispatchOptions options)
        : client_(std::move(client)), options_(std::move(options)) {
        if (!client_) {
            throw PipelineError(ErrorKind::InvalidConfiguration, "DispatchCoordinator requires a detection client");
        }
        options_.validate();
    }

    DispatchResult run(const std::vector<Frame>& frames,
                       const WorkerEndpoint& endpoint,
                       CancellationToken& cancel) {
        DispatchResult result;
        if (frames.empty()) {
            return result;
        }

        const size_t total = frames.size();
        const size_t workers = std::min(static_cast<size_t>(options_.concurrency_limit), total);

        if (options_.verbose) {
            log_info("dispatch", "Dispatching " + std::to_string(total) + " frames to " +
                     endpoint.to_string() + " with " + std::to_string(workers) + " concurrent requests");
        }

        BoundedQueue<size_t> work(total);
        for (size_t i = 0; i < total; ++i) {
            work.push(i);
        }
        work.close();

        BoundedQueue<OutcomeMessage> messages(workers * 2);

        std::vector<std::future<void>> tasks;
        tasks.reserve(workers);
        for (size_t w = 0; w < workers; ++w) {
            tasks.push_back(std::async(std::launch::async, [this, &frames, &endpoint, &cancel, &work, &messages] {
                try {
                    dispatch_loop(frames, endpoint, cancel, work, messages);
                } catch (...) {
                    messages.push(OutcomeMessage{});
                    throw;
                }
                messages.push(OutcomeMessage{});
            }));
        }

        // Results store addressed by frame position; only this thread writes it.
        std::vector<std::optional<FrameOutcome>> slots(total);
        size_t finished_tasks = 0;
        while (finished_tasks < workers) {
            auto message = messages.pop();
            if (!message) break;
            if (!message->outcome) {
                ++finished_tasks;
                continue;
            }
            result.total_attempts += message->outcome->attempts;
            slots[message->position] = std::move(message->outcome);
        }

        // Rethrows anything a dispatch task failed with.
        for (auto& task : tasks) {
            task.get();
        }

        result.outcomes.reserve(total);
        size_t skipped = 0;
        for (size_t i = 0; i < total; ++i) {
            if (slots[i]) {
                result.outcomes.push_back(std::move(*slots[i]));
            } else {
                result.outcomes.push_back(skipped_outcome(frames[i]));
                ++skipped;
            }
        }
        result.cancelled = cancel.is_cancelled();

        if (result.cancelled) {
            log_warn("dispatch", "Run cancelled; " + std::to_string(skipped) + " of " +
                     std::to_string(total) + " frames were not dispatched");
        }
        return result;
    }

    const DispatchOptions& options() const { return options_; }

private:
    void dispatch_loop(const std::vector<Frame>& frames,
                       const WorkerEndpoint& endpoint,
                       CancellationToken& cancel,
                       BoundedQueue<size_t>& work,
                       BoundedQueue<OutcomeMessage>& messages) {
        while (!cancel.is_cancelled()) {
            auto position = work.pop();
            if (!position) break;
            // Cancellation may have arrived while this task was waiting.
            if (cancel.is_cancelled()) break;

            OutcomeMessage message;
            message.position = *position;
            message.outcome = dispatch_frame(frames[*position], frames.size(), endpoint, cancel);
            messages.push(std::move(message));
        }
    }

    FrameOutcome dispatch_frame(const Frame& frame,
                                size_t total,
                                const WorkerEndpoint& endpoint,
                                CancellationToken& cancel) {
        const auto start = std::chrono::steady_clock::now();
        const int max_attempts = 1 + options_.retry.per_frame_retries;

        if (options_.verbose) {
            log_info("dispatch", "Sending frame " + std::to_string(frame.index) + "/" +
                     std::to_string(total) + " -> " + frame.name);
        }

        FrameOutcome outcome;
        int attempts = 0;
        while (true) {
            ++attempts;
            outcome = attempt(frame, endpoint);

            if (outcome.ok() || !is_retryable(outcome.error_kind) || attempts >= max_attempts) {
                break;
            }

            const auto delay = options_.retry.backoff_after(attempts);
            log_warn("dispatch", frame.name + " attempt " + std::to_string(attempts) + "/" +
                     std::to_string(max_attempts) + " failed (" + outcome.error_message +
                     "), retrying in " + std::to_string(delay.count()) + "ms");

            if (cancel.wait_for(delay)) {
                outcome.error_message += " (retry abandoned: run cancelled)";
                break;
            }
        }

        outcome.frame_index = frame.index;
        outcome.frame_name = frame.name;
        outcome.attempts = attempts;
        outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        if (outcome.ok()) {
            if (options_.verbose) {
                log_info("dispatch", "Frame " + frame.name + ": " +
                         std::to_string(outcome.detection_count) + " objects detected");
            }
        } else {
            log_error("dispatch", "Frame " + frame.name + " failed after " + std::to_string(attempts) +
                      " attempt(s): " + to_string(outcome.error_kind) + ": " + outcome.error_message);
        }
        return outcome;
    }

    // A client that throws is treated as a transport-level failure.
    FrameOutcome attempt(const Frame& frame, const WorkerEndpoint& endpoint) {
        try {
            return client_->detect(frame, endpoint, options_.timeout);
        } catch (const std::exception& e) {
            return FrameOutcome::failure(frame, ErrorKind::WorkerUnreachable,
                                         "transport failure: " + std::string(e.what()));
        }
    }

    std::shared_ptr<DetectionClient> client_;
    DispatchOptions options_;
};

DispatchCoordinator::DispatchCoordinator(std::shared_ptr<DetectionClient> client, DispatchOptions options)
    : pimpl_(std::make_unique<Impl>(std::move(client), std::move(options))) {}

DispatchCoordinator::~DispatchCoordinator() = default;

DispatchResult DispatchCoordinator::run(const std::vector<Frame>& frames,
                                        const WorkerEndpoint& endpoint,
                                        CancellationToken& cancel) {
    return pimpl_->run(frames, endpoint, cancel);
}

DispatchResult DispatchCoordinator::run(const std::vector<Frame>& frames, const WorkerEndpoint& endpoint) {
    CancellationToken never_cancelled;
    return pimpl_->run(frames, endpoint, never_cancelled);
}

const DispatchOptions& DispatchCoordinator::options() const {
    return pimpl_->options();
}

} // namespace vidcount
