#include <gtest/gtest.h>
#include "dispatch_coordinator.hpp"
#include "bounded_queue.hpp"
#include "test_support.hpp"
#include <chrono>
#include <random>
#include <stdexcept>
#include <thread>

namespace vidcount {

using testing_support::ScriptedClient;
using testing_support::make_frames;

class DispatchCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        options_.verbose = false;
        options_.concurrency_limit = 2;
        options_.retry.per_frame_retries = 2;
        options_.retry.initial_backoff = std::chrono::milliseconds(1);
        options_.retry.max_backoff = std::chrono::milliseconds(5);
        options_.timeout = std::chrono::milliseconds(1000);
    }

    static FrameOutcome count_by_index(const Frame& frame, int /*attempt*/) {
        return FrameOutcome::success(frame, frame.index * 10);
    }

    DispatchOptions options_;
    WorkerEndpoint endpoint_;
};

TEST_F(DispatchCoordinatorTest, OutcomesFollowFrameOrder) {
    // Random per-frame delays so completion order differs from input order.
    auto client = std::make_shared<ScriptedClient>([](const Frame& frame, int) {
        std::mt19937 gen(static_cast<unsigned>(frame.index));
        std::uniform_int_distribution<int> delay(0, 15);
        std::this_thread::sleep_for(std::chrono::milliseconds(delay(gen)));
        return FrameOutcome::success(frame, frame.index * 10);
    });
    options_.concurrency_limit = 4;
    DispatchCoordinator coordinator(client, options_);

    auto frames = make_frames(12);
    auto result = coordinator.run(frames, endpoint_);

    ASSERT_EQ(result.outcomes.size(), frames.size());
    EXPECT_FALSE(result.cancelled);
    EXPECT_EQ(result.total_attempts, 12);
    for (size_t i = 0; i < frames.size(); ++i) {
        EXPECT_EQ(result.outcomes[i].frame_index, frames[i].index);
        EXPECT_EQ(result.outcomes[i].frame_name, frames[i].name);
        EXPECT_TRUE(result.outcomes[i].ok());
        EXPECT_EQ(result.outcomes[i].detection_count, frames[i].index * 10);
        EXPECT_EQ(result.outcomes[i].attempts, 1);
    }
}

TEST_F(DispatchCoordinatorTest, RejectedFrameDoesNotStopOthers) {
    auto client = std::make_shared<ScriptedClient>([](const Frame& frame, int) {
        if (frame.index == 3) {
            return FrameOutcome::failure(frame, ErrorKind::WorkerRejectedFrame, "cannot identify image");
        }
        return FrameOutcome::success(frame, 1);
    });
    DispatchCoordinator coordinator(client, options_);

    auto result = coordinator.run(make_frames(5), endpoint_);

    ASSERT_EQ(result.outcomes.size(), 5u);
    EXPECT_EQ(result.outcomes[2].error_kind, ErrorKind::WorkerRejectedFrame);
    EXPECT_EQ(result.outcomes[2].error_message, "cannot identify image");
    EXPECT_EQ(result.outcomes[2].attempts, 1);
    EXPECT_EQ(client->attempts_for(3), 1);
    for (size_t i : {0u, 1u, 3u, 4u}) {
        EXPECT_TRUE(result.outcomes[i].ok());
    }
}

TEST_F(DispatchCoordinatorTest, UnreachableRetriedUntilSuccess) {
    auto client = std::make_shared<ScriptedClient>([](const Frame& frame, int attempt) {
        if (frame.index == 2 && attempt <= 2) {
            return FrameOutcome::failure(frame, ErrorKind::WorkerUnreachable, "connection refused");
        }
        return FrameOutcome::success(frame, 4);
    });
    DispatchCoordinator coordinator(client, options_);

    auto result = coordinator.run(make_frames(3), endpoint_);

    EXPECT_TRUE(result.outcomes[1].ok());
    EXPECT_EQ(result.outcomes[1].detection_count, 4);
    EXPECT_EQ(result.outcomes[1].attempts, 3);
    EXPECT_EQ(client->attempts_for(2), 3);
    EXPECT_EQ(result.total_attempts, 5);
}

TEST_F(DispatchCoordinatorTest, RetryBudgetExhausted) {
    auto client = std::make_shared<ScriptedClient>([](const Frame& frame, int) {
        return FrameOutcome::failure(frame, ErrorKind::WorkerUnreachable, "connection refused");
    });
    options_.retry.per_frame_retries = 1;
    DispatchCoordinator coordinator(client, options_);

    auto result = coordinator.run(make_frames(2), endpoint_);

    for (const auto& outcome : result.outcomes) {
        EXPECT_EQ(outcome.error_kind, ErrorKind::WorkerUnreachable);
        EXPECT_EQ(outcome.attempts, 2);
    }
    EXPECT_EQ(client->total_calls(), 4);
}

TEST_F(DispatchCoordinatorTest, NonTransportFailuresNotRetried) {
    auto client = std::make_shared<ScriptedClient>([](const Frame& frame, int) {
        if (frame.index == 1) {
            return FrameOutcome::failure(frame, ErrorKind::MalformedWorkerResponse, "not json");
        }
        return FrameOutcome::failure(frame, ErrorKind::WorkerRejectedFrame, "bad image");
    });
    DispatchCoordinator coordinator(client, options_);

    auto result = coordinator.run(make_frames(2), endpoint_);

    EXPECT_EQ(result.outcomes[0].error_kind, ErrorKind::MalformedWorkerResponse);
    EXPECT_EQ(result.outcomes[1].error_kind, ErrorKind::WorkerRejectedFrame);
    EXPECT_EQ(client->attempts_for(1), 1);
    EXPECT_EQ(client->attempts_for(2), 1);
}

TEST_F(DispatchCoordinatorTest, ThrowingClientTreatedAsUnreachable) {
    auto client = std::make_shared<ScriptedClient>([](const Frame& frame, int attempt) -> FrameOutcome {
        if (attempt == 1) {
            throw std::runtime_error("socket closed");
        }
        return FrameOutcome::success(frame, 2);
    });
    DispatchCoordinator coordinator(client, options_);

    auto result = coordinator.run(make_frames(2), endpoint_);

    for (const auto& outcome : result.outcomes) {
        EXPECT_TRUE(outcome.ok());
        EXPECT_EQ(outcome.attempts, 2);
    }
}

TEST_F(DispatchCoordinatorTest, InFlightNeverExceedsLimit) {
    auto client = std::make_shared<ScriptedClient>([](const Frame& frame, int) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        return FrameOutcome::success(frame, 0);
    });
    options_.concurrency_limit = 3;
    DispatchCoordinator coordinator(client, options_);

    auto result = coordinator.run(make_frames(20), endpoint_);

    EXPECT_EQ(result.outcomes.size(), 20u);
    EXPECT_LE(client->max_in_flight(), 3);
    EXPECT_GE(client->max_in_flight(), 1);
}

TEST_F(DispatchCoordinatorTest, SerialWhenLimitIsOne) {
    auto client = std::make_shared<ScriptedClient>([](const Frame& frame, int) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        return FrameOutcome::success(frame, 1);
    });
    options_.concurrency_limit = 1;
    DispatchCoordinator coordinator(client, options_);

    coordinator.run(make_frames(6), endpoint_);
    EXPECT_EQ(client->max_in_flight(), 1);
}

TEST_F(DispatchCoordinatorTest, CancellationSkipsRemainingFrames) {
    CancellationToken cancel;
    auto client = std::make_shared<ScriptedClient>([&cancel](const Frame& frame, int) {
        if (frame.index == 2) {
            cancel.cancel();
        }
        return FrameOutcome::success(frame, 1);
    });
    options_.concurrency_limit = 1;
    DispatchCoordinator coordinator(client, options_);

    auto result = coordinator.run(make_frames(6), endpoint_, cancel);

    EXPECT_TRUE(result.cancelled);
    ASSERT_EQ(result.outcomes.size(), 6u);
    EXPECT_TRUE(result.outcomes[0].ok());
    EXPECT_TRUE(result.outcomes[1].ok());
    for (size_t i = 2; i < 6; ++i) {
        EXPECT_EQ(result.outcomes[i].error_kind, ErrorKind::Cancelled);
        EXPECT_EQ(result.outcomes[i].attempts, 0);
        EXPECT_EQ(result.outcomes[i].frame_index, static_cast<int>(i) + 1);
    }
    EXPECT_EQ(client->total_calls(), 2);
}

TEST_F(DispatchCoordinatorTest, CancellationInterruptsBackoff) {
    CancellationToken cancel;
    auto client = std::make_shared<ScriptedClient>([](const Frame& frame, int) {
        return FrameOutcome::failure(frame, ErrorKind::WorkerUnreachable, "connection refused");
    });
    options_.concurrency_limit = 1;
    options_.retry.per_frame_retries = 5;
    options_.retry.initial_backoff = std::chrono::milliseconds(10000);
    options_.retry.max_backoff = std::chrono::milliseconds(10000);
    DispatchCoordinator coordinator(client, options_);

    std::thread canceller([&cancel] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        cancel.cancel();
    });

    const auto start = std::chrono::steady_clock::now();
    auto result = coordinator.run(make_frames(3), endpoint_, cancel);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.outcomes[0].error_kind, ErrorKind::WorkerUnreachable);
    EXPECT_EQ(result.outcomes[0].attempts, 1);
    EXPECT_NE(result.outcomes[0].error_message.find("cancelled"), std::string::npos);
    EXPECT_EQ(result.outcomes[1].error_kind, ErrorKind::Cancelled);
    EXPECT_EQ(result.outcomes[2].error_kind, ErrorKind::Cancelled);
}

TEST_F(DispatchCoordinatorTest, EmptyInputYieldsEmptyResult) {
    auto client = std::make_shared<ScriptedClient>(count_by_index);
    DispatchCoordinator coordinator(client, options_);

    auto result = coordinator.run({}, endpoint_);
    EXPECT_TRUE(result.outcomes.empty());
    EXPECT_EQ(client->total_calls(), 0);
}

TEST_F(DispatchCoordinatorTest, InvalidOptionsRejected) {
    auto client = std::make_shared<ScriptedClient>(count_by_index);

    options_.concurrency_limit = 0;
    try {
        DispatchCoordinator coordinator(client, options_);
        FAIL() << "expected InvalidConfiguration";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidConfiguration);
    }

    options_.concurrency_limit = 2;
    options_.retry.per_frame_retries = -1;
    EXPECT_THROW(DispatchCoordinator(client, options_), PipelineError);

    options_.retry.per_frame_retries = 0;
    options_.timeout = std::chrono::milliseconds(0);
    EXPECT_THROW(DispatchCoordinator(client, options_), PipelineError);

    EXPECT_THROW(DispatchCoordinator(nullptr, DispatchOptions{}), PipelineError);
}

TEST(RetryPolicyTest, ExponentialBackoffIsCapped) {
    RetryPolicy policy;
    policy.initial_backoff = std::chrono::milliseconds(200);
    policy.backoff_multiplier = 2.0;
    policy.max_backoff = std::chrono::milliseconds(1000);

    EXPECT_EQ(policy.backoff_after(1).count(), 200);
    EXPECT_EQ(policy.backoff_after(2).count(), 400);
    EXPECT_EQ(policy.backoff_after(3).count(), 800);
    EXPECT_EQ(policy.backoff_after(4).count(), 1000);
    EXPECT_EQ(policy.backoff_after(10).count(), 1000);
}

TEST(BoundedQueueTest, DrainsAfterClose) {
    BoundedQueue<int> queue(4);
    EXPECT_TRUE(queue.push(1));
    EXPECT_TRUE(queue.push(2));
    queue.close();

    EXPECT_FALSE(queue.push(3));
    EXPECT_EQ(queue.pop().value(), 1);
    EXPECT_EQ(queue.pop().value(), 2);
    EXPECT_FALSE(queue.pop().has_value());
}

TEST(BoundedQueueTest, PushBlocksAtCapacity) {
    BoundedQueue<int> queue(1);
    ASSERT_TRUE(queue.push(1));

    std::atomic<bool> pushed{false};
    std::thread producer([&] {
        queue.push(2);
        pushed = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_FALSE(pushed);
    EXPECT_EQ(queue.pop().value(), 1);
    producer.join();
    EXPECT_TRUE(pushed);
    EXPECT_EQ(queue.pop().value(), 2);
}

} // namespace vidcount
