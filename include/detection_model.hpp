#pragma once

#include <chrono>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace vidcount {

// Long-lived object detector shared by reference between clients and the
// worker server. Implementations must be safe to call from several threads.
class DetectionModel {
public:
    virtual ~DetectionModel() = default;

    // Objects detected in one encoded image. Throws std::exception on failure.
    virtual int count_objects(const std::vector<unsigned char>& image_bytes) = 0;

    virtual std::string name() const = 0;
    virtual bool is_simulated() const { return false; }
};

// Stand-in used when no real model is loaded: uniformly random counts in
// [0, max_count], optionally after a fixed latency.
class SimulatedDetectionModel : public DetectionModel {
public:
    explicit SimulatedDetectionModel(unsigned int seed = std::random_device{}(),
                                     int max_count = 5,
                                     std::chrono::milliseconds latency = std::chrono::milliseconds(0));

    int count_objects(const std::vector<unsigned char>& image_bytes) override;

    std::string name() const override;
    bool is_simulated() const override { return true; }

private:
    std::mutex mutex_;
    std::mt19937 gen_;
    std::uniform_int_distribution<int> dist_;
    std::chrono::milliseconds latency_;
};

} // namespace vidcount
