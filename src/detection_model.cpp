#include "detection_model.hpp"

#include <stdexcept>
#include <thread>

namespace vidcount {

SimulatedDetectionModel::SimulatedDetectionModel(unsigned int seed,
                                                 int max_count,
                                                 std::chrono::milliseconds latency)
    : gen_(seed), dist_(0, max_count < 0 ? 0 : max_count), latency_(latency) {}

int SimulatedDetectionModel::count_objects(const std::vector<unsigned char>& image_bytes) {
    if (image_bytes.empty()) {
        throw std::invalid_argument("empty image");
    }
    if (latency_.count() > 0) {
        std::this_thread::sleep_for(latency_);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return dist_(gen_);
}

std::string SimulatedDetectionModel::name() const {
    return "simulated";
}

} // namespace vidcount
