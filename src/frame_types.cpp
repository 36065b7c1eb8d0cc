#include "frame_types.hpp"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <iterator>

namespace vidcount {

void SampleSpec::validate() const {
    if (!std::isfinite(interval_seconds) || interval_seconds <= 0.0) {
        throw PipelineError(ErrorKind::InvalidConfiguration,
                            "interval_seconds must be greater than 0 (got " +
                            std::to_string(interval_seconds) + ")");
    }
    if (max_frames && *max_frames <= 0) {
        throw PipelineError(ErrorKind::InvalidConfiguration,
                            "max_frames must be a positive integer (got " +
                            std::to_string(*max_frames) + ")");
    }
}

std::string frame_display_name(int index) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "frame_%05d.jpg", index);
    return std::string(buffer);
}

std::vector<unsigned char> load_frame_bytes(const Frame& frame) {
    if (!frame.bytes.empty()) {
        return frame.bytes;
    }
    if (frame.path.empty()) {
        throw PipelineError(ErrorKind::ExtractionFailed, "Frame " + frame.name + " has no image data");
    }
    std::ifstream in(frame.path, std::ios::binary);
    if (!in.is_open()) {
        throw PipelineError(ErrorKind::ExtractionFailed, "Cannot read extracted frame " + frame.path);
    }
    std::vector<unsigned char> bytes((std::istreambuf_iterator<char>(in)),
                                     std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw PipelineError(ErrorKind::ExtractionFailed, "Error reading extracted frame " + frame.path);
    }
    return bytes;
}

FrameOutcome FrameOutcome::success(const Frame& frame, int count) {
    FrameOutcome outcome;
    outcome.frame_index = frame.index;
    outcome.frame_name = frame.name;
    outcome.detection_count = count;
    return outcome;
}

FrameOutcome FrameOutcome::failure(const Frame& frame, ErrorKind kind, const std::string& message) {
    FrameOutcome outcome;
    outcome.frame_index = frame.index;
    outcome.frame_name = frame.name;
    outcome.error_kind = kind;
    outcome.error_message = message;
    return outcome;
}

} // namespace vidcount
