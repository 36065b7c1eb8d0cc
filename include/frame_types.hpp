#pragma once

#include "errors.hpp"

#include <opencv2/core.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace vidcount {

struct VideoInfo {
    int total_frames = 0;
    double fps = 0.0;
    double duration = 0.0;
    cv::Size frame_size;
    std::string codec;
};

struct SampleSpec {
    double interval_seconds = 1.0;
    std::optional<int> max_frames;

    // Throws PipelineError(InvalidConfiguration).
    void validate() const;
};

// One sampled still image. Frames are handed out by const reference only.
// Sampled frames carry only `path`; the image is read when the frame is
// dispatched. `bytes`, when set, is used instead of the file.
struct Frame {
    int index = 0;                 // 1-based, dense
    double timestamp_seconds = 0.0;
    std::string name;
    std::string path;
    std::vector<unsigned char> bytes;
};

// "frame_00007.jpg" for index 7; matches the extraction tool output pattern.
std::string frame_display_name(int index);

// Encoded image for `frame`. Throws PipelineError(ExtractionFailed) when the
// file is gone or unreadable.
std::vector<unsigned char> load_frame_bytes(const Frame& frame);

struct FrameOutcome {
    int frame_index = 0;
    std::string frame_name;
    int detection_count = 0;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
    int attempts = 0;
    std::chrono::milliseconds elapsed{0};

    bool ok() const { return error_kind == ErrorKind::None; }

    static FrameOutcome success(const Frame& frame, int count);
    static FrameOutcome failure(const Frame& frame, ErrorKind kind, const std::string& message);
};

} // namespace vidcount
