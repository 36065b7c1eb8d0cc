#pragma once

#include "frame_types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace vidcount {

// Handle to one on-disk video, owned by a single pipeline invocation.
// A temporary source (an upload spooled to disk) deletes its file when the
// handle is destroyed.
class VideoSource {
public:
    // Throws PipelineError(SourceNotFound) if the file is missing or unreadable.
    static VideoSource open(const std::string& path);
    static VideoSource adopt_temporary(const std::string& path);

    VideoSource(VideoSource&& other) noexcept;
    VideoSource& operator=(VideoSource&& other) noexcept;
    VideoSource(const VideoSource&) = delete;
    VideoSource& operator=(const VideoSource&) = delete;
    ~VideoSource();

    const std::string& path() const { return path_; }
    std::uintmax_t byte_length() const { return byte_length_; }
    bool owns_file() const { return owns_file_; }

private:
    VideoSource(std::string path, std::uintmax_t byte_length, bool owns_file);
    void release() noexcept;

    std::string path_;
    std::uintmax_t byte_length_ = 0;
    bool owns_file_ = false;
};

// Container properties as reported by OpenCV. Throws SourceNotFound when the
// container cannot be opened.
VideoInfo get_video_info(const std::string& video_path);

// Same as get_video_info, but empty when OpenCV has no demuxer for the file.
std::optional<VideoInfo> probe_video_info(const std::string& video_path);

} // namespace vidcount
