#include "video_source.hpp"
#include "console.hpp"

#include <opencv2/videoio.hpp>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

namespace vidcount {

namespace fs = std::filesystem;

VideoSource::VideoSource(std::string path, std::uintmax_t byte_length, bool owns_file)
    : path_(std::move(path)), byte_length_(byte_length), owns_file_(owns_file) {}

VideoSource VideoSource::open(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !fs::is_regular_file(path, ec)) {
        throw PipelineError(ErrorKind::SourceNotFound, "Video file not found: " + path);
    }

    std::ifstream probe(path, std::ios::binary);
    if (!probe.is_open()) {
        throw PipelineError(ErrorKind::SourceNotFound, "Cannot open video file: " + path);
    }

    const std::uintmax_t size = fs::file_size(path, ec);
    if (ec) {
        throw PipelineError(ErrorKind::SourceNotFound,
                            "Cannot stat video file " + path + ": " + ec.message());
    }
    return VideoSource(path, size, false);
}

VideoSource VideoSource::adopt_temporary(const std::string& path) {
    VideoSource source = open(path);
    source.owns_file_ = true;
    return source;
}

VideoSource::VideoSource(VideoSource&& other) noexcept
    : path_(std::move(other.path_))
    , byte_length_(other.byte_length_)
    , owns_file_(other.owns_file_) {
    other.owns_file_ = false;
    other.byte_length_ = 0;
}

VideoSource& VideoSource::operator=(VideoSource&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        byte_length_ = other.byte_length_;
        owns_file_ = other.owns_file_;
        other.owns_file_ = false;
        other.byte_length_ = 0;
    }
    return *this;
}

VideoSource::~VideoSource() {
    release();
}

void VideoSource::release() noexcept {
    if (!owns_file_) return;
    owns_file_ = false;

    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        log_warn("video", "failed to remove temporary video " + path_ + ": " + ec.message());
    }
}

std::optional<VideoInfo> probe_video_info(const std::string& video_path) {
    cv::VideoCapture cap(video_path);
    if (!cap.isOpened()) {
        return std::nullopt;
    }

    VideoInfo info;
    info.total_frames = static_cast<int>(cap.get(cv::CAP_PROP_FRAME_COUNT));
    info.fps = cap.get(cv::CAP_PROP_FPS);
    info.duration = info.fps > 0.0 ? info.total_frames / info.fps : 0.0;
    info.frame_size = cv::Size(
        static_cast<int>(cap.get(cv::CAP_PROP_FRAME_WIDTH)),
        static_cast<int>(cap.get(cv::CAP_PROP_FRAME_HEIGHT))
    );

    int fourcc = static_cast<int>(cap.get(cv::CAP_PROP_FOURCC));
    char codec_chars[5];
    codec_chars[0] = static_cast<char>(fourcc & 0xFF);
    codec_chars[1] = static_cast<char>((fourcc >> 8) & 0xFF);
    codec_chars[2] = static_cast<char>((fourcc >> 16) & 0xFF);
    codec_chars[3] = static_cast<char>((fourcc >> 24) & 0xFF);
    codec_chars[4] = '\0';
    info.codec = std::string(codec_chars);

    return info;
}

VideoInfo get_video_info(const std::string& video_path) {
    auto info = probe_video_info(video_path);
    if (!info) {
        throw PipelineError(ErrorKind::SourceNotFound, "Cannot open video file: " + video_path);
    }
    return *info;
}

} // namespace vidcount
