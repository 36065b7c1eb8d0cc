#include "extraction_tool.hpp"
#include "errors.hpp"
#include "frame_types.hpp"
#include "console.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/videoio.hpp>
#include <sys/wait.h>
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <utility>

namespace vidcount {

namespace {

std::string shell_quote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

// Runs a shell command, capturing stdout and stderr together. Returns the
// exit status, or -1 if the process could not be started.
int run_command(const std::string& command, std::string& output) {
    output.clear();
    const std::string wrapped = command + " 2>&1";

    FILE* pipe = popen(wrapped.c_str(), "r");
    if (pipe == nullptr) {
        return -1;
    }

    std::array<char, 512> buffer;
    while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr) {
        output += buffer.data();
    }

    const int raw_status = pclose(pipe);
    if (raw_status == -1) {
        return -1;
    }
    if (WIFEXITED(raw_status)) {
        return WEXITSTATUS(raw_status);
    }
    return raw_status;
}

std::string format_interval(double interval_seconds) {
    std::ostringstream oss;
    oss << std::setprecision(10) << interval_seconds;
    return oss.str();
}

} // namespace

int expected_sample_count(double duration_seconds, double interval_seconds) {
    if (!(duration_seconds > 0.0) || !(interval_seconds > 0.0)) {
        return 0;
    }
    return static_cast<int>(std::floor(duration_seconds / interval_seconds + 1e-9));
}

// FFmpeg tool

FfmpegExtractionTool::FfmpegExtractionTool(std::string executable, int jpeg_quality)
    : executable_(std::move(executable)), jpeg_quality_(jpeg_quality) {}

std::string FfmpegExtractionTool::build_command(const std::string& video_path,
                                                double interval_seconds,
                                                const std::filesystem::path& output_dir) const {
    const std::string pattern = (output_dir / "frame_%05d.jpg").string();

    std::ostringstream cmd;
    cmd << shell_quote(executable_)
        << " -hide_banner -loglevel error -y"
        << " -i " << shell_quote(video_path)
        << " -vf " << shell_quote("fps=1/" + format_interval(interval_seconds))
        << " -q:v " << jpeg_quality_
        << " " << shell_quote(pattern);
    return cmd.str();
}

void FfmpegExtractionTool::extract(const std::string& video_path,
                                   double interval_seconds,
                                   const std::filesystem::path& output_dir) {
    const std::string command = build_command(video_path, interval_seconds, output_dir);

    std::string output;
    const int exit_code = run_command(command, output);
    if (exit_code == -1) {
        throw PipelineError(ErrorKind::ExtractionFailed, "failed to launch " + executable_);
    }
    if (exit_code != 0) {
        throw PipelineError(ErrorKind::ExtractionFailed,
                            executable_ + " exited with status " + std::to_string(exit_code) +
                            (output.empty() ? std::string() : ": " + output));
    }
}

std::string FfmpegExtractionTool::name() const {
    return "ffmpeg";
}

bool FfmpegExtractionTool::is_available() const {
    std::string output;
    return run_command(shell_quote(executable_) + " -version", output) == 0;
}

// OpenCV tool

OpenCvExtractionTool::OpenCvExtractionTool(int jpeg_quality)
    : jpeg_quality_(jpeg_quality) {}

void OpenCvExtractionTool::extract(const std::string& video_path,
                                   double interval_seconds,
                                   const std::filesystem::path& output_dir) {
    cv::VideoCapture cap(video_path);
    if (!cap.isOpened()) {
        throw PipelineError(ErrorKind::ExtractionFailed, "OpenCV cannot decode video: " + video_path);
    }

    const double fps = cap.get(cv::CAP_PROP_FPS);
    const int total_frames = static_cast<int>(cap.get(cv::CAP_PROP_FRAME_COUNT));
    if (fps <= 0.0 || total_frames <= 0) {
        throw PipelineError(ErrorKind::ExtractionFailed,
                            "OpenCV reports no frame rate or frame count for " + video_path);
    }

    const int samples = expected_sample_count(total_frames / fps, interval_seconds);

    // Nearest source frame for each sample timestamp, in ascending order.
    std::vector<int> targets;
    targets.reserve(static_cast<size_t>(samples));
    for (int n = 1; n <= samples; ++n) {
        const double t = (n - 1) * interval_seconds;
        const int idx = static_cast<int>(std::lround(t * fps));
        targets.push_back(std::min(idx, total_frames - 1));
    }

    const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, jpeg_quality_};

    // Sequential decode is used instead of seeking; seeking is unreliable for
    // several containers.
    size_t next = 0;
    int frame_no = 0;
    cv::Mat frame;
    while (next < targets.size() && cap.read(frame)) {
        while (next < targets.size() && targets[next] == frame_no) {
            const auto path = output_dir / frame_display_name(static_cast<int>(next) + 1);
            if (!cv::imwrite(path.string(), frame, params)) {
                throw PipelineError(ErrorKind::ExtractionFailed,
                                    "failed to write " + path.string());
            }
            ++next;
        }
        ++frame_no;
    }

    if (next < targets.size()) {
        log_warn("opencv", "stream ended after " + std::to_string(frame_no) + " frames, wrote " +
                 std::to_string(next) + " of " + std::to_string(targets.size()) + " samples");
    }
}

std::string OpenCvExtractionTool::name() const {
    return "opencv";
}

bool OpenCvExtractionTool::is_available() const {
    return true;
}

// Factory

std::unique_ptr<ExtractionTool> create_extraction_tool(const std::string& tool_name) {
    if (tool_name == "ffmpeg") {
        return std::make_unique<FfmpegExtractionTool>();
    }
    if (tool_name == "opencv") {
        return std::make_unique<OpenCvExtractionTool>();
    }
    throw PipelineError(ErrorKind::InvalidConfiguration,
                        "Unknown extraction tool: " + tool_name + " (expected ffmpeg or opencv)");
}

std::unique_ptr<ExtractionTool> create_best_extraction_tool() {
    auto ffmpeg = std::make_unique<FfmpegExtractionTool>();
    if (ffmpeg->is_available()) {
        return ffmpeg;
    }
    log_info("sampler", "ffmpeg not found on PATH, using OpenCV extraction");
    return std::make_unique<OpenCvExtractionTool>();
}

std::vector<std::string> get_available_extraction_tools() {
    std::vector<std::string> tools;
    if (FfmpegExtractionTool().is_available()) {
        tools.push_back("ffmpeg");
    }
    tools.push_back("opencv");
    return tools;
}

} // namespace vidcount
