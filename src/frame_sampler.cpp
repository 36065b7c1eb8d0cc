#include "frame_sampler.hpp"
#include "console.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <system_error>
#include <utility>

namespace vidcount {

namespace fs = std::filesystem;

FrameSequence::FrameSequence(ScratchDirectory scratch, std::vector<Frame> frames, double interval_seconds)
    : scratch_(std::move(scratch)), frames_(std::move(frames)), interval_seconds_(interval_seconds) {}

class FrameSampler::Impl {
public:
    Impl(std::shared_ptr<ExtractionTool> tool, SamplerOptions options)
        : tool_(std::move(tool)), options_(std::move(options)) {
        if (!tool_) {
            throw PipelineError(ErrorKind::InvalidConfiguration, "FrameSampler requires an extraction tool");
        }
    }

    FrameSequence sample(const VideoSource& video, const SampleSpec& spec) {
        spec.validate();

        std::error_code ec;
        if (!fs::is_regular_file(video.path(), ec)) {
            throw PipelineError(ErrorKind::SourceNotFound, "Video file not found: " + video.path());
        }

        // Duration is optional: OpenCV may lack a demuxer that ffmpeg has.
        const auto info = probe_video_info(video.path());
        const bool duration_known = info && info->duration > 0.0;
        if (duration_known && info->duration < spec.interval_seconds) {
            throw PipelineError(ErrorKind::NoFramesProduced,
                                "Video is " + std::to_string(info->duration) +
                                "s long, shorter than one sampling interval of " +
                                std::to_string(spec.interval_seconds) + "s");
        }

        ScratchDirectory scratch = make_scratch();

        if (options_.verbose) {
            std::ostringstream msg;
            msg << "Extracting frames from " << video.path()
                << " every " << spec.interval_seconds << "s using " << tool_->name();
            if (duration_known) {
                msg << " (duration: " << info->duration << "s)";
            }
            log_info("sampler", msg.str());
        }

        tool_->extract(video.path(), spec.interval_seconds, scratch.path());

        std::vector<fs::path> files = list_frame_files(scratch.path());
        const size_t produced = files.size();

        if (duration_known) {
            const int cap = expected_sample_count(info->duration, spec.interval_seconds);
            if (cap > 0 && files.size() > static_cast<size_t>(cap)) {
                files.resize(static_cast<size_t>(cap));
            }
        }
        if (spec.max_frames && files.size() > static_cast<size_t>(*spec.max_frames)) {
            files.resize(static_cast<size_t>(*spec.max_frames));
        }

        if (files.empty()) {
            throw PipelineError(ErrorKind::NoFramesProduced,
                                "No frames extracted. Possibly video too short or invalid step " +
                                std::to_string(spec.interval_seconds) + "s");
        }

        std::vector<Frame> frames;
        frames.reserve(files.size());
        for (size_t i = 0; i < files.size(); ++i) {
            Frame frame;
            frame.index = static_cast<int>(i) + 1;
            frame.timestamp_seconds = static_cast<double>(i) * spec.interval_seconds;
            frame.name = frame_display_name(frame.index);
            frame.path = files[i].string();
            frames.push_back(std::move(frame));
        }

        if (options_.verbose) {
            log_info("sampler", "Extracted " + std::to_string(produced) + " frames, keeping " +
                     std::to_string(frames.size()));
        }

        return FrameSequence(std::move(scratch), std::move(frames), spec.interval_seconds);
    }

    const ExtractionTool& tool() const { return *tool_; }

private:
    ScratchDirectory make_scratch() const {
        try {
            return ScratchDirectory("vidcount_frames_", options_.scratch_root);
        } catch (const std::runtime_error& e) {
            throw PipelineError(ErrorKind::ExtractionFailed,
                                "Cannot allocate scratch storage: " + std::string(e.what()));
        }
    }

    // Parses the numeric part of "frame_<digits>.jpg"; -1 for anything else.
    static long frame_file_number(const std::string& filename) {
        const std::string prefix = "frame_";
        const std::string suffix = ".jpg";
        if (filename.size() <= prefix.size() + suffix.size()) return -1;
        if (filename.compare(0, prefix.size(), prefix) != 0) return -1;
        if (filename.compare(filename.size() - suffix.size(), suffix.size(), suffix) != 0) return -1;

        const std::string digits = filename.substr(prefix.size(),
                                                   filename.size() - prefix.size() - suffix.size());
        if (digits.empty() || digits.size() > 9) return -1;
        for (char c : digits) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return -1;
        }
        return std::stol(digits);
    }

    static std::vector<fs::path> list_frame_files(const fs::path& dir) {
        std::vector<std::pair<long, fs::path>> numbered;
        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
            std::error_code type_ec;
            if (!it->is_regular_file(type_ec)) continue;
            const long number = frame_file_number(it->path().filename().string());
            if (number >= 0) {
                numbered.emplace_back(number, it->path());
            }
        }
        if (ec) {
            throw PipelineError(ErrorKind::ExtractionFailed,
                                "Cannot list extracted frames in " + dir.string() + ": " + ec.message());
        }

        std::sort(numbered.begin(), numbered.end(),
                  [](const auto& a, const auto& b) { return a.first < b.first; });

        std::vector<fs::path> files;
        files.reserve(numbered.size());
        for (auto& item : numbered) {
            files.push_back(std::move(item.second));
        }
        return files;
    }

    std::shared_ptr<ExtractionTool> tool_;
    SamplerOptions options_;
};

FrameSampler::FrameSampler(std::shared_ptr<ExtractionTool> tool, SamplerOptions options)
    : pimpl_(std::make_unique<Impl>(std::move(tool), std::move(options))) {}

FrameSampler::~FrameSampler() = default;
FrameSampler::FrameSampler(FrameSampler&&) noexcept = default;
FrameSampler& FrameSampler::operator=(FrameSampler&&) noexcept = default;

FrameSequence FrameSampler::sample(const VideoSource& video, const SampleSpec& spec) {
    return pimpl_->sample(video, spec);
}

const ExtractionTool& FrameSampler::tool() const {
    return pimpl_->tool();
}

} // namespace vidcount
