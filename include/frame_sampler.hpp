#pragma once

#include "extraction_tool.hpp"
#include "frame_types.hpp"
#include "scratch_directory.hpp"
#include "video_source.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace vidcount {

// Frames of one run together with the scratch directory holding their image
// files. Move-only; the directory is removed when the sequence is destroyed.
class FrameSequence {
public:
    FrameSequence(ScratchDirectory scratch, std::vector<Frame> frames, double interval_seconds);

    FrameSequence(FrameSequence&&) noexcept = default;
    FrameSequence& operator=(FrameSequence&&) noexcept = default;

    const std::vector<Frame>& frames() const { return frames_; }
    size_t size() const { return frames_.size(); }
    bool empty() const { return frames_.empty(); }
    const Frame& operator[](size_t i) const { return frames_[i]; }

    std::vector<Frame>::const_iterator begin() const { return frames_.begin(); }
    std::vector<Frame>::const_iterator end() const { return frames_.end(); }

    double interval_seconds() const { return interval_seconds_; }
    const std::filesystem::path& scratch_path() const { return scratch_.path(); }

private:
    ScratchDirectory scratch_;
    std::vector<Frame> frames_;
    double interval_seconds_;
};

struct SamplerOptions {
    // Parent of the per-run scratch directory; empty means the system temp dir.
    std::filesystem::path scratch_root;
    bool verbose = true;
};

class FrameSampler {
public:
    explicit FrameSampler(std::shared_ptr<ExtractionTool> tool, SamplerOptions options = {});
    ~FrameSampler();

    FrameSampler(FrameSampler&&) noexcept;
    FrameSampler& operator=(FrameSampler&&) noexcept;

    // Samples one frame per spec.interval_seconds, frame 1 at t = 0.
    // Throws PipelineError with InvalidConfiguration, SourceNotFound,
    // ExtractionFailed or NoFramesProduced. Never returns an empty sequence.
    FrameSequence sample(const VideoSource& video, const SampleSpec& spec);

    const ExtractionTool& tool() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace vidcount
