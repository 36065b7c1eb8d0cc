#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace vidcount {

// Decodes a video into still images. Implementations write one JPEG per
// sample point into output_dir, named frame_%05d.jpg starting at 1, and throw
// PipelineError(ExtractionFailed) when decoding fails.
class ExtractionTool {
public:
    virtual ~ExtractionTool() = default;

    virtual void extract(const std::string& video_path,
                         double interval_seconds,
                         const std::filesystem::path& output_dir) = 0;

    virtual std::string name() const = 0;
    virtual bool is_available() const = 0;
};

// Runs the ffmpeg binary with an fps=1/<interval> filter.
class FfmpegExtractionTool : public ExtractionTool {
public:
    explicit FfmpegExtractionTool(std::string executable = "ffmpeg", int jpeg_quality = 2);
    ~FfmpegExtractionTool() override = default;

    void extract(const std::string& video_path,
                 double interval_seconds,
                 const std::filesystem::path& output_dir) override;

    std::string name() const override;
    bool is_available() const override;

    // Shell command line for one extraction; exposed for diagnostics.
    std::string build_command(const std::string& video_path,
                              double interval_seconds,
                              const std::filesystem::path& output_dir) const;

private:
    std::string executable_;
    int jpeg_quality_;
};

// Decodes in-process with cv::VideoCapture and picks the nearest source frame
// for each sample timestamp.
class OpenCvExtractionTool : public ExtractionTool {
public:
    explicit OpenCvExtractionTool(int jpeg_quality = 95);
    ~OpenCvExtractionTool() override = default;

    void extract(const std::string& video_path,
                 double interval_seconds,
                 const std::filesystem::path& output_dir) override;

    std::string name() const override;
    bool is_available() const override;

private:
    int jpeg_quality_;
};

// "ffmpeg" or "opencv"; throws PipelineError(InvalidConfiguration) otherwise.
std::unique_ptr<ExtractionTool> create_extraction_tool(const std::string& tool_name);

// ffmpeg when it is on PATH, falling back to opencv.
std::unique_ptr<ExtractionTool> create_best_extraction_tool();

std::vector<std::string> get_available_extraction_tools();

// Number of sample points for a clip: floor(duration / interval), computed
// with a small tolerance so 10.0 / 2.5 yields 4 and not 3.
int expected_sample_count(double duration_seconds, double interval_seconds);

} // namespace vidcount
