/**
 * @file FormatConverter.hpp
 * @brief Converts arbitrary audio containers to 16 kHz mono PCM WAV through ffmpeg.
 */

#pragma once
#include "application/ConversionGate.hpp"
#include "domain/AudioFormat.hpp"
#include "domain/ProcessRunner.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace voicescribe::application {

/**
 * @class FormatConverter
 * @brief Runs one external conversion per call over a pair of transient files.
 *
 * Input and output files are uniquely named per call and are removed before
 * convert() returns, whether it succeeds or throws.
 */
class FormatConverter {
public:
    /**
     * @param runner Launches the converter executable.
     * @param ffmpegPath Converter executable name or path.
     * @param maxConcurrent Maximum simultaneous conversions across all callers.
     * @param workDir Directory for transient files; the system temp directory when empty.
     */
    FormatConverter(std::shared_ptr<domain::ProcessRunner> runner,
                    const std::string& ffmpegPath = "ffmpeg",
                    std::size_t maxConcurrent = 4,
                    const std::filesystem::path& workDir = {});

    /**
     * @brief Converts the bytes to WAV.
     * @throws domain::ConversionFailure when the converter fails, times out or cannot start.
     */
    domain::NormalizedAudio convert(const std::string& bytes);

    /** @brief Converter arguments: no video, WAV container, 16 kHz, mono, s16le, overwrite. */
    static std::vector<std::string> BuildArguments(const std::string& inputPath, const std::string& outputPath);

private:
    std::shared_ptr<domain::ProcessRunner> m_runner;
    std::string m_ffmpegPath;
    std::filesystem::path m_workDir;
    ConversionGate m_gate;
};

} // namespace voicescribe::application
