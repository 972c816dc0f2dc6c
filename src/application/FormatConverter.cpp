#include "application/FormatConverter.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/TransientFile.hpp"

#include <iostream>
#include <system_error>

namespace voicescribe::application {

FormatConverter::FormatConverter(std::shared_ptr<domain::ProcessRunner> runner,
                                 const std::string& ffmpegPath,
                                 std::size_t maxConcurrent,
                                 const std::filesystem::path& workDir)
    : m_runner(std::move(runner))
    , m_ffmpegPath(ffmpegPath)
    , m_workDir(workDir)
    , m_gate(maxConcurrent)
{}

std::vector<std::string> FormatConverter::BuildArguments(const std::string& inputPath, const std::string& outputPath) {
    return {
        "-y",
        "-loglevel", "error",
        "-i", inputPath,
        "-vn",
        "-f", "wav",
        "-ar", "16000",
        "-ac", "1",
        "-acodec", "pcm_s16le",
        outputPath
    };
}

domain::NormalizedAudio FormatConverter::convert(const std::string& bytes) {
    ConversionGate::Slot slot(m_gate);

    std::filesystem::path workDir = m_workDir;
    if (workDir.empty()) {
        std::error_code ec;
        workDir = std::filesystem::temp_directory_path(ec);
        if (ec) {
            throw domain::ConversionFailure("No usable temporary directory for conversion: " + ec.message());
        }
    }

    // Declared before any work so both are released on every exit path.
    infrastructure::TransientFile input(".input", workDir);
    infrastructure::TransientFile output(".wav", workDir);

    try {
        input.write(bytes);
    } catch (const std::exception& e) {
        throw domain::ConversionFailure(std::string("Could not stage audio for conversion: ") + e.what());
    }

    std::cout << "[FormatConverter] Converting " << bytes.size() << " bytes to WAV" << std::endl;
    domain::ProcessResult result = m_runner->run(m_ffmpegPath, BuildArguments(input.path().string(), output.path().string()));

    if (!result.launched) {
        std::cerr << "[FormatConverter] Launch failed: " << result.error << std::endl;
        throw domain::ConversionFailure("Audio conversion could not start: " + result.error);
    }
    if (result.timedOut) {
        throw domain::ConversionFailure("Audio conversion timed out", result.exitCode);
    }
    if (result.exitCode != 0) {
        std::cerr << "[FormatConverter] " << m_ffmpegPath << " exited with code " << result.exitCode << std::endl;
        throw domain::ConversionFailure("Audio conversion failed with code " + std::to_string(result.exitCode), result.exitCode);
    }

    domain::NormalizedAudio normalized;
    try {
        normalized.bytes = output.read();
    } catch (const std::exception& e) {
        throw domain::ConversionFailure(std::string("Converted audio not found: ") + e.what(), result.exitCode);
    }
    normalized.extension = "wav";
    std::cout << "[FormatConverter] Produced " << normalized.bytes.size() << " bytes of WAV" << std::endl;
    return normalized;
}

} // namespace voicescribe::application
