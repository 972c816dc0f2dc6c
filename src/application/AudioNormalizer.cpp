#include "application/AudioNormalizer.hpp"
#include "domain/FormatSniffer.hpp"

#include <iostream>

namespace voicescribe::application {

AudioNormalizer::AudioNormalizer(std::shared_ptr<FormatConverter> converter)
    : m_converter(std::move(converter)) {}

domain::NormalizedAudio AudioNormalizer::normalize(const std::string& bytes) {
    domain::AudioBuffer buffer{bytes, domain::FormatSniffer::Classify(bytes)};
    std::cout << "[AudioNormalizer] Detected format: " << domain::AudioFormatToString(buffer.format)
              << " (" << buffer.bytes.size() << " bytes)" << std::endl;

    if (domain::IsUpstreamAccepted(buffer.format)) {
        return {std::move(buffer.bytes), domain::AudioFormatToString(buffer.format)};
    }
    return m_converter->convert(buffer.bytes);
}

} // namespace voicescribe::application
