/**
 * @file AudioNormalizer.hpp
 * @brief Brings request audio into a format the upstream provider accepts.
 */

#pragma once
#include "application/FormatConverter.hpp"
#include "domain/AudioFormat.hpp"
#include <memory>
#include <string>

namespace voicescribe::application {

/**
 * @class AudioNormalizer
 * @brief Classifies bytes and converts them only when they are not wav or mp3.
 */
class AudioNormalizer {
public:
    explicit AudioNormalizer(std::shared_ptr<FormatConverter> converter);

    /**
     * @brief Passes wav/mp3 through untouched; everything else goes through the converter.
     * @throws domain::ConversionFailure from the converter.
     */
    domain::NormalizedAudio normalize(const std::string& bytes);

private:
    std::shared_ptr<FormatConverter> m_converter;
};

} // namespace voicescribe::application
