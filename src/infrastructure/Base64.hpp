#pragma once

#include <optional>
#include <string>

namespace voicescribe::infrastructure {

/**
 * @brief Base64 codec for audio payloads carried in JSON bodies.
 */
class Base64 {
public:
    /** @brief Standard alphabet with '=' padding. */
    static std::string Encode(const std::string& bytes);

    /**
     * @brief Decodes standard or URL-safe base64.
     * Whitespace is skipped and padding is optional.
     * @return std::nullopt on any other character or a truncated final quantum.
     */
    static std::optional<std::string> Decode(const std::string& text);
};

} // namespace voicescribe::infrastructure
