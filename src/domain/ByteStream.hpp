/**
 * @file ByteStream.hpp
 * @brief Pull-based source of network chunks.
 */

#pragma once
#include <string>

namespace voicescribe::domain {

/**
 * @class ByteStream
 * @brief Yields a response body as it arrives, in arbitrarily sized chunks.
 */
class ByteStream {
public:
    virtual ~ByteStream() = default;

    /**
     * @brief Reads the next chunk.
     * @param chunk Replaced with the chunk contents.
     * @return False once the stream has ended. Throws TransportFailure on read errors.
     */
    virtual bool read(std::string& chunk) = 0;
};

} // namespace voicescribe::domain
