/**
 * @file TransientFile.hpp
 * @brief Uniquely named temporary file removed when its owner goes out of scope.
 */

#pragma once
#include <filesystem>
#include <string>

namespace voicescribe::infrastructure {

/**
 * @class TransientFile
 * @brief Owns one path in the temp directory for the lifetime of a conversion.
 *
 * The name embeds a random UUID so concurrent owners never collide. The file
 * is not created until something writes to it; the destructor removes it if
 * present and never throws.
 */
class TransientFile {
public:
    /**
     * @param suffix Appended to the generated name, e.g. ".wav".
     * @param directory Parent directory; the system temp directory when empty.
     */
    explicit TransientFile(const std::string& suffix, const std::filesystem::path& directory = {});
    ~TransientFile();

    TransientFile(const TransientFile&) = delete;
    TransientFile& operator=(const TransientFile&) = delete;

    const std::filesystem::path& path() const { return m_path; }

    /** @brief Replaces the file contents. Throws std::runtime_error on I/O failure. */
    void write(const std::string& bytes) const;

    /** @brief Reads the whole file. Throws std::runtime_error if it is missing or unreadable. */
    std::string read() const;

    /** @brief Removes the file now; safe to call repeatedly. */
    void release() noexcept;

    /** @brief Random lowercase UUID string. */
    static std::string GenerateId();

private:
    std::filesystem::path m_path;
};

} // namespace voicescribe::infrastructure
