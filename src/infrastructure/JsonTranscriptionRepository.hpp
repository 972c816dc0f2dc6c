/**
 * @file JsonTranscriptionRepository.hpp
 * @brief TranscriptionRepository persisted as a single JSON array file.
 */

#pragma once
#include "domain/TranscriptionRepository.hpp"
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace voicescribe::infrastructure {

/**
 * @class JsonTranscriptionRepository
 * @brief Keeps records in memory, newest first, and rewrites the file atomically on every change.
 */
class JsonTranscriptionRepository : public domain::TranscriptionRepository {
public:
    /**
     * @param filePath JSON file holding the record array; created on first write.
     */
    explicit JsonTranscriptionRepository(const std::filesystem::path& filePath);

    std::optional<domain::TranscriptionRecord> get(const std::string& id) override;
    std::vector<domain::TranscriptionRecord> list() override;
    domain::TranscriptionRecord create(const domain::NewTranscription& data) override;
    bool remove(const std::string& id) override;

    /** @brief "<epoch-ms>-<9 base36 chars>". */
    static std::string GenerateId();

    /** @brief Current UTC time as ISO-8601 with milliseconds. */
    static std::string CurrentTimestamp();

private:
    void load();
    /** @brief Writes temp file then renames over the target. Throws std::runtime_error on failure. */
    void persist() const;

    std::filesystem::path m_filePath;
    std::vector<domain::TranscriptionRecord> m_records;
    mutable std::mutex m_mutex;
};

} // namespace voicescribe::infrastructure
