/**
 * @file TranscriptionRepository.hpp
 * @brief Interface for the transcription history store.
 */

#pragma once
#include "domain/TranscriptionRecord.hpp"
#include <optional>
#include <string>
#include <vector>

namespace voicescribe::domain {

/**
 * @class TranscriptionRepository
 * @brief Abstract storage of transcription records.
 */
class TranscriptionRepository {
public:
    virtual ~TranscriptionRepository() = default;

    /** @brief Looks up one record by id. */
    virtual std::optional<TranscriptionRecord> get(const std::string& id) = 0;

    /** @brief All records, newest first. */
    virtual std::vector<TranscriptionRecord> list() = 0;

    /**
     * @brief Stores a new record, assigning its id and creation time.
     * @return The stored record.
     */
    virtual TranscriptionRecord create(const NewTranscription& data) = 0;

    /**
     * @brief Deletes a record.
     * @return False if no record had that id.
     */
    virtual bool remove(const std::string& id) = 0;
};

} // namespace voicescribe::domain
