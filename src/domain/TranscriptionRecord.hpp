/**
 * @file TranscriptionRecord.hpp
 * @brief Client-side history entry for a finished transcription.
 */

#pragma once
#include <optional>
#include <string>

namespace voicescribe::domain {

/**
 * @struct TranscriptionRecord
 * @brief A saved transcript and where its audio came from.
 */
struct TranscriptionRecord {
    enum class Source { Recording, File };

    std::string id; ///< "<epoch-ms>-<random>" assigned on creation.
    std::string text; ///< Final transcript.
    Source source = Source::File;
    std::optional<std::string> fileName; ///< Original file name for Source::File.
    std::optional<double> duration; ///< Audio length in seconds, when known.
    std::string createdAt; ///< ISO-8601 UTC timestamp.

    static std::string SourceToString(Source s) {
        switch (s) {
            case Source::Recording: return "recording";
            case Source::File: return "file";
        }
        return "file";
    }

    static std::optional<Source> SourceFromString(const std::string& value) {
        if (value == "recording") return Source::Recording;
        if (value == "file") return Source::File;
        return std::nullopt;
    }
};

/**
 * @struct NewTranscription
 * @brief Fields supplied by the caller when saving a record.
 */
struct NewTranscription {
    std::string text;
    TranscriptionRecord::Source source = TranscriptionRecord::Source::File;
    std::optional<std::string> fileName;
    std::optional<double> duration;
};

} // namespace voicescribe::domain
