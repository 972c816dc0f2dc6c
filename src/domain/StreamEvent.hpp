/**
 * @file StreamEvent.hpp
 * @brief Events carried by the transcription stream.
 */

#pragma once
#include <string>

namespace voicescribe::domain {

/**
 * @struct StreamEvent
 * @brief One event of the relay stream.
 *
 * A well-formed stream is zero or more Delta events followed by exactly one
 * Done or Error event.
 */
struct StreamEvent {
    enum class Type { Delta, Done, Error };

    Type type = Type::Delta;
    std::string text; ///< Fragment (Delta), final transcript (Done) or message (Error).

    static StreamEvent Delta(const std::string& fragment) { return {Type::Delta, fragment}; }
    static StreamEvent Done(const std::string& transcript) { return {Type::Done, transcript}; }
    static StreamEvent Error(const std::string& message) { return {Type::Error, message}; }

    static std::string TypeToString(Type t) {
        switch (t) {
            case Type::Delta: return "delta";
            case Type::Done: return "done";
            case Type::Error: return "error";
        }
        return "error";
    }
};

} // namespace voicescribe::domain
