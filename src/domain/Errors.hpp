/**
 * @file Errors.hpp
 * @brief Exception taxonomy shared by the relay server and the client.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace voicescribe::domain {

/**
 * @class VoiceScribeError
 * @brief Base for every failure the pipeline reports to a caller.
 */
class VoiceScribeError : public std::runtime_error {
public:
    explicit VoiceScribeError(const std::string& message) : std::runtime_error(message) {}
};

/** @brief Request body missing or malformed. Reported as HTTP 400. */
class InvalidRequest : public VoiceScribeError {
public:
    explicit InvalidRequest(const std::string& message) : VoiceScribeError(message) {}
};

/**
 * @class ConversionFailure
 * @brief External converter could not be launched, timed out or exited non-zero.
 */
class ConversionFailure : public VoiceScribeError {
public:
    /** Exit code used when the process never produced one (launch failure). */
    static constexpr int kNoExitCode = -1;

    ConversionFailure(const std::string& message, int exitCode = kNoExitCode)
        : VoiceScribeError(message), m_exitCode(exitCode) {}

    int exitCode() const { return m_exitCode; }

private:
    int m_exitCode;
};

/**
 * @class UpstreamFailure
 * @brief Transcription provider call failed, before or during streaming.
 */
class UpstreamFailure : public VoiceScribeError {
public:
    UpstreamFailure(const std::string& message, int httpStatus = 0)
        : VoiceScribeError(message), m_httpStatus(httpStatus) {}

    /** @brief HTTP status returned by the provider, 0 when no response was received. */
    int httpStatus() const { return m_httpStatus; }

private:
    int m_httpStatus;
};

/** @brief A wire frame parsed as JSON but does not describe a valid event. */
class MalformedWireFrame : public VoiceScribeError {
public:
    explicit MalformedWireFrame(const std::string& message) : VoiceScribeError(message) {}
};

/** @brief Network read or write failure on either side of the relay. */
class TransportFailure : public VoiceScribeError {
public:
    explicit TransportFailure(const std::string& message) : VoiceScribeError(message) {}
};

/** @brief The relay terminated the stream with an error event. */
class RelayReportedError : public VoiceScribeError {
public:
    explicit RelayReportedError(const std::string& message) : VoiceScribeError(message) {}
};

} // namespace voicescribe::domain
