#pragma once

#include <stdexcept>
#include <string>

#include "Recognition/RecognitionMessages.hpp"

namespace voice_search {

// Inbound message carried a non-ok status. Fatal for the session.
class ServerErrorException : public std::runtime_error {
public:
    ServerErrorException(StatusCode code, const std::string& message)
        : std::runtime_error("Server error: " + message)
        , _code(code) {}

    StatusCode GetCode() const { return _code; }

private:
    StatusCode _code;
};

// The stream was cancelled locally; expected on interrupt.
class StreamCancelledException : public std::runtime_error {
public:
    StreamCancelledException() : std::runtime_error("Recognition stream cancelled") {}
};

// Connect failure, socket error, malformed message or deadline exceeded.
class RecognitionStreamException : public std::runtime_error {
public:
    explicit RecognitionStreamException(const std::string& message)
        : std::runtime_error(message) {}
};

// Inbound half of a bidirectional recognition stream.
class IRecognitionStream {
public:
    virtual ~IRecognitionStream() = default;

    // Blocks for the next response in arrival order. Returns false when the
    // server has finished. Throws StreamCancelledException after Cancel().
    virtual bool Read(StreamingResponse& response) = 0;

    // Must be async-signal-safe.
    virtual void Cancel() noexcept = 0;

    // Releases the transport once capture has stopped. Safe to call twice.
    virtual void Close() = 0;
};

} // namespace voice_search
