// Declares the exception type raised by the capture and composition pipeline.

#pragma once

#include <stdexcept>
#include <string>

namespace framelab
{
    enum class ErrorKind
    {
        StreamUnavailable = 0,  // No decodable video stream in the container.
        SeekOutOfRange,         // Timestamp outside the stream.
        DecodeFailure,          // Image bytes could not be decoded.
        EncodeFailure,          // PNG encoding or writing failed.
        ValidationError,        // Request rejected before any work was done.
        NotFound,               // Unknown frame, video or category id.
        Timeout,                // Decode budget exhausted.
        Io
    };

    inline std::string toString(ErrorKind kind)
    {
        switch (kind)
        {
            case ErrorKind::StreamUnavailable: return "StreamUnavailable";
            case ErrorKind::SeekOutOfRange: return "SeekOutOfRange";
            case ErrorKind::DecodeFailure: return "DecodeFailure";
            case ErrorKind::EncodeFailure: return "EncodeFailure";
            case ErrorKind::ValidationError: return "ValidationError";
            case ErrorKind::NotFound: return "NotFound";
            case ErrorKind::Timeout: return "Timeout";
            case ErrorKind::Io: return "Io";
        }
        return "Unknown";
    }

    class Error : public std::runtime_error
    {
    public:
        Error(ErrorKind kind, const std::string& message)
            : std::runtime_error(toString(kind) + ": " + message)
            , kind_(kind)
        {
        }

        [[nodiscard]] ErrorKind kind() const { return kind_; }

    private:
        ErrorKind kind_;
    };
}
