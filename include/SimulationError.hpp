#pragma once

#include <stdexcept>
#include <string>

namespace trafficjam
{
    enum class ErrorKind
    {
        ConfigurationError,
        ShapeOrCountMismatch,
        CorruptArtifact,
        VersionMismatch,
        InvalidRunnerState
    };

    inline const char *toString(ErrorKind kind)
    {
        switch (kind)
        {
        case ErrorKind::ConfigurationError:
            return "ConfigurationError";
        case ErrorKind::ShapeOrCountMismatch:
            return "ShapeOrCountMismatch";
        case ErrorKind::CorruptArtifact:
            return "CorruptArtifact";
        case ErrorKind::VersionMismatch:
            return "VersionMismatch";
        case ErrorKind::InvalidRunnerState:
            return "InvalidRunnerState";
        }
        return "ConfigurationError";
    }

    class SimulationError : public std::runtime_error
    {
    public:
        SimulationError(ErrorKind kind, const std::string &message)
            : std::runtime_error(std::string(toString(kind)) + ": " + message), error_kind(kind)
        {
        }

        ErrorKind kind() const { return error_kind; }

    private:
        ErrorKind error_kind;
    };

} // namespace trafficjam
