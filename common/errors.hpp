#pragma once

// ============================================================
// errors.hpp -- Error taxonomy for hbload
//
// Every error is terminal for the run.  Each kind carries the
// process exit code main() reports it with.
// ============================================================

#include <stdexcept>
#include <string>

enum class ExitCode : int {
    OK                  = 0,
    USAGE               = 1,
    CONFIGURATION       = 2,
    NOT_FOUND           = 3,
    UNSUPPORTED         = 4,
    PACKAGING           = 5,
    COMPRESSION         = 6,
    PROTOCOL_LIMIT      = 7,
    CONNECTION          = 8,
    TRANSFER            = 9,
    FATAL               = 10,
};

class LoaderError : public std::runtime_error {
public:
    LoaderError(ExitCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ExitCode code() const { return code_; }

private:
    ExitCode code_;
};

// Bad or missing target endpoint, malformed launch argument
class ConfigurationError : public LoaderError {
public:
    explicit ConfigurationError(const std::string& msg)
        : LoaderError(ExitCode::CONFIGURATION, msg) {}
};

// Payload path absent or unreadable
class NotFoundError : public LoaderError {
public:
    explicit NotFoundError(const std::string& msg)
        : LoaderError(ExitCode::NOT_FOUND, msg) {}
};

// Wrong extension, or a directory nobody packaged
class UnsupportedArtifact : public LoaderError {
public:
    explicit UnsupportedArtifact(const std::string& msg)
        : LoaderError(ExitCode::UNSUPPORTED, msg) {}
};

// Directory could not be turned into an archive (or the user said no)
class PackagingError : public LoaderError {
public:
    explicit PackagingError(const std::string& msg)
        : LoaderError(ExitCode::PACKAGING, msg) {}
};

class CompressionError : public LoaderError {
public:
    explicit CompressionError(const std::string& msg)
        : LoaderError(ExitCode::COMPRESSION, msg) {}
};

// A length does not fit its fixed-width header field
class ProtocolLimitError : public LoaderError {
public:
    explicit ProtocolLimitError(const std::string& msg)
        : LoaderError(ExitCode::PROTOCOL_LIMIT, msg) {}
};

// TCP connect failed (unreachable, refused, unresolvable host)
class ConnectionError : public LoaderError {
public:
    explicit ConnectionError(const std::string& msg)
        : LoaderError(ExitCode::CONNECTION, msg) {}
};

// A write failed mid-session; the rest of the stream was abandoned
class TransferError : public LoaderError {
public:
    explicit TransferError(const std::string& msg)
        : LoaderError(ExitCode::TRANSFER, msg) {}
};

inline int exit_code_of(ExitCode c) { return static_cast<int>(c); }
