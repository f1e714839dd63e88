#pragma once

#include <stdexcept>
#include <string>

namespace docflow {

/**
 * Error taxonomy for the ingestion core.
 *
 * Transport errors stay inside the Resilient Channel, reassembly errors
 * discard a single transfer, stage errors terminate a single file's run and
 * configuration errors are either fatal at boot (duplicates) or degrade to a
 * per-file stage error (unknown stage).
 */
enum class ErrorCode {
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,

    // Transport errors
    CONNECTION_FAILED = 100,
    CONNECTION_LOST = 101,
    HEARTBEAT_TIMEOUT = 102,

    // Reassembly errors
    MALFORMED_FRAGMENT = 200,
    CONFLICTING_TOTAL = 201,
    SESSION_EXPIRED = 202,

    // Stage errors
    LOAD_FAILED = 300,
    SPLIT_FAILED = 301,
    EMBED_FAILED = 302,
    STORE_FAILED = 303,

    // Configuration errors
    DUPLICATE_STAGE = 400,
    UNKNOWN_STAGE = 401,

    // Wire protocol errors
    MALFORMED_MESSAGE = 500
};

const char* error_code_name(ErrorCode code);

class DocflowException : public std::runtime_error {
public:
    explicit DocflowException(ErrorCode code, const std::string& message,
                              const std::string& context = "")
        : std::runtime_error(message)
        , code_(code)
        , context_(context) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& context() const noexcept { return context_; }

    // "[CODE] message (context)" for logs
    std::string describe() const;

private:
    ErrorCode code_;
    std::string context_;
};

class InvalidArgumentError : public DocflowException {
public:
    explicit InvalidArgumentError(const std::string& message, const std::string& context = "")
        : DocflowException(ErrorCode::INVALID_ARGUMENT, message, context) {}
};

class TransportError : public DocflowException {
public:
    explicit TransportError(const std::string& message, const std::string& context = "",
                            ErrorCode code = ErrorCode::CONNECTION_LOST)
        : DocflowException(code, message, context) {}
};

class ReassemblyError : public DocflowException {
public:
    explicit ReassemblyError(const std::string& message, const std::string& transfer_id = "",
                             ErrorCode code = ErrorCode::MALFORMED_FRAGMENT)
        : DocflowException(code, message, transfer_id) {}

    const std::string& transfer_id() const noexcept { return context(); }
};

class ProtocolError : public DocflowException {
public:
    explicit ProtocolError(const std::string& message, const std::string& context = "")
        : DocflowException(ErrorCode::MALFORMED_MESSAGE, message, context) {}
};

// Stage failures raised by collaborator implementations
class StageError : public DocflowException {
public:
    StageError(ErrorCode code, const std::string& message, const std::string& context = "")
        : DocflowException(code, message, context) {}
};

class LoadError : public StageError {
public:
    explicit LoadError(const std::string& message, const std::string& context = "")
        : StageError(ErrorCode::LOAD_FAILED, message, context) {}
};

class SplitError : public StageError {
public:
    explicit SplitError(const std::string& message, const std::string& context = "")
        : StageError(ErrorCode::SPLIT_FAILED, message, context) {}
};

class EmbedError : public StageError {
public:
    explicit EmbedError(const std::string& message, const std::string& context = "")
        : StageError(ErrorCode::EMBED_FAILED, message, context) {}
};

class StoreError : public StageError {
public:
    explicit StoreError(const std::string& message, const std::string& context = "")
        : StageError(ErrorCode::STORE_FAILED, message, context) {}
};

class ConfigurationError : public DocflowException {
public:
    ConfigurationError(ErrorCode code, const std::string& message, const std::string& context = "")
        : DocflowException(code, message, context) {}
};

class DuplicateStageError : public ConfigurationError {
public:
    explicit DuplicateStageError(const std::string& message, const std::string& context = "")
        : ConfigurationError(ErrorCode::DUPLICATE_STAGE, message, context) {}
};

class UnknownStageError : public ConfigurationError {
public:
    explicit UnknownStageError(const std::string& message, const std::string& context = "")
        : ConfigurationError(ErrorCode::UNKNOWN_STAGE, message, context) {}
};

#define DOCFLOW_CHECK_ARGUMENT(condition, message) \
    do { if (!(condition)) throw docflow::InvalidArgumentError(message, __func__); } while (0)

} // namespace docflow
