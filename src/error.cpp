#include "docflow/error.hpp"

namespace docflow {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "SUCCESS";
        case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case ErrorCode::CONNECTION_FAILED: return "CONNECTION_FAILED";
        case ErrorCode::CONNECTION_LOST: return "CONNECTION_LOST";
        case ErrorCode::HEARTBEAT_TIMEOUT: return "HEARTBEAT_TIMEOUT";
        case ErrorCode::MALFORMED_FRAGMENT: return "MALFORMED_FRAGMENT";
        case ErrorCode::CONFLICTING_TOTAL: return "CONFLICTING_TOTAL";
        case ErrorCode::SESSION_EXPIRED: return "SESSION_EXPIRED";
        case ErrorCode::LOAD_FAILED: return "LOAD_FAILED";
        case ErrorCode::SPLIT_FAILED: return "SPLIT_FAILED";
        case ErrorCode::EMBED_FAILED: return "EMBED_FAILED";
        case ErrorCode::STORE_FAILED: return "STORE_FAILED";
        case ErrorCode::DUPLICATE_STAGE: return "DUPLICATE_STAGE";
        case ErrorCode::UNKNOWN_STAGE: return "UNKNOWN_STAGE";
        case ErrorCode::MALFORMED_MESSAGE: return "MALFORMED_MESSAGE";
    }
    return "UNKNOWN";
}

std::string DocflowException::describe() const {
    std::string result = std::string("[") + error_code_name(code_) + "] " + what();
    if (!context_.empty()) {
        result += " (" + context_ + ")";
    }
    return result;
}

} // namespace docflow
