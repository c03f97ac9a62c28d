#pragma once

#include <exception>
#include <optional>
#include <string>
#include <string_view>

namespace chatgate::core {

// Error codes organized by category
enum class ErrorCode {
    // Success
    Ok = 0,

    // General errors (1-99)
    Unknown = 1,
    InvalidArgument = 2,
    Timeout = 6,
    Cancelled = 7,
    InternalError = 9,
    InvalidState = 10,

    // LLM errors (200-299)
    LLMConnectionFailed = 200,
    LLMRateLimited = 201,
    LLMContextOverflow = 202,
    LLMInvalidResponse = 203,
    LLMApiKeyMissing = 204,
    LLMProviderUnavailable = 205,
    LLMStreamError = 207,
    LLMAuthFailed = 208,
    LLMInvalidRequest = 209,
    LLMProviderUnknown = 210,

    // Tokenizer errors (500-599)
    TokenizerLoadFailed = 500,

    // Configuration errors (600-699)
    ConfigNotFound = 600,
    ConfigParseFailed = 601,
    ConfigValidationFailed = 602,
    ConfigKeyMissing = 603,

    // Network errors (800-899)
    NetworkError = 800,
    ConnectionRefused = 801,
    DNSResolutionFailed = 802,
    SSLError = 803,
};

// Get human-readable message for error code
inline std::string_view error_code_message(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::Cancelled: return "Operation cancelled";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::InvalidState: return "Invalid state";

        case ErrorCode::LLMConnectionFailed: return "Failed to connect to LLM provider";
        case ErrorCode::LLMRateLimited: return "LLM rate limit exceeded";
        case ErrorCode::LLMContextOverflow: return "Context window exceeded";
        case ErrorCode::LLMInvalidResponse: return "Invalid response from LLM";
        case ErrorCode::LLMApiKeyMissing: return "API key not configured";
        case ErrorCode::LLMProviderUnavailable: return "LLM provider unavailable";
        case ErrorCode::LLMStreamError: return "Streaming error";
        case ErrorCode::LLMAuthFailed: return "LLM provider rejected credentials";
        case ErrorCode::LLMInvalidRequest: return "LLM provider rejected request";
        case ErrorCode::LLMProviderUnknown: return "Unknown LLM provider";

        case ErrorCode::TokenizerLoadFailed: return "Failed to load tokenizer vocabulary";

        case ErrorCode::ConfigNotFound: return "Configuration file not found";
        case ErrorCode::ConfigParseFailed: return "Failed to parse configuration";
        case ErrorCode::ConfigValidationFailed: return "Configuration validation failed";
        case ErrorCode::ConfigKeyMissing: return "Required configuration key missing";

        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::ConnectionRefused: return "Connection refused";
        case ErrorCode::DNSResolutionFailed: return "DNS resolution failed";
        case ErrorCode::SSLError: return "SSL/TLS error";
    }
    return "Unknown error code";
}

// Check if error is retriable by the caller. The gateway itself never retries.
inline bool is_retriable(ErrorCode code) {
    switch (code) {
        case ErrorCode::LLMRateLimited:
        case ErrorCode::LLMConnectionFailed:
        case ErrorCode::LLMProviderUnavailable:
        case ErrorCode::LLMStreamError:
        case ErrorCode::NetworkError:
        case ErrorCode::ConnectionRefused:
        case ErrorCode::Timeout:
            return true;
        default:
            return false;
    }
}

// Errors raised before any network attempt is made
inline bool is_configuration_error(ErrorCode code) {
    switch (code) {
        case ErrorCode::LLMApiKeyMissing:
        case ErrorCode::LLMProviderUnknown:
        case ErrorCode::TokenizerLoadFailed:
        case ErrorCode::ConfigNotFound:
        case ErrorCode::ConfigParseFailed:
        case ErrorCode::ConfigValidationFailed:
        case ErrorCode::ConfigKeyMissing:
            return true;
        default:
            return false;
    }
}

// Errors that terminate an in-flight stream
inline bool is_transport_error(ErrorCode code) {
    switch (code) {
        case ErrorCode::Timeout:
        case ErrorCode::LLMConnectionFailed:
        case ErrorCode::LLMRateLimited:
        case ErrorCode::LLMInvalidResponse:
        case ErrorCode::LLMProviderUnavailable:
        case ErrorCode::LLMStreamError:
        case ErrorCode::LLMAuthFailed:
        case ErrorCode::LLMInvalidRequest:
        case ErrorCode::NetworkError:
        case ErrorCode::ConnectionRefused:
        case ErrorCode::DNSResolutionFailed:
        case ErrorCode::SSLError:
            return true;
        default:
            return false;
    }
}

// Error structure with context
struct Error {
    ErrorCode code;
    std::string message;
    std::optional<std::string> context;  // Additional context (file path, endpoint, etc.)
    std::optional<std::string> source;   // Component that raised it

    Error() : code(ErrorCode::Unknown) {}

    Error(ErrorCode c) : code(c), message(std::string(error_code_message(c))) {}

    Error(ErrorCode c, std::string msg)
        : code(c), message(std::move(msg)) {}

    Error(ErrorCode c, std::string msg, std::string ctx)
        : code(c), message(std::move(msg)), context(std::move(ctx)) {}

    static Error from_exception(const std::exception& e) {
        return Error{ErrorCode::InternalError, e.what()};
    }

    // Predicates
    bool is_retriable() const { return chatgate::core::is_retriable(code); }
    bool is_configuration_error() const { return chatgate::core::is_configuration_error(code); }
    bool is_transport_error() const { return chatgate::core::is_transport_error(code); }

    // Get full error message
    std::string full_message() const {
        std::string result = message;
        if (context) {
            result += " [" + *context + "]";
        }
        if (source) {
            result += " at " + *source;
        }
        return result;
    }

    // For logging
    std::string to_string() const {
        return "[" + std::to_string(static_cast<int>(code)) + "] " + full_message();
    }
};

}  // namespace chatgate::core
