#pragma once
#include <stdexcept>
#include <string>

// Thrown by collaborators (REST client, WS transport, parsers).
struct UpstreamError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct SubscriptionError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct DecodeFailure : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Returned (not thrown) by the cache service.
enum class SummaryErrorCode {
    UpstreamUnavailable,
    SubscriptionFailed,
    DecodeError,
    // Nothing cached yet. Expected right after startup.
    EmptyCache,
};

struct SummaryError {
    SummaryErrorCode code;
    std::string message;
};

inline const char* to_cstr(SummaryErrorCode c) {
    switch (c) {
        case SummaryErrorCode::UpstreamUnavailable: return "UpstreamUnavailable";
        case SummaryErrorCode::SubscriptionFailed:  return "SubscriptionFailed";
        case SummaryErrorCode::DecodeError:         return "DecodeError";
        case SummaryErrorCode::EmptyCache:          return "EmptyCache";
    }
    return "?";
}
