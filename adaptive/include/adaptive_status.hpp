#pragma once

#include <string>
#include <utility>

/*
 * ERROR KINDS FOR THE ADAPTIVE LAYER
 *
 * Components report failures as values; the AdaptationCore decides the
 * fallback. Nothing here throws.
 */

enum class ErrorKind {
    NONE,
    VALIDATION,         // malformed outcome/signal (soft-defaulted)
    STORAGE,            // state file or trade store unreadable/unwritable
    INSUFFICIENT_DATA   // resolved to a conservative default by the caller
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "none";
        case ErrorKind::VALIDATION: return "validation";
        case ErrorKind::STORAGE: return "storage";
        case ErrorKind::INSUFFICIENT_DATA: return "insufficient_data";
    }
    return "unknown";
}

struct Status {
    ErrorKind kind = ErrorKind::NONE;
    std::string message;

    bool ok() const { return kind == ErrorKind::NONE; }

    static Status success() { return Status{}; }
    static Status error(ErrorKind kind, std::string message) {
        Status s;
        s.kind = kind;
        s.message = std::move(message);
        return s;
    }
};

template <typename T>
struct Result {
    T value{};
    Status status;

    bool ok() const { return status.ok(); }

    static Result success(T value) {
        Result r;
        r.value = std::move(value);
        return r;
    }
    static Result error(ErrorKind kind, std::string message, T fallback = T{}) {
        Result r;
        r.value = std::move(fallback);
        r.status = Status::error(kind, std::move(message));
        return r;
    }
};
