#pragma once

#include <stdexcept>
#include <string>

enum class RecomputeErrorKind {
    LedgerUnavailable,
    PersistFailed,
    Aborted,
    Internal
};

inline std::string to_string(RecomputeErrorKind kind) {
    switch (kind) {
        case RecomputeErrorKind::LedgerUnavailable: return "ledger_unavailable";
        case RecomputeErrorKind::PersistFailed: return "persist_failed";
        case RecomputeErrorKind::Aborted: return "aborted";
        case RecomputeErrorKind::Internal: return "internal";
    }
    return "internal";
}

// A full refresh failed; the previous snapshot stays in place
class RecomputeError : public std::runtime_error {
public:
    RecomputeError(RecomputeErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    RecomputeErrorKind kind() const { return kind_; }

private:
    RecomputeErrorKind kind_;
};

// Rejected input at write time (e.g. a non-positive weight override)
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message)
        : std::runtime_error(message) {}
};
