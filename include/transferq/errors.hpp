#pragma once

#include <stdexcept>
#include <string>

namespace transferq {

enum class ErrorKind {
    Transport,
    Archive,
    Validation,
    Capacity
};

[[nodiscard]] const char* toString(ErrorKind kind) noexcept;

class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// Network or IO failure; retried by the scheduler with bounded backoff.
class TransportError : public TransferError {
public:
    explicit TransportError(const std::string& message, bool retryable = true)
        : TransferError(ErrorKind::Transport, message), retryable_(retryable) {}

    // False for failures a retry cannot fix (404, malformed URL).
    [[nodiscard]] bool retryable() const noexcept { return retryable_; }

private:
    bool retryable_;
};

// Corrupt or unsupported archive content. Terminal on first occurrence.
class ArchiveError : public TransferError {
public:
    explicit ArchiveError(const std::string& message)
        : TransferError(ErrorKind::Archive, message) {}
};

// Malformed command input (bad permutation, unknown hash). State is untouched.
class ValidationError : public TransferError {
public:
    explicit ValidationError(const std::string& message)
        : TransferError(ErrorKind::Validation, message) {}
};

class CapacityError : public TransferError {
public:
    explicit CapacityError(const std::string& message)
        : TransferError(ErrorKind::Capacity, message) {}
};

} // namespace transferq
