#pragma once
// Exception taxonomy. Absent keys are never errors; everything below is.
#include <stdexcept>
#include <string>

namespace cachex {

class CacheError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// incr on a missing/non-integer key, rename of a missing source, ...
class PreconditionError : public CacheError {
public:
    PreconditionError(const std::string& key, const std::string& message)
        : CacheError(message), key_(key) {}

    [[nodiscard]] const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

class IndexOutOfRangeError : public PreconditionError {
public:
    IndexOutOfRangeError(const std::string& key, long long index)
        : PreconditionError(key, "list index " + std::to_string(index) +
                                 " out of range for key '" + key + "'"),
          index_(index) {}

    [[nodiscard]] long long index() const noexcept { return index_; }

private:
    long long index_;
};

// The operation exists on the native engine but not on this backend.
class NotSupportedError : public CacheError {
public:
    NotSupportedError(const std::string& operation, const std::string& backend)
        : CacheError("Operation '" + operation + "' is not supported by " + backend),
          operation_(operation), backend_(backend) {}

    [[nodiscard]] const std::string& operation() const noexcept { return operation_; }
    [[nodiscard]] const std::string& backend() const noexcept { return backend_; }

private:
    std::string operation_;
    std::string backend_;
};

class SerializerError : public CacheError {
public:
    using CacheError::CacheError;
};

class CompressorError : public CacheError {
public:
    using CacheError::CacheError;
};

class DatabaseError : public CacheError {
public:
    explicit DatabaseError(const std::string& message, std::string sqlstate = {})
        : CacheError(message), sqlstate_(std::move(sqlstate)) {}

    // Five-character SQLSTATE, empty when the failure happened client-side
    [[nodiscard]] const std::string& sqlstate() const noexcept { return sqlstate_; }

private:
    std::string sqlstate_;
};

class ConfigError : public CacheError {
public:
    using CacheError::CacheError;
};

} // namespace cachex
