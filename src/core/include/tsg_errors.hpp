#pragma once

/**
 * @file tsg_errors.hpp
 * @brief Exception hierarchy for the guard pipeline and chaos harness
 *
 * Detection-path errors (MalformedInputError, PatternEngineError,
 * WindowStateError) are caught at their component boundary and turned into
 * rejections or degraded verdicts. Harness errors (FaultApplicationError,
 * ScoringError) become structured findings in the resilience report.
 */

#include <stdexcept>
#include <string>

namespace tsg {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class MalformedInputError : public Error {
public:
    enum class Reason {
        MISSING_FIELD,
        WRONG_TYPE,
        INVALID_VALUE,
        UNDECODABLE,
        LIMIT_EXCEEDED,
        STRUCTURE,
        PROTOCOL,
        ORDERING
    };

    MalformedInputError(Reason reason, std::string field, const std::string& msg)
        : Error(msg), reason_(reason), field_(std::move(field)) {}

    Reason reason() const noexcept { return reason_; }
    const std::string& field() const noexcept { return field_; }

private:
    Reason reason_;
    std::string field_;
};

const char* reason_to_string(MalformedInputError::Reason reason) noexcept;

class PatternEngineError : public Error {
public:
    using Error::Error;
};

class WindowStateError : public Error {
public:
    WindowStateError(std::string identity, const std::string& msg)
        : Error(msg), identity_(std::move(identity)) {}

    const std::string& identity() const noexcept { return identity_; }

private:
    std::string identity_;
};

class FaultApplicationError : public Error {
public:
    using Error::Error;
};

class ScoringError : public Error {
public:
    ScoringError(std::string category, const std::string& msg)
        : Error(msg), category_(std::move(category)) {}

    const std::string& category() const noexcept { return category_; }

private:
    std::string category_;
};

class ConfigError : public Error {
public:
    using Error::Error;
};

} // namespace tsg
