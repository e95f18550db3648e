#pragma once

#include <stdexcept>
#include <string>

namespace fracktal {

/**
 * Structured error reporting for the codec.
 *
 * Degenerate input (empty or shorter than one chunk) is NOT an error: it
 * encodes to an empty artifact. Everything below is fatal for the call that
 * raised it and is always thrown, never returned as a partial result.
 */

enum class ErrorCode {
    INVALID_ARGUMENT = 1,

    // Artifact could not be decoded
    MISSING_PATTERN = 101,
    INCONSISTENT_ARTIFACT = 102,

    // Decoded artifact does not match its stored fingerprint
    INTEGRITY_VIOLATION = 200
};

class FracktalException : public std::runtime_error {
public:
    explicit FracktalException(ErrorCode code, const std::string& message,
                               const std::string& context = "",
                               const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "Fracktal error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string context_;
    std::string suggestion_;
};

class InvalidArgumentError : public FracktalException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : FracktalException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

// The artifact is corrupted: a reference has no dictionary entry, or the
// chunk table and symbol stream disagree. No output is produced.
class DecodeError : public FracktalException {
public:
    DecodeError(const std::string& message, const std::string& context, ErrorCode code)
        : FracktalException(code, message, context,
                            "Treat the artifact as corrupted and re-read it from another replica") {}
};

// Fingerprint recomputed after decode differs from the stored one
class IntegrityError : public FracktalException {
public:
    IntegrityError(const std::string& expected, const std::string& actual,
                   const std::string& context = "")
        : FracktalException(ErrorCode::INTEGRITY_VIOLATION,
                            "Fingerprint mismatch: stored " + expected + ", recomputed " + actual,
                            context,
                            "Do not repair; discard the artifact and restore from a trusted copy")
        , expected_(expected)
        , actual_(actual) {}

    const std::string& expected() const noexcept { return expected_; }
    const std::string& actual() const noexcept { return actual_; }

private:
    std::string expected_;
    std::string actual_;
};

class ErrorHandler {
public:
    static void check_argument(bool condition, const std::string& message,
                               const std::string& context = "") {
        if (!condition) {
            throw InvalidArgumentError(message, context);
        }
    }

    static void check_decode(bool condition, ErrorCode code, const std::string& message,
                             const std::string& context = "") {
        if (!condition) {
            throw DecodeError(message, context, code);
        }
    }
};

#define FRACKTAL_CHECK_ARGUMENT(condition, message) \
    fracktal::ErrorHandler::check_argument(condition, message, __func__)

#define FRACKTAL_CHECK_DECODE(condition, code, message) \
    fracktal::ErrorHandler::check_decode(condition, code, message, __func__)

} // namespace fracktal
