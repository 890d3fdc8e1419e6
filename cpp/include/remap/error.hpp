#pragma once

#include <stdexcept>
#include <string>

namespace remap {

/**
 * Structured errors for construction and input contract violations.
 * Query-time outcomes (dead ends, unmatched values) are not errors and are
 * reported through std::optional returns instead.
 */

enum class ErrorCode {
    INVALID_ARGUMENT = 1,

    // Input errors
    PARSE_ERROR = 100,
    FILE_NOT_FOUND = 101
};

class RemapException : public std::runtime_error {
public:
    explicit RemapException(ErrorCode code, const std::string& message,
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
        std::string result = "remap error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
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

class InvalidArgumentError : public RemapException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : RemapException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

class ParseError : public RemapException {
public:
    ParseError(const std::string& message, size_t line,
               const std::string& suggestion = "")
        : RemapException(ErrorCode::PARSE_ERROR, message,
                         "line " + std::to_string(line), suggestion)
        , line_(line) {}

    size_t line() const noexcept { return line_; }

private:
    size_t line_;
};

class IOError : public RemapException {
public:
    explicit IOError(const std::string& message,
                     const std::string& context = "",
                     const std::string& suggestion = "")
        : RemapException(ErrorCode::FILE_NOT_FOUND, message, context, suggestion) {}
};

class ErrorHandler {
public:
    static void check_argument(bool condition, const std::string& message,
                               const std::string& context = "") {
        if (!condition) {
            throw InvalidArgumentError(message, context);
        }
    }
};

#define REMAP_CHECK_ARGUMENT(condition, message) \
    remap::ErrorHandler::check_argument(condition, message, __func__)

} // namespace remap
