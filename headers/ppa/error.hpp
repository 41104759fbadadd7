//
// Created by gregorian-rayne on 10/12/26.
//

#ifndef PPA_ERROR_HPP
#define PPA_ERROR_HPP

/**
 * @file error.hpp
 * @brief Error type shared by the parser, analyzer and checker.
 *
 * Every fallible operation returns Result<T, Error>. The code tells the
 * caller which part of the taxonomy a failure belongs to:
 *
 * - InvalidArgument: usage error (no source, or both source text and path)
 * - NotFound / IoError: the supplied path is missing or unreadable
 * - ParseError: the Python source does not parse
 * - ConfigError: a configuration file or value is invalid
 * - InternalError: an invariant of the analyzer itself was broken
 *
 * Parse errors carry a "line N, column M" context and never the source
 * text itself.
 *
 * @code
 *     auto checker = checker::PerformanceChecker::from_file("app.py");
 *     if (checker.is_err()) {
 *         std::cerr << checker.error() << std::endl;
 *         // [ParseError] invalid syntax (context: line 3, column 9)
 *     }
 * @endcode
 */

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace ppa {

    /**
     * Error category.
     */
    enum class ErrorCode {
        None,
        InvalidArgument,  ///< Caller passed ambiguous or missing input
        NotFound,         ///< Path does not exist
        ParseError,       ///< Source or document failed to parse
        IoError,          ///< Path exists but could not be read or written
        ConfigError,      ///< Configuration rejected
        InternalError     ///< Broken analyzer invariant
    };

    inline const char* error_code_to_string(const ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::None:            return "None";
            case ErrorCode::InvalidArgument: return "InvalidArgument";
            case ErrorCode::NotFound:        return "NotFound";
            case ErrorCode::ParseError:      return "ParseError";
            case ErrorCode::IoError:         return "IoError";
            case ErrorCode::ConfigError:     return "ConfigError";
            case ErrorCode::InternalError:   return "InternalError";
        }
        return "Unknown";
    }

    /**
     * Structured error with code, message and optional context.
     *
     * Errors are immutable; with_context() returns a copy.
     */
    class Error {
    public:
        Error(const ErrorCode code, std::string message)
            : code_(code)
            , message_(std::move(message)) {}

        Error(const ErrorCode code, std::string message, std::string context)
            : code_(code)
            , message_(std::move(message))
            , context_(std::move(context)) {}

        static Error invalid_argument(std::string message) {
            return {ErrorCode::InvalidArgument, std::move(message)};
        }

        static Error invalid_argument(std::string message, std::string context) {
            return {ErrorCode::InvalidArgument, std::move(message), std::move(context)};
        }

        static Error not_found(std::string message, std::string context) {
            return {ErrorCode::NotFound, std::move(message), std::move(context)};
        }

        static Error parse_error(std::string message) {
            return {ErrorCode::ParseError, std::move(message)};
        }

        static Error parse_error(std::string message, std::string context) {
            return {ErrorCode::ParseError, std::move(message), std::move(context)};
        }

        /**
         * Creates a syntax error located at a source position.
         *
         * Only the position is recorded, so the message is safe to hand
         * back to a remote caller.
         */
        static Error syntax_error(std::string message, const std::size_t line, const std::size_t column) {
            return {
                ErrorCode::ParseError,
                std::move(message),
                "line " + std::to_string(line) + ", column " + std::to_string(column)
            };
        }

        static Error io_error(std::string message, std::string context) {
            return {ErrorCode::IoError, std::move(message), std::move(context)};
        }

        static Error config_error(std::string message) {
            return {ErrorCode::ConfigError, std::move(message)};
        }

        static Error config_error(std::string message, std::string context) {
            return {ErrorCode::ConfigError, std::move(message), std::move(context)};
        }

        static Error internal_error(std::string message) {
            return {ErrorCode::InternalError, std::move(message)};
        }

        [[nodiscard]] ErrorCode code() const noexcept {
            return code_;
        }

        [[nodiscard]] const std::string& message() const noexcept {
            return message_;
        }

        [[nodiscard]] const std::optional<std::string>& context() const noexcept {
            return context_;
        }

        [[nodiscard]] bool has_context() const noexcept {
            return context_.has_value();
        }

        /**
         * True for failures caused by the caller's arguments.
         */
        [[nodiscard]] bool is_usage_error() const noexcept {
            return code_ == ErrorCode::InvalidArgument;
        }

        /**
         * True for failures caused by the supplied path rather than its content.
         */
        [[nodiscard]] bool is_resource_error() const noexcept {
            return code_ == ErrorCode::NotFound || code_ == ErrorCode::IoError;
        }

        /**
         * Returns a copy with additional context appended.
         */
        [[nodiscard]] Error with_context(std::string additional_context) const {
            if (context_.has_value()) {
                return {code_, message_, *context_ + "; " + std::move(additional_context)};
            }
            return {code_, message_, std::move(additional_context)};
        }

        /**
         * Formats as "[Code] message" or "[Code] message (context: ...)".
         */
        [[nodiscard]] std::string to_string() const {
            std::string result = "[";
            result += error_code_to_string(code_);
            result += "] ";
            result += message_;
            if (context_.has_value()) {
                result += " (context: ";
                result += *context_;
                result += ")";
            }
            return result;
        }

        bool operator==(const Error& other) const {
            return code_ == other.code_ &&
                   message_ == other.message_ &&
                   context_ == other.context_;
        }

        bool operator!=(const Error& other) const {
            return !(*this == other);
        }

    private:
        ErrorCode code_;
        std::string message_;
        std::optional<std::string> context_;
    };

    inline std::ostream& operator<<(std::ostream& os, const Error& error) {
        return os << error.to_string();
    }

    inline std::ostream& operator<<(std::ostream& os, const ErrorCode code) {
        return os << error_code_to_string(code);
    }

}  // namespace ppa

#endif //PPA_ERROR_HPP
