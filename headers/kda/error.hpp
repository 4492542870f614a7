//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef KDA_ERROR_HPP
#define KDA_ERROR_HPP

/**
 * @file error.hpp
 * @brief Error type shared by the I/O-facing parts of the analyzer.
 *
 * The graph and analysis layers never fail: missing dependencies and
 * cycles are reported as part of the analysis result. Errors only come
 * from the edges of the system (loading components, reading the
 * configuration, writing reports and DOT files) and from the strict
 * graph builder.
 *
 * Error categories:
 * - InvalidArgument: Invalid function arguments or parameters
 * - NotFound: Input file does not exist
 * - ParseError: Component list or configuration could not be parsed
 * - IoError: File creation, write or rename failed
 * - ConfigError: Configuration values out of range
 * - DuplicateComponent: Two components share a name (strict builder only)
 * - AnalysisError: Analysis result not usable for the request
 * - InternalError: Unexpected internal error
 *
 * Usage:
 * @code
 *     auto written = exporters::write_dot(graph, "deps.dot");
 *     if (written.is_err()) {
 *         std::cerr << written.error() << std::endl;
 *         // Output: [IoError] Failed to open file for writing (context: deps.dot.tmp)
 *     }
 * @endcode
 */

#include <string>
#include <optional>
#include <ostream>
#include <utility>

namespace kda {

    enum class ErrorCode {
        None,               ///< No error
        InvalidArgument,    ///< Invalid argument or parameter
        NotFound,           ///< Resource not found
        ParseError,         ///< Parsing failed
        IoError,            ///< I/O operation failed
        ConfigError,        ///< Configuration error
        DuplicateComponent, ///< Component name declared more than once
        AnalysisError,      ///< Analysis result unusable for the request
        InternalError       ///< Internal/unexpected error
    };

    inline const char* error_code_to_string(ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::None:               return "None";
            case ErrorCode::InvalidArgument:    return "InvalidArgument";
            case ErrorCode::NotFound:           return "NotFound";
            case ErrorCode::ParseError:         return "ParseError";
            case ErrorCode::IoError:            return "IoError";
            case ErrorCode::ConfigError:        return "ConfigError";
            case ErrorCode::DuplicateComponent: return "DuplicateComponent";
            case ErrorCode::AnalysisError:      return "AnalysisError";
            case ErrorCode::InternalError:      return "InternalError";
        }
        return "Unknown";
    }

    /**
     * Structured error with code, message, and optional context.
     *
     * The context usually names the file path or component involved.
     * Error objects are immutable after construction.
     */
    class Error {
    public:
        Error(ErrorCode code, std::string message)
            : code_(code)
            , message_(std::move(message)) {}

        Error(ErrorCode code, std::string message, std::string context)
            : code_(code)
            , message_(std::move(message))
            , context_(std::move(context)) {}

        static Error invalid_argument(std::string message, std::string context = {}) {
            return make(ErrorCode::InvalidArgument, std::move(message), std::move(context));
        }

        static Error not_found(std::string message, std::string context = {}) {
            return make(ErrorCode::NotFound, std::move(message), std::move(context));
        }

        static Error parse_error(std::string message, std::string context = {}) {
            return make(ErrorCode::ParseError, std::move(message), std::move(context));
        }

        static Error io_error(std::string message, std::string context = {}) {
            return make(ErrorCode::IoError, std::move(message), std::move(context));
        }

        static Error config_error(std::string message, std::string context = {}) {
            return make(ErrorCode::ConfigError, std::move(message), std::move(context));
        }

        static Error duplicate_component(std::string message, std::string context = {}) {
            return make(ErrorCode::DuplicateComponent, std::move(message), std::move(context));
        }

        static Error analysis_error(std::string message, std::string context = {}) {
            return make(ErrorCode::AnalysisError, std::move(message), std::move(context));
        }

        static Error internal_error(std::string message, std::string context = {}) {
            return make(ErrorCode::InternalError, std::move(message), std::move(context));
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
         * Returns a copy of this error with additional context appended.
         */
        [[nodiscard]] Error with_context(std::string additional_context) const {
            if (context_.has_value()) {
                return {code_, message_, *context_ + "; " + std::move(additional_context)};
            }
            return {code_, message_, std::move(additional_context)};
        }

        /**
         * Formats the error as "[Code] message" or "[Code] message (context: ...)".
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
        static Error make(ErrorCode code, std::string message, std::string context) {
            if (context.empty()) {
                return {code, std::move(message)};
            }
            return {code, std::move(message), std::move(context)};
        }

        ErrorCode code_;
        std::string message_;
        std::optional<std::string> context_;
    };

    inline std::ostream& operator<<(std::ostream& os, const Error& error) {
        return os << error.to_string();
    }

    inline std::ostream& operator<<(std::ostream& os, ErrorCode code) {
        return os << error_code_to_string(code);
    }

}  // namespace kda

#endif //KDA_ERROR_HPP
