//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef KDA_RESULT_HPP
#define KDA_RESULT_HPP

/**
 * @file result.hpp
 * @brief Result type for error handling without exceptions.
 *
 * Result<T, E> holds either a success value of type T or an error of
 * type E (kda::Error by default). Used at every fallible boundary:
 * component loading, configuration parsing, strict graph building and
 * report/DOT/JSON file export.
 *
 * Usage:
 * @code
 *     auto components = io::load_components("components.json");
 *     if (components.is_err()) {
 *         std::cerr << components.error() << std::endl;
 *         return 1;
 *     }
 *     auto graph = graph::build_dependency_graph(components.value());
 * @endcode
 *
 * Chaining:
 * @code
 *     auto report = io::load_components(path).map([](const auto& comps) {
 *         return exporters::generate_report(analyzer.analyze(comps));
 *     });
 * @endcode
 */

#include "kda/error.hpp"

#include <variant>
#include <optional>
#include <utility>
#include <type_traits>
#include <stdexcept>

namespace kda {

    struct SuccessTag {};
    struct FailureTag {};

    inline constexpr SuccessTag success_tag{};
    inline constexpr FailureTag failure_tag{};

    /**
     * Either a success value or an error. Never empty.
     */
    template<typename T, typename E = Error>
    class Result {
    public:
        using value_type = T;
        using error_type = E;

        static Result success(T value) {
            return Result(success_tag, std::move(value));
        }

        static Result failure(E error) {
            return Result(failure_tag, std::move(error));
        }

        Result(SuccessTag, T value) : data_(std::in_place_index<0>, std::move(value)) {}
        Result(FailureTag, E error) : data_(std::in_place_index<1>, std::move(error)) {}

        [[nodiscard]] bool is_ok() const noexcept {
            return data_.index() == 0;
        }

        [[nodiscard]] bool is_err() const noexcept {
            return data_.index() == 1;
        }

        explicit operator bool() const noexcept {
            return is_ok();
        }

        /**
         * @throws std::logic_error if the Result contains an error.
         */
        T& value() & {
            ensure_ok();
            return std::get<0>(data_);
        }

        const T& value() const& {
            ensure_ok();
            return std::get<0>(data_);
        }

        T&& value() && {
            ensure_ok();
            return std::get<0>(std::move(data_));
        }

        /**
         * @throws std::logic_error if the Result contains a success value.
         */
        E& error() & {
            ensure_err();
            return std::get<1>(data_);
        }

        const E& error() const& {
            ensure_err();
            return std::get<1>(data_);
        }

        T value_or(T default_value) const& {
            if (is_ok()) {
                return std::get<0>(data_);
            }
            return default_value;
        }

        T value_or(T default_value) && {
            if (is_ok()) {
                return std::get<0>(std::move(data_));
            }
            return default_value;
        }

        /**
         * Transforms the success value, passing an error through unchanged.
         */
        template<typename F>
        auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
            using U = std::invoke_result_t<F, const T&>;
            if (is_ok()) {
                return Result<U, E>::success(std::forward<F>(f)(std::get<0>(data_)));
            }
            return Result<U, E>::failure(std::get<1>(data_));
        }

        /**
         * Chains an operation that itself returns a Result.
         */
        template<typename F>
        auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
            if (is_ok()) {
                return std::forward<F>(f)(std::get<0>(data_));
            }
            using ResultType = std::invoke_result_t<F, const T&>;
            return ResultType::failure(std::get<1>(data_));
        }

        template<typename F>
        auto and_then(F&& f) && -> std::invoke_result_t<F, T&&> {
            if (is_ok()) {
                return std::forward<F>(f)(std::get<0>(std::move(data_)));
            }
            using ResultType = std::invoke_result_t<F, T&&>;
            return ResultType::failure(std::get<1>(std::move(data_)));
        }

    private:
        void ensure_ok() const {
            if (is_err()) {
                throw std::logic_error("Result::value() called on error result");
            }
        }

        void ensure_err() const {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
        }

        std::variant<T, E> data_;
    };

    /**
     * Result for operations that produce no value, such as file export.
     */
    template<typename E>
    class Result<void, E> {
    public:
        using value_type = void;
        using error_type = E;

        static Result success() {
            return Result(success_tag);
        }

        static Result failure(E error) {
            return Result(failure_tag, std::move(error));
        }

        explicit Result(SuccessTag) {}
        Result(FailureTag, E error) : error_(std::move(error)) {}

        [[nodiscard]] bool is_ok() const noexcept {
            return !error_.has_value();
        }

        [[nodiscard]] bool is_err() const noexcept {
            return error_.has_value();
        }

        explicit operator bool() const noexcept {
            return is_ok();
        }

        const E& error() const& {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
            return *error_;
        }

        template<typename F>
        auto and_then(F&& f) const& -> std::invoke_result_t<F> {
            if (is_ok()) {
                return std::forward<F>(f)();
            }
            using ResultType = std::invoke_result_t<F>;
            return ResultType::failure(*error_);
        }

    private:
        std::optional<E> error_;
    };

}  // namespace kda

#endif //KDA_RESULT_HPP
