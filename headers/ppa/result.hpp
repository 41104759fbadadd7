//
// Created by gregorian-rayne on 10/12/26.
//

#ifndef PPA_RESULT_HPP
#define PPA_RESULT_HPP

/**
 * @file result.hpp
 * @brief Success-or-error return type.
 *
 * Result<T, E> holds either a T or an E, never neither. The analyzer
 * pipeline is written as a chain of Results so that a usage, resource or
 * syntax error stops the run before any partial output is produced:
 *
 * @code
 *     auto issues = frontend::parse(input)
 *         .map([](frontend::ParsedModule module) { return analysis::AstAnalyzer(std::move(module)); })
 *         .map([](const analysis::AstAnalyzer& a) { return a.calls().size(); });
 * @endcode
 */

#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace ppa {

    struct SuccessTag {};
    struct FailureTag {};

    inline constexpr SuccessTag success_tag{};
    inline constexpr FailureTag failure_tag{};

    /**
     * Either a success value of type T or an error of type E.
     */
    template<typename T, typename E>
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
         * @throws std::logic_error if this holds an error.
         */
        T& value() & {
            require_value();
            return std::get<0>(data_);
        }

        const T& value() const& {
            require_value();
            return std::get<0>(data_);
        }

        T&& value() && {
            require_value();
            return std::get<0>(std::move(data_));
        }

        /**
         * @throws std::logic_error if this holds a value.
         */
        E& error() & {
            require_error();
            return std::get<1>(data_);
        }

        const E& error() const& {
            require_error();
            return std::get<1>(data_);
        }

        T value_or(T fallback) const& {
            return is_ok() ? std::get<0>(data_) : std::move(fallback);
        }

        T value_or(T fallback) && {
            return is_ok() ? std::get<0>(std::move(data_)) : std::move(fallback);
        }

        /**
         * Transforms the success value, passing errors through untouched.
         */
        template<typename F>
        auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
            using U = std::invoke_result_t<F, const T&>;
            if (is_ok()) {
                return Result<U, E>::success(std::forward<F>(f)(std::get<0>(data_)));
            }
            return Result<U, E>::failure(std::get<1>(data_));
        }

        template<typename F>
        auto map(F&& f) && -> Result<std::invoke_result_t<F, T&&>, E> {
            using U = std::invoke_result_t<F, T&&>;
            if (is_ok()) {
                return Result<U, E>::success(std::forward<F>(f)(std::get<0>(std::move(data_))));
            }
            return Result<U, E>::failure(std::get<1>(std::move(data_)));
        }

        /**
         * Chains a fallible step that itself returns a Result.
         */
        template<typename F>
        auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
            using R = std::invoke_result_t<F, const T&>;
            if (is_ok()) {
                return std::forward<F>(f)(std::get<0>(data_));
            }
            return R::failure(std::get<1>(data_));
        }

        template<typename F>
        auto and_then(F&& f) && -> std::invoke_result_t<F, T&&> {
            using R = std::invoke_result_t<F, T&&>;
            if (is_ok()) {
                return std::forward<F>(f)(std::get<0>(std::move(data_)));
            }
            return R::failure(std::get<1>(std::move(data_)));
        }

        /**
         * Rewrites the error, e.g. to attach the file being processed.
         */
        template<typename F>
        auto map_error(F&& f) && -> Result<T, std::invoke_result_t<F, E&&>> {
            using E2 = std::invoke_result_t<F, E&&>;
            if (is_ok()) {
                return Result<T, E2>::success(std::get<0>(std::move(data_)));
            }
            return Result<T, E2>::failure(std::forward<F>(f)(std::get<1>(std::move(data_))));
        }

    private:
        void require_value() const {
            if (is_err()) {
                throw std::logic_error("Result::value() called on error result");
            }
        }

        void require_error() const {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
        }

        std::variant<T, E> data_;
    };

    /**
     * Result of an operation that produces nothing on success.
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
            using R = std::invoke_result_t<F>;
            if (is_ok()) {
                return std::forward<F>(f)();
            }
            return R::failure(*error_);
        }

    private:
        std::optional<E> error_;
    };

}  // namespace ppa

#endif //PPA_RESULT_HPP
