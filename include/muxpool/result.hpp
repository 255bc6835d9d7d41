#pragma once

#include <cassert>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

#include "error.hpp"

namespace muxpool {

    /// @brief Result<T> holds either a successful value of type T or an
    /// Error.
    /// @tparam T The type of the successful value.
    /// @note Similar to std::expected<T, Error> in C++23. Pool and transport
    /// failures travel through this type instead of exceptions.
    template <typename T>
    class [[nodiscard]] Result {
       public:
        /// @brief Create a successful Result with the given value.
        /// @tparam Args The types of the arguments to construct T.
        /// @param args The arguments to construct T.
        /// @return A Result containing the constructed T.
        template <typename... Args, typename = std::enable_if_t<
                                        std::is_constructible_v<T, Args&&...>>>
        static Result ok(Args&&... args) {
            return Result(std::in_place_type<T>, std::forward<Args>(args)...);
        }

        /// @brief Create an error Result with the given Error.
        static Result err(const Error& error) {
            return Result(std::in_place_type<Error>, error);
        }

        /// @brief Create an error Result with the given Error.
        static Result err(Error&& error) {
            return Result(std::in_place_type<Error>, std::move(error));
        }

        /// @brief Shorthand for err(Error{code, message}).
        static Result err(Error::Code code, std::string message) {
            return err(Error{code, std::move(message)});
        }

        /// @brief Allow `if (result) { ... }` to mean "if success".
        explicit operator bool() const noexcept { return has_value(); }

        /// @brief True if this Result currently holds a value of type T.
        bool has_value() const noexcept {
            return std::holds_alternative<T>(m_state);
        }

        /// @brief True if this Result currently holds an Error.
        bool has_error() const noexcept {
            return std::holds_alternative<Error>(m_state);
        }

        /// @brief Get the stored value (const lvalue overload).
        const T& value() const& {
            const T* p = value_ptr();
            assert(p &&
                   "Result::value() called but this Result holds an Error");
            return *p;
        }

        /// @brief Get the stored value (mutable lvalue overload).
        T& value() & {
            T* p = value_ptr();
            assert(p &&
                   "Result::value() called but this Result holds an Error");
            return *p;
        }

        /// @brief Get the stored value (rvalue overload).
        T&& value() && {
            T* p = value_ptr();
            assert(p &&
                   "Result::value() called but this Result holds an Error");
            return std::move(*p);
        }

        [[nodiscard]] const T* value_ptr() const noexcept {
            return std::get_if<T>(&m_state);
        }

        [[nodiscard]] T* value_ptr() noexcept {
            return std::get_if<T>(&m_state);
        }

        /// @brief Get the stored error (const lvalue overload).
        const Error& error() const& {
            const Error* p = error_ptr();
            assert(p && "Result::error() called but this Result holds a value");
            return *p;
        }

        /// @brief Get the stored error (mutable lvalue overload).
        Error& error() & {
            Error* p = error_ptr();
            assert(p && "Result::error() called but this Result holds a value");
            return *p;
        }

        /// @brief Get the stored error (rvalue overload).
        Error&& error() && {
            Error* p = error_ptr();
            assert(p && "Result::error() called but this Result holds a value");
            return std::move(*p);
        }

        [[nodiscard]] const Error* error_ptr() const noexcept {
            return std::get_if<Error>(&m_state);
        }

        [[nodiscard]] Error* error_ptr() noexcept {
            return std::get_if<Error>(&m_state);
        }

        /// @brief Error code if this Result holds an Error.
        std::optional<Error::Code> error_code() const noexcept {
            if (const Error* e = error_ptr()) return e->code;
            return std::nullopt;
        }

        /// @brief Return the stored value if present, otherwise call a fallback
        /// function.
        /// @note make_fallback() is only invoked when there is no value.
        template <typename F,
                  typename = std::enable_if_t<std::is_invocable_r_v<T, F&&>>>
        T value_or_else(F&& make_fallback) const& {
            return has_value() ? value() : std::forward<F>(make_fallback)();
        }

        /// @brief Rvalue overload of value_or_else to preserve move semantics.
        template <typename F,
                  typename = std::enable_if_t<std::is_invocable_r_v<T, F&&>>>
        T value_or_else(F&& make_fallback) && {
            return has_value() ? std::move(*this).value()
                               : std::forward<F>(make_fallback)();
        }

        /// @brief Eager fallback: return stored value if present, otherwise
        /// return fallback.
        T value_or(T fallback) const& {
            return value_or_else([&] { return std::move(fallback); });
        }

        T value_or(T fallback) && {
            return std::move(*this).value_or_else(
                [&] { return std::move(fallback); });
        }

        /// @brief Return the stored error if present, otherwise return a
        /// provided fallback reference.
        const Error& error_or(const Error& fallback) const noexcept {
            return has_error() ? *error_ptr() : fallback;
        }

       private:
        template <typename... Args>
        explicit Result(std::in_place_type_t<T>, Args&&... args)
            : m_state(std::in_place_type<T>, std::forward<Args>(args)...) {}

        explicit Result(std::in_place_type_t<Error>, const Error& error)
            : m_state(std::in_place_type<Error>, error) {}

        explicit Result(std::in_place_type_t<Error>, Error&& error)
            : m_state(std::in_place_type<Error>, std::move(error)) {}

        /// @brief Storage: exactly one of {T, Error} is active at any time.
        std::variant<T, Error> m_state;
    };

    /// @brief Outcome of an operation that produces no value.
    class [[nodiscard]] Status {
       public:
        static Status ok() { return Status{}; }

        static Status err(Error error) { return Status{std::move(error)}; }

        static Status err(Error::Code code, std::string message) {
            return Status{Error{code, std::move(message)}};
        }

        explicit operator bool() const noexcept { return !m_error; }

        bool has_error() const noexcept { return m_error.has_value(); }

        const Error& error() const& {
            assert(m_error && "Status::error() called on a success Status");
            return *m_error;
        }

        /// @brief Lift into a Result<T> carrying the same error.
        template <typename T>
        Result<T> as_result() const {
            assert(m_error && "Status::as_result() called on a success Status");
            return Result<T>::err(*m_error);
        }

       private:
        Status() = default;
        explicit Status(Error e) : m_error(std::move(e)) {}

        std::optional<Error> m_error;
    };

}  // namespace muxpool
