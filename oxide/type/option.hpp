/*
 * option.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-10-19

Description: Option<T>, a value that is either Present or Absent

**************************************************/

#ifndef OXIDE_TYPE_OPTION_HPP
#define OXIDE_TYPE_OPTION_HPP

#include <concepts>
#include <functional>
#include <optional>
#include <ostream>
#include <source_location>
#include <string_view>
#include <type_traits>
#include <utility>

#include "oxide/error/exception.hpp"
#include "oxide/type/fwd.hpp"
#include "oxide/utils/to_string.hpp"

namespace oxide::type {

/**
 * @brief A value that is either Present or Absent.
 *
 * Like Result, an Option is immutable: combinators return new instances and
 * closures are invoked at most once, only when the receiver's state calls
 * for it. unwrap and expect throw oxide::error::UnwrapFailure on Absent.
 *
 * @tparam T The type of the contained value
 */
template <typename T>
class Option {
    static_assert(std::is_object_v<T> && !std::is_array_v<T>,
                  "Option value type must be a non-array object type");

public:
    using value_type = T;

    /**
     * @brief Constructs an Absent option.
     */
    constexpr Option() noexcept = default;

    /**
     * @brief Constructs an Absent option from std::nullopt.
     */
    constexpr Option(std::nullopt_t) noexcept {}

    /**
     * @brief Constructs a Present option holding @p value.
     *
     * @tparam U The type of the value to construct from
     * @param value The value to store
     */
    template <typename U = T>
        requires std::constructible_from<T, U> &&
                 (!std::same_as<std::remove_cvref_t<U>, Option>) &&
                 (!std::same_as<std::remove_cvref_t<U>, std::nullopt_t>) &&
                 (!std::same_as<std::remove_cvref_t<U>, std::in_place_t>)
    constexpr explicit Option(U&& value)
        : storage_(std::in_place, std::forward<U>(value)) {}

    /**
     * @brief Constructs a Present option, building the value in place.
     */
    template <typename... Args>
        requires std::constructible_from<T, Args...>
    constexpr explicit Option(std::in_place_t, Args&&... args)
        : storage_(std::in_place, std::forward<Args>(args)...) {}

    [[nodiscard]] constexpr auto isPresent() const noexcept -> bool {
        return storage_.has_value();
    }

    [[nodiscard]] constexpr auto isAbsent() const noexcept -> bool {
        return !storage_.has_value();
    }

    /**
     * @brief Checks whether the option is Present and its value satisfies
     * @p predicate. The predicate is not invoked on Absent.
     */
    template <typename Pred>
        requires std::predicate<Pred, const T&>
    [[nodiscard]] constexpr auto isPresentAnd(Pred&& predicate) const -> bool {
        return isPresent() && static_cast<bool>(std::invoke(
                                  std::forward<Pred>(predicate), *storage_));
    }

    constexpr explicit operator bool() const noexcept { return isPresent(); }

    /**
     * @brief Gets the contained value.
     *
     * @param location Call site, recorded in the raised exception
     * @throws oxide::error::UnwrapFailure if the option is Absent
     */
    [[nodiscard]] auto unwrap(const std::source_location& location =
                                  std::source_location::current()) const&
        -> const T& {
        if (isAbsent()) [[unlikely]] {
            error::throwUnwrapFailure(location,
                                      "called unwrap() on an Absent value");
        }
        return *storage_;
    }

    [[nodiscard]] auto unwrap(const std::source_location& location =
                                  std::source_location::current()) && -> T {
        if (isAbsent()) [[unlikely]] {
            error::throwUnwrapFailure(location,
                                      "called unwrap() on an Absent value");
        }
        return std::move(*storage_);
    }

    /**
     * @brief Gets the contained value, failing with exactly @p message.
     *
     * @throws oxide::error::UnwrapFailure if the option is Absent
     */
    [[nodiscard]] auto expect(std::string_view message,
                              const std::source_location& location =
                                  std::source_location::current()) const&
        -> const T& {
        if (isAbsent()) [[unlikely]] {
            error::throwUnwrapFailure(location, message);
        }
        return *storage_;
    }

    [[nodiscard]] auto expect(std::string_view message,
                              const std::source_location& location =
                                  std::source_location::current()) && -> T {
        if (isAbsent()) [[unlikely]] {
            error::throwUnwrapFailure(location, message);
        }
        return std::move(*storage_);
    }

    template <typename U>
        requires std::constructible_from<T, U>
    [[nodiscard]] constexpr auto unwrapOr(U&& defaultValue) const& -> T {
        return isPresent() ? *storage_
                           : static_cast<T>(std::forward<U>(defaultValue));
    }

    template <typename U>
        requires std::constructible_from<T, U>
    [[nodiscard]] constexpr auto unwrapOr(U&& defaultValue) && -> T {
        return isPresent() ? std::move(*storage_)
                           : static_cast<T>(std::forward<U>(defaultValue));
    }

    /**
     * @brief Gets the contained value or computes one. @p func is not
     * invoked on Present.
     */
    template <typename Func>
        requires std::invocable<Func> &&
                 std::convertible_to<std::invoke_result_t<Func>, T>
    [[nodiscard]] constexpr auto unwrapOrElse(Func&& func) const& -> T {
        if (isPresent()) {
            return *storage_;
        }
        return static_cast<T>(std::invoke(std::forward<Func>(func)));
    }

    template <typename Func>
        requires std::invocable<Func> &&
                 std::convertible_to<std::invoke_result_t<Func>, T>
    [[nodiscard]] constexpr auto unwrapOrElse(Func&& func) && -> T {
        if (isPresent()) {
            return std::move(*storage_);
        }
        return static_cast<T>(std::invoke(std::forward<Func>(func)));
    }

    /**
     * @brief Transforms the contained value.
     *
     * @tparam Func The type of the transformation function
     * @param func Function applied to the value; not invoked on Absent
     * @return Option<U> where U is the function's return type
     */
    template <typename Func>
        requires std::invocable<Func, const T&>
    [[nodiscard]] constexpr auto map(Func&& func) const&
        -> Option<detail::InvokeResultT<Func, const T&>> {
        using U = detail::InvokeResultT<Func, const T&>;
        if (isPresent()) {
            return Option<U>(std::in_place,
                             std::invoke(std::forward<Func>(func), *storage_));
        }
        return Option<U>();
    }

    template <typename Func>
        requires std::invocable<Func, T&&>
    [[nodiscard]] constexpr auto map(Func&& func) &&
        -> Option<detail::InvokeResultT<Func, T&&>> {
        using U = detail::InvokeResultT<Func, T&&>;
        if (isPresent()) {
            return Option<U>(std::in_place,
                             std::invoke(std::forward<Func>(func),
                                         std::move(*storage_)));
        }
        return Option<U>();
    }

    template <typename V, typename Func>
        requires std::invocable<Func, const T&> &&
                 std::constructible_from<detail::InvokeResultT<Func, const T&>,
                                         V>
    [[nodiscard]] constexpr auto mapOr(V&& defaultValue, Func&& func) const&
        -> detail::InvokeResultT<Func, const T&> {
        using U = detail::InvokeResultT<Func, const T&>;
        if (isPresent()) {
            return std::invoke(std::forward<Func>(func), *storage_);
        }
        return U(std::forward<V>(defaultValue));
    }

    template <typename V, typename Func>
        requires std::invocable<Func, T&&> &&
                 std::constructible_from<detail::InvokeResultT<Func, T&&>, V>
    [[nodiscard]] constexpr auto mapOr(V&& defaultValue, Func&& func) &&
        -> detail::InvokeResultT<Func, T&&> {
        using U = detail::InvokeResultT<Func, T&&>;
        if (isPresent()) {
            return std::invoke(std::forward<Func>(func), std::move(*storage_));
        }
        return U(std::forward<V>(defaultValue));
    }

    /**
     * @brief Applies @p func to the value, or calls @p defaultFunc when
     * Absent. Exactly one of the two is invoked.
     */
    template <typename DefaultFunc, typename Func>
        requires std::invocable<Func, const T&> && std::invocable<DefaultFunc>
    [[nodiscard]] constexpr auto mapOrElse(DefaultFunc&& defaultFunc,
                                           Func&& func) const&
        -> detail::InvokeResultT<Func, const T&> {
        using U = detail::InvokeResultT<Func, const T&>;
        if (isPresent()) {
            return std::invoke(std::forward<Func>(func), *storage_);
        }
        return U(std::invoke(std::forward<DefaultFunc>(defaultFunc)));
    }

    template <typename DefaultFunc, typename Func>
        requires std::invocable<Func, T&&> && std::invocable<DefaultFunc>
    [[nodiscard]] constexpr auto mapOrElse(DefaultFunc&& defaultFunc,
                                           Func&& func) &&
        -> detail::InvokeResultT<Func, T&&> {
        using U = detail::InvokeResultT<Func, T&&>;
        if (isPresent()) {
            return std::invoke(std::forward<Func>(func), std::move(*storage_));
        }
        return U(std::invoke(std::forward<DefaultFunc>(defaultFunc)));
    }

    /**
     * @brief Calls @p func with the value for its side effect.
     *
     * @return This same object, unchanged
     */
    template <typename Func>
        requires std::invocable<Func, const T&>
    constexpr auto inspect(Func&& func) const& -> const Option& {
        if (isPresent()) {
            std::invoke(std::forward<Func>(func), *storage_);
        }
        return *this;
    }

    template <typename Func>
        requires std::invocable<Func, const T&>
    constexpr auto inspect(Func&& func) && -> Option {
        if (isPresent()) {
            std::invoke(std::forward<Func>(func), std::as_const(*storage_));
        }
        return std::move(*this);
    }

    /**
     * @brief Converts to a Result: Success with the value, or Failure with
     * @p error when Absent. C string errors are stored as std::string.
     */
    template <typename G>
    [[nodiscard]] constexpr auto toResult(G&& error) const&
        -> Result<T, detail::StorageT<G>> {
        using ResultType = Result<T, detail::StorageT<G>>;
        if (isPresent()) {
            return ResultType(Success<T>(*storage_));
        }
        return ResultType(Failure<detail::StorageT<G>>(std::forward<G>(error)));
    }

    template <typename G>
    [[nodiscard]] constexpr auto toResult(G&& error) &&
        -> Result<T, detail::StorageT<G>> {
        using ResultType = Result<T, detail::StorageT<G>>;
        if (isPresent()) {
            return ResultType(Success<T>(std::move(*storage_)));
        }
        return ResultType(Failure<detail::StorageT<G>>(std::forward<G>(error)));
    }

    /**
     * @brief Converts to a Result, computing the error only when Absent.
     */
    template <typename Func>
        requires std::invocable<Func>
    [[nodiscard]] constexpr auto toResultElse(Func&& func) const&
        -> Result<T, detail::InvokeResultT<Func>> {
        using F = detail::InvokeResultT<Func>;
        if (isPresent()) {
            return Result<T, F>(Success<T>(*storage_));
        }
        return Result<T, F>(Failure<F>(std::invoke(std::forward<Func>(func))));
    }

    template <typename Func>
        requires std::invocable<Func>
    [[nodiscard]] constexpr auto toResultElse(Func&& func) &&
        -> Result<T, detail::InvokeResultT<Func>> {
        using F = detail::InvokeResultT<Func>;
        if (isPresent()) {
            return Result<T, F>(Success<T>(std::move(*storage_)));
        }
        return Result<T, F>(Failure<F>(std::invoke(std::forward<Func>(func))));
    }

    /**
     * @brief Returns Absent if this is Absent, otherwise @p other.
     */
    template <typename U>
    [[nodiscard]] constexpr auto and_(Option<U> other) const -> Option<U> {
        if (isAbsent()) {
            return Option<U>();
        }
        return other;
    }

    /**
     * @brief Chains a computation that may produce no value.
     *
     * @tparam Func Callable taking the value and returning Option<U>
     * @param func Function applied to the value; not invoked on Absent
     */
    template <typename Func>
        requires std::invocable<Func, const T&>
    [[nodiscard]] constexpr auto andThen(Func&& func) const&
        -> detail::InvokeResultT<Func, const T&> {
        using R = detail::InvokeResultT<Func, const T&>;
        static_assert(detail::IsOption<R>::value,
                      "andThen callback must return an Option");
        if (isPresent()) {
            return std::invoke(std::forward<Func>(func), *storage_);
        }
        return R();
    }

    template <typename Func>
        requires std::invocable<Func, T&&>
    [[nodiscard]] constexpr auto andThen(Func&& func) &&
        -> detail::InvokeResultT<Func, T&&> {
        using R = detail::InvokeResultT<Func, T&&>;
        static_assert(detail::IsOption<R>::value,
                      "andThen callback must return an Option");
        if (isPresent()) {
            return std::invoke(std::forward<Func>(func), std::move(*storage_));
        }
        return R();
    }

    /**
     * @brief Keeps the value only if it satisfies @p predicate. The
     * predicate is not invoked on Absent.
     */
    template <typename Pred>
        requires std::predicate<Pred, const T&>
    [[nodiscard]] constexpr auto filter(Pred&& predicate) const& -> Option {
        if (isPresent() &&
            std::invoke(std::forward<Pred>(predicate), *storage_)) {
            return *this;
        }
        return Option();
    }

    template <typename Pred>
        requires std::predicate<Pred, const T&>
    [[nodiscard]] constexpr auto filter(Pred&& predicate) && -> Option {
        if (isPresent() &&
            std::invoke(std::forward<Pred>(predicate), std::as_const(*storage_))) {
            return std::move(*this);
        }
        return Option();
    }

    [[nodiscard]] constexpr auto or_(Option other) const& -> Option {
        return isPresent() ? *this : other;
    }

    [[nodiscard]] constexpr auto or_(Option other) && -> Option {
        return isPresent() ? std::move(*this) : std::move(other);
    }

    /**
     * @brief Returns this if Present, otherwise the result of @p func.
     */
    template <typename Func>
        requires std::invocable<Func>
    [[nodiscard]] constexpr auto orElse(Func&& func) const& -> Option {
        static_assert(std::is_same_v<detail::InvokeResultT<Func>, Option>,
                      "orElse callback must return an Option of the same type");
        if (isPresent()) {
            return *this;
        }
        return std::invoke(std::forward<Func>(func));
    }

    template <typename Func>
        requires std::invocable<Func>
    [[nodiscard]] constexpr auto orElse(Func&& func) && -> Option {
        static_assert(std::is_same_v<detail::InvokeResultT<Func>, Option>,
                      "orElse callback must return an Option of the same type");
        if (isPresent()) {
            return std::move(*this);
        }
        return std::invoke(std::forward<Func>(func));
    }

    /**
     * @brief Returns whichever of this and @p other is Present when exactly
     * one of them is, Absent otherwise.
     */
    [[nodiscard]] constexpr auto xor_(Option other) const& -> Option {
        if (isPresent() && other.isAbsent()) {
            return *this;
        }
        if (isAbsent() && other.isPresent()) {
            return other;
        }
        return Option();
    }

    [[nodiscard]] constexpr auto xor_(Option other) && -> Option {
        if (isPresent() && other.isAbsent()) {
            return std::move(*this);
        }
        if (isAbsent() && other.isPresent()) {
            return other;
        }
        return Option();
    }

    [[nodiscard]] constexpr auto operator==(const Option& other) const
        -> bool {
        if (isPresent() != other.isPresent()) {
            return false;
        }
        return isAbsent() || *storage_ == *other.storage_;
    }

    [[nodiscard]] constexpr auto operator==(std::nullopt_t) const noexcept
        -> bool {
        return isAbsent();
    }

    /**
     * @brief Compares against a bare value: equal only when Present with an
     * equal value.
     */
    template <typename U>
        requires(!detail::IsOption<std::remove_cvref_t<U>>::value) &&
                (!std::same_as<std::remove_cvref_t<U>, std::nullopt_t>) &&
                requires(const T& lhs, const U& rhs) {
                    { lhs == rhs } -> std::convertible_to<bool>;
                }
    [[nodiscard]] constexpr auto operator==(const U& value) const -> bool {
        return isPresent() && *storage_ == value;
    }

private:
    std::optional<T> storage_;
};

/**
 * @brief Creates a Present option. C strings are stored as std::string.
 */
template <typename V>
[[nodiscard]] constexpr auto present(V&& value)
    -> Option<detail::StorageT<V>> {
    return Option<detail::StorageT<V>>(std::in_place,
                                        std::forward<V>(value));
}

/**
 * @brief Creates an Absent option of type T.
 */
template <typename T>
[[nodiscard]] constexpr auto absent() noexcept -> Option<T> {
    return Option<T>();
}

/**
 * @brief Writes "Present(<value>)" or "Absent".
 */
template <typename T>
auto operator<<(std::ostream& os, const Option<T>& option) -> std::ostream& {
    if (option.isAbsent()) {
        return os << "Absent";
    }
    return os << "Present(" << utils::toString(option.unwrap()) << ")";
}

}  // namespace oxide::type

#include "oxide/type/result.hpp"

#endif  // OXIDE_TYPE_OPTION_HPP
