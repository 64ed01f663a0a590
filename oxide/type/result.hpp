#ifndef OXIDE_TYPE_RESULT_HPP
#define OXIDE_TYPE_RESULT_HPP

#include <concepts>
#include <functional>
#include <ostream>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include <fmt/format.h>

#include "oxide/error/exception.hpp"
#include "oxide/type/fwd.hpp"
#include "oxide/utils/to_string.hpp"

namespace oxide::type {

/**
 * @brief The success arm of a Result, holding a value.
 *
 * Converts implicitly into any Result whose value type can be built from
 * the held value, which lets `Result<int, std::string> r = success(2);`
 * compile without naming the error type.
 *
 * @tparam T The type of the success value
 */
template <typename T>
class Success {
public:
    /**
     * @brief Constructs the success arm from a value.
     *
     * @tparam U The type of the value to construct from
     * @param value The value to store
     */
    template <typename U = T>
        requires std::constructible_from<T, U> &&
                 (!std::same_as<std::remove_cvref_t<U>, Success>)
    constexpr explicit Success(U&& value) noexcept(
        std::is_nothrow_constructible_v<T, U>)
        : value_(std::forward<U>(value)) {}

    /**
     * @brief Gets a const reference to the held value.
     */
    [[nodiscard]] constexpr auto value() const& noexcept -> const T& {
        return value_;
    }

    /**
     * @brief Gets an rvalue reference to the held value.
     */
    [[nodiscard]] constexpr auto value() && noexcept -> T&& {
        return std::move(value_);
    }

    constexpr auto operator==(const Success& other) const -> bool {
        return value_ == other.value_;
    }

private:
    T value_;
};

/**
 * @brief The failure arm of a Result, holding an error.
 *
 * @tparam E The type of the error value
 */
template <typename E>
class Failure {
public:
    /**
     * @brief Constructs the failure arm from an error value.
     *
     * @tparam U The type of the error to construct from
     * @param error The error value to store
     */
    template <typename U = E>
        requires std::constructible_from<E, U> &&
                 (!std::same_as<std::remove_cvref_t<U>, Failure>)
    constexpr explicit Failure(U&& error) noexcept(
        std::is_nothrow_constructible_v<E, U>)
        : error_(std::forward<U>(error)) {}

    [[nodiscard]] constexpr auto error() const& noexcept -> const E& {
        return error_;
    }

    [[nodiscard]] constexpr auto error() && noexcept -> E&& {
        return std::move(error_);
    }

    constexpr auto operator==(const Failure& other) const -> bool {
        return error_ == other.error_;
    }

private:
    E error_;
};

template <typename T>
Success(T) -> Success<T>;

template <typename E>
Failure(E) -> Failure<E>;

/**
 * @brief The outcome of an operation: either Success holding a value of
 * type T, or Failure holding an error of type E.
 *
 * A Result is an immutable value. Exactly one arm is populated and no
 * member function changes which one; every combinator returns a new
 * Result. Closures passed to combinators are invoked at most once and only
 * on the arm they apply to.
 *
 * The raising accessors (unwrap, unwrapError, expect, expectFailure) throw
 * oxide::error::UnwrapFailure when called on the wrong arm. Every other
 * operation is total.
 *
 * @tparam T The type of the success value
 * @tparam E The type of the error (defaults to std::string)
 */
template <typename T, typename E>
class Result {
    static_assert(std::is_object_v<T> && !std::is_array_v<T>,
                  "Result value type must be a non-array object type");
    static_assert(std::is_object_v<E> && !std::is_array_v<E>,
                  "Result error type must be a non-array object type");

public:
    using value_type = T;
    using error_type = E;

    /**
     * @brief Constructs a Success result from a Success arm.
     *
     * @tparam U The type held by the arm
     * @param wrapped The arm to copy the value from
     */
    template <typename U>
        requires std::constructible_from<T, const U&>
    constexpr explicit(!std::convertible_to<const U&, T>)
        Result(const Success<U>& wrapped)
        : storage_(std::in_place_index<0>, wrapped.value()) {}

    /**
     * @brief Constructs a Success result from a Success arm (move version).
     */
    template <typename U>
        requires std::constructible_from<T, U>
    constexpr explicit(!std::convertible_to<U, T>)
        Result(Success<U>&& wrapped)
        : storage_(std::in_place_index<0>, std::move(wrapped).value()) {}

    /**
     * @brief Constructs a Failure result from a Failure arm.
     *
     * @tparam G The type held by the arm
     * @param wrapped The arm to copy the error from
     */
    template <typename G>
        requires std::constructible_from<E, const G&>
    constexpr explicit(!std::convertible_to<const G&, E>)
        Result(const Failure<G>& wrapped)
        : storage_(std::in_place_index<1>, wrapped.error()) {}

    /**
     * @brief Constructs a Failure result from a Failure arm (move version).
     */
    template <typename G>
        requires std::constructible_from<E, G>
    constexpr explicit(!std::convertible_to<G, E>)
        Result(Failure<G>&& wrapped)
        : storage_(std::in_place_index<1>, std::move(wrapped).error()) {}

    /**
     * @brief Creates a Success result holding @p value.
     */
    template <typename U = T>
        requires std::constructible_from<T, U>
    [[nodiscard]] static constexpr auto success(U&& value) -> Result {
        return Result(Success<T>(std::forward<U>(value)));
    }

    /**
     * @brief Creates a Failure result holding @p error.
     */
    template <typename G = E>
        requires std::constructible_from<E, G>
    [[nodiscard]] static constexpr auto failure(G&& error) -> Result {
        return Result(Failure<E>(std::forward<G>(error)));
    }

    // Predicates

    [[nodiscard]] constexpr auto isSuccess() const noexcept -> bool {
        return storage_.index() == 0;
    }

    [[nodiscard]] constexpr auto isFailure() const noexcept -> bool {
        return storage_.index() == 1;
    }

    /**
     * @brief Checks whether this is a Success whose value satisfies
     * @p predicate. The predicate is not invoked on a Failure.
     *
     * @tparam Pred The type of the predicate
     * @param predicate Predicate over the success value
     * @return true if Success and predicate(value) holds
     */
    template <typename Pred>
        requires std::predicate<Pred, const T&>
    [[nodiscard]] constexpr auto isSuccessAnd(Pred&& predicate) const -> bool {
        return isSuccess() && static_cast<bool>(std::invoke(
                                  std::forward<Pred>(predicate), successRef()));
    }

    /**
     * @brief Checks whether this is a Failure whose error satisfies
     * @p predicate. The predicate is not invoked on a Success.
     */
    template <typename Pred>
        requires std::predicate<Pred, const E&>
    [[nodiscard]] constexpr auto isFailureAnd(Pred&& predicate) const -> bool {
        return isFailure() && static_cast<bool>(std::invoke(
                                  std::forward<Pred>(predicate), errorRef()));
    }

    constexpr explicit operator bool() const noexcept { return isSuccess(); }

    // Transformations

    /**
     * @brief Transforms the success value, leaving a Failure untouched.
     *
     * @tparam Func The type of the transformation function
     * @param func Function applied to the success value
     * @return Result<U, E> where U is the function's return type
     */
    template <typename Func>
        requires std::invocable<Func, const T&>
    [[nodiscard]] constexpr auto map(Func&& func) const&
        -> Result<detail::InvokeResultT<Func, const T&>, E> {
        using U = detail::InvokeResultT<Func, const T&>;
        if (isSuccess()) {
            return Result<U, E>(
                Success<U>(std::invoke(std::forward<Func>(func), successRef())));
        }
        return Result<U, E>(Failure<E>(errorRef()));
    }

    /**
     * @brief Transforms the success value, leaving a Failure untouched (move
     * version).
     */
    template <typename Func>
        requires std::invocable<Func, T&&>
    [[nodiscard]] constexpr auto map(Func&& func) &&
        -> Result<detail::InvokeResultT<Func, T&&>, E> {
        using U = detail::InvokeResultT<Func, T&&>;
        if (isSuccess()) {
            return Result<U, E>(Success<U>(std::invoke(
                std::forward<Func>(func), std::move(*this).successRef())));
        }
        return Result<U, E>(Failure<E>(std::move(*this).errorRef()));
    }

    /**
     * @brief Transforms the error, leaving a Success untouched.
     *
     * @tparam Func The type of the transformation function
     * @param func Function applied to the error
     * @return Result<T, F> where F is the function's return type
     */
    template <typename Func>
        requires std::invocable<Func, const E&>
    [[nodiscard]] constexpr auto mapError(Func&& func) const&
        -> Result<T, detail::InvokeResultT<Func, const E&>> {
        using F = detail::InvokeResultT<Func, const E&>;
        if (isFailure()) {
            return Result<T, F>(
                Failure<F>(std::invoke(std::forward<Func>(func), errorRef())));
        }
        return Result<T, F>(Success<T>(successRef()));
    }

    /**
     * @brief Transforms the error, leaving a Success untouched (move
     * version).
     */
    template <typename Func>
        requires std::invocable<Func, E&&>
    [[nodiscard]] constexpr auto mapError(Func&& func) &&
        -> Result<T, detail::InvokeResultT<Func, E&&>> {
        using F = detail::InvokeResultT<Func, E&&>;
        if (isFailure()) {
            return Result<T, F>(Failure<F>(std::invoke(
                std::forward<Func>(func), std::move(*this).errorRef())));
        }
        return Result<T, F>(Success<T>(std::move(*this).successRef()));
    }

    /**
     * @brief Applies @p func to the success value, or returns
     * @p defaultValue for a Failure.
     *
     * The default is an already evaluated value; use mapOrElse to compute
     * it only when needed.
     */
    template <typename V, typename Func>
        requires std::invocable<Func, const T&> &&
                 std::constructible_from<detail::InvokeResultT<Func, const T&>,
                                         V>
    [[nodiscard]] constexpr auto mapOr(V&& defaultValue, Func&& func) const&
        -> detail::InvokeResultT<Func, const T&> {
        using U = detail::InvokeResultT<Func, const T&>;
        if (isSuccess()) {
            return std::invoke(std::forward<Func>(func), successRef());
        }
        return U(std::forward<V>(defaultValue));
    }

    template <typename V, typename Func>
        requires std::invocable<Func, T&&> &&
                 std::constructible_from<detail::InvokeResultT<Func, T&&>, V>
    [[nodiscard]] constexpr auto mapOr(V&& defaultValue, Func&& func) &&
        -> detail::InvokeResultT<Func, T&&> {
        using U = detail::InvokeResultT<Func, T&&>;
        if (isSuccess()) {
            return std::invoke(std::forward<Func>(func),
                               std::move(*this).successRef());
        }
        return U(std::forward<V>(defaultValue));
    }

    /**
     * @brief Applies @p func to the success value, or @p defaultFunc to the
     * error. Exactly one of the two functions is invoked.
     *
     * @param defaultFunc Function computing the fallback from the error
     * @param func Function applied to the success value
     */
    template <typename DefaultFunc, typename Func>
        requires std::invocable<Func, const T&> &&
                 std::invocable<DefaultFunc, const E&>
    [[nodiscard]] constexpr auto mapOrElse(DefaultFunc&& defaultFunc,
                                           Func&& func) const&
        -> detail::InvokeResultT<Func, const T&> {
        using U = detail::InvokeResultT<Func, const T&>;
        if (isSuccess()) {
            return std::invoke(std::forward<Func>(func), successRef());
        }
        return U(std::invoke(std::forward<DefaultFunc>(defaultFunc),
                             errorRef()));
    }

    template <typename DefaultFunc, typename Func>
        requires std::invocable<Func, T&&> && std::invocable<DefaultFunc, E&&>
    [[nodiscard]] constexpr auto mapOrElse(DefaultFunc&& defaultFunc,
                                           Func&& func) &&
        -> detail::InvokeResultT<Func, T&&> {
        using U = detail::InvokeResultT<Func, T&&>;
        if (isSuccess()) {
            return std::invoke(std::forward<Func>(func),
                               std::move(*this).successRef());
        }
        return U(std::invoke(std::forward<DefaultFunc>(defaultFunc),
                             std::move(*this).errorRef()));
    }

    /**
     * @brief Calls @p func with the success value for its side effect.
     *
     * @return This same object, unchanged
     */
    template <typename Func>
        requires std::invocable<Func, const T&>
    constexpr auto inspect(Func&& func) const& -> const Result& {
        if (isSuccess()) {
            std::invoke(std::forward<Func>(func), successRef());
        }
        return *this;
    }

    template <typename Func>
        requires std::invocable<Func, const T&>
    constexpr auto inspect(Func&& func) && -> Result {
        if (isSuccess()) {
            std::invoke(std::forward<Func>(func), successRef());
        }
        return std::move(*this);
    }

    /**
     * @brief Calls @p func with the error for its side effect.
     *
     * @return This same object, unchanged
     */
    template <typename Func>
        requires std::invocable<Func, const E&>
    constexpr auto inspectError(Func&& func) const& -> const Result& {
        if (isFailure()) {
            std::invoke(std::forward<Func>(func), errorRef());
        }
        return *this;
    }

    template <typename Func>
        requires std::invocable<Func, const E&>
    constexpr auto inspectError(Func&& func) && -> Result {
        if (isFailure()) {
            std::invoke(std::forward<Func>(func), errorRef());
        }
        return std::move(*this);
    }

    // Conversions to Option

    /**
     * @brief Converts to an Option holding the success value. The error of
     * a Failure is discarded.
     */
    [[nodiscard]] constexpr auto toOption() const& -> Option<T> {
        if (isSuccess()) {
            return Option<T>(std::in_place, successRef());
        }
        return Option<T>();
    }

    [[nodiscard]] constexpr auto toOption() && -> Option<T> {
        if (isSuccess()) {
            return Option<T>(std::in_place,
                             std::move(*this).successRef());
        }
        return Option<T>();
    }

    /**
     * @brief Converts to an Option holding the error. The value of a
     * Success is discarded.
     */
    [[nodiscard]] constexpr auto errorAsOption() const& -> Option<E> {
        if (isFailure()) {
            return Option<E>(std::in_place, errorRef());
        }
        return Option<E>();
    }

    [[nodiscard]] constexpr auto errorAsOption() && -> Option<E> {
        if (isFailure()) {
            return Option<E>(std::in_place,
                             std::move(*this).errorRef());
        }
        return Option<E>();
    }

    // Extraction

    /**
     * @brief Gets the success value.
     *
     * @param location Call site, recorded in the raised exception
     * @return const T& The success value
     * @throws oxide::error::UnwrapFailure if this is a Failure; the message
     * contains the stringified error
     */
    [[nodiscard]] auto unwrap(const std::source_location& location =
                                  std::source_location::current()) const&
        -> const T& {
        if (isFailure()) [[unlikely]] {
            error::throwUnwrapFailure(
                location, fmt::format("called unwrap() on a Failure value: {}",
                                      utils::toString(errorRef())));
        }
        return successRef();
    }

    /**
     * @brief Moves the success value out (move version).
     */
    [[nodiscard]] auto unwrap(const std::source_location& location =
                                  std::source_location::current()) && -> T {
        if (isFailure()) [[unlikely]] {
            error::throwUnwrapFailure(
                location, fmt::format("called unwrap() on a Failure value: {}",
                                      utils::toString(errorRef())));
        }
        return std::move(*this).successRef();
    }

    /**
     * @brief Gets the error.
     *
     * @throws oxide::error::UnwrapFailure if this is a Success; the message
     * contains the stringified value
     */
    [[nodiscard]] auto unwrapError(const std::source_location& location =
                                       std::source_location::current()) const&
        -> const E& {
        if (isSuccess()) [[unlikely]] {
            error::throwUnwrapFailure(
                location,
                fmt::format("called unwrapError() on a Success value: {}",
                            utils::toString(successRef())));
        }
        return errorRef();
    }

    [[nodiscard]] auto unwrapError(const std::source_location& location =
                                       std::source_location::current()) && -> E {
        if (isSuccess()) [[unlikely]] {
            error::throwUnwrapFailure(
                location,
                fmt::format("called unwrapError() on a Success value: {}",
                            utils::toString(successRef())));
        }
        return std::move(*this).errorRef();
    }

    /**
     * @brief Gets the success value, failing with exactly @p message.
     *
     * @param message Diagnostic carried by the exception on a Failure
     * @throws oxide::error::UnwrapFailure if this is a Failure
     */
    [[nodiscard]] auto expect(std::string_view message,
                              const std::source_location& location =
                                  std::source_location::current()) const&
        -> const T& {
        if (isFailure()) [[unlikely]] {
            error::throwUnwrapFailure(location, message);
        }
        return successRef();
    }

    [[nodiscard]] auto expect(std::string_view message,
                              const std::source_location& location =
                                  std::source_location::current()) && -> T {
        if (isFailure()) [[unlikely]] {
            error::throwUnwrapFailure(location, message);
        }
        return std::move(*this).successRef();
    }

    /**
     * @brief Gets the error, failing with exactly @p message.
     *
     * @throws oxide::error::UnwrapFailure if this is a Success
     */
    [[nodiscard]] auto expectFailure(std::string_view message,
                                     const std::source_location& location =
                                         std::source_location::current()) const&
        -> const E& {
        if (isSuccess()) [[unlikely]] {
            error::throwUnwrapFailure(location, message);
        }
        return errorRef();
    }

    [[nodiscard]] auto expectFailure(std::string_view message,
                                     const std::source_location& location =
                                         std::source_location::current()) && -> E {
        if (isSuccess()) [[unlikely]] {
            error::throwUnwrapFailure(location, message);
        }
        return std::move(*this).errorRef();
    }

    /**
     * @brief Gets the success value or @p defaultValue for a Failure.
     */
    template <typename U>
        requires std::constructible_from<T, U>
    [[nodiscard]] constexpr auto unwrapOr(U&& defaultValue) const& -> T {
        return isSuccess() ? successRef()
                           : static_cast<T>(std::forward<U>(defaultValue));
    }

    template <typename U>
        requires std::constructible_from<T, U>
    [[nodiscard]] constexpr auto unwrapOr(U&& defaultValue) && -> T {
        return isSuccess() ? std::move(*this).successRef()
                           : static_cast<T>(std::forward<U>(defaultValue));
    }

    /**
     * @brief Gets the success value, or computes one from the error. @p func
     * is not invoked on a Success.
     */
    template <typename Func>
        requires std::invocable<Func, const E&> &&
                 std::convertible_to<std::invoke_result_t<Func, const E&>, T>
    [[nodiscard]] constexpr auto unwrapOrElse(Func&& func) const& -> T {
        if (isSuccess()) {
            return successRef();
        }
        return static_cast<T>(std::invoke(std::forward<Func>(func), errorRef()));
    }

    template <typename Func>
        requires std::invocable<Func, E&&> &&
                 std::convertible_to<std::invoke_result_t<Func, E&&>, T>
    [[nodiscard]] constexpr auto unwrapOrElse(Func&& func) && -> T {
        if (isSuccess()) {
            return std::move(*this).successRef();
        }
        return static_cast<T>(std::invoke(std::forward<Func>(func),
                                          std::move(*this).errorRef()));
    }

    // Chaining

    /**
     * @brief Returns @p other if this is a Success, otherwise this Failure
     * recast to Result<U, E>.
     *
     * @p other is constructed by the caller before the call, whatever the
     * arm of this Result.
     */
    template <typename U>
    [[nodiscard]] constexpr auto and_(Result<U, E> other) const&
        -> Result<U, E> {
        if (isSuccess()) {
            return other;
        }
        return Result<U, E>(Failure<E>(errorRef()));
    }

    template <typename U>
    [[nodiscard]] constexpr auto and_(Result<U, E> other) && -> Result<U, E> {
        if (isSuccess()) {
            return other;
        }
        return Result<U, E>(Failure<E>(std::move(*this).errorRef()));
    }

    /**
     * @brief Returns @p other as a Result<U, E> if this is a Success, so
     * `ok.and_(success(3))` needs no explicit Result type.
     */
    template <typename U>
    [[nodiscard]] constexpr auto and_(Success<U> other) const&
        -> Result<U, E> {
        if (isSuccess()) {
            return Result<U, E>(std::move(other));
        }
        return Result<U, E>(Failure<E>(errorRef()));
    }

    template <typename U>
    [[nodiscard]] constexpr auto and_(Success<U> other) && -> Result<U, E> {
        if (isSuccess()) {
            return Result<U, E>(std::move(other));
        }
        return Result<U, E>(Failure<E>(std::move(*this).errorRef()));
    }

    /**
     * @brief Monadic bind: chains a computation that may fail.
     *
     * @tparam Func Callable taking the success value and returning
     * Result<U, E>
     * @param func Function applied to the success value; not invoked on a
     * Failure
     * @return func(value) for a Success, this Failure recast otherwise
     */
    template <typename Func>
        requires std::invocable<Func, const T&>
    [[nodiscard]] constexpr auto andThen(Func&& func) const&
        -> detail::InvokeResultT<Func, const T&> {
        using R = detail::InvokeResultT<Func, const T&>;
        static_assert(detail::IsResult<R>::value,
                      "andThen callback must return a Result");
        static_assert(std::is_same_v<typename R::error_type, E>,
                      "andThen callback must keep the error type");
        if (isSuccess()) {
            return std::invoke(std::forward<Func>(func), successRef());
        }
        return R(Failure<E>(errorRef()));
    }

    template <typename Func>
        requires std::invocable<Func, T&&>
    [[nodiscard]] constexpr auto andThen(Func&& func) &&
        -> detail::InvokeResultT<Func, T&&> {
        using R = detail::InvokeResultT<Func, T&&>;
        static_assert(detail::IsResult<R>::value,
                      "andThen callback must return a Result");
        static_assert(std::is_same_v<typename R::error_type, E>,
                      "andThen callback must keep the error type");
        if (isSuccess()) {
            return std::invoke(std::forward<Func>(func),
                               std::move(*this).successRef());
        }
        return R(Failure<E>(std::move(*this).errorRef()));
    }

    /**
     * @brief Returns this Success recast to Result<T, F>, or @p other if
     * this is a Failure.
     */
    template <typename F>
    [[nodiscard]] constexpr auto or_(Result<T, F> other) const&
        -> Result<T, F> {
        if (isSuccess()) {
            return Result<T, F>(Success<T>(successRef()));
        }
        return other;
    }

    template <typename F>
    [[nodiscard]] constexpr auto or_(Result<T, F> other) && -> Result<T, F> {
        if (isSuccess()) {
            return Result<T, F>(Success<T>(std::move(*this).successRef()));
        }
        return other;
    }

    /**
     * @brief Returns this Success recast to Result<T, F>, or @p other as a
     * Result if this is a Failure.
     */
    template <typename F>
    [[nodiscard]] constexpr auto or_(Failure<F> other) const& -> Result<T, F> {
        if (isSuccess()) {
            return Result<T, F>(Success<T>(successRef()));
        }
        return Result<T, F>(std::move(other));
    }

    template <typename F>
    [[nodiscard]] constexpr auto or_(Failure<F> other) && -> Result<T, F> {
        if (isSuccess()) {
            return Result<T, F>(Success<T>(std::move(*this).successRef()));
        }
        return Result<T, F>(std::move(other));
    }

    /**
     * @brief Recovers from a Failure by calling @p func with the error.
     *
     * @tparam Func Callable taking the error and returning Result<T, F>
     * @param func Function applied to the error; not invoked on a Success
     * @return This Success recast, or func(error)
     */
    template <typename Func>
        requires std::invocable<Func, const E&>
    [[nodiscard]] constexpr auto orElse(Func&& func) const&
        -> detail::InvokeResultT<Func, const E&> {
        using R = detail::InvokeResultT<Func, const E&>;
        static_assert(detail::IsResult<R>::value,
                      "orElse callback must return a Result");
        static_assert(std::is_same_v<typename R::value_type, T>,
                      "orElse callback must keep the value type");
        if (isFailure()) {
            return std::invoke(std::forward<Func>(func), errorRef());
        }
        return R(Success<T>(successRef()));
    }

    template <typename Func>
        requires std::invocable<Func, E&&>
    [[nodiscard]] constexpr auto orElse(Func&& func) &&
        -> detail::InvokeResultT<Func, E&&> {
        using R = detail::InvokeResultT<Func, E&&>;
        static_assert(detail::IsResult<R>::value,
                      "orElse callback must return a Result");
        static_assert(std::is_same_v<typename R::value_type, T>,
                      "orElse callback must keep the value type");
        if (isFailure()) {
            return std::invoke(std::forward<Func>(func),
                               std::move(*this).errorRef());
        }
        return R(Success<T>(std::move(*this).successRef()));
    }

    // Comparison

    /**
     * @brief Two results are equal when they hold the same arm with equal
     * payloads.
     */
    [[nodiscard]] constexpr auto operator==(const Result& other) const
        -> bool {
        if (isSuccess() != other.isSuccess()) {
            return false;
        }
        if (isSuccess()) {
            return successRef() == other.successRef();
        }
        return errorRef() == other.errorRef();
    }

    template <typename U>
    [[nodiscard]] constexpr auto operator==(const Success<U>& other) const
        -> bool {
        return isSuccess() && successRef() == other.value();
    }

    template <typename G>
    [[nodiscard]] constexpr auto operator==(const Failure<G>& other) const
        -> bool {
        return isFailure() && errorRef() == other.error();
    }

private:
    [[nodiscard]] constexpr auto successRef() const& noexcept -> const T& {
        return std::get<0>(storage_).value();
    }

    [[nodiscard]] constexpr auto successRef() && noexcept -> T&& {
        return std::get<0>(std::move(storage_)).value();
    }

    [[nodiscard]] constexpr auto errorRef() const& noexcept -> const E& {
        return std::get<1>(storage_).error();
    }

    [[nodiscard]] constexpr auto errorRef() && noexcept -> E&& {
        return std::get<1>(std::move(storage_)).error();
    }

    std::variant<Success<T>, Failure<E>> storage_;
};

/**
 * @brief Creates a Success arm. C strings are stored as std::string.
 *
 * @param value The success value
 * @return Success<U> convertible to any compatible Result
 */
template <typename T>
[[nodiscard]] constexpr auto success(T&& value)
    -> Success<detail::StorageT<T>> {
    return Success<detail::StorageT<T>>(std::forward<T>(value));
}

/**
 * @brief Creates a fully typed Success result, e.g.
 * `success<int, std::string>(2)`.
 */
template <typename T, typename E, typename U>
[[nodiscard]] constexpr auto success(U&& value) -> Result<T, E> {
    return Result<T, E>::success(std::forward<U>(value));
}

/**
 * @brief Creates a Failure arm. C strings are stored as std::string.
 *
 * @param error The error value
 * @return Failure<G> convertible to any compatible Result
 */
template <typename E>
[[nodiscard]] constexpr auto failure(E&& error)
    -> Failure<detail::StorageT<E>> {
    return Failure<detail::StorageT<E>>(std::forward<E>(error));
}

/**
 * @brief Creates a fully typed Failure result, e.g.
 * `failure<int, std::string>("bad")`.
 */
template <typename T, typename E, typename G>
[[nodiscard]] constexpr auto failure(G&& error) -> Result<T, E> {
    return Result<T, E>::failure(std::forward<G>(error));
}

template <typename T>
auto operator<<(std::ostream& os, const Success<T>& wrapped) -> std::ostream& {
    return os << "Success(" << utils::toString(wrapped.value()) << ")";
}

template <typename E>
auto operator<<(std::ostream& os, const Failure<E>& wrapped) -> std::ostream& {
    return os << "Failure(" << utils::toString(wrapped.error()) << ")";
}

/**
 * @brief Writes "Success(<value>)" or "Failure(<error>)".
 */
template <typename T, typename E>
auto operator<<(std::ostream& os, const Result<T, E>& result)
    -> std::ostream& {
    if (result.isSuccess()) {
        return os << "Success(" << utils::toString(result.unwrap()) << ")";
    }
    return os << "Failure(" << utils::toString(result.unwrapError()) << ")";
}

}  // namespace oxide::type

#include "oxide/type/option.hpp"

#endif  // OXIDE_TYPE_RESULT_HPP
