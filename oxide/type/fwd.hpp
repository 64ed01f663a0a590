#ifndef OXIDE_TYPE_FWD_HPP
#define OXIDE_TYPE_FWD_HPP

#include <string>
#include <type_traits>

namespace oxide::type {

template <typename T>
class Success;

template <typename E>
class Failure;

template <typename T, typename E = std::string>
class Result;

template <typename T>
class Option;

namespace detail {

/// Storage type for a payload passed by the caller: decayed, with C strings
/// stored as std::string.
template <typename T>
using StorageT = std::conditional_t<
    std::is_same_v<std::decay_t<T>, const char*> ||
        std::is_same_v<std::decay_t<T>, char*>,
    std::string, std::decay_t<T>>;

template <typename T>
struct IsResult : std::false_type {};

template <typename T, typename E>
struct IsResult<Result<T, E>> : std::true_type {};

template <typename T>
struct IsOption : std::false_type {};

template <typename T>
struct IsOption<Option<T>> : std::true_type {};

/// Plain result type of invoking Func with Args.
template <typename Func, typename... Args>
using InvokeResultT = std::remove_cvref_t<std::invoke_result_t<Func, Args...>>;

}  // namespace detail

}  // namespace oxide::type

#endif  // OXIDE_TYPE_FWD_HPP
