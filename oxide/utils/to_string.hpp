/*
 * to_string.hpp
 *
 * Copyright (C) 2023-2024 Max Qian
 */

/*************************************************

Date: 2024-10-19

Description: Best-effort conversion of arbitrary values to text, used to
render payloads in diagnostics

**************************************************/

#ifndef OXIDE_UTILS_TO_STRING_HPP
#define OXIDE_UTILS_TO_STRING_HPP

#include <concepts>
#include <exception>
#include <optional>
#include <ostream>
#include <ranges>
#include <sstream>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

#include <fmt/format.h>

#include "oxide/meta/abi.hpp"

namespace oxide::utils {

/**
 * @brief Concept for string types: std::string, string_view and C strings.
 */
template <typename T>
concept StringType = std::is_same_v<std::decay_t<T>, std::string> ||
                     std::is_same_v<std::decay_t<T>, const char*> ||
                     std::is_same_v<std::decay_t<T>, char*> ||
                     std::is_same_v<std::decay_t<T>, std::string_view>;

/**
 * @brief Concept for ranges that are not strings. Ranges whose elements are
 * themselves (such as std::filesystem::path) are excluded.
 */
template <typename T>
concept Container =
    std::ranges::range<T> && !StringType<T> &&
    !std::same_as<std::remove_cvref_t<std::ranges::range_value_t<T>>,
                  std::remove_cvref_t<T>>;

/**
 * @brief Concept for ranges of key/value pairs.
 */
template <typename T>
concept MapType = Container<T> && requires {
    typename T::key_type;
    typename T::mapped_type;
};

template <typename T>
concept PointerType = std::is_pointer_v<T> && !StringType<T>;

template <typename T>
concept EnumType = std::is_enum_v<T>;

template <typename T>
concept SmartPointer = requires(T smartPtr) {
    *smartPtr;
    { smartPtr.get() } -> std::convertible_to<const volatile void*>;
};

template <typename T>
concept HasStdToString = requires(T t) {
    { std::to_string(t) } -> std::convertible_to<std::string>;
};

template <typename T>
concept Streamable = requires(std::ostream& os, const T& t) {
    { os << t } -> std::convertible_to<std::ostream&>;
};

/**
 * @brief Types handled by the general overload.
 */
template <typename T>
concept GeneralType = !StringType<T> && !Container<T> && !PointerType<T> &&
                      !EnumType<T> && !SmartPointer<T>;

/**
 * @brief Exception class for toString conversion errors
 */
class ToStringException : public std::exception {
private:
    std::string message_;

public:
    explicit ToStringException(std::string message)
        : message_(fmt::format("ToString conversion error: {}",
                               std::move(message))) {}

    [[nodiscard]] auto what() const noexcept -> const char* override {
        return message_.c_str();
    }
};

// Every overload is declared before any is defined so that nested values
// (a vector of optionals, a tuple of maps) resolve to the right one.
auto toString(char value) -> std::string;
auto toString(bool value) -> std::string;
template <StringType T>
auto toString(T&& value) -> std::string;
template <EnumType T>
auto toString(T value) -> std::string;
template <PointerType T>
auto toString(T ptr) -> std::string;
template <SmartPointer T>
auto toString(const T& ptr) -> std::string;
template <Container T>
auto toString(const T& container, std::string_view separator) -> std::string;
template <Container T>
auto toString(const T& container) -> std::string;
template <typename... Args>
auto toString(const std::tuple<Args...>& tpl, std::string_view separator)
    -> std::string;
template <typename... Args>
auto toString(const std::tuple<Args...>& tpl) -> std::string;
template <typename First, typename Second>
auto toString(const std::pair<First, Second>& pair) -> std::string;
template <typename T>
auto toString(const std::optional<T>& opt) -> std::string;
template <typename... Ts>
auto toString(const std::variant<Ts...>& var) -> std::string;
template <typename T>
    requires GeneralType<T>
auto toString(const T& value) -> std::string;

/**
 * @brief Converts a string type to std::string. A null C string renders as
 * "null".
 */
template <StringType T>
auto toString(T&& value) -> std::string {
    if constexpr (std::is_same_v<std::decay_t<T>, std::string>) {
        return std::forward<T>(value);
    } else if constexpr (std::is_same_v<std::decay_t<T>, std::string_view>) {
        return std::string(value);
    } else {
        const char* text = value;
        if (text == nullptr) {
            return "null";
        }
        return std::string(text);
    }
}

/**
 * @brief Converts an enum to its underlying integer value.
 */
template <EnumType T>
auto toString(T value) -> std::string {
    return std::to_string(static_cast<std::underlying_type_t<T>>(value));
}

/**
 * @brief Converts a raw pointer to "Pointer(<address>, <pointee>)".
 */
template <PointerType T>
auto toString(T ptr) -> std::string {
    if (ptr == nullptr) {
        return "nullptr";
    }
    if constexpr (std::is_void_v<std::remove_cv_t<std::remove_pointer_t<T>>>) {
        return fmt::format("Pointer({})", static_cast<const void*>(ptr));
    } else {
        try {
            return fmt::format("Pointer({}, {})",
                               static_cast<const void*>(ptr), toString(*ptr));
        } catch (const std::exception& e) {
            return fmt::format("Pointer({}) [Error: {}]",
                               static_cast<const void*>(ptr), e.what());
        }
    }
}

/**
 * @brief Converts a smart pointer to "SmartPointer(<address>, <pointee>)".
 */
template <SmartPointer T>
auto toString(const T& ptr) -> std::string {
    if (!ptr) {
        return "nullptr";
    }
    try {
        return fmt::format("SmartPointer({}, {})",
                           static_cast<const void*>(ptr.get()),
                           toString(*ptr));
    } catch (const std::exception& e) {
        return fmt::format("SmartPointer({}) [Error: {}]",
                           static_cast<const void*>(ptr.get()), e.what());
    }
}

/**
 * @brief Converts a container to "[a, b]", or "{k: v}" for maps. An element
 * that fails to convert is rendered in place as "[Error: <what>]".
 */
template <Container T>
auto toString(const T& container, std::string_view separator) -> std::string {
    std::string result;
    bool first = true;

    if constexpr (MapType<T>) {
        result += "{";
        for (const auto& [key, value] : container) {
            if (!first) {
                result += separator;
            }
            first = false;

            try {
                result += fmt::format("{}: {}", toString(key), toString(value));
            } catch (const std::exception& e) {
                result += fmt::format("[Error: {}]", e.what());
            }
        }
        result += "}";
    } else {
        result += "[";
        for (const auto& item : container) {
            if (!first) {
                result += separator;
            }
            first = false;

            try {
                result += toString(item);
            } catch (const std::exception& e) {
                result += fmt::format("[Error: {}]", e.what());
            }
        }
        result += "]";
    }
    return result;
}

template <Container T>
auto toString(const T& container) -> std::string {
    return toString(container, ", ");
}

template <typename Tuple, std::size_t... I>
auto tupleToStringImpl(const Tuple& tpl, std::index_sequence<I...>,
                       std::string_view separator) -> std::string {
    std::string result = "(";
    bool first = true;

    auto append = [&](const auto& element) {
        if (!first) {
            result += separator;
        }
        first = false;
        try {
            result += toString(element);
        } catch (const std::exception& e) {
            result += fmt::format("[Error: {}]", e.what());
        }
    };
    (append(std::get<I>(tpl)), ...);

    result += ")";
    return result;
}

template <typename... Args>
auto toString(const std::tuple<Args...>& tpl, std::string_view separator)
    -> std::string {
    return tupleToStringImpl(tpl, std::index_sequence_for<Args...>(),
                             separator);
}

template <typename... Args>
auto toString(const std::tuple<Args...>& tpl) -> std::string {
    return toString(tpl, ", ");
}

template <typename First, typename Second>
auto toString(const std::pair<First, Second>& pair) -> std::string {
    return fmt::format("({}, {})", toString(pair.first),
                       toString(pair.second));
}

/**
 * @brief Converts a std::optional to "Optional(<value>)" or "nullopt".
 */
template <typename T>
auto toString(const std::optional<T>& opt) -> std::string {
    if (!opt.has_value()) {
        return "nullopt";
    }
    try {
        return fmt::format("Optional({})", toString(*opt));
    } catch (const std::exception& e) {
        return fmt::format("Optional([Error: {}])", e.what());
    }
}

template <typename... Ts>
auto toString(const std::variant<Ts...>& var) -> std::string {
    if (var.valueless_by_exception()) {
        return "Variant(valueless)";
    }
    return std::visit(
        [](const auto& value) -> std::string {
            try {
                return toString(value);
            } catch (const std::exception& e) {
                return fmt::format("Variant(error: {})", e.what());
            }
        },
        var);
}

/**
 * @brief Converts any other value: arithmetic types through std::to_string,
 * streamable types through operator<<, everything else as
 * "<unprintable TYPE>". A failing operator<< renders as "[Error: <what>]".
 */
template <typename T>
    requires GeneralType<T>
auto toString(const T& value) -> std::string {
    if constexpr (HasStdToString<T>) {
        return std::to_string(value);
    } else if constexpr (Streamable<T>) {
        std::ostringstream oss;
        try {
            oss << value;
            if (oss.fail()) {
                throw ToStringException("stream insertion failed");
            }
        } catch (const std::exception& e) {
            return fmt::format("[Error: {}]", e.what());
        }
        return oss.str();
    } else {
        return fmt::format("<unprintable {}>",
                           meta::DemangleHelper::demangleType<T>());
    }
}

}  // namespace oxide::utils

#endif  // OXIDE_UTILS_TO_STRING_HPP
