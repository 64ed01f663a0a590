/*!
 * \file abi.hpp
 * \brief C++ ABI wrapper for symbol and type demangling
 * \author Max Qian <lightapt.com>
 * \date 2024-5-25
 * \copyright Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef OXIDE_META_ABI_HPP
#define OXIDE_META_ABI_HPP

#include <string>
#include <string_view>
#include <typeinfo>

namespace oxide::meta {

/*!
 * \brief Helper class for C++ name demangling
 */
class DemangleHelper {
public:
    /*!
     * \brief Demangle a type
     * \tparam T The type to demangle
     * \return A human-readable string representation of the type
     */
    template <typename T>
    static auto demangleType() -> std::string {
        return demangle(typeid(T).name());
    }

    /*!
     * \brief Demangle the dynamic type of an instance
     * \tparam T The static type of the instance
     * \param instance An instance of the type
     * \return A human-readable string representation of the type
     */
    template <typename T>
    static auto demangleType(const T& instance) -> std::string {
        return demangle(typeid(instance).name());
    }

    /*!
     * \brief Demangle a symbol or type name
     * \param mangledName The mangled name
     * \return The demangled name, or the input unchanged when it is not a
     * valid mangled name
     */
    static auto demangle(std::string_view mangledName) -> std::string;
};

}  // namespace oxide::meta

#endif  // OXIDE_META_ABI_HPP
