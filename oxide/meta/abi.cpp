#include "abi.hpp"

#include <cstdlib>
#include <memory>

#ifndef _MSC_VER
#include <cxxabi.h>
#endif

namespace oxide::meta {

auto DemangleHelper::demangle(std::string_view mangledName) -> std::string {
    std::string name(mangledName);
#ifdef _MSC_VER
    // MSVC type names are already readable
    return name;
#else
    int status = -1;
    std::unique_ptr<char, decltype(&std::free)> demangled(
        abi::__cxa_demangle(name.c_str(), nullptr, nullptr, &status),
        &std::free);
    if (status != 0 || demangled == nullptr) {
        return name;
    }
    return std::string(demangled.get());
#endif
}

}  // namespace oxide::meta
