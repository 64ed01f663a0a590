#include "stacktrace.hpp"
#include "oxide/meta/abi.hpp"

#include <cstdint>
#include <cstdlib>
#include <memory>
#include <iomanip>
#include <regex>
#include <sstream>

#ifdef _WIN32
// clang-format off
#include <windows.h>
#include <dbghelp.h>
// clang-format on
#if !defined(__MINGW32__) && !defined(__MINGW64__)
#pragma comment(lib, "dbghelp.lib")
#endif
#elif defined(__APPLE__) || defined(__linux__)
#include <dlfcn.h>
#include <execinfo.h>
#endif

namespace oxide::error {

namespace {

constexpr int MAX_FRAMES = 128;
constexpr const char* UNKNOWN_FUNCTION = "<unknown function>";

auto prettifyStacktrace(const std::string& input) -> std::string {
    std::string output = input;

    static const std::vector<std::pair<std::regex, std::string>> REPLACEMENTS =
        {{std::regex("std::__1::"), "std::"},
         {std::regex("std::__cxx11::"), "std::"},
         {std::regex(", std::allocator<[^<>]+>"), ""},
         {std::regex(R"(\s{2,})"), " "}};

    for (const auto& [pattern, replacement] : REPLACEMENTS) {
        output = std::regex_replace(output, pattern, replacement);
    }
    return output;
}

auto formatAddress(std::uintptr_t address) -> std::string {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::uppercase << std::setfill('0')
        << std::setw(sizeof(void*) * 2) << address;
    return oss.str();
}

auto getBaseName(const std::string& path) -> std::string {
    const auto lastSlash = path.find_last_of("/\\");
    if (lastSlash != std::string::npos) {
        return path.substr(lastSlash + 1);
    }
    return path;
}

#if defined(__APPLE__) || defined(__linux__)
// backtrace_symbols() lines look like "module(_Z3foov+0x1a) [0x...]"
auto symbolFromBacktraceLine(const std::string& line) -> std::string {
    const auto start = line.find('(');
    const auto end = line.find('+', start == std::string::npos ? 0 : start);
    if (start == std::string::npos || end == std::string::npos ||
        end <= start + 1) {
        return UNKNOWN_FUNCTION;
    }
    return meta::DemangleHelper::demangle(
        line.substr(start + 1, end - start - 1));
}
#endif

}  // namespace

StackTrace::StackTrace() { capture(); }

auto StackTrace::toString() const -> std::string {
    std::ostringstream oss;
    oss << "Stack trace:\n";

    if (frames_.empty()) {
        oss << "\tStack trace not available on this platform.\n";
        return oss.str();
    }

    for (std::size_t i = 0; i < frames_.size(); ++i) {
        oss << "\t[" << i << "] "
            << processFrame(frames_[i], static_cast<int>(i)) << "\n";
    }
    return prettifyStacktrace(oss.str());
}

#ifdef _WIN32
auto StackTrace::processFrame(void* frame, int /*frameIndex*/) const
    -> std::string {
    const auto address = reinterpret_cast<std::uintptr_t>(frame);

    std::string moduleName;
    if (auto it = moduleCache_.find(frame); it != moduleCache_.end()) {
        moduleName = it->second;
    } else {
        HMODULE module;
        if (GetModuleHandleExA(GET_MODULE_HANDLE_EX_FLAG_FROM_ADDRESS |
                                   GET_MODULE_HANDLE_EX_FLAG_UNCHANGED_REFCOUNT,
                               reinterpret_cast<LPCSTR>(frame), &module)) {
            char modulePath[MAX_PATH];
            if (GetModuleFileNameA(module, modulePath, MAX_PATH) > 0) {
                moduleName = modulePath;
                moduleCache_[frame] = moduleName;
            }
        }
    }

    constexpr std::size_t MAX_SYMBOL_LEN = 1024;
    std::vector<char> buffer(sizeof(SYMBOL_INFO) + MAX_SYMBOL_LEN);
    auto* symbol = reinterpret_cast<SYMBOL_INFO*>(buffer.data());
    symbol->MaxNameLen = MAX_SYMBOL_LEN - 1;
    symbol->SizeOfStruct = sizeof(SYMBOL_INFO);

    DWORD64 displacement = 0;
    std::string functionName = UNKNOWN_FUNCTION;
    if (SymFromAddr(GetCurrentProcess(), address, &displacement, symbol)) {
        functionName = symbol->Name;
    }

    std::ostringstream oss;
    oss << functionName << " at " << formatAddress(address);
    if (!moduleName.empty()) {
        oss << " in " << getBaseName(moduleName);
    }
    return oss.str();
}

void StackTrace::capture() {
    SymSetOptions(SYMOPT_UNDNAME | SYMOPT_DEFERRED_LOADS | SYMOPT_LOAD_LINES);
    SymInitialize(GetCurrentProcess(), nullptr, TRUE);

    void* framePtrs[MAX_FRAMES];
    const WORD captured =
        CaptureStackBackTrace(1, MAX_FRAMES, framePtrs, nullptr);
    frames_.assign(framePtrs, framePtrs + captured);
    moduleCache_.clear();
}

#elif defined(__APPLE__) || defined(__linux__)
auto StackTrace::processFrame(void* frame, int frameIndex) const
    -> std::string {
    if (auto it = symbolCache_.find(frame); it != symbolCache_.end()) {
        return it->second;
    }

    const auto address = reinterpret_cast<std::uintptr_t>(frame);
    std::string functionName = UNKNOWN_FUNCTION;
    std::string moduleName;
    std::uintptr_t offset = 0;

    Dl_info dlInfo;
    if (dladdr(frame, &dlInfo) != 0) {
        if (dlInfo.dli_fname != nullptr) {
            moduleName = dlInfo.dli_fname;
        }
        if (dlInfo.dli_fbase != nullptr) {
            offset = address - reinterpret_cast<std::uintptr_t>(dlInfo.dli_fbase);
        }
        if (dlInfo.dli_sname != nullptr) {
            functionName = meta::DemangleHelper::demangle(dlInfo.dli_sname);
        }
    }

    if (functionName == UNKNOWN_FUNCTION &&
        frameIndex < static_cast<int>(symbols_.size())) {
        functionName = symbolFromBacktraceLine(symbols_[frameIndex]);
    }

    std::ostringstream oss;
    oss << functionName << " at " << formatAddress(address);
    if (!moduleName.empty()) {
        oss << " in " << getBaseName(moduleName);
        if (offset > 0) {
            oss << " (+" << std::hex << offset << ")";
        }
    }

    auto result = oss.str();
    symbolCache_[frame] = result;
    return result;
}

void StackTrace::capture() {
    void* framePtrs[MAX_FRAMES];
    const int captured = backtrace(framePtrs, MAX_FRAMES);

    frames_.clear();
    symbols_.clear();
    if (captured > 1) {
        frames_.assign(framePtrs + 1, framePtrs + captured);
        std::unique_ptr<char*, decltype(&std::free)> lines(
            backtrace_symbols(framePtrs + 1, captured - 1), &std::free);
        if (lines) {
            symbols_.assign(lines.get(), lines.get() + (captured - 1));
        }
    }
    symbolCache_.clear();
}

#else
auto StackTrace::processFrame(void* frame, int /*frameIndex*/) const
    -> std::string {
    return "<frame information unavailable> at " +
           formatAddress(reinterpret_cast<std::uintptr_t>(frame));
}

void StackTrace::capture() { frames_.clear(); }
#endif

}  // namespace oxide::error
