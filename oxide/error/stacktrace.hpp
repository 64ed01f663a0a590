#ifndef OXIDE_ERROR_STACKTRACE_HPP
#define OXIDE_ERROR_STACKTRACE_HPP

#include <string>
#include <unordered_map>
#include <vector>

namespace oxide::error {

/**
 * @brief Captures the call stack at construction and renders it as text.
 *
 * Each frame is rendered with its demangled function name, address and
 * owning module when the platform exposes them.
 */
class StackTrace {
public:
    /**
     * @brief Captures the current stack, skipping this constructor's frame.
     */
    StackTrace();

    /**
     * @brief Get the string representation of the stack trace.
     *
     * @return One line per frame, prefixed by "Stack trace:".
     */
    [[nodiscard]] auto toString() const -> std::string;

    /**
     * @brief Number of captured frames.
     */
    [[nodiscard]] auto size() const -> std::size_t { return frames_.size(); }

private:
    void capture();

    [[nodiscard]] auto processFrame(void* frame, int frameIndex) const
        -> std::string;

    std::vector<void*> frames_;

#ifdef _WIN32
    mutable std::unordered_map<void*, std::string> moduleCache_;
#elif defined(__APPLE__) || defined(__linux__)
    std::vector<std::string> symbols_;
    mutable std::unordered_map<void*, std::string> symbolCache_;
#endif
};

}  // namespace oxide::error

#endif  // OXIDE_ERROR_STACKTRACE_HPP
