#ifndef CADENCE_ERROR_STACKTRACE_HPP
#define CADENCE_ERROR_STACKTRACE_HPP

#include <string>
#include <unordered_map>
#include <vector>

namespace cadence::error {

/**
 * @brief Captures the call stack at construction time.
 *
 * Symbol names are resolved and demangled lazily by toString(), so capturing
 * a trace stays cheap for exceptions that are caught and never printed.
 */
class StackTrace {
public:
    /**
     * @brief Captures the current stack trace.
     */
    StackTrace();

    /**
     * @brief Renders one line per frame: function, address and module.
     */
    [[nodiscard]] auto toString() const -> std::string;

private:
    void capture();

    [[nodiscard]] auto processFrame(void* frame) const -> std::string;

    std::vector<void*> frames_;
    mutable std::unordered_map<void*, std::string> symbolCache_;
};

}  // namespace cadence::error

#endif
