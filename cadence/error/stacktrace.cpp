#include "stacktrace.hpp"

#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <memory>
#include <sstream>

#if defined(__APPLE__) || defined(__linux__)
#include <cxxabi.h>
#include <dlfcn.h>
#include <execinfo.h>
#endif

namespace cadence::error {

namespace {

constexpr int MAX_FRAMES = 64;

auto formatAddress(uintptr_t address) -> std::string {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::uppercase << std::setfill('0')
        << std::setw(sizeof(void*) * 2) << address;
    return oss.str();
}

auto getBaseName(const std::string& path) -> std::string {
    size_t lastSlash = path.find_last_of("/\\");
    if (lastSlash != std::string::npos) {
        return path.substr(lastSlash + 1);
    }
    return path;
}

#if defined(__APPLE__) || defined(__linux__)
auto demangle(const char* name) -> std::string {
    int status = 0;
    std::unique_ptr<char, decltype(&std::free)> demangled(
        abi::__cxa_demangle(name, nullptr, nullptr, &status), &std::free);
    if (status == 0 && demangled) {
        return demangled.get();
    }
    return name;
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
    for (size_t i = 0; i < frames_.size(); ++i) {
        oss << "\t[" << i << "] " << processFrame(frames_[i]) << "\n";
    }
    return oss.str();
}

#if defined(__APPLE__) || defined(__linux__)
void StackTrace::capture() {
    void* framePtrs[MAX_FRAMES];
    int numFrames = backtrace(framePtrs, MAX_FRAMES);
    // Skip the frame of capture() itself.
    if (numFrames > 1) {
        frames_.assign(framePtrs + 1, framePtrs + numFrames);
    }
}

auto StackTrace::processFrame(void* frame) const -> std::string {
    auto it = symbolCache_.find(frame);
    if (it != symbolCache_.end()) {
        return it->second;
    }

    auto address = reinterpret_cast<uintptr_t>(frame);
    std::string functionName = "<unknown function>";
    std::string moduleName;
    uintptr_t offset = 0;

    Dl_info dlInfo;
    if (dladdr(frame, &dlInfo) != 0) {
        if (dlInfo.dli_fname != nullptr) {
            moduleName = dlInfo.dli_fname;
        }
        if (dlInfo.dli_fbase != nullptr) {
            offset = address - reinterpret_cast<uintptr_t>(dlInfo.dli_fbase);
        }
        if (dlInfo.dli_sname != nullptr) {
            functionName = demangle(dlInfo.dli_sname);
        }
    }

    std::ostringstream oss;
    oss << functionName << " at " << formatAddress(address);
    if (!moduleName.empty()) {
        oss << " in " << getBaseName(moduleName);
        if (offset > 0) {
            oss << " (+" << std::hex << offset << ")";
        }
    }

    std::string result = oss.str();
    symbolCache_[frame] = result;
    return result;
}
#else
void StackTrace::capture() {}

auto StackTrace::processFrame(void* frame) const -> std::string {
    return "<frame information unavailable> at " +
           formatAddress(reinterpret_cast<uintptr_t>(frame));
}
#endif

}  // namespace cadence::error
