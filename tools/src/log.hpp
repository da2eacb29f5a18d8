// Thread-safe logging for the mockforge tool.
#pragma once

#include <atomic>
#include <fmt/format.h>
#include <llvm/Support/raw_ostream.h>

#include <iterator>
#include <mutex>
#include <utility>

namespace mockforge::codegen {

inline std::mutex &log_mutex() {
    static std::mutex mu;
    return mu;
}

inline std::atomic<bool> &debug_logging_flag() {
    static std::atomic<bool> enabled{false};
    return enabled;
}

inline void set_debug_logging(bool enabled) { debug_logging_flag().store(enabled); }
inline bool debug_logging() { return debug_logging_flag().load(); }

namespace detail {

template <typename... Args>
void write_line(llvm::raw_ostream &os, fmt::format_string<Args...> format_string, Args &&...args) {
    fmt::memory_buffer buffer;
    buffer.reserve(256);
    fmt::format_to(std::back_inserter(buffer), "mockforge: ");
    fmt::format_to(std::back_inserter(buffer), format_string, std::forward<Args>(args)...);
    buffer.push_back('\n');
    std::lock_guard<std::mutex> lock(log_mutex());
    os << fmt::to_string(buffer);
    os.flush();
}

} // namespace detail

template <typename... Args> void log_err(fmt::format_string<Args...> format_string, Args &&...args) {
    detail::write_line(llvm::errs(), format_string, std::forward<Args>(args)...);
}

template <typename... Args> void log_info(fmt::format_string<Args...> format_string, Args &&...args) {
    detail::write_line(llvm::outs(), format_string, std::forward<Args>(args)...);
}

template <typename... Args> void log_debug(fmt::format_string<Args...> format_string, Args &&...args) {
    if (!debug_logging()) {
        return;
    }
    detail::write_line(llvm::errs(), format_string, std::forward<Args>(args)...);
}

} // namespace mockforge::codegen
