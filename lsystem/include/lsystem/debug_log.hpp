#ifndef LSYSTEM_DEBUG_LOG_HPP
#define LSYSTEM_DEBUG_LOG_HPP

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <sstream>
#include <string>
#include <thread>

namespace lsystem {
namespace debug {

/**
 * Receives one finished log line, without a trailing newline, e.g.
 *   [lsystem:chunked_rewriter][T140213] ChunkedRewriter: 3 chunk(s) failed
 * Called from whichever thread logged, so it must be thread-safe.
 */
using DebugSink = void (*)(const char* line);

// Null routes lines to stderr
inline std::atomic<DebugSink> g_debug_sink{nullptr};

inline void set_debug_sink(DebugSink sink) {
    g_debug_sink.store(sink, std::memory_order_release);
}

inline void clear_debug_sink() {
    g_debug_sink.store(nullptr, std::memory_order_release);
}

// "path/to/chunked_rewriter.hpp" -> "chunked_rewriter"
inline std::string component_name(const char* path) {
    std::string name(path ? path : "");
    const auto slash = name.find_last_of("/\\");
    if (slash != std::string::npos) {
        name.erase(0, slash + 1);
    }
    const auto dot = name.find('.');
    if (dot != std::string::npos) {
        name.erase(dot);
    }
    return name;
}

inline void log_line(const char* source_file, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    va_list measure;
    va_copy(measure, args);
    const int length = std::vsnprintf(nullptr, 0, fmt, measure);
    va_end(measure);

    std::string message(length > 0 ? static_cast<std::size_t>(length) : 0, '\0');
    if (length > 0) {
        std::vsnprintf(&message[0], message.size() + 1, fmt, args);
    }
    va_end(args);

    std::ostringstream line;
    line << "[lsystem:" << component_name(source_file) << "][T" << std::this_thread::get_id() << "] "
         << message;
    const std::string text = line.str();

    if (DebugSink sink = g_debug_sink.load(std::memory_order_acquire)) {
        sink(text.c_str());
    } else {
        std::fprintf(stderr, "%s\n", text.c_str());
    }
}

} // namespace debug
} // namespace lsystem

// Compiled out unless ENABLE_DEBUG_OUTPUT is defined (CMake: LSYSTEM_ENABLE_DEBUG_OUTPUT)
#ifdef ENABLE_DEBUG_OUTPUT
    #define DEBUG_LOG(fmt, ...) ::lsystem::debug::log_line(__FILE__, fmt, ##__VA_ARGS__)
#else
    #define DEBUG_LOG(fmt, ...) ((void)0)
#endif

#endif // LSYSTEM_DEBUG_LOG_HPP
