#ifndef PAREX_DEBUG_LOG_HPP
#define PAREX_DEBUG_LOG_HPP

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <sstream>
#include <string>
#include <thread>

namespace parex {
namespace debug {

// Subsystems that trace; each can be muted on its own
enum class Component : uint32_t {
    Engine = 1u << 0,
    Finalize = 1u << 1,
    VectorSource = 1u << 2,
    DirectorySource = 1u << 3
};

constexpr uint32_t all_components = 0xFu;

inline const char* component_name(Component component) {
    switch (component) {
        case Component::Engine: return "engine";
        case Component::Finalize: return "finalize";
        case Component::VectorSource: return "vector";
        case Component::DirectorySource: return "directory";
    }
    return "?";
}

// Receives one formatted line, without trailing newline
using DebugCallback = void (*)(Component component, const char* message);

inline std::atomic<DebugCallback> g_debug_callback{nullptr};
inline std::atomic<uint32_t> g_enabled_components{all_components};

// When no callback is set, lines go to stdout
inline void set_debug_callback(DebugCallback cb) {
    g_debug_callback.store(cb, std::memory_order_release);
}

inline void clear_debug_callback() {
    g_debug_callback.store(nullptr, std::memory_order_release);
}

// Bitwise OR of Component values
inline void set_enabled_components(uint32_t mask) {
    g_enabled_components.store(mask, std::memory_order_release);
}

inline bool is_enabled(Component component) {
    return (g_enabled_components.load(std::memory_order_acquire) &
            static_cast<uint32_t>(component)) != 0;
}

#if defined(__GNUC__)
__attribute__((format(printf, 2, 3)))
#endif
inline void log(Component component, const char* fmt, ...) {
    if (!is_enabled(component)) return;

    std::ostringstream line;
    line << "[DEBUG][T" << std::this_thread::get_id() << "][" << component_name(component) << "] ";

    va_list args;
    va_start(args, fmt);
    va_list sizing;
    va_copy(sizing, args);
    const int length = vsnprintf(nullptr, 0, fmt, sizing);
    va_end(sizing);
    if (length > 0) {
        std::string body(static_cast<std::size_t>(length) + 1, '\0');
        vsnprintf(&body[0], body.size(), fmt, args);
        body.resize(static_cast<std::size_t>(length));
        line << body;
    }
    va_end(args);

    const std::string text = line.str();
    DebugCallback cb = g_debug_callback.load(std::memory_order_acquire);
    if (cb) {
        cb(component, text.c_str());
    } else {
        std::printf("%s\n", text.c_str());
        std::fflush(stdout);
    }
}

} // namespace debug
} // namespace parex

// PAREX_DEBUG_LOG(Engine, "limit %zu reached", n)
#ifdef PAREX_ENABLE_DEBUG_OUTPUT
    #define PAREX_DEBUG_LOG(component, fmt, ...) \
        ::parex::debug::log(::parex::debug::Component::component, fmt, ##__VA_ARGS__)
#else
    #define PAREX_DEBUG_LOG(component, fmt, ...) ((void)0)
#endif

#endif // PAREX_DEBUG_LOG_HPP
