#pragma once

/**
 * @file trace_logger.hpp
 * @brief Compile-time trace logging for derivations and the fetch loop.
 *
 * SECURITY WARNING: trace output may contain derived public keys, entry IDs
 * and full host responses. Only enable SKYKERNEL_DEBUG_TRACE for development.
 * Seeds and secret keys are never passed to these helpers.
 *
 * Enable via CMake: -DSKYKERNEL_DEBUG_TRACE=ON
 */

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>

namespace skykernel::debug {

// ============================================================================
// Component identifiers - always defined so types are available
// ============================================================================

enum class Component {
    Seed,
    Registry,
    Skylink,
    Fetch,
    Module,
    Storage
};

#ifdef SKYKERNEL_DEBUG_TRACE

inline std::string ToHexTruncated(std::span<const uint8_t> data, size_t max_bytes = 32) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    const size_t shown = data.size() < max_bytes ? data.size() : max_bytes;
    std::string result;
    result.reserve(shown * 2 + 16);
    for (size_t i = 0; i < shown; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    if (shown < data.size()) {
        result += "...(" + std::to_string(data.size()) + " bytes)";
    }
    return result;
}

inline const char* ComponentToString(Component component) {
    switch (component) {
        case Component::Seed: return "SEED";
        case Component::Registry: return "REGISTRY";
        case Component::Skylink: return "SKYLINK";
        case Component::Fetch: return "FETCH";
        case Component::Module: return "MODULE";
        case Component::Storage: return "STORAGE";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// Core logging macros
// ============================================================================

#define SKY_LOG_BYTES(component, name, data) \
    do { \
        fprintf(stdout, "[SKY-TRACE] %s %s: %s\n", \
            ::skykernel::debug::ComponentToString(component), \
            name, \
            ::skykernel::debug::ToHexTruncated(data).c_str()); \
        fflush(stdout); \
    } while(0)

#define SKY_LOG_VALUE(component, name, value) \
    do { \
        fprintf(stdout, "[SKY-TRACE] %s %s: %s\n", \
            ::skykernel::debug::ComponentToString(component), \
            name, \
            std::to_string(value).c_str()); \
        fflush(stdout); \
    } while(0)

#define SKY_LOG_MSG(component, message) \
    do { \
        fprintf(stdout, "[SKY-TRACE] %s %s\n", \
            ::skykernel::debug::ComponentToString(component), \
            std::string(message).c_str()); \
        fflush(stdout); \
    } while(0)

#define SKY_LOG_SECTION(component, section_name) \
    do { \
        fprintf(stdout, "[SKY-TRACE] %s ========== %s ==========\n", \
            ::skykernel::debug::ComponentToString(component), \
            section_name); \
        fflush(stdout); \
    } while(0)

// ============================================================================
// Fetch Logging
// ============================================================================

inline void LogFetchAttempt(std::string_view host, std::string_view endpoint, size_t attempt) {
    fprintf(stdout, "[SKY-TRACE] FETCH attempt %zu: https://%.*s%.*s\n",
        attempt,
        static_cast<int>(host.size()), host.data(),
        static_cast<int>(endpoint.size()), endpoint.data());
    fflush(stdout);
}

inline void LogFetchOutcome(std::string_view host, int status, bool accepted) {
    fprintf(stdout, "[SKY-TRACE] FETCH %.*s status=%d %s\n",
        static_cast<int>(host.size()), host.data(),
        status,
        accepted ? "accepted" : "rejected");
    fflush(stdout);
}

// ============================================================================
// Registry Logging
// ============================================================================

inline void LogRegistryEntry(
    std::span<const uint8_t> public_key,
    std::span<const uint8_t> datakey,
    uint64_t revision) {

    SKY_LOG_SECTION(Component::Registry, "REGISTRY ENTRY");
    SKY_LOG_BYTES(Component::Registry, "public_key", public_key);
    SKY_LOG_BYTES(Component::Registry, "datakey", datakey);
    SKY_LOG_VALUE(Component::Registry, "revision", revision);
}

#else // !SKYKERNEL_DEBUG_TRACE

// No-op implementations when SKYKERNEL_DEBUG_TRACE is not defined
#define SKY_LOG_BYTES(component, name, data) ((void)0)
#define SKY_LOG_VALUE(component, name, value) ((void)0)
#define SKY_LOG_MSG(component, message) ((void)0)
#define SKY_LOG_SECTION(component, section_name) ((void)0)

inline void LogFetchAttempt(std::string_view, std::string_view, size_t) {}
inline void LogFetchOutcome(std::string_view, int, bool) {}
inline void LogRegistryEntry(std::span<const uint8_t>, std::span<const uint8_t>, uint64_t) {}

#endif // SKYKERNEL_DEBUG_TRACE

} // namespace skykernel::debug
