#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

// SPEECHNORM_PROFILING_LEVEL comes from CMake:
//   0 = off, macros compile to nothing
//   1 = scope timers logged on plog instance kProfilingLogInstance
//   2 = Tracy zones plus the timers

#ifndef SPEECHNORM_PROFILING_LEVEL
#define SPEECHNORM_PROFILING_LEVEL 0
#endif

#if SPEECHNORM_PROFILING_LEVEL >= 2
#include <tracy/Tracy.hpp>
#endif

#if SPEECHNORM_PROFILING_LEVEL >= 1
#include <plog/Log.h>
#endif

namespace profiling
{

#if SPEECHNORM_PROFILING_LEVEL >= 1
constexpr int kProfilingLogInstance = 2;

namespace detail
{

/**
 * @brief Logs how long a scope took and, when given, how much text it handled
 *
 * Pipeline scopes pass the input size so the log shows throughput per call:
 *   [PROFILE] TextPipeline::process 412 us, 1830 bytes
 */
class ScopeTimer
{
public:
    explicit ScopeTimer(std::string_view name, std::size_t bytes = 0)
        : name_(name)
        , bytes_(bytes)
        , start_(std::chrono::steady_clock::now())
    {
    }

    ~ScopeTimer()
    {
        const auto elapsed =
            std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start_);
        if (bytes_ > 0)
            PLOG_DEBUG_(kProfilingLogInstance) << "[PROFILE] " << name_ << ' ' << elapsed.count() << " us, " << bytes_
                                               << " bytes";
        else
            PLOG_DEBUG_(kProfilingLogInstance) << "[PROFILE] " << name_ << ' ' << elapsed.count() << " us";
    }

    ScopeTimer(const ScopeTimer&) = delete;
    ScopeTimer& operator=(const ScopeTimer&) = delete;

private:
    std::string name_;
    std::size_t bytes_;
    std::chrono::steady_clock::time_point start_;
};

#if SPEECHNORM_PROFILING_LEVEL >= 2
// Tracy zone names are limited to 16-bit lengths
inline void NameZone(tracy::ScopedZone& zone, std::string_view name)
{
    const auto length = static_cast<std::uint16_t>(name.size() > 0xFFFF ? 0xFFFF : name.size());
    zone.Name(name.data(), length);
}
#endif

} // namespace detail
#endif

} // namespace profiling

#if SPEECHNORM_PROFILING_LEVEL == 0
#define PROFILE_SCOPE_CUSTOM(nameExpr) ((void)sizeof(nameExpr))
#define PROFILE_SCOPE_TEXT(nameExpr, bytesExpr) ((void)sizeof(nameExpr), (void)sizeof(bytesExpr))

#elif SPEECHNORM_PROFILING_LEVEL == 1
#define PROFILE_SCOPE_CUSTOM(nameExpr) ::profiling::detail::ScopeTimer speechnorm_scope_timer_(nameExpr)
#define PROFILE_SCOPE_TEXT(nameExpr, bytesExpr) \
    ::profiling::detail::ScopeTimer speechnorm_scope_timer_(nameExpr, bytesExpr)

#else
#define PROFILE_SCOPE_CUSTOM(nameExpr)                                                 \
    ZoneScoped;                                                                        \
    ::profiling::detail::NameZone(___tracy_scoped_zone, std::string_view{ nameExpr }); \
    ::profiling::detail::ScopeTimer speechnorm_scope_timer_(nameExpr)
#define PROFILE_SCOPE_TEXT(nameExpr, bytesExpr)                                        \
    ZoneScoped;                                                                        \
    ::profiling::detail::NameZone(___tracy_scoped_zone, std::string_view{ nameExpr }); \
    ZoneValue(static_cast<std::uint64_t>(bytesExpr));                                  \
    ::profiling::detail::ScopeTimer speechnorm_scope_timer_(nameExpr, bytesExpr)
#endif
