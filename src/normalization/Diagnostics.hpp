#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace normalization
{

class Diagnostics
{
public:
    static constexpr int kLogInstance = 1;

    static void SetVerbose(bool enabled) noexcept;
    [[nodiscard]] static bool IsVerbose() noexcept;

    static void SetMaxPreview(std::size_t bytes) noexcept;
    [[nodiscard]] static std::size_t MaxPreview() noexcept;

    // Log-safe excerpt: control bytes escaped, cut on a codepoint boundary
    [[nodiscard]] static std::string Preview(std::string_view text);

private:
    static void appendEscaped(std::string& out, std::string_view text);
    static std::atomic<bool> verbose_;
    static std::atomic<std::size_t> max_preview_;
};

} // namespace normalization
