#include "Diagnostics.hpp"

#include <cstdio>

namespace normalization
{

std::atomic<bool> Diagnostics::verbose_{ false };
std::atomic<std::size_t> Diagnostics::max_preview_{ 160 };

namespace
{

bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

// Largest cut <= limit that does not split a UTF-8 sequence
std::size_t codepoint_boundary(std::string_view text, std::size_t limit)
{
    if (limit >= text.size())
        return text.size();
    std::size_t cut = limit;
    while (cut > 0 && is_continuation(static_cast<unsigned char>(text[cut])))
        --cut;
    return cut;
}

} // namespace

void Diagnostics::SetVerbose(bool enabled) noexcept { verbose_.store(enabled, std::memory_order_relaxed); }

bool Diagnostics::IsVerbose() noexcept { return verbose_.load(std::memory_order_relaxed); }

void Diagnostics::SetMaxPreview(std::size_t bytes) noexcept
{
    max_preview_.store(bytes == 0 ? 1 : bytes, std::memory_order_relaxed);
}

std::size_t Diagnostics::MaxPreview() noexcept { return max_preview_.load(std::memory_order_relaxed); }

std::string Diagnostics::Preview(std::string_view text)
{
    const std::size_t cut = codepoint_boundary(text, MaxPreview());

    std::string out;
    out.reserve(cut + 24);
    appendEscaped(out, text.substr(0, cut));

    if (cut < text.size())
        out += "... (" + std::to_string(text.size()) + " bytes)";
    return out;
}

void Diagnostics::appendEscaped(std::string& out, std::string_view text)
{
    for (char ch : text)
    {
        const auto byte = static_cast<unsigned char>(ch);
        switch (ch)
        {
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (byte < 0x20 || byte == 0x7F)
            {
                char hex[5];
                std::snprintf(hex, sizeof(hex), "\\x%02X", byte);
                out += hex;
            }
            else
            {
                out.push_back(ch);
            }
            break;
        }
    }
}

} // namespace normalization
