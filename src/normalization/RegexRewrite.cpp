#include "RegexRewrite.hpp"
#include "Diagnostics.hpp"

#include <exception>
#include <plog/Log.h>

namespace normalization
{

namespace
{

bool isTokenBreak(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

} // anonymous namespace

std::vector<std::pair<std::size_t, std::size_t>> overlong_tokens(std::string_view text)
{
    std::vector<std::pair<std::size_t, std::size_t>> runs;
    std::size_t pos = 0;
    while (pos < text.size())
    {
        if (isTokenBreak(text[pos]))
        {
            ++pos;
            continue;
        }
        const std::size_t begin = pos;
        while (pos < text.size() && !isTokenBreak(text[pos]))
            ++pos;
        if (pos - begin > kMaxTokenBytes)
            runs.emplace_back(begin, pos);
    }
    return runs;
}

std::string rewrite_matches(const std::string& text, const std::regex& pattern, const SpanHandler& handler,
                            std::string_view pass_name)
{
    std::string out;
    out.reserve(text.size() + text.size() / 4);

    const std::string_view view(text);
    std::size_t copied = 0;
    std::size_t rewritten = 0;

    // Scan the stretches between over-long runs one at a time
    auto skipped = overlong_tokens(view);
    skipped.emplace_back(text.size(), text.size());

    std::size_t segment_begin = 0;
    for (const auto& [skip_begin, skip_end] : skipped)
    {
        if (skip_begin > segment_begin)
        {
            const auto first = text.begin() + static_cast<std::ptrdiff_t>(segment_begin);
            const auto last_char = text.begin() + static_cast<std::ptrdiff_t>(skip_begin);
            const auto flags = segment_begin == 0 ? std::regex_constants::match_default
                                                  : std::regex_constants::match_prev_avail;

            for (std::sregex_iterator it(first, last_char, pattern, flags), last; it != last; ++it)
            {
                const std::smatch& match = *it;
                if (match.length(0) == 0)
                    continue;

                MatchSpan span;
                span.start = static_cast<std::size_t>(match[0].first - text.begin());
                span.end = span.start + static_cast<std::size_t>(match.length(0));
                span.prefix = view.substr(0, span.start);
                span.suffix = view.substr(span.end);
                span.groups.reserve(match.size());
                for (std::size_t i = 0; i < match.size(); ++i)
                {
                    if (match[i].matched)
                        span.groups.emplace_back(match[i].str());
                    else
                        span.groups.emplace_back(std::nullopt);
                }

                std::optional<std::string> replacement;
                try
                {
                    replacement = handler(span);
                }
                catch (const std::exception& ex)
                {
                    PLOG_WARNING_(Diagnostics::kLogInstance) << "[TextPipeline] pass=" << pass_name
                                                             << " span=" << Diagnostics::Preview(span.text())
                                                             << " kept verbatim: " << ex.what();
                    replacement.reset();
                }

                if (!replacement)
                    continue;

                out.append(text, copied, span.start - copied);
                out += *replacement;
                copied = span.end;
                ++rewritten;
            }
        }
        segment_begin = skip_end;
    }

    if (rewritten == 0)
        return text;

    out.append(text, copied, std::string::npos);
    return out;
}

} // namespace normalization
