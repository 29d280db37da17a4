#include "TextPipeline.hpp"
#include "Diagnostics.hpp"
#include "PassRegistry.hpp"
#include "RegexRewrite.hpp"
#include "StageRunner.hpp"
#include "TextUtils.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/Profile.hpp"

#include <sstream>
#include <plog/Log.h>

namespace normalization
{

namespace
{

void logInput(const std::string& input, const NormalizationOptions& options)
{
    if (Diagnostics::IsVerbose())
        PLOG_INFO_(Diagnostics::kLogInstance) << "[TextPipeline] stage=input lang=" << options.language
                                              << " raw=" << Diagnostics::Preview(input);
}

void logSkipped(const PassDefinition& pass)
{
    if (!Diagnostics::IsVerbose())
        return;
    PLOG_INFO_(Diagnostics::kLogInstance) << "[TextPipeline] stage=" << pass.name << " status=skipped"
                                          << (pass.unavailable_reason.empty() ? "" : " reason=unavailable");
}

void logStageResult(const StageResult<std::string>& stage, const std::string& input)
{
    if (stage.succeeded)
    {
        if (!Diagnostics::IsVerbose())
            return;
        std::ostringstream oss;
        oss << "[TextPipeline] stage=" << stage.stage_name << " status=ok duration=" << stage.duration.count() << "us";
        if (stage.result != input)
            oss << " output=" << Diagnostics::Preview(stage.result);
        else
            oss << " unchanged";
        PLOG_INFO_(Diagnostics::kLogInstance) << oss.str();
    }
    else
    {
        std::ostringstream oss;
        oss << "[TextPipeline] stage=" << stage.stage_name << " status=error duration=" << stage.duration.count()
            << "us input=" << Diagnostics::Preview(input) << " reason=" << (stage.error ? *stage.error : "unknown");
        PLOG_ERROR_(Diagnostics::kLogInstance) << oss.str();
    }
}

void logFallback(const char* stage_name)
{
    PLOG_WARNING_(Diagnostics::kLogInstance) << "[TextPipeline] fallback=pre_" << stage_name;
}

void reportOverlongTokens(const std::string& input)
{
    for (const auto& [begin, end] : overlong_tokens(input))
    {
        std::ostringstream details;
        details << "bytes=" << (end - begin) << " at=" << begin << " token="
                << Diagnostics::Preview(input.substr(begin, 64));
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Normalization,
                                            "Over-long token left unnormalized", details.str());
    }
}

void logCompletion(const std::string& output)
{
    if (Diagnostics::IsVerbose())
        PLOG_INFO_(Diagnostics::kLogInstance) << "[TextPipeline] stage=complete output=" << Diagnostics::Preview(output);
}

} // anonymous namespace

struct TextPipeline::Impl
{
    explicit Impl(std::shared_ptr<const LookupTables> tables)
        : registry(std::move(tables))
    {
    }

    PassRegistry registry;
};

TextPipeline::TextPipeline(std::shared_ptr<const LookupTables> tables)
    : impl_(std::make_unique<Impl>(std::move(tables)))
{
}

TextPipeline::~TextPipeline() = default;

const PassRegistry& TextPipeline::registry() const noexcept { return impl_->registry; }

std::string TextPipeline::process(const std::string& input, const NormalizationOptions& options) const
{
    PROFILE_SCOPE_TEXT("TextPipeline::process", input.size());

    logInput(input, options);

    if (!options.normalize)
    {
        std::string trimmed = trimWhitespace(input);
        logCompletion(trimmed);
        return trimmed;
    }

    reportOverlongTokens(input);

    std::string text = input;
    for (const auto& pass : impl_->registry.passes())
    {
        if (!pass.enabled(options))
        {
            logSkipped(pass);
            continue;
        }

        auto stage = run_stage<std::string>(pass.name, [&]() { return pass.apply(text); });
        logStageResult(stage, text);
        if (stage.succeeded)
            text = std::move(stage.result);
        else
            logFallback(pass.name);
    }

    // Whitespace pass output is already trimmed unless it failed
    text = trimWhitespace(text);

    logCompletion(text);
    return text;
}

std::string normalize_text(const std::string& input, const NormalizationOptions& options)
{
    static const TextPipeline pipeline;
    return pipeline.process(input, options);
}

} // namespace normalization
