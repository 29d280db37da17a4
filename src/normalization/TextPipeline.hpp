#pragma once

#include "LookupTables.hpp"
#include "NormalizationOptions.hpp"

#include <memory>
#include <string>

namespace normalization
{

class PassRegistry;

class TextPipeline
{
public:
    explicit TextPipeline(std::shared_ptr<const LookupTables> tables = LookupTables::defaults());
    ~TextPipeline();

    TextPipeline(const TextPipeline&) = delete;
    TextPipeline& operator=(const TextPipeline&) = delete;

    // Never throws for text input; a failing pass leaves its input text in place
    [[nodiscard]] std::string process(const std::string& input, const NormalizationOptions& options = {}) const;

    [[nodiscard]] const PassRegistry& registry() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Shared pipeline over the built-in tables
[[nodiscard]] std::string normalize_text(const std::string& input, const NormalizationOptions& options = {});

} // namespace normalization
