#include "NormalizationConfig.hpp"
#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

namespace
{

void read_flag(const toml::table& section, const char* key, bool& target)
{
    const toml::node* node = section.get(key);
    if (!node)
        return;
    if (auto value = node->value<bool>())
    {
        target = *value;
        return;
    }
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                        "Ignored [normalization] setting with wrong type",
                                        std::string(key) + " must be true or false");
}

} // namespace

NormalizationConfig::NormalizationConfig()
    : tables_(normalization::LookupTables::defaults())
{
}

const std::vector<std::string>& NormalizationConfig::ownedKeys()
{
    static const std::vector<std::string> keys = {
        "normalize",
        "url_normalization",
        "email_normalization",
        "unit_normalization",
        "phone_normalization",
        "optional_pluralization_normalization",
        "replace_remaining_symbols",
        "language",
    };
    return keys;
}

bool NormalizationConfig::registerWith(ConfigManager& manager)
{
    TableCallbacks callbacks;
    callbacks.load = [this](const toml::table& section) { load(section); };
    callbacks.save = [this]() { return save(); };
    return manager.registerTable("normalization", std::move(callbacks), ownedKeys());
}

void NormalizationConfig::load(const toml::table& section)
{
    normalization::NormalizationOptions loaded;
    read_flag(section, "normalize", loaded.normalize);
    read_flag(section, "url_normalization", loaded.url_normalization);
    read_flag(section, "email_normalization", loaded.email_normalization);
    read_flag(section, "unit_normalization", loaded.unit_normalization);
    read_flag(section, "phone_normalization", loaded.phone_normalization);
    read_flag(section, "optional_pluralization_normalization", loaded.optional_pluralization_normalization);
    read_flag(section, "replace_remaining_symbols", loaded.replace_remaining_symbols);

    if (const toml::node* language = section.get("language"))
    {
        auto code = language->value<std::string>();
        if (code && !code->empty())
            loaded.language = *code;
        else
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                                "Ignored [normalization] setting with wrong type",
                                                "language must be a non-empty string");
    }
    options_ = std::move(loaded);

    if (const toml::table* overrides = section["tables"].as_table())
        tables_ = normalization::LookupTables::withOverrides(*overrides);
    else
        tables_ = normalization::LookupTables::defaults();

    PLOG_INFO << "[normalization] normalize=" << options_.normalize << " urls=" << options_.url_normalization
              << " emails=" << options_.email_normalization << " units=" << options_.unit_normalization
              << " phones=" << options_.phone_normalization
              << " plurals=" << options_.optional_pluralization_normalization
              << " symbols=" << options_.replace_remaining_symbols << " language=" << options_.language;
}

toml::table NormalizationConfig::save() const
{
    toml::table t;
    t.insert("normalize", options_.normalize);
    t.insert("url_normalization", options_.url_normalization);
    t.insert("email_normalization", options_.email_normalization);
    t.insert("unit_normalization", options_.unit_normalization);
    t.insert("phone_normalization", options_.phone_normalization);
    t.insert("optional_pluralization_normalization", options_.optional_pluralization_normalization);
    t.insert("replace_remaining_symbols", options_.replace_remaining_symbols);
    t.insert("language", options_.language);
    return t;
}
