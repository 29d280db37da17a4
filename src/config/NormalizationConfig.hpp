#pragma once

#include "../normalization/LookupTables.hpp"
#include "../normalization/NormalizationOptions.hpp"

#include <memory>
#include <string>
#include <vector>

#include <toml++/toml.h>

class ConfigManager;

/**
 * @brief The [normalization] section of config.toml
 *
 * Scalar keys map onto NormalizationOptions; the [normalization.tables]
 * sub-table overlays the built-in lookup tables. Unknown or wrongly typed
 * values keep their defaults and are reported as Configuration warnings.
 */
class NormalizationConfig
{
public:
    NormalizationConfig();

    // Registers load/save callbacks for [normalization]
    bool registerWith(ConfigManager& manager);

    void load(const toml::table& section);
    [[nodiscard]] toml::table save() const;

    [[nodiscard]] const normalization::NormalizationOptions& options() const noexcept { return options_; }
    [[nodiscard]] normalization::NormalizationOptions& options() noexcept { return options_; }

    [[nodiscard]] std::shared_ptr<const normalization::LookupTables> tables() const { return tables_; }

    static const std::vector<std::string>& ownedKeys();

private:
    normalization::NormalizationOptions options_;
    std::shared_ptr<const normalization::LookupTables> tables_;
};
