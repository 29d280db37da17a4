#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include <toml++/toml.h>

#include "config/ConfigManager.hpp"
#include "config/NormalizationConfig.hpp"
#include "utils/ErrorReporter.hpp"

namespace fs = std::filesystem;

namespace
{

// Scratch config file removed when the test ends
struct TempConfig
{
    fs::path path;

    explicit TempConfig(const std::string& name, const std::string& contents = {})
        : path(fs::temp_directory_path() / name)
    {
        fs::remove(path);
        if (!contents.empty())
        {
            std::ofstream ofs(path, std::ios::binary);
            ofs << contents;
        }
    }

    ~TempConfig()
    {
        std::error_code ec;
        fs::remove(path, ec);
        fs::remove(path.string() + ".tmp", ec);
    }
};

} // namespace

TEST_CASE("Missing config file leaves every option at its default", "[config]")
{
    TempConfig file("speechnorm_missing.toml");
    ConfigManager manager(file.path.string());
    NormalizationConfig config;
    REQUIRE(config.registerWith(manager));

    REQUIRE(manager.load());
    REQUIRE(config.options().normalize);
    REQUIRE(config.options().url_normalization);
    REQUIRE_FALSE(config.options().unit_normalization);
    REQUIRE(config.options().language == "en-us");
    REQUIRE(config.tables() == normalization::LookupTables::defaults());
}

TEST_CASE("Normalization section is loaded from disk", "[config]")
{
    TempConfig file("speechnorm_values.toml", R"(
[normalization]
unit_normalization = true
phone_normalization = false
language = "en-gb"

[normalization.tables.units.nmi]
word = "nautical mile"
)");
    ConfigManager manager(file.path.string());
    NormalizationConfig config;
    REQUIRE(config.registerWith(manager));
    REQUIRE(manager.load());

    REQUIRE(config.options().unit_normalization);
    REQUIRE_FALSE(config.options().phone_normalization);
    REQUIRE(config.options().email_normalization);
    REQUIRE(config.options().language == "en-gb");
    REQUIRE(config.tables()->findUnit("nmi") != nullptr);
}

TEST_CASE("Wrongly typed values keep their defaults and warn", "[config]")
{
    utils::ErrorReporter::ClearErrors();

    toml::table section;
    section.insert("url_normalization", "yes");
    section.insert("language", 42);
    section.insert("replace_remaining_symbols", false);

    NormalizationConfig config;
    config.load(section);

    REQUIRE(config.options().url_normalization);
    REQUIRE(config.options().language == "en-us");
    REQUIRE_FALSE(config.options().replace_remaining_symbols);

    const auto warnings = utils::ErrorReporter::GetPendingErrors();
    REQUIRE(warnings.size() == 2);
    REQUIRE(warnings.front().category == utils::ErrorCategory::Configuration);
    REQUIRE(warnings.front().technical_details.find("url_normalization") != std::string::npos);
}

TEST_CASE("Malformed TOML reports and keeps defaults", "[config]")
{
    utils::ErrorReporter::ClearErrors();

    TempConfig file("speechnorm_broken.toml", "[normalization\nunit_normalization = tru\n");
    ConfigManager manager(file.path.string());
    NormalizationConfig config;
    REQUIRE(config.registerWith(manager));

    REQUIRE_FALSE(manager.load());
    REQUIRE(std::string(manager.lastError()).find("parse error") != std::string::npos);
    REQUIRE_FALSE(config.options().unit_normalization);

    REQUIRE(utils::ErrorReporter::HasPendingErrors());
    REQUIRE(utils::ErrorReporter::GetLastError().category == utils::ErrorCategory::Configuration);
    utils::ErrorReporter::ClearErrors();
}

TEST_CASE("Saved settings survive a reload and keep foreign keys", "[config]")
{
    TempConfig file("speechnorm_roundtrip.toml", R"(
[logging]
level = "debug"

[normalization]
language = "en"
)");

    {
        ConfigManager manager(file.path.string());
        NormalizationConfig config;
        REQUIRE(config.registerWith(manager));
        REQUIRE(manager.load());

        config.options().unit_normalization = true;
        config.options().replace_remaining_symbols = false;
        REQUIRE(manager.save());
    }

    ConfigManager manager(file.path.string());
    NormalizationConfig config;
    REQUIRE(config.registerWith(manager));
    REQUIRE(manager.load());

    REQUIRE(config.options().unit_normalization);
    REQUIRE_FALSE(config.options().replace_remaining_symbols);
    REQUIRE(config.options().language == "en");
    REQUIRE(manager.root()["logging"]["level"].value_or(std::string()) == "debug");
    REQUIRE_FALSE(fs::exists(file.path.string() + ".tmp"));
}

TEST_CASE("Two owners cannot claim the same key", "[config]")
{
    TempConfig file("speechnorm_owners.toml");
    ConfigManager manager(file.path.string());

    NormalizationConfig first;
    NormalizationConfig second;
    REQUIRE(first.registerWith(manager));
    REQUIRE_FALSE(second.registerWith(manager));
    REQUIRE(std::string(manager.lastError()).find("Duplicate ownership") != std::string::npos);

    TableCallbacks other;
    other.load = [](const toml::table&) {};
    other.save = [] { return toml::table{}; };
    REQUIRE(manager.registerTable("normalization", other, { "voice" }));
}

TEST_CASE("Edited config files are picked up on reload", "[config]")
{
    TempConfig file("speechnorm_reload.toml", "[normalization]\nunit_normalization = false\n");
    ConfigManager manager(file.path.string());
    NormalizationConfig config;
    REQUIRE(config.registerWith(manager));
    REQUIRE(manager.load());
    REQUIRE_FALSE(manager.reloadIfChanged());

    {
        std::ofstream ofs(file.path, std::ios::binary | std::ios::trunc);
        ofs << "[normalization]\nunit_normalization = true\n";
    }
    fs::last_write_time(file.path, fs::last_write_time(file.path) + std::chrono::seconds(5));

    REQUIRE(manager.reloadIfChanged());
    REQUIRE(config.options().unit_normalization);
    REQUIRE_FALSE(manager.reloadIfChanged());
}
