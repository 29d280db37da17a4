#include "config/ConfigManager.hpp"
#include "config/NormalizationConfig.hpp"
#include "normalization/Diagnostics.hpp"
#include "normalization/TextPipeline.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"
#include "utils/Profile.hpp"

#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <plog/Log.h>

namespace
{

void PrintUsage(const char* program_name)
{
    std::cout << "Usage: " << program_name << " [OPTIONS] [TEXT ...]\n";
    std::cout << "Rewrites text into a speakable form for speech synthesis.\n";
    std::cout << "Each TEXT argument (or each stdin line when none is given) is printed normalized.\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <file>      Read settings from <file> (default: config.toml)\n";
    std::cout << "  --lang <code>        Language selector (en-us, en-gb, a, b, ...)\n";
    std::cout << "  --raw                Only trim the input, run no rewrite pass\n";
    std::cout << "  --units              Enable measurement unit expansion\n";
    std::cout << "  --no-urls            Leave URLs untouched\n";
    std::cout << "  --no-emails          Leave email addresses untouched\n";
    std::cout << "  --no-phones          Leave phone numbers untouched\n";
    std::cout << "  --no-symbols         Keep leftover symbols such as % and &\n";
    std::cout << "  --no-plurals         Keep optional plurals such as file(s)\n";
    std::cout << "  --verbose            Log every pass to stderr\n";
    std::cout << "  --version            Show version information\n";
    std::cout << "  --help               Show this help message\n";
}

void PrintVersion()
{
    std::cout << "speechnorm text normalizer\n";
    std::cout << "Version: 1.0.0\n";
    std::cout << "Build: " << __DATE__ << " " << __TIME__ << "\n";
}

struct CommandLine
{
    std::string config_path = "config.toml";
    std::optional<std::string> language;
    bool raw = false;
    bool units = false;
    bool no_urls = false;
    bool no_emails = false;
    bool no_phones = false;
    bool no_symbols = false;
    bool no_plurals = false;
    bool verbose = false;
    std::vector<std::string> texts;
};

void ApplyOverrides(const CommandLine& cli, normalization::NormalizationOptions& options)
{
    if (cli.raw)
        options.normalize = false;
    if (cli.units)
        options.unit_normalization = true;
    if (cli.no_urls)
        options.url_normalization = false;
    if (cli.no_emails)
        options.email_normalization = false;
    if (cli.no_phones)
        options.phone_normalization = false;
    if (cli.no_symbols)
        options.replace_remaining_symbols = false;
    if (cli.no_plurals)
        options.optional_pluralization_normalization = false;
    if (cli.language)
        options.language = *cli.language;
}

void FlushErrors()
{
    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
        std::cerr << utils::ErrorReporter::Describe(report) << "\n";
}

} // namespace

int main(int argc, char* argv[])
{
    CommandLine cli;
    bool options_done = false;

    for (int i = 1; i < argc; ++i)
    {
        const char* arg = argv[i];
        if (options_done || arg[0] != '-' || strcmp(arg, "-") == 0)
        {
            cli.texts.emplace_back(arg);
        }
        else if (strcmp(arg, "--") == 0)
        {
            options_done = true;
        }
        else if (strcmp(arg, "--version") == 0)
        {
            PrintVersion();
            return 0;
        }
        else if (strcmp(arg, "--help") == 0)
        {
            PrintUsage(argv[0]);
            return 0;
        }
        else if (strcmp(arg, "--config") == 0 || strcmp(arg, "--lang") == 0)
        {
            if (i + 1 >= argc)
            {
                std::cerr << "ERROR: " << arg << " needs a value\n";
                PrintUsage(argv[0]);
                return 2;
            }
            if (strcmp(arg, "--config") == 0)
                cli.config_path = argv[++i];
            else
                cli.language = argv[++i];
        }
        else if (strcmp(arg, "--raw") == 0)
            cli.raw = true;
        else if (strcmp(arg, "--units") == 0)
            cli.units = true;
        else if (strcmp(arg, "--no-urls") == 0)
            cli.no_urls = true;
        else if (strcmp(arg, "--no-emails") == 0)
            cli.no_emails = true;
        else if (strcmp(arg, "--no-phones") == 0)
            cli.no_phones = true;
        else if (strcmp(arg, "--no-symbols") == 0)
            cli.no_symbols = true;
        else if (strcmp(arg, "--no-plurals") == 0)
            cli.no_plurals = true;
        else if (strcmp(arg, "--verbose") == 0)
            cli.verbose = true;
        else
        {
            std::cerr << "ERROR: unknown option " << arg << "\n";
            PrintUsage(argv[0]);
            return 2;
        }
    }

    if (!utils::LogManager::Initialize(cli.config_path))
        std::cerr << "WARNING: logging could not be initialized\n";
    const bool verbose = cli.verbose || utils::LogManager::IsVerboseRequested();
    normalization::Diagnostics::SetVerbose(verbose);

    utils::LogManager::RegisterLogger<0>({ "app", "logs/speechnorm.log" });
    utils::ErrorReporter::InitializeLogFile("logs/errors.log");
    utils::LogManager::LoggerConfig pipeline_log{ "normalization", "logs/normalization.log" };
    if (verbose)
    {
        pipeline_log.add_console_appender = true;
        pipeline_log.level_override = plog::debug;
    }
    utils::LogManager::RegisterLogger<normalization::Diagnostics::kLogInstance>(pipeline_log);
#if SPEECHNORM_PROFILING_LEVEL >= 1
    utils::LogManager::RegisterLogger<profiling::kProfilingLogInstance>({ "profiling", "logs/profiling.log" });
#endif

    ConfigManager config(cli.config_path);
    NormalizationConfig normalization_config;
    if (!normalization_config.registerWith(config))
        PLOG_ERROR << "Config registration failed: " << config.lastError();
    if (!config.load())
        PLOG_WARNING << "Continuing with default settings: " << config.lastError();

    normalization::NormalizationOptions options = normalization_config.options();
    ApplyOverrides(cli, options);

    PLOG_INFO << "speechnorm starting, config=" << cli.config_path << " lang=" << options.language;

    const normalization::TextPipeline pipeline(normalization_config.tables());

    if (!cli.texts.empty())
    {
        for (const auto& text : cli.texts)
            std::cout << pipeline.process(text, options) << "\n";
    }
    else
    {
        std::string line;
        while (std::getline(std::cin, line))
            std::cout << pipeline.process(line, options) << "\n";
    }
    std::cout.flush();

    FlushErrors();
    utils::LogManager::Shutdown();
    return 0;
}
