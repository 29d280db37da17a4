#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <plog/Log.h>

namespace fs = std::filesystem;

static long long file_mtime_ms(const fs::path& p)
{
    std::error_code ec;
    auto tp = fs::last_write_time(p, ec);
    if (ec)
        return 0;
    auto sctp = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        tp - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
    return std::chrono::duration_cast<std::chrono::milliseconds>(sctp.time_since_epoch()).count();
}

ConfigManager::ConfigManager(std::string config_path)
    : config_path_(std::move(config_path))
    , root_(std::make_unique<toml::table>())
{
    last_mtime_ = file_mtime_ms(config_path_);
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys)
{
    for (const auto& handler : handlers_)
    {
        if (handler.path != path)
            continue;
        for (const auto& key : ownedKeys)
        {
            if (std::find(handler.ownedKeys.begin(), handler.ownedKeys.end(), key) != handler.ownedKeys.end())
            {
                last_error_ = "Duplicate ownership: key '" + key + "' at [" + path + "] already registered";
                PLOG_ERROR << last_error_;
                return false;
            }
        }
    }

    handlers_.push_back({ path, std::move(cb), std::move(ownedKeys) });
    return true;
}

void ConfigManager::dispatch()
{
    static const toml::table empty;
    for (const auto& handler : handlers_)
    {
        const toml::table* section = resolveTablePath(*root_, handler.path);
        handler.callbacks.load(section ? *section : empty);
    }
}

bool ConfigManager::load()
{
    last_error_.clear();

    std::error_code ec;
    if (!fs::exists(config_path_, ec))
    {
        PLOG_INFO << "No config at " << config_path_ << ", using defaults";
        root_ = std::make_unique<toml::table>();
        dispatch();
        return true;
    }

    try
    {
        root_ = std::make_unique<toml::table>(toml::parse_file(config_path_));
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = std::string("config parse error: ") + std::string(pe.description());
        PLOG_WARNING << last_error_;

        std::string details = std::string(pe.description());
        if (pe.source().begin.line > 0)
            details = "Error at line " + std::to_string(pe.source().begin.line) + ": " + details;

        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors. Using defaults.",
                                            details + "\nFile: " + config_path_);
        return false;
    }

    dispatch();
    last_mtime_ = file_mtime_ms(config_path_);
    PLOG_INFO << "Loaded config from " << config_path_;
    return true;
}

bool ConfigManager::reloadIfChanged()
{
    auto mtime = file_mtime_ms(config_path_);
    if (mtime == 0 || mtime == last_mtime_)
        return false;

    if (load())
    {
        PLOG_INFO << "Config reloaded from " << config_path_;
        return true;
    }

    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "Failed to reload configuration",
                                        last_error_.empty() ? std::string("See logs for details") : last_error_);
    return false;
}

bool ConfigManager::save()
{
    last_error_.clear();

    toml::table output = *root_;
    for (const auto& handler : handlers_)
    {
        toml::table produced = handler.callbacks.save();
        toml::table* target = resolveTablePath(output, handler.path);
        if (!target)
        {
            last_error_ = "Cannot write [" + handler.path + "]: path is not a table";
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                              last_error_);
            return false;
        }

        for (const auto& [key, node] : produced)
        {
            const std::string name(key.str());
            if (std::find(handler.ownedKeys.begin(), handler.ownedKeys.end(), name) == handler.ownedKeys.end())
                PLOG_WARNING << "Handler at [" << handler.path << "] returned unowned key '" << name << "'; dropped";
        }

        for (const auto& key : handler.ownedKeys)
        {
            if (produced.contains(key))
                target->insert_or_assign(key, produced[key]);
            else
                target->erase(key);
        }
    }

    const std::string tmp = config_path_ + ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary);
        if (!ofs)
        {
            last_error_ = "Failed to open temp file for writing";
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                              "Could not create temporary file: " + tmp);
            return false;
        }
        ofs << output << '\n';
    }

    std::error_code ec;
    fs::rename(tmp, config_path_, ec);
    if (ec)
    {
        last_error_ = std::string("Failed to rename: ") + ec.message();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                          "Could not rename temporary file: " + ec.message());
        return false;
    }

    last_mtime_ = file_mtime_ms(config_path_);
    *root_ = std::move(output);
    PLOG_INFO << "Saved config to " << config_path_;
    return true;
}

const toml::table& ConfigManager::root() const { return *root_; }

toml::table* ConfigManager::resolveTablePath(toml::table& root, const std::string& path)
{
    if (path.empty())
        return &root;

    std::istringstream ss(path);
    std::string segment;
    toml::table* current = &root;
    while (std::getline(ss, segment, '.'))
    {
        if (segment.empty())
            return nullptr;

        toml::node* node = current->get(segment);
        if (!node)
        {
            auto [it, inserted] = current->insert(segment, toml::table{});
            if (!inserted)
                return nullptr;
            node = &it->second;
        }
        current = node->as_table();
        if (!current)
        {
            PLOG_WARNING << "Config path segment '" << segment << "' exists but is not a table";
            return nullptr;
        }
    }
    return current;
}

const toml::table* ConfigManager::resolveTablePath(const toml::table& root, const std::string& path) const
{
    if (path.empty())
        return &root;

    std::istringstream ss(path);
    std::string segment;
    const toml::table* current = &root;
    while (std::getline(ss, segment, '.'))
    {
        if (segment.empty())
            return nullptr;
        const toml::node* node = current->get(segment);
        if (!node)
            return nullptr;
        current = node->as_table();
        if (!current)
        {
            PLOG_WARNING << "Config path segment '" << segment << "' exists but is not a table";
            return nullptr;
        }
    }
    return current;
}
