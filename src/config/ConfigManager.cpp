#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <toml++/toml.h>
#include <plog/Log.h>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

ConfigManager::ConfigManager(fs::path config_path, bool required)
    : config_path_(std::move(config_path))
    , required_(required)
{
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys)
{
    for (const auto& handler : handlers_)
    {
        if (handler.path == path)
        {
            for (const auto& key : ownedKeys)
            {
                for (const auto& existingKey : handler.ownedKeys)
                {
                    if (key == existingKey)
                    {
                        last_error_ = "Duplicate ownership: key '" + key + "' at path '" + path + "' already registered";
                        PLOG_ERROR << last_error_;
                        return false;
                    }
                }
            }
        }
    }

    handlers_.push_back({path, std::move(cb), std::move(ownedKeys)});
    return true;
}

bool ConfigManager::load()
{
    last_error_.clear();
    file_loaded_ = false;
    std::ifstream ifs(config_path_, std::ios::binary);
    if (!ifs)
    {
        if (required_)
        {
            last_error_ = "cannot open " + config_path_.string();
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration,
                                              "Cannot read configuration file", config_path_.string());
            return false;
        }
        PLOG_DEBUG << "No configuration at " << config_path_.string() << ", using defaults";
        root_ = std::make_unique<toml::table>();
        return true;
    }

    std::stringstream buffer;
    buffer << ifs.rdbuf();
    file_loaded_ = true;
    return loadFromString(buffer.str());
}

bool ConfigManager::loadFromString(std::string_view text)
{
    last_error_.clear();
    try
    {
        root_ = std::make_unique<toml::table>(toml::parse(text, config_path_.string()));
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = std::string("config parse error: ") + std::string(pe.description());
        PLOG_WARNING << last_error_;

        std::string error_details;
        if (pe.source().begin.line > 0)
        {
            error_details = "Error at line " + std::to_string(pe.source().begin.line) + ": " + std::string(pe.description());
        }
        else
        {
            error_details = std::string(pe.description());
        }

        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors, using defaults",
                                            error_details + " (" + config_path_.string() + ")");
        root_ = std::make_unique<toml::table>();
        return false;
    }

    PLOG_DEBUG << "Loaded configuration from " << config_path_.string();
    return applyHandlers();
}

bool ConfigManager::applyHandlers()
{
    bool ok = true;
    for (const auto& handler : handlers_)
    {
        const toml::table* section = resolveTablePath(*root_, handler.path);
        if (section)
        {
            warnUnknownKeys(handler.path, *section, handler.ownedKeys);
            ok = handler.callbacks.load(*section) && ok;
        }
        else
        {
            toml::table empty;
            ok = handler.callbacks.load(empty) && ok;
        }
    }
    return ok;
}

void ConfigManager::warnUnknownKeys(const std::string& path, const toml::table& section,
                                    const std::vector<std::string>& ownedKeys) const
{
    for (const auto& [key, value] : section)
    {
        const std::string name(key.str());
        if (std::find(ownedKeys.begin(), ownedKeys.end(), name) == ownedKeys.end())
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "Unknown configuration key",
                                                path + "." + name);
        }
    }
}

const toml::table& ConfigManager::root() const
{
    static const toml::table empty;
    return root_ ? *root_ : empty;
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
        {
            PLOG_WARNING << "Invalid path segment (empty) in path: " << path;
            return nullptr;
        }

        auto it = current->find(segment);
        if (it == current->end())
            return nullptr;

        auto* tbl = it->second.as_table();
        if (!tbl)
        {
            PLOG_WARNING << "Path segment '" << segment << "' exists but is not a table";
            return nullptr;
        }

        current = tbl;
    }

    return current;
}
