#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <toml++/toml.h>

struct TableCallbacks
{
    std::function<bool(const toml::table& section)> load;
};

// Loads the optional TOML configuration. Components register the table they
// own by dotted path along with the keys they read; unknown keys in an owned
// table are warned about, a missing table loads as empty.
class ConfigManager
{
public:
    explicit ConfigManager(std::filesystem::path config_path = "nej.toml", bool required = false);
    ~ConfigManager();

    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);

    // False on a parse error, an unreadable required file, or when a handler
    // rejects a value. Handlers that succeed keep what they loaded.
    bool load();
    bool loadFromString(std::string_view text);

    const toml::table& root() const;
    const std::filesystem::path& path() const { return config_path_; }
    const char* lastError() const { return last_error_.c_str(); }
    bool fileLoaded() const { return file_loaded_; }

private:
    bool applyHandlers();
    void warnUnknownKeys(const std::string& path, const toml::table& section,
                         const std::vector<std::string>& ownedKeys) const;
    const toml::table* resolveTablePath(const toml::table& root, const std::string& path) const;

    std::filesystem::path config_path_;
    bool required_ = false;
    bool file_loaded_ = false;
    std::string last_error_;

    struct HandlerEntry {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;
    };
    std::vector<HandlerEntry> handlers_;
    std::unique_ptr<toml::table> root_;
};
