#pragma once

#include "files/FileProcessor.hpp"
#include "processing/TextProcessingTypes.hpp"

#include <optional>
#include <string>
#include <vector>

struct CommandLineOptions
{
    files::ProcessingMode mode = files::ProcessingMode::Stdout;
    std::optional<std::string> backup_suffix;
    std::optional<processing::RemovalMode> removal;
    std::optional<std::string> config_path;
    bool verbose = false;
    bool show_help = false;
    bool show_version = false;
    std::vector<std::string> paths;
};

class CommandLine
{
public:
    // Parses arguments without the program name. Returns false and sets
    // `error` on unknown options, conflicting modes or a missing file list.
    static bool Parse(const std::vector<std::string>& args, CommandLineOptions& options, std::string& error);

    static std::string Usage(const std::string& program);

private:
    static bool TakeValue(const std::vector<std::string>& args, std::size_t& index, const std::string& flag,
                          std::string& value, std::string& error);
};
