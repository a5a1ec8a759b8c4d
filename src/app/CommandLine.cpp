#include "CommandLine.hpp"
#include "processing/EmojiStripper.hpp"

#include <string_view>

namespace
{

bool startsWith(std::string_view text, std::string_view prefix)
{
    return text.substr(0, prefix.size()) == prefix;
}

} // namespace

bool CommandLine::Parse(const std::vector<std::string>& args, CommandLineOptions& options, std::string& error)
{
    bool dry_run = false;
    bool in_place = false;
    bool options_done = false;

    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const std::string& arg = args[i];

        if (options_done || arg == "-" || !startsWith(arg, "-"))
        {
            options.paths.push_back(arg);
            continue;
        }

        if (arg == "--")
        {
            options_done = true;
        }
        else if (arg == "--dry-run")
        {
            dry_run = true;
        }
        else if (startsWith(arg, "--in-place"))
        {
            in_place = true;
            if (arg.size() > 10)
            {
                if (arg[10] != '=')
                {
                    error = "unknown option '" + arg + "'";
                    return false;
                }
                options.backup_suffix = arg.substr(11);
            }
        }
        else if (startsWith(arg, "-i"))
        {
            // sed style: the suffix is glued to the flag
            in_place = true;
            if (arg.size() > 2)
                options.backup_suffix = arg.substr(2);
        }
        else if (arg == "-v" || arg == "--verbose")
        {
            options.verbose = true;
        }
        else if (arg == "-h" || arg == "--help")
        {
            options.show_help = true;
        }
        else if (arg == "--version")
        {
            options.show_version = true;
        }
        else if (arg == "--removal" || startsWith(arg, "--removal="))
        {
            std::string value;
            if (!TakeValue(args, i, "--removal", value, error))
                return false;
            options.removal = processing::ParseRemovalMode(value);
            if (!options.removal)
            {
                error = "invalid removal mode '" + value + "' (expected space, elide or width)";
                return false;
            }
        }
        else if (arg == "--config" || startsWith(arg, "--config="))
        {
            std::string value;
            if (!TakeValue(args, i, "--config", value, error))
                return false;
            options.config_path = value;
        }
        else
        {
            error = "unknown option '" + arg + "'";
            return false;
        }
    }

    if (options.show_help || options.show_version)
        return true;

    if (dry_run && in_place)
    {
        error = "--dry-run and -i cannot be combined";
        return false;
    }

    if (options.paths.empty())
    {
        error = "no input files";
        return false;
    }

    if (dry_run)
        options.mode = files::ProcessingMode::DryRun;
    else if (in_place)
        options.mode = files::ProcessingMode::InPlace;
    else
        options.mode = files::ProcessingMode::Stdout;

    return true;
}

// Accepts both "--flag=value" and "--flag value"
bool CommandLine::TakeValue(const std::vector<std::string>& args, std::size_t& index, const std::string& flag,
                            std::string& value, std::string& error)
{
    const std::string& arg = args[index];
    if (arg.size() > flag.size() && arg[flag.size()] == '=')
    {
        value = arg.substr(flag.size() + 1);
    }
    else if (index + 1 < args.size())
    {
        value = args[++index];
    }
    else
    {
        error = "option '" + flag + "' requires a value";
        return false;
    }

    if (value.empty())
    {
        error = "option '" + flag + "' requires a value";
        return false;
    }
    return true;
}

std::string CommandLine::Usage(const std::string& program)
{
    return "Usage: " + program + " [OPTIONS] FILE...\n"
           "Remove emoji from UTF-8 text files.\n"
           "\n"
           "Without -i or --dry-run the cleaned text is written to standard output.\n"
           "\n"
           "Options:\n"
           "      --dry-run          report how many emoji each file contains\n"
           "  -i[SUFFIX], --in-place[=SUFFIX]\n"
           "                         edit files in place (keep a backup if SUFFIX given)\n"
           "      --removal=MODE     replace removed emoji with: space (default),\n"
           "                         elide (nothing) or width (one space per column)\n"
           "      --config=PATH      read settings from PATH (default: ./nej.toml)\n"
           "  -v, --verbose          log progress to standard error\n"
           "  -h, --help             show this help\n"
           "      --version          show version information\n"
           "\n"
           "Exit status: 0 on success, 1 if a file could not be read or written,\n"
           "2 on usage errors.\n";
}
