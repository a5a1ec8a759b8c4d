#pragma once

#include "CommandLine.hpp"
#include "config/Settings.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace files
{
struct FileReport;
}

class Application
{
public:
    static constexpr int kExitSuccess = 0;
    static constexpr int kExitFileError = 1;
    static constexpr int kExitUsage = 2;

    Application(int argc, char** argv);
    Application(std::vector<std::string> args, std::ostream& out, std::ostream& err);
    ~Application();

    int run();

private:
    bool initializeConfig();
    bool initializeLogging();
    void applyCommandLineOverrides();
    int processFiles();
    void printPendingReports();

    static int ExitCodeFor(const std::vector<files::FileReport>& reports);

    std::string program_ = "nej";
    std::vector<std::string> args_;
    std::ostream& out_;
    std::ostream& err_;

    CommandLineOptions options_;
    AppSettings settings_;
};
