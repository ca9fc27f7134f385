#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace utils
{

// Cross-platform utilities for running post-sync commands
class ProcessUtils
{
public:
    // Splits on runs of spaces and tabs. No quoting is recognised.
    static std::vector<std::string> SplitCommand(const std::string& command);

    // Runs the command with inherited stdio and waits for it to exit.
    // Returns the exit code, or -1 if the process could not be started.
    static int RunCommand(const std::string& command, const std::filesystem::path& workingDir = {});

    static int RunProcess(const std::vector<std::string>& argv, const std::filesystem::path& workingDir = {});
};

} // namespace utils
