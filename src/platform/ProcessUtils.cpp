#include "ProcessUtils.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <sstream>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace utils
{

std::vector<std::string> ProcessUtils::SplitCommand(const std::string& command)
{
    std::vector<std::string> parts;
    std::istringstream ss(command);
    std::string part;
    while (ss >> part)
    {
        parts.push_back(part);
    }
    return parts;
}

int ProcessUtils::RunCommand(const std::string& command, const std::filesystem::path& workingDir)
{
    return RunProcess(SplitCommand(command), workingDir);
}

int ProcessUtils::RunProcess(const std::vector<std::string>& args, const std::filesystem::path& workingDir)
{
    if (args.empty())
    {
        ErrorReporter::ReportError(ErrorCategory::Process, "Cannot run an empty command");
        return -1;
    }

    PLOG_INFO << "Running command: " << args.front() << " (" << args.size() - 1 << " args)";

#ifdef _WIN32
    std::string cmdLine;
    for (const auto& arg : args)
    {
        if (!cmdLine.empty())
            cmdLine += ' ';
        cmdLine += "\"" + arg + "\"";
    }

    STARTUPINFOA si = {sizeof(si)};
    PROCESS_INFORMATION pi = {};
    const std::string cwd = workingDir.string();

    if (!CreateProcessA(nullptr, const_cast<char*>(cmdLine.c_str()), nullptr, nullptr, TRUE, 0, nullptr,
                        cwd.empty() ? nullptr : cwd.c_str(), &si, &pi))
    {
        ErrorReporter::ReportError(ErrorCategory::Process, "Failed to start command: " + args.front(),
                                   "CreateProcessA failed: " + std::to_string(GetLastError()));
        return -1;
    }

    WaitForSingleObject(pi.hProcess, INFINITE);
    DWORD exitCode = 0;
    GetExitCodeProcess(pi.hProcess, &exitCode);
    CloseHandle(pi.hProcess);
    CloseHandle(pi.hThread);

    PLOG_INFO << "Command exited with code " << exitCode;
    return static_cast<int>(exitCode);
#else
    // Child reports exec failure through this pipe; a successful exec closes it
    int errPipe[2];
    if (pipe(errPipe) != 0)
    {
        ErrorReporter::ReportError(ErrorCategory::Process, "Failed to start command: " + args.front(),
                                   std::string("pipe() failed: ") + strerror(errno));
        return -1;
    }

    pid_t pid = fork();
    if (pid < 0)
    {
        close(errPipe[0]);
        close(errPipe[1]);
        ErrorReporter::ReportError(ErrorCategory::Process, "Failed to start command: " + args.front(),
                                   std::string("fork() failed: ") + strerror(errno));
        return -1;
    }

    if (pid == 0)
    {
        close(errPipe[0]);
        fcntl(errPipe[1], F_SETFD, FD_CLOEXEC);

        if (!workingDir.empty() && chdir(workingDir.c_str()) != 0)
        {
            int err = errno;
            (void)!write(errPipe[1], &err, sizeof(err));
            _exit(127);
        }

        std::vector<char*> argv;
        for (const auto& arg : args)
        {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        execvp(argv[0], argv.data());

        int err = errno;
        (void)!write(errPipe[1], &err, sizeof(err));
        _exit(127);
    }

    close(errPipe[1]);
    int childErr = 0;
    ssize_t n = read(errPipe[0], &childErr, sizeof(childErr));
    close(errPipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0)
    {
        if (errno != EINTR)
        {
            ErrorReporter::ReportError(ErrorCategory::Process, "Lost track of command: " + args.front(),
                                       std::string("waitpid() failed: ") + strerror(errno));
            return -1;
        }
    }

    if (n == static_cast<ssize_t>(sizeof(childErr)))
    {
        ErrorReporter::ReportError(ErrorCategory::Process, "Failed to start command: " + args.front(),
                                   strerror(childErr));
        return -1;
    }

    if (WIFEXITED(status))
    {
        int code = WEXITSTATUS(status);
        PLOG_INFO << "Command exited with code " << code;
        return code;
    }

    if (WIFSIGNALED(status))
    {
        PLOG_WARNING << "Command terminated by signal " << WTERMSIG(status);
        return 128 + WTERMSIG(status);
    }

    return -1;
#endif
}

} // namespace utils
