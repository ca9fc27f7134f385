#include "ErrorReporter.hpp"

#include <plog/Log.h>

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <utility>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::vector<ErrorReport> ErrorReporter::s_error_queue;
std::vector<ErrorReport> ErrorReporter::s_error_history;
std::string ErrorReporter::s_log_path;
size_t ErrorReporter::s_dropped_count = 0;

ErrorReport::ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details)
    : category(cat)
    , severity(sev)
    , user_message(std::move(user_msg))
    , technical_details(std::move(tech_details))
    , timestamp(ErrorReporter::GetTimestamp())
    , is_fatal(sev == ErrorSeverity::Fatal)
{
}

void ErrorReporter::ReportError(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                                const std::string& technical_details)
{
    ErrorReport report(category, severity, user_message, technical_details);

    // Workers report concurrently; plog serializes its own appenders
    const std::string line = "[" + CategoryToString(category) + "] " + user_message +
                             (technical_details.empty() ? std::string() : " | Details: " + technical_details);
    switch (severity)
    {
    case ErrorSeverity::Info:
        PLOG_INFO << line;
        break;
    case ErrorSeverity::Warning:
        PLOG_WARNING << line;
        break;
    case ErrorSeverity::Error:
        PLOG_ERROR << line;
        break;
    case ErrorSeverity::Fatal:
        PLOG_FATAL << line;
        break;
    }

    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_error_queue.size() >= MAX_QUEUE_SIZE)
    {
        // A large failing batch keeps the newest reports; the log has all of them
        s_error_queue.erase(s_error_queue.begin());
        ++s_dropped_count;
    }
    s_error_queue.push_back(std::move(report));
}

void ErrorReporter::ReportFatal(ErrorCategory category, const std::string& user_message,
                                const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Fatal, user_message, technical_details);
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& user_message,
                                const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Error, user_message, technical_details);
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& user_message,
                                  const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Warning, user_message, technical_details);
}

bool ErrorReporter::HasPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return !s_error_queue.empty();
}

bool ErrorReporter::HasPendingAtLeast(ErrorSeverity severity)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    for (const auto& report : s_error_queue)
    {
        if (static_cast<int>(report.severity) >= static_cast<int>(severity))
            return true;
    }
    return false;
}

std::vector<ErrorReport> ErrorReporter::GetPendingErrors()
{
    std::vector<ErrorReport> drained;
    {
        std::lock_guard<std::mutex> lock(s_mutex);
        drained.swap(s_error_queue);
        for (const auto& report : drained)
        {
            AppendToHistoryLocked(report);
        }
    }
    return drained;
}

ErrorReport ErrorReporter::GetLastError()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_error_queue.empty() ? ErrorReport() : s_error_queue.back();
}

size_t ErrorReporter::DroppedCount()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_dropped_count;
}

void ErrorReporter::ClearErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_error_queue.clear();
    s_dropped_count = 0;
}

std::vector<ErrorReport> ErrorReporter::GetHistorySnapshot()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_error_history;
}

void ErrorReporter::ClearHistory()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_error_queue.clear();
    s_error_history.clear();
    s_dropped_count = 0;
}

void ErrorReporter::InitializeLogFile(const std::string& path, std::ios::openmode mode)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::ofstream ofs(path, mode);
    if (!ofs)
    {
        PLOG_WARNING << "Cannot open error log " << path << "; drained reports stay in the main log only";
        s_log_path.clear();
        return;
    }

    s_log_path = path;
    ofs << "\n=== Sync run started " << GetTimestamp() << " ===\n";
}

std::string ErrorReporter::CategoryToString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::Verification:
        return "Verification";
    case ErrorCategory::Transfer:
        return "Transfer";
    case ErrorCategory::Scheduling:
        return "Scheduling";
    case ErrorCategory::Process:
        return "Process";
    case ErrorCategory::Unknown:
        break;
    }
    return "Unknown";
}

std::string ErrorReporter::SeverityToString(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Info:
        return "Info";
    case ErrorSeverity::Warning:
        return "Warning";
    case ErrorSeverity::Error:
        return "Error";
    case ErrorSeverity::Fatal:
        return "Fatal";
    }
    return "Unknown";
}

std::string ErrorReporter::GetTimestamp()
{
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &now);
#else
    localtime_r(&now, &tm_buf);
#endif

    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

std::string ErrorReporter::Format(const ErrorReport& report, bool with_details)
{
    std::string text = "[" + SeverityToString(report.severity) + "] [" + CategoryToString(report.category) + "] " +
                       report.user_message;
    if (with_details && !report.technical_details.empty())
    {
        text += " | " + report.technical_details;
    }
    return text;
}

void ErrorReporter::AppendToHistoryLocked(const ErrorReport& report)
{
    if (s_error_history.size() >= MAX_HISTORY_SIZE)
    {
        s_error_history.erase(s_error_history.begin());
    }
    s_error_history.push_back(report);
    WriteToLogFile(report);
}

void ErrorReporter::WriteToLogFile(const ErrorReport& report)
{
    if (s_log_path.empty())
        return;

    std::ofstream ofs(s_log_path, std::ios::app);
    if (ofs)
    {
        ofs << report.timestamp << ' ' << Format(report, true) << '\n';
    }
}

} // namespace utils
