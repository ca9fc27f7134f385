#pragma once

#include <chrono>
#include <ios>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization, // logger, fetcher, engine setup
    Configuration,  // TOML settings, manifest files
    Verification,   // digest computation, unreadable local files
    Transfer,       // failed or cancelled fetches
    Scheduling,     // worker pool, task attachment
    Process,        // post-sync commands
    Unknown
};

enum class ErrorSeverity
{
    Info,
    Warning,
    Error,
    Fatal
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // Short message printed at the end of a run
    std::string technical_details; // Underlying error text for logs
    std::string timestamp;
    bool is_fatal = false;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

/**
 * @brief Thread-safe error reporter shared by the sync workers and the CLI
 *
 * Every report is logged through plog immediately and queued. The CLI drains
 * the queue after a batch and prints a short error list.
 *
 * Usage:
 *   ErrorReporter::ReportError(ErrorCategory::Transfer,
 *                              "Failed to sync data/a.bin",
 *                              "HTTP 404");
 *
 *   if (ErrorReporter::HasPendingErrors()) {
 *       for (const auto& e : ErrorReporter::GetPendingErrors()) { ... }
 *   }
 */
class ErrorReporter
{
public:
    static void ReportError(ErrorCategory category, ErrorSeverity severity,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    static void ReportFatal(ErrorCategory category,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    static void ReportError(ErrorCategory category,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    static void ReportWarning(ErrorCategory category,
                             const std::string& user_message,
                             const std::string& technical_details = "");

    static bool HasPendingErrors();

    /**
     * @brief Get all pending errors, move them to history and clear the queue
     */
    static std::vector<ErrorReport> GetPendingErrors();

    static ErrorReport GetLastError();

    // True when a queued report is at least this severe
    static bool HasPendingAtLeast(ErrorSeverity severity);

    // Reports pushed out of the full queue since the last ClearErrors()
    static size_t DroppedCount();

    static void ClearErrors();

    static std::vector<ErrorReport> GetHistorySnapshot();
    static void ClearHistory();

    /**
     * @brief Mirror drained reports into a plain text file next to the log
     */
    static void InitializeLogFile(const std::string& path, std::ios::openmode mode = std::ios::app);

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);
    static std::string GetTimestamp();

    // "[Severity] [Category] message" with " | details" appended on request
    static std::string Format(const ErrorReport& report, bool with_details);

private:
    static void AppendToHistoryLocked(const ErrorReport& report);
    static void WriteToLogFile(const ErrorReport& report);

    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
    static std::vector<ErrorReport> s_error_history;
    static std::string s_log_path;
    static size_t s_dropped_count;
    static constexpr size_t MAX_QUEUE_SIZE = 100;
    static constexpr size_t MAX_HISTORY_SIZE = 500;
};

} // namespace utils
