#pragma once

#include <cstddef>
#include <ios>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization, // Logger setup, pattern compilation
    Configuration,  // config.toml parsing, lookup table overrides
    Normalization,  // A pipeline stage or span handler failed
    Unknown
};

enum class ErrorSeverity
{
    Info,
    Warning, // Output degraded, text still produced
    Error,   // Operation failed, caller can continue
    Fatal
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;
    std::string technical_details;
    std::string timestamp;
    bool is_fatal = false;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

/**
 * @brief Process-wide sink for problems that must outlive a log line
 *
 * Normalization never throws at its callers; stages and the configuration
 * layer report here instead. Each report is logged through plog at the
 * matching severity and kept in a bounded pending queue until a front end
 * collects it. Collected reports move to a bounded history and, once
 * InitializeLogFile() was called, to an append-only text file.
 *
 *   ErrorReporter::ReportWarning(ErrorCategory::Normalization,
 *                                "Text pipeline stage failed", "money: regex_error");
 *
 *   for (const auto& report : ErrorReporter::GetPendingErrors())
 *       std::cerr << ErrorReporter::Describe(report) << '\n';
 */
class ErrorReporter
{
public:
    static void ReportError(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                            const std::string& technical_details = "");
    static void ReportError(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");
    static void ReportWarning(ErrorCategory category, const std::string& user_message,
                              const std::string& technical_details = "");
    static void ReportFatal(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");

    static bool HasPendingErrors();

    // Drains the pending queue into the history
    static std::vector<ErrorReport> GetPendingErrors();

    // Newest pending report, or a default Unknown/Info report
    static ErrorReport GetLastError();

    static void ClearErrors();

    static std::vector<ErrorReport> GetHistorySnapshot();
    static void ClearHistory();

    static void InitializeLogFile(const std::string& path, std::ios::openmode mode = std::ios::app);

    // "[Warning] [Normalization] Text pipeline stage failed | money: regex_error"
    static std::string Describe(const ErrorReport& report);

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);
    static std::string GetTimestamp();

private:
    static void WriteToLogFileLocked(const ErrorReport& report);

    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
    static std::vector<ErrorReport> s_error_history;
    static std::string s_log_path;
    static constexpr std::size_t MAX_QUEUE_SIZE = 100;
    static constexpr std::size_t MAX_HISTORY_SIZE = 200;
};

} // namespace utils
