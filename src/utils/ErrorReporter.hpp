#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace utils
{

enum class ErrorCategory
{
    Configuration, // TOML parsing, invalid client settings
    Transport,     // HTTP failures talking to the prediction API
    RemoteJob,     // prediction finished as failed or canceled
    Protocol,      // unexpected payloads from the API
    Callback,      // result observers that threw
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
    std::string user_message;
    std::string technical_details;
    std::string timestamp;
    bool is_fatal = false;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

/**
 * @brief Thread-safe error reporter
 *
 * Collects errors from the client subsystems and queues them for the front end.
 * Every report is also written to plog.
 *
 * Usage:
 *   ErrorReporter::ReportWarning(ErrorCategory::Transport, "Prediction submission failed",
 *                                "Network error: Could not resolve host");
 *
 *   if (ErrorReporter::HasPendingErrors()) {
 *       for (const auto& report : ErrorReporter::GetPendingErrors())
 *           ...
 *   }
 */
class ErrorReporter
{
public:
    /**
     * @brief Report an error to the system
     * @param category Error category
     * @param severity Error severity
     * @param user_message User-friendly message
     * @param technical_details Technical details for debugging
     */
    static void ReportError(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportFatal(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportError(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportWarning(ErrorCategory category, const std::string& user_message,
                              const std::string& technical_details = "");

    static bool HasPendingErrors();

    /**
     * @brief Get all pending errors and clear the queue
     */
    static std::vector<ErrorReport> GetPendingErrors();

    static ErrorReport GetLastError();

    static void ClearErrors();

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);
    static std::string GetTimestamp();

private:
    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
    static constexpr std::size_t MAX_QUEUE_SIZE = 100;
};

} // namespace utils
