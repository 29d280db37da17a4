#include <catch2/catch_test_macros.hpp>

#include <string>

#include "utils/ErrorReporter.hpp"

using utils::ErrorCategory;
using utils::ErrorReporter;
using utils::ErrorSeverity;

TEST_CASE("Reports queue until they are collected", "[error_reporter]")
{
    ErrorReporter::ClearHistory();
    REQUIRE_FALSE(ErrorReporter::HasPendingErrors());

    ErrorReporter::ReportWarning(ErrorCategory::Normalization, "Text pipeline stage failed", "money: boom");
    ErrorReporter::ReportError(ErrorCategory::Configuration, "Failed to save configuration");
    REQUIRE(ErrorReporter::HasPendingErrors());

    auto last = ErrorReporter::GetLastError();
    REQUIRE(last.category == ErrorCategory::Configuration);
    REQUIRE(last.severity == ErrorSeverity::Error);
    REQUIRE_FALSE(last.is_fatal);
    REQUIRE_FALSE(last.timestamp.empty());

    auto pending = ErrorReporter::GetPendingErrors();
    REQUIRE(pending.size() == 2);
    REQUIRE(pending[0].technical_details == "money: boom");
    REQUIRE_FALSE(ErrorReporter::HasPendingErrors());

    REQUIRE(ErrorReporter::GetHistorySnapshot().size() == 2);
    ErrorReporter::ClearHistory();
    REQUIRE(ErrorReporter::GetHistorySnapshot().empty());
}

TEST_CASE("Fatal reports are flagged", "[error_reporter]")
{
    ErrorReporter::ClearErrors();
    ErrorReporter::ReportFatal(ErrorCategory::Initialization, "Logger could not be created");
    REQUIRE(ErrorReporter::GetLastError().is_fatal);
    ErrorReporter::ClearErrors();
    REQUIRE(ErrorReporter::GetLastError().category == ErrorCategory::Unknown);
}

TEST_CASE("The pending queue drops its oldest reports", "[error_reporter]")
{
    ErrorReporter::ClearErrors();
    for (int i = 0; i < 150; ++i)
        ErrorReporter::ReportWarning(ErrorCategory::Normalization, "span " + std::to_string(i));

    auto pending = ErrorReporter::GetPendingErrors();
    REQUIRE(pending.size() == 100);
    REQUIRE(pending.front().user_message == "span 50");
    REQUIRE(pending.back().user_message == "span 149");
    ErrorReporter::ClearHistory();
}

TEST_CASE("Enum names for log lines", "[error_reporter]")
{
    REQUIRE(ErrorReporter::CategoryToString(ErrorCategory::Normalization) == "Normalization");
    REQUIRE(ErrorReporter::CategoryToString(ErrorCategory::Configuration) == "Configuration");
    REQUIRE(ErrorReporter::SeverityToString(ErrorSeverity::Warning) == "Warning");
    REQUIRE(ErrorReporter::SeverityToString(ErrorSeverity::Fatal) == "Fatal");
}

TEST_CASE("Reports render as one line", "[error_reporter]")
{
    utils::ErrorReport report(ErrorCategory::Normalization, ErrorSeverity::Warning, "Text pipeline stage failed",
                              "money: regex_error");
    REQUIRE(ErrorReporter::Describe(report) ==
            "[Warning] [Normalization] Text pipeline stage failed | money: regex_error");

    utils::ErrorReport bare(ErrorCategory::Configuration, ErrorSeverity::Info, "No config file", "");
    REQUIRE(ErrorReporter::Describe(bare) == "[Info] [Configuration] No config file");
}
