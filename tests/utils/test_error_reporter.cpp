#include <catch2/catch_test_macros.hpp>
#include "utils/ErrorReporter.hpp"

using utils::ErrorCategory;
using utils::ErrorReporter;
using utils::ErrorSeverity;

TEST_CASE("ErrorReporter - Queue", "[utils][errors]")
{
    ErrorReporter::ClearHistory();

    SECTION("Reports are queued in order and drained once")
    {
        ErrorReporter::ReportWarning(ErrorCategory::Transfer, "first");
        ErrorReporter::ReportError(ErrorCategory::Verification, "second", "details");

        REQUIRE(ErrorReporter::HasPendingErrors());
        REQUIRE(ErrorReporter::GetLastError().user_message == "second");

        const auto drained = ErrorReporter::GetPendingErrors();
        REQUIRE(drained.size() == 2);
        REQUIRE(drained[0].user_message == "first");
        REQUIRE(drained[1].technical_details == "details");
        REQUIRE_FALSE(ErrorReporter::HasPendingErrors());
        REQUIRE(ErrorReporter::GetHistorySnapshot().size() == 2);
    }

    SECTION("Severity threshold")
    {
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "warn only");
        REQUIRE(ErrorReporter::HasPendingAtLeast(ErrorSeverity::Warning));
        REQUIRE_FALSE(ErrorReporter::HasPendingAtLeast(ErrorSeverity::Error));

        ErrorReporter::ReportFatal(ErrorCategory::Initialization, "fatal");
        REQUIRE(ErrorReporter::HasPendingAtLeast(ErrorSeverity::Error));
        REQUIRE(ErrorReporter::GetLastError().is_fatal);
    }

    SECTION("Oldest reports are dropped past the queue limit")
    {
        for (int i = 0; i < 105; ++i)
        {
            ErrorReporter::ReportError(ErrorCategory::Transfer, "item " + std::to_string(i));
        }

        REQUIRE(ErrorReporter::DroppedCount() == 5);
        const auto drained = ErrorReporter::GetPendingErrors();
        REQUIRE(drained.size() == 100);
        REQUIRE(drained.front().user_message == "item 5");
    }

    ErrorReporter::ClearHistory();
}

TEST_CASE("ErrorReporter - Formatting", "[utils][errors]")
{
    utils::ErrorReport report(ErrorCategory::Scheduling, ErrorSeverity::Warning, "Task cancelled", "broken promise");

    REQUIRE(ErrorReporter::Format(report, false) == "[Warning] [Scheduling] Task cancelled");
    REQUIRE(ErrorReporter::Format(report, true) == "[Warning] [Scheduling] Task cancelled | broken promise");
    REQUIRE_FALSE(report.timestamp.empty());
}
