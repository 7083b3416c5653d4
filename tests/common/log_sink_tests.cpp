/**
 * @file log_sink_tests.cpp
 * @brief Unit tests for StreamLogSink, NullLogSink and name helpers.
 */
#include <gtest/gtest.h>
#include "trailgraph/common/log_sink.hpp"
#include "trailgraph/common/trail_diagnostics.hpp"
#include <sstream>

using namespace trailgraph;

namespace
{

/**
 * @brief Stream buffer whose every write fails.
 */
class ThrowingStreamBuf : public std::streambuf
{
protected:
    int_type overflow(int_type) override
    {
        throw std::runtime_error("device unavailable");
    }
};

} // namespace

TEST(LogSinkTests, StreamLogSink_WritesPrefixedLine)
{
    std::ostringstream os;
    StreamLogSink sink(os);

    sink.write(LogLevel::Warning, "Step 1 has no content reference; skipped");

    EXPECT_EQ(os.str(), "[trailgraph] WARNING: Step 1 has no content reference; skipped\n");
}

TEST(LogSinkTests, StreamLogSink_FiltersBelowMinimumLevel)
{
    std::ostringstream os;
    StreamLogSink sink(os, LogLevel::Warning);

    sink.write(LogLevel::Info, "dropped");
    sink.write(LogLevel::Error, "kept");

    EXPECT_EQ(os.str(), "[trailgraph] ERROR: kept\n");
}

TEST(LogSinkTests, StreamLogSink_LevelsOrderedBySeverity)
{
    std::ostringstream os;
    StreamLogSink sink(os, LogLevel::Error);

    sink.write(LogLevel::Info, "info");
    sink.write(LogLevel::Warning, "warning");
    EXPECT_TRUE(os.str().empty());

    std::ostringstream all;
    StreamLogSink verbose(all, LogLevel::Info);
    verbose.write(LogLevel::Info, "a");
    verbose.write(LogLevel::Warning, "b");
    verbose.write(LogLevel::Error, "c");
    EXPECT_EQ(all.str(), "[trailgraph] INFO: a\n[trailgraph] WARNING: b\n[trailgraph] ERROR: c\n");
}

TEST(LogSinkTests, StreamLogSink_ThrowingStreamDoesNotPropagate)
{
    ThrowingStreamBuf buf;
    std::ostream os(&buf);
    os.exceptions(std::ios::badbit);

    StreamLogSink sink(os);
    EXPECT_NO_THROW(sink.write(LogLevel::Warning, "lost"));
}

TEST(LogSinkTests, NullLogSink_AcceptsEverything)
{
    NullLogSink sink;
    EXPECT_NO_THROW(sink.write(LogLevel::Error, "ignored"));
}

TEST(LogSinkTests, LevelNames)
{
    EXPECT_STREQ(to_string(LogLevel::Info), "INFO");
    EXPECT_STREQ(to_string(LogLevel::Warning), "WARNING");
    EXPECT_STREQ(to_string(LogLevel::Error), "ERROR");
}

TEST(LogSinkTests, DiagnosticCategoryNames)
{
    EXPECT_STREQ(to_string(DiagnosticCategory::MissingContentReference), "missing_content_reference");
    EXPECT_STREQ(to_string(DiagnosticCategory::InvalidContentReference), "invalid_content_reference");
    EXPECT_STREQ(to_string(DiagnosticCategory::DuplicateNodeId), "duplicate_node_id");
    EXPECT_STREQ(to_string(DiagnosticCategory::ChoiceMissingId), "choice_missing_id");
    EXPECT_STREQ(to_string(DiagnosticCategory::ChoiceMissingNextNode), "choice_missing_next_node");
    EXPECT_STREQ(to_string(DiagnosticCategory::StartNodeNotFound), "start_node_not_found");
}
