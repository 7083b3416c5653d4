/**
 * @file log_sink.cpp
 */
#include "trailgraph/common/log_sink.hpp"

namespace trailgraph
{

LogSink::~LogSink() = default;

const char* to_string(LogLevel level) noexcept
{
    switch (level)
    {
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    }
    return "UNKNOWN";
}

StreamLogSink::StreamLogSink(std::ostream& os, LogLevel min_level)
    : m_os(os)
    , m_min_level(min_level)
{
}

void StreamLogSink::write(LogLevel level, const std::string& message) noexcept
{
    if (static_cast<int>(level) < static_cast<int>(m_min_level))
    {
        return;
    }
    try
    {
        m_os << "[trailgraph] " << to_string(level) << ": " << message << "\n" << std::flush;
    }
    catch (const std::exception&)
    {
        // A failing stream must not fail reconstruction; the message is lost.
    }
}

} // namespace trailgraph
