/**
 * @file log_sink.hpp
 * @brief Log sink interface and the stream and no-op implementations.
 */
#pragma once
#include "trailgraph/common/common.hpp"

namespace trailgraph
{

/**
 * @brief Severity of a log message.
 *
 * @note Declaration order is significant: levels are compared by value.
 */
enum class LogLevel
{
    Info,
    Warning,
    Error
};

/**
 * @brief Get the upper-case name of a log level ("INFO", "WARNING", "ERROR").
 */
const char* to_string(LogLevel level) noexcept;

/**
 * @brief Interface for receivers of diagnostic log messages.
 *
 * @details
 * Implementations must not throw from `write()` and must not block the
 * caller for long; the reconstructor calls it inline for every skipped
 * record or choice.
 *
 * @par Thread Safety
 * - Implementations shared between threads must synchronize internally.
 */
class LogSink
{
public:
    virtual ~LogSink() = 0;

    /**
     * @brief Receive one message.
     * @param level Severity of the message.
     * @param message Human-readable text, without trailing newline.
     */
    virtual void write(LogLevel level, const std::string& message) noexcept = 0;

protected:
    LogSink() = default;

private:
    LogSink(const LogSink&) = delete;
    LogSink(LogSink&&) = delete;
    LogSink& operator=(const LogSink&) = delete;
    LogSink& operator=(LogSink&&) = delete;
};

/**
 * @brief Writes each message as one line to a `std::ostream`.
 *
 * @details Lines have the form `[trailgraph] WARNING: message`. Messages
 * below `min_level` are dropped. The stream must outlive the sink.
 */
class StreamLogSink : public LogSink
{
public:
    explicit StreamLogSink(std::ostream& os, LogLevel min_level = LogLevel::Info);

    void write(LogLevel level, const std::string& message) noexcept override;

private:
    std::ostream& m_os;
    LogLevel m_min_level;
};

/**
 * @brief Discards every message.
 */
class NullLogSink : public LogSink
{
public:
    NullLogSink() = default;

    void write(LogLevel, const std::string&) noexcept override
    {
    }
};

} // namespace trailgraph
