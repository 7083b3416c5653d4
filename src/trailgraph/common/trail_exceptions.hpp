/**
 * @file trail_exceptions.hpp
 */
#pragma once
#include "trailgraph/common/common.hpp"

namespace trailgraph
{

/**
 * @brief Error codes for reconstruction precondition failures.
 */
enum class ConfigurationErrorCode
{
    EmptyInput,
    MissingStartNode
};

/**
 * @brief Exception class for reconstruction precondition failures.
 *
 * @details
 * `ConfigurationError` is thrown by `DagReconstructor::reconstruct()` when the
 * caller violates the basic contract: an empty step sequence or a missing
 * start node id. Data-quality problems inside the steps are never reported
 * this way; they become diagnostics.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class ConfigurationError : public std::exception
{
public:
    /**
     * @brief Construct a ConfigurationError.
     * @param code The error code indicating the violated precondition.
     * @param message A descriptive message explaining the error.
     */
    ConfigurationError(ConfigurationErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    /**
     * @brief Get the error code.
     */
    ConfigurationErrorCode code() const noexcept
    {
        return m_code;
    }

    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    ConfigurationErrorCode m_code;
    std::string m_message;
};

/**
 * @brief Exception thrown when a trail document is not structurally usable.
 *
 * @details Thrown by the JSON codec for invalid JSON text, or when the
 * step array cannot be located. Field-level problems inside individual
 * steps are not errors at this layer.
 */
class TrailFormatError : public std::runtime_error
{
public:
    explicit TrailFormatError(const std::string& msg)
        : std::runtime_error(msg)
    {}
};

} // namespace trailgraph
