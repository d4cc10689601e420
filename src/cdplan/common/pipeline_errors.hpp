/**
 * @file pipeline_errors.hpp
 */
#pragma once
#include "cdplan/common/common.hpp"

namespace cdplan
{

/**
 * @brief Error codes for pipeline compilation.
 */
enum class PipelineErrorCode
{
    /// A graph invariant was violated, e.g. a container reached scheduling.
    Structural,
    /// User-supplied configuration is inconsistent.
    Validation,
    /// A step capability that cannot be translated into an action.
    UnsupportedStep,
    /// A build-once object was built a second time.
    AlreadyBuilt,
    /// A build result was read before it was produced.
    NotBuilt,
    /// A pipeline description file could not be read or is malformed.
    Configuration
};

/**
 * @brief Get a short name for an error code.
 */
inline const char* to_string(PipelineErrorCode code) noexcept
{
    switch (code)
    {
        case PipelineErrorCode::Structural: return "StructuralError";
        case PipelineErrorCode::Validation: return "ValidationError";
        case PipelineErrorCode::UnsupportedStep: return "UnsupportedStepError";
        case PipelineErrorCode::AlreadyBuilt: return "AlreadyBuiltError";
        case PipelineErrorCode::NotBuilt: return "NotBuiltError";
        case PipelineErrorCode::Configuration: return "ConfigurationError";
    }
    return "PipelineError";
}

/**
 * @brief Base exception class for pipeline compilation errors.
 *
 * @details
 * `PipelineError` is thrown when the layered graph, the engine properties or
 * the pipeline description violate a precondition. Each exception carries an
 * error code and a message naming the offending node, asset type or stage.
 *
 * None of these errors is retried: compilation is deterministic, so the same
 * input fails the same way.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class PipelineError : public std::exception
{
public:
    /**
     * @brief Construct a PipelineError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     */
    PipelineError(PipelineErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    /**
     * @brief Get the error code.
     */
    PipelineErrorCode code() const noexcept
    {
        return m_code;
    }

    /**
     * @brief Get the error message.
     */
    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    PipelineErrorCode m_code;
    std::string m_message;
};

/**
 * @brief A container node leaked into leaf position, or the node tree is malformed.
 * @note Indicates a defect in the upstream layering, never a runtime condition.
 */
class StructuralError : public PipelineError
{
public:
    explicit StructuralError(std::string message)
        : PipelineError(PipelineErrorCode::Structural, std::move(message))
    {}
};

/**
 * @brief Configuration is inconsistent, e.g. mixed asset types in one publish group.
 */
class ValidationError : public PipelineError
{
public:
    explicit ValidationError(std::string message)
        : PipelineError(PipelineErrorCode::Validation, std::move(message))
    {}
};

/**
 * @brief A step that is neither native, scripted, nor a manual approval.
 */
class UnsupportedStepError : public PipelineError
{
public:
    explicit UnsupportedStepError(std::string message)
        : PipelineError(PipelineErrorCode::UnsupportedStep, std::move(message))
    {}
};

class AlreadyBuiltError : public PipelineError
{
public:
    explicit AlreadyBuiltError(std::string message)
        : PipelineError(PipelineErrorCode::AlreadyBuilt, std::move(message))
    {}
};

class NotBuiltError : public PipelineError
{
public:
    explicit NotBuiltError(std::string message)
        : PipelineError(PipelineErrorCode::NotBuilt, std::move(message))
    {}
};

/**
 * @brief A pipeline description file is unreadable or malformed.
 */
class ConfigurationError : public PipelineError
{
public:
    explicit ConfigurationError(std::string message)
        : PipelineError(PipelineErrorCode::Configuration, std::move(message))
    {}
};

} // namespace cdplan
