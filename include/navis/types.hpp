#pragma once

#include <algorithm>
#include <expected>
#include <stdexcept>
#include <string>

namespace navis
{

    /**
     * Error types for navis operations.
     * The first five codes are the decision-pipeline taxonomy; the rest cover
     * configuration, parsing and storage.
     */
    enum class ErrorCode
    {
        EmptyCandidateSet,
        NoCandidatesAvailable,
        ExecutionFailure,
        VisionFallbackFailure,
        ModelUpdateFailure,
        ConfigError,
        ValidationError,
        StorageError,
        NotFound,
        InvalidInput,
        ParsingError,
        IOError,
        InternalError
    };

    inline std::string error_code_to_string(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::EmptyCandidateSet:
            return "empty_candidate_set";
        case ErrorCode::NoCandidatesAvailable:
            return "no_candidates_available";
        case ErrorCode::ExecutionFailure:
            return "execution_failure";
        case ErrorCode::VisionFallbackFailure:
            return "vision_fallback_failure";
        case ErrorCode::ModelUpdateFailure:
            return "model_update_failure";
        case ErrorCode::ConfigError:
            return "config_error";
        case ErrorCode::ValidationError:
            return "validation_error";
        case ErrorCode::StorageError:
            return "storage_error";
        case ErrorCode::NotFound:
            return "not_found";
        case ErrorCode::InvalidInput:
            return "invalid_input";
        case ErrorCode::ParsingError:
            return "parsing_error";
        case ErrorCode::IOError:
            return "io_error";
        case ErrorCode::InternalError:
            return "internal_error";
        }
        return "unknown";
    }

    /**
     * navis error with code and message
     */
    class NavisError : public std::runtime_error
    {
    public:
        ErrorCode code;

        NavisError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        static NavisError empty_candidate_set(const std::string &msg)
        {
            return NavisError(ErrorCode::EmptyCandidateSet, msg);
        }

        static NavisError no_candidates(const std::string &msg)
        {
            return NavisError(ErrorCode::NoCandidatesAvailable, msg);
        }

        static NavisError execution(const std::string &msg)
        {
            return NavisError(ErrorCode::ExecutionFailure, msg);
        }

        static NavisError vision_fallback(const std::string &msg)
        {
            return NavisError(ErrorCode::VisionFallbackFailure, msg);
        }

        static NavisError model_update(const std::string &msg)
        {
            return NavisError(ErrorCode::ModelUpdateFailure, msg);
        }

        static NavisError config(const std::string &msg)
        {
            return NavisError(ErrorCode::ConfigError, msg);
        }

        static NavisError validation(const std::string &msg)
        {
            return NavisError(ErrorCode::ValidationError, msg);
        }

        static NavisError storage(const std::string &msg)
        {
            return NavisError(ErrorCode::StorageError, msg);
        }

        static NavisError not_found(const std::string &msg)
        {
            return NavisError(ErrorCode::NotFound, msg);
        }

        static NavisError invalid_input(const std::string &msg)
        {
            return NavisError(ErrorCode::InvalidInput, msg);
        }

        static NavisError parsing(const std::string &msg)
        {
            return NavisError(ErrorCode::ParsingError, msg);
        }

        static NavisError io(const std::string &msg)
        {
            return NavisError(ErrorCode::IOError, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, NavisError>;

    inline double clamp_unit(double value)
    {
        return std::clamp(value, 0.0, 1.0);
    }

    inline double clamp_reward(double value)
    {
        return std::clamp(value, -1.0, 1.0);
    }

    /** ISO 8601 UTC timestamp with millisecond precision */
    std::string now_iso8601();

} // namespace navis
