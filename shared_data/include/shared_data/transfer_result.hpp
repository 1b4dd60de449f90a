#pragma once

#include <shared_data/execution_error_type.hpp>
#include <shared_data/shared_data.hpp>

#include <optional>
#include <string>

namespace SharedData
{
    struct TransferResult
    {
        bool success{false};
        std::string userMessage{};
        std::optional<std::string> rawStdout{std::nullopt};
        std::optional<std::string> rawStderr{std::nullopt};
        // Set on failure only.
        std::optional<ExecutionErrorType> errorType{std::nullopt};
        std::optional<int> exitCode{std::nullopt};

        explicit operator bool() const
        {
            return success;
        }
    };
    BOOST_DESCRIBE_STRUCT(TransferResult, (), (success, userMessage, rawStdout, rawStderr, errorType, exitCode))
}
