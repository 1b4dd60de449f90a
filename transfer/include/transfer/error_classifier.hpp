#pragma once

#include <shared_data/execution_error_type.hpp>

#include <string>
#include <string_view>

namespace Transfer
{
    BOOST_DEFINE_ENUM_CLASS(ClassificationContext, Transfer, Listing);

    struct ErrorClassification
    {
        SharedData::ExecutionErrorType type{SharedData::ExecutionErrorType::Unclassified};
        std::string userMessage{};
    };

    /**
     * @brief Maps the output of a failed ssh, scp or rsync run to an error category and a message for the user.
     *
     * Matching is case insensitive on stderr and message combined. The checks run in a fixed order,
     * authentication and connection problems come before file problems, so that
     * "Permission denied (publickey)" is never reported as a file permission problem.
     */
    ErrorClassification classifyError(
        std::string_view standardError,
        std::string_view message,
        ClassificationContext context = ClassificationContext::Transfer);
}
