#pragma once

#include <shared_data/shared_data.hpp>

#include <optional>
#include <string>

namespace SharedData
{
    BOOST_DEFINE_ENUM_CLASS(
        ValidationErrorType,
        EmptyPath,
        NotFound,
        ControlCharacters,
        ShellMetacharacter,
        NotInteger,
        OutOfRange,
        MissingAlias,
        MissingHostRecord);

    struct ValidationResult
    {
        bool valid{true};
        std::optional<std::string> error{std::nullopt};
        std::optional<ValidationErrorType> errorType{std::nullopt};

        explicit operator bool() const
        {
            return valid;
        }

        static ValidationResult ok()
        {
            return ValidationResult{};
        }

        static ValidationResult fail(ValidationErrorType type, std::string message)
        {
            return ValidationResult{.valid = false, .error = std::move(message), .errorType = type};
        }
    };
    BOOST_DESCRIBE_STRUCT(ValidationResult, (), (valid, error, errorType))
}
