#include <transfer/validator.hpp>

#include <log/log.hpp>
#include <utility/algorithm/split.hpp>
#include <utility/home_directory.hpp>

#include <cmath>
#include <system_error>

using namespace SharedData;

namespace Transfer
{
    namespace
    {
        bool isBlank(std::string_view str)
        {
            return Utility::Algorithm::trim(str).empty();
        }

        bool isControlCharacter(char c)
        {
            const auto u = static_cast<unsigned char>(c);
            return u < 0x20 || u == 0x7F;
        }

        bool isShellMetacharacter(char c)
        {
            switch (c)
            {
                case ';':
                case '|':
                case '&':
                case '`':
                case '$':
                    return true;
                default:
                    return false;
            }
        }
    }

    Validator::Validator(bool strictRemotePaths, std::filesystem::path home)
        : strictRemotePaths_{strictRemotePaths}
        , home_{std::move(home)}
    {}

    Validator::Validator(bool strictRemotePaths)
        : Validator{strictRemotePaths, Utility::homeDirectory()}
    {}

    ValidationResult Validator::validateLocalPath(std::string_view path) const
    {
        if (isBlank(path))
            return ValidationResult::fail(ValidationErrorType::EmptyPath, "Local path cannot be empty");

        const auto expanded = Utility::expandTilde(path, home_);
        std::error_code ec;
        if (!std::filesystem::exists(expanded, ec))
        {
            if (ec && ec != std::errc::no_such_file_or_directory)
                Log::debug("Validator: cannot inspect '{}': {}", expanded, ec.message());
            return ValidationResult::fail(ValidationErrorType::NotFound, "File not found");
        }
        return ValidationResult::ok();
    }

    ValidationResult Validator::validateLocalDestination(std::string_view path) const
    {
        if (isBlank(path))
            return ValidationResult::fail(ValidationErrorType::EmptyPath, "Local path cannot be empty");
        return ValidationResult::ok();
    }

    ValidationResult Validator::validateRemotePath(std::string_view path) const
    {
        if (isBlank(path))
            return ValidationResult::fail(ValidationErrorType::EmptyPath, "Remote path cannot be empty");

        for (auto c : path)
        {
            if (isControlCharacter(c))
                return ValidationResult::fail(
                    ValidationErrorType::ControlCharacters, "Invalid path format: contains control characters");
        }

        // The builders escape the path regardless, this only narrows what is accepted.
        if (strictRemotePaths_)
        {
            for (auto c : path)
            {
                if (isShellMetacharacter(c))
                    return ValidationResult::fail(
                        ValidationErrorType::ShellMetacharacter, "Invalid path format: contains shell metacharacters");
            }
        }
        return ValidationResult::ok();
    }

    ValidationResult Validator::validatePort(double port)
    {
        if (std::isnan(port) || (std::isfinite(port) && std::trunc(port) != port))
            return ValidationResult::fail(ValidationErrorType::NotInteger, "Port must be an integer");

        if (port < 1 || port > 65535)
            return ValidationResult::fail(
                ValidationErrorType::OutOfRange, "Invalid port number: must be between 1 and 65535");

        return ValidationResult::ok();
    }

    ValidationResult Validator::validateHostRecord(std::optional<HostRecord> const& host)
    {
        if (!host)
            return ValidationResult::fail(ValidationErrorType::MissingHostRecord, "Host configuration is required");

        if (isBlank(host->alias))
            return ValidationResult::fail(ValidationErrorType::MissingAlias, "Host alias is required");

        if (host->port)
            return validatePort(*host->port);

        return ValidationResult::ok();
    }
}
