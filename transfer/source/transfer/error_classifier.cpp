#include <transfer/error_classifier.hpp>

#include <log/log.hpp>
#include <utility/algorithm/case_convert.hpp>
#include <utility/algorithm/split.hpp>
#include <utility/enum_string_convert.hpp>

#include <array>
#include <cctype>

using namespace SharedData;

namespace Transfer
{
    namespace
    {
        bool contains(std::string_view str, std::string_view what)
        {
            return str.find(what) != std::string_view::npos;
        }

        /**
         * ssh reports a refused login as "Permission denied, please try again." or
         * "Permission denied (publickey,password)." with the offered methods in parentheses.
         * File errors read "...: Permission denied" or "Permission denied (13)".
         */
        bool isAuthenticationDenial(std::string_view text)
        {
            if (contains(text, "permission denied, please try again"))
                return true;

            constexpr std::string_view marker = "permission denied (";
            for (auto pos = text.find(marker); pos != std::string_view::npos; pos = text.find(marker, pos + 1))
            {
                const auto next = pos + marker.size();
                if (next < text.size() && std::isalpha(static_cast<unsigned char>(text[next])))
                    return true;
            }
            return false;
        }

        struct ClassificationRule
        {
            ExecutionErrorType type;
            bool (*matches)(std::string_view combined);
            char const* transferMessage;
            // nullptr when the transfer message fits listings too.
            char const* listingMessage;
        };

        // Order matters, the first match wins.
        constexpr std::array<ClassificationRule, 15> classificationRules{{
            {
                ExecutionErrorType::AuthKeyRejected,
                [](std::string_view text) {
                    return contains(text, "permission denied") && contains(text, "publickey");
                },
                "Authentication failed: SSH key not accepted. Check your SSH key configuration.",
                "Authentication failed: SSH key not accepted.",
            },
            {
                ExecutionErrorType::AuthPermissionDenied,
                [](std::string_view text) {
                    return isAuthenticationDenial(text);
                },
                "Authentication failed: Permission denied. Check your credentials and SSH configuration.",
                "Permission denied: Check your credentials.",
            },
            {
                ExecutionErrorType::HostKeyVerificationFailed,
                [](std::string_view text) {
                    return contains(text, "host key verification failed");
                },
                "Host key verification failed. You may need to add the host to your known_hosts file.",
                nullptr,
            },
            {
                ExecutionErrorType::IdentityFileMissing,
                [](std::string_view text) {
                    return contains(text, "no such identity");
                },
                "SSH key file not found. Check the IdentityFile path in your SSH config.",
                nullptr,
            },
            {
                ExecutionErrorType::ConnectionRefused,
                [](std::string_view text) {
                    return contains(text, "connection refused");
                },
                "Connection refused: The server is not accepting connections on the specified port.",
                "Connection refused: The server is not accepting connections.",
            },
            {
                ExecutionErrorType::ConnectionTimedOut,
                [](std::string_view text) {
                    return contains(text, "connection timed out") || contains(text, "operation timed out");
                },
                "Connection timed out: Unable to reach the server. Check your network connection and server address.",
                "Connection timed out: Unable to reach the server.",
            },
            {
                ExecutionErrorType::NoRouteToHost,
                [](std::string_view text) {
                    return contains(text, "no route to host");
                },
                "No route to host: The server address is unreachable. Check the hostname or IP address.",
                nullptr,
            },
            {
                ExecutionErrorType::HostnameUnresolvable,
                [](std::string_view text) {
                    return contains(text, "could not resolve hostname");
                },
                "Could not resolve hostname: The server address is invalid or DNS lookup failed.",
                "Could not resolve hostname: The server address is invalid.",
            },
            {
                ExecutionErrorType::NetworkUnreachable,
                [](std::string_view text) {
                    return contains(text, "network is unreachable");
                },
                "Network is unreachable: Check your internet connection.",
                nullptr,
            },
            {
                ExecutionErrorType::RemotePathNotFound,
                [](std::string_view text) {
                    return contains(text, "no such file or directory");
                },
                "File not found: The specified file or directory does not exist on the remote server.",
                "Directory not found: The specified path does not exist on the remote server.",
            },
            {
                ExecutionErrorType::RemotePathIsDirectory,
                [](std::string_view text) {
                    return contains(text, "is a directory");
                },
                "Target is a directory: Use a directory path or ensure the path ends with a slash.",
                nullptr,
            },
            {
                ExecutionErrorType::RemotePathNotADirectory,
                [](std::string_view text) {
                    return contains(text, "not a directory");
                },
                "Target is not a directory: The destination path must be a directory.",
                "Not a directory: The specified path is a file, not a directory.",
            },
            {
                ExecutionErrorType::RemotePermissionDenied,
                [](std::string_view text) {
                    return contains(text, "permission denied");
                },
                "Permission denied: You do not have permission to access the file or directory on the remote server.",
                nullptr,
            },
            {
                ExecutionErrorType::NoSpaceLeft,
                [](std::string_view text) {
                    return contains(text, "no space left on device");
                },
                "No space left on device: The destination has insufficient disk space.",
                nullptr,
            },
            {
                ExecutionErrorType::DiskQuotaExceeded,
                [](std::string_view text) {
                    return contains(text, "disk quota exceeded");
                },
                "Disk quota exceeded: You have exceeded your disk quota on the remote server.",
                nullptr,
            },
        }};
    }

    ErrorClassification
    classifyError(std::string_view standardError, std::string_view message, ClassificationContext context)
    {
        auto combined = Utility::Algorithm::toLowerCase(std::string{standardError} + " " + std::string{message});

        for (auto const& rule : classificationRules)
        {
            if (!rule.matches(combined))
                continue;

            Log::debug("Classified failure as {}.", Utility::enumToString(rule.type));
            const char* userMessage = rule.transferMessage;
            if (context == ClassificationContext::Listing && rule.listingMessage != nullptr)
                userMessage = rule.listingMessage;
            return {.type = rule.type, .userMessage = userMessage};
        }

        const auto trimmedError = Utility::Algorithm::trim(standardError);
        const auto detail = !trimmedError.empty() ? trimmedError : Utility::Algorithm::trim(message);
        if (context == ClassificationContext::Listing)
            return {
                .type = ExecutionErrorType::Unclassified,
                .userMessage = "Failed to list remote files: " + std::string{detail.empty() ? "Unknown error" : detail},
            };
        return {
            .type = ExecutionErrorType::Unclassified,
            .userMessage = "Transfer failed: " + std::string{detail.empty() ? "Unknown error occurred" : detail},
        };
    }
}
