#include <persistence/ssh_config_parser.hpp>

#include <log/log.hpp>
#include <utility/algorithm/case_convert.hpp>
#include <utility/algorithm/split.hpp>
#include <utility/home_directory.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>

namespace Persistence
{
    namespace
    {
        struct KeyValue
        {
            std::string key;
            std::string value;
        };

        bool isKeyCharacter(char c)
        {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
        }

        /**
         * Splits "Key Value", "Key=Value" and "Key = Value". Surrounding double quotes of the value are removed.
         */
        std::optional<KeyValue> splitKeyValue(std::string_view line)
        {
            std::size_t keyEnd = 0;
            while (keyEnd < line.size() && isKeyCharacter(line[keyEnd]))
                ++keyEnd;
            if (keyEnd == 0 || keyEnd == line.size())
                return std::nullopt;

            auto rest = line.substr(keyEnd);
            if (!Utility::Algorithm::isSpace(rest.front()) && rest.front() != '=')
                return std::nullopt;

            rest = Utility::Algorithm::trimLeft(rest);
            if (!rest.empty() && rest.front() == '=')
                rest = Utility::Algorithm::trimLeft(rest.substr(1));
            rest = Utility::Algorithm::trimRight(rest);

            if (rest.size() >= 2 && rest.front() == '"' && rest.back() == '"')
                rest = rest.substr(1, rest.size() - 2);
            if (rest.empty())
                return std::nullopt;

            return KeyValue{
                .key = Utility::Algorithm::toLowerCase(std::string{line.substr(0, keyEnd)}),
                .value = std::string{rest},
            };
        }

        std::optional<int> parsePort(std::string_view value)
        {
            int port = 0;
            const auto* end = value.data() + value.size();
            const auto [ptr, ec] = std::from_chars(value.data(), end, port);
            if (ec != std::errc{} || ptr != end)
                return std::nullopt;
            if (port < 1 || port > 65535)
                return std::nullopt;
            return port;
        }

        void flush(
            std::vector<SharedData::HostRecord>& hosts,
            std::vector<std::string> const& aliases,
            SharedData::HostRecord const& properties)
        {
            for (auto const& alias : aliases)
            {
                auto record = properties;
                record.alias = alias;
                hosts.push_back(std::move(record));
            }
        }
    }

    std::vector<SharedData::HostRecord> parseSshConfig(std::istream& input, std::filesystem::path const& homeDirectory)
    {
        std::vector<SharedData::HostRecord> hosts{};
        std::vector<std::string> currentAliases{};
        SharedData::HostRecord currentProperties{};

        std::string line;
        std::size_t lineNumber = 0;
        while (std::getline(input, line))
        {
            ++lineNumber;
            const auto trimmed = Utility::Algorithm::trim(line);
            if (trimmed.empty() || trimmed.front() == '#')
                continue;

            const auto keyValue = splitKeyValue(trimmed);
            if (!keyValue)
            {
                Log::debug("ssh config line {}: skipping unrecognized line.", lineNumber);
                continue;
            }

            if (keyValue->key == "host" || keyValue->key == "match")
            {
                flush(hosts, currentAliases, currentProperties);
                currentAliases.clear();
                currentProperties = {};

                if (keyValue->key == "match")
                    continue;

                for (auto& alias : Utility::Algorithm::splitWhitespace(keyValue->value))
                {
                    if (alias.find('*') != std::string::npos)
                        continue;
                    currentAliases.push_back(std::move(alias));
                }
                continue;
            }

            // Properties outside of a named block (global or wildcard) do not describe a host.
            if (currentAliases.empty())
                continue;

            auto const& [key, value] = *keyValue;
            if (key == "hostname")
                currentProperties.hostName = value;
            else if (key == "user")
                currentProperties.user = value;
            else if (key == "port")
            {
                if (const auto port = parsePort(value); port)
                    currentProperties.port = *port;
                else
                    Log::warn("ssh config line {}: invalid port value '{}', ignoring it.", lineNumber, value);
            }
            else if (key == "identityfile")
                currentProperties.identityFilePath = Utility::expandTilde(value, homeDirectory);
            else if (key == "proxyjump")
                currentProperties.proxyJumpAlias = value;
        }

        flush(hosts, currentAliases, currentProperties);
        return hosts;
    }
}
