#include <transfer/listing_parser.hpp>

#include <log/log.hpp>
#include <utility/algorithm/split.hpp>

using namespace SharedData;

namespace Transfer
{
    namespace
    {
        constexpr std::size_t minimumFieldCount = 9;
    }

    std::vector<RemoteEntry> parseRemoteListing(std::string_view output)
    {
        const auto lines = Utility::Algorithm::splitLines(Utility::Algorithm::trim(output));

        std::vector<RemoteEntry> entries;
        entries.reserve(lines.size());
        for (std::size_t i = 0; i < lines.size(); ++i)
        {
            if (i == 0 && lines[i].starts_with("total"))
                continue;

            const auto fields = Utility::Algorithm::splitWhitespace(lines[i]);
            if (fields.size() < minimumFieldCount)
            {
                if (!fields.empty())
                    Log::debug("Skipping malformed listing line: '{}'", lines[i]);
                continue;
            }

            std::string name = fields[8];
            for (std::size_t f = minimumFieldCount; f < fields.size(); ++f)
            {
                name.push_back(' ');
                name.append(fields[f]);
            }

            const bool isDirectory = fields[0].starts_with('d');
            entries.push_back(RemoteEntry{
                .name = std::move(name),
                .isDirectory = isDirectory,
                .size = isDirectory ? std::string{} : fields[4],
                .permissions = fields[0],
                .modifiedDate = fields[5] + " " + fields[6] + " " + fields[7],
            });
        }
        return entries;
    }
}
