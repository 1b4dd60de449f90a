#pragma once

#include <shared_data/remote_entry.hpp>

#include <string_view>
#include <vector>

namespace Transfer
{
    /**
     * @brief Parses the output of "ls -lAh".
     *
     * A leading "total" line is skipped, as are lines with fewer than nine fields.
     * The name is everything from the ninth field on, joined by single spaces.
     */
    std::vector<SharedData::RemoteEntry> parseRemoteListing(std::string_view output);
}
