#pragma once

#include <shared_data/host_record.hpp>

#include <filesystem>
#include <istream>
#include <vector>

namespace Persistence
{
    /**
     * @brief Parses the Host blocks of an ssh configuration file.
     *
     * Every alias of a "Host" line becomes its own record carrying the properties of the block.
     * Aliases containing "*" are dropped, as are "Match" blocks. Recognized keys are HostName, User,
     * Port, IdentityFile and ProxyJump (case insensitive), everything else is ignored.
     * Malformed values are logged and skipped, parsing never throws.
     *
     * @param input The configuration text.
     * @param homeDirectory Used to expand a leading "~" of IdentityFile.
     */
    std::vector<SharedData::HostRecord> parseSshConfig(std::istream& input, std::filesystem::path const& homeDirectory);
}
