#pragma once

#include <shared_data/host_record.hpp>
#include <shared_data/validation_result.hpp>

#include <filesystem>
#include <optional>
#include <string_view>

namespace Transfer
{
    /**
     * @brief Checks caller input before any command is built from it.
     */
    class Validator
    {
      public:
        /**
         * @param strictRemotePaths Additionally reject remote paths with shell metacharacters.
         * @param home Used to expand "~" in local paths.
         */
        Validator(bool strictRemotePaths, std::filesystem::path home);

        /**
         * @brief Uses the home directory of the current user.
         *
         * @throws std::runtime_error if the home directory cannot be determined.
         */
        explicit Validator(bool strictRemotePaths = false);

        /**
         * @brief Path that is read locally (upload source). Has to exist.
         */
        SharedData::ValidationResult validateLocalPath(std::string_view path) const;

        /**
         * @brief Path that is written locally (download destination). Does not have to exist yet.
         */
        SharedData::ValidationResult validateLocalDestination(std::string_view path) const;

        SharedData::ValidationResult validateRemotePath(std::string_view path) const;

        static SharedData::ValidationResult validatePort(double port);

        static SharedData::ValidationResult validateHostRecord(std::optional<SharedData::HostRecord> const& host);

      private:
        bool strictRemotePaths_;
        std::filesystem::path home_;
    };
}
