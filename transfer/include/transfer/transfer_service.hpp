#pragma once

#include <persistence/host_config_store.hpp>
#include <persistence/settings.hpp>
#include <shared_data/built_command.hpp>
#include <shared_data/remote_entry.hpp>
#include <shared_data/transfer_request.hpp>
#include <shared_data/transfer_result.hpp>
#include <shared_data/validation_result.hpp>
#include <transfer/command_builder.hpp>
#include <transfer/path_normalizer.hpp>
#include <transfer/process_executor.hpp>
#include <transfer/validator.hpp>

#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Transfer
{
    struct ListingError
    {
        std::string message{};
        // Exactly one of the two is set.
        std::optional<SharedData::ValidationErrorType> validationError{std::nullopt};
        std::optional<SharedData::ExecutionErrorType> executionError{std::nullopt};
        std::optional<std::string> rawStderr{std::nullopt};
    };

    /**
     * @brief Everything a front end needs: hosts, validation, building and running transfers and remote listings.
     */
    class TransferService
    {
      public:
        /**
         * @param settings Missing fields take their built-in defaults.
         * @param home Home directory for "~" in local paths and the configuration.
         */
        TransferService(Persistence::Settings settings, std::filesystem::path home);

        /**
         * @throws std::runtime_error if the home directory cannot be determined.
         */
        explicit TransferService(Persistence::Settings settings);

        std::shared_ptr<Persistence::HostConfigStore::HostList const> listHosts();
        std::optional<SharedData::HostRecord> findHost(std::string_view alias);
        Persistence::HostConfigStore& hostStore();

        SharedData::ValidationResult validateLocalPath(std::string_view path) const;
        SharedData::ValidationResult validateLocalDestination(std::string_view path) const;
        SharedData::ValidationResult validateRemotePath(std::string_view path) const;
        SharedData::ValidationResult validatePort(double port) const;
        SharedData::ValidationResult validateHostRecord(std::optional<SharedData::HostRecord> const& host) const;

        /**
         * @brief Validates the request for its direction, then normalizes it and builds the command.
         */
        std::expected<SharedData::BuiltCommand, SharedData::ValidationResult>
        prepare(SharedData::TransferRequest const& request) const;

        /**
         * @brief Normalizes and builds without validating. Callers must have validated the request.
         */
        SharedData::BuiltCommand buildCommand(SharedData::TransferRequest const& request) const;

        /**
         * @brief Execution options for transfers according to the settings.
         */
        ExecutionOptions transferOptions() const;

        SharedData::TransferResult execute(
            SharedData::BuiltCommand const& command,
            std::function<void(std::string const&)> const& onProgress = {}) const;
        SharedData::TransferResult execute(
            SharedData::BuiltCommand const& command,
            ExecutionOptions const& options,
            std::function<void(std::string const&)> const& onProgress = {}) const;

        Execution startExecution(SharedData::BuiltCommand const& command) const;
        Execution startExecution(SharedData::BuiltCommand const& command, ExecutionOptions const& options) const;

        /**
         * @brief Runs "ls -lAh" on the host. An empty path lists the remote home directory.
         */
        std::expected<std::vector<SharedData::RemoteEntry>, ListingError>
        listRemoteDirectory(SharedData::HostRecord const& host, std::string_view remotePath) const;

        Persistence::Settings const& settings() const;
        ToolConfig const& tools() const;

      private:
        Persistence::Settings settings_;
        std::filesystem::path home_;
        Persistence::HostConfigStore store_;
        Validator validator_;
        PathNormalizer normalizer_;
        ToolConfig tools_;
        ProcessExecutor executor_;
    };
}
