#include <cli/commands.hpp>

#include <log/log.hpp>
#include <persistence/settings_holder.hpp>

#include <cxxopts.hpp>

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

int main(int argc, char** argv)
{
    cxxopts::Options options{"hostxfer", "Transfer files to and from hosts of your ssh configuration"};
    options.positional_help("<hosts|upload|download|ls> [arguments...]");

    // clang-format off
    options.add_options()
        ("command", "Command to run", cxxopts::value<std::string>())
        ("arguments", "Command arguments", cxxopts::value<std::vector<std::string>>())
        ("mode", "Transfer tool: scp or rsync", cxxopts::value<std::string>())
        ("h,human-readable", "rsync: human readable sizes", cxxopts::value<bool>()->default_value("false"))
        ("P,progress", "rsync: show progress and keep partial files", cxxopts::value<bool>()->default_value("false"))
        ("delete", "rsync: delete extraneous files at the destination", cxxopts::value<bool>()->default_value("false"))
        ("dry-run", "Print the command instead of running it", cxxopts::value<bool>()->default_value("false"))
        ("timeout", "Transfer timeout in milliseconds", cxxopts::value<long long>())
        ("json", "Print results as JSON", cxxopts::value<bool>()->default_value("false"))
        ("settings", "Settings file", cxxopts::value<std::string>())
        ("ssh-config", "ssh configuration file", cxxopts::value<std::string>())
        ("log-level", "trace, debug, info, warning, error, critical or off", cxxopts::value<std::string>())
        ("help", "Print usage");
    // clang-format on
    options.parse_positional({"command", "arguments"});

    cxxopts::ParseResult parsed;
    try
    {
        parsed = options.parse(argc, argv);
    }
    catch (cxxopts::exceptions::exception const& e)
    {
        std::cerr << e.what() << "\n\n" << options.help() << std::endl;
        return Cli::ExitCode::UsageError;
    }

    if (parsed.count("help") || !parsed.count("command"))
    {
        std::cout << options.help() << std::endl;
        return parsed.count("help") ? Cli::ExitCode::Success : Cli::ExitCode::UsageError;
    }

    Persistence::SettingsHolder settingsHolder{
        parsed.count("settings") ? std::filesystem::path{parsed["settings"].as<std::string>()}
                                 : Persistence::defaultSettingsPath()};
    if (!settingsHolder.load())
        Log::warn("Continuing with default settings, '{}' was not loaded.", settingsHolder.path().string());
    auto settings = settingsHolder.settings();

    if (parsed.count("ssh-config"))
        settings.sshConfigPath = parsed["ssh-config"].as<std::string>();
    if (parsed.count("log-level"))
        settings.logLevel = parsed["log-level"].as<std::string>();

    const auto level = Log::parseLevel(settings.logLevel.value_or("info"));
    if (!level)
    {
        std::cerr << "Unknown log level '" << *settings.logLevel << "'." << std::endl;
        return Cli::ExitCode::UsageError;
    }
    Log::setup(Log::LoggerOptions{
        .level = *level,
        .logToConsole = true,
        .logFile = settings.logFile,
    });
    Log::debug("Log level is {}.", Log::levelToString(*level));

    try
    {
        Transfer::TransferService service{settings};
        const Cli::CommandContext context{.service = service, .json = parsed["json"].as<bool>()};

        const auto command = parsed["command"].as<std::string>();
        const auto arguments = parsed.count("arguments") ? parsed["arguments"].as<std::vector<std::string>>()
                                                          : std::vector<std::string>{};

        if (command == "hosts")
            return Cli::listHosts(context);
        if (command == "ls")
            return Cli::listRemote(context, arguments);

        if (command == "upload" || command == "download")
        {
            Cli::TransferFlags flags{
                .mode = std::nullopt,
                .humanReadable = parsed["human-readable"].as<bool>(),
                .progress = parsed["progress"].as<bool>(),
                .deleteExtraneous = parsed["delete"].as<bool>(),
                .dryRun = parsed["dry-run"].as<bool>(),
                .timeoutMs = std::nullopt,
            };
            if (parsed.count("mode"))
                flags.mode = parsed["mode"].as<std::string>();
            if (parsed.count("timeout"))
                flags.timeoutMs = parsed["timeout"].as<long long>();

            return Cli::transfer(
                context,
                command == "upload" ? SharedData::TransferDirection::Upload : SharedData::TransferDirection::Download,
                arguments,
                flags);
        }

        std::cerr << "Unknown command '" << command << "'.\n\n" << options.help() << std::endl;
        return Cli::ExitCode::UsageError;
    }
    catch (std::exception const& e)
    {
        Log::critical("{}", e.what());
        return Cli::ExitCode::Failure;
    }
}
