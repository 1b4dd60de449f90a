#pragma once

#include "fake_tool.hpp"

#include <transfer/shell_escape.hpp>
#include <transfer/transfer_service.hpp>
#include <utility/temporary_directory.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <fstream>

extern std::filesystem::path programDirectory;

namespace Transfer::Test
{
    using SharedData::ExecutionErrorType;
    using SharedData::HostRecord;
    using SharedData::TransferDirection;
    using SharedData::TransferMode;
    using SharedData::TransferRequest;
    using SharedData::ValidationErrorType;
    using ::testing::_;
    using ::testing::ElementsAre;
    using ::testing::HasSubstr;
    using ::testing::StartsWith;

    class TransferServiceTests : public ::testing::Test
    {
      protected:
        void SetUp() override
        {
            std::filesystem::create_directories(home() / ".ssh");
            std::ofstream{home() / ".ssh" / "config"} << "Host web\n"
                                                         "    HostName example.com\n"
                                                         "    User deploy\n";
            std::filesystem::create_directory(home() / "project");
            std::ofstream{home() / "project" / "index.html"} << "<html></html>";
            writeArgumentEcho(home() / "echo-args");
        }

        std::filesystem::path const& home() const
        {
            return isolateDirectory_.path();
        }

        /**
         * @brief A service whose scp and rsync print their arguments and whose ssh runs the given script.
         */
        TransferService makeService(std::string const& sshScript = "exit 0") const
        {
            const auto echo = (home() / "echo-args").string();
            const auto ssh = writeScript(home() / "fake-ssh", sshScript).string();
            return TransferService{
                Persistence::Settings{
                    .sshConfigPath = (home() / ".ssh" / "config").string(),
                    .listingTimeoutMs = 10'000,
                    .tools = Persistence::ToolPaths{.scp = echo, .rsync = echo, .ssh = ssh},
                },
                home()};
        }

        static TransferRequest upload(std::string local, std::string remote)
        {
            return TransferRequest{
                .direction = TransferDirection::Upload,
                .mode = TransferMode::IncrementalSync,
                .localPath = std::move(local),
                .remotePath = std::move(remote),
                .host = {.alias = "web"},
            };
        }

      protected:
        Utility::TemporaryDirectory isolateDirectory_{programDirectory / "temp", true};
    };

    TEST_F(TransferServiceTests, HostsComeFromTheConfiguredFile)
    {
        auto service = makeService();

        const auto hosts = service.listHosts();
        ASSERT_EQ(hosts->size(), 1);
        EXPECT_EQ(hosts->front().alias, "web");
        EXPECT_EQ(service.findHost("web")->user, "deploy");
        EXPECT_FALSE(service.findHost("db").has_value());
    }

    TEST_F(TransferServiceTests, MissingDefaultsAreFilledIn)
    {
        const auto service = makeService();

        EXPECT_EQ(service.settings().transferTimeout(), std::chrono::minutes{5});
        EXPECT_EQ(service.settings().listingTimeout(), std::chrono::seconds{10});
        EXPECT_EQ(service.tools().sshConfigPath, (home() / ".ssh" / "config").string());
    }

    TEST_F(TransferServiceTests, PrepareRejectsMissingAlias)
    {
        auto request = upload((home() / "project").string(), "/srv/site");
        request.host.alias.clear();

        const auto prepared = makeService().prepare(request);
        ASSERT_FALSE(prepared.has_value());
        EXPECT_EQ(prepared.error().errorType, ValidationErrorType::MissingAlias);
        EXPECT_EQ(prepared.error().error, "Host alias is required");
    }

    TEST_F(TransferServiceTests, PrepareRejectsBadRemotePathBeforeLocalPath)
    {
        const auto prepared = makeService().prepare(upload("/does/not/exist", "/srv/\nsite"));
        ASSERT_FALSE(prepared.has_value());
        EXPECT_EQ(prepared.error().errorType, ValidationErrorType::ControlCharacters);
    }

    TEST_F(TransferServiceTests, PrepareRejectsMissingUploadSource)
    {
        const auto prepared = makeService().prepare(upload((home() / "missing.txt").string(), "/srv/site"));
        ASSERT_FALSE(prepared.has_value());
        EXPECT_EQ(prepared.error().errorType, ValidationErrorType::NotFound);
        EXPECT_EQ(prepared.error().error, "File not found");
    }

    TEST_F(TransferServiceTests, DownloadDestinationNeedNotExist)
    {
        auto request = upload((home() / "new-folder").string(), "/srv/site");
        request.direction = TransferDirection::Download;

        EXPECT_TRUE(makeService().prepare(request).has_value());
    }

    TEST_F(TransferServiceTests, DirectoryUploadGetsTrailingSlashOnTheRemoteSide)
    {
        const auto local = (home() / "project").string();
        const auto prepared = makeService().prepare(upload(local + "/", "/srv/site"));

        ASSERT_TRUE(prepared.has_value());
        EXPECT_THAT(prepared->commandLine, HasSubstr(shellEscape(local) + " 'web':'/srv/site/'"));
    }

    TEST_F(TransferServiceTests, PreparedCommandRunsEndToEnd)
    {
        const auto local = (home() / "project").string();
        auto service = makeService();

        const auto prepared = service.prepare(upload(local, "~/site with space"));
        ASSERT_TRUE(prepared.has_value());

        const auto result = service.execute(*prepared);
        ASSERT_TRUE(result.success) << result.userMessage;
        EXPECT_THAT(
            splitNul(result.rawStdout.value_or("")),
            ElementsAre("-e", _, "-avz", local, "web:~/site with space/"));
    }

    TEST_F(TransferServiceTests, RemoteListingIsParsed)
    {
        auto service = makeService(R"(cat <<'LISTING'
total 8.0K
drwxr-xr-x 5 u g 4.0K Jan 13 10:30 docs
-rw-r--r-- 1 u g  120 Jan 14 09:00 read me.txt
LISTING)");

        const auto entries = service.listRemoteDirectory(HostRecord{.alias = "web"}, "/srv");
        ASSERT_TRUE(entries.has_value()) << entries.error().message;
        ASSERT_EQ(entries->size(), 2);
        EXPECT_EQ(entries->at(0).name, "docs");
        EXPECT_TRUE(entries->at(0).isDirectory);
        EXPECT_EQ(entries->at(1).name, "read me.txt");
        EXPECT_EQ(entries->at(1).size, "120");
    }

    TEST_F(TransferServiceTests, EmptyListingPathMeansHome)
    {
        auto service = makeService(R"(printf '%s\n' "$@" >&2; exit 1)");

        const auto entries = service.listRemoteDirectory(HostRecord{.alias = "web"}, "");
        ASSERT_FALSE(entries.has_value());
        EXPECT_THAT(entries.error().rawStderr.value_or(""), HasSubstr("ls -lAh -- ~\n"));
    }

    TEST_F(TransferServiceTests, MissingRemoteDirectoryIsReported)
    {
        auto service = makeService(R"(echo "ls: cannot access '/nope': No such file or directory" >&2; exit 2)");

        const auto entries = service.listRemoteDirectory(HostRecord{.alias = "web"}, "/nope");
        ASSERT_FALSE(entries.has_value());
        EXPECT_EQ(entries.error().executionError, ExecutionErrorType::RemotePathNotFound);
        EXPECT_FALSE(entries.error().validationError.has_value());
        EXPECT_THAT(entries.error().message, StartsWith("Directory not found"));
    }

    TEST_F(TransferServiceTests, ListingRejectsMissingAlias)
    {
        const auto entries = makeService().listRemoteDirectory(HostRecord{}, "/srv");
        ASSERT_FALSE(entries.has_value());
        EXPECT_EQ(entries.error().validationError, ValidationErrorType::MissingAlias);
        EXPECT_FALSE(entries.error().executionError.has_value());
    }
}
