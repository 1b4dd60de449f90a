#pragma once

#include <persistence/ssh_config_parser.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <sstream>

namespace Persistence::Test
{
    using ::testing::ElementsAre;
    using ::testing::Field;
    using ::testing::IsEmpty;
    using ::testing::Optional;

    class SshConfigParserTests : public ::testing::Test
    {
      protected:
        std::vector<SharedData::HostRecord> parse(std::string const& text)
        {
            std::istringstream stream{text};
            return parseSshConfig(stream, "/home/tester");
        }
    };

    TEST_F(SshConfigParserTests, BlockPropertiesApplyToEveryAlias)
    {
        const auto hosts = parse("Host a b\n  HostName x.example.com\n  User u\n");

        ASSERT_EQ(hosts.size(), 2);
        EXPECT_EQ(hosts[0].alias, "a");
        EXPECT_EQ(hosts[1].alias, "b");
        for (auto const& host : hosts)
        {
            EXPECT_THAT(host.hostName, Optional(std::string{"x.example.com"}));
            EXPECT_THAT(host.user, Optional(std::string{"u"}));
            EXPECT_FALSE(host.port.has_value());
        }
    }

    TEST_F(SshConfigParserTests, AllKnownKeysAreMapped)
    {
        const auto hosts = parse(
            "# comment\n"
            "\n"
            "host web\n"
            "    HOSTNAME 10.0.0.1\n"
            "    user deploy\n"
            "    Port 2222\n"
            "    IdentityFile ~/.ssh/id_ed25519\n"
            "    ProxyJump bastion\n"
            "    ForwardAgent yes\n");

        ASSERT_EQ(hosts.size(), 1);
        auto const& host = hosts.front();
        EXPECT_EQ(host.alias, "web");
        EXPECT_THAT(host.hostName, Optional(std::string{"10.0.0.1"}));
        EXPECT_THAT(host.user, Optional(std::string{"deploy"}));
        EXPECT_THAT(host.port, Optional(2222));
        EXPECT_THAT(host.identityFilePath, Optional(std::string{"/home/tester/.ssh/id_ed25519"}));
        EXPECT_THAT(host.proxyJumpAlias, Optional(std::string{"bastion"}));
    }

    TEST_F(SshConfigParserTests, WildcardAliasesAreDropped)
    {
        const auto hosts = parse(
            "Host *\n"
            "  User everyone\n"
            "Host prod-* db\n"
            "  User admin\n");

        ASSERT_EQ(hosts.size(), 1);
        EXPECT_EQ(hosts[0].alias, "db");
        EXPECT_THAT(hosts[0].user, Optional(std::string{"admin"}));
    }

    TEST_F(SshConfigParserTests, InvalidPortsAreIgnored)
    {
        const auto hosts = parse(
            "Host a\n  Port abc\n"
            "Host b\n  Port 0\n"
            "Host c\n  Port 70000\n"
            "Host d\n  Port 22x\n"
            "Host e\n  Port 22\n");

        ASSERT_EQ(hosts.size(), 5);
        for (std::size_t i = 0; i < 4; ++i)
            EXPECT_FALSE(hosts[i].port.has_value()) << hosts[i].alias;
        EXPECT_THAT(hosts[4].port, Optional(22));
    }

    TEST_F(SshConfigParserTests, EqualsSeparatorAndQuotesAreAccepted)
    {
        const auto hosts = parse("Host q\n  HostName=q.example.com\n  IdentityFile \"/keys/my key\"\n");

        ASSERT_EQ(hosts.size(), 1);
        EXPECT_THAT(hosts[0].hostName, Optional(std::string{"q.example.com"}));
        EXPECT_THAT(hosts[0].identityFilePath, Optional(std::string{"/keys/my key"}));
    }

    TEST_F(SshConfigParserTests, PropertiesOutsideOfHostBlocksAreIgnored)
    {
        const auto hosts = parse(
            "User nobody\n"
            "Host a\n"
            "  User someone\n"
            "Match host a\n"
            "  User matched\n");

        ASSERT_EQ(hosts.size(), 1);
        EXPECT_THAT(hosts[0].user, Optional(std::string{"someone"}));
    }

    TEST_F(SshConfigParserTests, EmptyInputYieldsNoHosts)
    {
        EXPECT_THAT(parse(""), IsEmpty());
        EXPECT_THAT(parse("# only a comment\n\n"), IsEmpty());
    }

    TEST_F(SshConfigParserTests, LastBlockIsFlushedWithoutTrailingNewline)
    {
        EXPECT_THAT(
            parse("Host first\nHost last\n  User x"),
            ElementsAre(Field(&SharedData::HostRecord::alias, "first"), Field(&SharedData::HostRecord::alias, "last")));
    }
}
