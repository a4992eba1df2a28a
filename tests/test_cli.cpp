#include <gtest/gtest.h>
#include <cli/rexec_cli.hpp>
#include <sstream>
#include "fakes.hpp"

class RexecCLITest : public ::testing::Test {
protected:
    std::shared_ptr<FakeWire> wire = std::make_shared<FakeWire>();
    std::ostringstream out;
    std::ostringstream err;

    Config config() {
        auto parsed = Config::parse(
            "servers:\n"
            "  - {name: web1, address: 10.0.0.5, user: deploy, password: pw}\n"
            "  - {name: web2, address: 10.0.0.6, user: deploy, password: pw}\n"
            "resources:\n"
            "  - {name: hosts, server: web1, path: /etc/hosts}\n"
            "  - {name: secret, server: web1, path: /etc/secret, sensitive: true}\n");
        EXPECT_TRUE(parsed.is_ok()) << parsed.error.message;
        return parsed.value;
    }

    std::unique_ptr<RexecCLI> make_cli() {
        return std::make_unique<RexecCLI>(config(), std::make_unique<FakeDialer>(wire), out, err);
    }
};

TEST_F(RexecCLITest, ReadPrintsIdentityAndContent) {
    wire->responder = [](const std::string&) { return exited(0, "\n1042\n127.0.0.1 localhost\n"); };
    auto cli = make_cli();

    EXPECT_EQ(cli->execute_command("read", {"hosts"}), 0);
    EXPECT_NE(out.str().find("10.0.0.5-1042"), std::string::npos);
    EXPECT_NE(out.str().find("127.0.0.1 localhost"), std::string::npos);
}

TEST_F(RexecCLITest, ReadSensitiveHidesContent) {
    wire->responder = [](const std::string&) { return exited(0, "\n9\ntop-secret\n"); };
    auto cli = make_cli();

    EXPECT_EQ(cli->execute_command("read", {"secret"}), 0);
    EXPECT_EQ(out.str().find("top-secret"), std::string::npos);
    EXPECT_NE(out.str().find("(sensitive)"), std::string::npos);
}

TEST_F(RexecCLITest, ReadUnknownResourceFails) {
    auto cli = make_cli();
    EXPECT_EQ(cli->execute_command("read", {"nope"}), 1);
    EXPECT_NE(err.str().find("Unknown resource"), std::string::npos);
    EXPECT_EQ(wire->dials, 0);
}

TEST_F(RexecCLITest, ExecJoinsWordsAndReportsExit) {
    wire->responder = [](const std::string&) { return exited(3, "out\n", "bad\n"); };
    auto cli = make_cli();

    EXPECT_EQ(cli->execute_command("exec", {"web1", "ls", "-l", "/tmp"}), 1);
    ASSERT_EQ(wire->commands.size(), 1u);
    EXPECT_EQ(wire->commands[0], "ls -l /tmp");
    EXPECT_NE(out.str().find("out"), std::string::npos);
    EXPECT_NE(err.str().find("bad"), std::string::npos);
    EXPECT_NE(err.str().find("exit 3"), std::string::npos);
}

TEST_F(RexecCLITest, ExecConnectionFailureIsReported) {
    wire->dial_error = Error::make(ErrorKind::Connection, "connection refused");
    auto cli = make_cli();

    EXPECT_EQ(cli->execute_command("exec", {"web1", "true"}), 1);
    EXPECT_NE(err.str().find("unable to connect/execute: connection refused"), std::string::npos);
}

TEST_F(RexecCLITest, ConnectOpensEveryServer) {
    auto cli = make_cli();

    EXPECT_EQ(cli->execute_command("connect", {}), 0);
    EXPECT_EQ(wire->dials, 2);
    EXPECT_EQ(cli->connections().size(), 2u);
    EXPECT_NE(out.str().find("deploy@10.0.0.6:22"), std::string::npos);
}

TEST_F(RexecCLITest, UsageErrors) {
    auto cli = make_cli();
    EXPECT_EQ(cli->execute_command("exec", {"web1"}), 1);
    EXPECT_EQ(cli->execute_command("read", {}), 1);
    EXPECT_EQ(cli->execute_command("frobnicate", {}), 1);
    EXPECT_FALSE(cli->has_command("frobnicate"));
}

TEST_F(RexecCLITest, DestructorClosesConnections) {
    {
        auto cli = make_cli();
        ASSERT_EQ(cli->execute_command("connect", {}), 0);
    }
    EXPECT_EQ(wire->transports_closed, 2);
}
