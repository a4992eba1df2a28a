#include <gtest/gtest.h>
#include <managers/connection_manager.hpp>
#include <managers/file_resolver.hpp>
#include "fakes.hpp"

// ── Command construction ──────────────────────────────────────

TEST(BuildCombinedCommand, Unprivileged) {
    EXPECT_EQ(build_combined_command("/etc/hosts", false),
              "stat -c '%i' /etc/hosts; cat /etc/hosts");
}

TEST(BuildCombinedCommand, PrivilegedPrefixesBothHalves) {
    EXPECT_EQ(build_combined_command("/etc/shadow", true),
              "sudo stat -c '%i' /etc/shadow; sudo cat /etc/shadow");
}

TEST(BuildCombinedCommand, QuotesPathsWithShellCharacters) {
    EXPECT_EQ(build_combined_command("/tmp/my file", false),
              "stat -c '%i' '/tmp/my file'; cat '/tmp/my file'");
}

TEST(BuildCombinedCommand, HomeRelativePathStaysExpandable) {
    EXPECT_EQ(build_combined_command("~/.bashrc", false),
              "stat -c '%i' ~/.bashrc; cat ~/.bashrc");
    EXPECT_EQ(build_combined_command("~deploy/my notes", true),
              "sudo stat -c '%i' ~deploy/'my notes'; sudo cat ~deploy/'my notes'");
}

// ── Output parsing ────────────────────────────────────────────

TEST(ParseResourceOutput, IdentityAndContent) {
    auto result = parse_resource_output("\n1042\nline1\nline2\n", "10.0.0.5", false);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value.id, "10.0.0.5-1042");
    EXPECT_EQ(result.value.content, "line1\nline2");
    EXPECT_TRUE(result.value.sensitive_content.empty());
}

TEST(ParseResourceOutput, SensitiveGoesToSensitiveContent) {
    auto result = parse_resource_output("\n1042\nline1\nline2\n", "10.0.0.5", true);

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value.content.empty());
    EXPECT_EQ(result.value.sensitive_content, "line1\nline2");
    EXPECT_TRUE(result.value.sensitive);
}

TEST(ParseResourceOutput, StripsCarriageReturns) {
    auto result = parse_resource_output("\r\n 77 \r\na\r\nb\r\n", "h", false);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value.id, "h-77");
    EXPECT_EQ(result.value.content, "a\nb");
}

TEST(ParseResourceOutput, EmptyFile) {
    auto result = parse_resource_output("\n1042\n", "10.0.0.5", false);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value.id, "10.0.0.5-1042");
    EXPECT_EQ(result.value.content, "");
}

TEST(ParseResourceOutput, KeepsInnerBlankLines) {
    auto result = parse_resource_output("\n5\na\n\nb\n\n", "h", false);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value.content, "a\n\nb\n");
}

TEST(ParseResourceOutput, TooFewLinesIsMalformed) {
    auto result = parse_resource_output("1042", "h", false);

    ASSERT_TRUE(result.is_err());
    EXPECT_TRUE(result.error.is(ErrorKind::Command));
    EXPECT_NE(result.error.message.find("malformed"), std::string::npos);
}

TEST(ParseResourceOutput, BlankInodeIsMalformed) {
    auto result = parse_resource_output("\n  \ncontent\n", "h", false);
    ASSERT_TRUE(result.is_err());
    EXPECT_TRUE(result.error.is(ErrorKind::Command));
}

// ── Resolve ───────────────────────────────────────────────────

class FileResolverTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeWire> wire = std::make_shared<FakeWire>();
    ConnectionManager manager{std::make_unique<FakeDialer>(wire)};
    RecordingExecutor executor;
    FileResolver resolver{manager, executor};
    Server server = make_server("10.0.0.5");
};

TEST_F(FileResolverTest, OpensConnectionThenRunsCombinedCommand) {
    executor.result.stdout_data = "\n1042\nline1\nline2\n";
    auto result = resolver.resolve("/etc/hosts", false, false, server);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(wire->dials, 1);
    ASSERT_EQ(executor.commands.size(), 1u);
    EXPECT_EQ(executor.commands[0], "stat -c '%i' /etc/hosts; cat /etc/hosts");
    EXPECT_EQ(result.value.id, "10.0.0.5-1042");
    EXPECT_EQ(result.value.content, "line1\nline2");
}

TEST_F(FileResolverTest, IdentityUsesAddressNotName) {
    Server named = make_server("web1", "192.168.1.20");
    executor.result.stdout_data = "\n9\nx\n";
    auto result = resolver.resolve("/x", false, false, named);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value.id, "192.168.1.20-9");
}

TEST_F(FileResolverTest, NonZeroExitIsCommandErrorWithoutState) {
    executor.result.exit_code = 2;
    executor.result.stderr_data = "No such file";
    executor.run_error = Error::command(2, "No such file");
    auto result = resolver.resolve("/nope", false, false, server);

    ASSERT_TRUE(result.is_err());
    EXPECT_TRUE(result.error.is(ErrorKind::Command));
    EXPECT_EQ(result.error.exit_code, 2);
    EXPECT_EQ(result.error.stderr_data, "No such file");
    EXPECT_TRUE(result.value.id.empty());
}

TEST_F(FileResolverTest, RunErrorWithZeroExitPropagatesAsIs) {
    executor.result.stdout_data = "\n1042\npartial";
    executor.run_error = Error::make(ErrorKind::Connection, "connection reset");
    auto result = resolver.resolve("/etc/hosts", false, false, server);

    ASSERT_TRUE(result.is_err());
    EXPECT_TRUE(result.error.is(ErrorKind::Connection));
    EXPECT_EQ(result.error.message, "connection reset");
}

TEST_F(FileResolverTest, DialFailureSkipsExecution) {
    wire->dial_error = Error::make(ErrorKind::Connection, "auth failed");
    auto result = resolver.resolve("/etc/hosts", false, false, server);

    ASSERT_TRUE(result.is_err());
    EXPECT_TRUE(result.error.is(ErrorKind::Connection));
    EXPECT_TRUE(executor.commands.empty());
}

TEST_F(FileResolverTest, ExecutorRefusalPropagates) {
    executor.refuse = Error::make(ErrorKind::Session, "no channel");
    auto result = resolver.resolve("/etc/hosts", false, false, server);

    ASSERT_TRUE(result.is_err());
    EXPECT_TRUE(result.error.is(ErrorKind::Session));
}

TEST_F(FileResolverTest, EndToEndThroughSshExecutorWithSudoEcho) {
    SshCommandExecutor ssh_executor(manager);
    FileResolver real(manager, ssh_executor);
    server.sudo_password = "pw";
    wire->responder = [](const std::string&) {
        return exited(0, "[sudo] password for deploy:\npw\n\n3311\nroot:x:0:0\n");
    };

    auto result = real.resolve("/etc/shadow", true, true, server);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(wire->commands[0], "sudo stat -c '%i' /etc/shadow; sudo cat /etc/shadow");
    EXPECT_EQ(result.value.id, "10.0.0.5-3311");
    EXPECT_TRUE(result.value.content.empty());
    EXPECT_EQ(result.value.sensitive_content, "root:x:0:0");
    EXPECT_TRUE(result.value.privileged);
}
