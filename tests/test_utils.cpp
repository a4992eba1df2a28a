#include <gtest/gtest.h>
#include <core/types.hpp>
#include <core/utils.hpp>
#include <core/server.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <netinet/in.h>
#include <sys/socket.h>
#include <filesystem>
#include <fstream>

TEST(SplitLines, TrailingNewlineYieldsEmptyLast) {
    EXPECT_EQ(split_lines("a\n"), (std::vector<std::string>{"a", ""}));
    EXPECT_EQ(split_lines(""), (std::vector<std::string>{""}));
    EXPECT_EQ(split_lines("a\nb"), (std::vector<std::string>{"a", "b"}));
}

TEST(SplitLines, JoinInverts) {
    std::string text = "\nx\n\ny\n";
    EXPECT_EQ(join_lines(split_lines(text)), text);
}

TEST(ShellQuote, PlainWordsUntouched) {
    EXPECT_EQ(shell_quote("/etc/hosts"), "/etc/hosts");
    EXPECT_EQ(shell_quote("a-b_c.d"), "a-b_c.d");
}

TEST(ShellQuote, SpecialCharactersQuoted) {
    EXPECT_EQ(shell_quote("a b"), "'a b'");
    EXPECT_EQ(shell_quote("x;rm -rf /"), "'x;rm -rf /'");
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
    EXPECT_EQ(shell_quote(""), "''");
}

TEST(ShellQuotePath, TildePrefixLeftUnquoted) {
    EXPECT_EQ(shell_quote_path("~"), "~");
    EXPECT_EQ(shell_quote_path("~/"), "~/");
    EXPECT_EQ(shell_quote_path("~/a b"), "~/'a b'");
    EXPECT_EQ(shell_quote_path("~root/.ssh/config"), "~root/.ssh/config");
    EXPECT_EQ(shell_quote_path("~$(id)/x"), "'~$(id)/x'");
    EXPECT_EQ(shell_quote_path("/tmp/~x y"), "'/tmp/~x y'");
}

TEST(Base64, KnownVector) {
    EXPECT_EQ(base64_encode("hello"), "aGVsbG8=");
    EXPECT_EQ(base64_decode("aGVsbG8="), "hello");
}

TEST(ExpandUserPath, Tilde) {
    EXPECT_EQ(expand_user_path("~/.ssh/id"), (platform::home_dir() / ".ssh/id").string());
    EXPECT_EQ(expand_user_path("/abs"), "/abs");
}

TEST(ErrorDescribe, Shapes) {
    EXPECT_EQ(Error::command(2, "No such file").describe(),
              "command failed with exit 2: No such file");
    EXPECT_EQ(Error::make(ErrorKind::Connection, "refused").describe(),
              "unable to connect/execute: refused");
    EXPECT_EQ(Error::make(ErrorKind::NotFound, "no connection found for server x").describe(),
              "no connection found for server x");
}

TEST(ServerAddress, BracketsIpv6) {
    Server s;
    s.address = "10.0.0.5";
    EXPECT_EQ(s.full_address(), "10.0.0.5:22");
    s.address = "::1";
    s.port = 2222;
    EXPECT_EQ(s.full_address(), "[::1]:2222");
}

TEST(ReadFile, MissingAndPresent) {
    auto dir = std::filesystem::temp_directory_path() / "rexec_read_file_test";
    std::filesystem::create_directories(dir);
    std::ofstream(dir / "f") << "data";

    auto ok = platform::read_file(dir / "f");
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value, "data");

    auto missing = platform::read_file(dir / "nope");
    ASSERT_TRUE(missing.is_err());
    EXPECT_TRUE(missing.error.is(ErrorKind::FileNotFound));

    std::filesystem::remove_all(dir);
}

TEST(RemainingMs, NeverNegative) {
    auto now = std::chrono::steady_clock::now();
    EXPECT_EQ(platform::remaining_ms(now - std::chrono::seconds(5)), 0);
    int left = platform::remaining_ms(now + std::chrono::seconds(5));
    EXPECT_GT(left, 4000);
    EXPECT_LE(left, 5000);
}

TEST(ConnectTcp, SpentBudgetTimesOutBeforeAnyAddress) {
    auto result = platform::connect_tcp("127.0.0.1", 22, 0);
    ASSERT_TRUE(result.is_err());
    EXPECT_TRUE(result.error.is(ErrorKind::Connection));
    EXPECT_NE(result.error.message.find("timed out"), std::string::npos);
}

TEST(ConnectTcp, ConnectsToLoopbackListener) {
    int listener = socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(listener, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ASSERT_EQ(bind(listener, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
    ASSERT_EQ(listen(listener, 1), 0);
    socklen_t len = sizeof(addr);
    ASSERT_EQ(getsockname(listener, reinterpret_cast<sockaddr*>(&addr), &len), 0);

    auto result = platform::connect_tcp("127.0.0.1", ntohs(addr.sin_port), 2000);
    ASSERT_TRUE(result.is_ok()) << result.error.message;
    platform::close_socket(result.value);
    platform::close_socket(listener);
}
