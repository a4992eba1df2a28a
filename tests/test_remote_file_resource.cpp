#include <gtest/gtest.h>
#include <managers/connection_manager.hpp>
#include <managers/file_resolver.hpp>
#include <managers/remote_file_resource.hpp>
#include <thread>
#include "fakes.hpp"

class RemoteFileResourceTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeWire> wire = std::make_shared<FakeWire>();
    ConnectionManager manager{std::make_unique<FakeDialer>(wire)};
    SshCommandExecutor executor{manager};
    FileResolver resolver{manager, executor};
    RemoteFileResource resource{resolver};

    ResourceSpec spec() const {
        ResourceSpec s;
        s.host = "10.0.0.5";
        s.user = "deploy";
        s.password = std::string("pw");
        s.path = "/etc/hosts";
        return s;
    }
};

TEST_F(RemoteFileResourceTest, ServerBuiltFromSpec) {
    ResourceSpec s = spec();
    s.private_key = std::string("/k");
    Server server = RemoteFileResource::server_for(s);

    EXPECT_EQ(server.name, "10.0.0.5");
    EXPECT_EQ(server.address, "10.0.0.5");
    EXPECT_EQ(server.port, 22);
    EXPECT_EQ(server.user, "deploy");
    EXPECT_EQ(*server.private_key_path, "/k");
}

TEST_F(RemoteFileResourceTest, CreateResolvesState) {
    wire->responder = [](const std::string&) { return exited(0, "\n1042\nline1\nline2\n"); };
    auto outcome = resource.create(spec());

    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.state->id, "10.0.0.5-1042");
    EXPECT_EQ(outcome.state->content, "line1\nline2");
}

TEST_F(RemoteFileResourceTest, ReadReusesConnection) {
    wire->responder = [](const std::string&) { return exited(0, "\n1\nx\n"); };
    ASSERT_TRUE(resource.create(spec()).ok());
    ASSERT_TRUE(resource.read(spec()).ok());

    EXPECT_EQ(wire->dials, 1);
    EXPECT_EQ(wire->sessions_opened, 2);
}

TEST_F(RemoteFileResourceTest, NonZeroExitIsCommandErrorDiagnostic) {
    wire->responder = [](const std::string&) { return exited(2, "", "No such file"); };
    auto outcome = resource.read(spec());

    EXPECT_FALSE(outcome.state.has_value());
    ASSERT_TRUE(outcome.diagnostic.has_value());
    EXPECT_EQ(outcome.diagnostic->summary, "Command Error");
    EXPECT_NE(outcome.diagnostic->detail.find("command failed with exit 2: No such file"),
              std::string::npos);
}

TEST_F(RemoteFileResourceTest, DialFailureIsSshErrorDiagnostic) {
    wire->dial_error = Error::make(ErrorKind::Connection, "authentication failed");
    auto outcome = resource.create(spec());

    ASSERT_TRUE(outcome.diagnostic.has_value());
    EXPECT_EQ(outcome.diagnostic->summary, "SSH Error");
    EXPECT_NE(outcome.diagnostic->detail.find("authentication failed"), std::string::npos);
}

TEST_F(RemoteFileResourceTest, UpdateMovesBodyWhenSensitivityChanges) {
    ResourceState prior;
    prior.id = "10.0.0.5-1";
    prior.content = "body";

    ResourceSpec s = spec();
    s.sensitive = true;
    auto outcome = resource.update(s, prior);

    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.state->id, "10.0.0.5-1");
    EXPECT_TRUE(outcome.state->content.empty());
    EXPECT_EQ(outcome.state->sensitive_content, "body");
    EXPECT_EQ(wire->dials, 0);
}

TEST_F(RemoteFileResourceTest, RemoveTouchesNothingRemote) {
    resource.remove(spec());
    EXPECT_EQ(wire->dials, 0);
    EXPECT_TRUE(wire->commands.empty());
}

TEST_F(RemoteFileResourceTest, ImportKeepsId) {
    ResourceState state = resource.import_state("10.0.0.5-77");
    EXPECT_EQ(state.id, "10.0.0.5-77");
    EXPECT_TRUE(state.content.empty());
    EXPECT_TRUE(state.sensitive_content.empty());
}

TEST_F(RemoteFileResourceTest, ConcurrentReadsOnOneHostRunOneAtATime) {
    InFlightCounter counter;
    wire->responder = counter.responder(std::chrono::milliseconds(100));

    std::thread first([this] { EXPECT_TRUE(resource.read(spec()).ok()); });
    std::thread second([this] { EXPECT_TRUE(resource.read(spec()).ok()); });
    first.join();
    second.join();

    EXPECT_EQ(counter.peak, 1);
    EXPECT_EQ(wire->dials, 1);
    EXPECT_EQ(wire->sessions_opened, 2);
}
