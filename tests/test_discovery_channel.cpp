#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "fake_node.h"
#include "network/discovery_channel.h"

using namespace pyremote;
using namespace pyremote::testing;
using namespace std::chrono_literals;

namespace {

RemoteExecutionConfig config_for(const Endpoint& group, const std::string& target = {}) {
    return RemoteExecutionConfig(RemoteExecutionConfig::kDefaultBufferSize, group, "0.0.0.0", 0, target);
}

Message reply(MessageType type, const std::string& source, const std::string& project) {
    Message message;
    message.type = type;
    message.source = source;
    message.data = {{"project_name", project}, {"engine_version", "5.3"}};
    return message;
}

} // namespace

// ── Reply filtering ─────────────────────────────────────────────────────────

TEST(AcceptsPong, AnyProjectWithoutTarget) {
    const RemoteExecutionConfig config;

    EXPECT_TRUE(accepts_pong(reply(MessageType::Pong, "node", "Foo"), config));
    EXPECT_TRUE(accepts_pong(reply(MessageType::Pong, "node", "Bar"), config));
}

TEST(AcceptsPong, TargetMustMatchExactly) {
    const auto config = RemoteExecutionConfig().with_target_name("Foo");

    EXPECT_TRUE(accepts_pong(reply(MessageType::Pong, "node", "Foo"), config));
    EXPECT_FALSE(accepts_pong(reply(MessageType::Pong, "node", "Bar"), config));
    EXPECT_FALSE(accepts_pong(reply(MessageType::Pong, "node", "foo"), config));
    EXPECT_FALSE(accepts_pong(reply(MessageType::Pong, "node", "FooBar"), config));
}

TEST(AcceptsPong, PingTypedReplyWithProjectName) {
    const RemoteExecutionConfig config;

    EXPECT_TRUE(accepts_pong(reply(MessageType::Ping, "node", "Foo"), config));
    // Another controller's ping is not an answer.
    EXPECT_FALSE(accepts_pong(make_ping("other-controller"), config));
}

TEST(AcceptsPong, IgnoresOwnMessagesAndOtherTypes) {
    const RemoteExecutionConfig config;

    EXPECT_FALSE(accepts_pong(reply(MessageType::Pong, config.local_id(), "Foo"), config));
    EXPECT_FALSE(accepts_pong(make_close_connection("node", config.local_id()), config));
}

TEST(PeerDescriptor, FromReply) {
    auto message = reply(MessageType::Pong, "node-1", "Foo");
    message.data["command_ip"] = "127.0.0.1";
    message.data["command_port"] = 9000;
    message.data["machine"] = "build-01";

    const auto peer = PeerDescriptor::from_message(message);

    EXPECT_EQ(peer.node_id, "node-1");
    EXPECT_EQ(peer.project_name, "Foo");
    EXPECT_EQ(peer.engine_version, "5.3");
    EXPECT_EQ(peer.command_ip, "127.0.0.1");
    EXPECT_EQ(peer.command_port, 9000);
    EXPECT_EQ(peer.metadata.at("machine"), "build-01");
}

TEST(PeerDescriptor, ToleratesMissingFields) {
    Message message;
    message.type = MessageType::Pong;
    message.source = "node";
    message.data = {{"project_name", "Foo"}, {"command_port", "not a number"}};

    const auto peer = PeerDescriptor::from_message(message);

    EXPECT_EQ(peer.engine_version, "");
    EXPECT_EQ(peer.command_port, 0);
}

// ── Multicast ───────────────────────────────────────────────────────────────

class DiscoveryChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!multicast_available(test_group(0)))
            GTEST_SKIP() << "multicast loopback is not available on this host";
    }
};

TEST_F(DiscoveryChannelTest, FindsTargetProject) {
    const auto group = test_group(1);
    FakeEditor editor(group, FakeEditor::Options{});
    editor.start();

    DiscoveryChannel channel(config_for(group, "Foo"));
    channel.send_ping();
    const auto peer = channel.receive_pong(1s);

    ASSERT_TRUE(peer.has_value());
    EXPECT_EQ(peer->node_id, editor.node_id());
    EXPECT_EQ(peer->project_name, "Foo");
    EXPECT_EQ(peer->engine_version, "5.3");
    EXPECT_EQ(peer->command_port, 9000);
}

TEST_F(DiscoveryChannelTest, OtherProjectTimesOut) {
    const auto group = test_group(2);
    FakeEditor editor(group, FakeEditor::Options{});
    editor.start();

    DiscoveryChannel channel(config_for(group, "Bar"));
    channel.send_ping();

    const auto start = Clock::now();
    EXPECT_FALSE(channel.receive_pong(300ms).has_value());
    EXPECT_LT(Clock::now() - start, 2s);
}

TEST_F(DiscoveryChannelTest, PicksMatchingEditorAmongSeveral) {
    const auto group = test_group(3);
    FakeEditor::Options foo;
    FakeEditor::Options bar;
    bar.project_name = "Bar";
    FakeEditor foo_editor(group, foo);
    FakeEditor bar_editor(group, bar);
    foo_editor.start();
    bar_editor.start();

    DiscoveryChannel channel(config_for(group, "Bar"));
    channel.send_ping();
    const auto peer = channel.receive_pong(1s);

    ASSERT_TRUE(peer.has_value());
    EXPECT_EQ(peer->node_id, bar_editor.node_id());
    EXPECT_EQ(peer->project_name, "Bar");
}

TEST_F(DiscoveryChannelTest, AcceptsPingTypedReply) {
    const auto group = test_group(4);
    FakeEditor::Options options;
    options.reply_type = MessageType::Ping;
    FakeEditor editor(group, options);
    editor.start();

    DiscoveryChannel channel(config_for(group));
    channel.send_ping();
    const auto peer = channel.receive_pong(1s);

    ASSERT_TRUE(peer.has_value());
    EXPECT_EQ(peer->node_id, editor.node_id());
}

TEST_F(DiscoveryChannelTest, CloseConnectionOnlyAfterOpen) {
    const auto group = test_group(5);
    FakeEditor::Options options;
    options.connect_back = false;
    FakeEditor editor(group, options);
    editor.start();

    DiscoveryChannel channel(config_for(group));
    channel.send_close_connection(editor.node_id());
    EXPECT_FALSE(editor.wait_for_close(200ms));
    EXPECT_FALSE(channel.connection_opened());

    channel.send_open_connection(editor.node_id());
    EXPECT_TRUE(channel.connection_opened());
    channel.send_close_connection(editor.node_id());

    EXPECT_TRUE(editor.wait_for_close(1s));
    EXPECT_TRUE(editor.open_received());
    EXPECT_FALSE(channel.connection_opened());
}
