#include <relay/chat/hub.hpp>
#include <relay/chat/MemoryMessageStore.hpp>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

namespace relay::chat {

namespace net = boost::asio;
using json = nlohmann::json;

struct HubFixture {
    net::io_context io;
    ChatMetrics metrics;
    std::shared_ptr<Hub> hub;

    explicit HubFixture(std::size_t historyLimit = 50)
        : hub(std::make_shared<Hub>(io.get_executor(),
                                    std::make_unique<MemoryMessageStore>(),
                                    historyLimit,
                                    metrics)) {}

    // Run every posted hub event to completion.
    void drain() {
        io.restart();
        io.run();
    }

    std::shared_ptr<Client> join(const std::string &name, std::size_t capacity = 256) {
        auto c = std::make_shared<Client>(make_uuid(), name, capacity);
        hub->register_client(c);
        drain();
        return c;
    }
};

static std::vector<json> take_all(Client &c) {
    std::vector<json> out;
    while (auto f = c.queue().try_pop())
        out.push_back(json::parse(*f));
    return out;
}

static std::vector<json> of_type(const std::vector<json> &frames, const std::string &type) {
    std::vector<json> out;
    for (const auto &f : frames)
        if (f["type"] == type)
            out.push_back(f);
    return out;
}

static ChatMessage stored(int i, const std::string &userId) {
    using namespace std::chrono;
    return ChatMessage{"m" + std::to_string(i), "old-" + userId, userId,
                       "line " + std::to_string(i),
                       TimePoint{milliseconds{1700000000000LL + i}}, false};
}

// Test 1: a joining client gets the last 50 messages, then presence
void test_history_replay_bounded() {
    std::cout << "\n=== Test 1: History Replay Is Bounded ===" << std::endl;
    HubFixture fx;
    for (int i = 0; i < 60; ++i)
        fx.hub->add_message(stored(i, "ghost"));

    auto alice = fx.join("alice");
    auto frames = take_all(*alice);

    assert(frames.size() == 51);
    for (int k = 0; k < 50; ++k) {
        assert(frames[k]["type"] == "message");
        assert(frames[k]["id"] == "m" + std::to_string(k + 10));
    }
    assert(frames[50]["type"] == "userList");
    assert(frames[50]["count"] == 1);
    assert(frames[50]["users"][0]["username"] == "alice");
    std::cout << "✓ Test 1 PASSED" << std::endl;
}

// Test 2: short history is replayed whole
void test_history_replay_short() {
    std::cout << "\n=== Test 2: Short History Replay ===" << std::endl;
    HubFixture fx;
    for (int i = 0; i < 3; ++i)
        fx.hub->add_message(stored(i, "ghost"));

    auto bob = fx.join("bob");
    auto msgs = of_type(take_all(*bob), "message");
    assert(msgs.size() == 3);
    assert(msgs[0]["id"] == "m0" && msgs[2]["id"] == "m2");

    HubFixture limited(2);
    for (int i = 0; i < 5; ++i)
        limited.hub->add_message(stored(i, "ghost"));
    auto carol = limited.join("carol");
    auto few = of_type(take_all(*carol), "message");
    assert(few.size() == 2);
    assert(few[0]["id"] == "m3" && few[1]["id"] == "m4");
    std::cout << "✓ Test 2 PASSED" << std::endl;
}

// Test 3: presence is announced to everyone on join and leave
void test_presence_on_join_and_leave() {
    std::cout << "\n=== Test 3: Presence On Join/Leave ===" << std::endl;
    HubFixture fx;
    auto alice = fx.join("alice");
    auto bob = fx.join("bob");

    auto aliceFrames = of_type(take_all(*alice), "userList");
    assert(aliceFrames.size() == 2);
    assert(aliceFrames[1]["count"] == 2);
    assert(aliceFrames[1]["users"][0]["id"] == alice->id());
    assert(aliceFrames[1]["users"][1]["id"] == bob->id());
    take_all(*bob);

    assert(fx.hub->member_count() == 2);
    assert(fx.metrics.connections_active == 2);

    fx.hub->unregister_client(alice);
    fx.drain();

    assert(alice->queue().is_closed());
    auto bobFrames = take_all(*bob);
    assert(bobFrames.size() == 1);
    assert(bobFrames[0]["type"] == "userList");
    assert(bobFrames[0]["count"] == 1);
    assert(bobFrames[0]["users"][0]["username"] == "bob");
    assert(fx.metrics.connections_active == 1);
    std::cout << "✓ Test 3 PASSED" << std::endl;
}

// Test 4: a second unregister is a no-op
void test_unregister_idempotent() {
    std::cout << "\n=== Test 4: Unregister Is Idempotent ===" << std::endl;
    HubFixture fx;
    auto alice = fx.join("alice");
    auto bob = fx.join("bob");
    take_all(*bob);

    fx.hub->unregister_client(alice);
    fx.hub->unregister_client(alice);
    fx.drain();

    auto frames = take_all(*bob);
    assert(frames.size() == 1 && "only one presence update for one departure");
    assert(fx.hub->member_count() == 1);

    // Never-registered client.
    auto stranger = std::make_shared<Client>(make_uuid(), "stranger", 8);
    fx.hub->unregister_client(stranger);
    fx.drain();
    assert(take_all(*bob).empty());
    std::cout << "✓ Test 4 PASSED" << std::endl;
}

// Test 5: a message reaches every member, including the sender
void test_message_fan_out() {
    std::cout << "\n=== Test 5: Message Fan-Out ===" << std::endl;
    HubFixture fx;
    auto alice = fx.join("alice");
    auto bob = fx.join("bob");
    take_all(*alice);
    take_all(*bob);

    fx.hub->dispatch(alice, SendMessage{"hello"});
    fx.hub->dispatch(alice, SendMessage{"world"});
    fx.drain();

    for (auto *c : {alice.get(), bob.get()}) {
        auto msgs = take_all(*c);
        assert(msgs.size() == 2);
        assert(msgs[0]["content"] == "hello");
        assert(msgs[1]["content"] == "world");
        assert(msgs[0]["username"] == "alice");
        assert(msgs[0]["userId"] == alice->id());
        assert(msgs[0]["edited"] == false);
        assert(msgs[0]["id"] != msgs[1]["id"]);
    }

    assert(fx.hub->store().size() == 2);
    assert(fx.hub->store().recent(1).front().content == "world");
    std::cout << "✓ Test 5 PASSED" << std::endl;
}

// Test 6: a saturated client is evicted without delaying the others
void test_slow_client_eviction() {
    std::cout << "\n=== Test 6: Slow Client Eviction ===" << std::endl;
    HubFixture fx;
    auto slow = fx.join("slow", 2); // holds its own presence frame
    auto fast = fx.join("fast");    // slow now holds two frames: full
    take_all(*fast);

    fx.hub->dispatch(fast, SendMessage{"ping"});
    fx.drain();

    assert(slow->queue().is_closed());
    assert(fx.hub->member_count() == 1);
    assert(fx.metrics.evictions_total == 1);

    auto frames = take_all(*fast);
    assert(frames.size() == 2);
    assert(frames[0]["type"] == "message");
    assert(frames[1]["type"] == "userList");
    assert(frames[1]["count"] == 1);

    // Frames buffered before eviction remain for the writer to flush.
    assert(slow->queue().size() == 2);

    // A late unregister from the slow client's session changes nothing.
    fx.hub->unregister_client(slow);
    fx.drain();
    assert(take_all(*fast).empty());
    std::cout << "✓ Test 6 PASSED" << std::endl;
}

// Test 7: only the author may edit
void test_edit_authorization() {
    std::cout << "\n=== Test 7: Edit Authorization ===" << std::endl;
    HubFixture fx;
    auto alice = fx.join("alice");
    auto bob = fx.join("bob");

    fx.hub->dispatch(alice, SendMessage{"original"});
    fx.drain();
    const std::string id = fx.hub->store().recent(1).front().id;
    take_all(*alice);
    take_all(*bob);

    fx.hub->dispatch(bob, EditMessage{id, "hacked"});
    fx.drain();
    assert(take_all(*alice).empty());
    assert(take_all(*bob).empty());
    assert(fx.hub->store().find(id)->content == "original");
    assert(!fx.hub->store().find(id)->edited);

    fx.hub->dispatch(alice, EditMessage{id, "revised"});
    fx.drain();
    for (auto *c : {alice.get(), bob.get()}) {
        auto frames = take_all(*c);
        assert(frames.size() == 1);
        assert(frames[0]["type"] == "messageEdited");
        assert(frames[0]["messageId"] == id);
        assert(frames[0]["content"] == "revised");
    }
    auto msg = fx.hub->store().find(id);
    assert(msg->content == "revised" && msg->edited);

    // Unknown id: silence.
    fx.hub->dispatch(alice, EditMessage{"no-such-id", "x"});
    fx.drain();
    assert(take_all(*alice).empty());
    std::cout << "✓ Test 7 PASSED" << std::endl;
}

// Test 8: only the author may delete
void test_delete_authorization() {
    std::cout << "\n=== Test 8: Delete Authorization ===" << std::endl;
    HubFixture fx;
    auto alice = fx.join("alice");
    auto bob = fx.join("bob");

    fx.hub->dispatch(alice, SendMessage{"keep me?"});
    fx.drain();
    const std::string id = fx.hub->store().recent(1).front().id;
    take_all(*alice);
    take_all(*bob);

    fx.hub->dispatch(bob, DeleteMessage{id});
    fx.drain();
    assert(take_all(*bob).empty());
    assert(fx.hub->store().find(id));

    fx.hub->dispatch(alice, DeleteMessage{id});
    fx.drain();
    auto frames = take_all(*bob);
    assert(frames.size() == 1);
    assert(frames[0]["type"] == "messageDeleted");
    assert(frames[0]["messageId"] == id);
    assert(!fx.hub->store().find(id));
    assert(fx.hub->store().size() == 0);

    // Deleted messages are not replayed.
    auto carol = fx.join("carol");
    assert(of_type(take_all(*carol), "message").empty());
    std::cout << "✓ Test 8 PASSED" << std::endl;
}

// Test 9: typing flips the presence flag for everyone
void test_typing_presence() {
    std::cout << "\n=== Test 9: Typing Presence ===" << std::endl;
    HubFixture fx;
    auto alice = fx.join("alice");
    auto bob = fx.join("bob");
    take_all(*alice);
    take_all(*bob);

    fx.hub->dispatch(alice, SetTyping{true});
    fx.drain();
    auto frames = take_all(*bob);
    assert(frames.size() == 1);
    assert(frames[0]["type"] == "userList");
    assert(frames[0]["users"][0]["isTyping"] == true);
    assert(frames[0]["users"][1]["isTyping"] == false);
    assert(alice->is_typing());

    fx.hub->dispatch(alice, SetTyping{false});
    fx.drain();
    frames = take_all(*alice);
    assert(frames.size() == 1);
    assert(frames[0]["users"][0]["isTyping"] == false);
    std::cout << "✓ Test 9 PASSED" << std::endl;
}

// Test 10: commands from non-members are dropped
void test_dispatch_from_non_member() {
    std::cout << "\n=== Test 10: Non-Member Commands Dropped ===" << std::endl;
    HubFixture fx;
    auto alice = fx.join("alice");
    take_all(*alice);

    auto ghost = std::make_shared<Client>(make_uuid(), "ghost", 8);
    fx.hub->dispatch(ghost, SendMessage{"boo"});
    fx.drain();

    assert(fx.hub->store().size() == 0);
    assert(take_all(*alice).empty());
    assert(take_all(*ghost).empty());
    std::cout << "✓ Test 10 PASSED" << std::endl;
}

// Test 11: last-seen moves forward on activity
void test_last_seen_refresh() {
    std::cout << "\n=== Test 11: Last Seen Refresh ===" << std::endl;
    HubFixture fx;
    auto alice = fx.join("alice");
    alice->touch(TimePoint{});
    take_all(*alice);

    fx.hub->dispatch(alice, SetTyping{true});
    fx.drain();
    assert(alice->last_seen() > TimePoint{});

    auto frames = take_all(*alice);
    assert(frames[0]["users"][0]["lastSeen"] != "1970-01-01T00:00:00.000Z");
    std::cout << "✓ Test 11 PASSED" << std::endl;
}

// Test 12: raw broadcast reaches every member in order, without storing
void test_raw_broadcast() {
    std::cout << "\n=== Test 12: Raw Broadcast ===" << std::endl;
    HubFixture fx;
    auto alice = fx.join("alice");
    auto bob = fx.join("bob");
    take_all(*alice);
    take_all(*bob);

    fx.hub->broadcast(R"({"type":"notice","seq":1})");
    fx.hub->broadcast(R"({"type":"notice","seq":2})");
    fx.drain();

    for (auto *c : {alice.get(), bob.get()}) {
        auto frames = take_all(*c);
        assert(frames.size() == 2);
        assert(frames[0]["seq"] == 1);
        assert(frames[1]["seq"] == 2);
    }
    assert(fx.hub->store().size() == 0);

    // Nobody to deliver to: nothing happens.
    HubFixture empty;
    empty.hub->broadcast("{}");
    empty.drain();
    assert(empty.hub->member_count() == 0);
    std::cout << "✓ Test 12 PASSED" << std::endl;
}

// Test 13: a display name with invalid UTF-8 does not stall the hub
void test_invalid_utf8_name() {
    std::cout << "\n=== Test 13: Invalid UTF-8 Display Name ===" << std::endl;
    HubFixture fx;
    auto mallory = fx.join("\xFF");
    auto alice = fx.join("alice");

    auto frames = take_all(*alice);
    assert(frames.size() == 1);
    assert(frames[0]["count"] == 2);
    assert(frames[0]["users"][0]["username"] == "\xEF\xBF\xBD");
    assert(frames[0]["users"][1]["username"] == "alice");

    fx.hub->dispatch(mallory, SendMessage{"hi"});
    fx.drain();
    auto msgs = of_type(take_all(*alice), "message");
    assert(msgs.size() == 1);
    assert(msgs[0]["username"] == "\xEF\xBF\xBD");

    // Replay to a later joiner serializes the stored name too.
    auto bob = fx.join("bob");
    auto replay = of_type(take_all(*bob), "message");
    assert(replay.size() == 1);
    assert(replay[0]["content"] == "hi");
    assert(fx.hub->member_count() == 3);
    std::cout << "✓ Test 13 PASSED" << std::endl;
}

// Test 14: member count can be read while the hub runs on its own thread
void test_member_count_from_other_thread() {
    std::cout << "\n=== Test 14: Member Count From Another Thread ===" << std::endl;
    HubFixture fx;
    auto work = net::make_work_guard(fx.io);
    std::thread hubThread([&] { fx.io.run(); });

    std::vector<std::shared_ptr<Client>> clients;
    for (int i = 0; i < 8; ++i) {
        clients.push_back(std::make_shared<Client>(make_uuid(), "user" + std::to_string(i), 256));
        fx.hub->register_client(clients.back());
    }

    const auto until = std::chrono::steady_clock::now() + std::chrono::seconds{5};
    while (fx.hub->member_count() != 8 && std::chrono::steady_clock::now() < until)
        std::this_thread::yield();
    assert(fx.hub->member_count() == 8);

    for (auto &c : clients)
        fx.hub->unregister_client(c);
    while (fx.hub->member_count() != 0 && std::chrono::steady_clock::now() < until)
        std::this_thread::yield();
    assert(fx.hub->member_count() == 0);
    assert(fx.metrics.connections_active.load() == 0);

    work.reset();
    hubThread.join();
    for (auto &c : clients)
        assert(c->queue().is_closed());
    std::cout << "✓ Test 14 PASSED" << std::endl;
}

}  // namespace relay::chat

int main() {
    std::cout << "╔════════════════════════════════════════════════════════════╗\n"
              << "║        Hub Test Suite                                      ║\n"
              << "╚════════════════════════════════════════════════════════════╝" << std::endl;

    try {
        relay::chat::test_history_replay_bounded();
        relay::chat::test_history_replay_short();
        relay::chat::test_presence_on_join_and_leave();
        relay::chat::test_unregister_idempotent();
        relay::chat::test_message_fan_out();
        relay::chat::test_slow_client_eviction();
        relay::chat::test_edit_authorization();
        relay::chat::test_delete_authorization();
        relay::chat::test_typing_presence();
        relay::chat::test_dispatch_from_non_member();
        relay::chat::test_last_seen_refresh();
        relay::chat::test_raw_broadcast();
        relay::chat::test_invalid_utf8_name();
        relay::chat::test_member_count_from_other_thread();

        std::cout << "\n✓ All hub tests PASSED" << std::endl;
        return 0;
    } catch (const std::exception &e) {
        std::cerr << "\n✗ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
