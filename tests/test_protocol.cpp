#include <relay/chat/protocol.hpp>

#include <cassert>
#include <chrono>
#include <iostream>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace relay::chat {

// 2025-12-07T10:15:30.123Z
static TimePoint sample_time() {
    using namespace std::chrono;
    return TimePoint{milliseconds{1765102530123LL}};
}

// Test 1: each known command decodes to its variant
void test_parse_known_commands() {
    std::cout << "\n=== Test 1: Parse Known Commands ===" << std::endl;
    std::string error;

    auto send = parse_command(R"({"type":"message","content":"hi"})", error);
    assert(send && std::holds_alternative<SendMessage>(*send));
    assert(std::get<SendMessage>(*send).content == "hi");

    auto typing = parse_command(R"({"type":"typing","isTyping":true})", error);
    assert(typing && std::holds_alternative<SetTyping>(*typing));
    assert(std::get<SetTyping>(*typing).isTyping);

    auto edit = parse_command(R"({"type":"edit","messageId":"m1","content":"bye"})", error);
    assert(edit && std::holds_alternative<EditMessage>(*edit));
    assert(std::get<EditMessage>(*edit).messageId == "m1");
    assert(std::get<EditMessage>(*edit).content == "bye");

    auto del = parse_command(R"({"type":"delete","messageId":"m2"})", error);
    assert(del && std::holds_alternative<DeleteMessage>(*del));
    assert(std::get<DeleteMessage>(*del).messageId == "m2");

    assert(std::string(command_name(*send)) == "message");
    assert(std::string(command_name(*typing)) == "typing");
    assert(std::string(command_name(*edit)) == "edit");
    assert(std::string(command_name(*del)) == "delete");

    std::cout << "✓ Test 1 PASSED" << std::endl;
}

// Test 2: malformed frames are rejected with a reason
void test_parse_rejects_malformed() {
    std::cout << "\n=== Test 2: Reject Malformed Frames ===" << std::endl;

    const std::vector<std::string> bad = {
        "not json",
        "[1,2,3]",
        R"("message")",
        R"({"content":"no type"})",
        R"({"type":42})",
        R"({"type":"shout","content":"x"})",
        R"({"type":"message"})",
        R"({"type":"message","content":""})",
        R"({"type":"message","content":7})",
        R"({"type":"typing"})",
        R"({"type":"typing","isTyping":"yes"})",
        R"({"type":"edit","content":"x"})",
        R"({"type":"edit","messageId":"m1"})",
        R"({"type":"delete"})",
        R"({"type":"delete","messageId":5})",
    };

    for (const auto &frame : bad) {
        std::string error;
        auto cmd = parse_command(frame, error);
        assert(!cmd && "malformed frame was accepted");
        assert(!error.empty());
        std::cout << "Rejected " << frame << " -> " << error << std::endl;
    }

    std::cout << "✓ Test 2 PASSED" << std::endl;
}

// Test 3: unknown extra fields do not break decoding
void test_parse_ignores_extra_fields() {
    std::cout << "\n=== Test 3: Extra Fields Ignored ===" << std::endl;
    std::string error;
    auto cmd = parse_command(R"({"type":"message","content":"hey","username":"mallory","id":"x"})", error);
    assert(cmd && std::holds_alternative<SendMessage>(*cmd));
    assert(std::get<SendMessage>(*cmd).content == "hey");
    std::cout << "✓ Test 3 PASSED" << std::endl;
}

// Test 4: outbound message layout
void test_serialize_message() {
    std::cout << "\n=== Test 4: Serialize Message ===" << std::endl;
    ChatMessage msg{"id-1", "alice", "user-1", "hello \"world\"", sample_time(), true};

    auto j = nlohmann::json::parse(serialize_message(msg));
    assert(j["type"] == "message");
    assert(j["id"] == "id-1");
    assert(j["username"] == "alice");
    assert(j["userId"] == "user-1");
    assert(j["content"] == "hello \"world\"");
    assert(j["timestamp"] == "2025-12-07T10:15:30.123Z");
    assert(j["edited"] == true);
    std::cout << "✓ Test 4 PASSED" << std::endl;
}

// Test 5: presence snapshot keeps order and count
void test_serialize_user_list() {
    std::cout << "\n=== Test 5: Serialize User List ===" << std::endl;
    std::vector<Presence> users{
        {"u1", "alice", false, sample_time()},
        {"u2", "bob", true, sample_time()},
    };

    auto j = nlohmann::json::parse(serialize_user_list(users, sample_time()));
    assert(j["type"] == "userList");
    assert(j["count"] == 2);
    assert(j["users"].size() == 2);
    assert(j["users"][0]["id"] == "u1");
    assert(j["users"][0]["isTyping"] == false);
    assert(j["users"][1]["username"] == "bob");
    assert(j["users"][1]["isTyping"] == true);
    assert(j["users"][1]["lastSeen"] == "2025-12-07T10:15:30.123Z");

    auto empty = nlohmann::json::parse(serialize_user_list({}, sample_time()));
    assert(empty["count"] == 0);
    assert(empty["users"].is_array() && empty["users"].empty());
    std::cout << "✓ Test 5 PASSED" << std::endl;
}

// Test 6: edit and delete notifications
void test_serialize_edit_delete() {
    std::cout << "\n=== Test 6: Serialize Edit/Delete ===" << std::endl;
    auto edited = nlohmann::json::parse(serialize_message_edited("m1", "new text", sample_time()));
    assert(edited["type"] == "messageEdited");
    assert(edited["messageId"] == "m1");
    assert(edited["content"] == "new text");
    assert(edited["timestamp"] == "2025-12-07T10:15:30.123Z");

    auto deleted = nlohmann::json::parse(serialize_message_deleted("m2", sample_time()));
    assert(deleted["type"] == "messageDeleted");
    assert(deleted["messageId"] == "m2");
    assert(!deleted.contains("content"));
    std::cout << "✓ Test 6 PASSED" << std::endl;
}

// Test 7: timestamp formatting at the epoch and with zero millis
void test_format_timestamp() {
    std::cout << "\n=== Test 7: Timestamp Format ===" << std::endl;
    assert(format_timestamp(TimePoint{}) == "1970-01-01T00:00:00.000Z");
    assert(format_timestamp(TimePoint{std::chrono::milliseconds{1000}}) == "1970-01-01T00:00:01.000Z");
    assert(format_timestamp(sample_time()) == "2025-12-07T10:15:30.123Z");
    std::cout << "✓ Test 7 PASSED" << std::endl;
}

// Test 8: UUIDs are canonical and distinct
void test_make_uuid() {
    std::cout << "\n=== Test 8: UUID Generation ===" << std::endl;
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        auto id = make_uuid();
        assert(id.size() == 36);
        assert(id[8] == '-' && id[13] == '-' && id[18] == '-' && id[23] == '-');
        assert(id[14] == '4');
        seen.insert(id);
    }
    assert(seen.size() == 1000);
    std::cout << "✓ Test 8 PASSED" << std::endl;
}

}  // namespace relay::chat

int main() {
    std::cout << "╔════════════════════════════════════════════════════════════╗\n"
              << "║        Wire Protocol Test Suite                            ║\n"
              << "╚════════════════════════════════════════════════════════════╝" << std::endl;

    try {
        relay::chat::test_parse_known_commands();
        relay::chat::test_parse_rejects_malformed();
        relay::chat::test_parse_ignores_extra_fields();
        relay::chat::test_serialize_message();
        relay::chat::test_serialize_user_list();
        relay::chat::test_serialize_edit_delete();
        relay::chat::test_format_timestamp();
        relay::chat::test_make_uuid();

        std::cout << "\n✓ All protocol tests PASSED" << std::endl;
        return 0;
    } catch (const std::exception &e) {
        std::cerr << "\n✗ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
