#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "test_harness.hpp"
#include "ipc/channel.hpp"
#include "ipc/channel_bridge.hpp"
#include "kernel/kernel.hpp"
#include "util/sanitize.hpp"

using namespace bastion;
using namespace bastion::ipc;
using namespace bastion::test;

namespace {

// In-process adapter: records outbound traffic and lets the test inject
// inbound messages through the handler the bridge installed.
class LoopbackAdapter : public ChannelAdapter {
public:
    LoopbackAdapter(std::string name, ChannelType type, bool fail_start = false)
        : name_(std::move(name)), type_(type), fail_start_(fail_start) {}

    std::string name() const override { return name_; }
    ChannelType channel_type() const override { return type_; }

    void start(MessageHandler handler) override {
        if (fail_start_) {
            throw std::runtime_error("bot token rejected");
        }
        handler_ = std::move(handler);
        status_.connected = true;
        status_.started_at = std::chrono::system_clock::now();
    }

    DeliveryReceipt send(const ChannelUser& user, const ChannelContent& content) override {
        if (fail_after >= 0 && static_cast<int>(sent.size()) >= fail_after) {
            throw std::runtime_error("HTTP 502 from api, token=abc123");
        }
        sent.push_back(content);
        status_.messages_sent++;

        DeliveryReceipt receipt;
        receipt.message_id = "out-" + std::to_string(sent.size());
        receipt.channel = channel_type_to_string(type_);
        receipt.recipient = user.platform_id;
        return receipt;
    }

    DeliveryReceipt send_in_thread(const ChannelUser& user, const ChannelContent& content,
                                   const std::string& thread_id) override {
        threads.push_back(thread_id);
        return send(user, content);
    }

    size_t max_message_length() const override { return max_length; }

    void send_typing(const ChannelUser&) override { typing++; }

    void send_reaction(const ChannelUser&, const std::string&, const LifecycleReaction& reaction) override {
        reactions.push_back(reaction);
    }

    void stop() override {
        status_.connected = false;
        handler_ = nullptr;
        stopped++;
    }

    ChannelStatus status() const override { return status_; }

    void inject(const ChannelMessage& message) {
        status_.messages_received++;
        status_.last_message_at = message.timestamp;
        if (handler_) handler_(message);
    }

    std::vector<ChannelContent> sent;
    std::vector<std::string> threads;
    std::vector<LifecycleReaction> reactions;
    size_t max_length = 4096;
    int fail_after = -1;   // Throw from send() once this many messages went out
    int typing = 0;
    int stopped = 0;

private:
    std::string name_;
    ChannelType type_;
    bool fail_start_;
    MessageHandler handler_;
    ChannelStatus status_;
};

ChannelMessage text_message(ChannelType channel, const std::string& sender, const std::string& text) {
    ChannelMessage message;
    message.channel = channel;
    message.platform_message_id = "m-1";
    message.sender.platform_id = "u-42";
    message.sender.display_name = sender;
    message.content = ChannelContent::make_text(text);
    return message;
}

std::string responder_manifest() {
    return "name = \"responder\"\n"
           "[capabilities]\n"
           "tools = [\"web_search\"]\n";
}

kernel::TriggerDefinition on_channel(kernel::AgentId agent, const std::string& channel) {
    kernel::TriggerDefinition def;
    def.agent_id = agent;
    def.pattern.kind = kernel::TriggerPatternKind::CHANNEL_MESSAGE;
    def.pattern.param = channel;
    def.prompt_template = "reply to {{event}}";
    return def;
}

// ============================================================================
// Message model
// ============================================================================

void test_channel_type_names() {
    expect(std::string(channel_type_to_string(ChannelType::WEBCHAT)) == "webchat", "lowercase name");
    expect(channel_type_from_string("Telegram") == ChannelType::TELEGRAM, "case-insensitive parse");
    expect(!channel_type_from_string("pigeon"), "unknown channel");

    ChannelMessage message;
    message.channel = ChannelType::CUSTOM;
    message.custom_channel = "intranet";
    expect(message.channel_name() == "intranet", "custom channel keeps its name");
}

void test_message_text() {
    auto message = text_message(ChannelType::SLACK, "erin", "deploy now");
    expect(message.message_text() == "deploy now", "text body");

    message.content = ChannelContent::make_image("https://cdn/x.png", "look at this");
    expect(message.message_text() == "look at this", "image caption");

    message.content = ChannelContent::make_command("status", {"api", "--verbose"});
    expect(message.message_text() == "/status api --verbose", "command rendered with args");

    message.content = ChannelContent::make_voice("https://cdn/v.ogg", 12);
    expect(message.message_text().empty(), "voice has no text");
    message.content = ChannelContent::make_location(52.5, 13.4);
    expect(message.message_text().empty(), "location has no text");
}

void test_message_json() {
    auto message = text_message(ChannelType::DISCORD, "finn", "hello");
    message.target_agent = 3;
    message.thread_id = std::string("t-9");
    auto j = message.to_json();
    expect(j["channel"] == "discord", "channel name");
    expect(j["sender"]["display_name"] == "finn", "sender");
    expect(j["content"]["kind"] == content_kind_to_string(ContentKind::TEXT), "content kind");
    expect(j["target_agent"] == 3 && j["thread_id"] == "t-9", "optional fields present");

    auto file = ChannelContent::make_file("https://cdn/report.pdf", "report.pdf").to_json();
    expect(file["filename"] == "report.pdf", "file name in JSON");
}

void test_reactions() {
    auto reaction = LifecycleReaction::for_phase(AgentPhase::THINKING);
    expect(reaction.phase == AgentPhase::THINKING, "phase kept");
    expect(reaction.emoji == default_phase_emoji(AgentPhase::THINKING), "default emoji");
    expect(reaction.remove_previous, "replaces the previous reaction");

    for (auto phase : {AgentPhase::QUEUED, AgentPhase::THINKING, AgentPhase::TOOL_USE,
                       AgentPhase::STREAMING, AgentPhase::DONE, AgentPhase::ERROR}) {
        expect(is_allowed_reaction_emoji(default_phase_emoji(phase)),
               std::string("default emoji allowed for ") + agent_phase_to_string(phase));
    }
    expect(!is_allowed_reaction_emoji("\U0001F4A9"), "arbitrary emoji rejected");
    expect(!is_allowed_reaction_emoji(""), "empty rejected");
}

void test_split_message() {
    auto whole = split_message("hello", 100);
    expect(whole.size() == 1 && whole[0] == "hello", "short text is one chunk");
    expect(split_message("", 10).size() == 1, "empty text is one empty chunk");

    auto lines = split_message("line1\nline2\nline3", 10);
    expect(lines == std::vector<std::string>({"line1", "line2", "line3"}), "cut at newlines");

    auto crlf = split_message("alpha\r\nbravo charlie", 10);
    expect(crlf.size() == 3 && crlf[0] == "alpha" && crlf[1] == "bravo char" && crlf[2] == "lie",
           "CRLF dropped at the cut");

    auto hard = split_message(std::string(25, 'x'), 10);
    expect(hard.size() == 3 && hard[0].size() == 10 && hard[2].size() == 5, "hard cut without newlines");

    // "é" is two bytes; a cut never lands between them
    std::string accents;
    for (int i = 0; i < 7; ++i) accents += "\xC3\xA9";
    auto utf8 = split_message(accents, 5);
    expect(utf8.size() == 4 && utf8[0].size() == 4 && utf8[3].size() == 2, "UTF-8 sequences kept whole");
    for (const auto& chunk : utf8) {
        expect(util::to_valid_utf8(chunk) == chunk, "every chunk is valid UTF-8");
    }

    expect_throws<std::invalid_argument>([] { split_message("abc", 0); }, "zero limit rejected");
}

void test_delivery_receipt() {
    DeliveryReceipt receipt;
    receipt.message_id = "msg-123";
    receipt.channel = "telegram";
    receipt.recipient = "user-456";
    auto j = receipt.to_json();
    expect(j["status"] == "sent" && j["message_id"] == "msg-123", "sent receipt");
    expect(j["error"].is_null(), "no error");

    ChannelUser user{"channel-abc", "Ops Room"};
    auto failed = DeliveryReceipt::failed("slack", user, "Connection refused\nretry with password=hunter2");
    expect(failed.status == DeliveryStatus::FAILED, "failed status");
    expect(failed.recipient == "channel-abc", "recipient is the platform id");
    expect(failed.error && failed.error->find("Connection refused") != std::string::npos, "error kept");
    expect(failed.error->find("hunter2") == std::string::npos, "error sanitized");
    expect(failed.to_json()["status"] == "failed", "status name");

    for (auto status : {DeliveryStatus::SENT, DeliveryStatus::DELIVERED, DeliveryStatus::FAILED,
                        DeliveryStatus::BEST_EFFORT}) {
        expect(delivery_status_from_string(delivery_status_to_string(status)) == status,
               std::string("status name parses: ") + delivery_status_to_string(status));
    }
    expect(!delivery_status_from_string("lost"), "unknown status");
}

// ============================================================================
// Bridge
// ============================================================================

void test_trigger_event_conversion() {
    auto message = text_message(ChannelType::TELEGRAM, "gina", "ping");
    auto event = ChannelBridge::to_trigger_event(message);
    expect(event.kind == kernel::TriggerEventKind::CHANNEL_MESSAGE, "channel event");
    expect(event.channel == "telegram", "channel name");
    expect(event.sender == "gina", "display name preferred");
    expect(event.text == "ping", "text carried");

    message.sender.display_name.clear();
    expect(ChannelBridge::to_trigger_event(message).sender == "u-42", "platform id as fallback");
}

void test_adapter_registration() {
    kernel::Kernel kernel;
    ChannelBridge bridge(kernel);
    bridge.add_adapter(std::make_unique<LoopbackAdapter>("tg-main", ChannelType::TELEGRAM));
    expect_throws<std::invalid_argument>([&] {
        bridge.add_adapter(std::make_unique<LoopbackAdapter>("tg-main", ChannelType::TELEGRAM));
    }, "duplicate adapter name");
    expect_throws<std::invalid_argument>([&] { bridge.add_adapter(nullptr); }, "null adapter");
    expect(bridge.adapter_count() == 1, "one adapter");
}

void test_start_skips_failing_adapter() {
    kernel::Kernel kernel;
    ChannelBridge bridge(kernel);
    bridge.add_adapter(std::make_unique<LoopbackAdapter>("slack", ChannelType::SLACK));
    bridge.add_adapter(std::make_unique<LoopbackAdapter>("broken", ChannelType::DISCORD, true));

    expect(bridge.start_all() == 1, "only the healthy adapter started");
    expect(bridge.start_all() == 0, "started adapters are not restarted");

    auto statuses = bridge.statuses();
    expect(statuses.size() == 2, "status for every adapter");
    expect(statuses[0].adapter == "slack" && statuses[0].connected, "healthy adapter connected");
    expect(!statuses[1].connected, "failed adapter disconnected");
}

void test_inbound_message_reaches_triggers() {
    kernel::Kernel kernel;
    auto agent = kernel.spawn_agent(responder_manifest());
    kernel.register_trigger(on_channel(agent, "telegram"));

    std::vector<kernel::FiredAction> handled;
    kernel.set_action_handler([&](const kernel::FiredAction& action) { handled.push_back(action); });

    ChannelBridge bridge(kernel);
    auto adapter = std::make_unique<LoopbackAdapter>("tg", ChannelType::TELEGRAM);
    LoopbackAdapter* loopback = adapter.get();
    bridge.add_adapter(std::move(adapter));
    bridge.start_all();

    loopback->inject(text_message(ChannelType::TELEGRAM, "hana", "what's new?"));
    expect(bridge.messages_dispatched() == 1, "message dispatched");
    expect(handled.size() == 1, "trigger admitted");
    expect(handled[0].prompt == "reply to telegram message from hana: what's new?", "prompt from message");

    loopback->inject(text_message(ChannelType::SLACK, "ivan", "ignored"));
    expect(handled.size() == 1, "other channels do not match");
    expect(loopback->status().messages_received == 2, "adapter counted both");

    bridge.stop_all();
    expect(loopback->stopped == 1, "adapter stopped");
    loopback->inject(text_message(ChannelType::TELEGRAM, "hana", "late"));
    expect(bridge.messages_dispatched() == 2, "stopped adapter delivers nothing");
}

void test_send_splits_long_text() {
    kernel::Kernel kernel;
    ChannelBridge bridge(kernel);
    auto adapter = std::make_unique<LoopbackAdapter>("dc", ChannelType::DISCORD);
    LoopbackAdapter* loopback = adapter.get();
    loopback->max_length = 2000;
    bridge.add_adapter(std::move(adapter));
    bridge.start_all();

    ChannelUser user{"u-1", "jo"};
    std::string reply = std::string(1500, 'a') + "\n" + std::string(1500, 'b');
    auto receipts = bridge.send("dc", user, ChannelContent::make_text(reply));
    expect(receipts.size() == 2, "one receipt per chunk");
    expect(loopback->sent.size() == 2, "two messages sent");
    expect(loopback->sent[0].text == std::string(1500, 'a'), "first chunk ends at the newline");
    expect(loopback->sent[1].text == std::string(1500, 'b'), "second chunk");
    expect(receipts[1].message_id == "out-2" && receipts[1].status == DeliveryStatus::SENT, "receipts returned");

    auto image = bridge.send("dc", user, ChannelContent::make_image("https://cdn/x.png", std::string(3000, 'c')));
    expect(image.size() == 1, "non-text content is never split");

    bridge.send("dc", user, ChannelContent::make_text("in thread"), std::string("t-77"));
    expect(loopback->threads.size() == 1 && loopback->threads[0] == "t-77", "thread reply");
}

void test_send_failures_become_receipts() {
    kernel::Kernel kernel;
    ChannelBridge bridge(kernel);
    auto adapter = std::make_unique<LoopbackAdapter>("tg", ChannelType::TELEGRAM);
    LoopbackAdapter* loopback = adapter.get();
    loopback->max_length = 10;
    loopback->fail_after = 1;
    bridge.add_adapter(std::move(adapter));
    bridge.add_adapter(std::make_unique<LoopbackAdapter>("idle", ChannelType::SLACK));

    ChannelUser user{"u-2", "kim"};
    auto not_started = bridge.send("tg", user, ChannelContent::make_text("hi"));
    expect(not_started.size() == 1 && not_started[0].status == DeliveryStatus::FAILED,
           "adapter not started yet");

    bridge.start_all();
    auto receipts = bridge.send("tg", user, ChannelContent::make_text("aaaaaaaaaa\nbbbbbbbbbb\ncccc"));
    expect(receipts.size() == 2, "stops at the first failed chunk");
    expect(receipts[0].status == DeliveryStatus::SENT, "first chunk sent");
    expect(receipts[1].status == DeliveryStatus::FAILED, "adapter error becomes a failed receipt");
    expect(receipts[1].error && receipts[1].error->find("abc123") == std::string::npos,
           "credentials stripped from the error");
    expect(receipts[1].channel == "telegram" && receipts[1].recipient == "u-2", "receipt addressed");

    expect_throws<std::invalid_argument>([&] { bridge.send("nope", user, ChannelContent::make_text("x")); },
                                         "unknown adapter");
}

void test_large_inbound_message() {
    kernel::Kernel kernel;
    auto agent = kernel.spawn_agent(responder_manifest());
    kernel.register_trigger(on_channel(agent, "webchat"));

    ChannelBridge bridge(kernel);
    auto adapter = std::make_unique<LoopbackAdapter>("web", ChannelType::WEBCHAT);
    LoopbackAdapter* loopback = adapter.get();
    bridge.add_adapter(std::move(adapter));
    bridge.start_all();

    loopback->inject(text_message(ChannelType::WEBCHAT, "lee",
                                  "Authorization: bearer " + std::string(150000, 'A')));
    expect(bridge.messages_dispatched() == 1, "large message dispatched");

    kernel::AuditFilter fired;
    fired.action = kernel::AuditAction::TRIGGER_FIRED;
    auto entries = kernel.ledger().query(fired).collect();
    expect(entries.size() == 1, "one fire audited");
    expect(entries[0].detail.size() <= 256, "audit detail capped");
    expect(entries[0].detail.find("AAAA") == std::string::npos, "token redacted");
}

void test_halted_kernel_does_not_crash_adapter() {
    auto path = (std::filesystem::temp_directory_path() / "bastion_channel_halt.jsonl").string();
    {
        std::ofstream out(path, std::ios::trunc);
        out << "{broken\n";
    }
    kernel::Kernel::Config config;
    config.audit_log_path = path;
    kernel::Kernel kernel(config);
    expect(kernel.halted(), "kernel starts halted");

    ChannelBridge bridge(kernel);
    auto adapter = std::make_unique<LoopbackAdapter>("cli", ChannelType::CLI);
    LoopbackAdapter* loopback = adapter.get();
    bridge.add_adapter(std::move(adapter));
    bridge.start_all();

    loopback->inject(text_message(ChannelType::CLI, "ops", "hello"));
    expect(bridge.messages_dispatched() == 0, "refused message not counted");
    expect_throws<kernel::KernelHalted>([&] {
        bridge.deliver(text_message(ChannelType::CLI, "ops", "hello"));
    }, "direct delivery reports the halt");
    std::filesystem::remove(path);
}

} // anonymous namespace

int main() {
    quiet_logs();
    std::cout << "=== Bastion Channel Tests ===\n";

    std::cout << "\n[Messages]\n";
    run_test("channel type names", test_channel_type_names);
    run_test("message text", test_message_text);
    run_test("message JSON", test_message_json);
    run_test("reactions", test_reactions);
    run_test("split message", test_split_message);
    run_test("delivery receipt", test_delivery_receipt);

    std::cout << "\n[Bridge]\n";
    run_test("trigger event conversion", test_trigger_event_conversion);
    run_test("adapter registration", test_adapter_registration);
    run_test("start skips failing adapter", test_start_skips_failing_adapter);
    run_test("inbound message reaches triggers", test_inbound_message_reaches_triggers);
    run_test("send splits long text", test_send_splits_long_text);
    run_test("send failures become receipts", test_send_failures_become_receipts);
    run_test("large inbound message", test_large_inbound_message);
    run_test("halted kernel", test_halted_kernel_does_not_crash_adapter);

    return finish("channel");
}
