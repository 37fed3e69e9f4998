/**
 * Bastion Channel Interface
 *
 * Normalized shape of messages arriving from chat platforms, and the fixed
 * interface every platform adapter implements. The kernel never parses
 * platform payloads; adapters hand it ChannelMessage values only.
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "kernel/types.hpp"

namespace bastion::ipc {

using kernel::AgentId;

enum class ChannelType {
    TELEGRAM,
    WHATSAPP,
    SLACK,
    DISCORD,
    SIGNAL,
    MATRIX,
    EMAIL,
    TEAMS,
    MATTERMOST,
    WEBCHAT,
    CLI,
    CUSTOM
};

// Lowercase wire name ("telegram", "webchat", ...). CUSTOM has no fixed name;
// use ChannelMessage::channel_name() for the full name.
const char* channel_type_to_string(ChannelType type);
std::optional<ChannelType> channel_type_from_string(const std::string& str);

struct ChannelUser {
    std::string platform_id;
    std::string display_name;
};

enum class ContentKind {
    TEXT,
    IMAGE,
    FILE,
    VOICE,
    LOCATION,
    COMMAND
};

const char* content_kind_to_string(ContentKind kind);

// Tagged content. Only the fields of the active kind are meaningful.
struct ChannelContent {
    ContentKind kind = ContentKind::TEXT;
    std::string text;                  // TEXT body, IMAGE caption
    std::string url;                   // IMAGE, FILE, VOICE
    std::string filename;              // FILE
    uint32_t duration_seconds = 0;     // VOICE
    double lat = 0.0;                  // LOCATION
    double lon = 0.0;
    std::string command;               // COMMAND name (without the leading '/')
    std::vector<std::string> args;     // COMMAND arguments

    static ChannelContent make_text(const std::string& text);
    static ChannelContent make_image(const std::string& url, const std::string& caption = "");
    static ChannelContent make_file(const std::string& url, const std::string& filename);
    static ChannelContent make_voice(const std::string& url, uint32_t duration_seconds);
    static ChannelContent make_location(double lat, double lon);
    static ChannelContent make_command(const std::string& name, const std::vector<std::string>& args);

    nlohmann::json to_json() const;
};

struct ChannelMessage {
    ChannelType channel = ChannelType::CLI;
    std::string custom_channel;        // Name when channel == CUSTOM
    std::string platform_message_id;
    ChannelUser sender;
    ChannelContent content;
    std::optional<AgentId> target_agent;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
    bool is_group = false;
    std::optional<std::string> thread_id;
    nlohmann::json metadata = nlohmann::json::object();   // Opaque platform data

    std::string channel_name() const;

    // Text that content triggers match against: the body for text, the
    // caption for images, "/name arg..." for commands, "" otherwise
    std::string message_text() const;

    nlohmann::json to_json() const;
};

// ============================================================================
// Outbound indicators
// ============================================================================

enum class AgentPhase {
    QUEUED,
    THINKING,
    TOOL_USE,
    STREAMING,
    DONE,
    ERROR
};

const char* agent_phase_to_string(AgentPhase phase);

struct LifecycleReaction {
    AgentPhase phase = AgentPhase::QUEUED;
    std::string emoji;
    bool remove_previous = true;

    // Reaction with the phase's default emoji
    static LifecycleReaction for_phase(AgentPhase phase);
};

const char* default_phase_emoji(AgentPhase phase);

// Adapters only ever put these emoji on a platform message
bool is_allowed_reaction_emoji(const std::string& emoji);

// ============================================================================
// Outbound delivery
// ============================================================================

enum class DeliveryStatus {
    SENT,          // Accepted by the platform API
    DELIVERED,     // Platform confirmed delivery
    FAILED,
    BEST_EFFORT    // Platform gives no confirmation
};

const char* delivery_status_to_string(DeliveryStatus status);
std::optional<DeliveryStatus> delivery_status_from_string(const std::string& str);

struct DeliveryReceipt {
    std::string message_id;            // Platform message id, if one was returned
    std::string channel;
    std::string recipient;             // Platform id; never a display name
    DeliveryStatus status = DeliveryStatus::SENT;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
    std::optional<std::string> error;  // Sanitized

    static DeliveryReceipt failed(const std::string& channel, const ChannelUser& user,
                                  const std::string& error);

    nlohmann::json to_json() const;
};

// Split text into chunks of at most max_bytes, cutting at the last newline
// inside the limit when there is one and never inside a UTF-8 sequence.
// The newline (or CRLF) a chunk was cut at is dropped. Throws
// std::invalid_argument when max_bytes is 0.
std::vector<std::string> split_message(const std::string& text, size_t max_bytes);

// ============================================================================
// Adapter interface
// ============================================================================

struct ChannelStatus {
    std::string adapter;
    bool connected = false;
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::optional<std::chrono::system_clock::time_point> last_message_at;
    uint64_t messages_received = 0;
    uint64_t messages_sent = 0;
    std::string last_error;

    nlohmann::json to_json() const;
};

using MessageHandler = std::function<void(const ChannelMessage&)>;

// One per platform, chosen when the process is composed. Implementations
// report failures by throwing; the bridge logs them per adapter.
class ChannelAdapter {
public:
    virtual ~ChannelAdapter() = default;

    virtual std::string name() const = 0;
    virtual ChannelType channel_type() const = 0;

    // Begin delivering inbound messages to handler (from any thread)
    virtual void start(MessageHandler handler) = 0;

    virtual DeliveryReceipt send(const ChannelUser& user, const ChannelContent& content) = 0;

    // Platforms without threads reply in the main conversation
    virtual DeliveryReceipt send_in_thread(const ChannelUser& user, const ChannelContent& content,
                                           const std::string& thread_id) {
        (void)thread_id;
        return send(user, content);
    }

    // Longest text the platform accepts in one message
    virtual size_t max_message_length() const { return 4096; }

    virtual void send_typing(const ChannelUser& user) = 0;
    virtual void send_reaction(const ChannelUser& user, const std::string& message_id,
                               const LifecycleReaction& reaction) = 0;

    virtual void stop() = 0;
    virtual ChannelStatus status() const = 0;
};

} // namespace bastion::ipc
