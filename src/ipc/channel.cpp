#include "ipc/channel.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string_view>
#include "kernel/types.hpp"
#include "util/sanitize.hpp"

namespace bastion::ipc {

const char* channel_type_to_string(ChannelType type) {
    switch (type) {
        case ChannelType::TELEGRAM:   return "telegram";
        case ChannelType::WHATSAPP:   return "whatsapp";
        case ChannelType::SLACK:      return "slack";
        case ChannelType::DISCORD:    return "discord";
        case ChannelType::SIGNAL:     return "signal";
        case ChannelType::MATRIX:     return "matrix";
        case ChannelType::EMAIL:      return "email";
        case ChannelType::TEAMS:      return "teams";
        case ChannelType::MATTERMOST: return "mattermost";
        case ChannelType::WEBCHAT:    return "webchat";
        case ChannelType::CLI:        return "cli";
        case ChannelType::CUSTOM:     return "custom";
        default: return "unknown";
    }
}

std::optional<ChannelType> channel_type_from_string(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "telegram")   return ChannelType::TELEGRAM;
    if (lower == "whatsapp")   return ChannelType::WHATSAPP;
    if (lower == "slack")      return ChannelType::SLACK;
    if (lower == "discord")    return ChannelType::DISCORD;
    if (lower == "signal")     return ChannelType::SIGNAL;
    if (lower == "matrix")     return ChannelType::MATRIX;
    if (lower == "email")      return ChannelType::EMAIL;
    if (lower == "teams")      return ChannelType::TEAMS;
    if (lower == "mattermost") return ChannelType::MATTERMOST;
    if (lower == "webchat")    return ChannelType::WEBCHAT;
    if (lower == "cli")        return ChannelType::CLI;
    return std::nullopt;
}

const char* content_kind_to_string(ContentKind kind) {
    switch (kind) {
        case ContentKind::TEXT:     return "text";
        case ContentKind::IMAGE:    return "image";
        case ContentKind::FILE:     return "file";
        case ContentKind::VOICE:    return "voice";
        case ContentKind::LOCATION: return "location";
        case ContentKind::COMMAND:  return "command";
        default: return "unknown";
    }
}

// ============================================================================
// ChannelContent
// ============================================================================

ChannelContent ChannelContent::make_text(const std::string& text) {
    ChannelContent c;
    c.kind = ContentKind::TEXT;
    c.text = text;
    return c;
}

ChannelContent ChannelContent::make_image(const std::string& url, const std::string& caption) {
    ChannelContent c;
    c.kind = ContentKind::IMAGE;
    c.url = url;
    c.text = caption;
    return c;
}

ChannelContent ChannelContent::make_file(const std::string& url, const std::string& filename) {
    ChannelContent c;
    c.kind = ContentKind::FILE;
    c.url = url;
    c.filename = filename;
    return c;
}

ChannelContent ChannelContent::make_voice(const std::string& url, uint32_t duration_seconds) {
    ChannelContent c;
    c.kind = ContentKind::VOICE;
    c.url = url;
    c.duration_seconds = duration_seconds;
    return c;
}

ChannelContent ChannelContent::make_location(double lat, double lon) {
    ChannelContent c;
    c.kind = ContentKind::LOCATION;
    c.lat = lat;
    c.lon = lon;
    return c;
}

ChannelContent ChannelContent::make_command(const std::string& name, const std::vector<std::string>& args) {
    ChannelContent c;
    c.kind = ContentKind::COMMAND;
    c.command = name;
    c.args = args;
    return c;
}

nlohmann::json ChannelContent::to_json() const {
    nlohmann::json j;
    j["kind"] = content_kind_to_string(kind);
    switch (kind) {
        case ContentKind::TEXT:
            j["text"] = text;
            break;
        case ContentKind::IMAGE:
            j["url"] = url;
            if (!text.empty()) j["caption"] = text;
            break;
        case ContentKind::FILE:
            j["url"] = url;
            j["filename"] = filename;
            break;
        case ContentKind::VOICE:
            j["url"] = url;
            j["duration_seconds"] = duration_seconds;
            break;
        case ContentKind::LOCATION:
            j["lat"] = lat;
            j["lon"] = lon;
            break;
        case ContentKind::COMMAND:
            j["name"] = command;
            j["args"] = args;
            break;
    }
    return j;
}

// ============================================================================
// ChannelMessage
// ============================================================================

std::string ChannelMessage::channel_name() const {
    if (channel == ChannelType::CUSTOM && !custom_channel.empty()) {
        return custom_channel;
    }
    return channel_type_to_string(channel);
}

std::string ChannelMessage::message_text() const {
    switch (content.kind) {
        case ContentKind::TEXT:
        case ContentKind::IMAGE:
            return content.text;
        case ContentKind::COMMAND: {
            std::string text = "/" + content.command;
            for (const auto& arg : content.args) {
                text += " " + arg;
            }
            return text;
        }
        default:
            return "";
    }
}

nlohmann::json ChannelMessage::to_json() const {
    nlohmann::json j;
    j["channel"] = channel_name();
    j["platform_message_id"] = platform_message_id;
    j["sender"] = {{"platform_id", sender.platform_id}, {"display_name", sender.display_name}};
    j["content"] = content.to_json();
    if (target_agent) j["target_agent"] = *target_agent;
    j["timestamp"] = kernel::format_timestamp(timestamp);
    j["is_group"] = is_group;
    if (thread_id) j["thread_id"] = *thread_id;
    j["metadata"] = metadata;
    return j;
}

// ============================================================================
// Reactions
// ============================================================================

const char* agent_phase_to_string(AgentPhase phase) {
    switch (phase) {
        case AgentPhase::QUEUED:    return "queued";
        case AgentPhase::THINKING:  return "thinking";
        case AgentPhase::TOOL_USE:  return "tool_use";
        case AgentPhase::STREAMING: return "streaming";
        case AgentPhase::DONE:      return "done";
        case AgentPhase::ERROR:     return "error";
        default: return "unknown";
    }
}

const char* default_phase_emoji(AgentPhase phase) {
    switch (phase) {
        case AgentPhase::QUEUED:    return "\u23F3";
        case AgentPhase::THINKING:  return "\U0001F914";
        case AgentPhase::TOOL_USE:  return "\u2699\uFE0F";
        case AgentPhase::STREAMING: return "\u270D\uFE0F";
        case AgentPhase::DONE:      return "\u2705";
        case AgentPhase::ERROR:     return "\u274C";
        default: return "\u23F3";
    }
}

LifecycleReaction LifecycleReaction::for_phase(AgentPhase phase) {
    LifecycleReaction r;
    r.phase = phase;
    r.emoji = default_phase_emoji(phase);
    return r;
}

bool is_allowed_reaction_emoji(const std::string& emoji) {
    static const char* const allowed[] = {
        "\U0001F914", "\u2699\uFE0F", "\u270D\uFE0F", "\u2705",
        "\u274C", "\u23F3", "\U0001F504", "\U0001F440",
    };
    for (const char* e : allowed) {
        if (emoji == e) return true;
    }
    return false;
}

nlohmann::json ChannelStatus::to_json() const {
    nlohmann::json j;
    j["adapter"] = adapter;
    j["connected"] = connected;
    j["started_at"] = started_at ? nlohmann::json(kernel::format_timestamp(*started_at)) : nlohmann::json();
    j["last_message_at"] = last_message_at
        ? nlohmann::json(kernel::format_timestamp(*last_message_at)) : nlohmann::json();
    j["messages_received"] = messages_received;
    j["messages_sent"] = messages_sent;
    if (!last_error.empty()) j["last_error"] = last_error;
    return j;
}

// ============================================================================
// Delivery
// ============================================================================

const char* delivery_status_to_string(DeliveryStatus status) {
    switch (status) {
        case DeliveryStatus::SENT:        return "sent";
        case DeliveryStatus::DELIVERED:   return "delivered";
        case DeliveryStatus::FAILED:      return "failed";
        case DeliveryStatus::BEST_EFFORT: return "best_effort";
        default: return "unknown";
    }
}

std::optional<DeliveryStatus> delivery_status_from_string(const std::string& str) {
    if (str == "sent")        return DeliveryStatus::SENT;
    if (str == "delivered")   return DeliveryStatus::DELIVERED;
    if (str == "failed")      return DeliveryStatus::FAILED;
    if (str == "best_effort") return DeliveryStatus::BEST_EFFORT;
    return std::nullopt;
}

DeliveryReceipt DeliveryReceipt::failed(const std::string& channel, const ChannelUser& user,
                                        const std::string& error) {
    DeliveryReceipt receipt;
    receipt.channel = channel;
    receipt.recipient = user.platform_id;
    receipt.status = DeliveryStatus::FAILED;
    receipt.error = util::sanitize_detail(error);
    return receipt;
}

nlohmann::json DeliveryReceipt::to_json() const {
    nlohmann::json j;
    j["message_id"] = message_id;
    j["channel"] = channel;
    j["recipient"] = recipient;
    j["status"] = delivery_status_to_string(status);
    j["timestamp"] = kernel::format_timestamp(timestamp);
    j["error"] = error ? nlohmann::json(*error) : nlohmann::json(nullptr);
    return j;
}

std::vector<std::string> split_message(const std::string& text, size_t max_bytes) {
    if (max_bytes == 0) {
        throw std::invalid_argument("split_message: max_bytes must be positive");
    }

    std::vector<std::string> chunks;
    size_t pos = 0;
    while (text.size() - pos > max_bytes) {
        size_t end = util::truncate_utf8(text.substr(pos, max_bytes + 1), max_bytes).size();
        if (end == 0) {
            // A single character longer than the limit goes out on its own
            end = 1;
            while (pos + end < text.size() &&
                   (static_cast<unsigned char>(text[pos + end]) & 0xC0) == 0x80) {
                ++end;
            }
        }

        size_t newline = std::string_view(text.data() + pos, end).rfind('\n');
        bool at_newline = newline != std::string_view::npos;
        size_t cut = at_newline ? pos + newline : pos + end;
        size_t chunk_end = cut;
        if (at_newline && chunk_end > pos && text[chunk_end - 1] == '\r') {
            --chunk_end;
        }
        chunks.push_back(text.substr(pos, chunk_end - pos));

        pos = at_newline ? cut + 1 : cut;
        if (!at_newline) {
            if (text.compare(pos, 2, "\r\n") == 0) {
                pos += 2;
            } else if (pos < text.size() && text[pos] == '\n') {
                ++pos;
            }
        }
    }
    if (pos < text.size() || chunks.empty()) {
        chunks.push_back(text.substr(pos));
    }
    return chunks;
}

} // namespace bastion::ipc
