#include "ipc/channel_bridge.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "util/sanitize.hpp"

namespace bastion::ipc {

ChannelBridge::ChannelBridge(kernel::Kernel& kernel)
    : kernel_(kernel) {}

ChannelBridge::~ChannelBridge() {
    stop_all();
}

void ChannelBridge::add_adapter(std::unique_ptr<ChannelAdapter> adapter) {
    if (!adapter) {
        throw std::invalid_argument("null channel adapter");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& existing : adapters_) {
        if (existing->name() == adapter->name()) {
            throw std::invalid_argument("duplicate channel adapter: " + adapter->name());
        }
    }
    spdlog::info("Channel adapter registered: {} ({})", adapter->name(),
                 channel_type_to_string(adapter->channel_type()));
    adapters_.push_back(std::move(adapter));
}

kernel::TriggerEvent ChannelBridge::to_trigger_event(const ChannelMessage& message) {
    const std::string& sender = message.sender.display_name.empty()
        ? message.sender.platform_id
        : message.sender.display_name;
    return kernel::TriggerEvent::channel_message(message.channel_name(), sender, message.message_text());
}

std::vector<kernel::FiredAction> ChannelBridge::deliver(const ChannelMessage& message) {
    auto event = to_trigger_event(message);
    spdlog::debug("Channel message on {} ({} bytes)", event.channel, event.text.size());
    auto admitted = kernel_.dispatch_event(event);
    dispatched_++;
    return admitted;
}

size_t ChannelBridge::start_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t started = 0;
    for (auto& adapter : adapters_) {
        bool already = false;
        for (auto* s : started_) {
            if (s == adapter.get()) already = true;
        }
        if (already) continue;

        const std::string name = adapter->name();
        try {
            adapter->start([this, name](const ChannelMessage& message) {
                try {
                    deliver(message);
                } catch (const kernel::KernelError& e) {
                    spdlog::error("Channel '{}': message not dispatched: {}", name, e.what());
                }
            });
            started_.push_back(adapter.get());
            started++;
            spdlog::info("Channel adapter started: {}", name);
        } catch (const std::exception& e) {
            spdlog::error("Channel adapter '{}' failed to start: {}", name,
                          util::sanitize_detail(e.what()));
        }
    }
    return started;
}

void ChannelBridge::stop_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto* adapter : started_) {
        try {
            adapter->stop();
            spdlog::info("Channel adapter stopped: {}", adapter->name());
        } catch (const std::exception& e) {
            spdlog::warn("Channel adapter '{}' failed to stop cleanly: {}", adapter->name(),
                         util::sanitize_detail(e.what()));
        }
    }
    started_.clear();
}

std::vector<DeliveryReceipt> ChannelBridge::send(const std::string& adapter_name, const ChannelUser& user,
                                                 const ChannelContent& content,
                                                 const std::optional<std::string>& thread_id) {
    ChannelAdapter* adapter = nullptr;
    bool started = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& candidate : adapters_) {
            if (candidate->name() == adapter_name) {
                adapter = candidate.get();
            }
        }
        if (!adapter) {
            throw std::invalid_argument("unknown channel adapter: " + adapter_name);
        }
        for (auto* s : started_) {
            if (s == adapter) started = true;
        }
    }

    const std::string channel = channel_type_to_string(adapter->channel_type());
    if (!started) {
        return {DeliveryReceipt::failed(channel, user, "adapter not started")};
    }

    std::vector<ChannelContent> parts;
    if (content.kind == ContentKind::TEXT && content.text.size() > adapter->max_message_length()) {
        for (auto& chunk : split_message(content.text, adapter->max_message_length())) {
            parts.push_back(ChannelContent::make_text(chunk));
        }
    } else {
        parts.push_back(content);
    }

    std::vector<DeliveryReceipt> receipts;
    for (const auto& part : parts) {
        try {
            receipts.push_back(thread_id ? adapter->send_in_thread(user, part, *thread_id)
                                         : adapter->send(user, part));
        } catch (const std::exception& e) {
            spdlog::error("Channel '{}': send failed: {}", adapter_name, util::sanitize_detail(e.what()));
            receipts.push_back(DeliveryReceipt::failed(channel, user, e.what()));
        }
        if (receipts.back().status == DeliveryStatus::FAILED) {
            break;
        }
    }
    return receipts;
}

std::vector<ChannelStatus> ChannelBridge::statuses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ChannelStatus> result;
    result.reserve(adapters_.size());
    for (const auto& adapter : adapters_) {
        ChannelStatus status = adapter->status();
        if (status.adapter.empty()) {
            status.adapter = adapter->name();
        }
        result.push_back(std::move(status));
    }
    return result;
}

size_t ChannelBridge::adapter_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return adapters_.size();
}

} // namespace bastion::ipc
