/**
 * Bastion Channel Bridge
 *
 * Owns the channel adapters picked at startup and feeds their inbound
 * messages to the kernel as ChannelMessage trigger events. Replies go out
 * through send(), which splits long text to the platform's limit.
 */
#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "ipc/channel.hpp"
#include "kernel/kernel.hpp"

namespace bastion::ipc {

class ChannelBridge {
public:
    explicit ChannelBridge(kernel::Kernel& kernel);
    ~ChannelBridge();

    // Non-copyable
    ChannelBridge(const ChannelBridge&) = delete;
    ChannelBridge& operator=(const ChannelBridge&) = delete;

    // Adapter names must be unique; throws std::invalid_argument otherwise
    void add_adapter(std::unique_ptr<ChannelAdapter> adapter);

    // Start every adapter. An adapter that fails to start is logged and
    // skipped; returns how many started.
    size_t start_all();
    void stop_all();

    // Convert and dispatch one message; returns the admitted actions.
    // Called from adapter threads.
    std::vector<kernel::FiredAction> deliver(const ChannelMessage& message);

    // Send content through a started adapter, in thread_id when given.
    // Text over the adapter's max_message_length() goes out in chunks, one
    // receipt each; sending stops at the first failed chunk. Adapter
    // exceptions become Failed receipts. Throws std::invalid_argument for
    // an unknown adapter name.
    std::vector<DeliveryReceipt> send(const std::string& adapter_name, const ChannelUser& user,
                                      const ChannelContent& content,
                                      const std::optional<std::string>& thread_id = std::nullopt);

    std::vector<ChannelStatus> statuses() const;
    size_t adapter_count() const;
    uint64_t messages_dispatched() const { return dispatched_; }

    // The trigger event a message becomes
    static kernel::TriggerEvent to_trigger_event(const ChannelMessage& message);

private:
    kernel::Kernel& kernel_;
    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<ChannelAdapter>> adapters_;
    std::vector<ChannelAdapter*> started_;
    std::atomic<uint64_t> dispatched_{0};
};

} // namespace bastion::ipc
