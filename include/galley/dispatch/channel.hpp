#pragma once
/**
 * @file channel.hpp
 * @brief Per-station broadcast channels for kitchen displays.
 * @details Each subscriber owns a bounded SpscQueue mailbox. Publishing never
 *          blocks: when a mailbox is full the message is dropped for that
 *          subscriber and it is flagged as needing a full refresh. Dropping
 *          the Subscription unsubscribes.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "galley/compat/expected.hpp"
#include "galley/config/constants.hpp"
#include "galley/mem/spsc_queue.hpp"
#include "galley/routing/manifest.hpp"
#include "galley/routing/order.hpp"

namespace galley::dispatch {

/** @struct ChannelMessage
 *  @brief Payload delivered to display subscribers.
 */
struct ChannelMessage {
    enum class Kind : std::uint8_t {
        Entry,   ///< New items for the station
        Cancel   ///< Items (or the whole order) withdrawn
    };

    Kind                          kind{Kind::Entry};
    std::uint64_t                 sequence{0};        ///< Set by DispatchContext, increasing across its Entry and Cancel messages
    std::string                   station_id;
    routing::OrderContext         order;
    routing::RoutingManifestEntry entry;              ///< Kind::Entry
    std::vector<std::string>      cancelled_item_ids; ///< Kind::Cancel; empty = whole order
};

using MessagePtr = std::shared_ptr<const ChannelMessage>;

/** @struct PublishResult
 *  @brief Fan-out of one publish call.
 */
struct PublishResult {
    std::size_t delivered{0};   ///< Subscribers whose mailbox accepted the message
    std::size_t dropped{0};     ///< Subscribers whose mailbox was full
};

class ChannelHub;

/** @class Subscription
 *  @brief Consumer end of one display connection. Move-only; unsubscribes on destruction.
 *  @note poll() must be called from one thread at a time.
 */
class Subscription final {
public:
    Subscription() = default;
    ~Subscription();

    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;
    Subscription(const Subscription&)            = delete;
    Subscription& operator=(const Subscription&) = delete;

    /// Take the next message. Returns false when the mailbox is empty.
    bool poll(MessagePtr& out);

    /// Take everything currently queued.
    std::vector<MessagePtr> drain();

    /// Set after a message was dropped; the client should reload the full station state.
    [[nodiscard]] bool needs_refresh() const noexcept;

    /// Acknowledge a refresh. Returns the previous flag.
    bool clear_refresh() noexcept;

    [[nodiscard]] std::uint64_t dropped() const noexcept;
    [[nodiscard]] const std::string& station_id() const noexcept;
    [[nodiscard]] bool active() const noexcept { return static_cast<bool>(sub_); }

    /// Unsubscribe now (idempotent).
    void reset();

private:
    friend class ChannelHub;
    struct Subscriber;
    struct HubState;

    Subscription(std::weak_ptr<HubState> hub, std::shared_ptr<Subscriber> sub);

    std::weak_ptr<HubState>     hub_;
    std::shared_ptr<Subscriber> sub_;
};

/** @class ChannelHub
 *  @brief Registry of display subscribers keyed by station id.
 *  @note publish() is thread-safe; publishers are serialized internally so each
 *        mailbox keeps a single producer.
 */
class ChannelHub final {
public:
    explicit ChannelHub(std::size_t default_capacity = config::constants::CHANNEL_DEFAULT_CAPACITY);
    ~ChannelHub();

    ChannelHub(const ChannelHub&)            = delete;
    ChannelHub& operator=(const ChannelHub&) = delete;

    /**
     * @brief Attach a new subscriber to @p station_id.
     * @param capacity Mailbox size (power-of-two); 0 selects the hub default.
     */
    galley_detail::expected<Subscription, mem::SpscError>
    subscribe(std::string station_id, std::size_t capacity = 0);

    /// Deliver @p msg to every current subscriber of msg->station_id.
    PublishResult publish(MessagePtr msg);

    [[nodiscard]] std::size_t subscriber_count(std::string_view station_id) const;
    [[nodiscard]] std::uint64_t published() const noexcept;

private:
    std::shared_ptr<Subscription::HubState> state_;
    std::size_t default_capacity_;
};

} // namespace galley::dispatch
