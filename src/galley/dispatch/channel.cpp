/**
 * @file channel.cpp
 * @brief Bounded fan-out to display subscribers.
 */
#include "galley/dispatch/channel.hpp"
#include "galley/obs/logger.hpp"

#include <algorithm>

namespace galley::dispatch {

struct Subscription::Subscriber {
    std::uint64_t                 id{0};
    std::string                   station_id;
    mem::SpscQueue<MessagePtr>    mailbox;
    std::atomic<bool>             needs_refresh{false};
    std::atomic<std::uint64_t>    dropped{0};
};

struct Subscription::HubState {
    mutable std::mutex mu;
    std::map<std::string, std::vector<std::shared_ptr<Subscriber>>, std::less<>> subscribers;
    std::uint64_t next_id{1};
    std::atomic<std::uint64_t> sequence{0};

    void remove(const std::shared_ptr<Subscriber>& sub) {
        std::lock_guard<std::mutex> lk(mu);
        const auto it = subscribers.find(sub->station_id);
        if (it == subscribers.end()) return;
        auto& list = it->second;
        list.erase(std::remove(list.begin(), list.end(), sub), list.end());
        if (list.empty()) subscribers.erase(it);
    }
};

//-------------------------------- Subscription --------------------------------

Subscription::Subscription(std::weak_ptr<HubState> hub, std::shared_ptr<Subscriber> sub)
    : hub_(std::move(hub)), sub_(std::move(sub)) {}

Subscription::~Subscription() { reset(); }

Subscription::Subscription(Subscription&& other) noexcept
    : hub_(std::move(other.hub_)), sub_(std::move(other.sub_)) {}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        reset();
        hub_ = std::move(other.hub_);
        sub_ = std::move(other.sub_);
    }
    return *this;
}

void Subscription::reset() {
    if (!sub_) return;
    if (auto hub = hub_.lock()) {
        hub->remove(sub_);
        obs::logger()->debug("channel: subscriber {} left '{}'", sub_->id, sub_->station_id);
    }
    sub_.reset();
    hub_.reset();
}

bool Subscription::poll(MessagePtr& out) {
    return sub_ && sub_->mailbox.pop(out);
}

std::vector<MessagePtr> Subscription::drain() {
    std::vector<MessagePtr> out;
    MessagePtr m;
    while (poll(m)) out.push_back(std::move(m));
    return out;
}

bool Subscription::needs_refresh() const noexcept {
    return sub_ && sub_->needs_refresh.load(std::memory_order_acquire);
}

bool Subscription::clear_refresh() noexcept {
    return sub_ && sub_->needs_refresh.exchange(false, std::memory_order_acq_rel);
}

std::uint64_t Subscription::dropped() const noexcept {
    return sub_ ? sub_->dropped.load(std::memory_order_relaxed) : 0;
}

const std::string& Subscription::station_id() const noexcept {
    static const std::string none;
    return sub_ ? sub_->station_id : none;
}

//--------------------------------- ChannelHub ---------------------------------

ChannelHub::ChannelHub(std::size_t default_capacity)
    : state_(std::make_shared<Subscription::HubState>()), default_capacity_(default_capacity) {}

ChannelHub::~ChannelHub() = default;

galley_detail::expected<Subscription, mem::SpscError>
ChannelHub::subscribe(std::string station_id, std::size_t capacity) {
    auto mailbox = mem::SpscQueue<MessagePtr>::with_capacity(capacity == 0 ? default_capacity_ : capacity);
    if (!mailbox) return galley_detail::unexpected(mailbox.error());

    auto sub = std::make_shared<Subscription::Subscriber>();
    sub->station_id = std::move(station_id);
    sub->mailbox    = std::move(*mailbox);

    {
        std::lock_guard<std::mutex> lk(state_->mu);
        sub->id = state_->next_id++;
        state_->subscribers[sub->station_id].push_back(sub);
    }
    obs::logger()->debug("channel: subscriber {} joined '{}'", sub->id, sub->station_id);
    return Subscription(state_, std::move(sub));
}

PublishResult ChannelHub::publish(MessagePtr msg) {
    PublishResult r;
    if (!msg) return r;

    std::lock_guard<std::mutex> lk(state_->mu);
    state_->sequence.fetch_add(1, std::memory_order_relaxed);
    const auto it = state_->subscribers.find(msg->station_id);
    if (it == state_->subscribers.end()) return r;

    for (const auto& sub : it->second) {
        MessagePtr copy = msg;
        if (sub->mailbox.push(std::move(copy))) {
            ++r.delivered;
        } else {
            sub->dropped.fetch_add(1, std::memory_order_relaxed);
            if (!sub->needs_refresh.exchange(true, std::memory_order_acq_rel)) {
                obs::logger()->warn("channel: subscriber {} of '{}' is full, flagged for refresh",
                                    sub->id, sub->station_id);
            }
            ++r.dropped;
        }
    }
    return r;
}

std::size_t ChannelHub::subscriber_count(std::string_view station_id) const {
    std::lock_guard<std::mutex> lk(state_->mu);
    const auto it = state_->subscribers.find(station_id);
    return it == state_->subscribers.end() ? 0 : it->second.size();
}

std::uint64_t ChannelHub::published() const noexcept {
    return state_->sequence.load(std::memory_order_relaxed);
}

} // namespace galley::dispatch
