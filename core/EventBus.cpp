#include "core/EventBus.hpp"
#include "core/ThreadPool.hpp"
#include "core/Logger.hpp"
#include <chrono>
#include <algorithm>

namespace homescout {

uint64_t Event::GetCurrentTimestamp() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

EventBus::EventBus() = default;

EventBus::~EventBus() {
    ShutdownAsyncPool();
}

SubscriptionId EventBus::Subscribe(EventType type, EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    subscribers_[type].emplace_back(id, std::move(handler));
    return id;
}

SubscriptionId EventBus::SubscribeAll(EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    wildcard_subscribers_.emplace_back(id, std::move(handler));
    return id;
}

void EventBus::Unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto matches = [id](const auto& pair) { return pair.first == id; };
    for (auto& [type, handlers] : subscribers_) {
        handlers.erase(std::remove_if(handlers.begin(), handlers.end(), matches), handlers.end());
    }
    wildcard_subscribers_.erase(
        std::remove_if(wildcard_subscribers_.begin(), wildcard_subscribers_.end(), matches),
        wildcard_subscribers_.end());
}

void EventBus::Publish(const Event& event) {
    std::vector<EventHandler> handlers_copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscribers_.find(event.type);
        if (it != subscribers_.end()) {
            handlers_copy.reserve(it->second.size() + wildcard_subscribers_.size());
            for (const auto& [id, handler] : it->second) {
                handlers_copy.push_back(handler);
            }
        }
        for (const auto& [id, handler] : wildcard_subscribers_) {
            handlers_copy.push_back(handler);
        }
    }

    // Observer exceptions are logged, never propagated to the publisher.
    for (const auto& handler : handlers_copy) {
        try {
            handler(event);
        } catch (const std::exception& ex) {
            LOG_ERROR("EventBus: observer for {} threw: {}", EventTypeToString(event.type), ex.what());
        }
    }
}

void EventBus::PublishAsync(Event event) {
    if (async_pool_) {
        try {
            async_pool_->Enqueue([this, event = std::move(event)]() {
                Publish(event);
            });
            return;
        } catch (const std::runtime_error& ex) {
            LOG_WARN("EventBus: async pool unavailable ({}), publishing synchronously", ex.what());
        }
    }
    // Fallback: publish synchronously if pool not initialized
    Publish(event);
}

void EventBus::InitAsyncPool() {
    if (!async_pool_) {
        async_pool_ = std::make_unique<ThreadPool>(1);
    }
}

void EventBus::ShutdownAsyncPool() {
    if (async_pool_) {
        async_pool_->Shutdown();
        async_pool_.reset();
    }
}

size_t EventBus::GetSubscriberCount(EventType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscribers_.find(type);
    size_t typed = it != subscribers_.end() ? it->second.size() : 0;
    return typed + wildcard_subscribers_.size();
}

void EventBus::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.clear();
    wildcard_subscribers_.clear();
}

} // namespace homescout
