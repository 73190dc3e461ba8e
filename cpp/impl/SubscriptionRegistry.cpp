#include "SubscriptionRegistry.hpp"
#include <algorithm>
#include <exception>
#include <utility>
#include "Logger.hpp"
#include "PayloadCodec.hpp"
#include "TopicFilter.hpp"

namespace quietmqtt
{

    // Subscription Implementation
    struct Subscription::Impl
    {
        std::weak_ptr<SubscriptionRegistry> registry;
        std::shared_ptr<SubscriptionEntry> entry;
    };

    Subscription::Subscription() : impl_(new Impl()) {}

    Subscription::~Subscription()
    {
        close();
        delete impl_;
    }

    bool Subscription::hasValue() const
    {
        std::lock_guard<std::mutex> lock(impl_->entry->mutex);
        return impl_->entry->hasValue;
    }

    Json::Value Subscription::getValue() const
    {
        std::lock_guard<std::mutex> lock(impl_->entry->mutex);
        return impl_->entry->latest;
    }

    uint64_t Subscription::getDeliveredCount() const
    {
        std::lock_guard<std::mutex> lock(impl_->entry->mutex);
        return impl_->entry->delivered;
    }

    const std::vector<std::string> &Subscription::getTopics() const
    {
        return impl_->entry->topics;
    }

    bool Subscription::isActive() const
    {
        std::lock_guard<std::mutex> lock(impl_->entry->mutex);
        return impl_->entry->active;
    }

    void Subscription::close()
    {
        {
            std::lock_guard<std::mutex> lock(impl_->entry->mutex);
            if (!impl_->entry->active)
            {
                return;
            }
            impl_->entry->active = false;
        }
        if (auto registry = impl_->registry.lock())
        {
            registry->remove(impl_->entry->id);
        }
    }

    namespace
    {
        bool matchesAny(const std::vector<std::string> &filters, const std::string &topic)
        {
            for (const auto &filter : filters)
            {
                if (TopicFilter::matches(filter, topic))
                {
                    return true;
                }
            }
            return false;
        }
    }

    // SubscriptionRegistry Implementation
    SubscriptionRegistry::SubscriptionRegistry() : sink_(nullptr), nextId_(1) {}

    void SubscriptionRegistry::setSink(TopicSink *sink)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = sink;
    }

    SubscriptionRegistry::TopicState SubscriptionRegistry::aggregateLocked(const std::string &topic) const
    {
        TopicState state;
        state.noLocal = true;
        for (const auto &item : entries_)
        {
            const auto &entry = item.second;
            if (std::find(entry->topics.begin(), entry->topics.end(), topic) == entry->topics.end())
            {
                continue;
            }
            ++state.refs;
            if (static_cast<int32_t>(entry->options.qos) > static_cast<int32_t>(state.qos))
            {
                state.qos = entry->options.qos;
            }
            state.noLocal = state.noLocal && entry->options.excludeSelf;
        }
        if (state.refs == 0)
        {
            state.noLocal = false;
        }
        return state;
    }

    std::unique_ptr<Subscription> SubscriptionRegistry::add(const std::vector<std::string> &topics,
                                                            const SubscriptionOptions &options)
    {
        auto entry = std::make_shared<SubscriptionEntry>();
        for (const auto &topic : topics)
        {
            if (std::find(entry->topics.begin(), entry->topics.end(), topic) == entry->topics.end())
            {
                entry->topics.push_back(topic);
            }
        }
        entry->options = options;

        TopicSink *sink;
        Grouped toSubscribe;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            entry->id = nextId_++;
            entries_[entry->id] = entry;

            for (const auto &topic : entry->topics)
            {
                TopicState before = topics_[topic];
                TopicState after = aggregateLocked(topic);
                topics_[topic] = after;
                if (before.refs == 0 || before.qos != after.qos || before.noLocal != after.noLocal)
                {
                    toSubscribe[std::make_pair(after.qos, after.noLocal)].push_back(topic);
                }
            }
            sink = sink_;
        }

        issue(sink, toSubscribe, std::vector<std::string>());
        logDebug("subscription {} added for {} topic(s)", entry->id, entry->topics.size());

        std::unique_ptr<Subscription> handle(new Subscription());
        handle->impl_->registry = shared_from_this();
        handle->impl_->entry = entry;
        return handle;
    }

    bool SubscriptionRegistry::remove(uint64_t id)
    {
        TopicSink *sink;
        Grouped toSubscribe;
        std::vector<std::string> toUnsubscribe;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(id);
            if (it == entries_.end())
            {
                return false;
            }
            std::shared_ptr<SubscriptionEntry> entry = it->second;
            entries_.erase(it);
            {
                std::lock_guard<std::mutex> entryLock(entry->mutex);
                entry->active = false;
            }

            for (const auto &topic : entry->topics)
            {
                TopicState before = topics_[topic];
                TopicState after = aggregateLocked(topic);
                if (after.refs == 0)
                {
                    topics_.erase(topic);
                    toUnsubscribe.push_back(topic);
                    continue;
                }
                topics_[topic] = after;
                if (before.qos != after.qos || before.noLocal != after.noLocal)
                {
                    toSubscribe[std::make_pair(after.qos, after.noLocal)].push_back(topic);
                }
            }
            sink = sink_;
        }

        issue(sink, toSubscribe, toUnsubscribe);
        logDebug("subscription {} removed, {} topic(s) released", id, toUnsubscribe.size());
        return true;
    }

    void SubscriptionRegistry::resubscribeAll()
    {
        TopicSink *sink;
        Grouped groups;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto &item : topics_)
            {
                groups[std::make_pair(item.second.qos, item.second.noLocal)].push_back(item.first);
            }
            sink = sink_;
        }
        issue(sink, groups, std::vector<std::string>());
    }

    void SubscriptionRegistry::issue(TopicSink *sink,
                                     const Grouped &toSubscribe,
                                     const std::vector<std::string> &toUnsubscribe)
    {
        if (!sink)
        {
            return;
        }
        if (!toUnsubscribe.empty())
        {
            sink->unsubscribeTopics(toUnsubscribe);
        }
        for (const auto &group : toSubscribe)
        {
            sink->subscribeTopics(group.second, group.first.first, group.first.second);
        }
    }

    size_t SubscriptionRegistry::dispatch(const Message &message, const SelfEchoFilter &filter)
    {
        std::vector<std::shared_ptr<SubscriptionEntry>> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            snapshot.reserve(entries_.size());
            for (const auto &item : entries_)
            {
                snapshot.push_back(item.second);
            }
        }

        const std::string topic = message.getTopic();
        size_t delivered = 0;
        for (const auto &entry : snapshot)
        {
            if (!matchesAny(entry->topics, topic))
            {
                continue;
            }

            const SubscriptionOptions &options = entry->options;
            if (options.excludeSelf)
            {
                bool ownEcho = false;
                try
                {
                    ownEcho = filter.isOwnEcho(message, options.selfWindowMs);
                }
                catch (const std::exception &e)
                {
                    logWarn("self-echo check failed on {}: {}", topic, e.what());
                }
                catch (...)
                {
                    logWarn("self-echo check failed on {}: unknown exception", topic);
                }
                if (ownEcho)
                {
                    logTrace("suppressed own message on {} for subscription {}", topic, entry->id);
                    continue;
                }
            }

            Json::Value value;
            if (options.parser)
            {
                try
                {
                    value = options.parser(message.getPayload(), message.getPayloadLength());
                }
                catch (const std::exception &e)
                {
                    logWarn("parser of subscription {} failed on {}: {}", entry->id, topic, e.what());
                    continue;
                }
                catch (...)
                {
                    logWarn("parser of subscription {} failed on {}: unknown exception", entry->id, topic);
                    continue;
                }
            }
            else
            {
                value = PayloadCodec::decode(message.getPayload(),
                                             message.getPayloadLength(),
                                             options.serializationMode);
            }

            {
                std::lock_guard<std::mutex> lock(entry->mutex);
                if (!entry->active)
                {
                    continue;
                }
                entry->latest = value;
                entry->hasValue = true;
                ++entry->delivered;
            }
            ++delivered;

            if (options.onMessage)
            {
                try
                {
                    options.onMessage(topic, value);
                }
                catch (const std::exception &e)
                {
                    logWarn("message callback of subscription {} threw: {}", entry->id, e.what());
                }
                catch (...)
                {
                    logWarn("message callback of subscription {} threw a non-standard exception", entry->id);
                }
            }
        }
        return delivered;
    }

    size_t SubscriptionRegistry::size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    std::map<std::string, SubscriptionRegistry::TopicState> SubscriptionRegistry::getTopicStates() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return topics_;
    }

} // namespace quietmqtt
