#ifndef QUIETMQTT_SUBSCRIPTION_REGISTRY_HPP_
#define QUIETMQTT_SUBSCRIPTION_REGISTRY_HPP_

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include <json/json.h>
#include "Message.hpp"
#include "SelfEchoFilter.hpp"
#include "Subscription.hpp"

namespace quietmqtt
{

    // Receives the transport-level subscribe/unsubscribe requests the
    // registry derives from its live subscriptions.
    class TopicSink
    {
    public:
        virtual ~TopicSink() {}
        virtual void subscribeTopics(const std::vector<std::string> &topics, Message::QoS qos, bool noLocal) = 0;
        virtual void unsubscribeTopics(const std::vector<std::string> &topics) = 0;
    };

    struct SubscriptionEntry
    {
        uint64_t id{0};
        std::vector<std::string> topics;
        SubscriptionOptions options;

        mutable std::mutex mutex;
        bool active{true};
        bool hasValue{false};
        Json::Value latest;
        uint64_t delivered{0};
    };

    // Live subscriptions of one session. Transport subscriptions are
    // reference counted per topic filter: a filter stays subscribed while any
    // live subscription names it, with the highest requested QoS, and with
    // noLocal only while every subscriber on it excludes its own messages.
    class SubscriptionRegistry : public std::enable_shared_from_this<SubscriptionRegistry>
    {
    public:
        struct TopicState
        {
            size_t refs{0};
            Message::QoS qos{Message::QoS::AT_MOST_ONCE};
            bool noLocal{false};

            bool operator==(const TopicState &other) const
            {
                return refs == other.refs && qos == other.qos && noLocal == other.noLocal;
            }
        };

        SubscriptionRegistry();

        // nullptr detaches; later changes are only tracked.
        void setSink(TopicSink *sink);

        std::unique_ptr<Subscription> add(const std::vector<std::string> &topics,
                                          const SubscriptionOptions &options);

        // Returns false if id is not live.
        bool remove(uint64_t id);

        // Re-issues every tracked topic filter to the sink.
        void resubscribeAll();

        // Routes one inbound message to every matching subscription. Returns
        // the number of subscriptions that received a value.
        size_t dispatch(const Message &message, const SelfEchoFilter &filter);

        size_t size() const;
        std::map<std::string, TopicState> getTopicStates() const;

    private:
        using Grouped = std::map<std::pair<Message::QoS, bool>, std::vector<std::string>>;

        TopicState aggregateLocked(const std::string &topic) const;

        // Called without mutex_ held.
        static void issue(TopicSink *sink,
                          const Grouped &toSubscribe,
                          const std::vector<std::string> &toUnsubscribe);

        mutable std::mutex mutex_;
        TopicSink *sink_;
        uint64_t nextId_;
        std::map<uint64_t, std::shared_ptr<SubscriptionEntry>> entries_;
        std::map<std::string, TopicState> topics_;
    };

} // namespace quietmqtt
#endif // QUIETMQTT_SUBSCRIPTION_REGISTRY_HPP_
