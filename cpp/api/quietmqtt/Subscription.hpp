#ifndef QUIETMQTT_SUBSCRIPTION_HPP_
#define QUIETMQTT_SUBSCRIPTION_HPP_

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include <json/json.h>
#include "Message.hpp"
#include "PayloadCodec.hpp"
#include "SelfEchoFilter.hpp"
#include "dllexport.h"

namespace quietmqtt
{

    struct SubscriptionOptions
    {
        Message::QoS qos{Message::QoS::AT_MOST_ONCE};
        bool excludeSelf{false};
        int64_t selfWindowMs{SelfEchoFilter::DEFAULT_WINDOW_MS};
        SerializationMode serializationMode{SerializationMode::AUTO};

        std::function<void(const std::string &topic, const Json::Value &value)> onMessage;

        std::function<Json::Value(const uint8_t *payload, size_t length)> parser;
    };

    class SubscriptionRegistry;

    class Subscription
    {
    public:
        QUIETMQTT_DLLEXPORT ~Subscription();

        Subscription(const Subscription &) = delete;
        Subscription &operator=(const Subscription &) = delete;

        QUIETMQTT_DLLEXPORT bool hasValue() const;
        QUIETMQTT_DLLEXPORT Json::Value getValue() const;

        QUIETMQTT_DLLEXPORT uint64_t getDeliveredCount() const;
        QUIETMQTT_DLLEXPORT const std::vector<std::string> &getTopics() const;
        QUIETMQTT_DLLEXPORT bool isActive() const;
        QUIETMQTT_DLLEXPORT void close();

    private:
        friend class SubscriptionRegistry;
        Subscription();
        struct Impl;
        Impl *impl_;
    };

} // namespace quietmqtt
#endif // QUIETMQTT_SUBSCRIPTION_HPP_
