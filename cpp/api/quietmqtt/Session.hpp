#ifndef QUIETMQTT_SESSION_HPP_
#define QUIETMQTT_SESSION_HPP_

#include <memory>
#include <string>
#include <vector>
#include "Message.hpp"
#include "SessionHandler.hpp"
#include "ConnectionConfig.hpp"
#include "PayloadCodec.hpp"
#include "SelfEchoFilter.hpp"
#include "Subscription.hpp"
#include "Transport.hpp"
#include "dllexport.h"

namespace quietmqtt
{
    struct PublishOptions
    {
        Message::QoS qos{Message::QoS::AT_MOST_ONCE};
        bool retain{false};
        SerializationMode serializationMode{SerializationMode::AUTO};
        UserProperties userProperties;
    };

    class Session
    {
    public:
        using State = SessionState;

        // factory must outlive the session.
        QUIETMQTT_DLLEXPORT Session(TransportFactory &factory,
                                    SessionHandler *handler = nullptr,
                                    SelfEchoFilter::Clock clock = SelfEchoFilter::Clock());
        QUIETMQTT_DLLEXPORT ~Session();

        Session(const Session &) = delete;
        Session &operator=(const Session &) = delete;

        QUIETMQTT_DLLEXPORT State getState() const;
        QUIETMQTT_DLLEXPORT const std::string &getPublisherIdentity() const;
        QUIETMQTT_DLLEXPORT ConnectionConfig getConfig() const;

        // Connection management
        QUIETMQTT_DLLEXPORT bool start(const ConnectionConfig &config);
        // No-op while connected or connecting with equal parameters.
        QUIETMQTT_DLLEXPORT bool reconfigure(const ConnectionConfig &config);
        QUIETMQTT_DLLEXPORT bool stop();

        // Publishing
        QUIETMQTT_DLLEXPORT bool publish(const std::string &topic,
                                         const Value &value,
                                         const PublishOptions &options = PublishOptions());

        // Subscription management
        QUIETMQTT_DLLEXPORT std::unique_ptr<Subscription> subscribe(const std::vector<std::string> &topics,
                                                                    const SubscriptionOptions &options = SubscriptionOptions());
        QUIETMQTT_DLLEXPORT std::unique_ptr<Subscription> subscribe(const std::string &topic,
                                                                    const SubscriptionOptions &options = SubscriptionOptions());
        QUIETMQTT_DLLEXPORT size_t getSubscriptionCount() const;

        QUIETMQTT_DLLEXPORT size_t getRecentPublishCount() const;

        // Handler registration
        QUIETMQTT_DLLEXPORT void setSessionHandler(SessionHandler *handler);

    private:
        struct Impl;
        Impl *impl_;
    };

} // namespace quietmqtt
#endif // QUIETMQTT_SESSION_HPP_
