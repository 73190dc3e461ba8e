#include "Session.hpp"
#include <exception>
#include <mutex>
#include <utility>
#include "ConnectionStateMachine.hpp"
#include "Logger.hpp"
#include "SubscriptionRegistry.hpp"
#include "TopicFilter.hpp"
#include "UsageError.hpp"

namespace quietmqtt
{

    struct Session::Impl : public TransportListener, public TopicSink
    {
        Impl(TransportFactory &factory, SessionHandler *handler, SelfEchoFilter::Clock clock)
            : factory(factory),
              sessionHandler(handler),
              filter(SelfEchoFilter::generateIdentity(), std::move(clock)),
              registry(std::make_shared<SubscriptionRegistry>()),
              reportedState(SessionState::OFFLINE)
        {
        }

        TransportFactory &factory;
        SessionHandler *sessionHandler;
        SelfEchoFilter filter;
        std::shared_ptr<SubscriptionRegistry> registry;

        // Serializes start, reconfigure and stop.
        std::mutex lifecycleMutex;

        // Guards everything below.
        mutable std::mutex stateMutex;
        ConnectionStateMachine machine;
        SessionState reportedState;
        std::unique_ptr<Transport> transport;
        ConnectionConfig config;

        SessionHandler *handler() const
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            return sessionHandler;
        }

        // Reports the current state to the handler if it differs from the
        // last reported one. Called without stateMutex held.
        void notifyIfChanged()
        {
            SessionState state;
            SessionHandler *h;
            {
                std::lock_guard<std::mutex> lock(stateMutex);
                state = machine.getState();
                if (state == reportedState)
                {
                    return;
                }
                reportedState = state;
                h = sessionHandler;
            }
            logDebug("session {} is {}", filter.getPublisherIdentity(), toString(state));
            if (h)
            {
                h->onStateChange(state);
            }
        }

        void applyEvent(ConnectionEvent event)
        {
            {
                std::lock_guard<std::mutex> lock(stateMutex);
                machine.apply(event);
            }
            notifyIfChanged();
        }

        void reportError(int code, const char *message)
        {
            logError("session {}: {} ({})", filter.getPublisherIdentity(), message, code);
            if (SessionHandler *h = handler())
            {
                h->onError(code, message);
            }
        }

        // Detach the listener, force-close the transport, drop it. The
        // session stops routing calls to the transport before detaching.
        void teardown()
        {
            std::unique_ptr<Transport> old;
            {
                std::lock_guard<std::mutex> lock(stateMutex);
                old = std::move(transport);
            }
            if (!old)
            {
                return;
            }
            old->setListener(nullptr);
            old->close();
            old.reset();
            filter.reset();
        }

        bool createAndConnect(const ConnectionConfig &newConfig)
        {
            std::unique_ptr<Transport> created = factory.createTransport(newConfig);
            if (!created)
            {
                {
                    std::lock_guard<std::mutex> lock(stateMutex);
                    machine.apply(ConnectionEvent::TRANSPORT_ERROR);
                }
                notifyIfChanged();
                reportError(-1, "Failed to create transport");
                return false;
            }
            created->setListener(this);

            bool accepted;
            {
                std::lock_guard<std::mutex> lock(stateMutex);
                transport = std::move(created);
                config = newConfig;
                machine.reset();
                machine.apply(ConnectionEvent::CONNECT_REQUESTED);
            }
            notifyIfChanged();

            {
                std::lock_guard<std::mutex> lock(stateMutex);
                accepted = transport && transport->connect(newConfig);
            }
            if (!accepted)
            {
                teardown();
                applyEvent(ConnectionEvent::TRANSPORT_ERROR);
                reportError(-1, "Connection failed");
                return false;
            }
            logInfo("session {} connecting to {}", filter.getPublisherIdentity(), newConfig.getServerUri());
            return true;
        }

        // TransportListener
        void onConnected() override
        {
            applyEvent(ConnectionEvent::TRANSPORT_CONNECTED);
            registry->resubscribeAll();
        }

        void onConnectionLost(bool willRetry, const char *cause) override
        {
            logWarn("session {} lost connection: {}", filter.getPublisherIdentity(),
                    cause ? cause : "Connection lost");
            applyEvent(willRetry ? ConnectionEvent::TRANSPORT_DROPPED_RETRY
                                 : ConnectionEvent::TRANSPORT_CLOSED);
        }

        void onClosed() override
        {
            applyEvent(ConnectionEvent::TRANSPORT_CLOSED);
        }

        void onError(int errorCode, const char *message) override
        {
            applyEvent(ConnectionEvent::TRANSPORT_ERROR);
            reportError(errorCode, message ? message : "Transport error");
        }

        void onMessage(const Message &message) override
        {
            registry->dispatch(message, filter);
        }

        // TopicSink
        void subscribeTopics(const std::vector<std::string> &topics, Message::QoS qos, bool noLocal) override
        {
            bool ok = true;
            {
                std::lock_guard<std::mutex> lock(stateMutex);
                if (!transport || machine.getState() != SessionState::ONLINE)
                {
                    return;
                }
                ok = transport->subscribe(topics, qos, noLocal);
            }
            if (!ok)
            {
                reportError(-1, "Subscribe failed");
            }
        }

        void unsubscribeTopics(const std::vector<std::string> &topics) override
        {
            bool ok = true;
            {
                std::lock_guard<std::mutex> lock(stateMutex);
                if (!transport || machine.getState() != SessionState::ONLINE)
                {
                    return;
                }
                ok = transport->unsubscribe(topics);
            }
            if (!ok)
            {
                reportError(-1, "Unsubscribe failed");
            }
        }
    };

    Session::Session(TransportFactory &factory, SessionHandler *handler, SelfEchoFilter::Clock clock)
        : impl_(new Impl(factory, handler, std::move(clock)))
    {
        impl_->registry->setSink(impl_);
    }

    Session::~Session()
    {
        stop();
        impl_->registry->setSink(nullptr);
        delete impl_;
    }

    Session::State Session::getState() const
    {
        std::lock_guard<std::mutex> lock(impl_->stateMutex);
        return impl_->machine.getState();
    }

    const std::string &Session::getPublisherIdentity() const
    {
        return impl_->filter.getPublisherIdentity();
    }

    ConnectionConfig Session::getConfig() const
    {
        std::lock_guard<std::mutex> lock(impl_->stateMutex);
        return impl_->config;
    }

    bool Session::start(const ConnectionConfig &config)
    {
        return reconfigure(config);
    }

    bool Session::reconfigure(const ConnectionConfig &config)
    {
        std::lock_guard<std::mutex> lifecycle(impl_->lifecycleMutex);
        {
            std::lock_guard<std::mutex> lock(impl_->stateMutex);
            if (impl_->transport && impl_->config == config &&
                impl_->machine.getState() != SessionState::ERROR)
            {
                return true;
            }
        }

        if (config.getServerUri().empty())
        {
            impl_->reportError(-1, "Broker URL not set");
            return false;
        }

        impl_->teardown();
        return impl_->createAndConnect(config);
    }

    bool Session::stop()
    {
        std::lock_guard<std::mutex> lifecycle(impl_->lifecycleMutex);
        impl_->teardown();
        impl_->applyEvent(ConnectionEvent::TRANSPORT_CLOSED);
        return true;
    }

    bool Session::publish(const std::string &topic, const Value &value, const PublishOptions &options)
    {
        if (topic.empty() || TopicFilter::hasWildcards(topic))
        {
            throw UsageError("invalid publish topic '" + topic + "'");
        }

        std::vector<uint8_t> payload = PayloadCodec::encode(value, options.serializationMode);

        PublishParams params;
        params.qos = options.qos;
        params.retain = options.retain;
        for (const auto &property : options.userProperties)
        {
            if (property.first != SelfEchoFilter::IDENTITY_PROPERTY)
            {
                params.userProperties.push_back(property);
            }
        }
        params.userProperties.emplace_back(SelfEchoFilter::IDENTITY_PROPERTY, getPublisherIdentity());

        bool ok;
        {
            std::lock_guard<std::mutex> lock(impl_->stateMutex);
            if (!impl_->transport)
            {
                throw UsageError("publish called before a connection exists");
            }
            try
            {
                impl_->filter.recordPublish(topic, payload.data(), payload.size());
            }
            catch (const std::exception &e)
            {
                logWarn("could not record publish on {}: {}", topic, e.what());
            }
            ok = impl_->transport->publish(topic, payload, params);
        }

        if (!ok)
        {
            impl_->reportError(-1, "Publish failed");
        }
        return ok;
    }

    std::unique_ptr<Subscription> Session::subscribe(const std::vector<std::string> &topics,
                                                     const SubscriptionOptions &options)
    {
        if (topics.empty())
        {
            throw UsageError("subscribe needs at least one topic");
        }
        for (const auto &topic : topics)
        {
            if (!TopicFilter::isValidFilter(topic))
            {
                throw UsageError("invalid topic filter '" + topic + "'");
            }
        }
        return impl_->registry->add(topics, options);
    }

    std::unique_ptr<Subscription> Session::subscribe(const std::string &topic,
                                                     const SubscriptionOptions &options)
    {
        return subscribe(std::vector<std::string>{topic}, options);
    }

    size_t Session::getSubscriptionCount() const
    {
        return impl_->registry->size();
    }

    size_t Session::getRecentPublishCount() const
    {
        return impl_->filter.size();
    }

    void Session::setSessionHandler(SessionHandler *handler)
    {
        std::lock_guard<std::mutex> lock(impl_->stateMutex);
        impl_->sessionHandler = handler;
    }

} // namespace quietmqtt
