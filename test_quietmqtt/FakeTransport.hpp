#ifndef QUIETMQTT_TEST_FAKE_TRANSPORT_HPP_
#define QUIETMQTT_TEST_FAKE_TRANSPORT_HPP_

#include <memory>
#include <string>
#include <vector>
#include <quietmqtt/Transport.hpp>

namespace quietmqtt
{
namespace test
{

    class FakeTransportFactory;

    struct PublishedMessage
    {
        std::string topic;
        std::vector<uint8_t> payload;
        PublishParams params;

        std::string text() const { return std::string(payload.begin(), payload.end()); }
    };

    struct SubscribeCall
    {
        std::vector<std::string> topics;
        Message::QoS qos;
        bool noLocal;
    };

    // In-memory transport. Records every request and lets the test raise
    // transport events by hand.
    class FakeTransport : public Transport
    {
    public:
        explicit FakeTransport(FakeTransportFactory &owner);
        ~FakeTransport() override;

        void setListener(TransportListener *listener) override;
        bool connect(const ConnectionConfig &config) override;
        void close() override;
        bool publish(const std::string &topic,
                     const std::vector<uint8_t> &payload,
                     const PublishParams &params) override;
        bool subscribe(const std::vector<std::string> &topics, Message::QoS qos, bool noLocal) override;
        bool unsubscribe(const std::vector<std::string> &topics) override;

        void emitConnected();
        void emitConnectionLost(bool willRetry);
        void emitClosed();
        void emitError(int code, const char *message);
        void deliver(const Message &message);

        // Sends published message index back as a broker would. With
        // keepProperties false the user properties are stripped, as by a
        // broker without MQTT 5.
        void echo(size_t index, bool keepProperties = true);

        bool hasListener() const { return listener_ != nullptr; }
        bool isClosed() const { return closed_; }
        int getConnectCalls() const { return connectCalls_; }
        const ConnectionConfig &getConfig() const { return config_; }

        std::vector<PublishedMessage> published;
        std::vector<SubscribeCall> subscribeCalls;
        std::vector<std::vector<std::string>> unsubscribeCalls;
        bool acceptPublish{true};
        bool acceptSubscribe{true};

    private:
        FakeTransportFactory &owner_;
        TransportListener *listener_{nullptr};
        ConnectionConfig config_;
        bool closed_{false};
        int connectCalls_{0};
    };

    class FakeTransportFactory : public TransportFactory
    {
    public:
        std::unique_ptr<Transport> createTransport(const ConnectionConfig &config) override
        {
            if (failCreate)
            {
                return std::unique_ptr<Transport>();
            }
            auto *transport = new FakeTransport(*this);
            current_ = transport;
            ++created;
            return std::unique_ptr<Transport>(transport);
        }

        // Most recently created transport, or nullptr once it is destroyed.
        FakeTransport *current() const { return current_; }

        void record(const std::string &operation) { operations.push_back(operation); }

        void onDestroyed(FakeTransport *transport)
        {
            record("destroy");
            if (current_ == transport)
            {
                current_ = nullptr;
            }
            ++destroyed;
        }

        bool failCreate{false};
        bool acceptConnect{true};
        int created{0};
        int destroyed{0};
        std::vector<std::string> operations;

    private:
        FakeTransport *current_{nullptr};
    };

    inline FakeTransport::FakeTransport(FakeTransportFactory &owner) : owner_(owner) {}

    inline FakeTransport::~FakeTransport()
    {
        owner_.onDestroyed(this);
    }

    inline void FakeTransport::setListener(TransportListener *listener)
    {
        owner_.record(listener ? "attach" : "detach");
        listener_ = listener;
    }

    inline bool FakeTransport::connect(const ConnectionConfig &config)
    {
        owner_.record("connect");
        ++connectCalls_;
        config_ = config;
        return owner_.acceptConnect;
    }

    inline void FakeTransport::close()
    {
        owner_.record("close");
        closed_ = true;
    }

    inline bool FakeTransport::publish(const std::string &topic,
                                       const std::vector<uint8_t> &payload,
                                       const PublishParams &params)
    {
        if (!acceptPublish)
        {
            return false;
        }
        published.push_back(PublishedMessage{topic, payload, params});
        return true;
    }

    inline bool FakeTransport::subscribe(const std::vector<std::string> &topics, Message::QoS qos, bool noLocal)
    {
        subscribeCalls.push_back(SubscribeCall{topics, qos, noLocal});
        return acceptSubscribe;
    }

    inline bool FakeTransport::unsubscribe(const std::vector<std::string> &topics)
    {
        unsubscribeCalls.push_back(topics);
        return true;
    }

    inline void FakeTransport::emitConnected()
    {
        if (listener_)
            listener_->onConnected();
    }

    inline void FakeTransport::emitConnectionLost(bool willRetry)
    {
        if (listener_)
            listener_->onConnectionLost(willRetry, "test drop");
    }

    inline void FakeTransport::emitClosed()
    {
        if (listener_)
            listener_->onClosed();
    }

    inline void FakeTransport::emitError(int code, const char *message)
    {
        if (listener_)
            listener_->onError(code, message);
    }

    inline void FakeTransport::deliver(const Message &message)
    {
        if (listener_)
            listener_->onMessage(message);
    }

    inline void FakeTransport::echo(size_t index, bool keepProperties)
    {
        const PublishedMessage &sent = published.at(index);
        Message message(sent.topic, sent.payload.data(), sent.payload.size());
        message.setQoS(sent.params.qos).setRetained(sent.params.retain);
        if (keepProperties)
        {
            for (const auto &property : sent.params.userProperties)
            {
                message.addUserProperty(property.first, property.second);
            }
        }
        deliver(message);
    }

} // namespace test
} // namespace quietmqtt
#endif // QUIETMQTT_TEST_FAKE_TRANSPORT_HPP_
