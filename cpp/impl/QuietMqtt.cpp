#include "QuietMqtt.hpp"
#include <string>
#include <vector>

namespace quietmqtt
{

    // Message Implementation
    struct Message::Impl
    {
        std::string topic;
        std::vector<uint8_t> payload;
        Message::QoS qos{Message::QoS::AT_MOST_ONCE};
        bool retained{false};
        int64_t messageId{0};
        UserProperties userProperties;
    };

    Message::Message(const std::string &topic, const uint8_t *payload, size_t length)
        : impl_(new Impl())
    {
        impl_->topic = topic;
        if (payload && length > 0)
        {
            impl_->payload.assign(payload, payload + length);
        }
    }

    Message::Message(const std::string &topic, const std::string &payload)
        : Message(topic, reinterpret_cast<const uint8_t *>(payload.data()), payload.size())
    {
    }

    Message::Message(const Message &other) : impl_(new Impl(*other.impl_)) {}

    Message &Message::operator=(const Message &other)
    {
        if (this != &other)
        {
            *impl_ = *other.impl_;
        }
        return *this;
    }

    Message::~Message() { delete impl_; }

    const char *Message::getTopic() const { return impl_->topic.c_str(); }
    const uint8_t *Message::getPayload() const { return impl_->payload.data(); }
    size_t Message::getPayloadLength() const { return impl_->payload.size(); }
    Message::QoS Message::getQoS() const { return impl_->qos; }
    bool Message::isRetained() const { return impl_->retained; }
    int64_t Message::getMessageId() const { return impl_->messageId; }
    const UserProperties &Message::getUserProperties() const { return impl_->userProperties; }

    const std::string *Message::getUserProperty(const std::string &key) const
    {
        for (const auto &property : impl_->userProperties)
        {
            if (property.first == key)
            {
                return &property.second;
            }
        }
        return nullptr;
    }

    Message &Message::setQoS(QoS qos)
    {
        impl_->qos = qos;
        return *this;
    }

    Message &Message::setRetained(bool retained)
    {
        impl_->retained = retained;
        return *this;
    }

    Message &Message::setMessageId(int64_t messageId)
    {
        impl_->messageId = messageId;
        return *this;
    }

    Message &Message::addUserProperty(const std::string &key, const std::string &value)
    {
        impl_->userProperties.emplace_back(key, value);
        return *this;
    }

    // Connection Config Implementation
    struct ConnectionConfig::Impl
    {
        std::string serverUri;
        std::string broker;
        uint16_t port{1883};
        std::string clientId;
        std::string username;
        std::string password;
        std::string caFile;
        std::string certFile;
        std::string keyFile;
        int32_t keepAliveInterval{60};
        bool cleanSession{true};
        int32_t connectionTimeout{30};
        int32_t maxInflight{10};
        int32_t maxQueuedMessages{100};
        int32_t reconnectDelay{1};
        int32_t maxReconnectDelay{60};
        bool automaticReconnect{true};
        bool tlsEnabled{false};
        int32_t protocolVersion{ConnectionConfig::MQTT_VERSION_5};

        bool operator==(const Impl &o) const
        {
            return serverUri == o.serverUri && broker == o.broker && port == o.port &&
                   clientId == o.clientId && username == o.username && password == o.password &&
                   caFile == o.caFile && certFile == o.certFile && keyFile == o.keyFile &&
                   keepAliveInterval == o.keepAliveInterval && cleanSession == o.cleanSession &&
                   connectionTimeout == o.connectionTimeout && maxInflight == o.maxInflight &&
                   maxQueuedMessages == o.maxQueuedMessages && reconnectDelay == o.reconnectDelay &&
                   maxReconnectDelay == o.maxReconnectDelay &&
                   automaticReconnect == o.automaticReconnect && tlsEnabled == o.tlsEnabled &&
                   protocolVersion == o.protocolVersion;
        }
    };

    ConnectionConfig::ConnectionConfig() : impl_(new Impl()) {}
    ConnectionConfig::ConnectionConfig(const ConnectionConfig &other) : impl_(new Impl(*other.impl_)) {}
    ConnectionConfig::~ConnectionConfig() { delete impl_; }

    ConnectionConfig &ConnectionConfig::operator=(const ConnectionConfig &other)
    {
        if (this != &other)
        {
            *impl_ = *other.impl_;
        }
        return *this;
    }

    ConnectionConfig &ConnectionConfig::set(Parameter param, int32_t value)
    {
        switch (param)
        {
        case Parameter::KEEP_ALIVE_INTERVAL:
            impl_->keepAliveInterval = value;
            break;
        case Parameter::CONNECTION_TIMEOUT:
            impl_->connectionTimeout = value;
            break;
        case Parameter::MAX_INFLIGHT:
            impl_->maxInflight = value;
            break;
        case Parameter::MAX_QUEUED_MESSAGES:
            impl_->maxQueuedMessages = value;
            break;
        case Parameter::RECONNECT_DELAY:
            impl_->reconnectDelay = value;
            break;
        case Parameter::MAX_RECONNECT_DELAY:
            impl_->maxReconnectDelay = value;
            break;
        case Parameter::PROTOCOL_VERSION:
            impl_->protocolVersion = value;
            break;
        default:
            break;
        }
        return *this;
    }

    ConnectionConfig &ConnectionConfig::set(Parameter param, bool value)
    {
        switch (param)
        {
        case Parameter::CLEAN_SESSION:
            impl_->cleanSession = value;
            break;
        case Parameter::TLS_ENABLED:
            impl_->tlsEnabled = value;
            break;
        case Parameter::AUTOMATIC_RECONNECT:
            impl_->automaticReconnect = value;
            break;
        default:
            break;
        }
        return *this;
    }

    ConnectionConfig &ConnectionConfig::setBroker(const char *host, uint16_t port)
    {
        impl_->broker = host ? host : "";
        impl_->port = port;
        return *this;
    }

    ConnectionConfig &ConnectionConfig::setServerUri(const char *uri)
    {
        impl_->serverUri = uri ? uri : "";
        return *this;
    }

    ConnectionConfig &ConnectionConfig::setClientId(const char *clientId)
    {
        impl_->clientId = clientId ? clientId : "";
        return *this;
    }

    ConnectionConfig &ConnectionConfig::setCredentials(const char *username, const char *password)
    {
        impl_->username = username ? username : "";
        impl_->password = password ? password : "";
        return *this;
    }

    ConnectionConfig &ConnectionConfig::setTlsCertificates(const char *caFile,
                                                           const char *certFile,
                                                           const char *keyFile)
    {
        impl_->caFile = caFile ? caFile : "";
        impl_->certFile = certFile ? certFile : "";
        impl_->keyFile = keyFile ? keyFile : "";
        impl_->tlsEnabled = true;
        return *this;
    }

    int32_t ConnectionConfig::getInt(Parameter param) const
    {
        switch (param)
        {
        case Parameter::KEEP_ALIVE_INTERVAL:
            return impl_->keepAliveInterval;
        case Parameter::CONNECTION_TIMEOUT:
            return impl_->connectionTimeout;
        case Parameter::MAX_INFLIGHT:
            return impl_->maxInflight;
        case Parameter::MAX_QUEUED_MESSAGES:
            return impl_->maxQueuedMessages;
        case Parameter::RECONNECT_DELAY:
            return impl_->reconnectDelay;
        case Parameter::MAX_RECONNECT_DELAY:
            return impl_->maxReconnectDelay;
        case Parameter::PROTOCOL_VERSION:
            return impl_->protocolVersion;
        default:
            return 0;
        }
    }

    bool ConnectionConfig::getBool(Parameter param) const
    {
        switch (param)
        {
        case Parameter::CLEAN_SESSION:
            return impl_->cleanSession;
        case Parameter::TLS_ENABLED:
            return impl_->tlsEnabled;
        case Parameter::AUTOMATIC_RECONNECT:
            return impl_->automaticReconnect;
        default:
            return false;
        }
    }

    std::string ConnectionConfig::getServerUri() const
    {
        if (!impl_->serverUri.empty())
        {
            return impl_->serverUri;
        }
        if (impl_->broker.empty())
        {
            return std::string();
        }
        return (impl_->tlsEnabled ? "ssl://" : "tcp://") +
               impl_->broker + ":" + std::to_string(impl_->port);
    }

    const std::string &ConnectionConfig::getClientId() const { return impl_->clientId; }
    const std::string &ConnectionConfig::getUsername() const { return impl_->username; }
    const std::string &ConnectionConfig::getPassword() const { return impl_->password; }
    const std::string &ConnectionConfig::getCaFile() const { return impl_->caFile; }
    const std::string &ConnectionConfig::getCertFile() const { return impl_->certFile; }
    const std::string &ConnectionConfig::getKeyFile() const { return impl_->keyFile; }

    bool ConnectionConfig::operator==(const ConnectionConfig &other) const
    {
        return *impl_ == *other.impl_;
    }

    bool ConnectionConfig::operator!=(const ConnectionConfig &other) const
    {
        return !(*this == other);
    }

    const char *toString(SessionState state)
    {
        switch (state)
        {
        case SessionState::OFFLINE:
            return "offline";
        case SessionState::CONNECTING:
            return "connecting";
        case SessionState::ONLINE:
            return "online";
        case SessionState::RECONNECTING:
            return "reconnecting";
        case SessionState::ERROR:
            return "error";
        }
        return "unknown";
    }

} // namespace quietmqtt
