#include "PahoTransport.hpp"
#include <MQTTAsync.h>
#include <exception>
#include <mutex>
#include <quietmqtt/Logger.hpp>

namespace quietmqtt
{

    struct PahoTransport::Impl
    {
        MQTTAsync client{nullptr};
        ConnectionConfig config;
        bool mqtt5{true};
        bool autoReconnect{true};

        std::mutex listenerMutex;
        TransportListener *listener{nullptr};

        template <typename Fn>
        void notify(Fn &&fn)
        {
            std::lock_guard<std::mutex> lock(listenerMutex);
            if (listener)
            {
                fn(*listener);
            }
        }

        static void onConnected(void *context, char *cause)
        {
            auto *impl = static_cast<PahoTransport::Impl *>(context);
            logDebug("paho connected{}{}", cause ? ": " : "", cause ? cause : "");
            impl->notify([](TransportListener &l)
                         { l.onConnected(); });
        }

        static void onConnectionLost(void *context, char *cause)
        {
            auto *impl = static_cast<PahoTransport::Impl *>(context);
            const char *reason = cause ? cause : "Connection lost";
            bool willRetry = impl->autoReconnect;
            impl->notify([&](TransportListener &l)
                         { l.onConnectionLost(willRetry, reason); });
        }

        static int onMessageArrived(void *context, char *topicName, int topicLen,
                                    MQTTAsync_message *message)
        {
            auto *impl = static_cast<PahoTransport::Impl *>(context);
            try
            {
                std::string topic = topicLen > 0 ? std::string(topicName, topicLen)
                                                 : std::string(topicName ? topicName : "");
                Message msg(topic, static_cast<const uint8_t *>(message->payload),
                            static_cast<size_t>(message->payloadlen));
                msg.setQoS(static_cast<Message::QoS>(message->qos))
                    .setRetained(message->retained != 0)
                    .setMessageId(message->msgid);

                for (int i = 0; i < message->properties.count; ++i)
                {
                    const MQTTProperty &property = message->properties.array[i];
                    if (property.identifier == MQTTPROPERTY_CODE_USER_PROPERTY)
                    {
                        msg.addUserProperty(std::string(property.value.data.data, property.value.data.len),
                                            std::string(property.value.value.data, property.value.value.len));
                    }
                }

                impl->notify([&](TransportListener &l)
                             { l.onMessage(msg); });
            }
            catch (const std::exception &e)
            {
                logError("dropping inbound message on {}: {}", topicName ? topicName : "", e.what());
            }
            catch (...)
            {
                logError("dropping inbound message on {}: unknown exception", topicName ? topicName : "");
            }
            MQTTAsync_freeMessage(&message);
            MQTTAsync_free(topicName);
            return 1;
        }

        static void onConnectFailure(void *context, MQTTAsync_failureData *response)
        {
            auto *impl = static_cast<PahoTransport::Impl *>(context);
            int code = response ? response->code : MQTTASYNC_FAILURE;
            const char *message = response && response->message ? response->message : "Connection failed";
            impl->notify([&](TransportListener &l)
                         { l.onError(code, message); });
        }

        static void onConnectFailure5(void *context, MQTTAsync_failureData5 *response)
        {
            auto *impl = static_cast<PahoTransport::Impl *>(context);
            int code = response ? response->code : MQTTASYNC_FAILURE;
            const char *message = response && response->message ? response->message
                                                                : MQTTReasonCode_toString(response ? response->reasonCode : MQTTREASONCODE_UNSPECIFIED_ERROR);
            impl->notify([&](TransportListener &l)
                         { l.onError(code, message); });
        }

        static void onRequestFailure(void *context, MQTTAsync_failureData *response)
        {
            logError("paho request failed: {} ({})",
                     response && response->message ? response->message : "no detail",
                     response ? response->code : MQTTASYNC_FAILURE);
        }

        static void onRequestFailure5(void *context, MQTTAsync_failureData5 *response)
        {
            logError("paho request failed: {} ({})",
                     response && response->message ? response->message
                                                   : MQTTReasonCode_toString(response ? response->reasonCode : MQTTREASONCODE_UNSPECIFIED_ERROR),
                     response ? response->code : MQTTASYNC_FAILURE);
        }

        MQTTAsync_responseOptions responseOptions()
        {
            MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
            opts.context = this;
            if (mqtt5)
            {
                opts.onFailure5 = onRequestFailure5;
            }
            else
            {
                opts.onFailure = onRequestFailure;
            }
            return opts;
        }
    };

    PahoTransport::PahoTransport() : impl_(new Impl()) {}

    PahoTransport::~PahoTransport()
    {
        setListener(nullptr);
        close();
        delete impl_;
    }

    void PahoTransport::setListener(TransportListener *listener)
    {
        std::lock_guard<std::mutex> lock(impl_->listenerMutex);
        impl_->listener = listener;
    }

    bool PahoTransport::connect(const ConnectionConfig &config)
    {
        if (impl_->client)
        {
            logError("paho transport already connected");
            return false;
        }

        impl_->config = config;
        const ConnectionConfig &cfg = impl_->config;
        impl_->mqtt5 = cfg.getInt(ConnectionConfig::Parameter::PROTOCOL_VERSION) >= ConnectionConfig::MQTT_VERSION_5;
        impl_->autoReconnect = cfg.getBool(ConnectionConfig::Parameter::AUTOMATIC_RECONNECT);

        std::string serverURI = cfg.getServerUri();
        if (serverURI.empty())
        {
            logError("Broker URL not set");
            return false;
        }

        MQTTAsync_createOptions createOpts = MQTTAsync_createOptions_initializer;
        if (impl_->mqtt5)
        {
            MQTTAsync_createOptions createOpts5 = MQTTAsync_createOptions_initializer5;
            createOpts = createOpts5;
        }
        createOpts.sendWhileDisconnected = 1;
        createOpts.maxBufferedMessages = cfg.getInt(ConnectionConfig::Parameter::MAX_QUEUED_MESSAGES);

        int rc = MQTTAsync_createWithOptions(&impl_->client, serverURI.c_str(),
                                             cfg.getClientId().c_str(),
                                             MQTTCLIENT_PERSISTENCE_NONE, nullptr, &createOpts);
        if (rc != MQTTASYNC_SUCCESS)
        {
            logError("Failed to create client for {}: {}", serverURI, MQTTAsync_strerror(rc));
            impl_->client = nullptr;
            return false;
        }

        MQTTAsync_setCallbacks(impl_->client, impl_,
                               Impl::onConnectionLost,
                               Impl::onMessageArrived,
                               nullptr);
        MQTTAsync_setConnected(impl_->client, impl_, Impl::onConnected);

        MQTTAsync_connectOptions conn_opts = MQTTAsync_connectOptions_initializer;
        if (impl_->mqtt5)
        {
            MQTTAsync_connectOptions conn_opts5 = MQTTAsync_connectOptions_initializer5;
            conn_opts = conn_opts5;
            conn_opts.cleanstart = cfg.getBool(ConnectionConfig::Parameter::CLEAN_SESSION) ? 1 : 0;
            conn_opts.onFailure5 = Impl::onConnectFailure5;
        }
        else
        {
            conn_opts.MQTTVersion = MQTTVERSION_3_1_1;
            conn_opts.cleansession = cfg.getBool(ConnectionConfig::Parameter::CLEAN_SESSION) ? 1 : 0;
            conn_opts.onFailure = Impl::onConnectFailure;
        }
        conn_opts.context = impl_;
        conn_opts.keepAliveInterval = cfg.getInt(ConnectionConfig::Parameter::KEEP_ALIVE_INTERVAL);
        conn_opts.connectTimeout = cfg.getInt(ConnectionConfig::Parameter::CONNECTION_TIMEOUT);
        conn_opts.maxInflight = cfg.getInt(ConnectionConfig::Parameter::MAX_INFLIGHT);
        conn_opts.automaticReconnect = impl_->autoReconnect ? 1 : 0;
        conn_opts.minRetryInterval = cfg.getInt(ConnectionConfig::Parameter::RECONNECT_DELAY);
        conn_opts.maxRetryInterval = cfg.getInt(ConnectionConfig::Parameter::MAX_RECONNECT_DELAY);

        if (!cfg.getUsername().empty())
        {
            conn_opts.username = cfg.getUsername().c_str();
            conn_opts.password = cfg.getPassword().c_str();
        }

        MQTTAsync_SSLOptions ssl_opts = MQTTAsync_SSLOptions_initializer;
        if (cfg.getBool(ConnectionConfig::Parameter::TLS_ENABLED))
        {
            if (!cfg.getCaFile().empty())
                ssl_opts.trustStore = cfg.getCaFile().c_str();
            if (!cfg.getCertFile().empty())
                ssl_opts.keyStore = cfg.getCertFile().c_str();
            if (!cfg.getKeyFile().empty())
                ssl_opts.privateKey = cfg.getKeyFile().c_str();
            conn_opts.ssl = &ssl_opts;
        }

        rc = MQTTAsync_connect(impl_->client, &conn_opts);
        if (rc != MQTTASYNC_SUCCESS)
        {
            logError("Connection request to {} rejected: {}", serverURI, MQTTAsync_strerror(rc));
            MQTTAsync_destroy(&impl_->client);
            impl_->client = nullptr;
            return false;
        }
        return true;
    }

    void PahoTransport::close()
    {
        if (!impl_->client)
        {
            return;
        }
        MQTTAsync_disconnectOptions opts = MQTTAsync_disconnectOptions_initializer;
        if (impl_->mqtt5)
        {
            MQTTAsync_disconnectOptions opts5 = MQTTAsync_disconnectOptions_initializer5;
            opts = opts5;
        }
        opts.timeout = 0;
        if (MQTTAsync_isConnected(impl_->client))
        {
            int rc = MQTTAsync_disconnect(impl_->client, &opts);
            if (rc != MQTTASYNC_SUCCESS)
            {
                logWarn("disconnect failed: {}", MQTTAsync_strerror(rc));
            }
        }
        MQTTAsync_destroy(&impl_->client);
        impl_->client = nullptr;
    }

    bool PahoTransport::publish(const std::string &topic,
                                const std::vector<uint8_t> &payload,
                                const PublishParams &params)
    {
        if (!impl_->client)
        {
            return false;
        }

        MQTTAsync_message pubmsg = MQTTAsync_message_initializer;
        pubmsg.payload = payload.empty() ? nullptr : const_cast<uint8_t *>(payload.data());
        pubmsg.payloadlen = static_cast<int>(payload.size());
        pubmsg.qos = static_cast<int>(params.qos);
        pubmsg.retained = params.retain ? 1 : 0;

        MQTTProperties props = MQTTProperties_initializer;
        if (impl_->mqtt5)
        {
            for (const auto &userProperty : params.userProperties)
            {
                MQTTProperty property;
                property.identifier = MQTTPROPERTY_CODE_USER_PROPERTY;
                property.value.data.data = const_cast<char *>(userProperty.first.c_str());
                property.value.data.len = static_cast<int>(userProperty.first.size());
                property.value.value.data = const_cast<char *>(userProperty.second.c_str());
                property.value.value.len = static_cast<int>(userProperty.second.size());
                MQTTProperties_add(&props, &property);
            }
            pubmsg.properties = props;
        }

        MQTTAsync_responseOptions opts = impl_->responseOptions();
        int rc = MQTTAsync_sendMessage(impl_->client, topic.c_str(), &pubmsg, &opts);
        MQTTProperties_free(&props);
        if (rc != MQTTASYNC_SUCCESS)
        {
            logError("Publish to {} failed: {}", topic, MQTTAsync_strerror(rc));
            return false;
        }
        return true;
    }

    bool PahoTransport::subscribe(const std::vector<std::string> &topics, Message::QoS qos, bool noLocal)
    {
        if (!impl_->client || topics.empty())
        {
            return false;
        }

        std::vector<char *> topicList;
        std::vector<int> qosList(topics.size(), static_cast<int>(qos));
        for (const auto &topic : topics)
        {
            topicList.push_back(const_cast<char *>(topic.c_str()));
        }

        MQTTAsync_responseOptions opts = impl_->responseOptions();
        MQTTSubscribe_options subscribeOptions = MQTTSubscribe_options_initializer;
        subscribeOptions.noLocal = noLocal ? 1 : 0;
        std::vector<MQTTSubscribe_options> optionList(topics.size(), subscribeOptions);
        if (impl_->mqtt5)
        {
            opts.subscribeOptionsCount = static_cast<int>(optionList.size());
            opts.subscribeOptionsList = optionList.data();
        }

        int rc = MQTTAsync_subscribeMany(impl_->client, static_cast<int>(topicList.size()),
                                         topicList.data(), qosList.data(), &opts);
        if (rc != MQTTASYNC_SUCCESS)
        {
            logError("Subscribe failed: {}", MQTTAsync_strerror(rc));
            return false;
        }
        return true;
    }

    bool PahoTransport::unsubscribe(const std::vector<std::string> &topics)
    {
        if (!impl_->client || topics.empty())
        {
            return false;
        }

        std::vector<char *> topicList;
        for (const auto &topic : topics)
        {
            topicList.push_back(const_cast<char *>(topic.c_str()));
        }

        MQTTAsync_responseOptions opts = impl_->responseOptions();
        int rc = MQTTAsync_unsubscribeMany(impl_->client, static_cast<int>(topicList.size()),
                                           topicList.data(), &opts);
        if (rc != MQTTASYNC_SUCCESS)
        {
            logError("Unsubscribe failed: {}", MQTTAsync_strerror(rc));
            return false;
        }
        return true;
    }

    std::unique_ptr<Transport> PahoTransportFactory::createTransport(const ConnectionConfig &)
    {
        return std::unique_ptr<Transport>(new PahoTransport());
    }

} // namespace quietmqtt
