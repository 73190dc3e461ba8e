#ifndef QUIETMQTT_CONNECTION_CONFIG_HPP_
#define QUIETMQTT_CONNECTION_CONFIG_HPP_

#include <string>
#include <cstdint>
#include "dllexport.h"

namespace quietmqtt
{

    class ConnectionConfig
    {
    public:
        enum class Parameter : int32_t
        {
            KEEP_ALIVE_INTERVAL = 0,
            CLEAN_SESSION = 1,
            CONNECTION_TIMEOUT = 2,
            MAX_INFLIGHT = 3,
            MAX_QUEUED_MESSAGES = 4,
            RECONNECT_DELAY = 5,
            TLS_ENABLED = 6,
            MAX_RECONNECT_DELAY = 7,
            AUTOMATIC_RECONNECT = 8,
            PROTOCOL_VERSION = 9
        };

        static constexpr int32_t MQTT_VERSION_3_1_1 = 4;
        static constexpr int32_t MQTT_VERSION_5 = 5;

        QUIETMQTT_DLLEXPORT ConnectionConfig();
        QUIETMQTT_DLLEXPORT ConnectionConfig(const ConnectionConfig &other);
        QUIETMQTT_DLLEXPORT ConnectionConfig &operator=(const ConnectionConfig &other);
        QUIETMQTT_DLLEXPORT ~ConnectionConfig();

        QUIETMQTT_DLLEXPORT ConnectionConfig &set(Parameter param, int32_t value);
        QUIETMQTT_DLLEXPORT ConnectionConfig &set(Parameter param, bool value);
        QUIETMQTT_DLLEXPORT ConnectionConfig &setBroker(const char *host, uint16_t port);
        // Full server URI (tcp://, ssl://, ws://, wss://); takes precedence over setBroker.
        QUIETMQTT_DLLEXPORT ConnectionConfig &setServerUri(const char *uri);
        QUIETMQTT_DLLEXPORT ConnectionConfig &setClientId(const char *clientId);
        QUIETMQTT_DLLEXPORT ConnectionConfig &setCredentials(const char *username, const char *password);
        QUIETMQTT_DLLEXPORT ConnectionConfig &setTlsCertificates(const char *caFile, const char *certFile, const char *keyFile);

        QUIETMQTT_DLLEXPORT int32_t getInt(Parameter param) const;
        QUIETMQTT_DLLEXPORT bool getBool(Parameter param) const;

        // Empty when neither setServerUri nor setBroker was called.
        QUIETMQTT_DLLEXPORT std::string getServerUri() const;
        QUIETMQTT_DLLEXPORT const std::string &getClientId() const;
        QUIETMQTT_DLLEXPORT const std::string &getUsername() const;
        QUIETMQTT_DLLEXPORT const std::string &getPassword() const;
        QUIETMQTT_DLLEXPORT const std::string &getCaFile() const;
        QUIETMQTT_DLLEXPORT const std::string &getCertFile() const;
        QUIETMQTT_DLLEXPORT const std::string &getKeyFile() const;

        QUIETMQTT_DLLEXPORT bool operator==(const ConnectionConfig &other) const;
        QUIETMQTT_DLLEXPORT bool operator!=(const ConnectionConfig &other) const;

    private:
        struct Impl;
        Impl *impl_;
    };

} // namespace quietmqtt
#endif // QUIETMQTT_CONNECTION_CONFIG_HPP_
