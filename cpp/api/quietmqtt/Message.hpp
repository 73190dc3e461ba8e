#ifndef QUIETMQTT_MESSAGE_HPP_
#define QUIETMQTT_MESSAGE_HPP_

#include <string>
#include <cstdint>
#include <vector>
#include <utility>
#include "dllexport.h"

namespace quietmqtt
{

    using UserProperties = std::vector<std::pair<std::string, std::string>>;

    // Inbound message as delivered by a Transport. The session only reads it
    // while filtering and decoding; nothing keeps it afterwards.
    class Message
    {
    public:
        enum class QoS : int32_t
        {
            AT_MOST_ONCE = 0,
            AT_LEAST_ONCE = 1,
            EXACTLY_ONCE = 2
        };

        QUIETMQTT_DLLEXPORT Message(const std::string &topic,
                                    const uint8_t *payload,
                                    size_t length);
        QUIETMQTT_DLLEXPORT Message(const std::string &topic, const std::string &payload);
        QUIETMQTT_DLLEXPORT Message(const Message &other);
        QUIETMQTT_DLLEXPORT Message &operator=(const Message &other);
        QUIETMQTT_DLLEXPORT ~Message();

        QUIETMQTT_DLLEXPORT const char *getTopic() const;
        QUIETMQTT_DLLEXPORT const uint8_t *getPayload() const;
        QUIETMQTT_DLLEXPORT size_t getPayloadLength() const;
        QUIETMQTT_DLLEXPORT QoS getQoS() const;
        QUIETMQTT_DLLEXPORT bool isRetained() const;
        QUIETMQTT_DLLEXPORT int64_t getMessageId() const;

        // MQTT 5 user properties; empty when the broker or protocol version
        // does not carry them.
        QUIETMQTT_DLLEXPORT const UserProperties &getUserProperties() const;

        // Value of the first user property named key, or nullptr.
        QUIETMQTT_DLLEXPORT const std::string *getUserProperty(const std::string &key) const;

        QUIETMQTT_DLLEXPORT Message &setQoS(QoS qos);
        QUIETMQTT_DLLEXPORT Message &setRetained(bool retained);
        QUIETMQTT_DLLEXPORT Message &setMessageId(int64_t messageId);
        QUIETMQTT_DLLEXPORT Message &addUserProperty(const std::string &key, const std::string &value);

    private:
        struct Impl;
        Impl *impl_;
    };

} // namespace quietmqtt
#endif // QUIETMQTT_MESSAGE_HPP_
