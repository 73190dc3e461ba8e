#ifndef QUIETMQTT_PAYLOAD_CODEC_HPP_
#define QUIETMQTT_PAYLOAD_CODEC_HPP_

#include <cstdint>
#include <string>
#include <vector>
#include <json/json.h>
#include "dllexport.h"

namespace quietmqtt
{

    enum class SerializationMode : int32_t
    {
        AUTO = 0,
        STRING = 1,
        JSON = 2
    };

    QUIETMQTT_DLLEXPORT const char *toString(SerializationMode mode);

    // Binary bytes or a Json::Value.
    class Value
    {
    public:
        QUIETMQTT_DLLEXPORT Value();
        QUIETMQTT_DLLEXPORT Value(const Json::Value &json);
        QUIETMQTT_DLLEXPORT Value(const std::string &text);
        QUIETMQTT_DLLEXPORT Value(const char *text);
        QUIETMQTT_DLLEXPORT Value(int value);
        QUIETMQTT_DLLEXPORT Value(int64_t value);
        QUIETMQTT_DLLEXPORT Value(double value);
        QUIETMQTT_DLLEXPORT Value(bool value);
        QUIETMQTT_DLLEXPORT Value(const std::vector<uint8_t> &bytes);

        QUIETMQTT_DLLEXPORT static Value fromBytes(const uint8_t *data, size_t length);

        QUIETMQTT_DLLEXPORT bool isBinary() const;
        QUIETMQTT_DLLEXPORT const std::vector<uint8_t> &getBytes() const;
        QUIETMQTT_DLLEXPORT const Json::Value &getJson() const;

    private:
        bool binary_;
        std::vector<uint8_t> bytes_;
        Json::Value json_;
    };

    class PayloadCodec
    {
    public:
        static constexpr const char *OBJECT_PLACEHOLDER = "[object Object]";

        QUIETMQTT_DLLEXPORT static std::vector<uint8_t> encode(const Value &value,
                                                               SerializationMode mode = SerializationMode::AUTO);

        QUIETMQTT_DLLEXPORT static Json::Value decode(const uint8_t *payload,
                                                      size_t length,
                                                      SerializationMode mode = SerializationMode::AUTO);

        QUIETMQTT_DLLEXPORT static Json::Value decode(const std::vector<uint8_t> &payload,
                                                      SerializationMode mode = SerializationMode::AUTO);

        QUIETMQTT_DLLEXPORT static std::string toJson(const Json::Value &value);

        QUIETMQTT_DLLEXPORT static std::string toText(const Json::Value &value);

        // Strict; false on any error.
        QUIETMQTT_DLLEXPORT static bool parseJson(const std::string &text, Json::Value &out);
    };

} // namespace quietmqtt
#endif // QUIETMQTT_PAYLOAD_CODEC_HPP_
