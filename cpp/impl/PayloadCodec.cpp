#include "PayloadCodec.hpp"
#include <cmath>
#include <memory>
#include <fmt/format.h>
#include "Logger.hpp"

namespace quietmqtt
{

    namespace
    {
        std::vector<uint8_t> toBytes(const std::string &text)
        {
            return std::vector<uint8_t>(text.begin(), text.end());
        }

        std::string numberToText(double value)
        {
            if (std::isnan(value))
                return "NaN";
            if (std::isinf(value))
                return value > 0 ? "Infinity" : "-Infinity";
            return fmt::format("{}", value);
        }

        bool isStructured(const Json::Value &value)
        {
            return value.isNull() || value.isObject() || value.isArray();
        }

        const Json::StreamWriterBuilder &compactWriter()
        {
            static const Json::StreamWriterBuilder builder = []
            {
                Json::StreamWriterBuilder b;
                b["indentation"] = "";
                b["emitUTF8"] = true;
                return b;
            }();
            return builder;
        }

        const Json::CharReaderBuilder &strictReader()
        {
            static const Json::CharReaderBuilder builder = []
            {
                Json::CharReaderBuilder b;
                b["allowComments"] = false;
                b["strictRoot"] = false;
                b["allowDroppedNullPlaceholders"] = false;
                b["allowNumericKeys"] = false;
                b["allowSingleQuotes"] = false;
                b["allowSpecialFloats"] = false;
                b["failIfExtra"] = true;
                return b;
            }();
            return builder;
        }
    }

    const char *toString(SerializationMode mode)
    {
        switch (mode)
        {
        case SerializationMode::AUTO:
            return "auto";
        case SerializationMode::STRING:
            return "string";
        case SerializationMode::JSON:
            return "json";
        }
        return "unknown";
    }

    // Value Implementation
    Value::Value() : binary_(false), json_(Json::nullValue) {}
    Value::Value(const Json::Value &json) : binary_(false), json_(json) {}
    Value::Value(const std::string &text) : binary_(false), json_(text) {}
    Value::Value(const char *text) : binary_(false), json_(text ? text : "") {}
    Value::Value(int value) : binary_(false), json_(value) {}
    Value::Value(int64_t value) : binary_(false), json_(static_cast<Json::Int64>(value)) {}
    Value::Value(double value) : binary_(false), json_(value) {}
    Value::Value(bool value) : binary_(false), json_(value) {}
    Value::Value(const std::vector<uint8_t> &bytes) : binary_(true), bytes_(bytes) {}

    Value Value::fromBytes(const uint8_t *data, size_t length)
    {
        if (!data || length == 0)
        {
            return Value(std::vector<uint8_t>());
        }
        return Value(std::vector<uint8_t>(data, data + length));
    }

    bool Value::isBinary() const { return binary_; }
    const std::vector<uint8_t> &Value::getBytes() const { return bytes_; }
    const Json::Value &Value::getJson() const { return json_; }

    // PayloadCodec Implementation
    std::string PayloadCodec::toJson(const Json::Value &value)
    {
        switch (value.type())
        {
        case Json::realValue:
        {
            double number = value.asDouble();
            if (!std::isfinite(number))
                return "null";
            return fmt::format("{}", number);
        }
        case Json::arrayValue:
        {
            std::string text = "[";
            for (Json::ArrayIndex i = 0; i < value.size(); ++i)
            {
                if (i > 0)
                    text += ',';
                text += toJson(value[i]);
            }
            return text + "]";
        }
        case Json::objectValue:
        {
            std::string text = "{";
            bool first = true;
            for (auto it = value.begin(); it != value.end(); ++it)
            {
                if (!first)
                    text += ',';
                first = false;
                text += Json::writeString(compactWriter(), Json::Value(it.name()));
                text += ':';
                text += toJson(*it);
            }
            return text + "}";
        }
        default:
            return Json::writeString(compactWriter(), value);
        }
    }

    std::string PayloadCodec::toText(const Json::Value &value)
    {
        switch (value.type())
        {
        case Json::nullValue:
            return "null";
        case Json::intValue:
            return std::to_string(value.asLargestInt());
        case Json::uintValue:
            return std::to_string(value.asLargestUInt());
        case Json::realValue:
            return numberToText(value.asDouble());
        case Json::booleanValue:
            return value.asBool() ? "true" : "false";
        case Json::stringValue:
            return value.asString();
        case Json::arrayValue:
        {
            std::string text;
            for (Json::ArrayIndex i = 0; i < value.size(); ++i)
            {
                if (i > 0)
                    text += ',';
                if (!value[i].isNull())
                    text += toText(value[i]);
            }
            return text;
        }
        case Json::objectValue:
            return OBJECT_PLACEHOLDER;
        }
        return std::string();
    }

    bool PayloadCodec::parseJson(const std::string &text, Json::Value &out)
    {
        std::unique_ptr<Json::CharReader> reader(strictReader().newCharReader());
        std::string errors;
        Json::Value parsed;
        try
        {
            if (!reader->parse(text.data(), text.data() + text.size(), &parsed, &errors))
            {
                return false;
            }
        }
        catch (const Json::Exception &e)
        {
            logDebug("payload rejected by JSON reader: {}", e.what());
            return false;
        }
        out = parsed;
        return true;
    }

    std::vector<uint8_t> PayloadCodec::encode(const Value &value, SerializationMode mode)
    {
        const Json::Value &json = value.getJson();
        switch (mode)
        {
        case SerializationMode::STRING:
            if (value.isBinary())
                return value.getBytes();
            return toBytes(toText(json));

        case SerializationMode::JSON:
            if (value.isBinary())
            {
                const auto &bytes = value.getBytes();
                return toBytes(toJson(Json::Value(std::string(bytes.begin(), bytes.end()))));
            }
            return toBytes(toJson(json));

        case SerializationMode::AUTO:
        default:
            if (value.isBinary())
                return value.getBytes();
            if (json.isString())
                return toBytes(json.asString());
            if (isStructured(json))
                return toBytes(toJson(json));
            return toBytes(toText(json));
        }
    }

    Json::Value PayloadCodec::decode(const uint8_t *payload, size_t length, SerializationMode mode)
    {
        std::string text;
        if (payload && length > 0)
        {
            text.assign(reinterpret_cast<const char *>(payload), length);
        }

        if (mode == SerializationMode::STRING)
        {
            return Json::Value(text);
        }

        Json::Value parsed;
        if (parseJson(text, parsed))
        {
            return parsed;
        }
        return Json::Value(text);
    }

    Json::Value PayloadCodec::decode(const std::vector<uint8_t> &payload, SerializationMode mode)
    {
        return decode(payload.data(), payload.size(), mode);
    }

} // namespace quietmqtt
