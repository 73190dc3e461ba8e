#include <quietmqtt/QuietMqtt.hpp>
#include <PahoTransport.hpp>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <thread>

class DemoSessionHandler : public quietmqtt::SessionHandler
{
public:
    void onStateChange(quietmqtt::SessionState newState) override
    {
        std::cout << "Session state changed to: " << quietmqtt::toString(newState) << std::endl;
    }

    void onError(int errorCode, const char *message) override
    {
        std::cout << "Error occurred: " << errorCode << " - " << message << std::endl;
    }
};

// Usage: quietmqtt_demo [host] [port] [topic]
int main(int argc, char **argv)
{
    const char *host = argc > 1 ? argv[1] : "broker.emqx.io";
    uint16_t port = static_cast<uint16_t>(argc > 2 ? std::atoi(argv[2]) : 1883);
    std::string topic = argc > 3 ? argv[3] : "quietmqtt/demo";

    try
    {
        quietmqtt::Logger::instance().initialize("QuietMqttDemo", true);

        DemoSessionHandler sessionHandler;
        quietmqtt::PahoTransportFactory factory;
        quietmqtt::Session session(factory, &sessionHandler);
        std::cout << "Publisher identity: " << session.getPublisherIdentity() << std::endl;

        // One subscriber that ignores its own publications, one that sees everything.
        quietmqtt::SubscriptionOptions quiet;
        quiet.qos = quietmqtt::Message::QoS::AT_LEAST_ONCE;
        quiet.excludeSelf = true;
        quiet.onMessage = [](const std::string &t, const Json::Value &value)
        {
            std::cout << "[others only] " << t << ": " << quietmqtt::PayloadCodec::toJson(value) << std::endl;
        };
        auto othersOnly = session.subscribe(topic, quiet);

        quietmqtt::SubscriptionOptions loud;
        loud.qos = quietmqtt::Message::QoS::AT_LEAST_ONCE;
        loud.onMessage = [](const std::string &t, const Json::Value &value)
        {
            std::cout << "[everything]  " << t << ": " << quietmqtt::PayloadCodec::toJson(value) << std::endl;
        };
        auto everything = session.subscribe(topic, loud);

        quietmqtt::ConnectionConfig config;
        config.setBroker(host, port)
            .set(quietmqtt::ConnectionConfig::Parameter::KEEP_ALIVE_INTERVAL, 60)
            .set(quietmqtt::ConnectionConfig::Parameter::CLEAN_SESSION, true);

        std::cout << "Connecting to " << config.getServerUri() << "..." << std::endl;
        if (!session.start(config))
        {
            std::cerr << "Failed to start session" << std::endl;
            return 1;
        }

        for (int i = 0; i < 30 && session.getState() != quietmqtt::SessionState::ONLINE; ++i)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        Json::Value reading(Json::objectValue);
        reading["test"] = true;
        reading["sequence"] = 1;

        quietmqtt::PublishOptions options;
        options.qos = quietmqtt::Message::QoS::AT_LEAST_ONCE;
        if (!session.publish(topic, quietmqtt::Value(reading), options))
        {
            std::cerr << "Failed to publish message" << std::endl;
        }

        std::cout << "\nListening for messages for 15 seconds..." << std::endl;
        std::this_thread::sleep_for(std::chrono::seconds(15));

        std::cout << "[others only] latest: " << quietmqtt::PayloadCodec::toJson(othersOnly->getValue()) << std::endl;
        std::cout << "[everything]  latest: " << quietmqtt::PayloadCodec::toJson(everything->getValue()) << std::endl;

        std::cout << "Cleaning up..." << std::endl;
        othersOnly->close();
        everything->close();
        session.stop();
        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Exception caught: " << e.what() << std::endl;
        return 1;
    }
}
