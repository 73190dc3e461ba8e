#ifndef QUIETMQTT_API_HPP_
#define QUIETMQTT_API_HPP_

#include "ConnectionConfig.hpp"
#include "ConnectionStateMachine.hpp"
#include "Logger.hpp"
#include "Message.hpp"
#include "PayloadCodec.hpp"
#include "SelfEchoFilter.hpp"
#include "Session.hpp"
#include "SessionHandler.hpp"
#include "Subscription.hpp"
#include "TopicFilter.hpp"
#include "Transport.hpp"
#include "UsageError.hpp"

#endif // QUIETMQTT_API_HPP_
