#include <gtest/gtest.h>
#include <vector>
#include <quietmqtt/ConnectionStateMachine.hpp>

using quietmqtt::ConnectionEvent;
using quietmqtt::ConnectionStateMachine;
using quietmqtt::SessionState;

TEST(ConnectionStateMachineTest, StartsOffline)
{
    ConnectionStateMachine machine;
    EXPECT_EQ(SessionState::OFFLINE, machine.getState());
}

TEST(ConnectionStateMachineTest, ConnectRequestOnlyLeavesOffline)
{
    EXPECT_EQ(SessionState::CONNECTING,
              ConnectionStateMachine::next(SessionState::OFFLINE, ConnectionEvent::CONNECT_REQUESTED));
    EXPECT_EQ(SessionState::ONLINE,
              ConnectionStateMachine::next(SessionState::ONLINE, ConnectionEvent::CONNECT_REQUESTED));
    EXPECT_EQ(SessionState::ERROR,
              ConnectionStateMachine::next(SessionState::ERROR, ConnectionEvent::CONNECT_REQUESTED));
    EXPECT_EQ(SessionState::RECONNECTING,
              ConnectionStateMachine::next(SessionState::RECONNECTING, ConnectionEvent::CONNECT_REQUESTED));
}

TEST(ConnectionStateMachineTest, DropWithRetryDependsOnCurrentState)
{
    EXPECT_EQ(SessionState::RECONNECTING,
              ConnectionStateMachine::next(SessionState::ONLINE, ConnectionEvent::TRANSPORT_DROPPED_RETRY));
    EXPECT_EQ(SessionState::CONNECTING,
              ConnectionStateMachine::next(SessionState::CONNECTING, ConnectionEvent::TRANSPORT_DROPPED_RETRY));
    EXPECT_EQ(SessionState::CONNECTING,
              ConnectionStateMachine::next(SessionState::RECONNECTING, ConnectionEvent::TRANSPORT_DROPPED_RETRY));
}

TEST(ConnectionStateMachineTest, TerminalEventsApplyFromAnyState)
{
    const SessionState all[] = {SessionState::OFFLINE, SessionState::CONNECTING, SessionState::ONLINE,
                                SessionState::RECONNECTING, SessionState::ERROR};
    for (SessionState state : all)
    {
        EXPECT_EQ(SessionState::ONLINE,
                  ConnectionStateMachine::next(state, ConnectionEvent::TRANSPORT_CONNECTED))
            << quietmqtt::toString(state);
        EXPECT_EQ(SessionState::OFFLINE,
                  ConnectionStateMachine::next(state, ConnectionEvent::TRANSPORT_CLOSED))
            << quietmqtt::toString(state);
        EXPECT_EQ(SessionState::ERROR,
                  ConnectionStateMachine::next(state, ConnectionEvent::TRANSPORT_ERROR))
            << quietmqtt::toString(state);
    }
}

TEST(ConnectionStateMachineTest, ScriptedReconnectSequence)
{
    ConnectionStateMachine machine;
    const ConnectionEvent script[] = {ConnectionEvent::CONNECT_REQUESTED,
                                      ConnectionEvent::TRANSPORT_CONNECTED,
                                      ConnectionEvent::TRANSPORT_DROPPED_RETRY,
                                      ConnectionEvent::TRANSPORT_CONNECTED,
                                      ConnectionEvent::TRANSPORT_CLOSED};
    std::vector<SessionState> seen;
    for (ConnectionEvent event : script)
    {
        EXPECT_TRUE(machine.apply(event)) << quietmqtt::toString(event);
        seen.push_back(machine.getState());
    }

    std::vector<SessionState> expected = {SessionState::CONNECTING, SessionState::ONLINE,
                                          SessionState::RECONNECTING, SessionState::ONLINE,
                                          SessionState::OFFLINE};
    EXPECT_EQ(expected, seen);
}

TEST(ConnectionStateMachineTest, ApplyReportsNoChange)
{
    ConnectionStateMachine machine;
    EXPECT_FALSE(machine.apply(ConnectionEvent::TRANSPORT_CLOSED));
    EXPECT_TRUE(machine.apply(ConnectionEvent::CONNECT_REQUESTED));
    EXPECT_FALSE(machine.apply(ConnectionEvent::CONNECT_REQUESTED));
    EXPECT_TRUE(machine.apply(ConnectionEvent::TRANSPORT_CONNECTED));
    EXPECT_FALSE(machine.apply(ConnectionEvent::TRANSPORT_CONNECTED));
}

TEST(ConnectionStateMachineTest, ResetReturnsToOffline)
{
    ConnectionStateMachine machine;
    machine.apply(ConnectionEvent::TRANSPORT_ERROR);
    EXPECT_EQ(SessionState::ERROR, machine.getState());
    machine.reset();
    EXPECT_EQ(SessionState::OFFLINE, machine.getState());
}
