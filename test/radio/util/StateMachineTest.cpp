/*
 * Copyright 2017, Andrej Kislovskij
 *
 * This is PUBLIC DOMAIN software so use at your own risk as it comes
 * with no warranties. This code is yours to share, use and modify without
 * any restrictions or obligations.
 *
 * For more information see conwrap/LICENSE or refer refer to http://unlicense.org
 *
 * Author: gimesketvirtadieni at gmail dot com (Andrej Kislovskij)
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <vector>

#include "radio/util/StateMachine.hpp"


struct StateMachineFixture : public ::testing::Test
{
	enum Event
	{
		StartEvent,
		StopEvent,
	};

	enum State
	{
		StartedState,
		StoppedState,
	};

	bool                                        allowed{true};
	std::vector<Event>                          actions;
	radio::util::StateMachine<Event, State>     stateMachine
	{
		StoppedState,  // initial state
		{   // transition table definition
			{StartEvent, StoppedState, StartedState, [&](auto event) {actions.push_back(event);}, [&] {return allowed;}},
			{StopEvent,  StartedState, StoppedState, [&](auto event) {actions.push_back(event);}, [&] {return true;}},
			{StopEvent,  StoppedState, StoppedState, nullptr,                                     nullptr},
		}
	};
};


TEST_F(StateMachineFixture, ProcessEvent1)
{
	EXPECT_TRUE(stateMachine.processEvent(StartEvent, [](auto, auto)
	{
		FAIL();
	}));

	EXPECT_EQ(stateMachine.state, StartedState);
	EXPECT_EQ(actions, std::vector<Event>{StartEvent});
}

TEST_F(StateMachineFixture, ProcessEvent2)
{
	allowed = false;

	EXPECT_FALSE(stateMachine.processEvent(StartEvent, [](auto, auto)
	{
		FAIL();
	}));

	EXPECT_EQ(stateMachine.state, StoppedState);
	EXPECT_TRUE(actions.empty());
}

TEST_F(StateMachineFixture, ProcessEvent3)
{
	auto errorEvent{StopEvent};
	auto errorState{StoppedState};

	stateMachine.processEvent(StartEvent, [](auto, auto) {});

	// there is no transition for Start in Started state
	EXPECT_FALSE(stateMachine.processEvent(StartEvent, [&](auto event, auto state)
	{
		errorEvent = event;
		errorState = state;
	}));

	EXPECT_EQ(errorEvent, StartEvent);
	EXPECT_EQ(errorState, StartedState);
}

TEST_F(StateMachineFixture, ProcessEvent4)
{
	// missing guard and action mean an unconditional transition with nothing to do
	EXPECT_TRUE(stateMachine.processEvent(StopEvent, [](auto, auto)
	{
		FAIL();
	}));

	EXPECT_EQ(stateMachine.state, StoppedState);
}

TEST_F(StateMachineFixture, ProcessEvent5)
{
	auto observedState{StoppedState};

	stateMachine.transitions.push_back({StartEvent, StartedState, StartedState, [&](auto)
	{
		observedState = stateMachine.state;
	}, nullptr});

	stateMachine.processEvent(StartEvent, [](auto, auto) {});
	stateMachine.processEvent(StartEvent, [](auto, auto) {});

	// state is already changed when the action runs
	EXPECT_EQ(observedState, StartedState);
}
