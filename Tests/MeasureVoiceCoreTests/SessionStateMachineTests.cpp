#include "SessionStateMachine.hpp"

#include <atomic>
#include <thread>

#include <gtest/gtest.h>

using namespace mv;
using namespace std::chrono_literals;

TEST(SessionStateMachineTest, StartsIdleWithDefaultContext) {
    SessionStateMachine sm(100);
    EXPECT_EQ(sm.state(), SessionState::idle);
    EXPECT_EQ(sm.context_id(), 100);
    EXPECT_EQ(sm.context_history(), (std::vector<int64_t>{100}));
}

TEST(SessionStateMachineTest, KeyToggleAlternatesRecordingAndPaused) {
    SessionStateMachine sm;
    EXPECT_TRUE(sm.start());
    EXPECT_EQ(sm.state(), SessionState::recording);
    EXPECT_TRUE(sm.key_toggle());
    EXPECT_EQ(sm.state(), SessionState::paused);
    EXPECT_TRUE(sm.key_toggle());
    EXPECT_EQ(sm.state(), SessionState::recording);
}

TEST(SessionStateMachineTest, VoiceCommands) {
    SessionStateMachine sm;
    sm.start();
    EXPECT_FALSE(sm.apply(Command::resume()));     // already recording
    EXPECT_TRUE(sm.apply(Command::pause()));
    EXPECT_EQ(sm.state(), SessionState::paused);
    EXPECT_FALSE(sm.apply(Command::pause()));
    EXPECT_TRUE(sm.apply(Command::resume()));
    EXPECT_EQ(sm.state(), SessionState::recording);
    EXPECT_TRUE(sm.apply(Command::stop()));
    EXPECT_EQ(sm.state(), SessionState::stopped);
}

TEST(SessionStateMachineTest, StopFromPaused) {
    SessionStateMachine sm;
    sm.start();
    sm.key_toggle();
    EXPECT_TRUE(sm.external_stop());
    EXPECT_EQ(sm.state(), SessionState::stopped);
}

TEST(SessionStateMachineTest, IdleIgnoresEverythingButStart) {
    SessionStateMachine sm;
    EXPECT_FALSE(sm.key_toggle());
    EXPECT_FALSE(sm.external_stop());
    EXPECT_FALSE(sm.apply(Command::stop()));
    EXPECT_FALSE(sm.apply(Command::set_context(300)));
    EXPECT_EQ(sm.state(), SessionState::idle);
    EXPECT_EQ(sm.context_id(), 100);
}

TEST(SessionStateMachineTest, StoppedIsTerminal) {
    SessionStateMachine sm;
    sm.start();
    sm.external_stop();
    EXPECT_FALSE(sm.start());
    EXPECT_FALSE(sm.key_toggle());
    EXPECT_FALSE(sm.apply(Command::resume()));
    EXPECT_FALSE(sm.apply(Command::pause()));
    EXPECT_FALSE(sm.apply(Command::set_context(500)));
    EXPECT_FALSE(sm.external_stop());
    EXPECT_EQ(sm.state(), SessionState::stopped);
    EXPECT_EQ(sm.context_id(), 100);
}

TEST(SessionStateMachineTest, SetContextWhileRecordingOrPaused) {
    SessionStateMachine sm;
    sm.start();
    EXPECT_TRUE(sm.apply(Command::set_context(200)));
    sm.key_toggle();
    EXPECT_TRUE(sm.apply(Command::set_context(300)));
    EXPECT_EQ(sm.state(), SessionState::paused);
    EXPECT_EQ(sm.context_id(), 300);
    EXPECT_EQ(sm.context_history(), (std::vector<int64_t>{100, 200, 300}));
}

TEST(SessionStateMachineTest, UnknownCommandIsNoOp) {
    SessionStateMachine sm;
    sm.start();
    EXPECT_FALSE(sm.apply(Command{}));
    EXPECT_EQ(sm.state(), SessionState::recording);
}

TEST(SessionStateMachineTest, ListenersSeeChangesInOrder) {
    SessionStateMachine sm;
    std::vector<StateChange> seen;
    sm.add_listener([&](const StateChange& c) { seen.push_back(c); });

    sm.start();
    sm.apply(Command::set_context(400));
    sm.key_toggle();
    sm.apply(Command::stop());

    ASSERT_EQ(seen.size(), 4u);
    EXPECT_EQ(seen[0].to, SessionState::recording);
    EXPECT_EQ(seen[1].trigger, "set_context");
    EXPECT_EQ(seen[1].context_id, 400);
    EXPECT_EQ(seen[2].to, SessionState::paused);
    EXPECT_EQ(seen[3].from, SessionState::paused);
    EXPECT_EQ(seen[3].to, SessionState::stopped);
}

TEST(SessionStateMachineTest, ListenerMayTriggerAnotherChange) {
    SessionStateMachine sm;
    std::vector<SessionState> seen;
    sm.add_listener([&](const StateChange& c) {
        seen.push_back(c.to);
        if (c.to == SessionState::paused) sm.external_stop();
    });

    sm.start();
    sm.key_toggle();
    EXPECT_EQ(sm.state(), SessionState::stopped);
    EXPECT_EQ(seen, (std::vector<SessionState>{SessionState::recording,
                                               SessionState::paused,
                                               SessionState::stopped}));
}

TEST(SessionStateMachineTest, WaitForStateChange) {
    SessionStateMachine sm;
    EXPECT_EQ(sm.wait_for_state_change(SessionState::idle, 20ms), SessionState::idle);

    std::thread t([&] {
        std::this_thread::sleep_for(20ms);
        sm.start();
    });
    EXPECT_EQ(sm.wait_for_state_change(SessionState::idle, 5s), SessionState::recording);
    t.join();
}

TEST(SessionStateMachineTest, WaitUntilStopped) {
    SessionStateMachine sm;
    sm.start();
    EXPECT_FALSE(sm.wait_until_stopped(20ms));

    std::thread t([&] {
        std::this_thread::sleep_for(20ms);
        sm.apply(Command::stop());
    });
    EXPECT_TRUE(sm.wait_until_stopped(5s));
    t.join();
}

TEST(SessionStateMachineTest, ConcurrentTogglesStayConsistent) {
    SessionStateMachine sm;
    sm.start();
    std::atomic<int> changes{0};
    sm.add_listener([&](const StateChange&) { changes.fetch_add(1); });

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&] {
            for (int k = 0; k < 250; ++k) sm.key_toggle();
        });
    }
    for (auto& t : threads) t.join();

    // 1000 toggles, each one a real transition: back to Recording.
    EXPECT_EQ(changes.load(), 1000);
    EXPECT_EQ(sm.state(), SessionState::recording);
}
