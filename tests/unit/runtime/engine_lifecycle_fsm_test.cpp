#include <gtest/gtest.h>

#include <scenelink/runtime/EngineLifecycleFsm.h>

using namespace scenelink;
using namespace scenelink::runtime;

static EngineState stateOf(const EngineLifecycleFsm& fsm) {
    return fsm.snapshot().state;
}

static Context shotContext(const std::string& shot) {
    return Context{"shotA", "Shot", shot, ""};
}

TEST(EngineLifecycleFsmTest, StartsWithoutEngine) {
    EngineLifecycleFsm fsm;
    EXPECT_EQ(stateOf(fsm), EngineState::NoEngine);
    EXPECT_FALSE(fsm.snapshot().context.has_value());
    EXPECT_EQ(fsm.snapshot().transitions, 0u);
}

TEST(EngineLifecycleFsmTest, EngineStartedGoesRunningWithContext) {
    EngineLifecycleFsm fsm;
    fsm.dispatch(EngineStartedEvent{shotContext("shot010")});
    auto snap = fsm.snapshot();
    EXPECT_EQ(snap.state, EngineState::Running);
    ASSERT_TRUE(snap.context.has_value());
    EXPECT_EQ(snap.context->entityName, "shot010");
    EXPECT_EQ(snap.transitions, 1u);
}

TEST(EngineLifecycleFsmTest, RestartKeepsRunningAndUpdatesContext) {
    EngineLifecycleFsm fsm;
    fsm.dispatch(EngineStartedEvent{shotContext("shot010")});
    fsm.dispatch(EngineStartedEvent{shotContext("shot020")});
    auto snap = fsm.snapshot();
    EXPECT_EQ(snap.state, EngineState::Running);
    EXPECT_EQ(snap.context->entityName, "shot020");
    // Running -> Running is not counted
    EXPECT_EQ(snap.transitions, 1u);
}

TEST(EngineLifecycleFsmTest, DisabledWithoutEngineClearsContext) {
    EngineLifecycleFsm fsm;
    fsm.dispatch(EngineStartedEvent{shotContext("shot010")});
    fsm.dispatch(EngineDisabledEvent{.reason = "init failed", .engineRetained = false});
    auto snap = fsm.snapshot();
    EXPECT_EQ(snap.state, EngineState::Disabled);
    EXPECT_FALSE(snap.context.has_value());
    EXPECT_FALSE(snap.engineRetained);
    EXPECT_EQ(snap.lastError, "init failed");
}

TEST(EngineLifecycleFsmTest, DisabledWithRetainedEngineKeepsContext) {
    EngineLifecycleFsm fsm;
    fsm.dispatch(EngineStartedEvent{shotContext("shot010")});
    fsm.dispatch(EngineDisabledEvent{.reason = "unknown path", .engineRetained = true});
    auto snap = fsm.snapshot();
    EXPECT_EQ(snap.state, EngineState::Disabled);
    EXPECT_TRUE(snap.engineRetained);
    ASSERT_TRUE(snap.context.has_value());
    EXPECT_EQ(snap.context->entityName, "shot010");
}

TEST(EngineLifecycleFsmTest, ContextKeptResumesRetainedEngine) {
    EngineLifecycleFsm fsm;
    fsm.dispatch(EngineStartedEvent{shotContext("shot010")});
    fsm.dispatch(EngineDisabledEvent{.reason = "unknown path", .engineRetained = true});
    fsm.dispatch(ContextKeptEvent{});
    EXPECT_EQ(stateOf(fsm), EngineState::Running);
    EXPECT_FALSE(fsm.snapshot().engineRetained);
    EXPECT_TRUE(fsm.snapshot().lastError.empty());
}

TEST(EngineLifecycleFsmTest, ContextKeptWithoutEngineStaysDisabled) {
    EngineLifecycleFsm fsm;
    fsm.dispatch(EngineDisabledEvent{.reason = "init failed", .engineRetained = false});
    fsm.dispatch(ContextKeptEvent{});
    EXPECT_EQ(stateOf(fsm), EngineState::Disabled);
}

TEST(EngineLifecycleFsmTest, DisabledFromNoEngine) {
    EngineLifecycleFsm fsm;
    fsm.dispatch(EngineDisabledEvent{.reason = "outside project"});
    EXPECT_EQ(stateOf(fsm), EngineState::Disabled);
}

TEST(EngineLifecycleFsmTest, StoppedIsTerminal) {
    EngineLifecycleFsm fsm;
    fsm.dispatch(EngineStartedEvent{shotContext("shot010")});
    fsm.dispatch(EngineStoppedEvent{});
    EXPECT_EQ(stateOf(fsm), EngineState::Stopped);
    EXPECT_FALSE(fsm.snapshot().context.has_value());

    fsm.dispatch(EngineStartedEvent{shotContext("shot020")});
    EXPECT_EQ(stateOf(fsm), EngineState::Stopped);
    fsm.dispatch(EngineDisabledEvent{.reason = "late"});
    EXPECT_EQ(stateOf(fsm), EngineState::Stopped);
    fsm.dispatch(ContextKeptEvent{});
    EXPECT_EQ(stateOf(fsm), EngineState::Stopped);
}

TEST(EngineLifecycleFsmTest, StoppedFromAnyState) {
    {
        EngineLifecycleFsm fsm;
        fsm.dispatch(EngineStoppedEvent{});
        EXPECT_EQ(stateOf(fsm), EngineState::Stopped);
    }
    {
        EngineLifecycleFsm fsm;
        fsm.dispatch(EngineDisabledEvent{.reason = "x"});
        fsm.dispatch(EngineStoppedEvent{});
        EXPECT_EQ(stateOf(fsm), EngineState::Stopped);
    }
}
