#include <stdexcept>
#include <string>
#include <vector>
#include <boost/bind.hpp>
#include <gtest/gtest.h>

#include "xhrsim/engine/events/Event.hpp"
#include "xhrsim/engine/events/EventListener.hpp"
#include "xhrsim/engine/events/EventTypeNames.hpp"
#include "xhrsim/engine/xml/QuirkProfile.hpp"
#include "xhrsim/engine/xml/XMLHttpRequestEventDispatcher.hpp"

#include "test_util.hpp"

using std::string;
using std::vector;

using xhrsim::AttributeListenerOrder;
using xhrsim::Event;
using xhrsim::EventTarget;
using xhrsim::FunctionEventListener;
using xhrsim::QuirkProfile;
using xhrsim::ReadyState;
using xhrsim::TerminalOutcome;
using xhrsim::XMLHttpRequestEventDispatcher;
using xhrsim_test::TestTarget;

typedef XMLHttpRequestEventDispatcher::Transition Transition;

namespace {

struct TestState
{
    TestState() : state(ReadyState::OPENED), status(0), current(true), num_snapshots(0) {}

    Event::Snapshot snapshot()
    {
        ++num_snapshots;
        Event::Snapshot s;
        s.readyState = state;
        s.status = status;
        s.async = true;
        return s;
    }

    bool still_current() const { return current; }

    ReadyState state;
    int status;
    bool current;
    int num_snapshots;
};

void s_append(vector<string>* log, const string& tag, Event* event)
{
    log->push_back(tag + ":" + event->type());
}

void s_throw(Event*)
{
    throw std::runtime_error("handler blew up");
}

void s_throw_int(Event*)
{
    throw 42;
}

class EventDispatcherTest : public ::testing::Test
{
protected:
    EventDispatcherTest()
        : target_(new TestTarget())
    {
    }

    size_t fire(XMLHttpRequestEventDispatcher& dispatcher,
                const Transition& transition,
                const TerminalOutcome& outcome = TerminalOutcome::NONE)
    {
        return dispatcher.fireTransition(
            target_.get(), transition, true, outcome,
            boost::bind(&TestState::snapshot, &state_),
            boost::bind(&TestState::still_current, &state_));
    }

    EventTarget::UniquePtr target_;
    TestState state_;
};

QuirkProfile
s_attribute_last_profile()
{
    QuirkProfile profile = QuirkProfile::default_profile();
    profile.name = "attribute-last";
    profile.attribute_listener_order = AttributeListenerOrder::AFTER_LISTENERS;
    return profile;
}

} // namespace

// ------------------------------------------------------------------
// plan()
// ------------------------------------------------------------------

TEST(EventDispatcherPlanTest, OpenFiresReadyStateChangeInEveryMode)
{
    XMLHttpRequestEventDispatcher def(QuirkProfile::default_profile());
    XMLHttpRequestEventDispatcher ie(QuirkProfile::legacy_ie_profile());

    const vector<string> expected = {"readystatechange"};
    EXPECT_EQ(def.plan(Transition::OPEN, true, TerminalOutcome::NONE), expected);
    EXPECT_EQ(def.plan(Transition::OPEN, false, TerminalOutcome::NONE), expected);
    EXPECT_EQ(ie.plan(Transition::OPEN, true, TerminalOutcome::NONE), expected);
    EXPECT_EQ(ie.plan(Transition::OPEN, false, TerminalOutcome::NONE), expected);
}

TEST(EventDispatcherPlanTest, SyncSendFiresNothing)
{
    XMLHttpRequestEventDispatcher def(QuirkProfile::default_profile());
    XMLHttpRequestEventDispatcher ie(QuirkProfile::legacy_ie_profile());

    EXPECT_TRUE(def.plan(Transition::SEND, false, TerminalOutcome::NONE).empty());
    EXPECT_TRUE(ie.plan(Transition::SEND, false, TerminalOutcome::NONE).empty());
}

TEST(EventDispatcherPlanTest, AsyncSendPerProfile)
{
    XMLHttpRequestEventDispatcher def(QuirkProfile::default_profile());
    XMLHttpRequestEventDispatcher ie(QuirkProfile::legacy_ie_profile());

    EXPECT_EQ(def.plan(Transition::SEND, true, TerminalOutcome::NONE),
              vector<string>({"loadstart"}));

    // loadstart comes later, from DEFERRED_LOADSTART
    EXPECT_EQ(ie.plan(Transition::SEND, true, TerminalOutcome::NONE),
              vector<string>({"readystatechange"}));
    EXPECT_EQ(ie.plan(Transition::DEFERRED_LOADSTART, true, TerminalOutcome::NONE),
              vector<string>({"loadstart"}));
}

TEST(EventDispatcherPlanTest, DuplicateWithoutDeferredLoadstart)
{
    QuirkProfile profile = QuirkProfile::legacy_ie_profile();
    profile.loadstart_after_send_returns = false;

    XMLHttpRequestEventDispatcher dup_first(profile);
    EXPECT_EQ(dup_first.plan(Transition::SEND, true, TerminalOutcome::NONE),
              vector<string>({"readystatechange", "loadstart"}));

    profile.duplicate_precedes_loadstart = false;
    XMLHttpRequestEventDispatcher dup_last(profile);
    EXPECT_EQ(dup_last.plan(Transition::SEND, true, TerminalOutcome::NONE),
              vector<string>({"loadstart", "readystatechange"}));
}

TEST(EventDispatcherPlanTest, ProgressTransitions)
{
    XMLHttpRequestEventDispatcher def(QuirkProfile::default_profile());

    EXPECT_EQ(def.plan(Transition::HEADERS_RECEIVED, true, TerminalOutcome::NONE),
              vector<string>({"readystatechange"}));
    EXPECT_EQ(def.plan(Transition::LOADING, true, TerminalOutcome::NONE),
              vector<string>({"readystatechange", "progress"}));
}

TEST(EventDispatcherPlanTest, DoneEndsWithTerminalThenLoadend)
{
    const QuirkProfile* profiles[] = {
        &QuirkProfile::default_profile(), &QuirkProfile::legacy_ie_profile(),
    };

    for (const auto* profile : profiles) {
        XMLHttpRequestEventDispatcher dispatcher(*profile);
        for (const bool async : {true, false}) {
            EXPECT_EQ(dispatcher.plan(Transition::DONE, async, TerminalOutcome::LOAD),
                      vector<string>({"readystatechange", "load", "loadend"}));
            EXPECT_EQ(dispatcher.plan(Transition::DONE, async, TerminalOutcome::ERROR),
                      vector<string>({"readystatechange", "error", "loadend"}));
            EXPECT_EQ(dispatcher.plan(Transition::DONE, async, TerminalOutcome::ABORT),
                      vector<string>({"readystatechange", "abort", "loadend"}));
            EXPECT_EQ(dispatcher.plan(Transition::DONE, async, TerminalOutcome::TIMEOUT),
                      vector<string>({"readystatechange", "timeout", "loadend"}));
        }
    }
}

TEST(EventDispatcherPlanTest, TerminalEventNames)
{
    EXPECT_STREQ(xhrsim::terminalEventName(TerminalOutcome::LOAD), "load");
    EXPECT_STREQ(xhrsim::terminalEventName(TerminalOutcome::ERROR), "error");
    EXPECT_STREQ(xhrsim::terminalEventName(TerminalOutcome::ABORT), "abort");
    EXPECT_STREQ(xhrsim::terminalEventName(TerminalOutcome::TIMEOUT), "timeout");
}

// ------------------------------------------------------------------
// dispatchEvent() / fireTransition()
// ------------------------------------------------------------------

TEST_F(EventDispatcherTest, AttributeListenerBeforeListenersByDefault)
{
    vector<string> log;
    XMLHttpRequestEventDispatcher dispatcher(QuirkProfile::default_profile());

    // assigned after the listeners were attached, still runs first
    ASSERT_TRUE(target_->addEventListener(
                    "load", FunctionEventListener::create(
                        boost::bind(s_append, &log, "first", _1))));
    ASSERT_TRUE(target_->addEventListener(
                    "load", FunctionEventListener::create(
                        boost::bind(s_append, &log, "second", _1))));
    target_->setAttributeEventListener(
        "load", FunctionEventListener::create(
            boost::bind(s_append, &log, "onload", _1)));

    Event event("load", target_.get(), state_.snapshot());
    dispatcher.dispatchEvent(target_.get(), event);

    EXPECT_EQ(log, vector<string>({"onload:load", "first:load", "second:load"}));
}

TEST_F(EventDispatcherTest, AttributeListenerAfterListenersWhenProfileSaysSo)
{
    vector<string> log;
    XMLHttpRequestEventDispatcher dispatcher(s_attribute_last_profile());

    target_->setAttributeEventListener(
        "load", FunctionEventListener::create(
            boost::bind(s_append, &log, "onload", _1)));
    ASSERT_TRUE(target_->addEventListener(
                    "load", FunctionEventListener::create(
                        boost::bind(s_append, &log, "first", _1))));

    Event event("load", target_.get(), state_.snapshot());
    dispatcher.dispatchEvent(target_.get(), event);

    EXPECT_EQ(log, vector<string>({"first:load", "onload:load"}));
}

TEST_F(EventDispatcherTest, FiresPlannedEventsInOrderWithFreshSnapshots)
{
    vector<string> log;
    XMLHttpRequestEventDispatcher dispatcher(QuirkProfile::default_profile());

    const auto listener = FunctionEventListener::create(
        boost::bind(s_append, &log, "l", _1));
    ASSERT_TRUE(target_->addEventListener("readystatechange", listener));
    ASSERT_TRUE(target_->addEventListener("load", listener));
    ASSERT_TRUE(target_->addEventListener("loadend", listener));

    state_.state = ReadyState::DONE;
    state_.status = 200;

    const auto num_fired = fire(dispatcher, Transition::DONE, TerminalOutcome::LOAD);

    EXPECT_EQ(num_fired, 3u);
    EXPECT_EQ(state_.num_snapshots, 3);
    EXPECT_EQ(log, vector<string>({"l:readystatechange", "l:load", "l:loadend"}));
}

TEST_F(EventDispatcherTest, SnapshotReflectsChangesMadeByEarlierListeners)
{
    vector<string> described;
    XMLHttpRequestEventDispatcher dispatcher(QuirkProfile::default_profile());

    TestState* state = &state_;
    ASSERT_TRUE(target_->addEventListener(
                    "readystatechange",
                    FunctionEventListener::create([state, &described](Event* e) {
                            described.push_back(e->describe());
                            state->status = 777;
                        })));
    ASSERT_TRUE(target_->addEventListener(
                    "progress",
                    FunctionEventListener::create([&described](Event* e) {
                            described.push_back(e->describe());
                        })));

    state_.state = ReadyState::LOADING;
    fire(dispatcher, Transition::LOADING);

    EXPECT_EQ(described,
              vector<string>({"readystatechange_3_0_true", "progress_3_777_false"}));
}

TEST_F(EventDispatcherTest, StopsWhenTransitionIsSuperseded)
{
    vector<string> log;
    XMLHttpRequestEventDispatcher dispatcher(QuirkProfile::default_profile());

    TestState* state = &state_;
    ASSERT_TRUE(target_->addEventListener(
                    "readystatechange",
                    FunctionEventListener::create([state, &log](Event* e) {
                            log.push_back(e->type());
                            state->current = false;
                        })));
    ASSERT_TRUE(target_->addEventListener(
                    "progress", FunctionEventListener::create(
                        boost::bind(s_append, &log, "l", _1))));

    state_.state = ReadyState::LOADING;
    const auto num_fired = fire(dispatcher, Transition::LOADING);

    EXPECT_EQ(num_fired, 1u);
    EXPECT_EQ(log, vector<string>({"readystatechange"}));
}

TEST_F(EventDispatcherTest, DoneRunsToTheEndEvenWhenSuperseded)
{
    vector<string> log;
    XMLHttpRequestEventDispatcher dispatcher(QuirkProfile::default_profile());

    TestState* state = &state_;
    const auto superseding = FunctionEventListener::create([state, &log](Event* e) {
            log.push_back(e->type());
            state->current = false;
        });
    ASSERT_TRUE(target_->addEventListener("readystatechange", superseding));
    ASSERT_TRUE(target_->addEventListener("error", superseding));
    ASSERT_TRUE(target_->addEventListener(
                    "loadend", FunctionEventListener::create(
                        boost::bind(s_append, &log, "l", _1))));

    state_.state = ReadyState::DONE;
    const auto num_fired = fire(dispatcher, Transition::DONE, TerminalOutcome::ERROR);

    EXPECT_EQ(num_fired, 3u);
    EXPECT_EQ(log, vector<string>({"readystatechange", "error", "l:loadend"}));
}

TEST_F(EventDispatcherTest, ThrowingListenerIsIsolated)
{
    vector<string> log;
    vector<string> errors;
    XMLHttpRequestEventDispatcher dispatcher(QuirkProfile::default_profile());
    dispatcher.set_handler_error_cb([&errors](const Event& e, const string& what) {
            errors.push_back(e.type() + ": " + what);
        });

    target_->setAttributeEventListener("readystatechange",
                                       FunctionEventListener::create(s_throw));
    ASSERT_TRUE(target_->addEventListener(
                    "readystatechange", FunctionEventListener::create(
                        boost::bind(s_append, &log, "sibling", _1))));
    ASSERT_TRUE(target_->addEventListener(
                    "error", FunctionEventListener::create(s_throw_int)));
    ASSERT_TRUE(target_->addEventListener(
                    "loadend", FunctionEventListener::create(
                        boost::bind(s_append, &log, "after", _1))));

    const auto num_fired = fire(dispatcher, Transition::DONE, TerminalOutcome::ERROR);

    EXPECT_EQ(num_fired, 3u);
    EXPECT_EQ(log, vector<string>({"sibling:readystatechange", "after:loadend"}));
    EXPECT_EQ(errors, vector<string>({"readystatechange: handler blew up",
                                      "error: non-standard exception"}));
}

TEST_F(EventDispatcherTest, ListenerAddedDuringDispatchWaitsForNextEvent)
{
    vector<string> log;
    XMLHttpRequestEventDispatcher dispatcher(QuirkProfile::default_profile());

    const auto late = FunctionEventListener::create(
        boost::bind(s_append, &log, "late", _1));
    EventTarget* target = target_.get();
    ASSERT_TRUE(target_->addEventListener(
                    "progress",
                    FunctionEventListener::create([target, late, &log](Event* e) {
                            log.push_back("adder:" + e->type());
                            target->addEventListener("progress", late);
                        })));

    Event first("progress", target_.get(), state_.snapshot());
    dispatcher.dispatchEvent(target_.get(), first);
    EXPECT_EQ(log, vector<string>({"adder:progress"}));

    Event second("progress", target_.get(), state_.snapshot());
    dispatcher.dispatchEvent(target_.get(), second);
    EXPECT_EQ(log, vector<string>({"adder:progress", "adder:progress", "late:progress"}));
}
