#include <exception>

#include <easylogging++.h>
#include <boost/algorithm/string/join.hpp>

#include "../../utility/common.hpp"
#include "../events/EventTarget.hpp"
#include "../events/EventTypeNames.hpp"

#include "XMLHttpRequestEventDispatcher.hpp"

using std::string;
using std::vector;


namespace xhrsim
{

const char*
terminalEventName(const TerminalOutcome& outcome)
{
    switch (outcome) {
    case TerminalOutcome::LOAD:
        return EventTypeNames::load;
    case TerminalOutcome::ERROR:
        return EventTypeNames::error;
    case TerminalOutcome::ABORT:
        return EventTypeNames::abort;
    case TerminalOutcome::TIMEOUT:
        return EventTypeNames::timeout;
    case TerminalOutcome::NONE:
        break;
    }
    LOG(FATAL) << "no terminal event for an unfinished cycle";
    return nullptr;
}

XMLHttpRequestEventDispatcher::XMLHttpRequestEventDispatcher(
    const QuirkProfile& profile)
    : profile_(profile)
{
    VLOG(2) << "dispatcher with quirk profile: " << profile_.name;
}

vector<string>
XMLHttpRequestEventDispatcher::plan(const Transition& transition,
                                    const bool& async,
                                    const TerminalOutcome& outcome) const
{
    vector<string> types;

    switch (transition) {
    case Transition::OPEN:
        types.push_back(EventTypeNames::readystatechange);
        break;

    case Transition::SEND:
        if (!async) {
            // nothing is observable until the sync transfer is done
            break;
        }
        if (profile_.loadstart_after_send_returns) {
            if (profile_.duplicate_opened_readystatechange_on_send) {
                types.push_back(EventTypeNames::readystatechange);
            }
        } else if (profile_.duplicate_opened_readystatechange_on_send) {
            if (profile_.duplicate_precedes_loadstart) {
                types.push_back(EventTypeNames::readystatechange);
                types.push_back(EventTypeNames::loadstart);
            } else {
                types.push_back(EventTypeNames::loadstart);
                types.push_back(EventTypeNames::readystatechange);
            }
        } else {
            types.push_back(EventTypeNames::loadstart);
        }
        break;

    case Transition::DEFERRED_LOADSTART:
        CHECK(async);
        types.push_back(EventTypeNames::loadstart);
        break;

    case Transition::HEADERS_RECEIVED:
        CHECK(async);
        types.push_back(EventTypeNames::readystatechange);
        break;

    case Transition::LOADING:
        CHECK(async);
        types.push_back(EventTypeNames::readystatechange);
        types.push_back(EventTypeNames::progress);
        break;

    case Transition::DONE:
        types.push_back(EventTypeNames::readystatechange);
        types.push_back(terminalEventName(outcome));
        types.push_back(EventTypeNames::loadend);
        break;
    }

    VLOG(3) << "transition " << common::as_integer(transition)
            << (async ? " async" : " sync") << ": ["
            << boost::algorithm::join(types, ", ") << "]";
    return types;
}

size_t
XMLHttpRequestEventDispatcher::fireTransition(EventTarget* target,
                                              const Transition& transition,
                                              const bool& async,
                                              const TerminalOutcome& outcome,
                                              SnapshotFn snapshot_fn,
                                              StillCurrentFn still_current_fn)
{
    CHECK_NOTNULL(target);

    // a listener may drop the last reference to the target
    folly::DelayedDestruction::DestructorGuard dg(target);

    const auto types = plan(transition, async, outcome);
    size_t num_fired = 0;

    for (const auto& type : types) {
        Event event(type, target, snapshot_fn());
        dispatchEvent(target, event);
        ++num_fired;

        // the send cycle has ended: its terminal event and loadend go
        // out no matter what the listeners do
        if (transition == Transition::DONE) {
            continue;
        }

        if (!still_current_fn()) {
            VLOG(2) << "transition superseded after [" << type << "], dropping "
                    << (types.size() - num_fired) << " planned event(s)";
            break;
        }
    }

    return num_fired;
}

void
XMLHttpRequestEventDispatcher::dispatchEvent(EventTarget* target, Event& event)
{
    VLOG(2) << "begin, event= " << event.describe();

    const auto attribute_listener = target->getAttributeEventListener(event.type());
    const auto listeners = target->getEventListeners(event.type());

    if (attribute_listener
        && profile_.attribute_listener_order == AttributeListenerOrder::BEFORE_LISTENERS)
    {
        _invoke_listener(attribute_listener, event);
    }

    for (const auto& listener : listeners) {
        _invoke_listener(listener, event);
    }

    if (attribute_listener
        && profile_.attribute_listener_order == AttributeListenerOrder::AFTER_LISTENERS)
    {
        _invoke_listener(attribute_listener, event);
    }

    VLOG(2) << "done, " << listeners.size() << " listener(s)"
            << (attribute_listener ? " + attribute listener" : "");
}

void
XMLHttpRequestEventDispatcher::_invoke_listener(const EventListener::Ptr& listener,
                                                Event& event)
{
    try {
        listener->handleEvent(&event);
    } catch (const std::exception& e) {
        _report_handler_error(event, e.what());
    } catch (...) {
        _report_handler_error(event, "non-standard exception");
    }
}

void
XMLHttpRequestEventDispatcher::_report_handler_error(const Event& event,
                                                     const std::string& what)
{
    LOG(WARNING) << "listener for [" << event.type() << "] threw: " << what;
    if (handler_error_cb_) {
        handler_error_cb_(event, what);
    }
}

} // end namespace xhrsim
