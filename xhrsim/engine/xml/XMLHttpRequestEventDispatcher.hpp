#ifndef XMLHttpRequestEventDispatcher_hpp
#define XMLHttpRequestEventDispatcher_hpp

#include <string>
#include <vector>
#include <boost/core/noncopyable.hpp>
#include <boost/function.hpp>

#include "../events/Event.hpp"
#include "../events/EventListener.hpp"
#include "QuirkProfile.hpp"


namespace xhrsim {

    class EventTarget;

/* how a send cycle ended. NONE while it has not */
enum class TerminalOutcome {
    NONE, LOAD, ERROR, ABORT, TIMEOUT,
};

const char* terminalEventName(const TerminalOutcome&);

/* turns request transitions into event firings.
 *
 * plan() is the whole ordering policy: which event types a
 * transition fires, in which order, given the mode and the quirk
 * profile. fireTransition() then fires them one by one, taking a
 * fresh snapshot of the request for each.
 *
 * listeners run synchronously, one at a time. whatever a listener
 * throws is reported through the handler error callback and does not
 * stop the other listeners or the rest of the transition
 */
class XMLHttpRequestEventDispatcher : private boost::noncopyable
{
public:
    enum class Transition {
        OPEN,
        SEND,
        DEFERRED_LOADSTART,
        HEADERS_RECEIVED,
        LOADING,
        DONE,
    };

    typedef boost::function<Event::Snapshot()> SnapshotFn;

    /* asked after every event; false means a listener has superseded
     * the transition (e.g., called abort() or open()), and the rest
     * of the plan is dropped. never asked during DONE: a finished
     * cycle always gets its terminal event and loadend
     */
    typedef boost::function<bool()> StillCurrentFn;

    /* (event being dispatched, what the listener threw) */
    typedef boost::function<void(const Event&, const std::string&)> HandlerErrorCb;

    explicit XMLHttpRequestEventDispatcher(const QuirkProfile&);

    std::vector<std::string> plan(const Transition&,
                                  const bool& async,
                                  const TerminalOutcome&) const;

    /* returns the number of events actually fired */
    size_t fireTransition(EventTarget*,
                          const Transition&,
                          const bool& async,
                          const TerminalOutcome&,
                          SnapshotFn,
                          StillCurrentFn);

    /* attribute listener and attached listeners for the event's type,
     * in the order the profile says
     */
    void dispatchEvent(EventTarget*, Event&);

    void set_handler_error_cb(HandlerErrorCb cb) { handler_error_cb_ = cb; }

    const QuirkProfile& profile() const { return profile_; }

private:

    void _invoke_listener(const EventListener::Ptr&, Event&);
    void _report_handler_error(const Event&, const std::string&);

    const QuirkProfile profile_;
    HandlerErrorCb handler_error_cb_;
};

} // namespace xhrsim

#endif // XMLHttpRequestEventDispatcher_hpp
