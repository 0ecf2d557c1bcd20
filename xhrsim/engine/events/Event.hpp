#ifndef Event_hpp
#define Event_hpp

#include <string>

#include "../xml/ReadyState.hpp"


namespace xhrsim {

    class EventTarget;

/* an event as handed to listeners. it carries a snapshot of the
 * request taken right before it was dispatched, not when the
 * transition that produced it was planned: a listener that runs
 * earlier in the same transition can change what later events see
 */
class Event
{
public:
    struct Snapshot
    {
        ReadyState readyState;
        int status;
        bool async;
    };

    Event(const std::string& type,
          EventTarget* target,
          const Snapshot&);

    const std::string& type() const { return type_; }
    EventTarget* target() const { return target_; }

    const ReadyState& readyState() const { return snapshot_.readyState; }
    const int& status() const { return snapshot_.status; }
    const bool& async() const { return snapshot_.async; }

    /* everything except readystatechange is a ProgressEvent, so
     * script would find "loaded" on it
     */
    bool isProgressEvent() const;

    /* "<type>_<readyState>_<status>_<plain>", where <plain> is true
     * if the event is not a progress event
     */
    std::string describe() const;

private:

    const std::string type_;
    EventTarget* target_;
    const Snapshot snapshot_;
};

} // namespace xhrsim

#endif // Event_hpp
