#ifndef EventTarget_hpp
#define EventTarget_hpp

#include <map>
#include <string>
#include <vector>

#include "../../utility/object.hpp"

#include "EventListener.hpp"


namespace xhrsim {

/* the listener registry. per event type there is an ordered list of
 * listeners attached with addEventListener(), plus one "attribute"
 * slot, i.e., what script sets with "xhr.onload = ...".
 *
 * the registry does not decide where the attribute listener runs
 * relative to the list; the dispatcher does, from the quirk profile
 */
class EventTarget : public Object
{
public:
    typedef std::unique_ptr<EventTarget, Destructor> UniquePtr;

    /* returns false, and adds nothing, if the listener is null, is
     * already in the list for this type, or the type is not one we
     * ever fire
     */
    bool addEventListener(const std::string& event_type,
                          const EventListener::Ptr&);

    /* returns false if the listener was not registered for the type */
    bool removeEventListener(const std::string& event_type,
                             const EventListener::Ptr&);

    void removeAllEventListeners();

    /* replaces whatever is in the slot; null clears it */
    void setAttributeEventListener(const std::string& event_type,
                                   const EventListener::Ptr&);
    EventListener::Ptr getAttributeEventListener(const std::string& event_type) const;

    bool hasEventListeners(const std::string& event_type) const;

    /* copy of the list, in attach order. the dispatcher works off a
     * copy so listeners can add/remove listeners while being called
     */
    std::vector<EventListener::Ptr> getEventListeners(const std::string& event_type) const;

    static bool is_supported_event_name(const std::string&);

protected:

    EventTarget();

    virtual ~EventTarget();

    ////////

    /* map from event type names like "load", "readystatechange",
     * etc. to the listeners attached for it
     */
    std::map<std::string, std::vector<EventListener::Ptr> > event_listeners_;

    std::map<std::string, EventListener::Ptr> attribute_listeners_;
};

} // namespace xhrsim

#endif // EventTarget_hpp
