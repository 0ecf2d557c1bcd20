#include <algorithm>

#include <easylogging++.h>

#include "../../utility/common.hpp"

#include "EventTarget.hpp"
#include "EventTypeNames.hpp"

using std::string;
using std::vector;


#define _LOG_PREFIX(inst) << "target= " << (inst)->objId() << ": "

/* "inst" stands for instance, as in, instance of a class */
#define vloginst(level, inst) VLOG(level) _LOG_PREFIX(inst)
#define vlogself(level) vloginst(level, this)


namespace xhrsim
{

bool
EventTarget::is_supported_event_name(const std::string& name)
{
    if (name == EventTypeNames::readystatechange
        || name == EventTypeNames::loadstart
        || name == EventTypeNames::progress
        || name == EventTypeNames::load
        || name == EventTypeNames::error
        || name == EventTypeNames::abort
        || name == EventTypeNames::timeout
        || name == EventTypeNames::loadend)
    {
        return true;
    }

    LOG(WARNING) << "event name \"" << name << "\" is not supported";
    return false;
}

EventTarget::EventTarget()
{
}

EventTarget::~EventTarget()
{
    vlogself(2) << "destructing";
}

bool
EventTarget::addEventListener(const std::string& event_type,
                              const EventListener::Ptr& listener)
{
    if (!listener || !is_supported_event_name(event_type)) {
        return false;
    }

    auto& listeners = event_listeners_[event_type];
    if (std::find(listeners.begin(), listeners.end(), listener)
        != listeners.end())
    {
        vlogself(2) << "listener " << listener.get() << " already attached for ["
                    << event_type << "]";
        return false;
    }

    listeners.push_back(listener);
    vlogself(3) << "add [" << event_type << "] listener " << listener.get()
                << ", now " << listeners.size();
    return true;
}

bool
EventTarget::removeEventListener(const std::string& event_type,
                                 const EventListener::Ptr& listener)
{
    auto it = event_listeners_.find(event_type);
    if (it == event_listeners_.end()) {
        return false;
    }

    auto& listeners = it->second;
    auto found = std::find(listeners.begin(), listeners.end(), listener);
    if (found == listeners.end()) {
        return false;
    }

    listeners.erase(found);
    if (listeners.empty()) {
        event_listeners_.erase(it);
    }
    return true;
}

void
EventTarget::removeAllEventListeners()
{
    vlogself(2) << "clearing listeners for " << event_listeners_.size()
                << " types and " << attribute_listeners_.size() << " slots";
    event_listeners_.clear();
    attribute_listeners_.clear();
}

void
EventTarget::setAttributeEventListener(const std::string& event_type,
                                       const EventListener::Ptr& listener)
{
    if (!listener) {
        attribute_listeners_.erase(event_type);
        return;
    }

    if (!is_supported_event_name(event_type)) {
        return;
    }

    attribute_listeners_[event_type] = listener;
}

EventListener::Ptr
EventTarget::getAttributeEventListener(const std::string& event_type) const
{
    auto it = attribute_listeners_.find(event_type);
    return (it == attribute_listeners_.end()) ? nullptr : it->second;
}

bool
EventTarget::hasEventListeners(const std::string& event_type) const
{
    return inMap(event_listeners_, event_type)
        || inMap(attribute_listeners_, event_type);
}

vector<EventListener::Ptr>
EventTarget::getEventListeners(const std::string& event_type) const
{
    auto it = event_listeners_.find(event_type);
    if (it == event_listeners_.end()) {
        return vector<EventListener::Ptr>();
    }
    return it->second;
}

} // end namespace xhrsim
