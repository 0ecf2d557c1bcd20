#include <sstream>

#include "../../utility/common.hpp"

#include "Event.hpp"
#include "EventTypeNames.hpp"


namespace xhrsim
{

Event::Event(const std::string& type,
             EventTarget* target,
             const Snapshot& snapshot)
    : type_(type)
    , target_(target)
    , snapshot_(snapshot)
{
}

bool
Event::isProgressEvent() const
{
    return type_ != EventTypeNames::readystatechange;
}

std::string
Event::describe() const
{
    std::ostringstream ss;
    ss << type_ << "_" << int(common::as_integer(snapshot_.readyState))
       << "_" << snapshot_.status
       << "_" << (isProgressEvent() ? "false" : "true");
    return ss.str();
}

} // end namespace xhrsim
