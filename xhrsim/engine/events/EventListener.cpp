#include <easylogging++.h>

#include "EventListener.hpp"


namespace xhrsim
{

EventListener::Ptr
FunctionEventListener::create(HandlerFn fn)
{
    return std::make_shared<FunctionEventListener>(fn);
}

FunctionEventListener::FunctionEventListener(HandlerFn fn)
    : fn_(fn)
{
    CHECK(!fn_.empty());
}

void
FunctionEventListener::handleEvent(Event* event)
{
    fn_(event);
}

} // end namespace xhrsim
