#ifndef EventListener_hpp
#define EventListener_hpp

#include <memory>
#include <boost/function.hpp>


namespace xhrsim {

    class Event;

/* listeners are compared by identity, i.e., the same shared pointer
 * registered twice is the same listener, while two listeners
 * wrapping the same function are not
 */
class EventListener
{
public:
    typedef std::shared_ptr<EventListener> Ptr;

    virtual ~EventListener() = default;

    /* may throw; the dispatcher isolates whatever escapes */
    virtual void handleEvent(Event*) = 0;
};

class FunctionEventListener final : public EventListener
{
public:
    typedef boost::function<void(Event*)> HandlerFn;

    static EventListener::Ptr create(HandlerFn fn);

    explicit FunctionEventListener(HandlerFn fn);

    virtual void handleEvent(Event*) override;

private:
    HandlerFn fn_;
};

} // namespace xhrsim

#endif // EventListener_hpp
