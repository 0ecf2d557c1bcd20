#ifndef timer_hpp
#define timer_hpp

#include <memory>
#include <event2/event.h>
#include <boost/function.hpp>

#include "object.hpp"


/* one-shot timeout on the event loop.
 *
 * the request uses one to queue its deferred loadstart, and the
 * scripted transport uses one per transfer to pace the script. each
 * arm() fires the callback at most once; re-arm from inside the
 * callback to keep going.
 */
class Timer : public Object
{
public:
    typedef std::unique_ptr<Timer, Destructor> UniquePtr;
    typedef boost::function<void(Timer*)> FiredCb;

    /* "priority" is set on the event if >= 0; 0 is the highest, so a
     * priority-0 timer armed with no delay runs ahead of other events
     * that become active in the same loop iteration
     */
    Timer(struct event_base *evbase, FiredCb cb, int priority=-1);

    /* fire "msec" from now. must not already be armed */
    void arm(const uint32_t msec);

    /* fire on the next loop iteration */
    void arm_now() { arm(0); }

    /* ok to call when not armed */
    void disarm();

    bool is_armed() const;

    uint32_t num_fired() const { return num_fired_; }

protected:

    virtual ~Timer();

    static void s_event_cb(int, short, void*);

    FiredCb fired_cb_;
    std::unique_ptr<struct event, void(*)(struct event*)> ev_;
    uint32_t num_fired_;
};


#endif /* timer_hpp */
