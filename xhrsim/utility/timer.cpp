
#include <easylogging++.h>

#include "timer.hpp"


#define _LOG_PREFIX(inst) << "timer= " << (inst)->objId() << ": "

#define vloginst(level, inst) VLOG(level) _LOG_PREFIX(inst)
#define vlogself(level) vloginst(level, this)


Timer::Timer(struct event_base *evbase,
             FiredCb cb,
             int priority)
    : fired_cb_(cb)
    , ev_(nullptr, event_free)
    , num_fired_(0)
{
    CHECK_NOTNULL(evbase);
    CHECK(fired_cb_);

    ev_.reset(evtimer_new(evbase, s_event_cb, this));
    CHECK_NOTNULL(ev_.get());

    if (priority >= 0) {
        auto rv = event_priority_set(ev_.get(), priority);
        CHECK_EQ(rv, 0);
    }
}

void
Timer::arm(const uint32_t msec)
{
    CHECK(!is_armed()) << "already armed to fire";

    struct timeval tv;
    tv.tv_sec = msec / 1000;
    tv.tv_usec = (msec % 1000) * 1000;

    auto rv = evtimer_add(ev_.get(), &tv);
    CHECK_EQ(rv, 0);

    vlogself(3) << "armed for " << msec << " ms";
}

void
Timer::disarm()
{
    auto rv = evtimer_del(ev_.get());
    CHECK_EQ(rv, 0);
}

bool
Timer::is_armed() const
{
    return evtimer_pending(ev_.get(), nullptr) != 0;
}

Timer::~Timer()
{
    evtimer_del(ev_.get());
}

void
Timer::s_event_cb(int, short, void* arg)
{
    Timer* timer = (Timer*)arg;

    // the callback commonly drops the last reference to us (e.g., a
    // transfer finishing and erasing itself), so keep ourselves alive
    // until it returns
    Object::DestructorGuard dg(timer);
    ++timer->num_fired_;
    timer->fired_cb_(timer);
}
