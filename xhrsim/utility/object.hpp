#ifndef object_hpp
#define object_hpp

#include <memory>
#include <stdint.h>

#include <folly/io/async/DelayedDestruction.h>


/* base of everything in the simulator that fires callbacks into user
 * code: requests, timers and the scripted transport.
 *
 * a listener may destroy the object that is calling it, so the firing
 * side holds a DestructorGuard until it is back in its own code, and
 * owners release through UniquePtr (i.e., destroy()) instead of
 * delete. objId() numbers instances in creation order for the logs.
 */
class Object : public folly::DelayedDestruction
{
public:
    typedef std::unique_ptr<Object, Destructor> UniquePtr;

    const uint32_t& objId() const { return objId_; }

    // final, so no subclass can skip the delayed path
    virtual void destroy() override final { DelayedDestruction::destroy(); }

protected:

    Object();
    virtual ~Object() = default;

    const uint32_t objId_;
};

#endif /* end object_hpp */
