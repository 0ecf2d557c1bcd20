#ifndef ScriptedTransport_hpp
#define ScriptedTransport_hpp

#include <deque>
#include <map>
#include <memory>
#include <string>

#include "../../utility/object.hpp"
#include "../../utility/timer.hpp"

#include "Transport.hpp"
#include "TransportFixtures.hpp"


namespace xhrsim {

/* plays back the canned response of the target's fixture.
 *
 * every transfer becomes a script of steps: zero or more progress
 * ticks, then the ending (complete/failure). a target without a
 * fixture fails right away, like an unreachable host.
 *
 * async transfers run each step off a one-shot timer on the event
 * base. when a timeout is given, steps due before the deadline still
 * run, and the rest is replaced by a timeout at the deadline.
 *
 * sync transfers sleep for the length of the script and then make
 * all the callbacks before beginTransfer() returns
 */
class ScriptedTransport : public Object
                        , public Transport
{
public:
    typedef std::unique_ptr<ScriptedTransport, Destructor> UniquePtr;

    explicit ScriptedTransport(struct ::event_base*,
                               const TransportFixtures*);

    /* implement Transport interface */
    virtual CycleHandle beginTransfer(TransportClient* client,
                                      const std::string& target,
                                      const bool& async,
                                      const uint32_t& timeout_ms) override;
    virtual void cancelTransfer(const CycleHandle&) override;

    size_t num_active_transfers() const { return transfers_.size(); }

protected:

    virtual ~ScriptedTransport();

    enum class StepKind {
        PROGRESS, COMPLETE, FAILURE, TIMEOUT,
    };

    struct Step
    {
        // since the start of the transfer
        uint32_t at_ms;
        StepKind kind;
    };

    struct Transfer
    {
        CycleHandle handle;
        TransportClient* client;
        std::string target;
        int status;
        std::deque<Step> steps;
        uint32_t elapsed_ms;
        Timer::UniquePtr timer;
    };

    std::deque<Step> _build_script(const std::string& target,
                                   const uint32_t& timeout_ms,
                                   int& status) const;

    void _run_sync_script(TransportClient*, const CycleHandle&,
                          const std::deque<Step>&, const int& status);

    void _schedule_next_step(Transfer*);
    void _on_step_timer_fired(Timer*, CycleHandle);

    static void _deliver(TransportClient*, const CycleHandle&,
                         const StepKind&, const int& status);

    //////////

    struct ::event_base* evbase_;
    const TransportFixtures* fixtures_;

    CycleHandle next_handle_;

    std::map<CycleHandle, std::unique_ptr<Transfer> > transfers_;
};

} // namespace xhrsim

#endif // ScriptedTransport_hpp
