#ifndef XMLHttpRequest_hpp
#define XMLHttpRequest_hpp

#include <memory>
#include <string>

#include "../../utility/object.hpp"
#include "../../utility/timer.hpp"

#include "../ExceptionState.hpp"
#include "../events/EventTarget.hpp"
#include "../fetch/Transport.hpp"

#include "QuirkProfile.hpp"
#include "ReadyState.hpp"
#include "XMLHttpRequestEventDispatcher.hpp"


namespace xhrsim {

/*
 * one request object, reusable across cycles: each open() starts a
 * new cycle, and each cycle that gets as far as send() ends with
 * exactly one of load/error/abort/timeout, followed by loadend.
 *
 * everything (api calls, transport callbacks, queued tasks) must run
 * on the thread that runs "evbase"; there are no locks.
 *
 * sync send() blocks inside the transport until the transfer is over,
 * and only readystatechange(4), the terminal event and loadend are
 * observable. async send() returns right away and the transport's
 * callbacks drive the rest.
 *
 * failures of the transfer itself are reported ONLY as events. the
 * ExceptionState params are for misuse of the api (send() in the wrong
 * state, etc.)
 */
class XMLHttpRequest final : public EventTarget
                           , public TransportClient
{
public:
    typedef std::unique_ptr<XMLHttpRequest, Destructor> UniquePtr;

    /* uses QuirkProfile::process_default() */
    explicit XMLHttpRequest(struct ::event_base*, Transport*);

    explicit XMLHttpRequest(struct ::event_base*,
                            Transport*,
                            const QuirkProfile&);

    void open(const std::string& method,
              const std::string& url,
              const bool& async,
              ExceptionState&);

    void send(ExceptionState&);
    void send(const std::string& body, ExceptionState&);

    /* no-op unless a send is in progress */
    void abort();

    const ReadyState& readyState() const { return state_; }
    const int& status() const { return status_; }
    const bool& async() const { return async_; }
    const std::string& method() const { return method_; }
    const std::string& url() const { return url_; }

    /* 0 means no timeout. can only be set before send(); a sync
     * request with a timeout fails at send()
     */
    const uint32_t& timeout() const { return timeout_ms_; }
    void setTimeout(const uint32_t& timeout_ms, ExceptionState&);

    /* true once abort() took effect in the current cycle */
    const bool& aborted() const { return aborted_; }

    /* how the current cycle ended; NONE while it has not */
    const TerminalOutcome& outcome() const { return outcome_; }

    /* bumped by every open() */
    const uint32_t& cycle() const { return cycle_; }

    const QuirkProfile& profile() const { return dispatcher_.profile(); }

    void setHandlerErrorCallback(XMLHttpRequestEventDispatcher::HandlerErrorCb cb);

    /* implement TransportClient interface */
    virtual void onProgress(const CycleHandle&) override;
    virtual void onComplete(const CycleHandle&, const int& status) override;
    virtual void onFailure(const CycleHandle&) override;
    virtual void onTimeout(const CycleHandle&) override;

protected:

    virtual ~XMLHttpRequest();

    Event::Snapshot _snapshot() const;

    /* whether "cycle" is still the current cycle */
    bool _is_current_cycle(const uint32_t cycle) const;

    /* whether "cycle" is still the current cycle and its send is still
     * in progress, i.e., not finished and not aborted
     */
    bool _is_current_send(const uint32_t cycle) const;

    /* whether a transport callback for "handle" belongs to the send in
     * progress. late callbacks, e.g., after an abort, do not
     */
    bool _is_live_transfer(const CycleHandle& handle) const;

    void _fire(const XMLHttpRequestEventDispatcher::Transition&,
               const TerminalOutcome& = TerminalOutcome::NONE);

    void _begin_async_transfer(const uint32_t cycle);
    void _run_sync_transfer();

    /* move to DONE and fire readystatechange, the terminal event and
     * loadend
     */
    void _finish(const TerminalOutcome&, const int& status);

    void _abort_send_in_progress(const char* why);

    void _schedule_deferred_loadstart();
    void _on_loadstart_timer_fired(Timer*);
    void _flush_deferred_loadstart();
    void _drop_deferred_loadstart();

    //////////

    struct ::event_base* evbase_;
    Transport* transport_;

    XMLHttpRequestEventDispatcher dispatcher_;

    ReadyState state_;
    int status_;
    bool async_;
    uint32_t timeout_ms_;
    std::string method_;
    std::string url_;

    /* set by send(), cleared when the cycle reaches DONE */
    bool send_flag_;
    bool aborted_;
    TerminalOutcome outcome_;

    uint32_t cycle_;
    CycleHandle transfer_handle_;

    /* number of onProgress() of the current transfer */
    uint32_t num_progress_;

    /* a sync transport calls us back before beginTransfer() returns,
     * i.e., before we know the handle, so we park the result here
     */
    struct SyncResult
    {
        CycleHandle handle;
        TerminalOutcome outcome;
        int status;
    };

    bool sync_transfer_in_progress_;
    SyncResult sync_result_;

    /* for the profiles that fire loadstart after send() returns */
    Timer::UniquePtr loadstart_timer_;
    bool loadstart_pending_;
};

} // namespace xhrsim

#endif // XMLHttpRequest_hpp
