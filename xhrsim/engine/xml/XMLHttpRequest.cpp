
#include <ctype.h>
#include <string.h>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/bind.hpp>

#include <easylogging++.h>

#include "../../utility/common.hpp"
#include "../events/EventTypeNames.hpp"

#include "XMLHttpRequest.hpp"

using std::string;

typedef xhrsim::XMLHttpRequestEventDispatcher::Transition Transition;


#define _LOG_PREFIX(inst) << "xhr= " << (inst)->objId() << " cycle= " << (inst)->cycle_ << ": "

/* "inst" stands for instance, as in, instance of a class */
#define vloginst(level, inst) VLOG(level) _LOG_PREFIX(inst)
#define vlogself(level) vloginst(level, this)

#define loginst(level, inst) LOG(level) _LOG_PREFIX(inst)
#define logself(level) loginst(level, this)


namespace xhrsim
{

/* rfc 7230 "token" */
static bool
s_is_http_token(const string& s)
{
    static const char token_punct[] = "!#$%&'*+-.^_`|~";

    if (s.empty()) {
        return false;
    }
    for (const char c : s) {
        if (isalnum((unsigned char)c)) {
            continue;
        }
        if (c == '\0' || !strchr(token_punct, c)) {
            return false;
        }
    }
    return true;
}

/* the standard methods are matched case-insensitively and normalized
 * to upper case; anything else is left as given
 */
static string
s_normalize_method(const string& method)
{
    const string upper = boost::algorithm::to_upper_copy(method);
    if (upper == "DELETE" || upper == "GET" || upper == "HEAD"
        || upper == "OPTIONS" || upper == "POST" || upper == "PUT")
    {
        return upper;
    }
    return method;
}

XMLHttpRequest::XMLHttpRequest(struct ::event_base* evbase,
                               Transport* transport)
    : XMLHttpRequest(evbase, transport, QuirkProfile::process_default())
{
}

XMLHttpRequest::XMLHttpRequest(struct ::event_base* evbase,
                               Transport* transport,
                               const QuirkProfile& profile)
    : evbase_(evbase)
    , transport_(transport)
    , dispatcher_(profile)
    , state_(ReadyState::UNSENT)
    , status_(0)
    , async_(true)
    , timeout_ms_(0)
    , send_flag_(false)
    , aborted_(false)
    , outcome_(TerminalOutcome::NONE)
    , cycle_(0)
    , transfer_handle_(0)
    , num_progress_(0)
    , sync_transfer_in_progress_(false)
    , loadstart_pending_(false)
{
    CHECK_NOTNULL(evbase_);
    CHECK_NOTNULL(transport_);

    loadstart_timer_.reset(
        new Timer(evbase_,
                  boost::bind(&XMLHttpRequest::_on_loadstart_timer_fired, this, _1),
                  0));

    vlogself(2) << "constructed, quirk profile: " << profile.name;
}

XMLHttpRequest::~XMLHttpRequest()
{
    vlogself(2) << "destructing";
    if (send_flag_ && transfer_handle_) {
        // nobody is left to hear about it
        transport_->cancelTransfer(transfer_handle_);
    }
}

void
XMLHttpRequest::setHandlerErrorCallback(
    XMLHttpRequestEventDispatcher::HandlerErrorCb cb)
{
    dispatcher_.set_handler_error_cb(cb);
}

void
XMLHttpRequest::open(const std::string& method,
                     const std::string& url,
                     const bool& async,
                     ExceptionState& es)
{
    DestructorGuard dg(this);

    vlogself(2) << "begin, " << method << " " << url
                << (async ? " async" : " sync");

    if (!s_is_http_token(method)) {
        es.throwDOMException(SyntaxError,
                             "'" + method + "' is not a valid HTTP method.");
        return;
    }
    if (url.empty()) {
        es.throwDOMException(SyntaxError, "Invalid URL");
        return;
    }

    if (send_flag_) {
        // every send gets its terminal event, even one cut short by
        // a new open()
        _abort_send_in_progress("open() called while sending");
    }
    _drop_deferred_loadstart();

    ++cycle_;
    method_ = s_normalize_method(method);
    url_ = url;
    async_ = async;
    status_ = 0;
    send_flag_ = false;
    aborted_ = false;
    outcome_ = TerminalOutcome::NONE;
    transfer_handle_ = 0;
    num_progress_ = 0;

    state_ = ReadyState::OPENED;
    _fire(Transition::OPEN);

    vlogself(2) << "done";
}

void
XMLHttpRequest::setTimeout(const uint32_t& timeout_ms, ExceptionState& es)
{
    if (send_flag_) {
        es.throwDOMException(
            InvalidStateError,
            "The timeout can only be set before send() is called.");
        return;
    }

    vlogself(2) << "timeout= " << timeout_ms << " ms";
    timeout_ms_ = timeout_ms;
}

void
XMLHttpRequest::send(ExceptionState& es)
{
    send(string(), es);
}

void
XMLHttpRequest::send(const std::string& body, ExceptionState& es)
{
    DestructorGuard dg(this);

    vlogself(2) << "begin, body " << body.size() << " bytes";

    if (state_ != ReadyState::OPENED || send_flag_) {
        es.throwDOMException(InvalidStateError,
                             "The object's state must be OPENED.");
        return;
    }

    if (!async_ && timeout_ms_ > 0) {
        es.throwDOMException(
            InvalidStateError,
            "Timeouts cannot be set for synchronous requests.");
        return;
    }

    if ((method_ == "GET" || method_ == "HEAD") && !body.empty()) {
        vlogself(2) << "ignoring body of " << method_ << " request";
    }

    send_flag_ = true;

    if (async_) {
        _begin_async_transfer(cycle_);
    } else {
        _run_sync_transfer();
    }

    vlogself(2) << "done";
}

void
XMLHttpRequest::_begin_async_transfer(const uint32_t cycle)
{
    _fire(Transition::SEND);

    if (!_is_current_send(cycle)) {
        // a loadstart/readystatechange listener aborted or re-opened
        vlogself(2) << "send superseded by a listener; not starting transfer";
        return;
    }

    if (dispatcher_.profile().loadstart_after_send_returns) {
        _schedule_deferred_loadstart();
    }

    transfer_handle_ = transport_->beginTransfer(this, url_, true, timeout_ms_);
    CHECK_GT(transfer_handle_, 0u);

    vlogself(2) << "transfer " << transfer_handle_ << " started";
}

void
XMLHttpRequest::_run_sync_transfer()
{
    sync_result_.handle = 0;
    sync_result_.outcome = TerminalOutcome::NONE;
    sync_result_.status = 0;

    sync_transfer_in_progress_ = true;
    const auto handle = transport_->beginTransfer(this, url_, false, 0);
    sync_transfer_in_progress_ = false;

    CHECK_GT(handle, 0u);
    CHECK(sync_result_.outcome != TerminalOutcome::NONE)
        << "sync transfer " << handle << " returned without finishing";
    CHECK_EQ(sync_result_.handle, handle);

    transfer_handle_ = handle;
    _finish(sync_result_.outcome, sync_result_.status);
}

void
XMLHttpRequest::abort()
{
    DestructorGuard dg(this);

    if (!send_flag_) {
        vlogself(2) << "nothing to abort in state "
                    << readyStateName(state_);
        return;
    }

    _abort_send_in_progress("abort() called");
}

void
XMLHttpRequest::_abort_send_in_progress(const char* why)
{
    CHECK(send_flag_);

    vlogself(1) << "aborting: " << why;

    aborted_ = true;
    if (transfer_handle_) {
        transport_->cancelTransfer(transfer_handle_);
    }
    _finish(TerminalOutcome::ABORT, 0);
}

void
XMLHttpRequest::_finish(const TerminalOutcome& outcome, const int& status)
{
    CHECK(send_flag_);
    CHECK(outcome != TerminalOutcome::NONE);

    _drop_deferred_loadstart();

    send_flag_ = false;
    outcome_ = outcome;
    status_ = (outcome == TerminalOutcome::LOAD) ? status : 0;
    state_ = ReadyState::DONE;

    vlogself(1) << "transfer " << transfer_handle_ << " done: "
                << terminalEventName(outcome) << ", status= " << status_;

    _fire(Transition::DONE, outcome);
}

void
XMLHttpRequest::_fire(const Transition& transition,
                      const TerminalOutcome& outcome)
{
    XMLHttpRequestEventDispatcher::StillCurrentFn still_current;

    if (transition == Transition::OPEN) {
        // only ends early if a listener starts another cycle
        still_current = boost::bind(&XMLHttpRequest::_is_current_cycle, this, cycle_);
    } else {
        still_current = boost::bind(&XMLHttpRequest::_is_current_send, this, cycle_);
    }

    dispatcher_.fireTransition(
        this, transition, async_, outcome,
        boost::bind(&XMLHttpRequest::_snapshot, this),
        still_current);
}

Event::Snapshot
XMLHttpRequest::_snapshot() const
{
    Event::Snapshot snapshot;
    snapshot.readyState = state_;
    snapshot.status = status_;
    snapshot.async = async_;
    return snapshot;
}

bool
XMLHttpRequest::_is_current_cycle(const uint32_t cycle) const
{
    return cycle == cycle_;
}

bool
XMLHttpRequest::_is_current_send(const uint32_t cycle) const
{
    return cycle == cycle_ && send_flag_ && !aborted_;
}

bool
XMLHttpRequest::_is_live_transfer(const CycleHandle& handle) const
{
    return send_flag_ && !aborted_ && async_
        && transfer_handle_ != 0 && handle == transfer_handle_;
}

void
XMLHttpRequest::onProgress(const CycleHandle& handle)
{
    DestructorGuard dg(this);

    if (sync_transfer_in_progress_) {
        // headers/loading are not observable for sync requests
        vlogself(3) << "sync transfer " << handle << " progress";
        return;
    }

    if (!_is_live_transfer(handle)) {
        vlogself(2) << "discarding progress of stale transfer " << handle;
        return;
    }

    _flush_deferred_loadstart();
    if (!_is_live_transfer(handle)) {
        return;
    }

    ++num_progress_;
    if (state_ == ReadyState::OPENED) {
        state_ = ReadyState::HEADERS_RECEIVED;
        _fire(Transition::HEADERS_RECEIVED);
    } else {
        CHECK(state_ == ReadyState::HEADERS_RECEIVED
              || state_ == ReadyState::LOADING)
            << readyStateName(state_);
        state_ = ReadyState::LOADING;
        _fire(Transition::LOADING);
    }
}

/* the three ending callbacks share this: park the result of a sync
 * transfer, or finish the async send it belongs to
 */
#define HANDLE_TRANSFER_END(handle, terminal_outcome, status_code)      \
    do {                                                                \
        if (sync_transfer_in_progress_) {                               \
            CHECK(sync_result_.outcome == TerminalOutcome::NONE)        \
                << "sync transfer " << (handle) << " ended twice";      \
            sync_result_.handle = (handle);                             \
            sync_result_.outcome = (terminal_outcome);                  \
            sync_result_.status = (status_code);                        \
            return;                                                     \
        }                                                               \
        if (!_is_live_transfer(handle)) {                               \
            vlogself(2) << "discarding end of stale transfer " << (handle); \
            return;                                                     \
        }                                                               \
        _flush_deferred_loadstart();                                    \
        if (!_is_live_transfer(handle)) {                               \
            return;                                                     \
        }                                                               \
        _finish((terminal_outcome), (status_code));                     \
    } while (0)

void
XMLHttpRequest::onComplete(const CycleHandle& handle, const int& status)
{
    DestructorGuard dg(this);
    vlogself(2) << "transfer " << handle << " completed, status= " << status;
    // a completed transfer always has an http status; 0 means "no
    // response", which the transport reports through onFailure()
    CHECK_GT(status, 0) << "transfer " << handle << " completed without a status";
    HANDLE_TRANSFER_END(handle, TerminalOutcome::LOAD, status);
}

void
XMLHttpRequest::onFailure(const CycleHandle& handle)
{
    DestructorGuard dg(this);
    vlogself(2) << "transfer " << handle << " failed";
    HANDLE_TRANSFER_END(handle, TerminalOutcome::ERROR, 0);
}

void
XMLHttpRequest::onTimeout(const CycleHandle& handle)
{
    DestructorGuard dg(this);
    vlogself(2) << "transfer " << handle << " timed out";
    if (sync_transfer_in_progress_) {
        // we never give a sync transfer a deadline
        logself(WARNING) << "sync transfer " << handle
                         << " reports a timeout; treating it as a network failure";
        HANDLE_TRANSFER_END(handle, TerminalOutcome::ERROR, 0);
    }
    HANDLE_TRANSFER_END(handle, TerminalOutcome::TIMEOUT, 0);
}

#undef HANDLE_TRANSFER_END

void
XMLHttpRequest::_schedule_deferred_loadstart()
{
    CHECK(!loadstart_pending_);
    vlogself(2) << "queueing loadstart";
    loadstart_pending_ = true;
    loadstart_timer_->arm_now();
}

void
XMLHttpRequest::_on_loadstart_timer_fired(Timer*)
{
    DestructorGuard dg(this);

    if (!loadstart_pending_) {
        return;
    }
    _flush_deferred_loadstart();
}

void
XMLHttpRequest::_flush_deferred_loadstart()
{
    if (!loadstart_pending_) {
        return;
    }

    loadstart_pending_ = false;
    loadstart_timer_->disarm();

    vlogself(2) << "firing queued loadstart";
    _fire(Transition::DEFERRED_LOADSTART);
}

void
XMLHttpRequest::_drop_deferred_loadstart()
{
    if (!loadstart_pending_) {
        return;
    }

    vlogself(2) << "dropping queued loadstart";
    loadstart_pending_ = false;
    loadstart_timer_->disarm();
}

} // end namespace xhrsim
