
#include <boost/bind.hpp>

#include <easylogging++.h>

#include "../../utility/common.hpp"

#include "ScriptedTransport.hpp"

using std::deque;
using std::string;
using std::unique_ptr;


#define _LOG_PREFIX(inst) << "transport= " << (inst)->objId() << ": "

/* "inst" stands for instance, as in, instance of a class */
#define vloginst(level, inst) VLOG(level) _LOG_PREFIX(inst)
#define vlogself(level) vloginst(level, this)

#define loginst(level, inst) LOG(level) _LOG_PREFIX(inst)
#define logself(level) loginst(level, this)


namespace xhrsim
{

ScriptedTransport::ScriptedTransport(struct ::event_base* evbase,
                                     const TransportFixtures* fixtures)
    : evbase_(evbase)
    , fixtures_(fixtures)
    , next_handle_(1)
{
    CHECK_NOTNULL(evbase_);
    CHECK_NOTNULL(fixtures_);
}

ScriptedTransport::~ScriptedTransport()
{
    if (!transfers_.empty()) {
        logself(WARNING) << "dropping " << transfers_.size()
                         << " unfinished transfer(s)";
    }
    transfers_.clear();
}

deque<ScriptedTransport::Step>
ScriptedTransport::_build_script(const std::string& target,
                                 const uint32_t& timeout_ms,
                                 int& status) const
{
    deque<Step> script;
    status = 0;

    TransportFixtures::FixtureInfo info;
    if (!fixtures_->get_fixture(target, info)) {
        logself(WARNING) << "no fixture for \"" << target
                         << "\"; failing like an unreachable host";
        Step step = {0, StepKind::FAILURE};
        script.push_back(step);
        return script;
    }

    for (uint32_t i = 0; i < info.progress_ticks; ++i) {
        Step step = {info.delay_ms + (i * info.tick_interval_ms),
                     StepKind::PROGRESS};
        script.push_back(step);
    }

    Step ending = {info.delay_ms + (info.progress_ticks * info.tick_interval_ms),
                   (info.outcome == TransportFixtures::Outcome::COMPLETE)
                   ? StepKind::COMPLETE : StepKind::FAILURE};
    script.push_back(ending);
    status = info.status;

    if (timeout_ms > 0) {
        deque<Step> truncated;
        for (const auto& step : script) {
            if (step.at_ms >= timeout_ms) {
                Step timeout = {timeout_ms, StepKind::TIMEOUT};
                truncated.push_back(timeout);
                break;
            }
            truncated.push_back(step);
        }
        script.swap(truncated);
    }

    return script;
}

CycleHandle
ScriptedTransport::beginTransfer(TransportClient* client,
                                 const std::string& target,
                                 const bool& async,
                                 const uint32_t& timeout_ms)
{
    CHECK_NOTNULL(client);
    CHECK_LT(next_handle_, 0xFFFFFFFF);

    const CycleHandle handle = next_handle_++;

    int status = 0;
    const auto script = _build_script(target, async ? timeout_ms : 0, status);
    CHECK(!script.empty());

    vlogself(2) << "transfer " << handle << ": [" << target << "] "
                << (async ? "async" : "sync") << ", " << script.size()
                << " steps, ends at " << script.back().at_ms << " ms";

    if (!async) {
        _run_sync_script(client, handle, script, status);
        return handle;
    }

    unique_ptr<Transfer> transfer(new Transfer());
    transfer->handle = handle;
    transfer->client = client;
    transfer->target = target;
    transfer->status = status;
    transfer->steps = script;
    transfer->elapsed_ms = 0;
    transfer->timer.reset(
        new Timer(evbase_,
                  boost::bind(&ScriptedTransport::_on_step_timer_fired,
                              this, _1, handle)));

    Transfer* raw = transfer.get();
    const auto ret = transfers_.insert(std::make_pair(handle, std::move(transfer)));
    CHECK(ret.second);

    _schedule_next_step(raw);

    return handle;
}

void
ScriptedTransport::_run_sync_script(TransportClient* client,
                                    const CycleHandle& handle,
                                    const deque<Step>& script,
                                    const int& status)
{
    DestructorGuard dg(this);

    // the caller is blocked for as long as the response takes
    common::msleep(script.back().at_ms);

    for (const auto& step : script) {
        _deliver(client, handle, step.kind, status);
    }
}

void
ScriptedTransport::_schedule_next_step(Transfer* transfer)
{
    CHECK(!transfer->steps.empty());

    const auto& next = transfer->steps.front();
    CHECK_GE(next.at_ms, transfer->elapsed_ms);

    const uint32_t delay_ms = next.at_ms - transfer->elapsed_ms;
    vlogself(3) << "transfer " << transfer->handle << ": next step in "
                << delay_ms << " ms";
    transfer->timer->arm(delay_ms);
}

void
ScriptedTransport::_on_step_timer_fired(Timer*, CycleHandle handle)
{
    DestructorGuard dg(this);

    auto it = transfers_.find(handle);
    if (it == transfers_.end()) {
        vlogself(2) << "timer of finished transfer " << handle << " fired";
        return;
    }

    Transfer* transfer = it->second.get();
    CHECK(!transfer->steps.empty());

    const Step step = transfer->steps.front();
    transfer->steps.pop_front();
    transfer->elapsed_ms = step.at_ms;

    TransportClient* client = transfer->client;
    const int status = transfer->status;

    if (step.kind == StepKind::PROGRESS) {
        _schedule_next_step(transfer);
    } else {
        CHECK(transfer->steps.empty());
        vlogself(2) << "transfer " << handle << " over";
        // the firing timer keeps itself alive until we return
        transfers_.erase(it);
    }

    // may re-enter us, e.g., cancelTransfer() from an abort(), so
    // nothing about "transfer" is touched after this
    _deliver(client, handle, step.kind, status);
}

void
ScriptedTransport::_deliver(TransportClient* client,
                            const CycleHandle& handle,
                            const StepKind& kind,
                            const int& status)
{
    switch (kind) {
    case StepKind::PROGRESS:
        client->onProgress(handle);
        break;
    case StepKind::COMPLETE:
        client->onComplete(handle, status);
        break;
    case StepKind::FAILURE:
        client->onFailure(handle);
        break;
    case StepKind::TIMEOUT:
        client->onTimeout(handle);
        break;
    }
}

void
ScriptedTransport::cancelTransfer(const CycleHandle& handle)
{
    auto it = transfers_.find(handle);
    if (it == transfers_.end()) {
        vlogself(2) << "no transfer " << handle << " to cancel";
        return;
    }

    vlogself(2) << "cancelling transfer " << handle << " with "
                << it->second->steps.size() << " step(s) left";
    it->second->timer->disarm();
    transfers_.erase(it);
}

} // end namespace xhrsim
