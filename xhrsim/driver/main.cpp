#include <event2/event.h>
#include <memory>
#include <iostream>
#include <string>
#include <vector>
#include <boost/bind.hpp>
#include <boost/lexical_cast.hpp>

#include <easylogging++.h>

#include "../utility/common.hpp"
#include "../engine/ExceptionState.hpp"
#include "../engine/events/Event.hpp"
#include "../engine/events/EventListener.hpp"
#include "../engine/events/EventTypeNames.hpp"
#include "../engine/fetch/ScriptedTransport.hpp"
#include "../engine/fetch/TransportFixtures.hpp"
#include "../engine/xml/QuirkProfile.hpp"
#include "../engine/xml/XMLHttpRequest.hpp"


using std::cout;
using std::endl;
using std::pair;
using std::string;
using std::unique_ptr;
using std::vector;

using xhrsim::Event;
using xhrsim::ExceptionState;
using xhrsim::FunctionEventListener;
using xhrsim::QuirkProfile;
using xhrsim::ScriptedTransport;
using xhrsim::TransportFixtures;
using xhrsim::XMLHttpRequest;

namespace EventTypeNames = xhrsim::EventTypeNames;


struct MyConfig
{
    MyConfig()
        : url("/xmlhttprequest/success.html")
        , method("GET")
        , async(true)
        , profile_name("default")
        , timeout_ms(0)
        , abort_after_send(false)
        , use_keyword(false)
        , cycles(1)
    {
    }

    string fixtures_fpath;
    string url;
    string method;
    bool async;
    string profile_name;
    uint32_t timeout_ms;
    bool abort_after_send;
    bool use_keyword;
    uint32_t cycles;
};

static bool
set_my_config(MyConfig& conf,
              const vector<pair<string, string> >& name_value_pairs)
{
    for (auto nv_pair : name_value_pairs) {
        const auto& name = nv_pair.first;
        const auto& value = nv_pair.second;

        try {
            if (name == "fixtures") {
                conf.fixtures_fpath = value;
            }

            else if (name == "url") {
                conf.url = value;
            }

            else if (name == "method") {
                conf.method = value;
            }

            else if (name == "sync") {
                conf.async = false;
            }

            else if (name == "profile") {
                conf.profile_name = value;
            }

            else if (name == "timeout") {
                conf.timeout_ms = boost::lexical_cast<uint32_t>(value);
            }

            else if (name == "abort-after-send") {
                conf.abort_after_send = true;
            }

            else if (name == "keyword") {
                conf.use_keyword = true;
            }

            else if (name == "cycles") {
                conf.cycles = boost::lexical_cast<uint32_t>(value);
            }

            else {
                // ignore other args, e.g., easylogging's --v
            }
        } catch (const boost::bad_lexical_cast&) {
            LOG(ERROR) << "bad value \"" << value << "\" for --" << name;
            return false;
        }
    }

    return true;
}

/* what page script would append to its log for every event */
static void
s_log_event(Event* event)
{
    if (event->type() == EventTypeNames::abort) {
        cout << event->type() << "_" << int(event->readyState())
             << "_" << event->status() << endl;
    } else {
        cout << event->describe() << endl;
    }
}

static void
s_on_handler_error(const Event& event, const string& what)
{
    cout << "HandlerError_" << event.type() << ": " << what << endl;
}

static void
s_register_logging_listeners(XMLHttpRequest* xhr, const bool use_keyword)
{
    static const char* event_types[] = {
        EventTypeNames::loadstart, EventTypeNames::load,
        EventTypeNames::loadend, EventTypeNames::progress,
        EventTypeNames::error, EventTypeNames::abort,
        EventTypeNames::readystatechange, EventTypeNames::timeout,
    };

    const auto listener = FunctionEventListener::create(s_log_event);

    for (size_t i = 0; i < ARRAY_LEN(event_types); ++i) {
        if (use_keyword) {
            xhr->setAttributeEventListener(event_types[i], listener);
        } else {
            const auto added = xhr->addEventListener(event_types[i], listener);
            CHECK(added);
        }
    }
}

/* one open()/send() cycle, the way the test page drives it. returns
 * false if the page would have caught an exception
 */
static bool
s_run_cycle(XMLHttpRequest* xhr, const MyConfig& conf,
            struct event_base* evbase)
{
    ExceptionState es;

    xhr->open(conf.method, conf.url, conf.async, es);
    if (es.hadException()) {
        LOG(ERROR) << "open() failed: " << es.message();
        cout << "ExceptionThrown" << endl;
        return false;
    }
    cout << "open-done" << endl;

    if (conf.timeout_ms) {
        xhr->setTimeout(conf.timeout_ms, es);
    }
    if (!es.hadException()) {
        xhr->send(es);
    }
    if (es.hadException()) {
        LOG(INFO) << xhrsim::exceptionCodeName(es.code()) << ": " << es.message();
        cout << "ExceptionThrown" << endl;
        return false;
    }
    cout << "send-done" << endl;

    if (conf.abort_after_send) {
        xhr->abort();
        cout << "abort-done" << endl;
    }

    common::dispatch_evbase(evbase);

    LOG(INFO) << "cycle " << xhr->cycle() << " over: readyState= "
              << int(xhr->readyState()) << " status= " << xhr->status();
    return true;
}


INITIALIZE_EASYLOGGINGPP

int main(int argc, char **argv)
{
    common::init_easylogging();

    START_EASYLOGGINGPP(argc, argv);

    MyConfig conf;

    bool found_conf_name = false;
    string found_conf_value;
    vector<pair<string, string> > name_value_pairs;
    auto rv = common::get_cmd_line_name_value_pairs(argc, (const char**)argv,
                                                    found_conf_name, found_conf_value,
                                                    name_value_pairs);
    CHECK(rv == 0);

    if (found_conf_name) {
        // the file goes first so the command line can override it
        vector<pair<string, string> > file_pairs;
        rv = common::get_config_name_value_pairs(found_conf_value.c_str(),
                                                 file_pairs);
        if (rv != 0) {
            return 1;
        }
        LOG(INFO) << "read " << file_pairs.size() << " option(s) from \""
                  << found_conf_value << "\"";
        name_value_pairs.insert(name_value_pairs.begin(),
                                file_pairs.begin(), file_pairs.end());
    }

    if (!set_my_config(conf, name_value_pairs)) {
        return 1;
    }

    QuirkProfile profile;
    if (!QuirkProfile::from_name(conf.profile_name, profile)) {
        LOG(ERROR) << "--profile must be \"default\" or \"legacy-ie\"";
        return 1;
    }
    QuirkProfile::set_process_default(profile);

    TransportFixtures::UniquePtr fixtures(new TransportFixtures());
    if (!conf.fixtures_fpath.empty()
        && !fixtures->load_file(conf.fixtures_fpath.c_str()))
    {
        return 1;
    }

    LOG(INFO) << "xhrsim driver starting: " << conf.method << " " << conf.url
              << (conf.async ? " async" : " sync")
              << ", profile " << profile.name
              << ", " << fixtures->size() << " fixtures";

    unique_ptr<struct event_base, void(*)(struct event_base*)> evbase(
        common::init_evbase(), event_base_free);

    ScriptedTransport::UniquePtr transport(
        new ScriptedTransport(evbase.get(), fixtures.get()));

    XMLHttpRequest::UniquePtr xhr(
        new XMLHttpRequest(evbase.get(), transport.get()));
    xhr->setHandlerErrorCallback(boost::bind(s_on_handler_error, _1, _2));

    s_register_logging_listeners(xhr.get(), conf.use_keyword);

    uint32_t num_exceptions = 0;
    for (uint32_t i = 0; i < conf.cycles; ++i) {
        if (!s_run_cycle(xhr.get(), conf, evbase.get())) {
            ++num_exceptions;
        }
    }
    LOG(INFO) << conf.cycles << " cycle(s), " << num_exceptions
              << " ended with an exception";

    // requests must go before the transport they cancel into
    xhr.reset();
    transport.reset();

    return 0;
}
