#include <unistd.h>
#include <string.h>
#include <math.h>
#include <event2/event.h>
#include <fstream>
#include <memory>
#include <sstream>

#include <easylogging++.h>

#include "common.hpp"

using std::string;
using std::vector;
using std::make_pair;

namespace common
{

/* "--name" or "--name=value"; anything else is not an option and
 * returns false. a value, when there is an '=', can't be empty
 */
static bool
parse_option(const string& arg, string& name, string& value)
{
    if (arg.compare(0, 2, "--") != 0) {
        return false;
    }

    const auto equal_pos = arg.find('=', 2);
    name = arg.substr(2, equal_pos == string::npos ? string::npos : equal_pos - 2);
    value = (equal_pos == string::npos) ? "" : arg.substr(equal_pos + 1);

    CHECK(!name.empty() && name[0] != '-') << "bad option \"" << arg << "\"";
    CHECK(equal_pos == string::npos || !value.empty())
        << "option \"" << name << "\" has an empty value";
    return true;
}

int
get_config_name_value_pairs(const char* fpath,
                            vector<std::pair<string, string> >& name_value_pairs)
{
    CHECK(name_value_pairs.empty());

    std::ifstream infile(fpath);
    if (!infile.good()) {
        LOG(ERROR) << "can't read config file \"" << fpath << "\"";
        return -1;
    }

    string line;
    int lineno = 0;
    while (std::getline(infile, line)) {
        ++lineno;
        if (line.empty() || line[0] == '#') {
            continue;
        }

        string name, value;
        if (!parse_option(line, name, value)) {
            LOG(WARNING) << fpath << ":" << lineno << ": ignoring \"" << line << "\"";
            continue;
        }
        name_value_pairs.push_back(make_pair(name, value));
    }

    return 0;
}

int
get_cmd_line_name_value_pairs(
    int argc,
    const char* argv[],
    bool& found_conf_name,
    string& found_conf_value,
    vector<std::pair<string, string> >& name_value_pairs)
{
    CHECK(name_value_pairs.empty());

    // argv[0] is the program
    for (int i = 1; i < argc; ++i) {
        string name, value;
        if (!parse_option(argv[i], name, value)) {
            VLOG(1) << "not an option: \"" << argv[i] << "\"";
            continue;
        }

        if (name == "conf") {
            found_conf_name = true;
            found_conf_value = value;
        }
        name_value_pairs.push_back(make_pair(name, value));
    }
    return 0;
}

bool
get_json_doc_from_file(const char* json_fpath,
                       rapidjson::Document& doc)
{
    std::fstream fs(json_fpath, std::ios_base::in);
    if (!fs.is_open()) {
        LOG(ERROR) << "unable to open json file at \"" << json_fpath << "\"";
        return false;
    }
    std::stringstream ss;
    ss << fs.rdbuf();
    doc.Parse(ss.str().c_str());

    if (doc.HasParseError()) {
        LOG(ERROR) << "json file \"" << json_fpath << "\" does not parse, offset "
                   << doc.GetErrorOffset();
        return false;
    }

    return true;
}

uint64_t
gettimeofdayMs(struct timeval* t)
{
    struct timeval now;
    if (NULL == t) {
        CHECK_EQ(gettimeofday(&now, NULL), 0);
        t = &now;
    }
    return (((uint64_t)t->tv_sec) * 1000) + (uint64_t)floor(((double)t->tv_usec) / 1000);
}

void
msleep(const uint32_t msec)
{
    VLOG(2) << "sleep for " << msec << " ms";
    usleep(msec * 1000);
}

struct event_base*
init_evbase()
{
    std::unique_ptr<struct event_config, void(*)(struct event_config*)> evconfig(
        event_config_new(), event_config_free);
    CHECK_NOTNULL(evconfig.get());

    // we mean to run single-threaded, so we don't need locks
    CHECK_EQ(event_config_set_flag(evconfig.get(), EVENT_BASE_FLAG_NOLOCK), 0);

    struct event_base* evbase = event_base_new_with_config(evconfig.get());
    CHECK_NOTNULL(evbase);

    /* two priorities: 0 for the request's own queued tasks (e.g., a
     * deferred loadstart), everything else uses the default (1)
     */
    auto rv = event_base_priority_init(evbase, 2);
    CHECK_EQ(rv, 0);

    VLOG(1) << "libevent method: " << event_base_get_method(evbase);

    return evbase;
}

void
dispatch_evbase(struct event_base* evbase)
{
    /* returns once there are no more pending/active events, which for
     * us means every transfer has finished or been cancelled
     */
    auto rv = event_base_dispatch(evbase);
    CHECK_GE(rv, 0);
}

void
init_easylogging()
{
   el::Configurations defaultConf;
   defaultConf.setToDefault();

   defaultConf.setGlobally(
       el::ConfigurationType::Format,
       "%datetime %level - %fbase :%line, %func ::   %msg");
   defaultConf.set(
       el::Level::Verbose, el::ConfigurationType::Format,
       "%datetime %level-%vlevel - %fbase :%line, %func ::   %msg");

    // console only
    defaultConf.setGlobally(el::ConfigurationType::ToFile, "false");

    el::Loggers::reconfigureLogger("default", defaultConf);
}

} // end namespace common
