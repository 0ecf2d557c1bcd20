#ifndef COMMON_HPP
#define COMMON_HPP

#include <stdint.h>
#include <sys/time.h>
#include <event2/event.h>
#include <rapidjson/document.h>
#include <type_traits>
#include <string>
#include <utility>
#include <vector>


namespace common
{

/* collect the "--name" and "--name=value" arguments, in order.
 * "--conf=<path>" is collected like any other and also reported
 * through found_conf_name/found_conf_value, so the caller can read
 * that file first and let the command line override it
 */
int
get_cmd_line_name_value_pairs(
    int argc,
    const char* argv[],
    bool& found_conf_name,
    std::string& found_conf_value,
    std::vector<std::pair<std::string, std::string> >& name_value_pairs);

/* read the same "--name=value" options from a config file, one per
 * line. empty lines and lines beginning with '#' are ignored
 */
int
get_config_name_value_pairs(
    const char* fpath,
    std::vector<std::pair<std::string, std::string> >& name_value_pairs);

bool
get_json_doc_from_file(const char* json_fpath,
                       rapidjson::Document& doc);

uint64_t
gettimeofdayMs(struct timeval* t=nullptr);

/* block the calling thread; nothing else on the event loop runs */
void
msleep(const uint32_t msec);

struct event_base*
init_evbase();

void
dispatch_evbase(struct event_base*);

void
init_easylogging();

template <typename Enumeration>
auto as_integer(Enumeration const value)
    -> typename std::underlying_type<Enumeration>::type
{
    return static_cast<typename std::underlying_type<Enumeration>::type>(value);
}

} // end namespace common


#define ARRAY_LEN(arr)  (sizeof(arr) / sizeof((arr)[0]))

#define inMap(m, k)                             \
    ((m).end() != (m).find(k))

#endif /* COMMON_HPP */
