
#include <easylogging++.h>

#include "../../utility/common.hpp"

#include "TransportFixtures.hpp"

using std::string;

namespace json = rapidjson;


#define _LOG_PREFIX(inst) << "fixtures= " << (inst)->objId() << ": "

/* "inst" stands for instance, as in, instance of a class */
#define vloginst(level, inst) VLOG(level) _LOG_PREFIX(inst)
#define vlogself(level) vloginst(level, this)

#define loginst(level, inst) LOG(level) _LOG_PREFIX(inst)
#define logself(level) loginst(level, this)


/* "object" is assumed to have passed "IsObject()"
 * check. "member_name_str" is "const char*", "type" is Bool, String,
 * Int, Uint, etc.
 *
 * "ret_val" will be assigned the value if the member is there; a
 * member of the wrong type, or a missing member that must exist,
 * makes the enclosing function return false
 */
#define GET_OBJECT_MEMBER(ret_val, object, member_name_str, must_exist, type) \
    do {                                                                \
        const json::Value::ConstMemberIterator itr =                    \
            (object).FindMember(member_name_str);                       \
        if (itr != (object).MemberEnd()) {                              \
            if (!itr->value.Is ## type()) {                             \
                logself(ERROR) << "member \"" << member_name_str        \
                               << "\" is not " #type;                   \
                return false;                                           \
            }                                                           \
            ret_val = itr->value.Get ## type();                         \
        } else if (must_exist) {                                        \
            logself(ERROR) << "json object does not have member \""     \
                           << member_name_str << "\"";                  \
            return false;                                               \
        }                                                               \
    } while (0)


namespace xhrsim {


TransportFixtures::TransportFixtures()
{
}

bool
TransportFixtures::load_file(const char* json_fpath)
{
    vlogself(2) << "fixtures fpath= " << json_fpath;

    json::Document doc;
    if (!common::get_json_doc_from_file(json_fpath, doc)) {
        return false;
    }
    return _load_document(doc);
}

bool
TransportFixtures::load_string(const std::string& json_str)
{
    json::Document doc;
    doc.Parse(json_str.c_str());
    if (doc.HasParseError()) {
        logself(ERROR) << "fixtures do not parse, offset " << doc.GetErrorOffset();
        return false;
    }
    return _load_document(doc);
}

bool
TransportFixtures::_load_document(const json::Document& doc)
{
    if (!doc.IsObject()) {
        logself(ERROR) << "fixtures document is not an object";
        return false;
    }

    const auto fixtures_itr = doc.FindMember("fixtures");
    if (fixtures_itr == doc.MemberEnd() || !fixtures_itr->value.IsObject()) {
        logself(ERROR) << "no \"fixtures\" object";
        return false;
    }

    for (auto itr = fixtures_itr->value.MemberBegin();
         itr != fixtures_itr->value.MemberEnd(); ++itr)
    {
        const string target = itr->name.GetString();
        if (!itr->value.IsObject()) {
            logself(ERROR) << "fixture for \"" << target << "\" is not an object";
            return false;
        }

        FixtureInfo info;
        if (!_parse_fixture(target, itr->value, info)) {
            logself(ERROR) << "bad fixture for \"" << target << "\"";
            return false;
        }
        add_fixture(info);
    }

    vlogself(1) << "have " << fixtures_.size() << " fixtures";
    return true;
}

bool
TransportFixtures::_parse_fixture(const std::string& target,
                                  const json::Value& object,
                                  FixtureInfo& info) const
{
    string outcome_str;
    GET_OBJECT_MEMBER(outcome_str, object, "outcome", true, String);

    info.target = target;
    info.status = 0;
    info.delay_ms = 0;
    info.tick_interval_ms = 0;

    if (outcome_str == "complete") {
        info.outcome = Outcome::COMPLETE;
        // headers, then one chunk of body
        info.progress_ticks = 2;
        GET_OBJECT_MEMBER(info.status, object, "status", true, Int);
        if (info.status < 100 || info.status > 599) {
            logself(ERROR) << "status " << info.status << " is not an http status";
            return false;
        }
    } else if (outcome_str == "failure") {
        info.outcome = Outcome::FAILURE;
        info.progress_ticks = 0;
    } else {
        logself(ERROR) << "unknown outcome \"" << outcome_str << "\"";
        return false;
    }

    GET_OBJECT_MEMBER(info.delay_ms, object, "delay_ms", false, Uint);
    GET_OBJECT_MEMBER(info.progress_ticks, object, "progress_ticks", false, Uint);
    GET_OBJECT_MEMBER(info.tick_interval_ms, object, "tick_interval_ms", false, Uint);

    return true;
}

void
TransportFixtures::add_fixture(const FixtureInfo& info)
{
    CHECK(!info.target.empty());

    vlogself(2) << "fixture [" << info.target << "]: "
                << (info.outcome == Outcome::COMPLETE ? "complete" : "failure")
                << " status= " << info.status
                << " delay_ms= " << info.delay_ms
                << " ticks= " << info.progress_ticks
                << " tick_interval_ms= " << info.tick_interval_ms;

    fixtures_[info.target] = info;
}

bool
TransportFixtures::get_fixture(const std::string& target,
                               FixtureInfo& info) const
{
    auto it = fixtures_.find(target);
    if (it == fixtures_.end()) {
        return false;
    }
    info = it->second;
    return true;
}

} // end namespace xhrsim
