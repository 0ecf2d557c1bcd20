#ifndef TransportFixtures_hpp
#define TransportFixtures_hpp

#include <map>
#include <memory>
#include <string>
#include <rapidjson/document.h>

#include "../../utility/object.hpp"


namespace xhrsim {

/* canned responses for the scripted transport, keyed by target url.
 *
 * json form:
 *
 * { "fixtures": {
 *     "/xmlhttprequest/success.html": {
 *         "outcome": "complete",      // or "failure"
 *         "status": 200,              // "complete" only
 *         "delay_ms": 5,              // until the first tick/ending
 *         "progress_ticks": 2,        // first tick = headers received
 *         "tick_interval_ms": 5
 *     }, ...
 * } }
 */
class TransportFixtures : public Object
{
public:
    typedef std::unique_ptr<TransportFixtures, Destructor> UniquePtr;

    enum class Outcome {
        COMPLETE, FAILURE,
    };

    struct FixtureInfo
    {
        std::string target;
        Outcome outcome;

        // valid only if "outcome" is COMPLETE
        int status;

        uint32_t delay_ms;
        uint32_t progress_ticks;
        uint32_t tick_interval_ms;
    };

    TransportFixtures();

    /* return false, with an error logged, if the file can't be read or
     * a fixture is malformed. fixtures loaded before the bad one stay
     */
    bool load_file(const char* json_fpath);
    bool load_string(const std::string& json);

    /* replaces an existing fixture for the same target */
    void add_fixture(const FixtureInfo&);

    /* return true if the target is found, false otherwise */
    bool get_fixture(const std::string& target, FixtureInfo&) const;

    size_t size() const { return fixtures_.size(); }

private:

    virtual ~TransportFixtures() = default;

    bool _load_document(const rapidjson::Document&);
    bool _parse_fixture(const std::string& target,
                        const rapidjson::Value& object,
                        FixtureInfo&) const;

    ///////////////

    std::map<std::string, FixtureInfo> fixtures_;
};

} // namespace xhrsim

#endif // TransportFixtures_hpp
