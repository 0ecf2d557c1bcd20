#ifndef QuirkProfile_hpp
#define QuirkProfile_hpp

#include <string>


namespace xhrsim {

/* where the attribute ("onload = ...") listener runs relative to the
 * listeners attached with addEventListener()
 */
enum class AttributeListenerOrder {
    BEFORE_LISTENERS, AFTER_LISTENERS,
};

/* the engine specific ordering/duplication of the NON-terminal xhr
 * events. it never changes which terminal event a cycle ends with.
 *
 * a profile is a plain value; a request copies the one it is given
 * (or the process default) at construction
 */
struct QuirkProfile
{
    std::string name;

    /* async send() fires readystatechange again with readyState
     * still OPENED
     */
    bool duplicate_opened_readystatechange_on_send;

    /* if both fire from within send(), the duplicate goes first */
    bool duplicate_precedes_loadstart;

    /* loadstart is queued on the event loop and fires after send()
     * has returned; an abort() before it runs means it never fires
     */
    bool loadstart_after_send_returns;

    AttributeListenerOrder attribute_listener_order;

    static const QuirkProfile& default_profile();
    static const QuirkProfile& legacy_ie_profile();

    /* "default" or "legacy-ie". returns false for anything else */
    static bool from_name(const std::string& name, QuirkProfile& profile);

    /* what a request constructed without an explicit profile uses */
    static const QuirkProfile& process_default();
    static void set_process_default(const QuirkProfile&);
};

} // namespace xhrsim

#endif // QuirkProfile_hpp
