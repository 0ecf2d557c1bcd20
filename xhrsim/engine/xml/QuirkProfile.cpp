#include <easylogging++.h>

#include "QuirkProfile.hpp"


namespace xhrsim
{

static QuirkProfile
s_make_default_profile()
{
    QuirkProfile profile;
    profile.name = "default";
    profile.duplicate_opened_readystatechange_on_send = false;
    profile.duplicate_precedes_loadstart = false;
    profile.loadstart_after_send_returns = false;
    profile.attribute_listener_order = AttributeListenerOrder::BEFORE_LISTENERS;
    return profile;
}

static QuirkProfile
s_make_legacy_ie_profile()
{
    QuirkProfile profile;
    profile.name = "legacy-ie";
    profile.duplicate_opened_readystatechange_on_send = true;
    profile.duplicate_precedes_loadstart = true;
    profile.loadstart_after_send_returns = true;
    profile.attribute_listener_order = AttributeListenerOrder::BEFORE_LISTENERS;
    return profile;
}

const QuirkProfile&
QuirkProfile::default_profile()
{
    static const QuirkProfile profile = s_make_default_profile();
    return profile;
}

const QuirkProfile&
QuirkProfile::legacy_ie_profile()
{
    static const QuirkProfile profile = s_make_legacy_ie_profile();
    return profile;
}

bool
QuirkProfile::from_name(const std::string& name, QuirkProfile& profile)
{
    if (name == "default") {
        profile = default_profile();
    } else if (name == "legacy-ie") {
        profile = legacy_ie_profile();
    } else {
        LOG(WARNING) << "unknown quirk profile \"" << name << "\"";
        return false;
    }
    return true;
}

static QuirkProfile&
s_process_default()
{
    static QuirkProfile profile = s_make_default_profile();
    return profile;
}

const QuirkProfile&
QuirkProfile::process_default()
{
    return s_process_default();
}

void
QuirkProfile::set_process_default(const QuirkProfile& profile)
{
    LOG(INFO) << "process default quirk profile: " << profile.name;
    s_process_default() = profile;
}

} // end namespace xhrsim
