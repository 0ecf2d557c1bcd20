#include <easylogging++.h>

#include "object.hpp"


namespace
{

uint32_t
next_obj_id()
{
    static uint32_t last_id = 0;
    CHECK_LT(last_id, 0x7FFFFFFFu) << "ran out of object ids";
    return ++last_id;
}

} // end namespace


Object::Object()
    : objId_(next_obj_id())
{}
