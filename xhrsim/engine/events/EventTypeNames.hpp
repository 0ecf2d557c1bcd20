#ifndef EventTypeNames_hpp
#define EventTypeNames_hpp

#include <string>

namespace xhrsim {

namespace EventTypeNames {

static const char readystatechange[] = "readystatechange";
static const char loadstart[] = "loadstart";
static const char progress[] = "progress";
static const char load[] = "load";
static const char error[] = "error";
static const char abort[] = "abort";
static const char timeout[] = "timeout";
static const char loadend[] = "loadend";

}

} // namespace xhrsim

#endif // EventTypeNames_hpp
