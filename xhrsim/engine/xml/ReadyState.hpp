#ifndef ReadyState_hpp
#define ReadyState_hpp

#include <stdint.h>


namespace xhrsim {

/* values are what script sees as xhr.readyState */
enum class ReadyState : uint8_t {
    UNSENT = 0,
    OPENED = 1,
    HEADERS_RECEIVED = 2,
    LOADING = 3,
    DONE = 4,
};

const char* readyStateName(const ReadyState&);

} // namespace xhrsim

#endif // ReadyState_hpp
