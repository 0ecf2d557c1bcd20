#include "ReadyState.hpp"


namespace xhrsim
{

const char*
readyStateName(const ReadyState& state)
{
    switch (state) {
    case ReadyState::UNSENT:
        return "UNSENT";
    case ReadyState::OPENED:
        return "OPENED";
    case ReadyState::HEADERS_RECEIVED:
        return "HEADERS_RECEIVED";
    case ReadyState::LOADING:
        return "LOADING";
    case ReadyState::DONE:
        return "DONE";
    }
    return "?";
}

} // end namespace xhrsim
