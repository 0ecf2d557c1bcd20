#include <easylogging++.h>

#include "ExceptionState.hpp"


namespace xhrsim
{

const char*
exceptionCodeName(ExceptionCode code)
{
    switch (code) {
    case NoException:
        return "NoException";
    case SyntaxError:
        return "SyntaxError";
    case InvalidStateError:
        return "InvalidStateError";
    case InvalidAccessError:
        return "InvalidAccessError";
    }
    return "UnknownError";
}

ExceptionState::ExceptionState()
    : code_(NoException)
{
}

void
ExceptionState::throwDOMException(const ExceptionCode& code,
                                  const std::string& message)
{
    CHECK_NE(code, NoException);

    if (hadException()) {
        LOG(WARNING) << "already have " << exceptionCodeName(code_)
                     << "; dropping " << exceptionCodeName(code)
                     << ": " << message;
        return;
    }

    VLOG(1) << exceptionCodeName(code) << ": " << message;
    code_ = code;
    message_ = message;
}

void
ExceptionState::clearException()
{
    code_ = NoException;
    message_.clear();
}

} // end namespace xhrsim
