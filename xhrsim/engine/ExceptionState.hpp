#ifndef ExceptionState_hpp
#define ExceptionState_hpp

#include <string>
#include <boost/core/noncopyable.hpp>


namespace xhrsim {

enum ExceptionCode {
    NoException = 0,
    SyntaxError,
    InvalidStateError,
    InvalidAccessError,
};

const char* exceptionCodeName(ExceptionCode);

/* the "exception" a dom operation raises synchronously to its caller,
 * as an out param the way the bindings hand it to the engine. the
 * caller is expected to test hadException() after every call that
 * takes one
 *
 * only the first exception thrown is kept; an operation stops at its
 * first failure anyway
 */
class ExceptionState : private boost::noncopyable
{
public:
    ExceptionState();

    void throwDOMException(const ExceptionCode&, const std::string& message);

    bool hadException() const { return code_ != NoException; }
    ExceptionCode code() const { return code_; }
    const std::string& message() const { return message_; }

    void clearException();

private:
    ExceptionCode code_;
    std::string message_;
};

} // namespace xhrsim

#endif // ExceptionState_hpp
