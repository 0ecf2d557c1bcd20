#ifndef Transport_hpp
#define Transport_hpp

#include <stdint.h>
#include <string>


namespace xhrsim {

/* identifies one transfer, i.e., one send cycle of one request. never
 * 0, so 0 can mean "no transfer"
 */
typedef uint32_t CycleHandle;

class TransportClient
{
public:
    /* more of the response has arrived. the first call means the
     * response headers are in
     */
    virtual void onProgress(const CycleHandle&) = 0;

    /* exactly one of these three ends a transfer, unless the transfer
     * is cancelled first. a server error status is still onComplete()
     */
    virtual void onComplete(const CycleHandle&, const int& status) = 0;
    virtual void onFailure(const CycleHandle&) = 0;
    virtual void onTimeout(const CycleHandle&) = 0;

protected:
    virtual ~TransportClient() = default;
};

/* where the request's bytes would go if we had any. we only care
 * about how the transfer ends
 */
class Transport
{
public:
    /* start a transfer and report back to "client".
     *
     * if "async" is false, this must not return until it has called
     * exactly one of the client's ending callbacks; the handle passed
     * to the callbacks is the one returned.
     *
     * "timeout_ms" of 0 means no deadline
     */
    virtual CycleHandle beginTransfer(TransportClient* client,
                                      const std::string& target,
                                      const bool& async,
                                      const uint32_t& timeout_ms) = 0;

    /* drop whatever is scheduled for the transfer; no callbacks will
     * be made for it after this. unknown/finished handles are ignored
     */
    virtual void cancelTransfer(const CycleHandle&) = 0;

protected:
    virtual ~Transport() = default;
};

} // namespace xhrsim

#endif // Transport_hpp
