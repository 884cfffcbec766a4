#pragma once
#include "callback_registry.hpp"
#include "request_correlator.hpp"
#include "rf_codec.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

using RfReceiveCallback = std::function<void(const DecodedProtocol &)>;
using RfCallbackRegistry = CallbackRegistry<std::string, const DecodedProtocol &>;

// Registry key for callbacks that want every decoded protocol
extern const std::string kAnyRfProtocol;

enum class LineKind
{
    Ready,
    RfReceive,
    KeyPress,
    Response,
    Unhandled,
    Malformed
};

struct RfPulses
{
    std::vector<int> pulseLengths;
    std::string pulseSequence;
};

// Classifies each framed line, first match wins:
//   "ready"          -> ready flag
//   "RF receive ..." -> codec decode, fan out to RF callbacks
//   "KP ..."         -> key press, logged only
//   anything else    -> response of the pending request, else unhandled
class LineRouter
{
public:
    // Hands a callback fan-out to another thread. Without one, RF callbacks
    // run on the thread calling route().
    using EventPoster = std::function<bool(std::function<void()>)>;

    LineRouter(RequestCorrelator &correlator, std::shared_ptr<const RfCodec> codec,
               RfCallbackRegistry &rfCallbacks, EventPoster post = nullptr);

    LineKind route(const std::string &line);

    // "RF receive p1 .. p8 sequence" -> pulses. False when fields are missing
    // or not numeric.
    static bool parseRfReceive(const std::string &line, RfPulses &out);

private:
    RequestCorrelator &correlator_;
    std::shared_ptr<const RfCodec> codec_;
    RfCallbackRegistry &rfCallbacks_;
    EventPoster post_;

    LineKind handleRfReceive(const std::string &line);
    void dispatchMatch(const DecodedProtocol &match);
};
