#include "line_router.hpp"
#include "command_protocol.hpp"
#include "log.hpp"

const std::string kAnyRfProtocol = "*";

LineRouter::LineRouter(RequestCorrelator &correlator, std::shared_ptr<const RfCodec> codec,
                       RfCallbackRegistry &rfCallbacks, EventPoster post)
    : correlator_(correlator), codec_(std::move(codec)), rfCallbacks_(rfCallbacks), post_(std::move(post)) {}

bool LineRouter::parseRfReceive(const std::string &line, RfPulses &out)
{
    // RF receive <8 pulse lengths> <pulse sequence>
    auto parts = hdcmd::split(line);
    const size_t first = 2;
    if (parts.size() < first + hdcmd::kPulseLengthSlots + 1)
        return false;

    RfPulses pulses;
    for (size_t i = first; i < first + hdcmd::kPulseLengthSlots; ++i)
    {
        try
        {
            size_t used = 0;
            int v = std::stoi(parts[i], &used);
            if (used != parts[i].size() || v < 0) return false;
            pulses.pulseLengths.push_back(v);
        }
        catch (const std::exception &)
        {
            return false;
        }
    }
    pulses.pulseSequence = parts[first + hdcmd::kPulseLengthSlots];
    out = pulses;
    return true;
}

LineKind LineRouter::route(const std::string &line)
{
    if (line == "ready")
    {
        correlator_.setReady(true);
        logInfo("Homeduino is connected");
        return LineKind::Ready;
    }
    if (hdcmd::startsWith(line, "RF receive "))
        return handleRfReceive(line);
    if (hdcmd::startsWith(line, "KP "))
    {
        // Key presses are not dispatched yet
        logDebug(line);
        return LineKind::KeyPress;
    }
    if (correlator_.offerResponse(line))
        return LineKind::Response;

    logDebug("Unhandled line: " + line);
    return LineKind::Unhandled;
}

LineKind LineRouter::handleRfReceive(const std::string &line)
{
    logDebug(line);

    RfPulses pulses;
    if (!parseRfReceive(line, pulses))
    {
        logWarn("Unparsable RF receive line: " + line);
        return LineKind::Malformed;
    }
    if (!codec_)
    {
        logDebug("No RF codec configured, dropping " + line);
        return LineKind::RfReceive;
    }

    std::vector<DecodedProtocol> decoded;
    try
    {
        decoded = codec_->decode(pulses.pulseLengths, pulses.pulseSequence);
    }
    catch (const std::exception &e)
    {
        logWarn(std::string("RF decode failed: ") + e.what());
        return LineKind::Malformed;
    }

    if (decoded.empty())
    {
        std::string lengths;
        for (int v : pulses.pulseLengths)
            lengths += std::to_string(v) + " ";
        logWarn("No protocol for " + lengths + pulses.pulseSequence);
    }
    else if (rfCallbacks_.empty())
    {
        logDebug("No receive callbacks configured");
    }
    else
    {
        for (const auto &match : decoded)
        {
            if (!post_)
            {
                dispatchMatch(match);
                continue;
            }
            if (!post_([this, match]{ dispatchMatch(match); }))
                logWarn("Dropping RF protocol " + match.protocol + ", event dispatcher stopped");
        }
    }
    return LineKind::RfReceive;
}

void LineRouter::dispatchMatch(const DecodedProtocol &match)
{
    logDebug("Forwarding RF protocol " + match.protocol + " to receive callbacks");
    rfCallbacks_.dispatch(match.protocol, match);
    rfCallbacks_.dispatch(kAnyRfProtocol, match);
}
