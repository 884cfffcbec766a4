#include "raw_pulse_codec.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

RawPulseCodec::RawPulseCodec(std::vector<int> sendPulseLengths)
    : sendPulseLengths_(std::move(sendPulseLengths)) {}

std::vector<DecodedProtocol> RawPulseCodec::decode(const std::vector<int> &pulseLengths,
                                                   const std::string &pulseSequence) const
{
    std::string lengths;
    for (int v : pulseLengths)
    {
        if (v == 0) continue;
        if (!lengths.empty()) lengths += " ";
        lengths += std::to_string(v);
    }
    DecodedProtocol match;
    match.protocol = kProtocol;
    match.values["pulse_lengths"] = lengths;
    match.values["pulse_sequence"] = pulseSequence;
    return {match};
}

std::string RawPulseCodec::encode(const std::string &protocol, const RfValues &values) const
{
    if (protocol != kProtocol)
        throw std::invalid_argument("Unknown RF protocol: " + protocol);
    auto it = values.find("pulse_sequence");
    if (it == values.end() || it->second.empty())
        throw std::invalid_argument("raw protocol needs a pulse_sequence value");
    const std::string &seq = it->second;
    bool digitsOnly = std::all_of(seq.begin(), seq.end(), [](unsigned char c){ return std::isdigit(c); });
    if (!digitsOnly)
        throw std::invalid_argument("pulse_sequence must only contain pulse indexes");
    return seq;
}

std::vector<int> RawPulseCodec::pulseLengths(const std::string &protocol) const
{
    if (protocol != kProtocol)
        throw std::invalid_argument("Unknown RF protocol: " + protocol);
    return sendPulseLengths_;
}

std::vector<std::string> RawPulseCodec::listProtocols() const
{
    return {kProtocol};
}
