#pragma once
#include "rf_codec.hpp"

// Pass-through codec for the command line tool: every received pulse train
// decodes to a single "raw" match, and "raw" encodes the pulse_sequence
// value as-is with the configured pulse lengths.
class RawPulseCodec : public RfCodec
{
public:
    static constexpr const char *kProtocol = "raw";

    explicit RawPulseCodec(std::vector<int> sendPulseLengths = {});

    std::vector<DecodedProtocol> decode(const std::vector<int> &pulseLengths,
                                        const std::string &pulseSequence) const override;
    std::string encode(const std::string &protocol, const RfValues &values) const override;
    std::vector<int> pulseLengths(const std::string &protocol) const override;
    std::vector<std::string> listProtocols() const override;

private:
    std::vector<int> sendPulseLengths_;
};
