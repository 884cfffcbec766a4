#pragma once
#include <map>
#include <string>
#include <vector>

using RfValues = std::map<std::string, std::string>;

// One protocol match for a received pulse train.
struct DecodedProtocol
{
    std::string protocol;
    RfValues values;
};

// Maps named RF protocols to and from the firmware's pulse representation.
// Implementations throw std::invalid_argument for unknown protocols or
// values they cannot encode.
class RfCodec
{
public:
    virtual ~RfCodec() = default;

    virtual std::vector<DecodedProtocol> decode(const std::vector<int> &pulseLengths,
                                                const std::string &pulseSequence) const = 0;
    virtual std::string encode(const std::string &protocol, const RfValues &values) const = 0;
    virtual std::vector<int> pulseLengths(const std::string &protocol) const = 0;
    // Sorted with naturalLess()
    virtual std::vector<std::string> listProtocols() const = 0;
};

// "switch2" < "switch10"
bool naturalLess(const std::string &a, const std::string &b);

// {"key": "value", ...} with quotes and backslashes escaped
std::string formatValues(const RfValues &values);
