#include "rf_codec.hpp"
#include <cctype>

bool naturalLess(const std::string &a, const std::string &b)
{
    size_t i = 0, j = 0;
    while (i < a.size() && j < b.size())
    {
        unsigned char ca = static_cast<unsigned char>(a[i]);
        unsigned char cb = static_cast<unsigned char>(b[j]);
        if (std::isdigit(ca) && std::isdigit(cb))
        {
            size_t ei = i, ej = j;
            while (ei < a.size() && std::isdigit(static_cast<unsigned char>(a[ei]))) ++ei;
            while (ej < b.size() && std::isdigit(static_cast<unsigned char>(b[ej]))) ++ej;
            // Compare digit runs by value: strip leading zeros, then length, then text
            size_t zi = i, zj = j;
            while (zi + 1 < ei && a[zi] == '0') ++zi;
            while (zj + 1 < ej && b[zj] == '0') ++zj;
            size_t li = ei - zi, lj = ej - zj;
            if (li != lj) return li < lj;
            int cmp = a.compare(zi, li, b, zj, lj);
            if (cmp != 0) return cmp < 0;
            i = ei;
            j = ej;
            continue;
        }
        if (ca != cb) return ca < cb;
        ++i;
        ++j;
    }
    return (a.size() - i) < (b.size() - j);
}

static std::string quoted(const std::string &text)
{
    std::string out = "\"";
    for (char c : text)
    {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    return out + "\"";
}

std::string formatValues(const RfValues &values)
{
    std::string out = "{";
    bool first = true;
    for (const auto &kv : values)
    {
        if (!first) out += ", ";
        out += quoted(kv.first) + ": " + quoted(kv.second);
        first = false;
    }
    return out + "}";
}
