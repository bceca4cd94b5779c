// Oid.cpp – Dotted-decimal OID helpers shared by the loader and the encoder.

#include "SnmprecConv/Oid.hpp"

#include <algorithm>
#include <charconv>

namespace snmprec {

std::optional<Oid> tryParseOid(std::string_view text) {
    if (text.empty())
        return std::nullopt;

    Oid oid;
    size_t pos = 0;
    while (true) {
        size_t dot = text.find('.', pos);
        std::string_view comp = text.substr(pos, dot == std::string_view::npos
                                                     ? std::string_view::npos
                                                     : dot - pos);
        if (comp.empty())
            return std::nullopt;

        uint32_t v = 0;
        auto [ptr, ec] = std::from_chars(comp.data(), comp.data() + comp.size(), v);
        if (ec != std::errc{} || ptr != comp.data() + comp.size())
            return std::nullopt;
        oid.push_back(v);

        if (dot == std::string_view::npos) break;
        pos = dot + 1;
    }
    return oid;
}

Oid parseOid(std::string_view text, const std::string& context) {
    auto oid = tryParseOid(text);
    if (!oid)
        throw ConversionError(ErrorCode::InvalidOid,
                              context + ": '" + std::string(text) + "' is not a valid OID");
    return std::move(*oid);
}

std::string formatOid(const Oid& oid) {
    std::string out;
    for (size_t i = 0; i < oid.size(); ++i) {
        if (i) out += '.';
        out += std::to_string(oid[i]);
    }
    return out;
}

int compareOid(const Oid& a, const Oid& b) noexcept {
    size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        if (a[i] < b[i]) return -1;
        if (a[i] > b[i]) return 1;
    }
    if (a.size() == b.size()) return 0;
    return a.size() < b.size() ? -1 : 1;
}

} // namespace snmprec
