// ValueEncoder.cpp – Type/tag table and per-type value rendering.

#include "SnmprecConv/ValueEncoder.hpp"
#include "SnmprecConv/Oid.hpp"

#include <charconv>
#include <limits>

namespace snmprec {

uint16_t typeTag(OidType type) noexcept {
    switch (type) {
    case OidType::OctetString:      return tag::OctetString;
    case OidType::Integer:
    case OidType::Integer32:        return tag::Integer;
    case OidType::Null:             return tag::Null;
    case OidType::ObjectIdentifier: return tag::ObjectIdentifier;
    case OidType::IpAddress:        return tag::IpAddress;
    case OidType::Counter32:        return tag::Counter32;
    case OidType::Gauge32:          return tag::Gauge32;
    case OidType::TimeTicks:        return tag::TimeTicks;
    case OidType::Opaque:           return tag::Opaque;
    case OidType::Counter64:        return tag::Counter64;
    }
    return tag::OctetString;
}

// ─── Hex ─────────────────────────────────────────────────────────────────────

std::string hexEncode(std::string_view bytes) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (char c : bytes) {
        auto b = static_cast<unsigned char>(c);
        out += kDigits[b >> 4];
        out += kDigits[b & 0x0F];
    }
    return out;
}

static int hexNibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<std::string> hexDecode(std::string_view hex) {
    if (hex.size() % 2 != 0)
        return std::nullopt;
    std::string out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hexNibble(hex[i]);
        int lo = hexNibble(hex[i + 1]);
        if (hi < 0 || lo < 0)
            return std::nullopt;
        out += static_cast<char>((hi << 4) | lo);
    }
    return out;
}

// ─── Decimal helpers ─────────────────────────────────────────────────────────

static bool allDigits(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s)
        if (c < '0' || c > '9') return false;
    return true;
}

[[noreturn]] static void notNumeric(const std::string& ctx, std::string_view v) {
    throw ConversionError(ErrorCode::ValueNotNumeric,
                          ctx + ": value '" + std::string(v) + "' is not numeric");
}

[[noreturn]] static void outOfRange(const std::string& ctx, std::string_view v) {
    throw ConversionError(ErrorCode::ValueOutOfRange,
                          ctx + ": value '" + std::string(v) + "' is out of range");
}

static std::string encodeSigned32(std::string_view v, const std::string& ctx) {
    std::string_view digits = (!v.empty() && v.front() == '-') ? v.substr(1) : v;
    if (!allDigits(digits))
        notNumeric(ctx, v);

    int32_t n = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), n);
    if (ec == std::errc::result_out_of_range)
        outOfRange(ctx, v);
    if (ec != std::errc{} || ptr != v.data() + v.size())
        notNumeric(ctx, v);
    return std::to_string(n);
}

static std::string encodeUnsigned(std::string_view v, uint64_t max, const std::string& ctx) {
    if (!v.empty() && v.front() == '-') {
        std::string_view digits = v.substr(1);
        if (!allDigits(digits))
            notNumeric(ctx, v);
        if (digits.find_first_not_of('0') != std::string_view::npos)
            outOfRange(ctx, v);
        return "0"; // "-0"
    }
    if (!allDigits(v))
        notNumeric(ctx, v);

    uint64_t n = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), n);
    if (ec == std::errc::result_out_of_range || (ec == std::errc{} && n > max))
        outOfRange(ctx, v);
    if (ec != std::errc{} || ptr != v.data() + v.size())
        notNumeric(ctx, v);
    return std::to_string(n);
}

static std::string encodeIpAddress(std::string_view v, const std::string& ctx) {
    std::string out;
    size_t pos   = 0;
    int    parts = 0;
    while (true) {
        size_t dot = v.find('.', pos);
        std::string_view part = v.substr(pos, dot == std::string_view::npos
                                                  ? std::string_view::npos
                                                  : dot - pos);
        if (++parts > 4 || !allDigits(part))
            notNumeric(ctx, v);

        uint64_t octet = 0;
        auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), octet);
        if (ec == std::errc::result_out_of_range || (ec == std::errc{} && octet > 255))
            outOfRange(ctx, v);
        if (ec != std::errc{})
            notNumeric(ctx, v);

        if (!out.empty()) out += '.';
        out += std::to_string(octet);

        if (dot == std::string_view::npos) break;
        pos = dot + 1;
    }
    if (parts != 4)
        notNumeric(ctx, v);
    return out;
}

// ─── Record encode ───────────────────────────────────────────────────────────

EncodedRecord encodeRecord(const DefinitionRecord& rec) {
    EncodedRecord out;
    out.oid    = rec.oid;
    out.tag    = typeTag(rec.type);
    out.index  = rec.index;
    out.offset = rec.offset;

    const std::string ctx = "OID " + formatOid(rec.oid) + " (" + toString(rec.type) + ")";
    const std::string_view v = rec.raw_value;

    switch (rec.type) {
    case OidType::OctetString:
    case OidType::Opaque:
        out.value = hexEncode(v);
        break;

    case OidType::Integer:
    case OidType::Integer32:
        out.value = encodeSigned32(v, ctx);
        break;

    case OidType::Counter32:
    case OidType::Gauge32:
    case OidType::TimeTicks:
        out.value = encodeUnsigned(v, std::numeric_limits<uint32_t>::max(), ctx);
        break;

    case OidType::Counter64:
        out.value = encodeUnsigned(v, std::numeric_limits<uint64_t>::max(), ctx);
        break;

    case OidType::ObjectIdentifier:
        out.value = formatOid(parseOid(v, ctx));
        break;

    case OidType::IpAddress:
        out.value = encodeIpAddress(v, ctx);
        break;

    case OidType::Null:
        break;
    }
    return out;
}

} // namespace snmprec
