// Types.cpp – Names for the error taxonomy and the SNMP type set.

#include "SnmprecConv/Types.hpp"

namespace snmprec {

const char* toString(ErrorCode code) noexcept {
    switch (code) {
    case ErrorCode::MalformedReference: return "MalformedReference";
    case ErrorCode::MalformedXml:       return "MalformedXml";
    case ErrorCode::MissingAttribute:   return "MissingAttribute";
    case ErrorCode::InvalidAttribute:   return "InvalidAttribute";
    case ErrorCode::InvalidOid:         return "InvalidOid";
    case ErrorCode::UnrecognizedType:   return "UnrecognizedType";
    case ErrorCode::ValueNotNumeric:    return "ValueNotNumeric";
    case ErrorCode::ValueOutOfRange:    return "ValueOutOfRange";
    case ErrorCode::DuplicateOid:       return "DuplicateOid";
    case ErrorCode::NoDefinitions:      return "NoDefinitions";
    case ErrorCode::Io:                 return "Io";
    }
    return "Unknown";
}

const char* toString(OidType type) noexcept {
    switch (type) {
    case OidType::OctetString:      return "OctetString";
    case OidType::Integer:          return "Integer";
    case OidType::Integer32:        return "Integer32";
    case OidType::Counter32:        return "Counter32";
    case OidType::Counter64:        return "Counter64";
    case OidType::Gauge32:          return "Gauge32";
    case OidType::TimeTicks:        return "TimeTicks";
    case OidType::IpAddress:        return "IpAddress";
    case OidType::ObjectIdentifier: return "ObjectIdentifier";
    case OidType::Null:             return "Null";
    case OidType::Opaque:           return "Opaque";
    }
    return "Unknown";
}

} // namespace snmprec
