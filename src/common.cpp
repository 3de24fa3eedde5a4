#include "dnsgate/common.hpp"

namespace dnsgate {

const char* errorString(Error err) {
    switch (err) {
        case Error::Success:              return "success";
        case Error::PacketTooShort:       return "packet too short";
        case Error::InvalidHeader:        return "invalid header";
        case Error::TruncatedMessage:     return "truncated message";
        case Error::PointerLoop:          return "compression pointer loop";
        case Error::InvalidLabel:         return "invalid label";
        case Error::BufferTooSmall:       return "buffer too small";
        case Error::NotQuery:             return "not a query";
        case Error::UnsupportedOpcode:    return "unsupported opcode";
        case Error::UnsupportedName:      return "label contains a dot";
        case Error::InvalidPattern:       return "invalid pattern";
        case Error::InvalidTarget:        return "invalid target, expected an IP address or REFUSED";
        case Error::InvalidWindow:        return "invalid time window, expected HH:MM";
        case Error::RuleNotFound:         return "rule not found";
        case Error::NoUpstream:           return "no upstream configured";
        case Error::UpstreamFailed:       return "upstream query failed";
        case Error::StateFileUnreadable:  return "state file unreadable";
        case Error::StateFileInvalid:     return "state file invalid";
        case Error::StateFileWriteFailed: return "state file write failed";
        case Error::SocketError:          return "socket error";
        case Error::BindFailed:           return "bind failed";
        case Error::SendFailed:           return "send failed";
        case Error::InvalidArgument:      return "invalid argument";
    }
    return "unknown error";
}

const char* typeName(uint16_t qtype) {
    switch (qtype) {
        case dns_type::A:     return "A";
        case dns_type::NS:    return "NS";
        case dns_type::CNAME: return "CNAME";
        case dns_type::SOA:   return "SOA";
        case dns_type::PTR:   return "PTR";
        case dns_type::MX:    return "MX";
        case dns_type::TXT:   return "TXT";
        case dns_type::AAAA:  return "AAAA";
        case dns_type::ANY:   return "ANY";
        default:              return "OTHER";
    }
}

} // namespace dnsgate
