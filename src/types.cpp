#include "types.h"

namespace kaddht {

const char* connectedness_to_string(Connectedness c) {
    switch (c) {
        case Connectedness::NotConnected:  return "not_connected";
        case Connectedness::Connected:     return "connected";
        case Connectedness::CanConnect:    return "can_connect";
        case Connectedness::CannotConnect: return "cannot_connect";
    }
    return "unknown";
}

std::string to_hex(const std::string& bytes) {
    static const char* digits = "0123456789abcdef";
    std::string result;
    result.reserve(bytes.size() * 2);
    for (unsigned char c : bytes) {
        result += digits[(c >> 4) & 0xF];
        result += digits[c & 0xF];
    }
    return result;
}

std::string short_peer_id(const PeerId& id) {
    std::string hex = to_hex(id);
    if (hex.size() > 16) {
        return hex.substr(hex.size() - 16);
    }
    return hex;
}

} // namespace kaddht
