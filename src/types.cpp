#include "../include/types.hpp"
#include <cctype>
#include <cstdlib>

bool normalizeHost(const std::string& in, std::string& out) {
    std::string result;
    size_t pos = 0;
    for (int part = 0; part < 4; ++part) {
        size_t dot = in.find('.', pos);
        if ((part < 3) != (dot != std::string::npos)) return false;
        std::string octet = in.substr(pos, dot == std::string::npos ? std::string::npos : dot - pos);
        if (octet.empty() || octet.size() > 3) return false;
        for (char c : octet) {
            if (!isdigit((unsigned char)c)) return false;
        }
        int value = atoi(octet.c_str());
        if (value > 255) return false;
        if (part > 0) result += '.';
        result += std::to_string(value);
        pos = dot + 1;
    }
    out = result;
    return true;
}

bool normalizeMac(const std::string& in, std::string& out) {
    std::string hex;
    for (char c : in) {
        if (c == ':' || c == '-') continue;
        if (!isxdigit((unsigned char)c)) return false;
        hex += (char)toupper((unsigned char)c);
    }
    if (hex.size() != 12) return false;
    std::string result;
    for (size_t i = 0; i < hex.size(); i += 2) {
        if (i > 0) result += ':';
        result += hex.substr(i, 2);
    }
    out = result;
    return true;
}

std::string compactMac(const std::string& mac) {
    std::string out;
    for (char c : mac) {
        if (c != ':') out += c;
    }
    return out;
}
