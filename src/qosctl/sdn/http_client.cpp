/**
 * @file http_client.cpp
 * @brief Method labels and the basic-auth header value.
 */
#include "qosctl/sdn/http_client.hpp"

namespace qosctl::sdn {

std::string_view to_string(HttpMethod m) noexcept {
    switch (m) {
        case HttpMethod::Get:    return "GET";
        case HttpMethod::Post:   return "POST";
        case HttpMethod::Put:    return "PUT";
        case HttpMethod::Delete: return "DELETE";
    }
    return "GET";
}

std::string basic_auth(std::string_view username, std::string_view password) {
    static constexpr char kAlphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string raw;
    raw.reserve(username.size() + password.size() + 1);
    raw.append(username).append(":").append(password);

    std::string out = "Basic ";
    std::size_t i = 0;
    for (; i + 2 < raw.size(); i += 3) {
        const uint32_t n = (uint32_t(uint8_t(raw[i])) << 16) | (uint32_t(uint8_t(raw[i + 1])) << 8) |
                           uint32_t(uint8_t(raw[i + 2]));
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += kAlphabet[(n >> 6) & 0x3F];
        out += kAlphabet[n & 0x3F];
    }
    const std::size_t rest = raw.size() - i;
    if (rest == 1) {
        const uint32_t n = uint32_t(uint8_t(raw[i])) << 16;
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        const uint32_t n = (uint32_t(uint8_t(raw[i])) << 16) | (uint32_t(uint8_t(raw[i + 1])) << 8);
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += kAlphabet[(n >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

} // namespace qosctl::sdn
