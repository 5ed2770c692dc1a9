/**
 * @file json.cpp
 * @brief JSON string escaping.
 * @author Dimitris Kafetzis
 */

#include "core/json.hpp"

namespace exec_profiler {

std::string json_escape(std::string_view text) {
    static constexpr char kHex[] = "0123456789abcdef";

    std::string out;
    out.reserve(text.size() + text.size() / 8 + 2);
    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default: {
                auto byte = static_cast<unsigned char>(c);
                if (byte < 0x20) {
                    out += "\\u00";
                    out += kHex[byte >> 4];
                    out += kHex[byte & 0x0F];
                } else {
                    out += c;
                }
            }
        }
    }
    return out;
}

}  // namespace exec_profiler
