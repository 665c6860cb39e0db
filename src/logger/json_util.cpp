#include "logger/json_util.hpp"

#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

std::string escape_json_string(std::string_view str) {
    std::string result;
    result.reserve(str.size() + 16);

    for (const unsigned char ch : str) {
        switch (ch) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b";  break;
            case '\f': result += "\\f";  break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            default:
                if (ch < 0x20) {
                    char buf[8]{};
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
                    result += buf;
                } else {
                    result += static_cast<char>(ch);
                }
                break;
        }
    }
    return result;
}

std::string json_quote(std::string_view str) {
    std::string out;
    out.reserve(str.size() + 2);
    out += '"';
    out += escape_json_string(str);
    out += '"';
    return out;
}

std::string json_nullable(const std::optional<std::string>& str) {
    return str ? json_quote(std::string_view{*str}) : std::string("null");
}

std::string format_iso8601(std::chrono::system_clock::time_point tp) {
    const auto since_epoch = tp.time_since_epoch();
    const auto seconds     = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    const auto millis      = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch) - seconds;

    const std::time_t time_val = std::chrono::system_clock::to_time_t(tp);
    std::tm           tm_val{};
    gmtime_r(&time_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count() << 'Z';
    return oss.str();
}
