#ifndef STACKFMT_PARSE_HPP
#define STACKFMT_PARSE_HPP

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <libstackfmt/error.hpp>

namespace stackfmt {
    template <class I>
    std::optional<I> to_integral(std::string_view sv, int base = 10) {
        auto begin = sv.begin();
        if (base == 16 and sv.size() > 1 and
            begin[0] == '0' and begin[1] == 'x') {
            begin += 2;
        }

        I ret;
        auto result = std::from_chars(begin, sv.end(), ret, base);

        if (sv.empty() or result.ptr != sv.end()) {
            return std::nullopt;
        }
        return ret;
    }

    inline std::optional<bool> to_bool(std::string_view sv) {
        if (sv == "true" or sv == "on" or sv == "1") return true;
        if (sv == "false" or sv == "off" or sv == "0") return false;
        return std::nullopt;
    }

    // Expands \n, \t and \\ so separators can be typed on one line.
    inline std::string unescape(std::string_view text) {
        std::string out;
        for (std::size_t i = 0; i < text.size(); ++i) {
            if (text[i] != '\\') {
                out += text[i];
                continue;
            }
            if (i + 1 == text.size()) {
                stackfmt::error::send("Trailing backslash in escape sequence");
            }
            switch (text[++i]) {
            case 'n': out += '\n'; break;
            case 't': out += '\t'; break;
            case '\\': out += '\\'; break;
            default:
                stackfmt::error::send(
                    std::string("Unknown escape sequence \\") + text[i]);
            }
        }
        return out;
    }

    // The inverse of unescape, for display.
    inline std::string escape(std::string_view text) {
        std::string out;
        for (auto c : text) {
            switch (c) {
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\\': out += "\\\\"; break;
            default: out += c;
            }
        }
        return out;
    }
}

#endif
