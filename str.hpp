#pragma once

#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

template<typename value_type>
std::ostream &operator<<(std::ostream &os, std::vector<value_type> const &v) {
    os << "[";
    bool first = true;
    for (auto const &i : v) {
        if (!first) os << ",";
        first = false;
        os << i;
    }
    return os << "]";
}

template<typename... Args>
inline std::string str(Args &&... args) {
    std::ostringstream oss;
    (oss << ... << args);
    return oss.str();
}

// empty pieces are kept, so "a,,b" gives three pieces and "" gives one
inline std::vector<std::string_view> str_split(std::string_view s, char separator) {
    std::vector<std::string_view> ret;
    for (;;) {
        auto pos = s.find(separator);
        ret.push_back(s.substr(0, pos));
        if (pos == std::string_view::npos) { break; }
        s.remove_prefix(pos + 1);
    }
    return ret;
}

inline std::string_view str_trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) { s.remove_prefix(1); }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) { s.remove_suffix(1); }
    return s;
}
