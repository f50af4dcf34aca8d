#pragma once

#include <cstdlib>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

// nullopt when given is not a complete T
template<typename T>
inline std::optional<T> env_parse(std::string_view given) {
    T parsed;
    std::istringstream is{std::string(given)};
    if (!(is >> parsed) || !(is >> std::ws).eof()) { return std::nullopt; }
    return parsed;
}

template<>
inline std::optional<std::string> env_parse(std::string_view given) {
    return std::string(given);
}

template<>
inline std::optional<bool> env_parse(std::string_view given) {
    if (given == "1" || given == "true" || given == "yes") { return true; }
    if (given == "0" || given == "false" || given == "no") { return false; }
    return std::nullopt;
}

// unset or unparseable variables give default_value
template<typename T>
inline T env(char const *var, T default_value) {
    auto given = std::getenv(var);
    if (!given) { return default_value; }
    return env_parse<T>(given).value_or(std::move(default_value));
}

inline std::string env(char const *var, char const *default_value) {
    return env(var, std::string(default_value));
}
