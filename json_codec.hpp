#pragma once

#include <json/json.h>

#include <stdexcept>
#include <string>
#include <string_view>

struct json_encode_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct json_decode_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// specializations provide
//   static Json::Value to_json(T const &)
//   static T from_json(Json::Value const &)   throwing json_decode_error
template<typename T>
struct json_codec;

template<>
struct json_codec<Json::Value> {
    static Json::Value to_json(Json::Value const &v) { return v; }
    static Json::Value from_json(Json::Value const &v) { return v; }
};

template<>
struct json_codec<std::string> {
    static Json::Value to_json(std::string const &s) { return Json::Value(s); }
    static std::string from_json(Json::Value const &v) {
        if (!v.isString()) { throw json_decode_error("expected a JSON string"); }
        return v.asString();
    }
};

// compact single line encoding; throws json_encode_error for NaN and infinities, which JSON cannot carry
std::string json_compact(Json::Value const &v);
Json::Value json_parse(std::string_view text);

template<typename T>
inline size_t json_encoded_size(T const &v) {
    return json_compact(json_codec<T>::to_json(v)).size();
}
