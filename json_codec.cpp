#include "json_codec.hpp"

#include "str.hpp"

#include <cmath>
#include <memory>

namespace {
void json_check_encodable(Json::Value const &v) {
    switch (v.type()) {
    case Json::realValue:
        if (!std::isfinite(v.asDouble())) { throw json_encode_error(str("unsupported value: ", v.asDouble())); }
        break;
    case Json::arrayValue:
    case Json::objectValue:
        for (auto const &i : v) { json_check_encodable(i); }
        break;
    default: break;
    }
}
} // namespace

std::string json_compact(Json::Value const &v) {
    json_check_encodable(v);
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, v);
}

Json::Value json_parse(std::string_view text) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    builder["failIfExtra"] = true;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) { throw json_decode_error(str("invalid JSON: ", errors)); }
    return root;
}
