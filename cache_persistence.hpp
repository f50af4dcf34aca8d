#pragma once

#include "bounded_result_cache.hpp"
#include "json_codec.hpp"
#include "mediavisor_errors.hpp"
#include "mediavisor_event.hpp"
#include "str.hpp"

#include <json/json.h>

#include <cstdio>

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Snapshot file: a JSON array of {"key": ..., "value": ...} records.

// nullopt when the file does not exist, cache_load_error for any other failure
std::optional<std::string> cache_persistence_read_file(std::filesystem::path const &path);

using rename_function = std::function<int(char const *, char const *)>;

// Renames from over to. Only when the rename fails because the destination is in
// the way is the destination unlinked and the rename retried. Throws errno_exception.
void cache_persistence_rename_over(std::filesystem::path const &from, std::filesystem::path const &to, rename_function const &rename_call = std::rename);

// Writes a temporary file next to path and renames it over path. produce_contents runs
// after the temporary file exists; if it or any write fails the temporary file is
// removed, path is left alone and cache_persist_error is thrown.
void cache_persistence_write_atomically(std::filesystem::path const &path, std::function<std::string()> const &produce_contents,
                                        rename_function const &rename_call = std::rename);

// Returns the number of records loaded. Everything is decoded before the first
// cache_set, so a cache_load_error leaves the cache as it was.
template<typename key_type, typename value_type>
size_t cache_persistence_load(std::filesystem::path const &path, bounded_result_cache<key_type, value_type> &cache) {
    auto contents = cache_persistence_read_file(path);
    if (!contents) {
        mediavisor_event_log("cache_persistence_missing", path.string());
        return 0;
    }

    Json::Value root;
    try {
        root = json_parse(*contents);
    } catch (json_decode_error const &e) {
        throw cache_load_error(str("cache_persistence_load ", path, ": ", e.what()));
    }
    if (!root.isArray()) { throw cache_load_error(str("cache_persistence_load ", path, ": top level is not an array")); }

    std::vector<std::pair<key_type, value_type>> decoded;
    decoded.reserve(root.size());
    for (Json::ArrayIndex n = 0; root.size() > n; ++n) {
        auto const &record = root[n];
        if (!record.isObject() || !record.isMember("key") || !record.isMember("value")) {
            throw cache_load_error(str("cache_persistence_load ", path, ": record ", n, " needs key and value"));
        }
        try {
            decoded.emplace_back(json_codec<key_type>::from_json(record["key"]), json_codec<value_type>::from_json(record["value"]));
        } catch (json_decode_error const &e) {
            throw cache_load_error(str("cache_persistence_load ", path, ": record ", n, ": ", e.what()));
        }
    }

    for (auto const &[k, v] : decoded) { cache.cache_set(k, v); }
    mediavisor_event_log("cache_persistence_loaded", str("added ", decoded.size(), " items from ", path));
    return decoded.size();
}

// Returns the number of records saved.
template<typename key_type, typename value_type>
size_t cache_persistence_save(std::filesystem::path const &path, bounded_result_cache<key_type, value_type> const &cache) {
    auto items = cache.cache_items();
    cache_persistence_write_atomically(path, [&] {
        Json::Value root(Json::arrayValue);
        for (auto const &item : items) {
            Json::Value record(Json::objectValue);
            record["key"] = json_codec<key_type>::to_json(item.entry_key);
            record["value"] = json_codec<value_type>::to_json(item.entry_value);
            root.append(std::move(record));
        }
        return json_compact(root) + "\n";
    });
    mediavisor_event_log("cache_persistence_saved", str("saved cache with ", items.size(), " items to ", path));
    return items.size();
}
