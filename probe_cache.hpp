#pragma once

#include "bounded_result_cache.hpp"
#include "json_codec.hpp"

#include <json/json.h>

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>

// identity of one probe: a file and the modification time it had when probed
struct probe_cache_key {
    std::string probe_path;
    double probe_mod_unixtime = 0;

    bool operator==(probe_cache_key const &) const = default;
};

namespace std {
template<>
struct hash<probe_cache_key> {
    size_t operator()(probe_cache_key const &k) const {
        auto ret = std::hash<std::string>()(k.probe_path);
        ret *= 18446744073709551557ul;
        ret ^= std::hash<double>()(k.probe_mod_unixtime);
        return ret;
    }
};
} // namespace std

struct probe_result {
    Json::Value probe_json;

    bool operator==(probe_result const &other) const { return probe_json == other.probe_json; }
};

template<>
struct json_codec<probe_cache_key> {
    static Json::Value to_json(probe_cache_key const &k);
    static probe_cache_key from_json(Json::Value const &v);
};

template<>
struct json_codec<probe_result> {
    static Json::Value to_json(probe_result const &r) { return r.probe_json; }
    static probe_result from_json(Json::Value const &v) { return probe_result{v}; }
};

using probe_result_cache = bounded_result_cache<probe_cache_key, probe_result>;

class prober {
  public:
    virtual ~prober() = default;
    // throws probe_error when the file cannot be probed
    virtual probe_result probe(std::filesystem::path const &path) = 0;
};

// Runs ffprobe without a shell and parses its JSON report. A run that outlasts
// timeout is killed, so a stuck file cannot hold up the serving instance.
class ffprobe_prober : public prober {
  public:
    explicit ffprobe_prober(std::string executable = "ffprobe", std::chrono::duration<double> timeout = std::chrono::seconds(30))
        : ffprobe_executable(std::move(executable)), ffprobe_timeout(std::chrono::duration_cast<std::chrono::steady_clock::duration>(timeout)) {}
    probe_result probe(std::filesystem::path const &path) override;

  private:
    std::string ffprobe_executable;
    std::chrono::steady_clock::duration ffprobe_timeout;
};

probe_cache_key probe_cache_key_for_path(std::filesystem::path const &path);

// memoizes prober calls; failures are not cached
probe_result probe_cached(probe_result_cache &cache, prober &probe_with, std::filesystem::path const &path);
