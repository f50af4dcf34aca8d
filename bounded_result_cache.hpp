#pragma once

#include "json_codec.hpp"
#include "mediavisor_event.hpp"
#include "result_store.hpp"
#include "str.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>

// Thread safe front for a result_store. Entry sizes are the compact JSON lengths of key
// and value, computed before taking the lock; no I/O happens while the lock is held.
template<typename key_type, typename value_type>
class bounded_result_cache {
  public:
    using entry_type = cache_entry<key_type, value_type>;

    explicit bounded_result_cache(std::unique_ptr<result_store<key_type, value_type>> store) : cache_store(std::move(store)) {
        if (!cache_store) { throw std::invalid_argument("bounded_result_cache needs a store"); }
    }

    bounded_result_cache(bounded_result_cache const &) = delete;
    bounded_result_cache &operator=(bounded_result_cache const &) = delete;

    std::optional<value_type> cache_get(key_type const &key) const {
        std::lock_guard _{cache_mutex};
        return cache_store->store_get(key);
    }

    // an encoding failure is logged and counts as zero bytes, the entry is stored anyway
    void cache_set(key_type const &key, value_type const &value) {
        auto size = encoded_size_or_zero(key, "key") + encoded_size_or_zero(value, "value");
        std::lock_guard _{cache_mutex};
        cache_store->store_set(key, value, size);
    }

    std::vector<entry_type> cache_items() const {
        std::lock_guard _{cache_mutex};
        return cache_store->store_items();
    }

    int64_t cache_total_size() const {
        std::lock_guard _{cache_mutex};
        return cache_store->store_total_size();
    }

    int64_t cache_capacity() const {
        std::lock_guard _{cache_mutex};
        return cache_store->store_capacity();
    }

    size_t cache_count() const {
        std::lock_guard _{cache_mutex};
        return cache_store->store_count();
    }

  private:
    template<typename T>
    static int64_t encoded_size_or_zero(T const &v, char const *what) {
        try {
            return static_cast<int64_t>(json_encoded_size(v));
        } catch (std::exception const &e) {
            mediavisor_event_log("bounded_result_cache_size_error", str("could not encode ", what, ": ", e.what()));
            return 0;
        }
    }

    std::unique_ptr<result_store<key_type, value_type>> cache_store;
    mutable std::mutex cache_mutex;
};
