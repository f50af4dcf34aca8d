#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <unordered_map>
#include <utility>
#include <vector>

template<typename key_type, typename value_type>
struct cache_entry {
    key_type entry_key;
    value_type entry_value;
    int64_t entry_size;
};

// Unsynchronized storage behind bounded_result_cache. Sizes are supplied by the caller.
template<typename key_type, typename value_type>
class result_store {
  public:
    virtual ~result_store() = default;

    virtual std::optional<value_type> store_get(key_type const &key) const = 0;
    virtual void store_set(key_type const &key, value_type const &value, int64_t size) = 0;
    virtual std::vector<cache_entry<key_type, value_type>> store_items() const = 0;
    virtual int64_t store_total_size() const = 0;
    virtual int64_t store_capacity() const = 0;
    virtual size_t store_count() const = 0;
};

// Evicts uniformly random entries once the total size goes over capacity. The entry
// being set is never its own victim, so a single entry larger than capacity stays
// alone in the store and the total exceeds capacity until something else is set.
template<typename key_type, typename value_type, typename hash_type = std::hash<key_type>>
class random_replacement_store : public result_store<key_type, value_type> {
    struct stored_value {
        value_type stored;
        int64_t stored_size;
        size_t stored_slot;
    };

    std::unordered_map<key_type, stored_value, hash_type> store_table;
    std::vector<key_type> store_keys; // dense, for O(1) random choice
    int64_t store_size = 0;
    int64_t const store_max_size;
    std::mt19937_64 store_random;

  public:
    explicit random_replacement_store(int64_t capacity, uint64_t seed = std::random_device{}())
        : store_max_size(capacity), store_random(seed) {}

    std::optional<value_type> store_get(key_type const &key) const override {
        auto i = store_table.find(key);
        if (i == store_table.end()) { return std::nullopt; }
        return i->second.stored;
    }

    void store_set(key_type const &key, value_type const &value, int64_t size) override {
        auto i = store_table.find(key);
        if (i != store_table.end()) {
            store_size -= i->second.stored_size;
            i->second.stored = value;
            i->second.stored_size = size;
        } else {
            i = store_table.emplace(key, stored_value{value, size, store_keys.size()}).first;
            store_keys.push_back(key);
        }
        store_size += size;
        trim_excluding(i->second.stored_slot);
    }

    std::vector<cache_entry<key_type, value_type>> store_items() const override {
        std::vector<cache_entry<key_type, value_type>> ret;
        ret.reserve(store_table.size());
        for (auto const &[k, v] : store_table) { ret.push_back({k, v.stored, v.stored_size}); }
        return ret;
    }

    int64_t store_total_size() const override { return store_size; }
    int64_t store_capacity() const override { return store_max_size; }
    size_t store_count() const override { return store_keys.size(); }

  private:
    void trim_excluding(size_t kept_slot) {
        while (store_size > store_max_size && store_keys.size() > 1) {
            std::uniform_int_distribution<size_t> pick(0, store_keys.size() - 2);
            auto victim = pick(store_random);
            if (victim >= kept_slot) { ++victim; }
            remove_slot(victim);
            // the last key moved into the hole
            if (kept_slot == store_keys.size()) { kept_slot = victim; }
        }
    }

    void remove_slot(size_t slot) {
        auto i = store_table.find(store_keys[slot]);
        store_size -= i->second.stored_size;
        auto last = store_keys.size() - 1;
        if (slot != last) {
            store_keys[slot] = std::move(store_keys[last]);
            store_table.find(store_keys[slot])->second.stored_slot = slot;
        }
        store_keys.pop_back();
        store_table.erase(i);
    }
};
