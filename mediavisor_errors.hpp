#pragma once

#include <stdexcept>

// non-fatal: logged, previous or default values kept
struct config_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// non-fatal: logged, the cache keeps what it had
struct cache_load_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// non-fatal: logged at shutdown
struct cache_persist_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// fatal
struct server_init_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// fatal
struct server_runtime_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// fatal, without an interface there is nothing to listen on
struct interface_lookup_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct probe_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};
