#include "test/memory_counter_store.hpp"

namespace gradeguard::server::mock {
using namespace std;

memory_counter_store::memory_counter_store(const chrono::system_clock::time_point &now) : now(now) {}

memory_counter_store::entry *memory_counter_store::find_alive(const string &key) {
    auto it = entries.find(key);
    if (it == entries.end()) return nullptr;
    if (it->second.expires_at <= now) {
        entries.erase(it);
        return nullptr;
    }
    return &it->second;
}

long long memory_counter_store::increment(const string &key, long long ttl_seconds) {
    scoped_lock guard(mut);
    entry *e = find_alive(key);
    long long value = e ? e->value + 1 : 1;
    entries[key] = {value, now + chrono::seconds(ttl_seconds)};
    return value;
}

long long memory_counter_store::hold(const string &key, long long ttl_seconds) {
    scoped_lock guard(mut);
    if (entry *e = find_alive(key)) {
        auto remaining = chrono::duration_cast<chrono::seconds>(e->expires_at - now).count();
        return max<long long>(remaining, 1);
    }
    entries[key] = {1, now + chrono::seconds(ttl_seconds)};
    return 0;
}

}  // namespace gradeguard::server::mock
