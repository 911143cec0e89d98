#pragma once

#include <chrono>
#include <cstddef>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

namespace seatswap {

// Thread-safe key/value store with a time-to-live and a capacity. A zero TTL keeps entries until they
// are evicted. Once full, the entry inserted earliest is evicted; overwriting a key renews it.
template <typename Key, typename Value, typename Clock = std::chrono::steady_clock>
class TtlStore {
public:
    TtlStore(std::chrono::seconds ttl, std::size_t capacity): ttl(ttl), capacity(capacity) {}

    std::optional<Value> get(const Key& key){
        std::lock_guard lock(mtx);
        auto it = entries.find(key);
        if(it == entries.end()) return std::nullopt;
        if(expired(it->second)){
            erase(it);
            return std::nullopt;
        }
        return it->second.value;
    }

    void put(const Key& key, Value value){
        std::lock_guard lock(mtx);
        auto it = entries.find(key);
        if(it != entries.end()) erase(it);

        while(capacity > 0 and entries.size() >= capacity){
            entries.erase(order.front());
            order.pop_front();
        }
        order.push_back(key);
        entries.emplace(key, Entry{std::move(value), Clock::now(), std::prev(order.end())});
    }

    bool remove(const Key& key){
        std::lock_guard lock(mtx);
        auto it = entries.find(key);
        if(it == entries.end()) return false;
        erase(it);
        return true;
    }

    std::size_t size() const {
        std::lock_guard lock(mtx);
        return entries.size();
    }

private:
    struct Entry {
        Value value;
        typename Clock::time_point stored_at;
        typename std::list<Key>::iterator position;
    };

    bool expired(const Entry& e) const { return ttl.count() > 0 and Clock::now() - e.stored_at >= ttl; }

    void erase(typename std::unordered_map<Key, Entry>::iterator it){
        order.erase(it->second.position);
        entries.erase(it);
    }

    std::chrono::seconds ttl;
    std::size_t capacity;
    mutable std::mutex mtx;
    std::list<Key> order;
    std::unordered_map<Key, Entry> entries;
};

} // namespace seatswap
