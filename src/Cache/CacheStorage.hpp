#pragma once

#include "../Clock/Clock.hpp"
#include <optional>
#include <string>
#include <unordered_map>

template <typename T>
struct CacheEntry {
    T value;
    TimePoint stored_at;
};

// The cache serializes every call.
template <typename T>
class CacheStorage {
public:
    virtual ~CacheStorage() = default;

    virtual bool erase(const std::string& key) = 0;
    virtual std::optional<CacheEntry<T>> get(const std::string& key) const = 0;
    virtual bool has(const std::string& key) const = 0;
    virtual CacheStorage& set(const std::string& key, CacheEntry<T> entry) = 0;
};

template <typename T>
class MemoryCacheStorage : public CacheStorage<T> {
public:
    bool erase(const std::string& key) override {
        return entries_.erase(key) != 0;
    }

    std::optional<CacheEntry<T>> get(const std::string& key) const override {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool has(const std::string& key) const override {
        return entries_.count(key) != 0;
    }

    CacheStorage<T>& set(const std::string& key, CacheEntry<T> entry) override {
        entries_.insert_or_assign(key, std::move(entry));
        return *this;
    }

    std::size_t size() const { return entries_.size(); }

private:
    std::unordered_map<std::string, CacheEntry<T>> entries_;
};
