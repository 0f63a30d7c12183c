#pragma once

#include <any>
#include <format>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>

// Names an entry of a ResolutionSession together with the type stored under it.
template <typename T>
struct SessionKey {
    const char* name;
};

// State shared by every resolver of one resolution chain.
class ResolutionSession {
public:
    template <typename T>
    void set(const SessionKey<T>& key, T value) {
        entries[key.name] = std::move(value);
    }

    // nullptr when absent. An entry stored under another type is a broken invariant.
    template <typename T>
    T* find(const SessionKey<T>& key) {
        auto it = entries.find(key.name);
        if (it == entries.end()) {
            return nullptr;
        }
        T* value = std::any_cast<T>(&it->second);
        if (value == nullptr) {
            throw std::logic_error(std::format("Session entry {} holds an unexpected type", key.name));
        }
        return value;
    }

    template <typename T>
    T& get(const SessionKey<T>& key) {
        T* value = find(key);
        if (value == nullptr) {
            throw std::logic_error(std::format("Session entry {} is missing", key.name));
        }
        return *value;
    }

    template <typename T>
    bool contains(const SessionKey<T>& key) const {
        return entries.contains(key.name);
    }

    template <typename T>
    void erase(const SessionKey<T>& key) {
        entries.erase(key.name);
    }

    size_t size() const { return entries.size(); }

private:
    std::map<std::string, std::any> entries;
};
