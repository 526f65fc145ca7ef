/**
 * @file Registry.cpp
 * @brief Type-keyed data store implementation
 */

#include <optiframe/engine/Registry.hpp>

#include <algorithm>

namespace optiframe {

void Registry::Assign(const TypeKey &key, std::any shared_value) {
    if (!shared_value.has_value()) {
        throw RegistryError("empty value for type '" + key.Name() + "'");
    }
    entries_.insert_or_assign(key.Index(), Entry{key, std::move(shared_value)});
}

bool Registry::Erase(const TypeKey &key) { return entries_.erase(key.Index()) > 0; }

const std::any *Registry::Find(const TypeKey &key) const {
    auto it = entries_.find(key.Index());
    if (it == entries_.end()) {
        return nullptr;
    }
    return &it->second.value;
}

std::vector<TypeKey> Registry::Keys() const {
    std::vector<TypeKey> keys;
    keys.reserve(entries_.size());
    for (const auto &[index, entry] : entries_) {
        keys.push_back(entry.key);
    }
    std::sort(keys.begin(), keys.end(), [](const TypeKey &a, const TypeKey &b) {
        if (a.Name() != b.Name()) {
            return a.Name() < b.Name();
        }
        return a < b;
    });
    return keys;
}

} // namespace optiframe
