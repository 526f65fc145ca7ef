#pragma once

/**
 * @file Registry.hpp
 * @brief Type-keyed data store threaded through a workflow
 *
 * Holds at most one value per TypeKey. Values live behind shared ownership so
 * a copy of the registry (a pass snapshot) stays valid while outputs are
 * written to the original.
 */

#include <optiframe/core/Error.hpp>
#include <optiframe/core/TypeKey.hpp>

#include <any>
#include <memory>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace optiframe {

/**
 * @brief Heterogeneous store keyed by TypeKey
 *
 * Writing a key that already has a value replaces it. Not safe for concurrent
 * mutation; concurrent reads of an unmodified registry are fine.
 *
 * Example:
 * @code
 * Registry data;
 * data.Set(Items{...});
 * if (const Items *items = data.Get<Items>()) { ... }
 * Solution &solution = data.Require<Solution>();  // throws RegistryError if absent
 * @endcode
 */
class Registry {
  public:
    // =========================================================================
    // Writes
    // =========================================================================

    /// Store a value under its own type (replaces any previous value)
    template <typename T> void Set(T &&value) {
        using Value = std::remove_cvref_t<T>;
        SetShared(std::make_shared<Value>(std::forward<T>(value)));
    }

    /// Store an already shared value under its type
    template <typename T> void SetShared(std::shared_ptr<T> value) {
        static_assert(!std::is_const_v<T>, "Registry values must be mutable");
        if (!value) {
            throw RegistryError("null value for type '" + TypeKey::Of<T>().Name() + "'");
        }
        Assign(TypeKey::Of<T>(), std::any(std::move(value)));
    }

    /**
     * @brief Store a type-erased value
     *
     * @param key Key to store under
     * @param shared_value std::any holding a std::shared_ptr<T> for the key's type T
     */
    void Assign(const TypeKey &key, std::any shared_value);

    /// Remove the value for a key, returns whether one was present
    bool Erase(const TypeKey &key);

    template <typename T> bool Erase() { return Erase(TypeKey::Of<T>()); }

    /// Remove all values
    void Clear() { entries_.clear(); }

    // =========================================================================
    // Reads
    // =========================================================================

    [[nodiscard]] bool Contains(const TypeKey &key) const {
        return entries_.contains(key.Index());
    }

    template <typename T> [[nodiscard]] bool Contains() const {
        return Contains(TypeKey::Of<T>());
    }

    /// Shared handle to the value of type T, or nullptr when absent
    template <typename T> [[nodiscard]] std::shared_ptr<T> GetShared() {
        return Lookup<std::remove_cvref_t<T>>();
    }

    /// Read-only handle; a const registry never hands out mutable values
    template <typename T> [[nodiscard]] std::shared_ptr<const T> GetShared() const {
        return Lookup<std::remove_cvref_t<T>>();
    }

    /// Pointer to the value of type T, or nullptr when absent
    template <typename T> [[nodiscard]] T *Get() { return GetShared<T>().get(); }

    template <typename T> [[nodiscard]] const T *Get() const { return GetShared<T>().get(); }

    /**
     * @brief Reference to the value of type T
     * @throws RegistryError if no value of type T is stored
     */
    template <typename T> [[nodiscard]] T &Require() {
        T *value = Get<T>();
        if (value == nullptr) {
            throw RegistryError::NotFound(TypeKey::Of<T>().Name());
        }
        return *value;
    }

    template <typename T> [[nodiscard]] const T &Require() const {
        const T *value = Get<T>();
        if (value == nullptr) {
            throw RegistryError::NotFound(TypeKey::Of<T>().Name());
        }
        return *value;
    }

    /// Type-erased value (std::any holding std::shared_ptr<T>), or nullptr when absent
    [[nodiscard]] const std::any *Find(const TypeKey &key) const;

    // =========================================================================
    // Introspection
    // =========================================================================

    [[nodiscard]] std::size_t Size() const { return entries_.size(); }
    [[nodiscard]] bool Empty() const { return entries_.empty(); }

    /// All current keys, sorted by name for stable diagnostics
    [[nodiscard]] std::vector<TypeKey> Keys() const;

  private:
    struct Entry {
        TypeKey key;
        std::any value; ///< Holds std::shared_ptr<T>
    };

    std::unordered_map<std::type_index, Entry> entries_;

    template <typename Value> std::shared_ptr<Value> Lookup() const {
        auto it = entries_.find(std::type_index(typeid(Value)));
        if (it == entries_.end()) {
            return nullptr;
        }
        return std::any_cast<const std::shared_ptr<Value> &>(it->second.value);
    }
};

} // namespace optiframe
