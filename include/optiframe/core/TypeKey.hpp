#pragma once

/**
 * @file TypeKey.hpp
 * @brief Stable runtime identifier of a semantic data kind
 *
 * A TypeKey is the sole addressing mechanism into the Registry. It maps 1:1 to
 * a decayed C++ type and carries a readable name for diagnostics. Identity,
 * ordering and hashing use only the type, never the name.
 */

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>

namespace optiframe {

namespace detail {

/// Demangle a compiler type name (returns the input when demangling fails)
[[nodiscard]] std::string Demangle(const char *mangled);

} // namespace detail

// =============================================================================
// TypeName - readable names for value types
// =============================================================================

/**
 * @brief Readable name of a type
 *
 * Defaults to the demangled C++ name. Specialize (or use OPTIFRAME_TYPE_NAME)
 * to give a type a short name in diagnostics and exported graphs.
 */
template <typename T> struct TypeName {
    static std::string Get() { return detail::Demangle(typeid(T).name()); }
};

// =============================================================================
// TypeKey
// =============================================================================

class TypeKey {
  public:
    /// Key for type T (cv-ref qualifiers are stripped)
    template <typename T> [[nodiscard]] static const TypeKey &Of() {
        using Decayed = std::remove_cvref_t<T>;
        static const TypeKey key(typeid(Decayed), TypeName<Decayed>::Get());
        return key;
    }

    [[nodiscard]] const std::type_index &Index() const { return index_; }
    [[nodiscard]] const std::string &Name() const { return name_; }

    bool operator==(const TypeKey &other) const { return index_ == other.index_; }
    bool operator!=(const TypeKey &other) const { return index_ != other.index_; }
    bool operator<(const TypeKey &other) const { return index_ < other.index_; }

  private:
    TypeKey(const std::type_info &info, std::string name)
        : index_(info), name_(std::move(name)) {}

    std::type_index index_;
    std::string name_;
};

inline std::ostream &operator<<(std::ostream &os, const TypeKey &key) { return os << key.Name(); }

} // namespace optiframe

namespace std {

template <> struct hash<optiframe::TypeKey> {
    std::size_t operator()(const optiframe::TypeKey &key) const noexcept {
        return std::hash<std::type_index>{}(key.Index());
    }
};

} // namespace std

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

/**
 * @brief Give a value type a readable name
 *
 * Use at global namespace scope:
 * @code
 * OPTIFRAME_TYPE_NAME(knapsack::BaseData, "BaseData")
 * @endcode
 */
#define OPTIFRAME_TYPE_NAME(Type, Name)                                                            \
    namespace optiframe {                                                                          \
    template <> struct TypeName<Type> {                                                            \
        static std::string Get() { return Name; }                                                  \
    };                                                                                             \
    }

// NOLINTEND(cppcoreguidelines-macro-usage)
