/**
 * @file test_type_key.cpp
 * @brief Unit tests for TypeKey identity and naming
 */

#include <optiframe/core/CoreTypes.hpp>
#include <optiframe/core/TypeKey.hpp>

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

namespace demo {
struct Unnamed {};
struct Named {};
} // namespace demo

OPTIFRAME_TYPE_NAME(demo::Named, "Named")

namespace optiframe {
namespace {

// =============================================================================
// Identity
// =============================================================================

TEST(TypeKeyTest, SameTypeSameKey) {
    EXPECT_EQ(TypeKey::Of<int>(), TypeKey::Of<int>());
    EXPECT_EQ(&TypeKey::Of<int>(), &TypeKey::Of<int>());
}

TEST(TypeKeyTest, DifferentTypesDiffer) {
    EXPECT_NE(TypeKey::Of<int>(), TypeKey::Of<double>());
    EXPECT_NE(TypeKey::Of<demo::Named>(), TypeKey::Of<demo::Unnamed>());
}

TEST(TypeKeyTest, QualifiersAreStripped) {
    EXPECT_EQ(TypeKey::Of<const int &>(), TypeKey::Of<int>());
    EXPECT_EQ(TypeKey::Of<volatile demo::Named>(), TypeKey::Of<demo::Named>());
    EXPECT_EQ(TypeKey::Of<demo::Named &&>(), TypeKey::Of<demo::Named>());
}

TEST(TypeKeyTest, HashingUsesTypeIdentity) {
    std::unordered_set<TypeKey> keys;
    keys.insert(TypeKey::Of<int>());
    keys.insert(TypeKey::Of<const int>());
    keys.insert(TypeKey::Of<double>());
    EXPECT_EQ(keys.size(), 2u);
    EXPECT_TRUE(keys.contains(TypeKey::Of<int>()));
}

TEST(TypeKeyTest, OrderingIsStrictWeak) {
    const TypeKey &a = TypeKey::Of<int>();
    const TypeKey &b = TypeKey::Of<double>();
    EXPECT_FALSE(a < a);
    EXPECT_NE(a < b, b < a);
}

// =============================================================================
// Names
// =============================================================================

TEST(TypeKeyTest, DefaultNameIsDemangled) {
    EXPECT_EQ(TypeKey::Of<demo::Unnamed>().Name(), "demo::Unnamed");
    EXPECT_EQ(TypeKey::Of<int>().Name(), "int");
}

TEST(TypeKeyTest, CustomNameOverridesDefault) {
    EXPECT_EQ(TypeKey::Of<demo::Named>().Name(), "Named");
}

TEST(TypeKeyTest, StreamsName) {
    std::ostringstream oss;
    oss << TypeKey::Of<demo::Named>();
    EXPECT_EQ(oss.str(), "Named");
}

TEST(TypeKeyTest, DemangleFallsBackToInput) {
    EXPECT_EQ(detail::Demangle("not a mangled name"), "not a mangled name");
}

// =============================================================================
// Naming helpers
// =============================================================================

TEST(CoreTypesTest, MakeFullPath) {
    EXPECT_EQ(MakeFullPath("build", "CreateModel"), "build.CreateModel");
    EXPECT_EQ(MakeFullPath("", "CreateModel"), "CreateModel");
}

TEST(CoreTypesTest, VersionString) {
    const std::string expected = std::to_string(VersionMajor()) + "." +
                                 std::to_string(VersionMinor()) + "." +
                                 std::to_string(VersionPatch());
    EXPECT_EQ(std::string(Version()), expected);
}

} // namespace
} // namespace optiframe
