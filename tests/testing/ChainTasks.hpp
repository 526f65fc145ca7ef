#pragma once

/**
 * @file ChainTasks.hpp
 * @brief Value types and small tasks shared by the engine tests
 *
 * ProduceA -> ProduceB -> ProduceC form a chain (A=1, B=A+1, C=B+1).
 * CycleX and CycleY need each other's output.
 */

#include <optiframe/core/TypeKey.hpp>
#include <optiframe/engine/Task.hpp>

#include <array>
#include <string_view>

namespace optiframe::fixtures {

struct A {
    int value = 0;
};

struct B {
    int value = 0;
};

struct C {
    int value = 0;
};

struct X {
    int value = 0;
};

struct Y {
    int value = 0;
};

struct Unused {};

class ProduceA : public Task<A> {
  public:
    static constexpr std::string_view kName = "ProduceA";

    A Execute() override { return A{1}; }
};

class ProduceB : public Task<B> {
  public:
    static constexpr std::string_view kName = "ProduceB";
    using Dependencies = Deps<A>;
    static constexpr std::array<std::string_view, 1> kParameterNames{"a"};

    explicit ProduceB(const A &a) : a_(a) {}

    B Execute() override { return B{a_.value + 1}; }

  private:
    const A &a_;
};

class ProduceC : public Task<C> {
  public:
    static constexpr std::string_view kName = "ProduceC";
    using Dependencies = Deps<B>;
    static constexpr std::array<std::string_view, 1> kParameterNames{"b"};

    explicit ProduceC(const B &b) : b_(b) {}

    C Execute() override { return C{b_.value + 1}; }

  private:
    const B &b_;
};

class CycleX : public Task<X> {
  public:
    static constexpr std::string_view kName = "CycleX";
    using Dependencies = Deps<Y>;
    static constexpr std::array<std::string_view, 1> kParameterNames{"y"};

    explicit CycleX(const Y &y) : y_(y) {}

    X Execute() override { return X{y_.value}; }

  private:
    const Y &y_;
};

class CycleY : public Task<Y> {
  public:
    static constexpr std::string_view kName = "CycleY";
    using Dependencies = Deps<X>;
    static constexpr std::array<std::string_view, 1> kParameterNames{"x"};

    explicit CycleY(const X &x) : x_(x) {}

    Y Execute() override { return Y{x_.value}; }

  private:
    const X &x_;
};

/// Needs a key nothing produces
class NeedsUnused : public Task<C> {
  public:
    static constexpr std::string_view kName = "NeedsUnused";
    using Dependencies = Deps<Unused>;
    static constexpr std::array<std::string_view, 1> kParameterNames{"unused"};

    explicit NeedsUnused(const Unused & /*unused*/) {}

    C Execute() override { return C{}; }
};

} // namespace optiframe::fixtures

OPTIFRAME_TYPE_NAME(optiframe::fixtures::A, "A")
OPTIFRAME_TYPE_NAME(optiframe::fixtures::B, "B")
OPTIFRAME_TYPE_NAME(optiframe::fixtures::C, "C")
OPTIFRAME_TYPE_NAME(optiframe::fixtures::X, "X")
OPTIFRAME_TYPE_NAME(optiframe::fixtures::Y, "Y")
OPTIFRAME_TYPE_NAME(optiframe::fixtures::Unused, "Unused")
