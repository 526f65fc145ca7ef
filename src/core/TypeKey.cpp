/**
 * @file TypeKey.cpp
 * @brief Type name demangling for TypeKey diagnostics
 */

#include <optiframe/core/TypeKey.hpp>

#include <cstdlib>
#include <memory>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace optiframe::detail {

std::string Demangle(const char *mangled) {
#if defined(__GNUG__)
    int status = 0;
    std::unique_ptr<char, void (*)(void *)> demangled(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
    if (status == 0 && demangled) {
        return demangled.get();
    }
#endif
    return mangled;
}

} // namespace optiframe::detail
