// type_name.hpp — readable, stable names for agent types
#pragma once

#include <cstdlib>
#include <memory>
#include <string>
#include <typeinfo>

#if defined(__GNUC__) || defined(__clang__)
#include <cxxabi.h>
#endif

namespace abm {
namespace core {

inline std::string demangle(const char* mangled) {
#if defined(__GNUC__) || defined(__clang__)
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> out(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
    if (status == 0 && out) return std::string(out.get());
#endif
    return std::string(mangled);
}

// Fully qualified type name, computed once per type.
template <class T>
inline const std::string& type_name() {
    static const std::string name = demangle(typeid(T).name());
    return name;
}

// Last component of a qualified name ("ns::Walker" -> "Walker").
// Template arguments are left untouched.
inline std::string short_name(const std::string& qualified) {
    int depth = 0;
    std::size_t cut = 0;
    for (std::size_t i = 0; i < qualified.size(); ++i) {
        const char c = qualified[i];
        if (c == '<') ++depth;
        else if (c == '>') --depth;
        else if (depth == 0 && c == ':' && i + 1 < qualified.size() && qualified[i + 1] == ':') {
            cut = i + 2;
            ++i;
        }
    }
    return qualified.substr(cut);
}

} // namespace core
} // namespace abm
