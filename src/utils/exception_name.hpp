/**
 * @file    exception_name.hpp
 * @brief   Human-readable dynamic type name of a caught exception
 * @license MIT
 */

#pragma once

#include <exception>
#include <memory>
#include <string>
#include <typeinfo>

#if defined(__GNUG__)
#include <cxxabi.h>
#include <cstdlib>
#endif

namespace pdm {

/**
 * Demangled class name of the exception's dynamic type,
 * e.g. "cv::Exception" or "std::filesystem::__cxx11::filesystem_error".
 * MSVC already returns readable names from type_info::name().
 */
inline std::string exception_name(const std::exception& e) {
    const char* raw = typeid(e).name();
#if defined(__GNUG__)
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled(
        abi::__cxa_demangle(raw, nullptr, nullptr, &status),
        std::free
    );
    if (status == 0 && demangled) {
        return demangled.get();
    }
#endif
    return raw;
}

}  // namespace pdm
