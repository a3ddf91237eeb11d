#pragma once

// Platform detection and requirements
#ifndef __linux__
    #error "This codebase requires Linux"
#endif

#if __cplusplus < 202002L
    #error "This codebase requires C++20 or later"
#endif

namespace recycling::core {

// Library version
inline constexpr const char* VERSION = "1.0.0";

}  // namespace recycling::core
