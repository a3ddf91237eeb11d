#include <iostream>

#include "core/cache.hpp"
#include "core/platform.hpp"
#include "core/recycler_config.hpp"

int main() {
    using namespace recycling::core;

    std::cout << "Recycling - Reusable Value Pool" << std::endl;
    std::cout << "Version: " << VERSION << std::endl;
    std::cout << "C++ Standard: " << __cplusplus << std::endl;
    std::cout << "Cache Line Size: " << CACHELINE_SIZE << " bytes" << std::endl;
    std::cout << "Default Max Idle: " << RecyclerConfig::DEFAULT_MAX_IDLE << " values" << std::endl;

    return 0;
}
