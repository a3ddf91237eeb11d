#include "recycler_config.hpp"

#include <stdexcept>
#include <string>

namespace recycling::core {

void RecyclerConfig::validate() const {
    if (prefill > max_idle) {
        throw std::runtime_error("Prefill count " + std::to_string(prefill) + " exceeds max idle " +
                                 std::to_string(max_idle));
    }
}

}  // namespace recycling::core
