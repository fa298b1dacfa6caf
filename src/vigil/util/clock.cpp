/**
 * @file clock.cpp
 * @brief Default clock instance.
 */
#include "vigil/util/clock.hpp"

namespace vigil::util {

    const Clock& system_clock() noexcept {
        static const SystemClock clk; // stateless, shared by all monitors
        return clk;
    }

} // namespace vigil::util
