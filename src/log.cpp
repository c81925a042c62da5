#include "log.hpp"

namespace evdevkit {

bool debug_logging_enabled = false;

void set_debug_logging(bool enabled) {
    debug_logging_enabled = enabled;
}

} // namespace evdevkit
