#include "logging.hpp"

namespace logging {
bool active = false;
}
