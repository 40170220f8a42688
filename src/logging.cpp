#include "gbm/logging.hpp"
#include "gbm/errors.hpp"
#include <spdlog/spdlog.h>

namespace gbm {

void setLogLevel(const std::string& name) {
    // from_str maps unknown names to "off"
    const spdlog::level::level_enum level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        throw InvalidParameter("Unknown log level '" + name + "'");
    }
    spdlog::set_level(level);
}

} // namespace gbm
