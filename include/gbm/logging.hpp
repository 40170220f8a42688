#ifndef GBM_LOGGING_HPP
#define GBM_LOGGING_HPP

#include <string>

namespace gbm {

// Sets the level of the default logger from a name such as "debug" or
// "warn". Throws InvalidParameter for names the logger does not know.
void setLogLevel(const std::string& name);

} // namespace gbm

#endif // GBM_LOGGING_HPP
