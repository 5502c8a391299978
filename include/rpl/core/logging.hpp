#pragma once

#include "rpl/core/config.hpp"
#include "rpl/core/result.hpp"

namespace rpl::core {

/**
 * @brief Install the default spdlog logger
 *
 * Console sink always; rotating file sink when config.file is set.
 * Unknown level names return InvalidConfig and leave logging untouched.
 */
Result<void> configure_logging(const LoggingConfig& config);

} // namespace rpl::core
