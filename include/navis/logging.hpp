#pragma once

#include "config.hpp"
#include "types.hpp"

namespace navis
{

    /**
     * Install the process-wide default logger: colour console output plus an
     * optional file sink, at the configured level.
     */
    Result<void> configure_logging(const LoggingConfig &cfg);

} // namespace navis
