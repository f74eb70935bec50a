#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace ata {

// Logger used by the library, registered in spdlog as "ata". Applications may
// register their own logger under that name before first use to redirect it.
std::shared_ptr<spdlog::logger> logger();

} // namespace ata
