// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

namespace reel::core {

// Install the stderr logger as spdlog's default.
// quiet wins over verbose.
void init_logging(bool verbose, bool quiet);

} // namespace reel::core
