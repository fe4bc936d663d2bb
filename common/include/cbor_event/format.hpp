#pragma once

// Use fmt as a header-only library. Include this before any spdlog header so
// both see the same fmt configuration.
#define FMT_HEADER_ONLY
#include <fmt/format.h>
