#pragma once
/**
 * @file gutters.hpp
 * @brief Umbrella header: primitives plus the bundled gutter types.
 */

#include "gutters/version.hpp"
#include "gutters/primitives.hpp"
#include "gutters/io/fd_gutter.hpp"
#include "gutters/io/memory_gutter.hpp"
#include "gutters/io/tcp.hpp"
#include "gutters/obs/observability.hpp"
