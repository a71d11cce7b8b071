#pragma once

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <expected>
#include <filesystem>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Core library headers - these provide assert, logger, and utilities
#include <faceid/core/assert.hpp>
#include <faceid/core/core.hpp>
#include <faceid/core/logger.hpp>
