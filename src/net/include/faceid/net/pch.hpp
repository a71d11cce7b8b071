#pragma once

// Standard library headers commonly used in net module
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

// Core library headers (net depends on core)
#include <faceid/core/core.hpp>
