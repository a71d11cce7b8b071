#pragma once

#include <faceid/pch.hpp>

#include <faceid/app/frame.hpp>
#include <faceid/app/orientation.hpp>

#include <cstdint>
#include <filesystem>
#include <vector>

namespace faceid {

/**
 * @brief Photo decoded from a file on disk.
 * @details Owned by a single capture run and dropped once its request completes or fails.
 */
struct CapturedImage {
  std::filesystem::path path;                    ///< File the image was decoded from.
  Frame pixels;                                  ///< Decoded pixels in stored (not yet oriented) order.
  Orientation orientation = Orientation::kNormal;  ///< Orientation tag of the file.
  std::vector<uint8_t> encoded;                  ///< File contents the pixels were decoded from.

  [[nodiscard]] int Width() const noexcept { return pixels.Width(); }
  [[nodiscard]] int Height() const noexcept { return pixels.Height(); }
};

/**
 * @brief Upright, optionally face-cropped image ready for submission.
 */
struct NormalizedImage {
  std::filesystem::path path;    ///< File holding the final bytes.
  std::vector<uint8_t> encoded;  ///< Final encoded bytes.
  int width = 0;
  int height = 0;
};

}  // namespace faceid
