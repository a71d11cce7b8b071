#pragma once

#include <faceid/pch.hpp>

#include <algorithm>
#include <optional>

namespace faceid {

/**
 * @brief Axis-aligned face rectangle in image pixel coordinates.
 */
struct FaceBoundingBox {
  int left = 0;    ///< Left edge (column of the first pixel).
  int top = 0;     ///< Top edge (row of the first pixel).
  int width = 0;   ///< Box width in pixels.
  int height = 0;  ///< Box height in pixels.

  [[nodiscard]] constexpr int Right() const noexcept { return left + width; }
  [[nodiscard]] constexpr int Bottom() const noexcept { return top + height; }

  /**
   * @brief Checks if the bounding box is valid (non-zero dimensions).
   * @return True if valid.
   */
  [[nodiscard]] constexpr bool Valid() const noexcept { return width > 0 && height > 0; }

  /**
   * @brief Checks if the box lies completely inside an image.
   * @param image_width Image width in pixels
   * @param image_height Image height in pixels
   */
  [[nodiscard]] constexpr bool InsideImage(int image_width, int image_height) const noexcept {
    return Valid() && left >= 0 && top >= 0 && Right() <= image_width && Bottom() <= image_height;
  }

  [[nodiscard]] constexpr bool operator==(const FaceBoundingBox& other) const noexcept = default;
};

/**
 * @brief Single face produced by a FaceLocator.
 */
struct FaceDetection {
  FaceBoundingBox box;      ///< Face rectangle as reported by the detector.
  float confidence = 0.0F;  ///< Detection confidence score (0.0 - 1.0).

  [[nodiscard]] constexpr bool operator==(const FaceDetection& other) const noexcept = default;
};

/**
 * @brief Clamps a detector box to the image bounds.
 * @details The origin is clamped into [0, W) x [0, H) (a negative origin also shrinks the box by the
 * overhang), then the extent is clamped so the box ends at the image border. The result always covers
 * at least one pixel, so a box lying completely outside the image degenerates to the nearest edge pixel.
 * @param box Detector box, may exceed the image
 * @param image_width Image width in pixels
 * @param image_height Image height in pixels
 * @return Clamped box, or std::nullopt for an empty image
 */
[[nodiscard]] constexpr auto ClampToImage(FaceBoundingBox box, int image_width, int image_height) noexcept
    -> std::optional<FaceBoundingBox> {
  if (image_width <= 0 || image_height <= 0) {
    return std::nullopt;
  }

  if (box.left < 0) {
    box.width += box.left;
    box.left = 0;
  }
  if (box.top < 0) {
    box.height += box.top;
    box.top = 0;
  }

  box.left = std::min(box.left, image_width - 1);
  box.top = std::min(box.top, image_height - 1);
  box.width = std::clamp(box.width, 1, image_width - box.left);
  box.height = std::clamp(box.height, 1, image_height - box.top);
  return box;
}

}  // namespace faceid
