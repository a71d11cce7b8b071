#pragma once

#include <faceid/pch.hpp>

#include <faceid/app/frame.hpp>

#include <QImageIOHandler>

#include <cstdint>
#include <string_view>

namespace faceid {

/**
 * @brief EXIF orientation tag values.
 * @details The numeric value of each enumerator equals the EXIF tag value.
 */
enum class Orientation : uint8_t {
  kNormal = 1,              ///< Pixels are stored upright.
  kMirrorHorizontal = 2,    ///< Mirrored left to right.
  kRotate180 = 3,           ///< Upside down.
  kMirrorVertical = 4,      ///< Mirrored top to bottom.
  kTranspose = 5,           ///< Mirrored along the main diagonal.
  kRotate90Clockwise = 6,   ///< Needs a 90 degree clockwise rotation to display upright.
  kTransverse = 7,          ///< Mirrored along the anti-diagonal.
  kRotate90CounterClockwise = 8  ///< Needs a 90 degree counter-clockwise rotation to display upright.
};

[[nodiscard]] constexpr std::string_view OrientationToString(Orientation orientation) noexcept {
  switch (orientation) {
    case Orientation::kNormal:
      return "Normal";
    case Orientation::kMirrorHorizontal:
      return "MirrorHorizontal";
    case Orientation::kRotate180:
      return "Rotate180";
    case Orientation::kMirrorVertical:
      return "MirrorVertical";
    case Orientation::kTranspose:
      return "Transpose";
    case Orientation::kRotate90Clockwise:
      return "Rotate90Clockwise";
    case Orientation::kTransverse:
      return "Transverse";
    case Orientation::kRotate90CounterClockwise:
      return "Rotate90CounterClockwise";
  }
  return "Unknown";
}

/**
 * @brief Maps the transformation reported by QImageReader to an EXIF orientation.
 */
[[nodiscard]] Orientation OrientationFromTransformations(QImageIOHandler::Transformations transformations) noexcept;

/**
 * @brief Bakes an orientation into pixel order.
 * @param frame Decoded pixels as stored in the file
 * @param orientation Orientation tag read from the file
 * @return Upright frame
 */
[[nodiscard]] Frame ApplyOrientation(const Frame& frame, Orientation orientation);

}  // namespace faceid
