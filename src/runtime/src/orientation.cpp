#include <faceid/app/orientation.hpp>

#include <opencv2/core.hpp>

#include <utility>

namespace faceid {

Orientation OrientationFromTransformations(QImageIOHandler::Transformations transformations) noexcept {
  const bool mirror = transformations.testFlag(QImageIOHandler::TransformationMirror);
  const bool flip = transformations.testFlag(QImageIOHandler::TransformationFlip);
  const bool rotate = transformations.testFlag(QImageIOHandler::TransformationRotate90);

  if (rotate) {
    if (mirror && flip) {
      return Orientation::kRotate90CounterClockwise;
    }
    if (mirror) {
      return Orientation::kTransverse;
    }
    if (flip) {
      return Orientation::kTranspose;
    }
    return Orientation::kRotate90Clockwise;
  }

  if (mirror && flip) {
    return Orientation::kRotate180;
  }
  if (mirror) {
    return Orientation::kMirrorHorizontal;
  }
  if (flip) {
    return Orientation::kMirrorVertical;
  }
  return Orientation::kNormal;
}

Frame ApplyOrientation(const Frame& frame, Orientation orientation) {
  if (frame.Empty()) {
    return {};
  }

  const cv::Mat& src = frame.Mat();
  cv::Mat dst;
  switch (orientation) {
    case Orientation::kNormal:
      return frame.Clone();
    case Orientation::kMirrorHorizontal:
      cv::flip(src, dst, 1);
      break;
    case Orientation::kRotate180:
      cv::rotate(src, dst, cv::ROTATE_180);
      break;
    case Orientation::kMirrorVertical:
      cv::flip(src, dst, 0);
      break;
    case Orientation::kTranspose:
      cv::transpose(src, dst);
      break;
    case Orientation::kRotate90Clockwise:
      cv::rotate(src, dst, cv::ROTATE_90_CLOCKWISE);
      break;
    case Orientation::kTransverse: {
      cv::Mat transposed;
      cv::transpose(src, transposed);
      cv::flip(transposed, dst, -1);
      break;
    }
    case Orientation::kRotate90CounterClockwise:
      cv::rotate(src, dst, cv::ROTATE_90_COUNTERCLOCKWISE);
      break;
  }
  return Frame(std::move(dst));
}

}  // namespace faceid
