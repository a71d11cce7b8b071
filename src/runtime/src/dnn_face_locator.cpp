#include <faceid/app/dnn_face_locator.hpp>

#include <faceid/core/logger.hpp>

#include <opencv2/core.hpp>
#include <opencv2/dnn.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/objdetect.hpp>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace faceid {

namespace {

constexpr int kYuNetScoreColumn = 14;
constexpr int kSsdValuesPerDetection = 7;

[[nodiscard]] std::string ShapeToString(const cv::Mat& mat) {
  std::string shape = "[";
  for (int i = 0; i < mat.dims; ++i) {
    if (i > 0) {
      shape.append(", ");
    }
    shape.append(std::to_string(mat.size[i]));
  }
  shape.append("]");
  return shape;
}

[[nodiscard]] FaceBoundingBox ToPixelBox(float x, float y, float w, float h) noexcept {
  return {.left = static_cast<int>(std::lround(x)),
          .top = static_cast<int>(std::lround(y)),
          .width = static_cast<int>(std::lround(w)),
          .height = static_cast<int>(std::lround(h))};
}

}  // namespace

auto DnnFaceLocator::Initialize(const ModelConfig& config) -> std::expected<void, FaceLocatorError> {
  config_ = config;
  initialized_ = false;
  net_ = cv::dnn::Net();
  yunet_detector_.reset();

  std::error_code ec;
  if (!std::filesystem::exists(config_.model_path, ec)) {
    FACEID_ERROR("Model file not found: {}", config_.model_path.string());
    return std::unexpected(FaceLocatorError::kModelNotFound);
  }

  if (!config_.config_path.empty() && !std::filesystem::exists(config_.config_path, ec)) {
    FACEID_ERROR("Config file not found: {}", config_.config_path.string());
    return std::unexpected(FaceLocatorError::kConfigNotFound);
  }

  try {
    use_yunet_ = config_.config_path.empty() && config_.model_path.extension() == ".onnx";

    if (use_yunet_) {
      yunet_detector_ = cv::FaceDetectorYN::create(config_.model_path.string(), "",
                                                   cv::Size(config_.input_width, config_.input_height),
                                                   config_.confidence_threshold, config_.nms_threshold);
      if (yunet_detector_.empty()) {
        FACEID_ERROR("Failed to create FaceDetectorYN");
        return std::unexpected(FaceLocatorError::kModelLoadFailed);
      }
    } else {
      net_ = config_.config_path.empty()
                 ? cv::dnn::readNet(config_.model_path.string())
                 : cv::dnn::readNet(config_.model_path.string(), config_.config_path.string());
      if (net_.empty()) {
        FACEID_ERROR("Failed to load neural network model");
        return std::unexpected(FaceLocatorError::kModelLoadFailed);
      }

      if (config_.use_gpu) {
        try {
          net_.setPreferableBackend(cv::dnn::DNN_BACKEND_CUDA);
          net_.setPreferableTarget(cv::dnn::DNN_TARGET_CUDA);
          FACEID_INFO("Face locator using CUDA backend");
        } catch (const cv::Exception& e) {
          FACEID_WARN("Failed to set CUDA backend, falling back to CPU: {}", e.what());
          net_.setPreferableBackend(cv::dnn::DNN_BACKEND_DEFAULT);
          net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
        }
      } else {
        net_.setPreferableBackend(cv::dnn::DNN_BACKEND_DEFAULT);
        net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
      }

      // Catch incompatible layer definitions at load time instead of on the first photo
      try {
        const int dims[] = {1, 3, config_.input_height, config_.input_width};
        net_.setInput(cv::Mat::zeros(4, dims, CV_32F));
        if (net_.forward().empty()) {
          FACEID_ERROR("Model test forward pass produced empty output");
          net_ = cv::dnn::Net();
          return std::unexpected(FaceLocatorError::kModelLoadFailed);
        }
      } catch (const cv::Exception& e) {
        FACEID_ERROR("Model test forward pass failed: {}", e.what());
        net_ = cv::dnn::Net();
        return std::unexpected(FaceLocatorError::kInvalidModel);
      }
    }
  } catch (const cv::Exception& e) {
    FACEID_ERROR("OpenCV exception during model loading: {}", e.what());
    net_ = cv::dnn::Net();
    yunet_detector_.reset();
    return std::unexpected(FaceLocatorError::kModelLoadFailed);
  }

  initialized_ = true;
  FACEID_INFO("Face locator initialized with {} model: {}", ModelTypeToString(config_.type),
              config_.model_path.filename().string());
  return {};
}

auto DnnFaceLocator::Locate(const Frame& frame) -> std::expected<std::vector<FaceDetection>, FaceLocatorError> {
  if (!initialized_) {
    return std::unexpected(FaceLocatorError::kNotInitialized);
  }

  if (frame.Empty()) {
    return std::unexpected(FaceLocatorError::kProcessingFailed);
  }

  try {
    std::vector<FaceDetection> faces;
    if (use_yunet_) {
      yunet_detector_->setInputSize(cv::Size(frame.Width(), frame.Height()));

      cv::Mat output;
      yunet_detector_->detect(frame.Mat(), output);
      faces = ParseYuNetDetections(output);
    } else {
      const cv::Mat blob = CreateBlob(frame);
      if (blob.empty()) {
        FACEID_ERROR("Failed to create blob from image");
        return std::unexpected(FaceLocatorError::kProcessingFailed);
      }

      net_.setInput(blob);
      const cv::Mat output = net_.forward();
      if (output.empty()) {
        FACEID_ERROR("Network forward pass produced empty output");
        return std::unexpected(FaceLocatorError::kProcessingFailed);
      }
      faces = ParseSsdDetections(output, frame.Width(), frame.Height());
    }

    ++images_processed_;
    FACEID_DEBUG("Located {} face(s) in {}x{} image", faces.size(), frame.Width(), frame.Height());
    return faces;
  } catch (const cv::Exception& e) {
    FACEID_ERROR("OpenCV exception during face detection: {}", e.what());
    return std::unexpected(FaceLocatorError::kProcessingFailed);
  }
}

void DnnFaceLocator::SetConfidenceThreshold(float threshold) noexcept {
  config_.confidence_threshold = threshold;
  if (use_yunet_ && !yunet_detector_.empty()) {
    yunet_detector_->setScoreThreshold(threshold);
  }
  FACEID_INFO("Confidence threshold updated to: {:.2f}", threshold);
}

cv::Mat DnnFaceLocator::CreateBlob(const Frame& frame) const {
  // Caffe SSD models are trained with mean subtraction
  const cv::Scalar mean_values =
      config_.config_path.empty() ? cv::Scalar(0.0, 0.0, 0.0) : cv::Scalar(104.0, 177.0, 123.0);
  return cv::dnn::blobFromImage(frame.Mat(), 1.0, cv::Size(config_.input_width, config_.input_height), mean_values,
                                config_.swap_rb, false);
}

auto DnnFaceLocator::ParseYuNetDetections(const cv::Mat& faces) const -> std::vector<FaceDetection> {
  std::vector<FaceDetection> result;
  if (faces.empty() || faces.cols <= kYuNetScoreColumn) {
    return result;
  }

  result.reserve(static_cast<size_t>(faces.rows));
  for (int i = 0; i < faces.rows; ++i) {
    const float confidence = faces.at<float>(i, kYuNetScoreColumn);
    const float w = faces.at<float>(i, 2);
    const float h = faces.at<float>(i, 3);
    if (confidence < config_.confidence_threshold || w <= 0.0F || h <= 0.0F) {
      continue;
    }

    result.push_back({ToPixelBox(faces.at<float>(i, 0), faces.at<float>(i, 1), w, h), confidence});
  }
  return result;
}

auto DnnFaceLocator::ParseSsdDetections(const cv::Mat& output, int frame_width, int frame_height) const
    -> std::vector<FaceDetection> {
  std::vector<FaceDetection> faces;

  // Outputs come as [1, 1, N, 7], [1, N, 7] or [N, 7]
  cv::Mat detections;
  if (output.dims == 4 || output.dims == 3) {
    const int values = output.size[output.dims - 1];
    const int rows = static_cast<int>(output.total()) / std::max(values, 1);
    detections = cv::Mat(rows, values, CV_32F, const_cast<uchar*>(output.ptr())).clone();
  } else if (output.dims == 2) {
    detections = output;
  } else {
    FACEID_WARN("Unexpected output tensor format: dims={}, shape={}", output.dims, ShapeToString(output));
    return faces;
  }

  if (detections.empty() || detections.cols < kSsdValuesPerDetection) {
    FACEID_WARN("Invalid detections matrix: rows={}, cols={}", detections.rows, detections.cols);
    return faces;
  }

  const auto width = static_cast<float>(frame_width);
  const auto height = static_cast<float>(frame_height);
  for (int i = 0; i < detections.rows; ++i) {
    const float confidence = detections.at<float>(i, 2);
    if (confidence < config_.confidence_threshold) {
      continue;
    }

    const float x1 = detections.at<float>(i, 3);
    const float y1 = detections.at<float>(i, 4);
    const float x2 = detections.at<float>(i, 5);
    const float y2 = detections.at<float>(i, 6);
    if (x1 >= x2 || y1 >= y2) {
      continue;
    }

    faces.push_back({ToPixelBox(x1 * width, y1 * height, (x2 - x1) * width, (y2 - y1) * height), confidence});
  }

  if (faces.size() > 1 && config_.nms_threshold > 0.0F) {
    std::vector<cv::Rect> boxes;
    std::vector<float> scores;
    boxes.reserve(faces.size());
    scores.reserve(faces.size());
    for (const auto& face : faces) {
      boxes.emplace_back(face.box.left, face.box.top, face.box.width, face.box.height);
      scores.push_back(face.confidence);
    }

    std::vector<int> indices;
    cv::dnn::NMSBoxes(boxes, scores, config_.confidence_threshold, config_.nms_threshold, indices);

    // NMSBoxes returns indices by score; keep the detector order
    std::ranges::sort(indices);
    std::vector<FaceDetection> kept;
    kept.reserve(indices.size());
    for (const int index : indices) {
      kept.push_back(faces[static_cast<size_t>(index)]);
    }
    faces = std::move(kept);
  }

  return faces;
}

}  // namespace faceid
