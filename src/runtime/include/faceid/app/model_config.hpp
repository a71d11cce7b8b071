#pragma once

#include <faceid/pch.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <system_error>

namespace faceid {

/**
 * @brief Enumeration of supported face detection models.
 */
enum class ModelType : uint8_t {
  kYuNetONNX,     ///< YuNet ONNX model (recommended).
  kResNet10Caffe  ///< ResNet10 SSD Caffe model.
};

[[nodiscard]] constexpr std::string_view ModelTypeToString(ModelType type) noexcept {
  switch (type) {
    case ModelType::kYuNetONNX:
      return "YuNet ONNX";
    case ModelType::kResNet10Caffe:
      return "ResNet10 Caffe";
  }
  return "Unknown";
}

/**
 * @brief Short command line / settings key of a model type.
 */
[[nodiscard]] constexpr std::string_view ModelTypeKey(ModelType type) noexcept {
  switch (type) {
    case ModelType::kYuNetONNX:
      return "yunet";
    case ModelType::kResNet10Caffe:
      return "resnet10";
  }
  return "yunet";
}

/**
 * @brief Parses a model key produced by ModelTypeKey.
 * @return Model type, or std::nullopt for an unknown key
 */
[[nodiscard]] constexpr auto ParseModelType(std::string_view key) noexcept -> std::optional<ModelType> {
  if (key == "yunet") {
    return ModelType::kYuNetONNX;
  }
  if (key == "resnet10") {
    return ModelType::kResNet10Caffe;
  }
  return std::nullopt;
}

/**
 * @brief Configuration for a face detection model.
 */
struct ModelConfig final {
  std::filesystem::path model_path;          ///< Path to the model file.
  std::filesystem::path config_path;         ///< Path to the config file (empty for ONNX).
  float confidence_threshold = 0.5F;         ///< Minimum confidence for detection (0.0-1.0).
  float nms_threshold = 0.4F;                ///< Non-maximum suppression threshold (0.0-1.0).
  int input_width = 320;                     ///< Model input width in pixels.
  int input_height = 320;                    ///< Model input height in pixels.
  bool swap_rb = true;                       ///< Swap Red and Blue channels.
  bool use_gpu = false;                      ///< Use GPU acceleration if available.
  ModelType type = ModelType::kYuNetONNX;    ///< Model type identifier.

  /**
   * @brief Creates a configuration for the YuNet ONNX model.
   * @details Needs a single ONNX file and runs through cv::FaceDetectorYN.
   * @param models_dir Base directory containing the models
   */
  [[nodiscard]] static ModelConfig YuNetONNX(std::string_view models_dir = "models") noexcept;

  /**
   * @brief Creates a configuration for the ResNet10 SSD Caffe model.
   * @details Needs both a .caffemodel and a .prototxt file.
   * @param models_dir Base directory containing the models
   */
  [[nodiscard]] static ModelConfig ResNet10Caffe(std::string_view models_dir = "models") noexcept;

  [[nodiscard]] static ModelConfig FromType(ModelType type, std::string_view models_dir = "models") noexcept;

  [[nodiscard]] static ModelConfig Default(std::string_view models_dir = "models") noexcept {
    return YuNetONNX(models_dir);
  }

  /**
   * @brief Validates that the model files exist.
   * @return True if all required model files exist.
   */
  [[nodiscard]] bool Validate() const noexcept;
};

inline ModelConfig ModelConfig::YuNetONNX(std::string_view models_dir) noexcept {
  ModelConfig config;
  config.model_path = std::filesystem::path(models_dir) / "face_detection_yunet_2023mar.onnx";
  config.input_width = 320;
  config.input_height = 320;
  config.type = ModelType::kYuNetONNX;
  return config;
}

inline ModelConfig ModelConfig::ResNet10Caffe(std::string_view models_dir) noexcept {
  ModelConfig config;
  config.model_path = std::filesystem::path(models_dir) / "res10_300x300_ssd_iter_140000.caffemodel";
  config.config_path = std::filesystem::path(models_dir) / "res10_300x300_ssd_deploy.prototxt";
  config.input_width = 300;
  config.input_height = 300;
  config.type = ModelType::kResNet10Caffe;
  return config;
}

inline ModelConfig ModelConfig::FromType(ModelType type, std::string_view models_dir) noexcept {
  switch (type) {
    case ModelType::kYuNetONNX:
      return YuNetONNX(models_dir);
    case ModelType::kResNet10Caffe:
      return ResNet10Caffe(models_dir);
  }
  return YuNetONNX(models_dir);
}

inline bool ModelConfig::Validate() const noexcept {
  std::error_code ec;
  if (!std::filesystem::exists(model_path, ec)) {
    return false;
  }

  // Caffe models also need their prototxt
  return config_path.empty() || std::filesystem::exists(config_path, ec);
}

}  // namespace faceid
