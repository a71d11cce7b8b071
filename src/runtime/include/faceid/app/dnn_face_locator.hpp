#pragma once

#include <faceid/pch.hpp>

#include <faceid/app/face_data.hpp>
#include <faceid/app/face_locator.hpp>
#include <faceid/app/frame.hpp>
#include <faceid/app/model_config.hpp>

#include <opencv2/dnn.hpp>
#include <opencv2/objdetect.hpp>

#include <cstdint>
#include <expected>
#include <vector>

namespace faceid {

/**
 * @brief DNN-based face locator.
 * @details Runs YuNet through cv::FaceDetectorYN, or an SSD Caffe model through cv::dnn::Net.
 * Faces are returned in the order the detector reports them.
 */
class DnnFaceLocator final : public FaceLocator {
public:
  DnnFaceLocator() noexcept = default;
  DnnFaceLocator(const DnnFaceLocator&) = delete;
  DnnFaceLocator(DnnFaceLocator&&) noexcept = default;
  ~DnnFaceLocator() override = default;

  DnnFaceLocator& operator=(const DnnFaceLocator&) = delete;
  DnnFaceLocator& operator=(DnnFaceLocator&&) noexcept = default;

  /**
   * @brief Loads the model described by the configuration.
   * @param config Model configuration.
   * @return Expected void on success, or FaceLocatorError on failure.
   */
  [[nodiscard]] auto Initialize(const ModelConfig& config) -> std::expected<void, FaceLocatorError>;

  [[nodiscard]] auto Locate(const Frame& frame) -> std::expected<std::vector<FaceDetection>, FaceLocatorError> override;

  /**
   * @brief Sets the confidence threshold and updates the detector.
   * @param threshold New confidence threshold (0.0 - 1.0).
   */
  void SetConfidenceThreshold(float threshold) noexcept;

  [[nodiscard]] bool Initialized() const noexcept { return initialized_; }
  [[nodiscard]] const ModelConfig& Config() const noexcept { return config_; }

  [[nodiscard]] uint64_t ImagesProcessed() const noexcept { return images_processed_; }

private:
  [[nodiscard]] cv::Mat CreateBlob(const Frame& frame) const;

  /**
   * @brief Parses FaceDetectorYN output.
   * @details Rows are [x, y, w, h, 5 landmark pairs, score] in pixel coordinates.
   */
  [[nodiscard]] auto ParseYuNetDetections(const cv::Mat& faces) const -> std::vector<FaceDetection>;

  /**
   * @brief Parses SSD output rows [batch, class, score, x1, y1, x2, y2] with normalized coordinates.
   */
  [[nodiscard]] auto ParseSsdDetections(const cv::Mat& output, int frame_width, int frame_height) const
      -> std::vector<FaceDetection>;

  cv::dnn::Net net_;
  cv::Ptr<cv::FaceDetectorYN> yunet_detector_;
  ModelConfig config_;
  bool use_yunet_ = false;
  bool initialized_ = false;
  uint64_t images_processed_ = 0;
};

}  // namespace faceid
