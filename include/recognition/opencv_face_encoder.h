#pragma once

#include "recognition/face_encoder.h"
#include <mutex>
#include <opencv2/core.hpp>
#include <opencv2/dnn.hpp>
#include <opencv2/objdetect.hpp>
#include <string>

/**
 * @brief IFaceEncoder backed by OpenCV DNN
 *
 * Detection uses YuNet (cv::FaceDetectorYN); each face is aligned on its
 * five landmarks to the 112x112 InsightFace template and passed through an
 * ONNX recognition model (SFace or ArcFace style). Embeddings are L2
 * normalized.
 *
 * Models are loaded on first use, so the service can start (and serve
 * vector based requests) without them. Inference is serialized by an
 * internal mutex since cv::dnn::Net is not reentrant.
 */
class OpenCVFaceEncoder : public IFaceEncoder {
public:
  struct Config {
    std::string detectorModelPath;   // face_detection_yunet_2023mar.onnx
    std::string recognizerModelPath; // face_recognition_sface_2021dec.onnx
    float scoreThreshold = 0.7f;
    float nmsThreshold = 0.3f;
    int topK = 5000;
  };

  explicit OpenCVFaceEncoder(Config config);

  std::vector<BoundingBox>
  detectFaces(const std::vector<unsigned char> &image) override;

  std::optional<std::vector<float>>
  encodeFace(const std::vector<unsigned char> &image,
             const BoundingBox &box) override;

  std::vector<EncodedFace>
  encodeAll(const std::vector<unsigned char> &image) override;

  std::string name() const override { return "opencv-yunet-sface"; }

  const Config &config() const { return config_; }

private:
  Config config_;
  std::mutex mutex_;
  cv::Ptr<cv::FaceDetectorYN> detector_;
  cv::dnn::Net recognizer_;
  bool loaded_ = false;

  /**
   * @brief Load both models once. Caller holds mutex_.
   * @throws EncodingFailedError if a model is missing or cannot be loaded
   */
  void ensureLoaded();

  /**
   * @brief YuNet rows (x, y, w, h, 5 landmarks, score). Caller holds mutex_.
   */
  cv::Mat detect(const cv::Mat &image);

  /**
   * @brief Caller holds mutex_.
   */
  std::optional<std::vector<float>> embed(const cv::Mat &alignedFace);

  static cv::Mat decode(const std::vector<unsigned char> &image);
  static BoundingBox toBox(const cv::Mat &faces, int row, const cv::Size &size);
  static cv::Mat alignFace(const cv::Mat &image, const cv::Mat &faces,
                           int row);
  static cv::Mat cropFace(const cv::Mat &image, const BoundingBox &box);
  static double overlap(const BoundingBox &a, const BoundingBox &b);
};
