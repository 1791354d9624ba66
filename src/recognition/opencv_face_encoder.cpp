#include "recognition/opencv_face_encoder.h"
#include "core/errors.h"
#include "core/logging_flags.h"
#include <algorithm>
#include <cfloat>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <plog/Log.h>

namespace {
const int kAlignedSize = 112;
const double kMinOverlap = 0.5;
} // namespace

OpenCVFaceEncoder::OpenCVFaceEncoder(Config config)
    : config_(std::move(config)) {}

void OpenCVFaceEncoder::ensureLoaded() {
  if (loaded_) {
    return;
  }

  for (const auto &path :
       {config_.detectorModelPath, config_.recognizerModelPath}) {
    if (path.empty() || !std::filesystem::exists(path)) {
      throw EncodingFailedError("Face model not found: '" + path + "'");
    }
  }

  try {
    detector_ = cv::FaceDetectorYN::create(
        config_.detectorModelPath, "", cv::Size(320, 320),
        config_.scoreThreshold, config_.nmsThreshold, config_.topK,
        cv::dnn::DNN_BACKEND_OPENCV, cv::dnn::DNN_TARGET_CPU);
    recognizer_ = cv::dnn::readNetFromONNX(config_.recognizerModelPath);
  } catch (const cv::Exception &e) {
    throw EncodingFailedError(std::string("Failed to load face models: ") +
                              e.what());
  }

  if (detector_.empty() || recognizer_.empty()) {
    throw EncodingFailedError("Failed to load face models");
  }
  recognizer_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
  recognizer_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);

  loaded_ = true;
  PLOG_INFO << "[OpenCVFaceEncoder] Loaded detector "
            << config_.detectorModelPath << " and recognizer "
            << config_.recognizerModelPath;
}

cv::Mat OpenCVFaceEncoder::decode(const std::vector<unsigned char> &image) {
  if (image.empty()) {
    throw InvalidImageError("Image data is empty");
  }
  cv::Mat mat = cv::imdecode(image, cv::IMREAD_COLOR);
  if (mat.empty()) {
    throw InvalidImageError("Failed to decode image data");
  }
  return mat;
}

cv::Mat OpenCVFaceEncoder::detect(const cv::Mat &image) {
  ensureLoaded();

  auto start = std::chrono::steady_clock::now();
  cv::Mat faces;
  try {
    detector_->setInputSize(image.size());
    detector_->detect(image, faces);
  } catch (const cv::Exception &e) {
    throw FaceDetectionError(std::string("Face detection failed: ") +
                              e.what());
  }

  if (isApiLoggingEnabled()) {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::steady_clock::now() - start)
                       .count();
    PLOG_DEBUG << "[OpenCVFaceEncoder] Detected " << faces.rows
               << " face(s) in " << image.cols << "x" << image.rows << " image ("
               << elapsed << "ms)";
  }
  return faces;
}

BoundingBox OpenCVFaceEncoder::toBox(const cv::Mat &faces, int row,
                                     const cv::Size &size) {
  int x = static_cast<int>(std::round(faces.at<float>(row, 0)));
  int y = static_cast<int>(std::round(faces.at<float>(row, 1)));
  int w = static_cast<int>(std::round(faces.at<float>(row, 2)));
  int h = static_cast<int>(std::round(faces.at<float>(row, 3)));

  BoundingBox box;
  box.left = std::clamp(x, 0, size.width);
  box.top = std::clamp(y, 0, size.height);
  box.right = std::clamp(x + w, 0, size.width);
  box.bottom = std::clamp(y + h, 0, size.height);
  return box;
}

double OpenCVFaceEncoder::overlap(const BoundingBox &a, const BoundingBox &b) {
  int left = std::max(a.left, b.left);
  int top = std::max(a.top, b.top);
  int right = std::min(a.right, b.right);
  int bottom = std::min(a.bottom, b.bottom);
  if (right <= left || bottom <= top) {
    return 0.0;
  }
  double inter = static_cast<double>(right - left) * (bottom - top);
  double areaA = static_cast<double>(a.width()) * a.height();
  double areaB = static_cast<double>(b.width()) * b.height();
  return inter / (areaA + areaB - inter);
}

// Similarity transform of the five YuNet landmarks
// (re, le, nose, rcm, lcm at columns 4..13) onto the InsightFace template.
cv::Mat OpenCVFaceEncoder::alignFace(const cv::Mat &image, const cv::Mat &faces,
                                     int row) {
  static const float kTemplate[5][2] = {{38.2946f, 51.6963f},
                                        {73.5318f, 51.5014f},
                                        {56.0252f, 71.7366f},
                                        {41.5493f, 92.3655f},
                                        {70.7299f, 92.2041f}};

  double src[5][2];
  double srcMean[2] = {0.0, 0.0};
  double dstMean[2] = {0.0, 0.0};
  for (int i = 0; i < 5; ++i) {
    src[i][0] = faces.at<float>(row, 4 + 2 * i);
    src[i][1] = faces.at<float>(row, 5 + 2 * i);
    srcMean[0] += src[i][0] / 5.0;
    srcMean[1] += src[i][1] / 5.0;
    dstMean[0] += kTemplate[i][0] / 5.0;
    dstMean[1] += kTemplate[i][1] / 5.0;
  }

  double A[2][2] = {{0.0, 0.0}, {0.0, 0.0}};
  double srcVar = 0.0;
  for (int i = 0; i < 5; ++i) {
    double sx = src[i][0] - srcMean[0];
    double sy = src[i][1] - srcMean[1];
    double dx = kTemplate[i][0] - dstMean[0];
    double dy = kTemplate[i][1] - dstMean[1];
    A[0][0] += dx * sx / 5.0;
    A[0][1] += dx * sy / 5.0;
    A[1][0] += dy * sx / 5.0;
    A[1][1] += dy * sy / 5.0;
    srcVar += (sx * sx + sy * sy) / 5.0;
  }

  cv::Mat covariance = (cv::Mat_<double>(2, 2) << A[0][0], A[0][1], A[1][0],
                        A[1][1]);
  cv::Mat s, u, vt;
  cv::SVD::compute(covariance, s, u, vt);

  double smax = std::max(s.at<double>(0), s.at<double>(1));
  if (srcVar <= 0.0 || s.at<double>(0) <= smax * 2 * FLT_MIN) {
    cv::Mat resized;
    cv::resize(image, resized, cv::Size(kAlignedSize, kAlignedSize));
    return resized;
  }

  double det = A[0][0] * A[1][1] - A[0][1] * A[1][0];
  double d[2] = {1.0, det < 0 ? -1.0 : 1.0};
  cv::Mat T = u * cv::Mat::diag(cv::Mat(cv::Vec2d(d[0], d[1]))) * vt;

  double scale =
      (s.at<double>(0) * d[0] + s.at<double>(1) * d[1]) / srcVar;
  double tx = dstMean[0] - scale * (T.at<double>(0, 0) * srcMean[0] +
                                    T.at<double>(0, 1) * srcMean[1]);
  double ty = dstMean[1] - scale * (T.at<double>(1, 0) * srcMean[0] +
                                    T.at<double>(1, 1) * srcMean[1]);

  cv::Mat transform = (cv::Mat_<double>(2, 3) << T.at<double>(0, 0) * scale,
                       T.at<double>(0, 1) * scale, tx,
                       T.at<double>(1, 0) * scale,
                       T.at<double>(1, 1) * scale, ty);

  cv::Mat aligned;
  cv::warpAffine(image, aligned, transform,
                 cv::Size(kAlignedSize, kAlignedSize), cv::INTER_LINEAR);
  return aligned;
}

cv::Mat OpenCVFaceEncoder::cropFace(const cv::Mat &image,
                                    const BoundingBox &box) {
  cv::Rect rect(box.left, box.top, box.width(), box.height());
  rect &= cv::Rect(0, 0, image.cols, image.rows);
  if (rect.width <= 0 || rect.height <= 0) {
    return cv::Mat();
  }
  cv::Mat resized;
  cv::resize(image(rect), resized, cv::Size(kAlignedSize, kAlignedSize));
  return resized;
}

std::optional<std::vector<float>>
OpenCVFaceEncoder::embed(const cv::Mat &alignedFace) {
  if (alignedFace.empty()) {
    return std::nullopt;
  }

  cv::Mat rgb;
  cv::cvtColor(alignedFace, rgb, cv::COLOR_BGR2RGB);

  cv::Mat blob;
  cv::dnn::blobFromImage(rgb, blob, 1.0 / 128.0, cv::Size(),
                         cv::Scalar(127.5, 127.5, 127.5), false, false,
                         CV_32F);

  std::vector<cv::Mat> outputs;
  try {
    recognizer_.setInput(blob);
    recognizer_.forward(outputs, recognizer_.getUnconnectedOutLayersNames());
  } catch (const cv::Exception &e) {
    PLOG_WARNING << "[OpenCVFaceEncoder] Recognizer forward failed: "
                 << e.what();
    return std::nullopt;
  }

  if (outputs.empty() || outputs[0].total() == 0) {
    return std::nullopt;
  }

  const cv::Mat &output = outputs[0];
  const float *data = output.ptr<float>();
  std::vector<float> embedding(data, data + output.total());

  double norm = 0.0;
  for (float v : embedding) {
    norm += static_cast<double>(v) * v;
  }
  norm = std::sqrt(norm);
  if (norm <= 1e-6) {
    return std::nullopt;
  }
  for (float &v : embedding) {
    v = static_cast<float>(v / norm);
  }
  return embedding;
}

std::vector<BoundingBox>
OpenCVFaceEncoder::detectFaces(const std::vector<unsigned char> &image) {
  cv::Mat mat = decode(image);

  std::lock_guard<std::mutex> lock(mutex_);
  cv::Mat faces = detect(mat);

  std::vector<BoundingBox> boxes;
  for (int row = 0; row < faces.rows; ++row) {
    boxes.push_back(toBox(faces, row, mat.size()));
  }
  return boxes;
}

std::optional<std::vector<float>>
OpenCVFaceEncoder::encodeFace(const std::vector<unsigned char> &image,
                              const BoundingBox &box) {
  cv::Mat mat = decode(image);

  std::lock_guard<std::mutex> lock(mutex_);
  cv::Mat faces = detect(mat);

  // Prefer the landmark-aligned detection that best overlaps the box.
  int bestRow = -1;
  double bestOverlap = kMinOverlap;
  for (int row = 0; row < faces.rows; ++row) {
    double o = overlap(box, toBox(faces, row, mat.size()));
    if (o >= bestOverlap) {
      bestOverlap = o;
      bestRow = row;
    }
  }

  if (bestRow >= 0) {
    return embed(alignFace(mat, faces, bestRow));
  }
  return embed(cropFace(mat, box));
}

std::vector<IFaceEncoder::EncodedFace>
OpenCVFaceEncoder::encodeAll(const std::vector<unsigned char> &image) {
  cv::Mat mat = decode(image);

  std::lock_guard<std::mutex> lock(mutex_);
  cv::Mat faces = detect(mat);

  std::vector<EncodedFace> encoded;
  for (int row = 0; row < faces.rows; ++row) {
    encoded.push_back(
        {toBox(faces, row, mat.size()), embed(alignFace(mat, faces, row))});
  }
  return encoded;
}
