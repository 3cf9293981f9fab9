#pragma once

#include <bubblegrade/vision/ocr_engine.hpp>
#include <memory>
#include <string>

namespace bubblegrade::vision {

/// Tesseract LSTM recognizer in single-line page segmentation mode.
/// One TessBaseAPI instance is shared; calls are serialized with a mutex.
class TesseractOcrEngine : public IOcrEngine {
 public:
  /// datapath: tessdata directory (empty = Tesseract default / TESSDATA_PREFIX).
  /// Throws std::runtime_error if the language data cannot be loaded.
  TesseractOcrEngine(const std::string& datapath, const std::string& language);
  ~TesseractOcrEngine() override;

  TesseractOcrEngine(const TesseractOcrEngine&) = delete;
  TesseractOcrEngine& operator=(const TesseractOcrEngine&) = delete;

  [[nodiscard]] std::expected<OcrOutput, bubblegrade::core::ScanFailure>
  recognize_line(const bubblegrade::core::Frame& gray) override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace bubblegrade::vision
