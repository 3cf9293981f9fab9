#include <bubblegrade/vision/tesseract_ocr_engine.hpp>
#include <bubblegrade/core/error.hpp>
#include <bubblegrade/core/frame.hpp>
#include <spdlog/spdlog.h>
#include <tesseract/baseapi.h>
#include <tesseract/resultiterator.h>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace bubblegrade::vision {

namespace bc = bubblegrade::core;

namespace {

struct TessTextDeleter {
  void operator()(char* text) const noexcept { delete[] text; }
};
using TessText = std::unique_ptr<char, TessTextDeleter>;

}  // namespace

struct TesseractOcrEngine::Impl {
  tesseract::TessBaseAPI api;
  std::mutex mutex;
};

TesseractOcrEngine::TesseractOcrEngine(const std::string& datapath, const std::string& language)
    : impl_(std::make_unique<Impl>()) {
  const char* path = datapath.empty() ? nullptr : datapath.c_str();
  if (impl_->api.Init(path, language.c_str(), tesseract::OEM_LSTM_ONLY) != 0) {
    throw std::runtime_error("TesseractOcrEngine: could not load language '" + language +
                             "' from " + (datapath.empty() ? "default tessdata" : datapath));
  }
  impl_->api.SetPageSegMode(tesseract::PSM_SINGLE_LINE);
  spdlog::info("tesseract {} initialized with language '{}'", tesseract::TessBaseAPI::Version(),
               language);
}

TesseractOcrEngine::~TesseractOcrEngine() {
  if (impl_) {
    impl_->api.End();
  }
}

std::expected<OcrOutput, bc::ScanFailure> TesseractOcrEngine::recognize_line(const bc::Frame& gray) {
  if (!gray.valid() || gray.format() != bc::PixelFormat::Grayscale8) {
    return std::unexpected(bc::make_failure(bc::PipelineError::InvalidFrame,
                                            "tesseract expects a non-empty Grayscale8 frame"));
  }

  std::lock_guard lock(impl_->mutex);
  auto& api = impl_->api;
  const int width = static_cast<int>(gray.width());
  const int height = static_cast<int>(gray.height());
  api.SetImage(reinterpret_cast<const unsigned char*>(gray.data().data()), width, height, 1,
               width);
  if (api.Recognize(nullptr) != 0) {
    api.Clear();
    return std::unexpected(bc::make_failure(bc::PipelineError::ExtractionError,
                                            "tesseract recognition failed"));
  }

  OcrOutput output;
  if (TessText text{api.GetUTF8Text()}) {
    output.text = text.get();
  }

  std::unique_ptr<tesseract::ResultIterator> it(api.GetIterator());
  if (it) {
    constexpr auto level = tesseract::RIL_WORD;
    do {
      TessText word{it->GetUTF8Text(level)};
      if (!word || *word == '\0') continue;
      output.tokens.push_back({word.get(), it->Confidence(level)});
    } while (it->Next(level));
  }
  api.Clear();
  return output;
}

}  // namespace bubblegrade::vision
