#include <peek/vision/tesseract_ocr_engine.hpp>
#include <peek/core/image.hpp>
#include <tesseract/baseapi.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace peek::vision {

using peek::core::Error;
using peek::core::ErrorCode;

namespace {

/// One initialised TessBaseAPI per thread and (datapath, language) pair.
/// Nothing is shared between threads, so a call that never returns only
/// holds its own thread's engine.
struct ThreadEngine {
  std::unique_ptr<tesseract::TessBaseAPI> api;
  std::string tessdata_path;
  std::string language;
};

bool init_api(tesseract::TessBaseAPI& api, const std::string& tessdata_path,
              const std::string& language) {
  const char* datapath = tessdata_path.empty() ? nullptr : tessdata_path.c_str();
  if (api.Init(datapath, language.c_str()) != 0) return false;
  api.SetPageSegMode(tesseract::PSM_AUTO);
  return true;
}

tesseract::TessBaseAPI* thread_api(const std::string& tessdata_path, const std::string& language) {
  thread_local ThreadEngine engine;
  if (engine.api && engine.tessdata_path == tessdata_path && engine.language == language) {
    return engine.api.get();
  }
  auto api = std::make_unique<tesseract::TessBaseAPI>();
  if (!init_api(*api, tessdata_path, language)) return nullptr;
  engine.api = std::move(api);
  engine.tessdata_path = tessdata_path;
  engine.language = language;
  return engine.api.get();
}

}  // namespace

struct TesseractOcrEngine::Impl {
  std::string tessdata_path;
  std::string language;
};

TesseractOcrEngine::TesseractOcrEngine(std::string tessdata_path, std::string language)
    : impl_(std::make_unique<Impl>(Impl{std::move(tessdata_path), std::move(language)})) {
  tesseract::TessBaseAPI check;
  if (!init_api(check, impl_->tessdata_path, impl_->language)) {
    throw std::runtime_error("TesseractOcrEngine: cannot load language data '" +
                             impl_->language + "'");
  }
  check.End();
}

TesseractOcrEngine::~TesseractOcrEngine() = default;

std::expected<std::string, Error> TesseractOcrEngine::recognize(
    const peek::core::DecodedImage& gray) const {
  if (gray.empty() || gray.format() != peek::core::PixelFormat::Gray8 || !gray.valid()) {
    return std::unexpected(Error{ErrorCode::DecodeError, "ocr: expected a Gray8 image"});
  }

  tesseract::TessBaseAPI* api = thread_api(impl_->tessdata_path, impl_->language);
  if (!api) {
    return std::unexpected(
        Error{ErrorCode::AnalyzerError, "ocr: cannot load language data '" + impl_->language + "'"});
  }
  api->SetImage(reinterpret_cast<const unsigned char*>(gray.data().data()),
                static_cast<int>(gray.width()), static_cast<int>(gray.height()), 1,
                static_cast<int>(gray.width()));
  std::unique_ptr<char[]> text(api->GetUTF8Text());
  api->Clear();
  if (!text) {
    return std::unexpected(Error{ErrorCode::AnalyzerError, "ocr: recognition failed"});
  }
  return std::string(text.get());
}

}  // namespace peek::vision
