#include "docqa_core/extractors/image_extractor.hpp"

#include <memory>

#ifdef DOCQA_HAVE_TESSERACT
#include <leptonica/allheaders.h>
#include <tesseract/baseapi.h>
#endif

namespace docqa_core {

ImageExtractor::ImageExtractor(std::string ocr_language) : ocr_language_(std::move(ocr_language)) {}

bool ImageExtractor::can_handle(const fs::path& file_path) const {
  return has_extension(file_path, {".png", ".jpg", ".jpeg", ".tif", ".tiff", ".bmp"});
}

bool ImageExtractor::decoder_available() {
#ifdef DOCQA_HAVE_TESSERACT
  return true;
#else
  return false;
#endif
}

ExtractionResult ImageExtractor::extract_content(const fs::path& file_path) const {
#ifdef DOCQA_HAVE_TESSERACT
  // TessBaseAPI is not thread-safe; one engine per call.
  auto api = std::make_unique<tesseract::TessBaseAPI>();
  if (api->Init(nullptr, ocr_language_.c_str(), tesseract::OEM_LSTM_ONLY) != 0) {
    return ExtractionResult::failure(ExtractionStatus::DecoderUnavailable,
                                     "tesseract could not load language '" + ocr_language_ + "'");
  }

  Pix* image = pixRead(file_path.string().c_str());
  if (!image) {
    api->End();
    return ExtractionResult::failure(ExtractionStatus::Failed, "leptonica could not read the image");
  }

  api->SetImage(image);
  char* ocr_text = api->GetUTF8Text();
  std::string text = ocr_text ? std::string(ocr_text) : std::string();
  delete[] ocr_text;
  pixDestroy(&image);
  api->End();
  return ExtractionResult::success(std::move(text));
#else
  (void)file_path;
  return ExtractionResult::failure(ExtractionStatus::DecoderUnavailable, "built without tesseract");
#endif
}

}  // namespace docqa_core
