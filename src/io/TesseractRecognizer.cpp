/* @file TesseractRecognizer.cpp
 * @brief Image -> Pix, upscale + contrast, Tesseract page segmentation per profile
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstring>

// OCR headers
#include <leptonica/allheaders.h>
#include <tesseract/baseapi.h>

// Autopilot headers
#include "core/Errors.hpp"
#include "io/TesseractRecognizer.hpp"

using namespace autopilot::io;
using autopilot::core::RecognitionError;

namespace {

  /// Owns a Pix until scope exit.
  struct PixGuard {
    Pix* pix{ nullptr };
    ~PixGuard() {
      if (pix)
        pixDestroy(&pix);
    }
  };

  tesseract::PageSegMode toPageSegMode(OcrProfile p) {
    switch (p) {
    case OcrProfile::SingleLine:
      return tesseract::PSM_SINGLE_LINE;
    case OcrProfile::Block:
      return tesseract::PSM_SINGLE_BLOCK;
    case OcrProfile::Auto:
    default:
      return tesseract::PSM_AUTO;
    }
  }

  Pix* toPix(const autopilot::io::Image& img) {
    Pix* pix = pixCreate(img.width, img.height, 8);
    if (!pix)
      return nullptr;
    for (int y = 0; y < img.height; ++y) {
      const auto* row = img.pixels.data() + static_cast<std::size_t>(y) * img.width;
      for (int x = 0; x < img.width; ++x)
        pixSetPixel(pix, x, y, row[x]);
    }
    return pix;
  }

} // namespace

TesseractRecognizer::TesseractRecognizer(TesseractOptions opts)
    : opts_(std::move(opts)), api_(std::make_unique<tesseract::TessBaseAPI>()) {
  if (opts_.scale < 1)
    opts_.scale = 1;

  const char* datapath = opts_.tessdataDir.empty() ? nullptr : opts_.tessdataDir.c_str();
  if (api_->Init(datapath, opts_.language.c_str(), tesseract::OEM_DEFAULT) != 0)
    throw RecognitionError("[TesseractRecognizer] could not initialise tesseract for language '" +
                           opts_.language + "'");
}

TesseractRecognizer::~TesseractRecognizer() {
  if (api_)
    api_->End();
}

std::string TesseractRecognizer::recognize(const Image& image, OcrProfile profile) {
  if (image.empty() ||
      image.pixels.size() < static_cast<std::size_t>(image.width) * image.height)
    throw RecognitionError("[TesseractRecognizer] empty or truncated image");

  PixGuard gray{ toPix(image) };
  if (!gray.pix)
    throw RecognitionError("[TesseractRecognizer] pixCreate failed");

  PixGuard scaled{ opts_.scale > 1
                       ? pixScaleGrayLI(gray.pix, static_cast<l_float32>(opts_.scale),
                                        static_cast<l_float32>(opts_.scale))
                       : pixClone(gray.pix) };
  if (!scaled.pix)
    throw RecognitionError("[TesseractRecognizer] upscale failed");

  // stretch contrast in place: enhance 0.7, gamma 1.0, full 0..255 range
  pixContrastTRC(scaled.pix, scaled.pix, 0.7f);

  std::lock_guard<std::mutex> lock(mtx_);
  api_->SetPageSegMode(toPageSegMode(profile));
  api_->SetImage(scaled.pix);

  char* out = api_->GetUTF8Text();
  if (!out)
    throw RecognitionError(std::string("[TesseractRecognizer] recognition failed (") +
                           toString(profile) + ")");
  std::string text{ out, std::strlen(out) };
  delete[] out;
  api_->Clear();
  return text;
}
