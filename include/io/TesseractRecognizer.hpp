#pragma once
/** @file  TesseractRecognizer.hpp
 *  @brief TextRecognizer backed by Tesseract, with Leptonica pre-processing.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>
#include <mutex>
#include <string>

#include "io/TextRecognizer.hpp"

namespace tesseract {
  class TessBaseAPI;
}

namespace autopilot {
  namespace io {

    struct TesseractOptions {
      std::string language{ "eng" };
      std::string tessdataDir; ///< empty → TESSDATA_PREFIX / compiled-in default
      int scale{ 3 };          ///< upscale factor before recognition
    };

    /**
 * @class TesseractRecognizer
 * @brief Upscales, contrast-stretches and OCRs a grayscale Image.
 *
 *  * One TessBaseAPI is initialised up front and reused for every call.
 *  * Throws `core::RecognitionError` from the ctor if the engine cannot load
 *    \p opts.language, and from `recognize()` if a page cannot be processed.
 */
    class TesseractRecognizer : public TextRecognizer {
    public:
      explicit TesseractRecognizer(TesseractOptions opts);
      ~TesseractRecognizer() override;

      std::string recognize(const Image& image, OcrProfile profile) override;

    private:
      TesseractOptions opts_;
      std::unique_ptr<tesseract::TessBaseAPI> api_;
      std::mutex mtx_;
    };

  } // namespace io
} // namespace autopilot
