#pragma once
/** @file  TextRecognizer.hpp
 *  @brief Abstract OCR collaborator.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include "io/ScreenCapture.hpp"

namespace autopilot {
  namespace io {

    /// Page-segmentation profiles, tried in this order by the sampler.
    enum class OcrProfile { SingleLine, Block, Auto };

    inline const char* toString(OcrProfile p) {
      switch (p) {
      case OcrProfile::SingleLine:
        return "single-line";
      case OcrProfile::Block:
        return "block";
      case OcrProfile::Auto:
        return "auto";
      default:
        return "unknown";
      }
    }

    class TextRecognizer {
    public:
      virtual ~TextRecognizer() = default;

      /// Raw recognised text (may be empty). Throws `core::RecognitionError` on engine failure.
      virtual std::string recognize(const Image& image, OcrProfile profile) = 0;
    };

  } // namespace io
} // namespace autopilot
