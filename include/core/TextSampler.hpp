#pragma once
/** @file  TextSampler.hpp
 *  @brief One capture + OCR pass over the watched region.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "core/ErrorMonitor.hpp"
#include "io/ScreenCapture.hpp"
#include "io/TextRecognizer.hpp"

namespace autopilot {
  namespace core {

    class Logger;

    /**
 * @class TextSampler
 * @brief Grabs the region and runs the recognizer under each profile until one yields text.
 *
 *  * Output is lowercased and trimmed; empty string means "no text this tick".
 *  * Capture/recognition failures are reported to the ErrorMonitor and swallowed.
 *  * Blocking: a hung recognizer stalls the caller (no timeout available upstream).
 */
    class TextSampler {
    public:
      TextSampler(io::ScreenCapture& capture, io::TextRecognizer& recognizer, Logger& logger,
                  std::shared_ptr<ErrorMonitor> errMonitor, io::Region region,
                  std::vector<io::OcrProfile> profiles = { io::OcrProfile::SingleLine,
                                                           io::OcrProfile::Block,
                                                           io::OcrProfile::Auto });

      std::string sample();

      /// Upper bound on remembered texts before the history is dropped.
      static constexpr std::size_t kMaxTrackedTexts = 256;
      /// Prefix of every failure this sampler reports.
      static constexpr std::string_view kFailureSource{ "[TextSampler]" };

      const io::Region& region() const { return region_; }
      std::size_t distinctTexts() const { return seen_.size(); }

    private:
      void announce(const std::string& text);

      io::ScreenCapture& capture_;
      io::TextRecognizer& recognizer_;
      Logger& logger_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      io::Region region_;
      std::vector<io::OcrProfile> profiles_;
      std::unordered_set<std::string> seen_; ///< texts already announced in the log
    };

  } // namespace core
} // namespace autopilot
