/* @file TextSampler.cpp
 * @brief capture → multi-profile OCR → first non-empty text
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <exception>

// Autopilot headers
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "core/TextSampler.hpp"
#include "core/TextUtil.hpp"

using namespace autopilot::core;

TextSampler::TextSampler(io::ScreenCapture& capture, io::TextRecognizer& recognizer,
                         Logger& logger, std::shared_ptr<ErrorMonitor> errMonitor,
                         io::Region region, std::vector<io::OcrProfile> profiles)
    : capture_(capture), recognizer_(recognizer), logger_(logger),
      errorMonitor_(std::move(errMonitor)), region_(region), profiles_(std::move(profiles)) {
  assert(errorMonitor_ && "[TextSampler] error monitor is nullptr");
}

std::string TextSampler::sample() {
  try {
    auto image = capture_.capture(region_);
    if (!image || image->empty()) {
      errorMonitor_->notifyFailure(std::string(kFailureSource) + " screenshot failed");
      return {};
    }

    std::string found;
    for (auto profile : profiles_) {
      found = toLowerCopy(trimCopy(recognizer_.recognize(*image, profile)));
      if (!found.empty())
        break;
    }
    // capture and every recognizer call went through
    errorMonitor_->recover(kFailureSource);
    if (!found.empty())
      announce(found);
    return found;
  } catch (const RecognitionError& e) {
    errorMonitor_->notifyFailure(std::string(kFailureSource) + " Error reading text: " + e.what());
  } catch (const std::exception& e) {
    errorMonitor_->notifyFailure(std::string(kFailureSource) +
                                 " Error reading text (unexpected): " + e.what());
  }
  return {};
}

void TextSampler::announce(const std::string& text) {
  if (seen_.count(text))
    return;
  if (seen_.size() >= kMaxTrackedTexts)
    seen_.clear(); // noisy OCR: start over rather than grow for the whole session
  seen_.insert(text);
  logger_.info("New text detected: '" + text + "'");
}
