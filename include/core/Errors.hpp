#pragma once
/** @file  Errors.hpp
 *  @brief Exception taxonomy shared by the core and the io adapters.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <stdexcept>
#include <string>

namespace autopilot {
  namespace core {

    /// Checklist file missing or unreadable. Fatal at startup, skipped mid-run.
    class DocumentReadError : public std::runtime_error {
    public:
      explicit DocumentReadError(const std::string& what) : std::runtime_error(what) {}
    };

    /// Screen capture or OCR failed; the poll tick is treated as "no text".
    class RecognitionError : public std::runtime_error {
    public:
      explicit RecognitionError(const std::string& what) : std::runtime_error(what) {}
    };

    /// Synthetic input could not be delivered by any channel.
    class EmissionError : public std::runtime_error {
    public:
      explicit EmissionError(const std::string& what) : std::runtime_error(what) {}
    };

    /// Bad config value or an unusable screen region.
    class ConfigurationError : public std::runtime_error {
    public:
      explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
    };

  } // namespace core
} // namespace autopilot
