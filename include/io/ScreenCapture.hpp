#pragma once
/** @file  ScreenCapture.hpp
 *  @brief Abstract screen-region grabber + the plain image it hands out.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace autopilot {
  namespace io {

    /// Screen rectangle in root-window pixels, right/bottom exclusive.
    struct Region {
      int left{ 0 };
      int top{ 0 };
      int right{ 0 };
      int bottom{ 0 };

      int width() const { return right - left; }
      int height() const { return bottom - top; }

      /// Normalises two arbitrary corners into a left/top/right/bottom box.
      static Region fromCorners(int x1, int y1, int x2, int y2) {
        return Region{ x1 < x2 ? x1 : x2, y1 < y2 ? y1 : y2, x1 < x2 ? x2 : x1, y1 < y2 ? y2 : y1 };
      }

      bool operator==(const Region&) const = default;
    };

    /// 8-bit grayscale, row-major, stride == width.
    struct Image {
      int width{ 0 };
      int height{ 0 };
      std::vector<std::uint8_t> pixels;

      bool empty() const { return width <= 0 || height <= 0 || pixels.empty(); }
    };

    /**
 * @class ScreenCapture
 * @brief Collaborator that grabs a region of the screen.
 *
 *  * `capture()` returns nullopt when the grab failed (logged by the caller).
 *  * Implementations may throw `core::RecognitionError` for hard failures.
 */
    class ScreenCapture {
    public:
      virtual ~ScreenCapture() = default;

      virtual std::optional<Image> capture(const Region& region) = 0;

      /// Current pointer position, used by interactive region selection.
      virtual std::optional<std::pair<int, int>> pointerPosition() = 0;
    };

  } // namespace io
} // namespace autopilot
