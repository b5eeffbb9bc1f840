#pragma once
/** @file  X11ScreenCapture.hpp
 *  @brief ScreenCapture over XGetImage on the root window.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>

#include "io/ScreenCapture.hpp"
#include "io/X11Display.hpp"

namespace autopilot {
  namespace io {

    class X11ScreenCapture : public ScreenCapture {
    public:
      explicit X11ScreenCapture(std::shared_ptr<X11Display> display);

      /// Grayscale copy of \p region; nullopt if the region is off-screen or the grab fails.
      std::optional<Image> capture(const Region& region) override;

      std::optional<std::pair<int, int>> pointerPosition() override;

    private:
      std::shared_ptr<X11Display> display_;
    };

  } // namespace io
} // namespace autopilot
