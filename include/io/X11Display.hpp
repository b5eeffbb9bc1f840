#pragma once
/** @file  X11Display.hpp
 *  @brief Shared RAII handle to the X server connection used by the X11 adapters.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>
#include <mutex>
#include <string>

// X11 header (opaque forward decl keeps Xlib macros out of core headers)
struct _XDisplay;

namespace autopilot {
  namespace io {

    /**
 * @class X11Display
 * @brief Owns one `Display*`; capture and input channels share it via shared_ptr.
 *
 *  * Xlib is not thread-safe per connection, so every user takes `mutex()`.
 *  * Throws `core::ConfigurationError` if the display cannot be opened.
 */
    class X11Display {
    public:
      /// @param name  display string, empty → $DISPLAY
      explicit X11Display(const std::string& name = {});
      ~X11Display();

      _XDisplay* get() const { return dpy_; }
      std::mutex& mutex() { return mtx_; }

      X11Display(const X11Display&) = delete;
      X11Display& operator=(const X11Display&) = delete;

    private:
      _XDisplay* dpy_{ nullptr };
      std::mutex mtx_;
    };

  } // namespace io
} // namespace autopilot
