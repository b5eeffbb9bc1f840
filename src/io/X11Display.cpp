/* @file X11Display.cpp
 * @brief XOpenDisplay / XCloseDisplay wrapper
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <iostream>

// X11 headers
#include <X11/Xlib.h>

// Autopilot headers
#include "core/Errors.hpp"
#include "io/X11Display.hpp"

using namespace autopilot::io;

namespace {

  // Xlib's default handler exits the process; a stale focus window or an
  // unlucky grab must only fail the one request.
  int reportXError(Display* dpy, XErrorEvent* ev) {
    char text[256] = { 0 };
    XGetErrorText(dpy, ev->error_code, text, sizeof(text));
    std::cerr << "[X11Display] X error: " << text << " (request " << int(ev->request_code)
              << ")\n";
    return 0;
  }

} // namespace

X11Display::X11Display(const std::string& name) {
  dpy_ = XOpenDisplay(name.empty() ? nullptr : name.c_str());
  if (!dpy_)
    throw core::ConfigurationError("[X11Display] cannot open display " +
                                   (name.empty() ? std::string("$DISPLAY") : name));
  XSetErrorHandler(&reportXError);
}

X11Display::~X11Display() {
  if (dpy_)
    XCloseDisplay(dpy_);
  dpy_ = nullptr;
}
