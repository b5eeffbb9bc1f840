/* @file X11ScreenCapture.cpp
 * @brief root-window grab → 8-bit luma
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cassert>

// X11 headers
#include <X11/Xlib.h>
#include <X11/Xutil.h>

// Autopilot headers
#include "io/X11ScreenCapture.hpp"

using namespace autopilot::io;

namespace {

  // position of the lowest set bit, e.g. 0x00ff0000 → 16
  int shiftOf(unsigned long mask) {
    int shift = 0;
    while (mask && !(mask & 1ul)) {
      mask >>= 1;
      ++shift;
    }
    return shift;
  }

} // namespace

X11ScreenCapture::X11ScreenCapture(std::shared_ptr<X11Display> display)
    : display_(std::move(display)) {
  assert(display_ && "[X11ScreenCapture] display is nullptr");
}

std::optional<Image> X11ScreenCapture::capture(const Region& region) {
  if (region.width() <= 0 || region.height() <= 0)
    return std::nullopt;

  std::lock_guard<std::mutex> lock(display_->mutex());
  Display* dpy = display_->get();
  Window root = DefaultRootWindow(dpy);

  // XGetImage outside the root window is a BadMatch, which kills the client
  const int screen = DefaultScreen(dpy);
  const int left = region.left < 0 ? 0 : region.left;
  const int top = region.top < 0 ? 0 : region.top;
  const int right =
      region.right > DisplayWidth(dpy, screen) ? DisplayWidth(dpy, screen) : region.right;
  const int bottom =
      region.bottom > DisplayHeight(dpy, screen) ? DisplayHeight(dpy, screen) : region.bottom;
  if (right <= left || bottom <= top)
    return std::nullopt;

  XImage* img = XGetImage(dpy, root, left, top, static_cast<unsigned>(right - left),
                          static_cast<unsigned>(bottom - top), AllPlanes, ZPixmap);
  if (!img)
    return std::nullopt;

  const int rs = shiftOf(img->red_mask);
  const int gs = shiftOf(img->green_mask);
  const int bs = shiftOf(img->blue_mask);
  const unsigned long rmax = img->red_mask >> rs;
  const unsigned long gmax = img->green_mask >> gs;
  const unsigned long bmax = img->blue_mask >> bs;

  Image out;
  out.width = img->width;
  out.height = img->height;
  out.pixels.resize(static_cast<std::size_t>(out.width) * static_cast<std::size_t>(out.height));

  for (int y = 0; y < out.height; ++y) {
    for (int x = 0; x < out.width; ++x) {
      const unsigned long px = XGetPixel(img, x, y);
      const auto channel = [px](unsigned long mask, int shift, unsigned long max) {
        return max ? static_cast<unsigned>(((px & mask) >> shift) * 255 / max) : 0u;
      };
      const unsigned r = channel(img->red_mask, rs, rmax);
      const unsigned g = channel(img->green_mask, gs, gmax);
      const unsigned b = channel(img->blue_mask, bs, bmax);
      // ITU-R BT.601 luma, integer weights
      out.pixels[static_cast<std::size_t>(y) * out.width + x] =
          static_cast<std::uint8_t>((299 * r + 587 * g + 114 * b) / 1000);
    }
  }

  XDestroyImage(img);
  return out;
}

std::optional<std::pair<int, int>> X11ScreenCapture::pointerPosition() {
  std::lock_guard<std::mutex> lock(display_->mutex());
  Display* dpy = display_->get();

  Window rootRet = 0, childRet = 0;
  int rootX = 0, rootY = 0, winX = 0, winY = 0;
  unsigned int mask = 0;
  if (!XQueryPointer(dpy, DefaultRootWindow(dpy), &rootRet, &childRet, &rootX, &rootY, &winX,
                     &winY, &mask))
    return std::nullopt;
  return std::make_pair(rootX, rootY);
}
