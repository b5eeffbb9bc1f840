/* @file X11InputChannels.cpp
 * @brief XTest fake-key and XSendEvent key delivery
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <thread>
#include <utility>

// X11 headers
#include <X11/XKBlib.h>
#include <X11/Xlib.h>
#include <X11/extensions/XTest.h>
#include <X11/keysym.h>

// Autopilot headers
#include "core/Errors.hpp"
#include "io/X11InputChannels.hpp"

using namespace autopilot::io;

namespace {

  KeySym toKeysym(Key k) {
    switch (k) {
    case Key::Control:
      return XK_Control_L;
    case Key::Return:
      return XK_Return;
    case Key::Slash:
      return XK_slash;
    default:
      return NoSymbol;
    }
  }

  // printable ASCII maps 1:1 onto Latin-1 keysyms
  KeySym charToKeysym(char c) {
    if (c == '\n')
      return XK_Return;
    if (c == '\t')
      return XK_Tab;
    const auto u = static_cast<unsigned char>(c);
    if (u >= 0x20 && u < 0x7f)
      return static_cast<KeySym>(u);
    return NoSymbol;
  }

  /// keycode for \p ks plus whether Shift is required to produce it; keycode 0 = unmapped
  std::pair<KeyCode, bool> lookup(Display* dpy, KeySym ks) {
    const KeyCode kc = XKeysymToKeycode(dpy, ks);
    if (kc == 0)
      return { 0, false };
    if (XkbKeycodeToKeysym(dpy, kc, 0, 0) == ks)
      return { kc, false };
    return { kc, XkbKeycodeToKeysym(dpy, kc, 0, 1) == ks };
  }

  void sleepFor(std::chrono::milliseconds d) {
    if (d.count() > 0)
      std::this_thread::sleep_for(d);
  }

} // namespace

//---XTest----------------------------------------------------------------------

XTestInputChannel::XTestInputChannel(std::shared_ptr<X11Display> display)
    : display_(std::move(display)) {
  assert(display_ && "[XTestInputChannel] display is nullptr");
  int ev = 0, err = 0, major = 0, minor = 0;
  if (!XTestQueryExtension(display_->get(), &ev, &err, &major, &minor))
    throw autopilot::core::ConfigurationError("[XTestInputChannel] XTEST extension not available");
}

bool XTestInputChannel::sendKeysym(unsigned long keysym, bool press) {
  Display* dpy = display_->get();
  const KeyCode kc = XKeysymToKeycode(dpy, static_cast<KeySym>(keysym));
  if (kc == 0)
    return false;
  if (!XTestFakeKeyEvent(dpy, kc, press ? True : False, CurrentTime))
    return false;
  XFlush(dpy);
  return true;
}

bool XTestInputChannel::pressChord(const std::vector<Key>& keys, std::chrono::milliseconds hold) {
  std::lock_guard<std::mutex> lock(display_->mutex());

  std::size_t pressed = 0;
  bool ok = true;
  for (auto k : keys) {
    if (!sendKeysym(toKeysym(k), true)) {
      ok = false;
      break;
    }
    ++pressed;
    sleepFor(hold);
  }
  // release whatever went down, last first, even after a failure
  while (pressed > 0)
    ok = sendKeysym(toKeysym(keys[--pressed]), false) && ok;
  XSync(display_->get(), False);
  return ok;
}

bool XTestInputChannel::tapKey(Key key) {
  std::lock_guard<std::mutex> lock(display_->mutex());
  const bool ok = sendKeysym(toKeysym(key), true) && sendKeysym(toKeysym(key), false);
  XSync(display_->get(), False);
  return ok;
}

bool XTestInputChannel::typeChar(char c) {
  Display* dpy = display_->get();
  const KeySym ks = charToKeysym(c);
  if (ks == NoSymbol)
    return false;
  const auto [kc, shift] = lookup(dpy, ks);
  if (kc == 0)
    return false;

  const KeyCode shiftKc = XKeysymToKeycode(dpy, XK_Shift_L);
  if (shift)
    XTestFakeKeyEvent(dpy, shiftKc, True, CurrentTime);
  XTestFakeKeyEvent(dpy, kc, True, CurrentTime);
  XTestFakeKeyEvent(dpy, kc, False, CurrentTime);
  if (shift)
    XTestFakeKeyEvent(dpy, shiftKc, False, CurrentTime);
  XFlush(dpy);
  return true;
}

bool XTestInputChannel::typeText(const std::string& text) {
  std::lock_guard<std::mutex> lock(display_->mutex());
  for (char c : text) {
    if (!typeChar(c))
      return false;
    sleepFor(std::chrono::milliseconds{ 5 });
  }
  XSync(display_->get(), False);
  return true;
}

//---XSendEvent-----------------------------------------------------------------

XSendEventInputChannel::XSendEventInputChannel(std::shared_ptr<X11Display> display)
    : display_(std::move(display)) {
  assert(display_ && "[XSendEventInputChannel] display is nullptr");
}

bool XSendEventInputChannel::sendKey(unsigned long keysym, unsigned int modifiers) {
  Display* dpy = display_->get();

  Window focus = 0;
  int revert = 0;
  XGetInputFocus(dpy, &focus, &revert);
  if (focus == None || focus == PointerRoot)
    return false;

  const auto [kc, shift] = lookup(dpy, static_cast<KeySym>(keysym));
  if (kc == 0)
    return false;

  XEvent ev{};
  ev.xkey.display = dpy;
  ev.xkey.window = focus;
  ev.xkey.root = DefaultRootWindow(dpy);
  ev.xkey.subwindow = None;
  ev.xkey.time = CurrentTime;
  ev.xkey.same_screen = True;
  ev.xkey.keycode = kc;
  ev.xkey.state = modifiers | (shift ? ShiftMask : 0u);

  ev.xkey.type = KeyPress;
  if (!XSendEvent(dpy, focus, True, KeyPressMask, &ev))
    return false;
  ev.xkey.type = KeyRelease;
  if (!XSendEvent(dpy, focus, True, KeyReleaseMask, &ev))
    return false;
  XFlush(dpy);
  return true;
}

bool XSendEventInputChannel::pressChord(const std::vector<Key>& keys,
                                        std::chrono::milliseconds hold) {
  if (keys.empty())
    return false;

  // everything but the last key is a modifier held through the final key
  unsigned int modifiers = 0;
  for (std::size_t i = 0; i + 1 < keys.size(); ++i) {
    if (keys[i] != Key::Control)
      return false;
    modifiers |= ControlMask;
  }

  sleepFor(hold);
  std::lock_guard<std::mutex> lock(display_->mutex());
  const bool ok = sendKey(toKeysym(keys.back()), modifiers);
  XSync(display_->get(), False);
  return ok;
}

bool XSendEventInputChannel::tapKey(Key key) {
  std::lock_guard<std::mutex> lock(display_->mutex());
  const bool ok = sendKey(toKeysym(key), 0);
  XSync(display_->get(), False);
  return ok;
}

bool XSendEventInputChannel::typeText(const std::string& text) {
  std::lock_guard<std::mutex> lock(display_->mutex());
  for (char c : text) {
    const KeySym ks = charToKeysym(c);
    if (ks == NoSymbol || !sendKey(ks, 0))
      return false;
  }
  XSync(display_->get(), False);
  return true;
}
