#pragma once
/** @file  X11InputChannels.hpp
 *  @brief Two independent X11 keyboard delivery mechanisms (XTest + XSendEvent).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <memory>

#include "io/InputChannel.hpp"
#include "io/X11Display.hpp"

namespace autopilot {
  namespace io {

    /**
 * @class XTestInputChannel
 * @brief Fakes hardware key events through the XTEST extension.
 *
 *  * Indistinguishable from a real keyboard for the target application.
 *  * Throws `core::ConfigurationError` if the server lacks XTEST.
 */
    class XTestInputChannel : public InputChannel {
    public:
      explicit XTestInputChannel(std::shared_ptr<X11Display> display);

      const char* name() const override { return "xtest"; }
      bool pressChord(const std::vector<Key>& keys, std::chrono::milliseconds hold) override;
      bool tapKey(Key key) override;
      bool typeText(const std::string& text) override;

    private:
      bool sendKeysym(unsigned long keysym, bool press);
      bool typeChar(char c);

      std::shared_ptr<X11Display> display_;
    };

    /**
 * @class XSendEventInputChannel
 * @brief Posts synthetic KeyPress/KeyRelease events straight to the focused window.
 *
 *  * Backup path for when XTEST events are swallowed (e.g. grabbed keyboard).
 *  * Some toolkits ignore events flagged `send_event`; that is why it is the second channel.
 */
    class XSendEventInputChannel : public InputChannel {
    public:
      explicit XSendEventInputChannel(std::shared_ptr<X11Display> display);

      const char* name() const override { return "xsendevent"; }
      bool pressChord(const std::vector<Key>& keys, std::chrono::milliseconds hold) override;
      bool tapKey(Key key) override;
      bool typeText(const std::string& text) override;

    private:
      bool sendKey(unsigned long keysym, unsigned int modifiers);

      std::shared_ptr<X11Display> display_;
    };

  } // namespace io
} // namespace autopilot
