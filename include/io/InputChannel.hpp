#pragma once
/** @file  InputChannel.hpp
 *  @brief One synthetic keyboard delivery mechanism.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace autopilot {
  namespace io {

    enum class Key : std::uint8_t { Control, Return, Slash };

    inline const char* toString(Key k) {
      switch (k) {
      case Key::Control:
        return "Ctrl";
      case Key::Return:
        return "Enter";
      case Key::Slash:
        return "/";
      default:
        return "?";
      }
    }

    /**
 * @class InputChannel
 * @brief Delivers key chords and text to whatever window has focus.
 *
 *  * Every call returns false on failure instead of throwing, so the
 *    ActionEmitter can fall back to the next channel.
 *  * Non-copyable; owned by the emitter through unique_ptr.
 */
    class InputChannel {
    public:
      InputChannel() = default;
      virtual ~InputChannel() = default;

      //---public API-------------------------------------------
      virtual const char* name() const = 0;

      /// Press \p keys in order, wait \p hold between steps, release in reverse.
      virtual bool pressChord(const std::vector<Key>& keys, std::chrono::milliseconds hold) = 0;

      virtual bool tapKey(Key key) = 0;

      /// Type printable ASCII text into the focused window.
      virtual bool typeText(const std::string& text) = 0;

      //---non-copyable-----------------------------------------
      InputChannel(const InputChannel&) = delete;
      InputChannel& operator=(const InputChannel&) = delete;
    };

  } // namespace io
} // namespace autopilot
