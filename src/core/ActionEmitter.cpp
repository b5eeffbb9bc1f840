/* @file ActionEmitter.cpp
 * @brief redundant key-chord delivery + chat message typing
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <stdexcept>
#include <string>
#include <thread>

// Autopilot headers
#include "core/ActionEmitter.hpp"
#include "core/Errors.hpp"

using namespace autopilot::core;
using autopilot::io::Key;

KeyboardActionEmitter::KeyboardActionEmitter(std::vector<std::unique_ptr<io::InputChannel>> channels,
                                             std::shared_ptr<ErrorMonitor> errMonitor,
                                             EmitterTiming timing, EmitterMessages messages,
                                             Sleeper sleeper)
    : channels_(std::move(channels)), errorMonitor_(std::move(errMonitor)), timing_(timing),
      messages_(std::move(messages)), sleeper_(std::move(sleeper)) {
  assert(errorMonitor_ && "[ActionEmitter] error monitor is nullptr");
  if (channels_.empty())
    throw std::invalid_argument("[ActionEmitter] at least one input channel is required");
}

void KeyboardActionEmitter::emit(Action action) {
  switch (action) {
  case Action::Accept:
    pressAccept();
    break;
  case Action::ContinueImplementation:
    sendMessage(messages_.continueImplementation);
    break;
  case Action::NextStep:
    sendMessage(messages_.nextStep);
    break;
  }
}

void KeyboardActionEmitter::pressAccept() {
  pause(timing_.actionDelay);

  std::size_t delivered = 0;
  for (auto& ch : channels_) {
    if (ch->pressChord({ Key::Control, Key::Return }, timing_.keyHold)) {
      ++delivered;
    } else {
      errorMonitor_->notifyFailure(std::string("[ActionEmitter] channel ") + ch->name() +
                                   " failed to deliver Ctrl+Enter");
    }
    pause(timing_.keyHold);
  }

  if (delivered == 0)
    throw EmissionError("[ActionEmitter] Ctrl+Enter not delivered by any channel");
}

void KeyboardActionEmitter::sendMessage(const std::string& text) {
  pause(timing_.actionDelay);

  auto& primary = *channels_.front();
  if (!primary.pressChord({ Key::Control, Key::Slash }, timing_.keyHold))
    throw EmissionError(std::string("[ActionEmitter] ") + primary.name() +
                        ": Ctrl+/ (focus chat) failed");
  pause(timing_.typingPause);

  if (!primary.typeText(text))
    throw EmissionError(std::string("[ActionEmitter] ") + primary.name() + ": typing failed");
  pause(timing_.typingPause);

  if (!primary.tapKey(Key::Return))
    throw EmissionError(std::string("[ActionEmitter] ") + primary.name() + ": Enter failed");
}

void KeyboardActionEmitter::pause(std::chrono::milliseconds d) const {
  if (d.count() <= 0)
    return;
  if (sleeper_)
    sleeper_(d);
  else
    std::this_thread::sleep_for(d);
}
