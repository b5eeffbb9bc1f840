#pragma once
/** @file  Mocks.hpp
 *  @brief gmock doubles for the ErrorMonitor and the ActionEmitter seam.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <gmock/gmock.h>

#include "core/ActionEmitter.hpp"
#include "core/ErrorMonitor.hpp"

namespace autopilot {
  namespace test {

    class MockErrorMonitor : public autopilot::core::ErrorMonitor {
    public:
      MOCK_METHOD(void, notifyFailure, (const std::string&), (override));
    };

    class MockActionEmitter : public autopilot::core::ActionEmitter {
    public:
      MOCK_METHOD(void, emit, (autopilot::core::Action), (override));
    };

  } // namespace test
} // namespace autopilot
