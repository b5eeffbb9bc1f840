/* @file main.cpp
 * @brief console front end: config, diagnostics, region selection, wiring, run
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <memory>
#include <string>
#include <vector>

// Linux headers
#include <unistd.h>

// Third-party headers
#include <nlohmann/json.hpp>

// Autopilot headers
#include "core/ActionEmitter.hpp"
#include "core/AutomationCoordinator.hpp"
#include "core/AutomationStateMachine.hpp"
#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "core/MetricsRecorder.hpp"
#include "core/Settings.hpp"
#include "core/StepIndex.hpp"
#include "core/StepResolver.hpp"
#include "core/TextSampler.hpp"
#include "io/ConsoleChannel.hpp"
#include "io/TesseractRecognizer.hpp"
#include "io/X11Display.hpp"
#include "io/X11InputChannels.hpp"
#include "io/X11ScreenCapture.hpp"
#include "ui/StatusPanel.hpp"

using namespace autopilot;

namespace {

  struct CommandLine {
    std::string configPath;
    std::string stepsFile;
  };

  void usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [--config <file>] [steps_file]\n";
  }

  /// Returns false on malformed arguments.
  bool parseArgs(int argc, char** argv, CommandLine& out) {
    for (int i = 1; i < argc; ++i) {
      const std::string arg{ argv[i] };
      if (arg == "--config") {
        if (i + 1 >= argc)
          return false;
        out.configPath = argv[++i];
      } else if (arg == "-h" || arg == "--help") {
        return false;
      } else if (out.stepsFile.empty() && !arg.starts_with("-")) {
        out.stepsFile = arg;
      } else {
        return false;
      }
    }
    return true;
  }

  core::Settings loadSettings(const CommandLine& cli) {
    core::Settings settings;
    if (!cli.configPath.empty())
      settings = core::Settings::fromJson(core::ConfigLoader(cli.configPath).load());
    if (!cli.stepsFile.empty())
      settings.stepsFile = cli.stepsFile;
    return settings;
  }

  void printDiagnostics(const core::DocumentDiagnostics& d) {
    std::cout << "\nProject Steps File Diagnostics:\n"
              << "  Sections (##):      " << (d.hasSections ? "yes" : "no") << '\n'
              << "  Subsections (###):  " << (d.hasSubsections ? "yes" : "no") << '\n'
              << "  Total steps:        " << d.totalSteps << '\n'
              << "  Completed (" << core::kCompleteGlyph << "):      " << d.completed << '\n'
              << "  In progress (" << core::kInProgressGlyph << "):   " << d.inProgress << '\n'
              << "  Incomplete (" << core::kIncompleteGlyph << "):    " << d.incomplete << '\n';
    for (const auto& w : d.warnings)
      std::cout << "  warning: " << w << '\n';
    for (const auto& i : d.issues)
      std::cout << "  issue: " << i << '\n';
  }

  bool waitForEnter(const std::string& prompt) {
    std::cout << prompt << std::flush;
    std::string ignored;
    return static_cast<bool>(std::getline(std::cin, ignored));
  }

  /// Asks the operator to point at two corners until a usable region comes back.
  std::optional<io::Region> selectRegion(io::ScreenCapture& capture,
                                         const core::Settings& settings) {
    std::cout << "\nSelect the region that shows the assistant's buttons.\n";
    while (true) {
      if (!waitForEnter("Move the mouse to the TOP-LEFT corner and press Enter..."))
        return std::nullopt;
      const auto a = capture.pointerPosition();
      if (!waitForEnter("Move the mouse to the BOTTOM-RIGHT corner and press Enter..."))
        return std::nullopt;
      const auto b = capture.pointerPosition();

      if (!a || !b) {
        std::cout << "Could not read the pointer position, try again.\n";
        continue;
      }

      const auto region = io::Region::fromCorners(a->first, a->second, b->first, b->second);
      try {
        core::validateRegion(region, settings.minRegionWidth, settings.minRegionHeight);
        std::cout << "Selected region: (" << region.left << ", " << region.top << ") - ("
                  << region.right << ", " << region.bottom << ")\n";
        return region;
      } catch (const core::ConfigurationError& e) {
        std::cout << e.what() << "\nPlease select again.\n";
      }
    }
  }

  int runAutopilot(const core::Settings& settings) {
    // ---- checklist sanity ------------------------------------------------
    const auto diag = core::diagnoseDocument(core::readDocument(settings.stepsFile));
    printDiagnostics(diag);
    if (!diag.ok()) {
      std::cerr << "\nPlease fix the issues in " << settings.stepsFile << " before starting.\n";
      return 1;
    }
    if (const auto step = core::StepResolver::resolve(
            core::parseDocument(core::readDocument(settings.stepsFile))))
      std::cout << "\nCurrent step: " << step->joined() << '\n';

    // ---- logging + fault fan-in -----------------------------------------
    // echo goes to stderr, so it survives the panel redraws on stdout
    core::Logger logger{ settings.logDir, true };
    logger.startNewRun();

    auto errorMonitor = std::make_shared<core::ErrorMonitor>();

    // ---- X11 + OCR adapters ---------------------------------------------
    auto display = std::make_shared<io::X11Display>();
    io::X11ScreenCapture capture{ display };
    io::TesseractRecognizer recognizer{ io::TesseractOptions{
        settings.ocrLanguage, settings.tessdataDir, settings.ocrScale } };

    auto region = settings.region;
    if (!region)
      region = selectRegion(capture, settings);
    if (!region) {
      std::cerr << "No region selected.\n";
      logger.finishRun();
      return 1;
    }
    logger.info("Watching region (" + std::to_string(region->left) + ", " +
                std::to_string(region->top) + ") - (" + std::to_string(region->right) + ", " +
                std::to_string(region->bottom) + ")");

    std::vector<std::unique_ptr<io::InputChannel>> channels;
    channels.push_back(std::make_unique<io::XTestInputChannel>(display));
    channels.push_back(std::make_unique<io::XSendEventInputChannel>(display));
    core::KeyboardActionEmitter emitter{ std::move(channels), errorMonitor, settings.timing,
                                         settings.messages };

    // ---- engine ---------------------------------------------------------
    core::AutomationStateMachine machine{ emitter, logger, errorMonitor };
    core::TextSampler sampler{ capture, recognizer, logger, errorMonitor, *region };
    core::StepResolver resolver{ settings.stepsFile, settings.stepCheckInterval };
    core::MetricsRecorder metrics{
      settings.effectiveProjectName(),
      core::MetricsRecorder::defaultPath(settings.logDir, std::chrono::system_clock::now()),
      errorMonitor
    };

    core::AutomationCoordinator coordinator{ settings, machine, sampler, resolver,
                                             metrics,  logger,  errorMonitor };
    if (settings.statusPanel) {
      coordinator.setStatusSink([panel = ui::StatusPanel{}](const ui::StatusSnapshot& snap) {
        std::cout << ui::StatusPanel::kClearScreen << panel.render(snap) << std::flush;
      });
    }

    io::ConsoleChannel console;
    if (console.open(STDIN_FILENO, STDOUT_FILENO)) {
      coordinator.run(&console);
    } else {
      logger.warn("stdin unavailable, running without operator commands");
      coordinator.run();
    }

    std::cout << '\n' << metrics.report() << std::endl;
    logger.info("Automation stopped. Log: " + logger.currentFile());
    logger.finishRun();
    return 0;
  }

} // namespace

int main(int argc, char** argv) {
  CommandLine cli;
  if (!parseArgs(argc, argv, cli)) {
    usage(argv[0]);
    return 2;
  }

  try {
    return runAutopilot(loadSettings(cli));
  } catch (const core::DocumentReadError& e) {
    std::cerr << e.what() << '\n';
  } catch (const core::ConfigurationError& e) {
    std::cerr << "configuration error: " << e.what() << '\n';
  } catch (const std::exception& e) {
    std::cerr << "fatal: " << e.what() << '\n';
  }
  return 1;
}
