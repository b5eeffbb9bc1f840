// Autopilot-Prod headers
#include "core/CommandRegistry.hpp"
#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/MetricsRecorder.hpp"
#include "core/RingBuffer.hpp"
#include "core/Settings.hpp"
#include "core/StepIndex.hpp"
#include "core/StepResolver.hpp"
#include "core/TextClassifier.hpp"
#include "core/TextUtil.hpp"
#include "ui/StatusPanel.hpp"

// Autopilot-Fake headers
#include "Mocks.hpp"
#include "TempDir.hpp"

// 3rd-party headers
#include <nlohmann/json.hpp>

// STL headers
#include <filesystem>
#include <sstream>

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace autopilot::core;
using namespace autopilot::test;
using ::testing::HasSubstr;
using nlohmann::json;

namespace {

  const std::string kChecklist = "# Demo project\n"
                                 "\n"
                                 "## Setup\n"
                                 "- install deps ✓\n"
                                 "### Env\n"
                                 "- configure env 🔄\n"
                                 "- write config ❌\n"
                                 "## Build\n"
                                 "  - compile ❌  \n"
                                 "- notes without a marker\n";

} // namespace

//---StepIndex--------------------------------------------------------------------

TEST(step_index, collects_only_glyph_lines_with_headings) {
  const auto index = parseDocument(kChecklist);
  ASSERT_EQ(index.size(), 4u);

  EXPECT_EQ(index[0], (Step{ "Setup", "", "install deps", StepStatus::Complete, 3 }));
  EXPECT_EQ(index[1], (Step{ "Setup", "Env", "configure env", StepStatus::InProgress, 5 }));
  EXPECT_EQ(index[2], (Step{ "Setup", "Env", "write config", StepStatus::Incomplete, 6 }));
  // a new section clears the subsection
  EXPECT_EQ(index[3], (Step{ "Build", "", "compile", StepStatus::Incomplete, 8 }));
}

TEST(step_index, parsing_is_idempotent) {
  EXPECT_EQ(parseDocument(kChecklist), parseDocument(kChecklist));
}

TEST(step_index, in_progress_beats_incomplete_beats_complete) {
  const auto index = parseDocument("- both ✓ ❌\n- all three ✓ ❌ 🔄\n- done ✓\n");
  ASSERT_EQ(index.size(), 3u);
  EXPECT_EQ(index[0].status, StepStatus::Incomplete);
  EXPECT_EQ(index[1].status, StepStatus::InProgress);
  EXPECT_EQ(index[2].status, StepStatus::Complete);
  EXPECT_EQ(index[1].label, "all three");
}

TEST(step_index, document_without_headings_has_empty_sections) {
  const auto index = parseDocument("- lonely 🔄\n");
  ASSERT_EQ(index.size(), 1u);
  EXPECT_TRUE(index[0].section.empty());
  EXPECT_TRUE(index[0].subsection.empty());
  EXPECT_EQ(index[0].label, "lonely");
}

TEST(step_index, heading_with_glyph_is_heading_and_step) {
  const auto index = parseDocument("## Release ❌\n- tag ❌\n");
  ASSERT_EQ(index.size(), 2u);
  EXPECT_EQ(index[0].sourcePosition, 0u);
  EXPECT_EQ(index[1].section, index[0].section);
}

TEST(step_index, missing_file_throws_document_read_error) {
  TempDir dir;
  EXPECT_THROW(readDocument(dir.file("nope.md")), DocumentReadError);
}

TEST(step_index, reads_whole_file) {
  TempDir dir;
  const auto path = dir.write("steps.md", kChecklist);
  EXPECT_EQ(readDocument(path), kChecklist);
}

TEST(document_diagnostics, counts_and_accepts_valid_document) {
  const auto d = diagnoseDocument(kChecklist);
  EXPECT_TRUE(d.ok());
  EXPECT_TRUE(d.hasSections);
  EXPECT_TRUE(d.hasSubsections);
  EXPECT_EQ(d.totalSteps, 4u);
  EXPECT_EQ(d.completed, 1u);
  EXPECT_EQ(d.inProgress, 1u);
  EXPECT_EQ(d.incomplete, 2u);
  EXPECT_TRUE(d.warnings.empty());
}

TEST(document_diagnostics, flags_missing_sections_and_markers) {
  const auto d = diagnoseDocument("- only done ✓\n");
  EXPECT_FALSE(d.ok());
  EXPECT_EQ(d.issues.size(), 2u);
}

TEST(document_diagnostics, warns_on_multiple_in_progress) {
  const auto d = diagnoseDocument("## A\n- one 🔄\n- two 🔄\n");
  EXPECT_TRUE(d.ok());
  ASSERT_EQ(d.warnings.size(), 1u);
  EXPECT_THAT(d.warnings[0], HasSubstr("2"));
}

//---StepResolver-----------------------------------------------------------------

TEST(step_resolver, earliest_in_progress_wins) {
  const auto step = StepResolver::resolve(parseDocument(kChecklist));
  ASSERT_TRUE(step);
  EXPECT_EQ(step->path, (std::vector<std::string>{ "Setup", "Env", "configure env" }));
  EXPECT_EQ(step->joined(), "Setup > Env > configure env");
}

TEST(step_resolver, falls_back_to_earliest_incomplete) {
  const auto step = StepResolver::resolve(parseDocument("## A\n- a ✓\n- b ❌\n## B\n- c ❌\n"));
  ASSERT_TRUE(step);
  EXPECT_EQ(step->path, (std::vector<std::string>{ "A", "b" }));
}

TEST(step_resolver, tie_broken_by_position) {
  const auto step = StepResolver::resolve(parseDocument("## A\n- first 🔄\n- second 🔄\n"));
  ASSERT_TRUE(step);
  EXPECT_EQ(step->path.back(), "first");
}

TEST(step_resolver, all_complete_resolves_to_nothing) {
  EXPECT_FALSE(StepResolver::resolve(parseDocument("## A\n- a ✓\n- b ✓\n")));
  EXPECT_FALSE(StepResolver::resolve({}));
}

TEST(step_resolver, setup_configure_env_end_to_end) {
  TempDir dir;
  const auto path =
      dir.write("steps.md", "## Setup\n- install deps ✓\n- configure env 🔄\n- run tests ❌\n");

  StepResolver resolver{ path };
  ASSERT_EQ(resolver.refresh(StepResolver::Clock::now()), StepResolver::RefreshResult::Reparsed);
  ASSERT_TRUE(resolver.current());
  EXPECT_EQ(resolver.current()->path, (std::vector<std::string>{ "Setup", "configure env" }));
}

TEST(step_resolver, in_progress_beats_earlier_incomplete) {
  // incomplete on line 2, in-progress on line 5
  const auto step = StepResolver::resolve(parseDocument("## A\n\n- early ❌\n\n\n- later 🔄\n"));
  ASSERT_TRUE(step);
  EXPECT_EQ(step->path.back(), "later");
}

TEST(step_resolver, leading_glyph_document_resolves_setup_step) {
  const auto step =
      StepResolver::resolve(parseDocument("## Setup\n- 🔄 configure env\n## Build\n- ❌ compile"));
  ASSERT_TRUE(step);
  EXPECT_EQ(step->path, (std::vector<std::string>{ "Setup", "configure env" }));
}

class StepResolverCacheTest : public ::testing::Test {
protected:
  StepResolver makeResolver() {
    return StepResolver{ "steps.md", std::chrono::seconds{ 1 }, [this](const std::string&) {
                          ++reads;
                          if (fail)
                            throw DocumentReadError("gone");
                          return content;
                        } };
  }

  std::string content = kChecklist;
  bool fail = false;
  int reads = 0;
  StepResolver::Clock::time_point t0 = StepResolver::Clock::now();
};

TEST_F(StepResolverCacheTest, reads_at_most_once_per_interval) {
  auto resolver = makeResolver();
  EXPECT_EQ(resolver.refresh(t0), StepResolver::RefreshResult::Reparsed);
  EXPECT_EQ(resolver.refresh(t0 + std::chrono::milliseconds{ 500 }),
            StepResolver::RefreshResult::NotDue);
  EXPECT_EQ(reads, 1);

  EXPECT_EQ(resolver.refresh(t0 + std::chrono::seconds{ 1 }),
            StepResolver::RefreshResult::Unchanged);
  EXPECT_EQ(reads, 2);
}

TEST_F(StepResolverCacheTest, reparses_when_content_changes) {
  auto resolver = makeResolver();
  resolver.refresh(t0);
  content = "## Build\n- compile 🔄\n";
  EXPECT_EQ(resolver.refresh(t0 + std::chrono::seconds{ 2 }),
            StepResolver::RefreshResult::Reparsed);
  ASSERT_TRUE(resolver.current());
  EXPECT_EQ(resolver.current()->joined(), "Build > compile");
}

TEST_F(StepResolverCacheTest, read_failure_keeps_last_good_result) {
  auto resolver = makeResolver();
  resolver.refresh(t0);
  const auto before = resolver.current();

  fail = true;
  EXPECT_EQ(resolver.refresh(t0 + std::chrono::seconds{ 2 }),
            StepResolver::RefreshResult::ReadFailed);
  EXPECT_EQ(resolver.current(), before);
  EXPECT_EQ(resolver.lastError(), "gone");

  fail = false;
  EXPECT_EQ(resolver.refresh(t0 + std::chrono::seconds{ 4 }),
            StepResolver::RefreshResult::Unchanged);
  EXPECT_TRUE(resolver.lastError().empty());
}

//---TextClassifier---------------------------------------------------------------

TEST(text_classifier, every_phrase_maps_to_its_category) {
  for (auto p : kAcceptPhrases)
    EXPECT_EQ(classify(p).category, TextCategory::Accept) << p;
  for (auto p : kCompletedPhrases)
    EXPECT_EQ(classify(p).category, TextCategory::Completed) << p;
  for (auto p : kBusyPhrases)
    EXPECT_EQ(classify(p).category, TextCategory::Busy) << p;
  for (auto p : kDismissPhrases)
    EXPECT_EQ(classify(p).category, TextCategory::Dismiss) << p;
}

TEST(text_classifier, case_insensitive_substring_match) {
  EXPECT_EQ(classify("Run Command ⌘⏎").category, TextCategory::Accept);
  EXPECT_EQ(classify("Generating...").category, TextCategory::Busy);
  EXPECT_EQ(classify("  SKIP  ").category, TextCategory::Dismiss);
  EXPECT_EQ(classify("Task Finished").category, TextCategory::Completed);
}

TEST(text_classifier, reference_examples) {
  EXPECT_EQ(classify("Run Command").category, TextCategory::Accept);
  EXPECT_EQ(classify("Task completed successfully").category, TextCategory::Completed);
  EXPECT_EQ(classify("Generating response...").category, TextCategory::Busy);
  EXPECT_EQ(classify("xyz").category, TextCategory::Unknown);
}

TEST(text_classifier, unmatched_and_empty_are_unknown) {
  EXPECT_EQ(classify("").category, TextCategory::Unknown);
  EXPECT_EQ(classify("hello world").category, TextCategory::Unknown);
  EXPECT_EQ(classify("hello world").matchMask, 0);
}

TEST(text_classifier, records_every_matching_set) {
  const auto c = classify("accept all - done");
  EXPECT_EQ(c.category, TextCategory::Accept);
  EXPECT_TRUE(c.matches(TextCategory::Accept));
  EXPECT_TRUE(c.matches(TextCategory::Completed));
  EXPECT_FALSE(c.matches(TextCategory::Busy));
}

TEST(text_classifier, bare_command_word_is_accept) {
  // known misfire source: any mention of the word counts
  EXPECT_EQ(classify("this mentions a command").category, TextCategory::Accept);
}

//---TextUtil---------------------------------------------------------------------

TEST(text_util, counts_and_pads_code_points) {
  EXPECT_EQ(utf8Length("✓ab"), 3u);
  EXPECT_EQ(utf8Truncate("❌❌❌", 2), "❌❌");
  EXPECT_EQ(padRight("ab", 4), "ab  ");
  EXPECT_EQ(padRight("abcdef", 3), "abc");
  EXPECT_EQ(trimCopy("\t x \n"), "x");
  EXPECT_EQ(toLowerCopy("MiXeD ⌘"), "mixed ⌘");
}

//---RingBuffer-------------------------------------------------------------------

TEST(ring_buffer, rejects_when_full_and_pops_in_order) {
  RingBuffer<int> rb{ 2 };
  EXPECT_TRUE(rb.push(1));
  EXPECT_TRUE(rb.push(2));
  EXPECT_FALSE(rb.push(3));

  EXPECT_EQ(rb.popFor(std::chrono::milliseconds{ 1 }), 1);
  EXPECT_TRUE(rb.push(4));
  EXPECT_EQ(rb.popFor(std::chrono::milliseconds{ 1 }), 2);
  EXPECT_EQ(rb.popFor(std::chrono::milliseconds{ 1 }), 4);
  EXPECT_FALSE(rb.popFor(std::chrono::milliseconds{ 1 }));
  EXPECT_TRUE(rb.empty());
}

//---CommandRegistry--------------------------------------------------------------

TEST(command_registry, dispatches_word_and_trimmed_argument) {
  CommandRegistry reg;
  std::string got;
  ASSERT_TRUE(reg.registerCommand("step", [&](const std::string& arg) { got = arg; }));
  EXPECT_FALSE(reg.registerCommand("STEP", [](const std::string&) {}));

  EXPECT_TRUE(reg.dispatch("  STEP   Wire Up DB  "));
  EXPECT_EQ(got, "Wire Up DB");
  EXPECT_TRUE(reg.dispatch("step"));
  EXPECT_EQ(got, "");
}

TEST(command_registry, unknown_or_blank_lines_are_rejected) {
  CommandRegistry reg;
  reg.registerCommand("help", [](const std::string&) {});
  EXPECT_FALSE(reg.dispatch("nope"));
  EXPECT_FALSE(reg.dispatch("   "));
  EXPECT_FALSE(reg.dispatch(""));
}

TEST(command_registry, aliases_share_one_handler) {
  CommandRegistry reg;
  int calls = 0;
  EXPECT_TRUE(reg.registerAliases({ "stop", "exit", "quit" }, [&](const std::string&) { ++calls; }));
  EXPECT_TRUE(reg.dispatch("exit"));
  EXPECT_TRUE(reg.dispatch("Quit"));
  EXPECT_TRUE(reg.contains("STOP"));
  EXPECT_EQ(calls, 2);
}

//---ErrorMonitor-----------------------------------------------------------------

TEST(error_monitor, escalates_each_message_once) {
  ErrorMonitor monitor;
  std::vector<std::string> escalated;
  monitor.registerEscalation([&](const std::string& m) { escalated.push_back(m); });

  monitor.notifyFailure("ocr down");
  monitor.notifyFailure("ocr down");
  monitor.notifyFailure("capture failed");

  EXPECT_EQ(escalated, (std::vector<std::string>{ "ocr down", "capture failed" }));
  EXPECT_EQ(monitor.failureCount(), 3u);

  monitor.reset();
  monitor.notifyFailure("ocr down");
  EXPECT_EQ(escalated.size(), 3u);
}

TEST(error_monitor, recovered_source_escalates_again) {
  ErrorMonitor monitor;
  int logged = 0;
  monitor.registerEscalation([&](const std::string&) { ++logged; });

  for (int i = 0; i < 3; ++i)
    monitor.notifyFailure("[TextSampler] Error reading text: tesseract crashed");
  monitor.notifyFailure("Error parsing steps file: gone");
  EXPECT_EQ(logged, 2);

  monitor.recover("[TextSampler]");
  monitor.notifyFailure("[TextSampler] Error reading text: tesseract crashed");
  monitor.notifyFailure("Error parsing steps file: gone"); // other source still muted

  EXPECT_EQ(logged, 3);
  EXPECT_EQ(monitor.failureCount(), 6u);
}

//---MetricsRecorder--------------------------------------------------------------

class MetricsRecorderTest : public ::testing::Test {
protected:
  void SetUp() override {
    errorMonitor = std::make_shared<::testing::NiceMock<MockErrorMonitor>>();
    recorder = std::make_unique<MetricsRecorder>("demo", dir.file("metrics/m.json"),
                                                 errorMonitor, [this] { return now; });
  }

  void advance(int seconds) { now += std::chrono::seconds{ seconds }; }

  TempDir dir;
  std::chrono::system_clock::time_point now{ std::chrono::seconds{ 1'700'000'000 } };
  std::shared_ptr<::testing::NiceMock<MockErrorMonitor>> errorMonitor;
  std::unique_ptr<MetricsRecorder> recorder;
};

TEST_F(MetricsRecorderTest, start_closes_open_step_as_complete) {
  recorder->startStep("a");
  advance(10);
  recorder->startStep("b");

  const auto steps = recorder->steps();
  ASSERT_EQ(steps.size(), 2u);
  EXPECT_EQ(steps[0].status, StepStatus::Complete);
  EXPECT_DOUBLE_EQ(*steps[0].durationSeconds, 10.0);
  EXPECT_EQ(steps[1].status, StepStatus::InProgress);
  EXPECT_EQ(recorder->currentStep(), "b");
}

TEST_F(MetricsRecorderTest, end_without_open_step_is_noop) {
  recorder->endStep();
  EXPECT_TRUE(recorder->steps().empty());
  EXPECT_FALSE(std::filesystem::exists(recorder->metricsPath()));
}

TEST_F(MetricsRecorderTest, total_counts_only_recorded_durations_after_restart) {
  recorder->startStep("a");
  advance(10);
  recorder->startStep("b");
  advance(5);
  recorder->endStep();
  EXPECT_DOUBLE_EQ(recorder->totalDuration(), 15.0);

  // restarting "a" overwrites its entry in place
  advance(5);
  recorder->startStep("a");
  EXPECT_DOUBLE_EQ(recorder->totalDuration(), 5.0);
  advance(2);
  recorder->endStep(StepStatus::Incomplete);
  EXPECT_DOUBLE_EQ(recorder->totalDuration(), 7.0);

  const auto steps = recorder->steps();
  ASSERT_EQ(steps.size(), 2u);
  EXPECT_EQ(steps[0].name, "a");
  EXPECT_EQ(steps[0].status, StepStatus::Incomplete);
}

TEST_F(MetricsRecorderTest, open_step_is_excluded_from_total) {
  recorder->startStep("A");
  advance(3);
  recorder->endStep(StepStatus::Complete);
  advance(1);
  recorder->startStep("B");
  advance(7);
  EXPECT_DOUBLE_EQ(recorder->totalDuration(), 3.0);
}

TEST_F(MetricsRecorderTest, first_step_start_writes_snapshot) {
  EXPECT_FALSE(std::filesystem::exists(recorder->metricsPath()));
  recorder->startStep("Wire DB");

  ASSERT_TRUE(std::filesystem::exists(recorder->metricsPath()));
  const auto j = json::parse(slurp(recorder->metricsPath()));
  const auto& step = j["steps"]["Wire DB"];
  EXPECT_EQ(step["status"], "🔄");
  EXPECT_TRUE(step["end_time"].is_null());
  EXPECT_DOUBLE_EQ(j["total_duration"].get<double>(), 0.0);
}

TEST_F(MetricsRecorderTest, persists_json_on_every_transition) {
  recorder->startStep("Wire DB");
  recorder->updateCounts(3, 1);
  advance(4);
  recorder->endStep();

  const auto j = json::parse(slurp(recorder->metricsPath()));
  EXPECT_EQ(j["project_name"], "demo");
  EXPECT_DOUBLE_EQ(j["total_duration"].get<double>(), 4.0);
  const auto& step = j["steps"]["Wire DB"];
  EXPECT_EQ(step["step_name"], "Wire DB");
  EXPECT_EQ(step["status"], "✓");
  EXPECT_DOUBLE_EQ(step["duration"].get<double>(), 4.0);
  EXPECT_EQ(step["commands_executed"], 3);
  EXPECT_EQ(step["messages_sent"], 1);
  EXPECT_FALSE(step["end_time"].is_null());
}

TEST_F(MetricsRecorderTest, write_failure_goes_to_error_monitor) {
  const auto blocker = dir.write("blocker", "file, not a directory");
  MetricsRecorder bad{ "demo", blocker + "/m.json", errorMonitor, [this] { return now; } };

  // one failed write for the start, one for the end
  EXPECT_CALL(*errorMonitor, notifyFailure(HasSubstr("MetricsRecorder"))).Times(2);
  bad.startStep("x");
  EXPECT_NO_THROW(bad.endStep());
}

TEST_F(MetricsRecorderTest, report_lists_steps_and_total) {
  recorder->startStep("a");
  advance(10);
  recorder->startStep("b");

  const auto report = recorder->report();
  EXPECT_THAT(report, HasSubstr("Project: demo"));
  EXPECT_THAT(report, HasSubstr("10.0s"));
  EXPECT_THAT(report, HasSubstr("In Progress"));
  EXPECT_THAT(report, HasSubstr("Total Duration: 10.0 seconds"));
}

TEST(metrics_recorder, default_path_is_timestamped_under_log_dir) {
  const auto p = MetricsRecorder::defaultPath("logs", std::chrono::system_clock::now());
  EXPECT_THAT(p, ::testing::StartsWith("logs/project_metrics_"));
  EXPECT_THAT(p, ::testing::EndsWith(".json"));
  EXPECT_EQ(p.size(), std::string("logs/project_metrics_YYYYmmdd_HHMMSS.json").size());
}

//---Settings / ConfigLoader------------------------------------------------------

TEST(settings, empty_object_gives_defaults) {
  const auto s = Settings::fromJson(json::object());
  EXPECT_EQ(s.stepsFile, "project_steps.md");
  EXPECT_EQ(s.pollInterval, std::chrono::milliseconds{ 500 });
  EXPECT_EQ(s.stepCheckInterval, std::chrono::milliseconds{ 1000 });
  EXPECT_EQ(s.timing.actionDelay, std::chrono::milliseconds{ 500 });
  EXPECT_EQ(s.ocrScale, 3);
  EXPECT_FALSE(s.region);
  EXPECT_TRUE(s.statusPanel);
  EXPECT_EQ(s.effectiveProjectName(), "project_steps");
}

TEST(settings, overrides_and_normalises_region) {
  const auto s = Settings::fromJson(json{
      { "steps_file", "plans/roadmap.md" },
      { "poll_interval_ms", 250 },
      { "next_step_message", "go on" },
      { "region", { { "left", 300 }, { "top", 200 }, { "right", 100 }, { "bottom", 150 } } },
  });
  EXPECT_EQ(s.pollInterval, std::chrono::milliseconds{ 250 });
  EXPECT_EQ(s.messages.nextStep, "go on");
  EXPECT_EQ(s.effectiveProjectName(), "roadmap");
  ASSERT_TRUE(s.region);
  EXPECT_EQ(*s.region, (autopilot::io::Region{ 100, 150, 300, 200 }));
}

TEST(settings, rejects_bad_values) {
  EXPECT_THROW(Settings::fromJson(json{ { "poll_interval_ms", 0 } }), ConfigurationError);
  EXPECT_THROW(Settings::fromJson(json{ { "poll_interval_ms", "fast" } }), ConfigurationError);
  EXPECT_THROW(Settings::fromJson(json{ { "ocr_scale", 0 } }), ConfigurationError);
  EXPECT_THROW(Settings::fromJson(json::array()), ConfigurationError);
  EXPECT_THROW(Settings::fromJson(json{ { "region", { { "left", 0 },
                                                      { "top", 0 },
                                                      { "right", 5 },
                                                      { "bottom", 100 } } } }),
               ConfigurationError);
}

TEST(settings, validate_region_enforces_minimum) {
  EXPECT_NO_THROW(validateRegion({ 0, 0, 10, 5 }, 10, 5));
  EXPECT_THROW(validateRegion({ 0, 0, 9, 5 }, 10, 5), ConfigurationError);
  EXPECT_THROW(validateRegion({ 5, 5, 5, 5 }, 0, 0), ConfigurationError);
}

TEST(config_loader, loads_file_and_reports_errors) {
  TempDir dir;
  const auto good = dir.write("good.json", R"({ "project_name": "x", "status_panel": false })");
  const auto s = Settings::fromJson(ConfigLoader(good).load());
  EXPECT_EQ(s.projectName, "x");
  EXPECT_FALSE(s.statusPanel);

  EXPECT_THROW(ConfigLoader(dir.write("bad.json", "{ nope")).load(), ConfigurationError);
  EXPECT_THROW(ConfigLoader(dir.file("missing.json")).load(), ConfigurationError);
}

//---StatusPanel------------------------------------------------------------------

namespace {

  std::vector<std::string> lines(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in{ text };
    for (std::string l; std::getline(in, l);)
      out.push_back(l);
    return out;
  }

} // namespace

TEST(status_panel, formats_runtime) {
  EXPECT_EQ(autopilot::ui::StatusPanel::formatRuntime(std::chrono::seconds{ 3725 }), "01:02:05");
  EXPECT_EQ(autopilot::ui::StatusPanel::formatRuntime(std::chrono::seconds{ 0 }), "00:00:00");
}

TEST(status_panel, renders_step_path_with_indentation) {
  autopilot::ui::StatusSnapshot snap;
  snap.stepPath = std::vector<std::string>{ "Setup", "configure env" };
  snap.messagesSent = 2;
  snap.commandsExecuted = 5;
  snap.lastAction = "Pressed Ctrl+Enter";

  const auto text = autopilot::ui::StatusPanel{}.render(snap);
  EXPECT_THAT(text, HasSubstr("║   Setup"));
  EXPECT_THAT(text, HasSubstr("║     configure env"));
  EXPECT_THAT(text, HasSubstr("Messages Sent: 2"));
  EXPECT_THAT(text, HasSubstr("Commands Executed: 5"));
  EXPECT_THAT(text, HasSubstr("Last Action: Pressed Ctrl+Enter"));
  EXPECT_THAT(text, ::testing::Not(HasSubstr("No current step found")));
}

TEST(status_panel, every_line_has_box_width_and_long_action_is_cut) {
  autopilot::ui::StatusSnapshot snap;
  snap.lastAction = std::string(200, 'x');

  const auto text = autopilot::ui::StatusPanel{}.render(snap);
  EXPECT_THAT(text, HasSubstr("No current step found"));
  EXPECT_THAT(text, HasSubstr("x..."));
  for (const auto& l : lines(text))
    EXPECT_EQ(utf8Length(l), 58u) << l;
}
