// CrashWatch-Prod headers
#include "core/ErrorMonitor.hpp"
#include "core/ErrorReporter.hpp"
#include "core/Logger.hpp"
#include "core/MemoryStore.hpp"
#include "core/Signature.hpp"
#include "protocols/ErrorReport.hpp"

// CrashWatch-Fake headers
#include "FakeClock.hpp"
#include "FakeDeliverySink.hpp"
#include "MockStores.hpp"
#include "TempDir.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace crashwatch::test {

  using crashwatch::core::ErrorMonitor;
  using crashwatch::core::ErrorReporter;
  using crashwatch::core::EnvironmentCollector;
  using crashwatch::core::EnvironmentProbe;
  using crashwatch::core::FailureKind;
  using crashwatch::core::MemoryCounterStore;
  using crashwatch::core::MemoryDedupStore;
  using crashwatch::core::ReportOutcome;
  using crashwatch::core::ReportState;
  using crashwatch::core::ReporterConfig;
  using crashwatch::core::ReporterDependencies;
  using crashwatch::core::SourceContext;
  using crashwatch::core::StorageError;
  using crashwatch::protocols::ErrorReport;
  using ::testing::_;
  using ::testing::HasSubstr;
  using ::testing::Return;
  using ::testing::Throw;

  class ErrorReporterTest : public ::testing::Test {
  protected:
    void SetUp() override {
      config.site_id = "shop-eu";
      config.source_root = "/var/www/html";
      config.host_version = "6.4.2";
      config.plugin_version = "3.1.0";

      logger = std::make_shared<core::Logger>(clock);
      logger->setMinLevel(core::LogLevel::Error); // keep test output quiet
      monitor = std::make_shared<ErrorMonitor>(logger);
    }

    std::vector<EnvironmentProbe> probes() {
      return { { "runtime_version", [this] {
                  ++probeCalls;
                  return std::string("test-runtime");
                } },
               { "os", [] { return std::string("Linux"); } } };
    }

    std::unique_ptr<ErrorReporter> makeReporter() {
      ReporterDependencies deps;
      deps.sink = sink;
      deps.dedupStore = dedupStore;
      deps.rateStore = rateStore;
      deps.clock = clock;
      deps.logger = logger;
      deps.monitor = monitor;
      deps.probes = probes();
      return std::make_unique<ErrorReporter>(config, std::move(deps));
    }

    static ErrorReport makeReport(const std::string& message, int line = 42,
                                  const std::string& code = "500") {
      ErrorReport r;
      r.message = message;
      r.code = code;
      r.file = "/var/www/html/wp-content/plugins/squad/src/Module.php";
      r.line = line;
      r.stack_trace = "#0 Module->render()";
      return r;
    }

    ReporterConfig config;
    int probeCalls = 0;
    std::shared_ptr<FakeClock> clock = std::make_shared<FakeClock>();
    std::shared_ptr<FakeDeliverySink> sink = std::make_shared<FakeDeliverySink>();
    std::shared_ptr<core::DedupStore> dedupStore = std::make_shared<MemoryDedupStore>();
    std::shared_ptr<core::RateCounterStore> rateStore =
        std::make_shared<MemoryCounterStore>(clock);
    std::shared_ptr<core::Logger> logger;
    std::shared_ptr<ErrorMonitor> monitor;
  };

  //---happy path---------------------------------------------------------------

  TEST_F(ErrorReporterTest, new_report_is_enriched_delivered_and_recorded) {
    auto reporter = makeReporter();
    const auto report = makeReport("Fatal error: Call to undefined function foo()");

    const auto outcome = reporter->submit(report);

    ASSERT_EQ(outcome.state, ReportState::Delivered);
    EXPECT_TRUE(outcome.accepted());
    EXPECT_EQ(outcome.reason, "");
    EXPECT_EQ(outcome.severity, "high");
    EXPECT_EQ(outcome.signature, core::computeSignature(report));
    EXPECT_EQ(outcome.reference_id.size(), 8u);
    EXPECT_EQ(outcome.trail,
              (std::vector<ReportState>{ ReportState::Received, ReportState::Validated,
                                         ReportState::DedupChecked, ReportState::RateChecked,
                                         ReportState::Enriched, ReportState::Delivered }));

    ASSERT_EQ(sink->send_calls, 1);
    const auto& payload = sink->last();
    EXPECT_EQ(payload.error_message, report.message);
    EXPECT_EQ(payload.error_code, "500");
    EXPECT_EQ(payload.relative_file_path, "wp-content/plugins/squad/src/Module.php");
    EXPECT_EQ(payload.error_line, 42);
    EXPECT_EQ(payload.severity, "high");
    EXPECT_EQ(payload.reference_id, outcome.reference_id);
    EXPECT_EQ(payload.timestamp, FakeClock::kEpoch);
    EXPECT_EQ(payload.site_id, "shop-eu");
    EXPECT_EQ(payload.environment.at("runtime_version"), "test-runtime");
    EXPECT_EQ(payload.environment.at("os"), "Linux");
    EXPECT_TRUE(payload.log_tail.empty()); // no log_path configured

    EXPECT_EQ(dedupStore->get(outcome.signature), FakeClock::kEpoch);
    const auto stats = reporter->stats();
    EXPECT_EQ(stats.tracked_errors, 1u);
    EXPECT_EQ(stats.rate_limit_remaining, 4);
    EXPECT_EQ(stats.window_expires, FakeClock::kEpoch + 600);
    EXPECT_EQ(monitor->totalFailures(), 0u);
  }

  TEST_F(ErrorReporterTest, caller_timestamp_is_kept) {
    auto reporter = makeReporter();
    auto report = makeReport("boom");
    report.timestamp = 1234;

    ASSERT_TRUE(reporter->report(report));
    EXPECT_EQ(sink->last().timestamp, 1234);
  }

  //---duplicate gate-----------------------------------------------------------

  TEST_F(ErrorReporterTest, repeated_report_is_skipped_and_delivered_once) {
    auto reporter = makeReporter();
    const auto report = makeReport("Fatal error: x");

    EXPECT_TRUE(reporter->report(report));
    const auto second = reporter->submit(report);

    EXPECT_TRUE(second.accepted());
    EXPECT_EQ(second.state, ReportState::Skipped);
    EXPECT_EQ(second.reason, "duplicate");
    EXPECT_EQ(sink->send_calls, 1);
    EXPECT_EQ(reporter->stats().rate_limit_remaining, 4); // skip does not count
  }

  TEST_F(ErrorReporterTest, duplicate_expires_after_tracking_window) {
    auto reporter = makeReporter();
    const auto report = makeReport("boom");

    ASSERT_TRUE(reporter->report(report));
    clock->advance(config.track_duration_seconds);

    EXPECT_EQ(reporter->submit(report).state, ReportState::Delivered);
    EXPECT_EQ(sink->send_calls, 2);
  }

  TEST_F(ErrorReporterTest, bypass_flag_skips_duplicate_gate_but_not_rate_gate) {
    config.max_reports_per_window = 2;
    auto reporter = makeReporter();
    auto report = makeReport("boom");
    report.bypass_duplicate_check = true;

    EXPECT_EQ(reporter->submit(report).state, ReportState::Delivered);
    EXPECT_EQ(reporter->submit(report).state, ReportState::Delivered);
    const auto third = reporter->submit(report);

    EXPECT_EQ(third.state, ReportState::Rejected);
    EXPECT_EQ(third.reason, "rate_limited");
    EXPECT_EQ(sink->send_calls, 2);
  }

  TEST_F(ErrorReporterTest, version_tag_rekeys_duplicates) {
    config.version_tag = "3.1.0";
    auto before = makeReporter();
    const auto report = makeReport("boom");
    ASSERT_EQ(before->submit(report).state, ReportState::Delivered);

    config.version_tag = "3.2.0";
    auto after = makeReporter();
    EXPECT_EQ(after->submit(report).state, ReportState::Delivered);
    EXPECT_EQ(sink->send_calls, 2);
  }

  TEST_F(ErrorReporterTest, duplicate_short_circuits_rate_store_and_probes) {
    auto dedup = std::make_shared<::testing::NiceMock<MockDedupStore>>();
    auto rate = std::make_shared<::testing::StrictMock<MockRateCounterStore>>();
    dedupStore = dedup;
    rateStore = rate;

    const auto report = makeReport("boom");
    ON_CALL(*dedup, getAll())
        .WillByDefault(Return(core::TrackedErrors{ { core::computeSignature(report),
                                                     FakeClock::kEpoch - 60 } }));
    EXPECT_CALL(*dedup, set(_, _)).Times(0);
    EXPECT_CALL(*rate, get(_)).Times(0);
    EXPECT_CALL(*rate, set(_, _, _)).Times(0);

    auto reporter = makeReporter();
    EXPECT_EQ(reporter->submit(report).state, ReportState::Skipped);
    EXPECT_EQ(sink->send_calls, 0);
    EXPECT_EQ(probeCalls, 0);
  }

  //---rate gate----------------------------------------------------------------

  TEST_F(ErrorReporterTest, sixth_distinct_report_in_window_is_rate_limited) {
    auto reporter = makeReporter();

    for (int i = 0; i < 5; ++i)
      ASSERT_TRUE(reporter->report(makeReport("error #" + std::to_string(i)))) << i;

    const auto sixth = reporter->submit(makeReport("error #5"));
    EXPECT_FALSE(sixth.accepted());
    EXPECT_EQ(sixth.state, ReportState::Rejected);
    EXPECT_EQ(sixth.reason, "rate_limited");
    EXPECT_EQ(sink->send_calls, 5);

    // the rejected report was not recorded, so it goes out once the window lapses
    clock->advance(config.rate_window_seconds);
    EXPECT_EQ(reporter->submit(makeReport("error #5")).state, ReportState::Delivered);
  }

  TEST_F(ErrorReporterTest, critical_report_bypasses_exhausted_window_and_resets_it) {
    auto reporter = makeReporter();
    for (int i = 0; i < 5; ++i)
      ASSERT_TRUE(reporter->report(makeReport("error #" + std::to_string(i))));
    clock->advance(100);

    auto critical = makeReport("Fatal error: database gone");
    critical.is_critical = true;
    const auto outcome = reporter->submit(critical);

    EXPECT_EQ(outcome.state, ReportState::Delivered);
    EXPECT_EQ(sink->send_calls, 6);

    // fresh window opened by the critical report
    const auto stats = reporter->stats();
    EXPECT_EQ(stats.rate_limit_remaining, 4);
    EXPECT_EQ(stats.window_expires, clock->now() + 600);
  }

  TEST_F(ErrorReporterTest, critical_report_bypasses_duplicate_gate) {
    auto reporter = makeReporter();
    auto report = makeReport("Fatal error: database gone");
    report.is_critical = true;

    EXPECT_EQ(reporter->submit(report).state, ReportState::Delivered);
    EXPECT_EQ(reporter->submit(report).state, ReportState::Delivered);
    EXPECT_EQ(sink->send_calls, 2);
  }

  TEST_F(ErrorReporterTest, disabled_rate_limiting_admits_everything) {
    config.rate_limiting_enabled = false;
    auto reporter = makeReporter();

    for (int i = 0; i < 12; ++i)
      EXPECT_TRUE(reporter->report(makeReport("error #" + std::to_string(i))));
    EXPECT_EQ(sink->send_calls, 12);
  }

  TEST_F(ErrorReporterTest, rate_limited_report_is_neither_delivered_nor_recorded) {
    auto dedup = std::make_shared<::testing::NiceMock<MockDedupStore>>();
    auto rate = std::make_shared<::testing::NiceMock<MockRateCounterStore>>();
    dedupStore = dedup;
    rateStore = rate;

    ON_CALL(*rate, get(_)).WillByDefault(Return(5));
    EXPECT_CALL(*dedup, set(_, _)).Times(0);
    EXPECT_CALL(*rate, set(_, _, _)).Times(0);

    auto reporter = makeReporter();
    EXPECT_EQ(reporter->submit(makeReport("boom")).reason, "rate_limited");
    EXPECT_EQ(sink->send_calls, 0);
    EXPECT_EQ(probeCalls, 0);
  }

  //---validation---------------------------------------------------------------

  TEST_F(ErrorReporterTest, missing_line_is_rejected_before_any_store_access) {
    auto dedup = std::make_shared<::testing::StrictMock<MockDedupStore>>();
    auto rate = std::make_shared<::testing::StrictMock<MockRateCounterStore>>();
    dedupStore = dedup;
    rateStore = rate;
    EXPECT_CALL(*dedup, getAll()).Times(0);
    EXPECT_CALL(*rate, get(_)).Times(0);

    auto reporter = makeReporter();
    const auto outcome = reporter->submit(makeReport("boom", 0));

    EXPECT_FALSE(outcome.accepted());
    EXPECT_EQ(outcome.state, ReportState::Rejected);
    EXPECT_EQ(outcome.reason, "validation");
    EXPECT_THAT(outcome.detail, HasSubstr("line"));
    EXPECT_EQ(outcome.trail,
              (std::vector<ReportState>{ ReportState::Received, ReportState::Rejected }));
    EXPECT_EQ(sink->send_calls, 0);
  }

  TEST_F(ErrorReporterTest, every_missing_field_is_listed) {
    auto reporter = makeReporter();
    ErrorReport empty;
    EXPECT_EQ(reporter->missingFields(empty),
              (std::vector<std::string>{ "message", "code", "file", "line" }));
    EXPECT_TRUE(reporter->missingFields(makeReport("ok")).empty());
  }

  TEST_F(ErrorReporterTest, required_fields_are_configurable) {
    config.required_fields = { "message", "request_uri" };
    auto reporter = makeReporter();

    ErrorReport report;
    report.message = "boom";
    EXPECT_EQ(reporter->submit(report).reason, "validation");

    report.extra["request_uri"] = "/checkout";
    EXPECT_EQ(reporter->submit(report).state, ReportState::Delivered);
    EXPECT_EQ(sink->last().extra.at("request_uri"), "/checkout");
  }

  //---delivery failures--------------------------------------------------------

  TEST_F(ErrorReporterTest, sink_returning_false_fails_without_recording) {
    sink->send_result = false;
    auto reporter = makeReporter();
    const auto report = makeReport("boom");

    EXPECT_FALSE(reporter->report(report));
    const auto outcome = reporter->submit(report); // not recorded, so not a duplicate

    EXPECT_EQ(outcome.state, ReportState::Failed);
    EXPECT_EQ(outcome.reason, "delivery_failed");
    EXPECT_EQ(sink->send_calls, 2);
    EXPECT_EQ(monitor->failureCount(FailureKind::Delivery), 2u);
    EXPECT_EQ(reporter->stats().tracked_errors, 0u);
    EXPECT_EQ(reporter->stats().rate_limit_remaining, 5);
  }

  TEST_F(ErrorReporterTest, throwing_sink_is_contained) {
    sink->throw_on_send = true;
    auto reporter = makeReporter();

    ReportOutcome outcome;
    EXPECT_NO_THROW(outcome = reporter->submit(makeReport("boom")));
    EXPECT_EQ(outcome.state, ReportState::Failed);
    EXPECT_EQ(outcome.reason, "delivery_failed");
    EXPECT_THAT(outcome.detail, HasSubstr("smtp connection refused"));
    EXPECT_EQ(monitor->failureCount(FailureKind::Delivery), 1u);
  }

  //---degraded collaborators---------------------------------------------------

  TEST_F(ErrorReporterTest, unavailable_stores_degrade_to_permissive_gates) {
    auto dedup = std::make_shared<::testing::NiceMock<MockDedupStore>>();
    auto rate = std::make_shared<::testing::NiceMock<MockRateCounterStore>>();
    dedupStore = dedup;
    rateStore = rate;
    ON_CALL(*dedup, getAll()).WillByDefault(Throw(StorageError("table missing")));
    ON_CALL(*rate, get(_)).WillByDefault(Throw(StorageError("cache offline")));

    auto reporter = makeReporter();
    EXPECT_TRUE(reporter->report(makeReport("boom")));
    EXPECT_TRUE(reporter->report(makeReport("boom")));

    EXPECT_EQ(sink->send_calls, 2);
    EXPECT_GT(monitor->failureCount(FailureKind::Storage), 0u);
  }

  TEST_F(ErrorReporterTest, failing_probe_yields_placeholder_and_delivery_proceeds) {
    ReporterDependencies deps;
    deps.sink = sink;
    deps.clock = clock;
    deps.logger = logger;
    deps.monitor = monitor;
    deps.probes = std::vector<EnvironmentProbe>{
      { "memory_limit", []() -> std::string { throw std::runtime_error("getrlimit: EPERM"); } },
      { "os", [] { return std::string("Linux"); } },
    };
    ErrorReporter reporter(config, std::move(deps));

    ASSERT_TRUE(reporter.report(makeReport("boom")));
    EXPECT_EQ(sink->last().environment.at("memory_limit"),
              EnvironmentCollector::placeholder("getrlimit: EPERM"));
    EXPECT_EQ(sink->last().environment.at("os"), "Linux");
    EXPECT_EQ(monitor->failureCount(FailureKind::Probe), 1u);
  }

  TEST_F(ErrorReporterTest, probe_throwing_non_standard_type_still_delivers) {
    ReporterDependencies deps;
    deps.sink = sink;
    deps.clock = clock;
    deps.logger = logger;
    deps.monitor = monitor;
    deps.probes = std::vector<EnvironmentProbe>{
      { "memory_limit", []() -> std::string { throw 42; } },
      { "os", [] { return std::string("Linux"); } },
    };
    ErrorReporter reporter(config, std::move(deps));

    ReportOutcome outcome;
    EXPECT_NO_THROW(outcome = reporter.submit(makeReport("boom")));
    ASSERT_EQ(outcome.state, ReportState::Delivered);
    EXPECT_EQ(sink->last().environment.at("memory_limit"),
              EnvironmentCollector::placeholder("non-standard exception"));
    EXPECT_EQ(sink->last().environment.at("os"), "Linux");
    EXPECT_EQ(monitor->failureCount(FailureKind::Probe), 1u);
  }

  TEST_F(ErrorReporterTest, stores_throwing_non_standard_types_degrade_to_permissive_gates) {
    auto dedup = std::make_shared<::testing::NiceMock<MockDedupStore>>();
    auto rate = std::make_shared<::testing::NiceMock<MockRateCounterStore>>();
    dedupStore = dedup;
    rateStore = rate;
    ON_CALL(*dedup, getAll()).WillByDefault(Throw(42));
    ON_CALL(*rate, get(_)).WillByDefault(Throw(std::string("cache offline")));

    auto reporter = makeReporter();
    bool delivered = false;
    EXPECT_NO_THROW(delivered = reporter->report(makeReport("boom")));
    EXPECT_TRUE(delivered);
    EXPECT_EQ(sink->send_calls, 1);
    EXPECT_GT(monitor->failureCount(FailureKind::Storage), 0u);
  }

  TEST_F(ErrorReporterTest, environment_is_gathered_once_per_report) {
    auto reporter = makeReporter();
    ASSERT_TRUE(reporter->report(makeReport("first")));
    ASSERT_TRUE(reporter->report(makeReport("second")));
    EXPECT_EQ(probeCalls, 2);
  }

  TEST_F(ErrorReporterTest, default_collaborators_are_built_when_not_injected) {
    ReporterDependencies deps;
    deps.sink = sink;
    ErrorReporter reporter(config, std::move(deps));

    ASSERT_TRUE(reporter.report(makeReport("boom")));
    const auto& env = sink->last().environment;
    EXPECT_EQ(env.at("host_version"), "6.4.2");
    EXPECT_EQ(env.at("plugin_version"), "3.1.0");
    EXPECT_EQ(env.at("active_integrations"), "none");
    EXPECT_EQ(reporter.stats().tracked_errors, 1u);
  }

  TEST_F(ErrorReporterTest, control_characters_are_scrubbed_from_delivered_fields) {
    auto reporter = makeReporter();
    auto report = makeReport("Fatal:\tbad\x07 input\r\nfrom   form");
    report.stack_trace = "#0 a()\r\n#1 b()\x1b[0m";
    report.extra["user_agent"] = "curl/8\n\nInjected: header";

    ASSERT_TRUE(reporter->report(report));
    const auto& payload = sink->last();
    EXPECT_EQ(payload.error_message, "Fatal: bad input from form");
    EXPECT_EQ(payload.stack_trace, "#0 a()\n#1 b() [0m");
    EXPECT_EQ(payload.extra.at("user_agent"), "curl/8 Injected: header");
  }

  TEST_F(ErrorReporterTest, shared_reporter_serialises_concurrent_reports) {
    config.rate_limiting_enabled = false;
    auto reporter = makeReporter();

    constexpr int kThreads = 4;
    constexpr int kPerThread = 25;
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
      workers.emplace_back([&reporter, t] {
        for (int i = 0; i < kPerThread; ++i)
          reporter->report(makeReport("thread " + std::to_string(t) + " error " +
                                      std::to_string(i)));
      });
    }
    for (auto& w : workers)
      w.join();

    EXPECT_EQ(sink->send_calls, kThreads * kPerThread);
    EXPECT_EQ(reporter->stats().tracked_errors, static_cast<std::size_t>(kThreads * kPerThread));
    EXPECT_EQ(probeCalls, kThreads * kPerThread);
  }

  //---log tail-----------------------------------------------------------------

  TEST_F(ErrorReporterTest, log_tail_is_attached_when_enabled) {
    TempDir dir;
    config.log_path = dir.writeFile("debug.log", "one\ntwo\nthree\nfour\n");
    config.log_tail_lines = 2;
    auto reporter = makeReporter();

    ASSERT_TRUE(reporter->report(makeReport("boom")));
    EXPECT_EQ(sink->last().log_tail, "three\nfour");
  }

  TEST_F(ErrorReporterTest, log_tail_is_skipped_when_disabled) {
    TempDir dir;
    config.log_path = dir.writeFile("debug.log", "one\ntwo\n");
    config.include_log_tail = false;
    auto reporter = makeReporter();

    ASSERT_TRUE(reporter->report(makeReport("boom")));
    EXPECT_TRUE(sink->last().log_tail.empty());
  }

  TEST_F(ErrorReporterTest, unreadable_log_degrades_to_empty_tail) {
    TempDir dir;
    config.log_path = (dir.path() / "missing.log").string();
    auto reporter = makeReporter();

    ASSERT_TRUE(reporter->report(makeReport("boom")));
    EXPECT_TRUE(sink->last().log_tail.empty());
    EXPECT_EQ(monitor->failureCount(FailureKind::LogRead), 1u);
  }

  //---exceptions---------------------------------------------------------------

  TEST_F(ErrorReporterTest, system_error_supplies_code_and_category) {
    auto reporter = makeReporter();
    const std::system_error error(std::make_error_code(std::errc::no_such_file_or_directory),
                                  "open uploads dir");
    SourceContext where{ "/var/www/html/uploader.php", 88, "", "#0 upload()", {}, false };

    ASSERT_TRUE(reporter->reportFromException(error, where));
    const auto& payload = sink->last();
    EXPECT_EQ(payload.error_code, std::to_string(ENOENT));
    EXPECT_THAT(payload.error_message, HasSubstr("open uploads dir"));
    EXPECT_EQ(payload.relative_file_path, "uploader.php");
    EXPECT_EQ(payload.extra.at("error_category"), "generic");
    EXPECT_THAT(payload.extra.at("exception_type"), HasSubstr("system_error"));
  }

  TEST_F(ErrorReporterTest, plain_exception_gets_generic_code_unless_given_one) {
    auto reporter = makeReporter();
    const std::runtime_error error("template not found");

    ASSERT_TRUE(reporter->reportFromException(error, { "a.php", 3, "", "", {}, false }));
    EXPECT_EQ(sink->last().error_code, "exception");
    EXPECT_THAT(sink->last().extra.at("exception_type"), HasSubstr("runtime_error"));

    ASSERT_TRUE(reporter->reportFromException(error, { "a.php", 3, "E_TEMPLATE", "", {}, false }));
    EXPECT_EQ(sink->last().error_code, "E_TEMPLATE");
  }

  TEST_F(ErrorReporterTest, exception_without_location_is_rejected) {
    auto reporter = makeReporter();
    EXPECT_FALSE(reporter->reportFromException(std::logic_error("bad"), SourceContext{}));
    EXPECT_EQ(sink->send_calls, 0);
  }

  //---administration-----------------------------------------------------------

  TEST_F(ErrorReporterTest, clearing_tracked_errors_allows_resend) {
    auto reporter = makeReporter();
    const auto report = makeReport("boom");
    ASSERT_TRUE(reporter->report(report));

    EXPECT_TRUE(reporter->clearTrackedErrors());
    EXPECT_EQ(reporter->stats().tracked_errors, 0u);
    EXPECT_EQ(reporter->submit(report).state, ReportState::Delivered);
  }

  TEST_F(ErrorReporterTest, resetting_rate_limit_reopens_window) {
    auto reporter = makeReporter();
    for (int i = 0; i < 5; ++i)
      ASSERT_TRUE(reporter->report(makeReport("error #" + std::to_string(i))));
    ASSERT_EQ(reporter->stats().rate_limit_remaining, 0);

    EXPECT_TRUE(reporter->resetRateLimit());
    EXPECT_EQ(reporter->stats().rate_limit_remaining, 5);
    EXPECT_EQ(reporter->stats().window_expires, 0);
    EXPECT_TRUE(reporter->report(makeReport("error #5")));
  }

  TEST_F(ErrorReporterTest, relative_path_strips_configured_root_only) {
    auto reporter = makeReporter();
    EXPECT_EQ(reporter->relativePath("/var/www/html/a/b.php"), "a/b.php");
    EXPECT_EQ(reporter->relativePath("/opt/other/b.php"), "/opt/other/b.php");
    EXPECT_EQ(reporter->relativePath("/var/www/html"), "/var/www/html");
  }

  TEST(report_state, names_are_stable) {
    EXPECT_STREQ(core::toString(ReportState::Received), "Received");
    EXPECT_STREQ(core::toString(ReportState::RateChecked), "RateChecked");
    EXPECT_STREQ(core::toString(ReportState::Failed), "Failed");
  }

} // namespace crashwatch::test
