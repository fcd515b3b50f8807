#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "reporter/Reporter.hpp"
#include "reporter/ReporterErrors.hpp"
#include "runtime/ReportingThread.hpp"
#include "tracker/GitLabClient.hpp"
#include "tracker/TrackerErrors.hpp"
#include "utils/fake_runtime.hpp"
#include "utils/fake_tracker.hpp"
#include "utils/log_capture.hpp"
#include "utils/test_errors.hpp"

#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

using Catch::Matchers::ContainsSubstring;
using reporter::Reporter;
using reporter::SyncAction;
using test_utils::FakeRuntime;
using test_utils::FakeTracker;
using test_utils::LogCapture;

namespace
{

runtime::UncaughtError Ooopsie()
{
    try
    {
        throw ValueError("Ooopsie");
    }
    catch (const std::exception& e)
    {
        return runtime::DescribeException(e, cpptrace::generate_trace());
    }
}

// Factory handing out one shared FakeTracker and remembering its arguments
struct RecordingFactory
{
    std::shared_ptr<FakeTracker> tracker = std::make_shared<FakeTracker>(56789);
    std::string host;
    std::string token;

    reporter::ClientFactory make()
    {
        return [this](const std::string& h, const std::string& t) -> std::shared_ptr<tracker::ITrackerClient>
        {
            host = h;
            token = t;
            return tracker;
        };
    }
};

class TempConfigFile
{
public:
    explicit TempConfigFile(const std::string& content)
        : path_("test_reporter_config_temp.toml")
    {
        std::ofstream file(path_);
        file << content;
    }

    ~TempConfigFile()
    {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    const std::string& getPath() const { return path_; }

private:
    std::string path_;
};

} // namespace

TEST_CASE("Reporter - Initialization", "[reporter]")
{
    FakeRuntime host;
    RecordingFactory factory;
    Reporter reporter(host, factory.make());

    SECTION("Not configured before initialize")
    {
        REQUIRE_FALSE(reporter.isConfigured());
    }

    SECTION("Configured after initialize, client built from host and token")
    {
        reporter.initialize("https://gitlab", "12345", 56789, 9999);

        REQUIRE(reporter.isConfigured());
        REQUIRE(factory.host == "https://gitlab");
        REQUIRE(factory.token == "12345");
    }

    SECTION("Default factory builds a GitLab client without touching the network")
    {
        Reporter gitlab_reporter(host);
        gitlab_reporter.initialize("https://gitlab", "12345", 56789);
        REQUIRE(gitlab_reporter.isConfigured());
    }

    SECTION("Null client is rejected")
    {
        REQUIRE_THROWS_AS(reporter.initialize(std::shared_ptr<tracker::ITrackerClient>{}, 1), reporter::ConfigurationError);
        REQUIRE_FALSE(reporter.isConfigured());
    }

    SECTION("Settings build a configured reporter")
    {
        config::ReporterSettings settings;
        settings.host = "https://gitlab.example.com";
        settings.token = "token";
        settings.project_id = 3;
        reporter.initialize(settings);
        REQUIRE(reporter.isConfigured());
    }

    SECTION("Installs both hooks")
    {
        reporter.initialize("https://gitlab", "12345", 56789);

        REQUIRE(host.uncaughtHook() != nullptr);
        REQUIRE(host.threadUncaughtHook() != nullptr);

        host.raise(Ooopsie());
        REQUIRE(factory.tracker->countWithTitle("ValueError: Ooopsie") == 1);
        REQUIRE(host.originalCalls().size() == 1);
    }
}

TEST_CASE("Reporter - Uninitialized handler", "[reporter]")
{
    auto& log = LogCapture::Instance();
    log.clear();

    FakeRuntime host;
    RecordingFactory factory;
    Reporter reporter(host, factory.make());

    auto error = Ooopsie();
    reporter.handleUncaughtError(error);

    REQUIRE(log.contains(plog::info, "gitlab-reporter not configured. Nothing to do."));

    auto calls = host.originalCalls();
    REQUIRE(calls.size() == 1);
    REQUIRE(calls[0].type_name == "ValueError");
    REQUIRE(calls[0].message == "Ooopsie");
    REQUIRE(calls[0].trace.has_value() == error.trace.has_value());

    REQUIRE(factory.tracker->issues().empty());
    REQUIRE(factory.tracker->counters().get_project == 0);
}

TEST_CASE("Reporter - Direct synchronization requires configuration", "[reporter]")
{
    FakeRuntime host;
    Reporter reporter(host);

    REQUIRE_THROWS_AS(reporter.createOrReopenIssue(Ooopsie()), reporter::ConfigurationError);
    REQUIRE_FALSE(reporter.reportNow(Ooopsie()).has_value());
}

TEST_CASE("Reporter - Initialized handler opens an issue", "[reporter]")
{
    FakeRuntime host;
    RecordingFactory factory;

    // Original hook checks the issue already exists when it runs
    std::vector<std::size_t> issues_seen_by_original;
    std::vector<runtime::UncaughtError> original_args;
    host.setUncaughtHook(
        [&](const runtime::UncaughtError& error)
        {
            issues_seen_by_original.push_back(factory.tracker->issues().size());
            original_args.push_back(error);
        });

    Reporter reporter(host, factory.make());
    reporter.initialize("https://gitlab", "12345", 56789, 9999);

    host.raise(Ooopsie());

    auto issues = factory.tracker->issues();
    REQUIRE(issues.size() == 1);
    REQUIRE(issues[0].title == "ValueError: Ooopsie");
    REQUIRE_THAT(issues[0].description, ContainsSubstring("Ooopsie"));
    REQUIRE_THAT(issues[0].description, ContainsSubstring("```text\n"));
    REQUIRE(issues[0].assignee_id == 9999);

    REQUIRE(issues_seen_by_original == std::vector<std::size_t>{ 1 });
    REQUIRE(original_args.size() == 1);
    REQUIRE(original_args[0].type_name == "ValueError");

    SECTION("A second occurrence reopens the same issue")
    {
        auto iid = issues[0].iid;
        host.raise(Ooopsie());

        issues = factory.tracker->issues();
        REQUIRE(issues.size() == 1);
        REQUIRE(issues[0].iid == iid);
        REQUIRE(factory.tracker->counters().saves == 1);
        REQUIRE(original_args.size() == 2);
    }

    SECTION("A closed issue is reopened")
    {
        auto closed_tracker = std::make_shared<FakeTracker>(56789);
        closed_tracker->addIssue("ValueError: Ooopsie", "old", tracker::IssueState::Closed);
        reporter.initialize(closed_tracker, 56789);

        host.raise(Ooopsie());

        auto closed_issues = closed_tracker->issues();
        REQUIRE(closed_issues.size() == 1);
        REQUIRE(closed_issues[0].state == tracker::IssueState::Open);
        REQUIRE(closed_issues[0].description != "old");
    }
}

TEST_CASE("Reporter - Tracker failures are absorbed", "[reporter]")
{
    auto& log = LogCapture::Instance();
    log.clear();

    FakeRuntime host;
    RecordingFactory factory;
    factory.tracker->addIssue("Unrelated", "x");
    factory.tracker->failListingAfter(0);

    Reporter reporter(host, factory.make());
    reporter.initialize("https://gitlab", "12345", 56789);

    REQUIRE_NOTHROW(host.raise(Ooopsie()));

    REQUIRE(log.contains(plog::error, "TrackerApiError"));
    REQUIRE(log.contains(plog::error, "HTTP 502"));

    auto counters = factory.tracker->counters();
    REQUIRE(counters.creates == 0);
    REQUIRE(counters.saves == 0);

    auto calls = host.originalCalls();
    REQUIRE(calls.size() == 1);
    REQUIRE(calls[0].type_name == "ValueError");
    REQUIRE(calls[0].message == "Ooopsie");

    SECTION("Unreachable project is logged as a configuration error")
    {
        log.clear();
        factory.tracker->failListingAfter(std::nullopt);
        factory.tracker->failGetProjectWithNotFound(true);

        REQUIRE_NOTHROW(host.raise(Ooopsie()));
        REQUIRE(log.contains(plog::error, "ConfigurationError"));
        REQUIRE(host.originalCalls().size() == 2);
    }

    SECTION("Non-standard exceptions from the client are absorbed too")
    {
        struct ThrowingClient : tracker::ITrackerClient
        {
            std::unique_ptr<tracker::IProject> getProject(std::int64_t) override { throw 42; }
        };
        reporter.initialize(std::make_shared<ThrowingClient>(), 56789);

        REQUIRE_NOTHROW(host.raise(Ooopsie()));
        REQUIRE(log.contains(plog::error, "non-standard exception"));
        REQUIRE(host.originalCalls().size() == 2);
    }
}

TEST_CASE("Reporter - Re-initialization keeps the original chain target", "[reporter]")
{
    FakeRuntime host;
    RecordingFactory factory;
    Reporter reporter(host, factory.make());

    reporter.initialize("https://gitlab", "12345", 56789);
    reporter.initialize("https://gitlab", "12345", 56789);
    reporter.initialize("https://gitlab", "67890", 56789);

    host.raise(Ooopsie());

    // One report, one call into the pre-existing hook, no self-chaining
    REQUIRE(factory.tracker->countWithTitle("ValueError: Ooopsie") == 1);
    REQUIRE(host.originalCalls().size() == 1);
    REQUIRE(factory.token == "67890");
}

TEST_CASE("Reporter - Thread errors", "[reporter][thread]")
{
    SECTION("Reported through the thread hook and chained with the thread arguments")
    {
        FakeRuntime host;
        RecordingFactory factory;
        Reporter reporter(host, factory.make());
        reporter.initialize("https://gitlab", "12345", 56789);

        runtime::RunReported("worker", [] { throw ZeroDivisionError("division by zero"); }, host);

        REQUIRE(factory.tracker->countWithTitle("ZeroDivisionError: division by zero") == 1);

        auto calls = host.originalThreadCalls();
        REQUIRE(calls.size() == 1);
        REQUIRE(calls[0].thread_name == "worker");
        REQUIRE(calls[0].error.message == "division by zero");
        REQUIRE(host.originalCalls().empty());
    }

    SECTION("Runtimes without a thread hook are tolerated")
    {
        auto& log = LogCapture::Instance();
        log.clear();

        FakeRuntime host(/*has_thread_hook*/ false);
        RecordingFactory factory;
        Reporter reporter(host, factory.make());

        REQUIRE_NOTHROW(reporter.initialize("https://gitlab", "12345", 56789));
        REQUIRE(reporter.isConfigured());
        REQUIRE(host.threadUncaughtHook() == nullptr);
        REQUIRE(log.contains(plog::info, "no thread hook"));

        host.raise(Ooopsie());
        REQUIRE(factory.tracker->issues().size() == 1);
    }

    SECTION("Concurrent errors produce one issue per signature")
    {
        FakeRuntime host;
        RecordingFactory factory;
        Reporter reporter(host, factory.make());
        reporter.initialize("https://gitlab", "12345", 56789);

        std::vector<std::thread> workers;
        for (int i = 0; i < 8; ++i)
        {
            workers.emplace_back(
                [&host, i]
                {
                    runtime::RunReported("worker-" + std::to_string(i),
                                         [i]
                                         {
                                             if (i % 2 == 0)
                                                 throw ValueError("even");
                                             throw ZeroDivisionError("odd");
                                         },
                                         host);
                });
        }
        for (auto& worker : workers)
            worker.join();

        REQUIRE(factory.tracker->countWithTitle("ValueError: even") == 1);
        REQUIRE(factory.tracker->countWithTitle("ZeroDivisionError: odd") == 1);
        REQUIRE(factory.tracker->counters().saves == 6);
        REQUIRE(host.originalThreadCalls().size() == 8);
        REQUIRE(reporter.pendingTitleCount() == 0);
    }
}

TEST_CASE("Reporter - reportNow", "[reporter]")
{
    auto& log = LogCapture::Instance();
    log.clear();

    FakeRuntime host;
    RecordingFactory factory;
    Reporter reporter(host, factory.make());

    REQUIRE_FALSE(reporter.reportNow(Ooopsie()).has_value());

    reporter.initialize("https://gitlab", "12345", 56789);

    auto created = reporter.reportNow(Ooopsie());
    REQUIRE(created.has_value());
    REQUIRE(created->action == SyncAction::Created);

    auto reopened = reporter.reportNow(Ooopsie());
    REQUIRE(reopened.has_value());
    REQUIRE(reopened->action == SyncAction::Reopened);
    REQUIRE(reopened->issue->iid() == created->issue->iid());

    REQUIRE(log.contains(plog::info, "Created issue #" + std::to_string(created->issue->iid())));
    REQUIRE(log.contains(plog::info, "Reopened issue #" + std::to_string(created->issue->iid())));

    // Direct reports do not run the original hook
    REQUIRE(host.originalCalls().empty());
}

TEST_CASE("Reporter - Per-title locks are released after each report", "[reporter]")
{
    FakeRuntime host;
    RecordingFactory factory;
    Reporter reporter(host, factory.make());
    reporter.initialize("https://gitlab", "12345", 56789);

    SECTION("Successful reports")
    {
        for (int i = 0; i < 5; ++i)
            reporter.reportNow(runtime::UncaughtError{ "ValueError", "message " + std::to_string(i), std::nullopt });

        REQUIRE(factory.tracker->issues().size() == 5);
        REQUIRE(reporter.pendingTitleCount() == 0);
    }

    SECTION("Failed reports")
    {
        factory.tracker->failCreate(true);
        REQUIRE_THROWS_AS(reporter.createOrReopenIssue(Ooopsie()), tracker::TrackerApiError);
        REQUIRE(reporter.pendingTitleCount() == 0);
    }
}

TEST_CASE("Reporter - Destruction restores the original hooks", "[reporter]")
{
    FakeRuntime host;
    RecordingFactory factory;
    {
        Reporter reporter(host, factory.make());
        reporter.initialize("https://gitlab", "12345", 56789);
    }

    host.raise(Ooopsie());
    REQUIRE(factory.tracker->issues().empty());
    REQUIRE(host.originalCalls().size() == 1);
}

TEST_CASE("Reporter - Setup from a config file", "[reporter][config]")
{
    SECTION("Missing file")
    {
        REQUIRE_FALSE(reporter::Setup("definitely_missing_reporter_config.toml"));
    }

    SECTION("Disabled reporter")
    {
        TempConfigFile file("[reporter]\nenabled = false\n");
        REQUIRE_FALSE(reporter::Setup(file.getPath()));
    }

    SECTION("Invalid settings")
    {
        TempConfigFile file("[reporter]\nhost = \"https://gitlab.example.com\"\ntoken = \"t\"\n");
        REQUIRE_FALSE(reporter::Setup(file.getPath()));
    }

    SECTION("Valid settings configure the global reporter")
    {
        TempConfigFile file("[reporter]\nhost = \"https://gitlab.example.com\"\ntoken = \"t\"\nproject_id = 42\n");
        REQUIRE(reporter::Setup(file.getPath()));
        REQUIRE(Reporter::Global().isConfigured());
    }
}
