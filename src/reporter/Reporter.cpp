#include "Reporter.hpp"
#include "GuardedCall.hpp"
#include "ReporterErrors.hpp"
#include "SignatureFormatter.hpp"
#include "tracker/HttpTransport.hpp"

#include <plog/Log.h>

namespace reporter
{

namespace
{
constexpr const char* kNotConfiguredMessage = "gitlab-reporter not configured. Nothing to do.";
}

Reporter::Reporter(runtime::IHostRuntime& host, ClientFactory client_factory)
    : host_(host)
    , client_factory_(std::move(client_factory))
    , original_uncaught_hook_(host.uncaughtHook())
    , original_thread_hook_(host.hasThreadHook() ? host.threadUncaughtHook() : runtime::ThreadUncaughtHook{})
{
}

Reporter::~Reporter()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!installed_)
        return;

    host_.setUncaughtHook(original_uncaught_hook_);
    if (thread_hook_installed_)
        host_.setThreadUncaughtHook(original_thread_hook_);
}

Reporter& Reporter::Global()
{
    static Reporter instance(runtime::ProcessRuntime::Instance());
    return instance;
}

void Reporter::initialize(const std::string& host, const std::string& token, std::int64_t project_id,
                          std::optional<std::int64_t> assignee_id)
{
    if (!client_factory_)
        throw ConfigurationError("No tracker client factory configured");
    initialize(client_factory_(host, token), project_id, assignee_id);
}

void Reporter::initialize(std::shared_ptr<tracker::ITrackerClient> client, std::int64_t project_id,
                          std::optional<std::int64_t> assignee_id)
{
    if (!client)
        throw ConfigurationError("Tracker client must not be null");

    {
        std::lock_guard<std::mutex> lock(mutex_);
        config_ = ReporterConfig{ std::move(client), project_id, assignee_id };
    }
    installHooks();

    PLOG_INFO << "gitlab-reporter initialized for project " << project_id;
}

void Reporter::initialize(const config::ReporterSettings& settings)
{
    tracker::SessionConfig session;
    session.connect_timeout_ms = settings.connect_timeout_ms;
    session.timeout_ms = settings.timeout_ms;

    auto client = std::make_shared<tracker::GitLabClient>(settings.host, settings.token,
                                                          std::make_shared<tracker::CprTransport>(session));
    initialize(std::move(client), settings.project_id, settings.assignee_id);
}

bool Reporter::isConfigured() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.has_value() && config_->client != nullptr;
}

std::optional<ReporterConfig> Reporter::currentConfig() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

void Reporter::installHooks()
{
    std::lock_guard<std::mutex> lock(mutex_);

    // Capture the pre-existing hooks only on the first install, so re-initializing never chains to ourselves
    if (!installed_)
    {
        original_uncaught_hook_ = host_.uncaughtHook();
        if (host_.hasThreadHook())
        {
            original_thread_hook_ = host_.threadUncaughtHook();
            thread_hook_installed_ = true;
        }
        else
        {
            PLOG_INFO << "Host runtime has no thread hook; errors escaping threads will not be reported";
        }
        installed_ = true;
    }

    host_.setUncaughtHook([this](const runtime::UncaughtError& error) { handleUncaughtError(error); });
    if (thread_hook_installed_)
    {
        host_.setThreadUncaughtHook([this](const runtime::ThreadErrorArgs& args) { handleUncaughtThreadError(args); });
    }
}

void Reporter::handleUncaughtError(const runtime::UncaughtError& error)
{
    reportNow(error);

    runtime::UncaughtHook original;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        original = original_uncaught_hook_;
    }
    if (original)
        original(error);
}

void Reporter::handleUncaughtThreadError(const runtime::ThreadErrorArgs& args)
{
    reportNow(args.error);

    runtime::ThreadUncaughtHook original;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        original = original_thread_hook_;
    }
    if (original)
        original(args);
}

std::optional<SyncResult> Reporter::reportNow(const runtime::UncaughtError& error)
{
    if (!isConfigured())
    {
        PLOG_INFO << kNotConfiguredMessage;
        return std::nullopt;
    }

    // The configuration may still vanish before createOrReopenIssue reads it; the guard absorbs that too
    std::optional<SyncResult> result;
    RunGuarded("Reporting uncaught error", [&] { result = createOrReopenIssue(error); });
    return result;
}

SyncResult Reporter::createOrReopenIssue(const runtime::UncaughtError& error)
{
    auto config = currentConfig();
    if (!config || !config->client)
        throw ConfigurationError("Reporter not initialized. Call Reporter::initialize() first.");

    const std::string title = FormatTitle(error);
    const std::string description = FormatDescription(error);

    // Serializes same-title reports within this process only
    auto title_mutex = acquireTitleMutex(title);
    std::optional<SyncResult> result;
    try
    {
        std::lock_guard<std::mutex> guard(*title_mutex);
        IssueSynchronizer synchronizer(*config->client);
        result = synchronizer.sync(config->project_id, title, description, config->assignee_id);
    }
    catch (...)
    {
        releaseTitleMutex(title, std::move(title_mutex));
        throw;
    }
    releaseTitleMutex(title, std::move(title_mutex));

    if (result->issue)
    {
        PLOG_INFO << SyncActionToString(result->action) << " issue #" << result->issue->iid() << " for '" << title
                  << "'";
    }
    return std::move(*result);
}

std::shared_ptr<std::mutex> Reporter::acquireTitleMutex(const std::string& title)
{
    std::lock_guard<std::mutex> lock(title_mutex_);
    auto& entry = title_locks_[title];
    if (!entry)
        entry = std::make_shared<std::mutex>();
    return entry;
}

void Reporter::releaseTitleMutex(const std::string& title, std::shared_ptr<std::mutex> entry)
{
    std::lock_guard<std::mutex> lock(title_mutex_);
    entry.reset();

    // Drop the entry once no report for this title holds it
    auto it = title_locks_.find(title);
    if (it != title_locks_.end() && it->second.use_count() == 1)
        title_locks_.erase(it);
}

std::size_t Reporter::pendingTitleCount() const
{
    std::lock_guard<std::mutex> lock(title_mutex_);
    return title_locks_.size();
}

} // namespace reporter
