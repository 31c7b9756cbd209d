#include "app/shipper.hpp"
#include "classifier/secret_classifier.hpp"
#include "db/schema_migrator.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <format>

namespace shiplog {

namespace {

constexpr const char* kLegacyStateFile = "state.json";

std::string join(const std::vector<std::string>& parts, const char* sep) {
    std::string out;
    for (const auto& p : parts) {
        if (!out.empty()) out += sep;
        out += p;
    }
    return out;
}

} // anonymous namespace

Shipper::Shipper(ShipperConfig config,
                 std::unique_ptr<IRemoteCollector> collector,
                 std::unique_ptr<IGitContextResolver> git)
    : config_(std::move(config)),
      root_(utils::expand_user(config_.monitor.conversation_dir)),
      collector_(std::move(collector)),
      git_(std::move(git)) {
    if (!git_) {
        git_ = std::make_unique<CommandGitContextResolver>();
    }

    std::shared_ptr<const ISecretClassifier> classifier;
    if (config_.redaction.enabled) {
        classifier = std::make_shared<PatternSecretClassifier>(
            config_.redaction.sentinel, config_.redaction.extra_patterns);
    }
    redactor_ = std::make_unique<EventRedactor>(std::move(classifier));
}

Shipper::~Shipper() {
    stop();
}

// ============================================================================
// Startup steps
// ============================================================================

void Shipper::open_state_store() {
    const auto& storage = config_.storage;
    const std::string path = utils::expand_user(
        storage.state_path.empty() ? storage.database_path : storage.state_path);

    try {
        state_db_ = std::make_unique<SqliteDatabase>(SqliteDatabase::Config{
            path, SqliteDatabase::Mode::READ_WRITE, storage.busy_timeout});
        cursors_ = std::make_unique<LineCursorTracker>(*state_db_);
        return;
    } catch (const StorageError& e) {
        utils::log::error(std::format(
            "Cannot open cursor store {}: {}; cursors will not survive a restart", path, e.what()));
    }

    // Nothing durable available; keep ingesting with in-memory cursors
    state_db_ = std::make_unique<SqliteDatabase>(SqliteDatabase::Config{
        ":memory:", SqliteDatabase::Mode::READ_WRITE, storage.busy_timeout});
    cursors_ = std::make_unique<LineCursorTracker>(*state_db_);
}

void Shipper::open_event_store() {
    const auto& storage = config_.storage;
    if (!storage.enabled) {
        utils::log::info("Local storage disabled");
        return;
    }

    const std::string path = utils::expand_user(storage.database_path);
    const std::string user = storage.user_name.empty() ? "unknown" : storage.user_name;

    try {
        SqliteDatabase* db = nullptr;
        if (state_db_->path() == path) {
            db = state_db_.get();
        } else {
            events_db_ = std::make_unique<SqliteDatabase>(SqliteDatabase::Config{
                path, SqliteDatabase::Mode::READ_WRITE, storage.busy_timeout});
            db = events_db_.get();
        }

        auto store = std::make_unique<EventStore>(*db, user);
        const auto report = store->migrate();
        utils::log::info(std::format(
            "Local storage ready: {} (added columns: {}, rebuilt: {}, fts: {})",
            path, utils::booltostr(report.added_columns), utils::booltostr(report.rebuilt_events_table),
            utils::booltostr(report.fts_available)));

        if (!storage.schema_docs_path.empty()) {
            SchemaMigrator migrator(*db);
            migrator.export_schema_docs(utils::expand_user(storage.schema_docs_path));
        }
        event_store_ = std::move(store);
    } catch (const StorageError& e) {
        utils::log::error(std::format("Local storage unavailable ({}): {}", path, e.what()));
        event_store_.reset();
        events_db_.reset();
    }
}

void Shipper::probe_remote() {
    const auto& remote = config_.remote;
    if (!remote.enabled) {
        collector_.reset();
        return;
    }

    Result<bool> probe = Result<bool>::ok(true);
    if (collector_) {
        probe = collector_->health_check();
    } else {
        auto http = std::make_unique<HttpRemoteCollector>(HttpRemoteCollector::Config{
            remote.url, remote.api_key, remote.request_timeout, remote.user_agent});
        probe = http->connect();
        collector_ = std::move(http);
    }

    if (probe.is_error()) {
        utils::log::error(std::format("Remote collector {} unavailable ({}): {}",
                                      collector_->endpoint(),
                                      error_category_to_string(probe.error_category()),
                                      probe.error_message()));
        collector_.reset();
        return;
    }
    remote_active_ = true;
}

void Shipper::import_legacy_state() {
    std::filesystem::path dir;
    if (state_db_->path() != ":memory:") {
        dir = std::filesystem::path(state_db_->path()).parent_path();
    } else {
        dir = std::filesystem::path(utils::expand_user(config_.storage.database_path)).parent_path();
    }

    try {
        cursors_->import_legacy_snapshot(dir / kLegacyStateFile);
    } catch (const StorageError& e) {
        utils::log::error(std::format("Legacy cursor import failed: {}", e.what()));
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

Result<bool> Shipper::start() {
    if (running_) return Result<bool>::ok(true);

    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec)) {
        return Result<bool>::error(ErrorCategory::CONFIG_ERROR,
            std::format("conversation directory not found: {}", root_.string()));
    }

    open_state_store();
    open_event_store();
    probe_remote();

    if (!event_store_ && !remote_active_) {
        return Result<bool>::error(ErrorCategory::CONFIG_ERROR,
            "no usable destination: local storage is disabled or unavailable and remote sync is off");
    }

    destinations_.clear();
    if (event_store_) {
        sink_ = event_store_.get();
        destinations_.push_back(std::format("local SQLite ({})",
                                            utils::expand_user(config_.storage.database_path)));
    } else {
        memory_queue_ = std::make_unique<MemoryEventQueue>(config_.sync.memory_queue_capacity);
        sink_ = memory_queue_.get();
        destinations_.push_back(std::format("memory queue (capacity {})",
                                            config_.sync.memory_queue_capacity));
    }
    if (remote_active_) {
        destinations_.push_back(std::format("remote collector ({})", collector_->endpoint()));
    }
    utils::log::info(std::format("Recording destinations: {}", join(destinations_, ", ")));

    import_legacy_state();

    const std::optional<std::string> filter = config_.monitor.debug_filter_project;
    if (config_.monitor.skip_backlog) {
        try {
            const size_t skipped = cursors_->fast_forward_all(root_, config_.monitor.extension, filter);
            utils::log::info(std::format("Skipped backlog of {} files", skipped));
        } catch (const StorageError& e) {
            utils::log::error(std::format("Backlog skip failed: {}", e.what()));
        }
    }

    const auto policy = parse_malformed_line_policy(config_.monitor.malformed_lines)
                            .value_or(MalformedLinePolicy::SKIP);
    pipeline_ = std::make_unique<IngestionPipeline>(
        IngestionPipeline::Config{root_, config_.monitor.extension, filter, policy,
                                  utils::expand_user(config_.monitor.quarantine_file)},
        *cursors_, *sink_, *git_, *redactor_);

    watcher_ = std::make_unique<FileWatcher>(
        FileWatcher::Config{root_, config_.monitor.extension},
        [this](const std::filesystem::path& file) {
            if (pipeline_->accepts(file)) {
                pipeline_->process_file(file);
            }
        });

    const size_t swept = watcher_->sweep();
    utils::log::info(std::format("Startup sweep processed {} files", swept));

    if (remote_active_) {
        const auto& s = config_.sync;
        sync_worker_ = std::make_unique<SyncWorker>(
            SyncWorker::Config{s.batch_size,
                               std::chrono::duration_cast<std::chrono::milliseconds>(s.idle_interval),
                               s.batch_pause,
                               s.request_interval,
                               s.initial_backoff,
                               std::chrono::duration_cast<std::chrono::milliseconds>(s.max_backoff)},
            *sink_, *collector_, *redactor_);
        sync_worker_->start();
    }

    if (!watcher_->start()) {
        utils::log::warn("File watcher unavailable; only the startup sweep was processed");
    }

    running_ = true;
    utils::log::info(std::format("Monitoring {}", root_.string()));
    return Result<bool>::ok(true);
}

void Shipper::stop() {
    if (!running_) return;
    running_ = false;

    if (watcher_) watcher_->stop();
    if (sync_worker_) {
        sync_worker_->stop(config_.sync.shutdown_timeout);
    }

    if (pipeline_) {
        const auto s = pipeline_->stats();
        utils::log::info(std::format("Ingestion: {} passes, {} events stored, {} malformed lines",
                                     s.passes, s.events_stored, s.malformed_lines));
    }
    if (sink_) {
        try {
            const auto stats = sink_->sync_stats();
            utils::log::info(std::format("{}: {} events, {} synced, {} pending",
                                         sink_->name(), stats.total, stats.synced, stats.pending));
        } catch (const StorageError& e) {
            utils::log::warn(std::format("Cannot read final sync stats: {}", e.what()));
        }
    }
    utils::log::info("Shipper stopped");
}

} // namespace shiplog
