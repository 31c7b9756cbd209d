#include "ingest/ingestion_pipeline.hpp"
#include "event/event_parser.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>
#include <sstream>

namespace shiplog {

namespace {

std::optional<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) return std::nullopt;
    return std::move(buffer).str();
}

std::optional<std::filesystem::path> event_cwd(const nlohmann::json& event) {
    const auto it = event.find("cwd");
    if (it == event.end() || !it->is_string()) return std::nullopt;
    const auto& cwd = it->get_ref<const std::string&>();
    if (cwd.empty()) return std::nullopt;
    return std::filesystem::path(cwd);
}

bool is_blank(std::string_view text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
}

} // anonymous namespace

IngestionPipeline::IngestionPipeline(Config config,
                                     LineCursorTracker& cursors,
                                     IEventLog& sink,
                                     IGitContextResolver& git,
                                     const EventRedactor& redactor)
    : config_(std::move(config)),
      cursors_(cursors),
      sink_(sink),
      git_(git),
      redactor_(redactor) {}

bool IngestionPipeline::accepts(const std::filesystem::path& path) const {
    if (path.extension() != config_.extension) return false;
    if (!config_.filter_prefix) return true;
    return utils::relative_name(path, config_.root).starts_with(*config_.filter_prefix);
}

PassResult IngestionPipeline::process_file(const std::filesystem::path& input) {
    const auto path = input.is_absolute() ? input : config_.root / input;

    PassResult result;
    result.file_name = utils::relative_name(path, config_.root);
    if (!accepts(path)) {
        result.skipped = true;
        return result;
    }

    std::lock_guard<std::mutex> lock(pass_mutex_);
    ++passes_;

    try {
        result.previous_cursor = cursors_.get_last_line(result.file_name);
    } catch (const StorageError& e) {
        utils::log::error(std::format("Cannot read cursor for {}: {}", result.file_name, e.what()));
        result.error = e.what();
        ++storage_failures_;
        return result;
    }
    result.cursor = result.previous_cursor;

    const auto content = read_file(path);
    if (!content) {
        utils::log::debug(std::format("Cannot read {}, skipping", result.file_name));
        result.skipped = true;
        return result;
    }

    // Complete lines beyond the cursor
    std::vector<Line> lines;
    int64_t line_number = 0;
    size_t start = 0;
    while (start < content->size()) {
        const size_t nl = content->find('\n', start);
        if (nl == std::string::npos) break;   // unterminated tail, next pass
        ++line_number;
        if (line_number > result.previous_cursor) {
            std::string_view text(content->data() + start, nl - start);
            if (!text.empty() && text.back() == '\r') text.remove_suffix(1);
            lines.push_back({line_number, text});
        }
        start = nl + 1;
    }
    if (lines.empty()) return result;

    result.new_lines = lines.size();
    const int64_t last_attempted = lines.back().number;

    std::vector<NewEvent> events;
    std::vector<nlohmann::json> parsed;
    std::optional<std::filesystem::path> git_dir;

    for (const auto& line : lines) {
        if (is_blank(line.text)) {
            ++result.blank;
            continue;
        }
        auto parsed_line = parse_event_line(line.text);
        if (!parsed_line.json) {
            ++result.malformed;
            ++malformed_lines_;
            utils::log::warn(std::format("Malformed line {}:{}: {}",
                                         result.file_name, line.number, parsed_line.error));
            if (config_.malformed_policy == MalformedLinePolicy::QUARANTINE) {
                quarantine(result.file_name, line.number, line.text, parsed_line.error);
            }
            continue;
        }
        if (!git_dir) git_dir = event_cwd(*parsed_line.json);

        NewEvent event;
        event.file_name = result.file_name;
        event.line_number = line.number;
        event.event_data = std::string(line.text);
        events.push_back(std::move(event));
        parsed.push_back(std::move(*parsed_line.json));
    }
    result.parsed = events.size();

    if (!events.empty()) {
        const auto git = git_.resolve(git_dir.value_or(path.parent_path()));
        for (size_t i = 0; i < events.size(); ++i) {
            events[i].git = git;
            // A non-durable sink holds only what will be sent
            if (!sink_.is_durable()) {
                events[i].event_data = redactor_.redact(parsed[i]).event.dump(
                    -1, ' ', false, nlohmann::json::error_handler_t::replace);
            }
        }

        try {
            result.stored = sink_.insert_batch(events);
        } catch (const StorageError& e) {
            utils::log::error(std::format("Failed to store {} events from {}: {}",
                                          events.size(), result.file_name, e.what()));
            result.error = e.what();
            ++storage_failures_;
            return result;
        }
        events_stored_ += result.stored;
    }

    try {
        cursors_.set_last_line(result.file_name, last_attempted);
        result.cursor = std::max(result.previous_cursor, last_attempted);
    } catch (const StorageError& e) {
        // Events are stored; the next pass re-reads them and the unique key drops duplicates
        utils::log::error(std::format("Failed to advance cursor for {}: {}",
                                      result.file_name, e.what()));
        result.error = e.what();
        ++storage_failures_;
        return result;
    }

    utils::log::info(std::format(
        "{}: {} new lines, {} events stored in {}, {} malformed, cursor {} -> {}",
        result.file_name, result.new_lines, result.stored, sink_.name(),
        result.malformed, result.previous_cursor, result.cursor));
    return result;
}

std::vector<PassResult> IngestionPipeline::process_existing() {
    namespace fs = std::filesystem;
    std::vector<fs::path> files;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(config_.root, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code file_ec;
        if (it->is_regular_file(file_ec) && accepts(it->path())) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        utils::log::warn(std::format("Scan of {} incomplete: {}", config_.root.string(), ec.message()));
    }
    std::sort(files.begin(), files.end());

    utils::log::info(std::format("Processing {} existing file(s) under {}",
                                 files.size(), config_.root.string()));
    std::vector<PassResult> results;
    results.reserve(files.size());
    for (const auto& file : files) {
        results.push_back(process_file(file));
    }
    return results;
}

void IngestionPipeline::quarantine(const std::string& file_name, int64_t line_number,
                                   std::string_view line, const std::string& error) {
    if (config_.quarantine_file.empty()) return;

    nlohmann::json record = {
        {"file_name", file_name},
        {"line_number", line_number},
        {"line", std::string(line)},
        {"error", error},
        {"quarantined_at", utils::format_timestamp(utils::now())},
    };

    std::error_code ec;
    const auto parent = config_.quarantine_file.parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);

    std::ofstream out(config_.quarantine_file, std::ios::out | std::ios::app);
    // Invalid UTF-8 is replaced rather than thrown on
    out << record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    if (!out) {
        utils::log::error(std::format("Cannot append to quarantine file {}",
                                      config_.quarantine_file.string()));
    }
}

IngestionPipeline::Stats IngestionPipeline::stats() const {
    Stats s;
    s.passes = passes_.load();
    s.events_stored = events_stored_.load();
    s.malformed_lines = malformed_lines_.load();
    s.storage_failures = storage_failures_.load();
    return s;
}

} // namespace shiplog
