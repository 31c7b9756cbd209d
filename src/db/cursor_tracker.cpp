#include "db/cursor_tracker.hpp"
#include "db/schema.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <format>
#include <fstream>
#include <mutex>
#include <utility>
#include <vector>

namespace shiplog {

namespace {

constexpr std::string_view kUpsertSql = R"(
INSERT INTO conversation_file_state (file_name, last_line, updated_at)
VALUES (?, ?, CURRENT_TIMESTAMP)
ON CONFLICT(file_name) DO UPDATE SET
    last_line = MAX(last_line, excluded.last_line),
    updated_at = CURRENT_TIMESTAMP)";

} // anonymous namespace

LineCursorTracker::LineCursorTracker(SqliteDatabase& db) : db_(db) {
    if (!db_.read_only()) {
        std::lock_guard<std::mutex> lock(db_.write_mutex());
        db_.exec(schema::kFileStateDdl);
    }
}

int64_t LineCursorTracker::get_last_line(const std::string& file_name) {
    std::lock_guard<std::mutex> lock(db_.write_mutex());
    auto stmt = db_.prepare("SELECT last_line FROM conversation_file_state WHERE file_name = ?");
    stmt.bind(1, file_name);
    return stmt.step() ? stmt.column_int64(0) : 0;
}

void LineCursorTracker::set_last_line(const std::string& file_name, int64_t line) {
    std::lock_guard<std::mutex> lock(db_.write_mutex());
    upsert_locked(file_name, line);
}

void LineCursorTracker::upsert_locked(const std::string& file_name, int64_t line) {
    auto stmt = db_.prepare(kUpsertSql);
    stmt.bind(1, file_name).bind(2, std::max<int64_t>(line, 0));
    stmt.run();
}

std::optional<int64_t> LineCursorTracker::count_complete_lines(const std::filesystem::path& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in) return std::nullopt;

    int64_t count = 0;
    char buf[64 * 1024];
    while (in.read(buf, sizeof(buf)) || in.gcount() > 0) {
        count += std::count(buf, buf + in.gcount(), '\n');
    }
    if (in.bad()) return std::nullopt;
    return count;
}

size_t LineCursorTracker::fast_forward_all(const std::filesystem::path& root,
                                           const std::string& extension,
                                           const std::optional<std::string>& filter_prefix) {
    namespace fs = std::filesystem;
    utils::log::info("Skipping backlog: fast-forwarding cursors to current file ends");

    std::vector<std::pair<std::string, int64_t>> updates;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code file_ec;
        if (!it->is_regular_file(file_ec) || it->path().extension() != extension) continue;

        const std::string name = utils::relative_name(it->path(), root);
        if (filter_prefix && !name.starts_with(*filter_prefix)) continue;

        const auto lines = count_complete_lines(it->path());
        if (!lines) {
            utils::log::error(std::format("Cannot read {} while fast-forwarding", name));
            continue;
        }
        if (*lines > 0) {
            updates.emplace_back(name, *lines);
            utils::log::debug(std::format("Skipped {} lines in {}", *lines, name));
        }
    }
    if (ec) {
        utils::log::warn(std::format("Directory scan of {} stopped early: {}",
                                     root.string(), ec.message()));
    }

    if (!updates.empty()) {
        std::lock_guard<std::mutex> lock(db_.write_mutex());
        Transaction txn(db_);
        for (const auto& [name, lines] : updates) {
            upsert_locked(name, lines);
        }
        txn.commit();
    }

    utils::log::info(std::format(
        "Fast-forwarded {} file(s); monitoring starts from the current position", updates.size()));
    return updates.size();
}

int64_t LineCursorTracker::file_count() {
    std::lock_guard<std::mutex> lock(db_.write_mutex());
    auto stmt = db_.prepare("SELECT COUNT(*) FROM conversation_file_state");
    return stmt.step() ? stmt.column_int64(0) : 0;
}

size_t LineCursorTracker::import_legacy_snapshot(const std::filesystem::path& snapshot) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (!fs::exists(snapshot, ec)) return 0;

    nlohmann::json legacy;
    {
        std::ifstream in(snapshot);
        legacy = nlohmann::json::parse(in, nullptr, false);
    }
    if (legacy.is_discarded() || !legacy.is_object()) {
        utils::log::warn(std::format("Could not import legacy cursor snapshot {}: not a JSON object",
                                     snapshot.string()));
        return 0;
    }
    if (legacy.empty()) return 0;

    size_t imported = 0;
    {
        std::lock_guard<std::mutex> lock(db_.write_mutex());
        int64_t existing = 0;
        {
            auto count = db_.prepare("SELECT COUNT(*) FROM conversation_file_state");
            if (count.step()) existing = count.column_int64(0);
        }
        if (existing > 0) {
            utils::log::debug("Cursor table already populated, skipping legacy snapshot");
            return 0;
        }

        utils::log::info(std::format("Importing {} cursors from {}", legacy.size(), snapshot.string()));
        Transaction txn(db_);
        for (const auto& [name, value] : legacy.items()) {
            if (!value.is_number_integer()) {
                utils::log::warn(std::format("Ignoring non-integer cursor for {}", name));
                continue;
            }
            upsert_locked(name, value.get<int64_t>());
            ++imported;
        }
        txn.commit();
    }

    const auto backup = fs::path(snapshot.string() + ".bak");
    fs::rename(snapshot, backup, ec);
    if (ec) {
        utils::log::warn(std::format("Could not archive {}: {}", snapshot.string(), ec.message()));
    } else {
        utils::log::info(std::format("Legacy cursor snapshot archived to {}", backup.string()));
    }
    return imported;
}

} // namespace shiplog
