#include "db/schema_migrator.hpp"
#include "db/schema.hpp"
#include "event/event_parser.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <mutex>

namespace shiplog {

namespace {

struct AddedColumn {
    std::string_view name;
    std::string_view decl;
};

// Columns that later versions added to existing files with ALTER TABLE
constexpr AddedColumn kAlterColumns[] = {
    {"git_remote_url", "TEXT"},
    {"git_commit_hash", "TEXT"},
    {"synced_at", "TIMESTAMP DEFAULT NULL"},
};

const SchemaMigrator::ColumnInfo* find_column(
    const std::vector<SchemaMigrator::ColumnInfo>& columns, std::string_view name) {
    const auto it = std::find_if(columns.begin(), columns.end(),
        [name](const auto& c) { return c.name == name; });
    return it == columns.end() ? nullptr : &*it;
}

} // anonymous namespace

SchemaMigrator::SchemaMigrator(SqliteDatabase& db) : db_(db) {}

std::vector<SchemaMigrator::ColumnInfo> SchemaMigrator::table_columns(std::string_view table) {
    std::vector<ColumnInfo> columns;
    auto stmt = db_.prepare(std::format("PRAGMA table_xinfo({})", table));
    while (stmt.step()) {
        ColumnInfo info;
        info.name = stmt.column_text(1);
        info.type = stmt.column_text(2);
        info.hidden = static_cast<int>(stmt.column_int64(6));
        columns.push_back(std::move(info));
    }
    return columns;
}

// ============================================================================
// Migration steps
// ============================================================================

SchemaMigrator::Report SchemaMigrator::migrate() {
    Report report;
    std::lock_guard<std::mutex> lock(db_.write_mutex());

    {
        Transaction txn(db_);
        create_base_tables();
        report.added_columns = add_missing_columns();
        if (needs_rebuild()) {
            rebuild_events_table(report);
        }
        create_indexes();
        txn.commit();
    }

    try {
        Transaction txn(db_);
        ensure_fts(report);
        txn.commit();
        report.fts_available = true;
    } catch (const StorageError& e) {
        // Search is optional; ingestion does not depend on it
        utils::log::warn(std::format("Full-text index unavailable: {}", e.what()));
    }

    if (report.rebuilt_events_table) {
        utils::log::info(std::format(
            "Migrated {}: {} rows recomputed, {} views restored",
            schema::kEventsTable, report.rows_recomputed, report.views_restored));
    }
    return report;
}

void SchemaMigrator::create_base_tables() {
    db_.exec(schema::events_table_ddl(schema::kEventsTable));
    db_.exec(schema::kFileStateDdl);
}

bool SchemaMigrator::add_missing_columns() {
    const auto columns = table_columns(schema::kEventsTable);
    bool added = false;
    for (const auto& col : kAlterColumns) {
        if (find_column(columns, col.name)) continue;
        db_.exec(std::format("ALTER TABLE {} ADD COLUMN {} {}",
                             schema::kEventsTable, col.name, col.decl));
        utils::log::info(std::format("Added column {}.{}", schema::kEventsTable, col.name));
        added = true;
    }
    return added;
}

bool SchemaMigrator::needs_rebuild() {
    const auto columns = table_columns(schema::kEventsTable);
    for (const auto name : schema::kDerivedColumns) {
        const auto* col = find_column(columns, name);
        if (!col) return true;
        if (col->hidden == 2 || col->hidden == 3) return true;
    }
    return false;
}

void SchemaMigrator::rebuild_events_table(Report& report) {
    utils::log::info(std::format("Rebuilding {} with derived columns", schema::kEventsTable));

    // Views referencing the table would block DROP/RENAME
    std::vector<SavedView> views;
    {
        auto stmt = db_.prepare(
            "SELECT name, sql FROM sqlite_master WHERE type = 'view' AND sql LIKE ?");
        stmt.bind(1, std::format("%{}%", schema::kEventsTable));
        while (stmt.step()) {
            views.push_back({stmt.column_text(0), stmt.column_text(1)});
        }
    }
    for (const auto& view : views) {
        db_.exec(std::format("DROP VIEW IF EXISTS \"{}\"", view.name));
    }

    db_.exec(std::format("DROP TABLE IF EXISTS {}", schema::kEventsShadowTable));
    db_.exec(schema::events_table_ddl(schema::kEventsShadowTable));

    // Statements must be finalized before the old table is dropped
    size_t rows = 0;
    {
        auto select = db_.prepare(std::format(
            "SELECT id, file_name, line_number, event_data, user_name, inserted_at, "
            "git_remote_url, git_commit_hash, synced_at FROM {} ORDER BY id",
            schema::kEventsTable));
        auto insert = db_.prepare(std::format(
            "INSERT INTO {} (id, file_name, line_number, event_data, user_name, inserted_at, "
            "event_type, event_message, event_git_branch, event_session_id, event_uuid, "
            "event_timestamp, event_model, event_input_tokens, "
            "event_cache_creation_input_tokens, event_cache_read_input_tokens, "
            "event_output_tokens, git_remote_url, git_commit_hash, synced_at) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
            schema::kEventsShadowTable));

        while (select.step()) {
            const std::string event_data = select.column_text(3);
            const auto derived = extract_derived_fields(std::string_view(event_data));

            insert.bind(1, select.column_int64(0))
                  .bind(2, select.column_text(1))
                  .bind(3, select.column_int64(2))
                  .bind(4, event_data)
                  .bind(5, select.column_text(4))
                  .bind(6, select.column_optional_text(5))
                  .bind(7, derived.type)
                  .bind(8, derived.message)
                  .bind(9, derived.git_branch)
                  .bind(10, derived.session_id)
                  .bind(11, derived.uuid)
                  .bind(12, derived.timestamp)
                  .bind(13, derived.model)
                  .bind(14, derived.input_tokens)
                  .bind(15, derived.cache_creation_input_tokens)
                  .bind(16, derived.cache_read_input_tokens)
                  .bind(17, derived.output_tokens)
                  .bind(18, select.column_optional_text(6))
                  .bind(19, select.column_optional_text(7))
                  .bind(20, select.column_optional_text(8));
            insert.run();
            insert.reset();
            ++rows;
        }
    }

    db_.exec(std::format("DROP TABLE {}", schema::kEventsTable));
    db_.exec(std::format("ALTER TABLE {} RENAME TO {}",
                         schema::kEventsShadowTable, schema::kEventsTable));

    for (const auto& view : views) {
        db_.exec(view.sql);
    }

    report.rebuilt_events_table = true;
    report.rows_recomputed = rows;
    report.views_restored = views.size();
}

void SchemaMigrator::create_indexes() {
    for (const auto& idx : schema::kEventIndexes) {
        db_.exec(std::format("CREATE INDEX IF NOT EXISTS {} ON {}({})",
                             idx.name, schema::kEventsTable, idx.column));
    }
}

void SchemaMigrator::ensure_fts(Report& report) {
    const bool existed = db_.table_exists(schema::kFtsTable);

    // Older files used triggers that deleted from the index directly
    bool stale_triggers = false;
    {
        auto stmt = db_.prepare(
            "SELECT sql FROM sqlite_master WHERE type = 'trigger' AND name = 'messages_fts_delete'");
        if (stmt.step() && stmt.column_text(0).find("'delete'") == std::string::npos) {
            stale_triggers = true;
        }
    }
    if (stale_triggers || report.rebuilt_events_table) {
        db_.exec(schema::kDropFtsTriggers);
    }

    db_.exec(schema::kFtsDdl);
    db_.exec(schema::kFtsTriggersDdl);

    bool rebuild = !existed || stale_triggers || report.rebuilt_events_table;
    if (!rebuild) {
        auto indexed = db_.prepare(std::format("SELECT COUNT(*) FROM {}_docsize", schema::kFtsTable));
        auto messages = db_.prepare(std::format(
            "SELECT COUNT(*) FROM {} WHERE event_message IS NOT NULL", schema::kEventsTable));
        const int64_t indexed_rows = indexed.step() ? indexed.column_int64(0) : 0;
        const int64_t message_rows = messages.step() ? messages.column_int64(0) : 0;
        rebuild = indexed_rows == 0 && message_rows > 0;
    }

    if (rebuild) {
        db_.exec(schema::kFtsRebuild);
        report.fts_rebuilt = true;
        utils::log::info(std::format("Rebuilt full-text index {}", schema::kFtsTable));
    }
}

// ============================================================================
// Schema documentation
// ============================================================================

bool SchemaMigrator::export_schema_docs(const std::string& path) {
    std::string doc = "# shiplog database schema\n\n";
    doc += std::format("Generated {}\n", utils::format_timestamp(utils::now()));

    try {
        std::vector<std::string> tables;
        {
            auto stmt = db_.prepare(
                "SELECT name FROM sqlite_master WHERE type = 'table' "
                "AND name NOT LIKE 'sqlite_%' AND name NOT LIKE 'messages_fts_%' ORDER BY name");
            while (stmt.step()) tables.push_back(stmt.column_text(0));
        }

        for (const auto& table : tables) {
            doc += std::format("\n## {}\n\n| column | type |\n|---|---|\n", table);
            for (const auto& col : table_columns(table)) {
                doc += std::format("| {} | {} |\n", col.name, col.type.empty() ? "-" : col.type);
            }

            auto idx = db_.prepare(
                "SELECT name FROM sqlite_master WHERE type = 'index' AND tbl_name = ? "
                "AND sql IS NOT NULL ORDER BY name");
            idx.bind(1, table);
            std::string indexes;
            while (idx.step()) {
                indexes += std::format("- `{}`\n", idx.column_text(0));
            }
            if (!indexes.empty()) doc += "\nIndexes:\n\n" + indexes;
        }
    } catch (const StorageError& e) {
        utils::log::error(std::format("Cannot read schema for docs: {}", e.what()));
        return false;
    }

    std::error_code ec;
    const auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);

    std::ofstream out(path, std::ios::out | std::ios::trunc);
    out << doc;
    out.close();
    if (!out) {
        utils::log::error(std::format("Cannot write schema docs to {}", path));
        return false;
    }
    utils::log::info(std::format("Wrote schema docs to {}", path));
    return true;
}

} // namespace shiplog
