#pragma once

#include "db/sqlite_database.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace shiplog {

/**
 * @brief Brings a store file of any earlier layout up to the current schema.
 *
 * Steps run in order and each is a no-op when already applied:
 *   1. create the base tables
 *   2. add provenance and synced_at columns missing from older files
 *   3. rebuild the events table through a shadow table when a derived
 *      column is missing or was declared as an engine-generated column,
 *      recomputing derived values and restoring dependent views
 *   4. create the full-text index and its triggers, repopulating it when
 *      new, stale, or empty while messages exist
 */
class SchemaMigrator {
public:
    struct ColumnInfo {
        std::string name;
        std::string type;
        int hidden = 0;   // 2 = virtual generated, 3 = stored generated
    };

    struct Report {
        bool added_columns = false;
        bool rebuilt_events_table = false;
        size_t rows_recomputed = 0;
        size_t views_restored = 0;
        bool fts_available = false;
        bool fts_rebuilt = false;
    };

    explicit SchemaMigrator(SqliteDatabase& db);

    /**
     * @brief Run all migration steps.
     * @throws StorageError when the events table cannot be brought up to date
     */
    Report migrate();

    /**
     * @brief Write a Markdown summary of tables, columns and indexes.
     * @return false if the file cannot be written
     */
    bool export_schema_docs(const std::string& path);

    [[nodiscard]] std::vector<ColumnInfo> table_columns(std::string_view table);

private:
    struct SavedView {
        std::string name;
        std::string sql;
    };

    void create_base_tables();
    bool add_missing_columns();
    [[nodiscard]] bool needs_rebuild();
    void rebuild_events_table(Report& report);
    void create_indexes();
    void ensure_fts(Report& report);

    SqliteDatabase& db_;
};

} // namespace shiplog
