#pragma once

#include "../types.hpp"
#include "../run.hpp"
#include "../run_artifact.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace conclave {
namespace storage {

/**
 * @brief A run as stored in the archive
 */
struct ArchivedRun {
    int64_t id = 0;
    std::string started_at;      ///< UTC ISO-8601
    std::string prompt;
    std::string stage;           ///< Terminal stage name ("done" / "failed")
    bool succeeded = false;
    int64_t total_ms = 0;
    nlohmann::json artifact;     ///< Full run document (see run_to_json)
};

/**
 * @brief Durable SQLite store of completed runs.
 *
 * Every recorded run keeps its summary columns plus the complete JSON
 * artifact, so past debates can be listed and inspected later.
 */
class RunArchive {
public:
    ~RunArchive() {
        if (stmt_insert_ != nullptr) {
            sqlite3_finalize(stmt_insert_);
            stmt_insert_ = nullptr;
        }
        if (stmt_get_ != nullptr) {
            sqlite3_finalize(stmt_get_);
            stmt_get_ = nullptr;
        }
        if (stmt_recent_ != nullptr) {
            sqlite3_finalize(stmt_recent_);
            stmt_recent_ = nullptr;
        }
        if (stmt_size_ != nullptr) {
            sqlite3_finalize(stmt_size_);
            stmt_size_ = nullptr;
        }

        if (db_ != nullptr) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    RunArchive(const RunArchive&) = delete;
    RunArchive& operator=(const RunArchive&) = delete;

    /**
     * @brief Open (and create if needed) an archive at @p path
     *
     * ":memory:" gives a private in-memory archive.
     */
    static Expected<std::shared_ptr<RunArchive>> open(const std::string& path) {
        if (path.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Archive path cannot be empty"});
        }

        sqlite3* db = nullptr;
        if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
            std::string message = "Failed to open run archive";
            if (db != nullptr && sqlite3_errmsg(db) != nullptr) {
                message += std::string(": ") + sqlite3_errmsg(db);
            }
            if (db != nullptr) {
                sqlite3_close(db);
            }
            return tl::unexpected(Error{ErrorCode::ArchiveOpenFailed, std::move(message), path});
        }

        auto instance = std::shared_ptr<RunArchive>(new RunArchive(db, path));
        auto init_result = instance->initialize_schema();
        if (!init_result) {
            return tl::unexpected(init_result.error());
        }
        return instance;
    }

    /**
     * @brief Store a finished run
     *
     * @return Row id of the stored run
     */
    Expected<int64_t> record(const PipelineRun& run) {
        const std::string started_at = format_timestamp(run.started_at);
        std::string artifact;
        try {
            artifact = dump_run(run);
        } catch (const nlohmann::json::exception& e) {
            return tl::unexpected(Error{ErrorCode::ArchiveWriteFailed,
                                        std::string("Cannot serialize run: ") + e.what(), db_path_});
        }
        const char* stage = stage_to_string(run.stage);

        std::lock_guard<std::mutex> lock(mutex_);

        sqlite3_bind_text(stmt_insert_, 1, started_at.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt_insert_, 2, run.prompt.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt_insert_, 3, stage, -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt_insert_, 4, run.succeeded() ? 1 : 0);
        sqlite3_bind_int64(stmt_insert_, 5, static_cast<sqlite3_int64>(run.timings.total.count()));
        sqlite3_bind_text(stmt_insert_, 6, artifact.c_str(), -1, SQLITE_TRANSIENT);

        const int rc = sqlite3_step(stmt_insert_);
        sqlite3_reset(stmt_insert_);
        sqlite3_clear_bindings(stmt_insert_);
        if (rc != SQLITE_DONE) {
            return tl::unexpected(make_sql_error(ErrorCode::ArchiveWriteFailed, "Failed to insert run"));
        }
        return static_cast<int64_t>(sqlite3_last_insert_rowid(db_));
    }

    /**
     * @brief Fetch one run by id
     *
     * @return The run, std::nullopt if no such id, or ArchiveReadFailed
     */
    Expected<std::optional<ArchivedRun>> get(int64_t id) const {
        std::lock_guard<std::mutex> lock(mutex_);

        sqlite3_bind_int64(stmt_get_, 1, static_cast<sqlite3_int64>(id));
        auto rows = read_rows(stmt_get_);
        sqlite3_reset(stmt_get_);
        sqlite3_clear_bindings(stmt_get_);
        if (!rows) {
            return tl::unexpected(rows.error());
        }
        if (rows->empty()) {
            return std::optional<ArchivedRun>{};
        }
        return std::optional<ArchivedRun>{std::move(rows->front())};
    }

    /**
     * @brief Most recent runs first
     */
    Expected<std::vector<ArchivedRun>> list_recent(int limit) const {
        std::lock_guard<std::mutex> lock(mutex_);

        sqlite3_bind_int(stmt_recent_, 1, limit > 0 ? limit : 1);
        auto rows = read_rows(stmt_recent_);
        sqlite3_reset(stmt_recent_);
        sqlite3_clear_bindings(stmt_recent_);
        return rows;
    }

    Expected<size_t> size() const {
        std::lock_guard<std::mutex> lock(mutex_);

        size_t count = 0;
        if (sqlite3_step(stmt_size_) == SQLITE_ROW) {
            count = static_cast<size_t>(sqlite3_column_int64(stmt_size_, 0));
        }
        sqlite3_reset(stmt_size_);
        return count;
    }

    const std::string& path() const { return db_path_; }

private:
    RunArchive(sqlite3* db, std::string db_path)
        : db_(db)
        , db_path_(std::move(db_path))
    {}

    Expected<void> initialize_schema() {
        char* err_msg = nullptr;
        constexpr const char* schema_sql =
            "CREATE TABLE IF NOT EXISTS runs("
            "id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "started_at TEXT NOT NULL,"
            "prompt TEXT NOT NULL,"
            "stage TEXT NOT NULL,"
            "succeeded INTEGER NOT NULL,"
            "total_ms INTEGER NOT NULL,"
            "artifact TEXT NOT NULL"
            ")";
        if (sqlite3_exec(db_, schema_sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
            std::string message = err_msg != nullptr ? err_msg : "Unknown SQLite error";
            sqlite3_free(err_msg);
            return tl::unexpected(Error{ErrorCode::ArchiveOpenFailed, std::move(message), db_path_});
        }

        constexpr const char* insert_sql =
            "INSERT INTO runs(started_at, prompt, stage, succeeded, total_ms, artifact) "
            "VALUES (?1, ?2, ?3, ?4, ?5, ?6)";
        constexpr const char* columns =
            "SELECT id, started_at, prompt, stage, succeeded, total_ms, artifact FROM runs ";
        const std::string get_sql = std::string(columns) + "WHERE id = ?1";
        const std::string recent_sql = std::string(columns) + "ORDER BY id DESC LIMIT ?1";
        constexpr const char* size_sql = "SELECT COUNT(*) FROM runs";

        if (sqlite3_prepare_v2(db_, insert_sql, -1, &stmt_insert_, nullptr) != SQLITE_OK ||
            sqlite3_prepare_v2(db_, get_sql.c_str(), -1, &stmt_get_, nullptr) != SQLITE_OK ||
            sqlite3_prepare_v2(db_, recent_sql.c_str(), -1, &stmt_recent_, nullptr) != SQLITE_OK ||
            sqlite3_prepare_v2(db_, size_sql, -1, &stmt_size_, nullptr) != SQLITE_OK) {
            return tl::unexpected(make_sql_error(ErrorCode::ArchiveOpenFailed, "Failed to prepare archive statements"));
        }
        return {};
    }

    Expected<std::vector<ArchivedRun>> read_rows(sqlite3_stmt* stmt) const {
        std::vector<ArchivedRun> runs;
        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            ArchivedRun run;
            run.id = static_cast<int64_t>(sqlite3_column_int64(stmt, 0));
            run.started_at = column_text(stmt, 1);
            run.prompt = column_text(stmt, 2);
            run.stage = column_text(stmt, 3);
            run.succeeded = sqlite3_column_int(stmt, 4) != 0;
            run.total_ms = static_cast<int64_t>(sqlite3_column_int64(stmt, 5));
            try {
                run.artifact = nlohmann::json::parse(column_text(stmt, 6));
            } catch (const nlohmann::json::exception& e) {
                return tl::unexpected(Error{ErrorCode::ArchiveReadFailed,
                                            "Stored artifact is not valid JSON",
                                            "run " + std::to_string(run.id) + ": " + e.what()});
            }
            runs.push_back(std::move(run));
        }
        if (rc != SQLITE_DONE) {
            return tl::unexpected(make_sql_error(ErrorCode::ArchiveReadFailed, "Failed to read runs"));
        }
        return runs;
    }

    static std::string column_text(sqlite3_stmt* stmt, int column) {
        const unsigned char* raw = sqlite3_column_text(stmt, column);
        return raw != nullptr ? std::string(reinterpret_cast<const char*>(raw)) : std::string();
    }

    Error make_sql_error(ErrorCode code, const std::string& prefix) const {
        return Error{code, prefix + ": " + sqlite3_errmsg(db_), db_path_};
    }

    sqlite3* db_ = nullptr;
    std::string db_path_;
    mutable std::mutex mutex_;

    sqlite3_stmt* stmt_insert_ = nullptr;
    mutable sqlite3_stmt* stmt_get_ = nullptr;
    mutable sqlite3_stmt* stmt_recent_ = nullptr;
    mutable sqlite3_stmt* stmt_size_ = nullptr;
};

} // namespace storage
} // namespace conclave
