#include <chrono>
#include <sqlite3.h>
#include "file_insights/store.hpp"
#include "file_insights/errors.hpp"
#include "file_insights/logging.hpp"

namespace file_insights {

    namespace {
        struct StatementDeleter {
            void operator()(sqlite3_stmt* stmt) const noexcept {
                sqlite3_finalize(stmt);
            }
        };

        using StatementPtr = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

        // Rolls the open transaction back unless commit was reached.
        class TransactionGuard {
        public:
            explicit TransactionGuard(sqlite3* db) : db_(db) {}

            ~TransactionGuard() {
                if (committed_) {
                    return;
                }
                if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
                    logger()->warn("Failed to roll back transaction: {}", sqlite3_errmsg(db_));
                }
            }

            TransactionGuard(const TransactionGuard&) = delete;
            TransactionGuard& operator=(const TransactionGuard&) = delete;

            void mark_committed() {
                committed_ = true;
            }

        private:
            sqlite3* db_;
            bool committed_ = false;
        };

        constexpr const char* kCreateSchema = R"(
            CREATE TABLE IF NOT EXISTS files (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                path TEXT NOT NULL,
                name TEXT NOT NULL,
                size INTEGER NOT NULL,
                extension TEXT NOT NULL,
                created_time INTEGER NOT NULL,
                modified_time INTEGER NOT NULL,
                content_preview TEXT,
                mime_type TEXT,
                is_binary INTEGER NOT NULL,
                is_video INTEGER NOT NULL,
                probe_status INTEGER NOT NULL DEFAULT 0,
                checksum TEXT,
                scan_timestamp INTEGER NOT NULL
            );
            CREATE TABLE IF NOT EXISTS video_metadata (
                file_id INTEGER PRIMARY KEY REFERENCES files(id) ON DELETE CASCADE,
                duration REAL,
                resolution_width INTEGER,
                resolution_height INTEGER,
                fps REAL,
                video_codec TEXT,
                audio_codec TEXT
            );
            CREATE INDEX IF NOT EXISTS idx_files_path ON files(path);
            CREATE INDEX IF NOT EXISTS idx_files_is_video ON files(is_video);
        )";

        constexpr const char* kDropSchema = R"(
            DROP TABLE IF EXISTS video_metadata;
            DROP TABLE IF EXISTS files;
        )";

        constexpr const char* kInsertFile = R"(
            INSERT INTO files (
                path, name, size, extension, created_time, modified_time,
                content_preview, mime_type, is_binary, is_video, probe_status, checksum, scan_timestamp
            ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        )";

        constexpr const char* kInsertVideo = R"(
            INSERT INTO video_metadata (
                file_id, duration, resolution_width, resolution_height, fps, video_codec, audio_codec
            ) VALUES (?, ?, ?, ?, ?, ?, ?)
        )";

        std::int64_t to_nanoseconds(TimePoint value) {
            return std::chrono::duration_cast<std::chrono::nanoseconds>(value.time_since_epoch()).count();
        }

        TimePoint from_nanoseconds(std::int64_t value) {
            return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds(value)));
        }

        void bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
            sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
        }

        void bind_optional_text(sqlite3_stmt* stmt, int index, const std::optional<std::string>& value) {
            if (value) {
                bind_text(stmt, index, *value);
            } else {
                sqlite3_bind_null(stmt, index);
            }
        }

        void bind_optional_double(sqlite3_stmt* stmt, int index, const std::optional<double>& value) {
            if (value) {
                sqlite3_bind_double(stmt, index, *value);
            } else {
                sqlite3_bind_null(stmt, index);
            }
        }

        std::optional<std::string> column_text(sqlite3_stmt* stmt, int index) {
            if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
                return std::nullopt;
            }
            const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
            const int length = sqlite3_column_bytes(stmt, index);
            return std::string(text ? text : "", static_cast<std::size_t>(length));
        }

        std::optional<double> column_double(sqlite3_stmt* stmt, int index) {
            if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
                return std::nullopt;
            }
            return sqlite3_column_double(stmt, index);
        }

        ProbeStatus probe_status_from_int(int value) {
            switch (value) {
                case 1: return ProbeStatus::SkippedSmall;
                case 2: return ProbeStatus::Succeeded;
                case 3: return ProbeStatus::Failed;
                default: return ProbeStatus::NotApplicable;
            }
        }

        int probe_status_to_int(ProbeStatus status) {
            switch (status) {
                case ProbeStatus::SkippedSmall: return 1;
                case ProbeStatus::Succeeded: return 2;
                case ProbeStatus::Failed: return 3;
                case ProbeStatus::NotApplicable: break;
            }
            return 0;
        }
    }

    void SqliteStore::ConnectionDeleter::operator()(sqlite3* db) const noexcept {
        sqlite3_close(db);
    }

    SqliteStore::SqliteStore(const std::string& connection) {
        if (connection.empty()) {
            throw StoreError("Database connection string is empty");
        }

        sqlite3* raw = nullptr;
        const int rc = sqlite3_open_v2(connection.c_str(), &raw, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
        db_.reset(raw);
        if (rc != SQLITE_OK) {
            const std::string message = raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc);
            throw StoreError("Failed to open database " + connection + ": " + message);
        }

        execute("PRAGMA foreign_keys=ON;");
        logger()->debug("Opened database {}", connection);
    }

    void SqliteStore::execute(const std::string& sql) {
        char* err = nullptr;
        if (sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
            const std::string message = err ? err : sqlite3_errmsg(db_.get());
            sqlite3_free(err);
            throw StoreError(message);
        }
    }

    void SqliteStore::initialize(bool rebuild) {
        if (rebuild) {
            logger()->warn("Rebuilding database schema; existing records are dropped");
            execute(kDropSchema);
        }
        execute(kCreateSchema);
    }

    SaveResult SqliteStore::save(const std::vector<FileRecord>& records) {
        SaveResult result;
        if (records.empty()) {
            return result;
        }

        auto prepare = [this](const char* sql) {
            sqlite3_stmt* raw = nullptr;
            if (sqlite3_prepare_v2(db_.get(), sql, -1, &raw, nullptr) != SQLITE_OK) {
                throw StoreError(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_.get()));
            }
            return StatementPtr(raw);
        };

        StatementPtr insert_file = prepare(kInsertFile);
        StatementPtr insert_video = prepare(kInsertVideo);
        const std::int64_t scan_timestamp = to_nanoseconds(Clock::now());

        execute("BEGIN TRANSACTION;");
        TransactionGuard transaction(db_.get());
        for (const auto& record : records) {
            // One savepoint per row: a failing row is rolled back alone.
            execute("SAVEPOINT record_row;");
            std::string failure;

            sqlite3_stmt* stmt = insert_file.get();
            sqlite3_reset(stmt);
            sqlite3_clear_bindings(stmt);
            bind_text(stmt, 1, record.path.string());
            bind_text(stmt, 2, record.name());
            sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(record.size));
            bind_text(stmt, 4, record.extension);
            sqlite3_bind_int64(stmt, 5, to_nanoseconds(record.created_time));
            sqlite3_bind_int64(stmt, 6, to_nanoseconds(record.modified_time));
            bind_optional_text(stmt, 7, record.content_preview);
            bind_optional_text(stmt, 8, record.mime_type);
            sqlite3_bind_int(stmt, 9, record.is_binary ? 1 : 0);
            sqlite3_bind_int(stmt, 10, record.is_video ? 1 : 0);
            sqlite3_bind_int(stmt, 11, probe_status_to_int(record.probe_status));
            bind_optional_text(stmt, 12, record.checksum);
            sqlite3_bind_int64(stmt, 13, scan_timestamp);

            if (sqlite3_step(stmt) != SQLITE_DONE) {
                failure = sqlite3_errmsg(db_.get());
            } else if (record.has_video_metadata()) {
                const sqlite3_int64 file_id = sqlite3_last_insert_rowid(db_.get());
                sqlite3_stmt* video = insert_video.get();
                sqlite3_reset(video);
                sqlite3_clear_bindings(video);
                sqlite3_bind_int64(video, 1, file_id);
                bind_optional_double(video, 2, record.video.duration);
                if (record.video.resolution) {
                    sqlite3_bind_int(video, 3, record.video.resolution->width);
                    sqlite3_bind_int(video, 4, record.video.resolution->height);
                } else {
                    sqlite3_bind_null(video, 3);
                    sqlite3_bind_null(video, 4);
                }
                bind_optional_double(video, 5, record.video.fps);
                bind_optional_text(video, 6, record.video.video_codec);
                bind_optional_text(video, 7, record.video.audio_codec);
                if (sqlite3_step(video) != SQLITE_DONE) {
                    failure = sqlite3_errmsg(db_.get());
                }
            }

            sqlite3_reset(insert_file.get());
            sqlite3_reset(insert_video.get());

            if (failure.empty()) {
                execute("RELEASE SAVEPOINT record_row;");
                ++result.saved;
            } else {
                execute("ROLLBACK TO SAVEPOINT record_row;");
                execute("RELEASE SAVEPOINT record_row;");
                result.errors.push_back("Failed to save " + record.path.string() + ": " + failure);
            }
        }
        execute("COMMIT;");
        transaction.mark_committed();

        logger()->debug("Saved {} of {} record(s)", result.saved, records.size());
        return result;
    }

    std::vector<FileRecord> SqliteStore::query(const QueryOptions& options) {
        std::string sql = R"(
            SELECT f.path, f.size, f.extension, f.created_time, f.modified_time,
                   f.content_preview, f.mime_type, f.is_binary, f.is_video, f.probe_status, f.checksum,
                   v.duration, v.resolution_width, v.resolution_height, v.fps, v.video_codec, v.audio_codec
            FROM files f
            LEFT JOIN video_metadata v ON f.id = v.file_id
            WHERE 1=1
        )";
        if (options.video_only) {
            sql += " AND f.is_video = 1";
        }
        if (!options.extensions.empty()) {
            sql += " AND f.extension IN (";
            for (std::size_t i = 0; i < options.extensions.size(); ++i) {
                sql += i == 0 ? "?" : ", ?";
            }
            sql += ")";
        }
        sql += " ORDER BY f.path LIMIT ?";

        sqlite3_stmt* raw = nullptr;
        if (sqlite3_prepare_v2(db_.get(), sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
            throw StoreError(std::string("Failed to prepare query: ") + sqlite3_errmsg(db_.get()));
        }
        StatementPtr stmt(raw);

        int index = 1;
        for (const auto& extension : options.extensions) {
            bind_text(stmt.get(), index++, extension);
        }
        sqlite3_bind_int64(stmt.get(), index, static_cast<sqlite3_int64>(options.limit));

        std::vector<FileRecord> records;
        int rc = SQLITE_OK;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            FileRecord record;
            record.path = column_text(stmt.get(), 0).value_or("");
            record.size = static_cast<uintmax_t>(sqlite3_column_int64(stmt.get(), 1));
            record.extension = column_text(stmt.get(), 2).value_or("");
            record.created_time = from_nanoseconds(sqlite3_column_int64(stmt.get(), 3));
            record.modified_time = from_nanoseconds(sqlite3_column_int64(stmt.get(), 4));
            record.content_preview = column_text(stmt.get(), 5);
            record.mime_type = column_text(stmt.get(), 6);
            record.is_binary = sqlite3_column_int(stmt.get(), 7) != 0;
            record.is_video = sqlite3_column_int(stmt.get(), 8) != 0;
            record.probe_status = probe_status_from_int(sqlite3_column_int(stmt.get(), 9));
            record.checksum = column_text(stmt.get(), 10);

            record.video.duration = column_double(stmt.get(), 11);
            if (sqlite3_column_type(stmt.get(), 12) != SQLITE_NULL && sqlite3_column_type(stmt.get(), 13) != SQLITE_NULL) {
                record.video.resolution = Resolution {sqlite3_column_int(stmt.get(), 12), sqlite3_column_int(stmt.get(), 13)};
            }
            record.video.fps = column_double(stmt.get(), 14);
            record.video.video_codec = column_text(stmt.get(), 15);
            record.video.audio_codec = column_text(stmt.get(), 16);
            records.push_back(std::move(record));
        }
        if (rc != SQLITE_DONE) {
            throw StoreError(std::string("Query failed: ") + sqlite3_errmsg(db_.get()));
        }
        return records;
    }

    std::size_t SqliteStore::count(bool video_only) {
        const char* sql = video_only
            ? "SELECT COUNT(*) FROM files WHERE is_video = 1"
            : "SELECT COUNT(*) FROM files";

        sqlite3_stmt* raw = nullptr;
        if (sqlite3_prepare_v2(db_.get(), sql, -1, &raw, nullptr) != SQLITE_OK) {
            throw StoreError(std::string("Failed to count files: ") + sqlite3_errmsg(db_.get()));
        }
        StatementPtr stmt(raw);
        if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
            throw StoreError(std::string("Failed to count files: ") + sqlite3_errmsg(db_.get()));
        }
        return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
    }

    std::size_t SqliteStore::delete_all() {
        const std::size_t existing = count(false);
        // video_metadata rows follow through ON DELETE CASCADE.
        execute("DELETE FROM files;");
        return existing;
    }
}
