#pragma once
#include <memory>
#include <string>
#include <vector>
#include "file_insights/types.hpp"

struct sqlite3;

namespace file_insights {
    struct SaveResult {
        std::size_t saved = 0;
        std::vector<std::string> errors;
    };

    class Store {
    public:
        virtual ~Store() = default;
        virtual void initialize(bool rebuild) = 0;
        virtual SaveResult save(const std::vector<FileRecord>& records) = 0;
        virtual std::vector<FileRecord> query(const QueryOptions& options) = 0;
        virtual std::size_t count(bool video_only) = 0;
        virtual std::size_t delete_all() = 0;
    };

    class SqliteStore : public Store {
    public:
        explicit SqliteStore(const std::string& connection);

        void initialize(bool rebuild) override;
        SaveResult save(const std::vector<FileRecord>& records) override;
        std::vector<FileRecord> query(const QueryOptions& options) override;
        std::size_t count(bool video_only) override;
        std::size_t delete_all() override;

    private:
        struct ConnectionDeleter {
            void operator()(sqlite3* db) const noexcept;
        };

        void execute(const std::string& sql);

        std::unique_ptr<sqlite3, ConnectionDeleter> db_;
    };
}
