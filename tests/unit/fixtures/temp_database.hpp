#pragma once

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <unistd.h>

#include "storage/database.hpp"

namespace devauth::tests {

namespace fs = std::filesystem;

// Fresh SQLite file under the temp directory, removed with its WAL files
class TempDatabase {
public:
    explicit TempDatabase(int busy_timeout_ms = 5000) {
        static std::atomic<int> counter{0};
        path_ = (fs::temp_directory_path() /
                 ("devauth_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++) + ".db"))
                    .string();
        remove_files();

        storage::DatabaseOptions options;
        options.path = path_;
        options.busy_timeout_ms = busy_timeout_ms;
        database_ = std::make_unique<storage::Database>(options);

        std::string error;
        initialized_ = database_->initialize(error);
        EXPECT_TRUE(initialized_) << error;
    }

    ~TempDatabase() {
        database_.reset();
        remove_files();
    }

    TempDatabase(const TempDatabase &) = delete;
    TempDatabase &operator=(const TempDatabase &) = delete;

    storage::Database &db() { return *database_; }
    const std::string &path() const { return path_; }
    bool initialized() const { return initialized_; }

private:
    void remove_files() {
        std::error_code ec;
        fs::remove(path_, ec);
        fs::remove(path_ + "-wal", ec);
        fs::remove(path_ + "-shm", ec);
    }

    std::string path_;
    std::unique_ptr<storage::Database> database_;
    bool initialized_ = false;
};

}  // namespace devauth::tests
