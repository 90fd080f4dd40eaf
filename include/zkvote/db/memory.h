// ZKVOTE - In-Memory Database
// Copyright (c) 2024 ZKVOTE Developers
// MIT License
//
// Ordered in-memory implementation of the database interface, used by tests
// and by sessions started with -inmemory.

#ifndef ZKVOTE_DB_MEMORY_H
#define ZKVOTE_DB_MEMORY_H

#include "zkvote/db/database.h"
#include <map>
#include <mutex>

namespace zkvote {
namespace db {

class MemoryDatabase : public Database {
private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;

    /// When set, Write() fails with this status (fault injection for tests)
    std::optional<Status> failWrites_;

public:
    MemoryDatabase() = default;

    using Database::Get;
    using Database::Put;
    using Database::Delete;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;

    /// Iterates over a snapshot taken at creation time
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_.size();
    }

    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        data_.clear();
    }

    /// Make subsequent batch writes fail with the given status
    void FailWrites(std::optional<Status> status) {
        std::lock_guard<std::mutex> lock(mutex_);
        failWrites_ = std::move(status);
    }
};

/**
 * Iterator over a private copy of a MemoryDatabase.
 */
class MemoryIterator : public Iterator {
private:
    std::map<std::string, std::string> data_;
    std::map<std::string, std::string>::const_iterator iter_;

public:
    explicit MemoryIterator(std::map<std::string, std::string> data)
        : data_(std::move(data)), iter_(data_.end()) {}

    bool Valid() const override { return iter_ != data_.end(); }

    void SeekToFirst() override { iter_ = data_.begin(); }

    void Seek(const Slice& target) override {
        iter_ = data_.lower_bound(target.ToString());
    }

    void Next() override {
        if (iter_ != data_.end()) {
            ++iter_;
        }
    }

    Slice key() const override { return Slice(iter_->first); }
    Slice value() const override { return Slice(iter_->second); }
    Status status() const override { return Status::Ok(); }
};

} // namespace db
} // namespace zkvote

#endif // ZKVOTE_DB_MEMORY_H
