// VFACE - Database Implementation
// Copyright (c) 2024 VFACE Developers
// MIT License

#include "vface/db/database.h"

#include <leveldb/cache.h>
#include <leveldb/db.h>
#include <leveldb/filter_policy.h>
#include <leveldb/write_batch.h>

#include <map>
#include <mutex>
#include <system_error>

namespace vface {
namespace db {

std::string Status::ToString() const {
    const char* name = "OK";
    switch (code_) {
        case OK:         return name;
        case NOT_FOUND:  name = "NotFound"; break;
        case CORRUPTION: name = "Corruption"; break;
        case IO_ERROR:   name = "IO error"; break;
    }
    return message_.empty() ? std::string(name) : std::string(name) + ": " + message_;
}

Status Database::ScanPrefix(
    const Slice& prefix,
    const std::function<bool(const Slice& key, const Slice& value)>& visitor) {

    auto iter = NewIterator();
    for (iter->Seek(prefix); iter->Valid() && iter->key().starts_with(prefix); iter->Next()) {
        if (!visitor(iter->key(), iter->value())) {
            break;
        }
    }
    return iter->status();
}

namespace {

// ============================================================================
// LevelDB Backend
// ============================================================================

Status FromLevelDB(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    return Status::IOError(s.ToString());
}

leveldb::Slice ToLevelDB(const Slice& s) {
    return leveldb::Slice(s.data(), s.size());
}

class LevelDBIterator : public Iterator {
public:
    explicit LevelDBIterator(leveldb::Iterator* iter) : iter_(iter) {}

    bool Valid() const override { return iter_->Valid(); }
    void SeekToFirst() override { iter_->SeekToFirst(); }
    void Seek(const Slice& target) override { iter_->Seek(ToLevelDB(target)); }
    void Next() override { iter_->Next(); }

    Slice key() const override {
        leveldb::Slice k = iter_->key();
        return Slice(k.data(), k.size());
    }

    Slice value() const override {
        leveldb::Slice v = iter_->value();
        return Slice(v.data(), v.size());
    }

    Status status() const override { return FromLevelDB(iter_->status()); }

private:
    std::unique_ptr<leveldb::Iterator> iter_;
};

class LevelDBStore : public Database {
public:
    // The DB must be destroyed before the cache and filter it references
    LevelDBStore(leveldb::DB* db, leveldb::Cache* cache, const leveldb::FilterPolicy* filter)
        : cache_(cache), filter_(filter), db_(db) {}

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override {
        return FromLevelDB(db_->Get(Read(options), ToLevelDB(key), value));
    }

    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override {
        return FromLevelDB(db_->Put(Write(options), ToLevelDB(key), ToLevelDB(value)));
    }

    Status Delete(const WriteOptions& options, const Slice& key) override {
        return FromLevelDB(db_->Delete(Write(options), ToLevelDB(key)));
    }

    Status Write(const WriteOptions& options, WriteBatch* batch) override {
        leveldb::WriteBatch updates;
        batch->Iterate([&updates](const std::string& key, const std::optional<std::string>& value) {
            if (value) {
                updates.Put(key, *value);
            } else {
                updates.Delete(key);
            }
        });
        return FromLevelDB(db_->Write(Write(options), &updates));
    }

    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override {
        return std::make_unique<LevelDBIterator>(db_->NewIterator(Read(options)));
    }

private:
    static leveldb::ReadOptions Read(const ReadOptions& options) {
        leveldb::ReadOptions ro;
        ro.verify_checksums = options.verify_checksums;
        return ro;
    }

    static leveldb::WriteOptions Write(const WriteOptions& options) {
        leveldb::WriteOptions wo;
        wo.sync = options.sync;
        return wo;
    }

    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<const leveldb::FilterPolicy> filter_;
    std::unique_ptr<leveldb::DB> db_;
};

// ============================================================================
// In-Memory Backend
// ============================================================================

using KeyMap = std::map<std::string, std::string>;

/// Walks a private copy of the map taken when the iterator was created
class SnapshotIterator : public Iterator {
public:
    explicit SnapshotIterator(KeyMap snapshot)
        : data_(std::move(snapshot)), pos_(data_.end()) {}

    bool Valid() const override { return pos_ != data_.end(); }
    void SeekToFirst() override { pos_ = data_.begin(); }
    void Seek(const Slice& target) override { pos_ = data_.lower_bound(target.ToString()); }
    void Next() override { ++pos_; }
    Slice key() const override { return Slice(pos_->first); }
    Slice value() const override { return Slice(pos_->second); }
    Status status() const override { return Status::Ok(); }

private:
    const KeyMap data_;
    KeyMap::const_iterator pos_;
};

class MemoryStore : public Database {
public:
    Status Get(const ReadOptions&, const Slice& key, std::string* value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = data_.find(key.ToString());
        if (it == data_.end()) {
            return Status::NotFound();
        }
        *value = it->second;
        return Status::Ok();
    }

    Status Put(const WriteOptions&, const Slice& key, const Slice& value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        data_[key.ToString()] = value.ToString();
        return Status::Ok();
    }

    Status Delete(const WriteOptions&, const Slice& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        data_.erase(key.ToString());
        return Status::Ok();
    }

    Status Write(const WriteOptions&, WriteBatch* batch) override {
        std::lock_guard<std::mutex> lock(mutex_);
        batch->Iterate([this](const std::string& key, const std::optional<std::string>& value) {
            if (value) {
                data_[key] = *value;
            } else {
                data_.erase(key);
            }
        });
        return Status::Ok();
    }

    std::unique_ptr<Iterator> NewIterator(const ReadOptions&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::make_unique<SnapshotIterator>(data_);
    }

private:
    std::mutex mutex_;
    KeyMap data_;
};

} // namespace

// ============================================================================
// Factory Functions
// ============================================================================

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options)
{
    if (options.create_if_missing) {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec) {
            return {Status::IOError("cannot create " + path.string() + ": " + ec.message()),
                    nullptr};
        }
    }

    std::unique_ptr<leveldb::Cache> cache;
    if (options.block_cache_size > 0) {
        cache.reset(leveldb::NewLRUCache(options.block_cache_size));
    }
    std::unique_ptr<const leveldb::FilterPolicy> filter;
    if (options.bloom_filter_bits > 0) {
        filter.reset(leveldb::NewBloomFilterPolicy(options.bloom_filter_bits));
    }

    leveldb::Options lo;
    lo.create_if_missing = options.create_if_missing;
    lo.write_buffer_size = options.write_buffer_size;
    lo.max_open_files = options.max_open_files;
    lo.block_cache = cache.get();
    lo.filter_policy = filter.get();

    leveldb::DB* handle = nullptr;
    leveldb::Status s = leveldb::DB::Open(lo, path.string(), &handle);
    if (!s.ok()) {
        return {FromLevelDB(s), nullptr};
    }
    return {Status::Ok(),
            std::make_unique<LevelDBStore>(handle, cache.release(), filter.release())};
}

std::unique_ptr<Database> OpenMemoryDatabase() {
    return std::make_unique<MemoryStore>();
}

Status DestroyDatabase(const std::filesystem::path& path) {
    return FromLevelDB(leveldb::DestroyDB(path.string(), leveldb::Options()));
}

} // namespace db
} // namespace vface
