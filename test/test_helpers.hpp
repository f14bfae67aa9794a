#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include "hpkvfs/types.hpp"
#include "hpkvfs/storage/memorystore.hpp"

namespace hpkvfs {
namespace testing {

// 包装MemoryStore，按键注入失败
class FaultyStore : public storage::KVStore {
public:
    explicit FaultyStore(size_t pageSize = 0) : inner_(pageSize) {}

    Result<Bytes> Get(const std::string& key) override {
        if (shouldFail(failGet_, key)) {
            return Result<Bytes>(Error(ErrorCode::StoreError, "injected get failure: " + key)
                                     .WithUpstreamStatus(503));
        }
        return inner_.Get(key);
    }

    Error Set(const std::string& key, const Bytes& value) override {
        ++sets;
        if (shouldFail(failSet_, key)) {
            return Error(ErrorCode::StoreError, "injected set failure: " + key).WithUpstreamStatus(503);
        }
        return inner_.Set(key, value);
    }

    Error Remove(const std::string& key) override {
        ++removes;
        if (shouldFail(failRemove_, key)) {
            return Error(ErrorCode::StoreError, "injected remove failure: " + key);
        }
        return inner_.Remove(key);
    }

    Result<storage::ListPage> List(const std::string& prefix, const std::string& delimiter,
                                   const std::string& marker) override {
        ++lists;
        if (failList) {
            return Result<storage::ListPage>(Error(ErrorCode::StoreError, "injected list failure"));
        }
        return inner_.List(prefix, delimiter, marker);
    }

    std::string Location() const override { return "faulty"; }

    void FailGet(const std::string& key) { add(failGet_, key); }
    void FailSet(const std::string& key) { add(failSet_, key); }
    void FailRemove(const std::string& key) { add(failRemove_, key); }

    storage::MemoryStore& Inner() { return inner_; }

    std::atomic<int> sets{0};
    std::atomic<int> removes{0};
    std::atomic<int> lists{0};
    bool failList = false;

private:
    bool shouldFail(const std::set<std::string>& keys, const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        return keys.count(key) > 0;
    }

    void add(std::set<std::string>& keys, const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        keys.insert(key);
    }

    storage::MemoryStore inner_;
    std::mutex mutex_;
    std::set<std::string> failGet_;
    std::set<std::string> failSet_;
    std::set<std::string> failRemove_;
};

// 可控时钟
inline Clock FixedClock(std::shared_ptr<int64_t> now) {
    return [now]() { return *now; };
}

// 长度为n的确定性字节序列，覆盖0x00-0xFF
inline Bytes PatternBytes(size_t n, uint8_t seed = 0) {
    Bytes data(n);
    for (size_t i = 0; i < n; ++i) {
        data[i] = static_cast<uint8_t>((i * 31 + seed) & 0xFF);
    }
    return data;
}

inline Bytes ToBytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

} // namespace testing
} // namespace hpkvfs
