#pragma once

#include "hpkvfs/storage/store.hpp"
#include <map>
#include <mutex>

namespace hpkvfs {
namespace storage {

// 内存存储实现，键按字典序保存
class MemoryStore : public KVStore {
public:
    // pageSize为每页最多返回的键数，0表示不分页
    explicit MemoryStore(size_t pageSize = 0, size_t maxValueSize = 0);

    Result<Bytes> Get(const std::string& key) override;
    Error Set(const std::string& key, const Bytes& value) override;
    Error Remove(const std::string& key) override;
    Result<ListPage> List(const std::string& prefix,
                          const std::string& delimiter = "",
                          const std::string& marker = "") override;
    std::string Location() const override;

    // 测试辅助
    size_t Size() const;
    bool Contains(const std::string& key) const;
    std::vector<std::string> Keys() const;

private:
    size_t pageSize_;
    size_t maxValueSize_;
    std::map<std::string, Bytes> storage_;
    mutable std::mutex mutex_;
};

} // namespace storage
} // namespace hpkvfs
