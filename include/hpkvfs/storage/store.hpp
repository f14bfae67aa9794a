#pragma once

#include <string>
#include <vector>
#include <map>
#include "hpkvfs/types.hpp"

namespace hpkvfs {
namespace storage {

// 列举结果的一页
struct ListPage {
    std::vector<std::string> keys;
    std::string nextMarker;  // 为空表示没有下一页
};

// 扁平键值存储后端接口
class KVStore {
public:
    virtual ~KVStore() = default;

    // 获取值，键不存在时返回ErrorCode::NotFound
    virtual Result<Bytes> Get(const std::string& key) = 0;

    // 写入值(覆盖)
    virtual Error Set(const std::string& key, const Bytes& value) = 0;

    // 删除键，键不存在视为成功
    virtual Error Remove(const std::string& key) = 0;

    // 按前缀分页列举键
    virtual Result<ListPage> List(const std::string& prefix,
                                  const std::string& delimiter = "",
                                  const std::string& marker = "") = 0;

    // 获取存储位置描述
    virtual std::string Location() const = 0;
};

// 跟随nextMarker列举前缀下的全部键
Result<std::vector<std::string>> ListAllKeys(KVStore& store, const std::string& prefix);

} // namespace storage
} // namespace hpkvfs
