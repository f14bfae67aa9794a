#pragma once

#include <string>
#include <vector>
#include <utility>
#include <nlohmann/json.hpp>
#include "hpkvfs/types.hpp"
#include "hpkvfs/storage/store.hpp"

namespace hpkvfs {
namespace storage {

using json = nlohmann::json;

// HPKV REST接口的KVStore实现，每次调用创建独立的curl句柄
class HttpStore : public KVStore {
public:
    HttpStore(const std::string& baseURL, const std::string& apiKey);

    Result<Bytes> Get(const std::string& key) override;
    Error Set(const std::string& key, const Bytes& value) override;
    Error Remove(const std::string& key) override;
    Result<ListPage> List(const std::string& prefix,
                          const std::string& delimiter = "",
                          const std::string& marker = "") override;
    std::string Location() const override;

    // 值编码: 合法UTF-8原样保留，其余字节逐个映射到U+F780..U+F7FF
    static std::string EncodeValue(const Bytes& value);
    // EncodeValue的逆变换；非法UTF-8返回StoreError
    static Result<Bytes> DecodeValue(const std::string& value);

    // 解析/list响应体
    static Result<ListPage> ParseListResponse(const std::string& body);

    std::string BuildURL(const std::string& endpoint,
                         const std::vector<std::pair<std::string, std::string>>& params = {}) const;

private:
    struct Response {
        long status = 0;
        std::string body;
    };

    Result<Response> perform(const std::string& method, const std::string& url,
                             const std::string& body = "") const;

    std::string baseURL_;
    std::string apiKey_;
};

// 非2xx状态转换为错误，消息中保留状态码和最多200个字符的响应体
Error TranslateStatusToError(long statusCode, const std::string& body, const std::string& resource);

} // namespace storage
} // namespace hpkvfs
