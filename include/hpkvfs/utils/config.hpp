#pragma once

#include <string>
#include "hpkvfs/types.hpp"
#include "hpkvfs/utils/logger.hpp"

namespace hpkvfs {
namespace utils {

// 客户端与服务器共用的配置，命令行参数覆盖配置文件
struct Config {
    std::string apiURL;
    std::string apiKey;
    std::string addr = "localhost:3000";
    int64_t uid = DEFAULT_UID;
    int64_t gid = DEFAULT_GID;
    size_t deleteConcurrency = 8;
    bool listResolve = true;
    LoggingConfig logging;
};

// 解析JSON文本，缺省的键保留config中的原值
Error ParseConfig(const std::string& text, Config& config);

// 读取配置文件；文件不存在或格式错误返回InvalidArgument
Error LoadConfigFile(const std::string& path, Config& config);

// 用HPKV_API_URL / HPKV_API_KEY环境变量填充尚未设置的字段
void ApplyEnvironment(Config& config);

} // namespace utils
} // namespace hpkvfs
