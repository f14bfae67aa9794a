#include "hpkvfs/utils/config.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace hpkvfs {
namespace utils {

using json = nlohmann::json;

namespace {

template<typename T>
void readField(const json& j, const char* key, T& out) {
    if (j.contains(key) && !j[key].is_null()) {
        out = j[key].get<T>();
    }
}

} // namespace

Error ParseConfig(const std::string& text, Config& config) {
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            return Error(ErrorCode::InvalidArgument, "Config must be a JSON object");
        }

        readField(j, "api_url", config.apiURL);
        readField(j, "api_key", config.apiKey);
        readField(j, "addr", config.addr);
        readField(j, "uid", config.uid);
        readField(j, "gid", config.gid);
        readField(j, "list_resolve", config.listResolve);

        if (j.contains("delete_concurrency")) {
            int64_t concurrency = j["delete_concurrency"].get<int64_t>();
            if (concurrency <= 0) {
                return Error(ErrorCode::InvalidArgument, "delete_concurrency must be positive");
            }
            config.deleteConcurrency = static_cast<size_t>(concurrency);
        }

        if (j.contains("logging")) {
            const json& logging = j["logging"];
            if (!logging.is_object()) {
                return Error(ErrorCode::InvalidArgument, "logging must be a JSON object");
            }
            readField(logging, "level", config.logging.level);
            readField(logging, "format", config.logging.format);
            readField(logging, "output", config.logging.output);
            readField(logging, "file", config.logging.file);
        }
    } catch (const json::exception& e) {
        return Error(ErrorCode::InvalidArgument, "Invalid config: " + std::string(e.what()));
    }
    return Error();
}

Error LoadConfigFile(const std::string& path, Config& config) {
    std::ifstream file(path);
    if (!file) {
        return Error(ErrorCode::InvalidArgument, "Failed to open config file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    Error err = ParseConfig(buffer.str(), config);
    if (!err.ok()) {
        return err.Wrap(path);
    }
    GetLogger().Debug("已加载配置文件", LogContext().With("path", path));
    return Error();
}

void ApplyEnvironment(Config& config) {
    if (config.apiURL.empty()) {
        if (const char* url = std::getenv("HPKV_API_URL")) {
            config.apiURL = url;
        }
    }
    if (config.apiKey.empty()) {
        if (const char* key = std::getenv("HPKV_API_KEY")) {
            config.apiKey = key;
        }
    }
}

} // namespace utils
} // namespace hpkvfs
