#pragma once

#include <string>
#include <functional>
#include <memory>
#include <vector>
#include <map>
#include <regex>
#include "hpkvfs/server/errors.hpp"
#include "hpkvfs/types.hpp"
#include "hpkvfs/storage/store.hpp"
#include "hpkvfs/fs/filesystem.hpp"
#include "hpkvfs/utils/logger.hpp"
#include <nlohmann/json.hpp>

// 前向声明
namespace httplib {
    struct Request;
    struct Response;
}

namespace hpkvfs {
namespace server {

using json = nlohmann::json;

// 凭据请求头，由客户端转发给HPKV
const std::string HPKV_API_KEY_HEADER = "hpkv-api-key";
const std::string HPKV_API_URL_HEADER = "hpkv-api-url";

// 请求和响应结构
struct Request {
    std::string method;
    std::string path;
    std::map<std::string, std::string> headers;  // 键为小写
    std::map<std::string, std::string> query;
    std::string body;
};

struct Response {
    int status = 200;
    std::map<std::string, std::string> headers;
    std::string body;
    std::string contentType = "application/json";
};

// 为一次请求提供存储后端；缺少凭据时返回Unauthorized
using StoreFactory = std::function<Result<std::shared_ptr<storage::KVStore>>(const Request&)>;

// 上下文
struct Context {
    Request request;
    StoreFactory storeFactory;
    fs::FileSystemOptions fsOptions;
};

// 处理器函数类型
using Handler = std::function<Error(const Context&, Response&)>;

// 路由器
class Router {
public:
    void AddRoute(const std::string& method, const std::string& path, Handler handler);
    Error HandleRequest(const Context& ctx, Response& response);

    // 注册/api下的全部路由
    static Router Default();

private:
    struct Route {
        std::string method;
        std::string path;
        std::regex pattern;
        Handler handler;
    };
    std::vector<Route> routes_;
};

// 处理请求并把错误写成{"error": msg}
Response Dispatch(Router& router, const Context& ctx);

// 从请求头构造HttpStore
Result<std::shared_ptr<storage::KVStore>> HeaderStoreFactory(const Request& request);

// 服务器配置
struct Config {
    std::string addr = "localhost:3000";
    bool memory = false;                 // 使用进程内MemoryStore，忽略凭据头
    fs::FileSystemOptions fsOptions;
    utils::LoggingConfig logging;
};

// 服务器
class Server {
public:
    explicit Server(const Config& config);
    hpkvfs::Error Run();

private:
    void setupRoutes();
    void setupLogger();
    void handleHttpRequest(const std::string& method, const httplib::Request& req, httplib::Response& res);

    Config config_;
    Router router_;
    StoreFactory storeFactory_;
    std::shared_ptr<storage::KVStore> memoryStore_;
};

// 处理函数声明
namespace handlers {
    Error MetadataHandler(const Context& ctx, Response& resp);
    Error ListHandler(const Context& ctx, Response& resp);
    Error MkdirHandler(const Context& ctx, Response& resp);
    Error ReadHandler(const Context& ctx, Response& resp);
    Error WriteHandler(const Context& ctx, Response& resp);
    Error DeleteHandler(const Context& ctx, Response& resp);
    Error NotFoundHandler(const Context& ctx, Response& resp);
}

} // namespace server
} // namespace hpkvfs
