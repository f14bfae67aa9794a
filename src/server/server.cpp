#include "hpkvfs/server/server.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "hpkvfs/storage/httpstore.hpp"
#include "hpkvfs/storage/memorystore.hpp"
#include "hpkvfs/utils/logger.hpp"

namespace hpkvfs {
namespace server {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

void Router::AddRoute(const std::string& method, const std::string& path, Handler handler) {
    // 路由模式整体匹配请求路径
    routes_.push_back({method, path, std::regex("^" + path + "$"), handler});
}

Error Router::HandleRequest(const Context& ctx, Response& response) {
    for (const auto& route : routes_) {
        if (route.method == ctx.request.method) {
            if (std::regex_match(ctx.request.path, route.pattern)) {
                utils::GetLogger().Debug("匹配到路由",
                    utils::LogContext()
                        .With("method", route.method)
                        .With("path", route.path)
                        .With("requestPath", ctx.request.path));

                return route.handler(ctx, response);
            }
        }
    }

    utils::GetLogger().Warn("未找到匹配的路由",
        utils::LogContext()
            .With("method", ctx.request.method)
            .With("path", ctx.request.path));

    return handlers::NotFoundHandler(ctx, response);
}

Router Router::Default() {
    Router router;
    router.AddRoute("GET", "/api/metadata/?", handlers::MetadataHandler);
    router.AddRoute("GET", "/api/list/?", handlers::ListHandler);
    router.AddRoute("POST", "/api/mkdir/?", handlers::MkdirHandler);
    router.AddRoute("GET", "/api/read/?", handlers::ReadHandler);
    router.AddRoute("POST", "/api/write/?", handlers::WriteHandler);
    router.AddRoute("DELETE", "/api/delete/?", handlers::DeleteHandler);
    return router;
}

Response Dispatch(Router& router, const Context& ctx) {
    Response response;
    response.status = 200;

    Error err = router.HandleRequest(ctx, response);
    if (err.Code() != 0) { // 0 = NoError
        response.status = err.HTTPStatusCode();

        utils::GetLogger().Warn("请求处理出错",
            utils::LogContext()
                .With("code", std::to_string(err.Code()))
                .With("message", err.Detail())
                .With("statusCode", std::to_string(response.status))
                .With("method", ctx.request.method)
                .With("path", ctx.request.path));

        json errorJson = {{"error", err.Detail()}};
        response.body = errorJson.dump(-1, ' ', false, json::error_handler_t::replace);
        response.contentType = "application/json";
    }
    return response;
}

Result<std::shared_ptr<storage::KVStore>> HeaderStoreFactory(const Request& request) {
    auto key = request.headers.find(HPKV_API_KEY_HEADER);
    auto url = request.headers.find(HPKV_API_URL_HEADER);
    if (key == request.headers.end() || key->second.empty() ||
        url == request.headers.end() || url->second.empty()) {
        return Result<std::shared_ptr<storage::KVStore>>(
            hpkvfs::Error(ErrorCode::Unauthorized, "API key and API URL headers are required"));
    }
    return Result<std::shared_ptr<storage::KVStore>>(
        std::shared_ptr<storage::KVStore>(std::make_shared<storage::HttpStore>(url->second, key->second)));
}

Server::Server(const Config& config) : config_(config) {
    setupLogger();
    setupRoutes();

    if (config_.memory) {
        memoryStore_ = std::make_shared<storage::MemoryStore>();
        auto shared = memoryStore_;
        storeFactory_ = [shared](const Request&) {
            return Result<std::shared_ptr<storage::KVStore>>(shared);
        };
    } else {
        storeFactory_ = HeaderStoreFactory;
    }
}

void Server::setupLogger() {
    utils::GetLogger().Initialize(config_.logging);
    utils::GetLogger().WithField("service", "hpkvfs-server");

    utils::GetLogger().Info("初始化hpkvfs服务器",
        utils::LogContext()
            .With("address", config_.addr)
            .With("memory", config_.memory ? "true" : "false")
            .With("logLevel", config_.logging.level)
            .With("logFormat", config_.logging.format));
}

void Server::setupRoutes() {
    router_ = Router::Default();
    utils::GetLogger().Debug("路由设置完成");
}

hpkvfs::Error Server::Run() {
    utils::GetLogger().Info("启动hpkvfs服务器",
        utils::LogContext().With("address", config_.addr));

    // 解析地址和端口
    std::string host;
    int port;
    try {
        size_t colonPos = config_.addr.rfind(':');
        if (colonPos != std::string::npos) {
            host = config_.addr.substr(0, colonPos);
            port = std::stoi(config_.addr.substr(colonPos + 1));
        } else {
            host = "0.0.0.0";
            port = std::stoi(config_.addr);
        }
    } catch (const std::exception& e) {
        return hpkvfs::Error(ErrorCode::InvalidArgument, "Invalid listen address: " + config_.addr + " (" + e.what() + ")");
    }

    // 内存模式下预先写入根目录元数据
    if (memoryStore_) {
        fs::FileSystem filesystem(memoryStore_, config_.fsOptions);
        hpkvfs::Error err = filesystem.EnsureRoot();
        if (!err.ok()) {
            return err.Wrap("Failed to initialize root directory");
        }
    }

    httplib::Server server;

    server.set_default_headers({{"Server", "hpkvfs/1.0"}});

    server.set_exception_handler([](const auto& req, auto& res, std::exception_ptr ep) {
        std::string message = "Unknown error";
        try {
            std::rethrow_exception(ep);
        } catch (std::exception& e) {
            message = e.what();
        } catch (...) {
            message = "Unknown error";
        }
        utils::GetLogger().Error("服务器异常",
            utils::LogContext()
                .With("exception", message)
                .With("path", req.path)
                .With("method", req.method));

        json errorJson = {{"error", "Internal server error: " + message}};
        res.status = 500;
        res.set_content(errorJson.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
    });

    server.set_logger([](const auto& req, const auto& res) {
        utils::LogContext ctx;
        ctx.WithField("method", req.method);
        ctx.WithField("path", req.path);
        ctx.WithField("status", std::to_string(res.status));
        ctx.WithField("remoteAddr", req.remote_addr);

        // 根据状态码选择日志级别
        if (res.status >= 500) {
            utils::GetLogger().Error("HTTP请求完成", ctx);
        } else if (res.status >= 400) {
            utils::GetLogger().Warn("HTTP请求完成", ctx);
        } else {
            utils::GetLogger().Info("HTTP请求完成", ctx);
        }
    });

    server.Get(".*", [this](const httplib::Request& req, httplib::Response& res) {
        handleHttpRequest("GET", req, res);
    });

    server.Post(".*", [this](const httplib::Request& req, httplib::Response& res) {
        handleHttpRequest("POST", req, res);
    });

    server.Delete(".*", [this](const httplib::Request& req, httplib::Response& res) {
        handleHttpRequest("DELETE", req, res);
    });

    utils::GetLogger().Info("服务器开始监听",
        utils::LogContext()
            .With("host", host)
            .With("port", std::to_string(port)));

    if (!server.listen(host.c_str(), port)) {
        utils::GetLogger().Fatal("无法启动服务器",
            utils::LogContext()
                .With("host", host)
                .With("port", std::to_string(port)));
        return hpkvfs::Error(ErrorCode::StoreError, "无法启动服务器");
    }

    return hpkvfs::Error();
}

void Server::handleHttpRequest(const std::string& method, const httplib::Request& req, httplib::Response& res) {
    utils::GetLogger().Debug("开始处理HTTP请求",
        utils::LogContext()
            .With("method", method)
            .With("path", req.path)
            .With("remoteAddr", req.remote_addr));

    Request request;
    request.method = method;
    request.path = req.path;
    request.body = req.body;

    for (const auto& header : req.headers) {
        request.headers[toLower(header.first)] = header.second;
    }
    for (const auto& param : req.params) {
        request.query[param.first] = param.second;
    }

    Context ctx;
    ctx.request = request;
    ctx.storeFactory = storeFactory_;
    ctx.fsOptions = config_.fsOptions;

    Response response = Dispatch(router_, ctx);

    for (const auto& header : response.headers) {
        res.set_header(header.first.c_str(), header.second.c_str());
    }

    res.status = response.status;
    res.set_content(response.body, response.contentType.c_str());
}

} // namespace server
} // namespace hpkvfs
