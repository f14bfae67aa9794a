#include "hpkvfs/server/server.hpp"
#include <nlohmann/json.hpp>
#include "hpkvfs/fs/filesystem.hpp"
#include "hpkvfs/utils/base64.hpp"
#include "hpkvfs/utils/logger.hpp"

namespace hpkvfs {
namespace server {
namespace handlers {

namespace {

// 读取必填的path参数
Error requirePath(const Context& ctx, std::string& path) {
    auto it = ctx.request.query.find("path");
    if (it == ctx.request.query.end() || it->second.empty()) {
        return Error::ErrMissingPath;
    }
    path = it->second;
    return Error();
}

// 解析非负整数参数；required为false且缺省时保留out的原值
Error parseNonNegative(const Context& ctx, const std::string& name, bool required, int64_t& out) {
    auto it = ctx.request.query.find(name);
    if (it == ctx.request.query.end()) {
        if (required) {
            return Error::ErrInvalidParameter.WithDetail(name + " parameter is required");
        }
        return Error();
    }
    try {
        size_t pos = 0;
        long long value = std::stoll(it->second, &pos, 10);
        if (pos != it->second.size() || value < 0) {
            return Error::ErrInvalidParameter.WithDetail("Invalid " + name);
        }
        out = static_cast<int64_t>(value);
    } catch (const std::exception&) {
        return Error::ErrInvalidParameter.WithDetail("Invalid " + name);
    }
    return Error();
}

// 为本次请求构造文件系统
Result<std::shared_ptr<fs::FileSystem>> openFileSystem(const Context& ctx) {
    if (!ctx.storeFactory) {
        return Result<std::shared_ptr<fs::FileSystem>>(
            hpkvfs::Error(ErrorCode::StoreError, "No storage backend configured"));
    }
    auto store = ctx.storeFactory(ctx.request);
    if (!store.ok()) {
        return Result<std::shared_ptr<fs::FileSystem>>(store.error());
    }
    return Result<std::shared_ptr<fs::FileSystem>>(
        std::make_shared<fs::FileSystem>(store.value(), ctx.fsOptions));
}

void writeJSON(Response& resp, int status, const json& body) {
    resp.status = status;
    resp.body = body.dump(-1, ' ', false, json::error_handler_t::replace);
    resp.contentType = "application/json";
}

} // namespace

// 404处理程序
Error NotFoundHandler(const Context& ctx, Response& resp) {
    utils::GetLogger().Warn("资源未找到",
        utils::LogContext()
            .With("method", ctx.request.method)
            .With("path", ctx.request.path));
    return Error::ErrNotFound.WithDetail("Resource not found");
}

// 获取元数据
Error MetadataHandler(const Context& ctx, Response& resp) {
    std::string path;
    Error err = requirePath(ctx, path);
    if (err.Code() != 0) {
        return err;
    }

    auto filesystem = openFileSystem(ctx);
    if (!filesystem.ok()) {
        return Error::FromFsError(filesystem.error());
    }

    auto meta = filesystem.value()->Stat(path);
    if (!meta.ok()) {
        return Error::FromFsError(meta.error());
    }
    writeJSON(resp, 200, meta.value().ToJson());
    return Error();
}

// 列举目录
Error ListHandler(const Context& ctx, Response& resp) {
    std::string path;
    Error err = requirePath(ctx, path);
    if (err.Code() != 0) {
        return err;
    }

    auto filesystem = openFileSystem(ctx);
    if (!filesystem.ok()) {
        return Error::FromFsError(filesystem.error());
    }

    auto entries = filesystem.value()->List(path);
    if (!entries.ok()) {
        return Error::FromFsError(entries.error());
    }

    json body = json::array();
    for (const auto& entry : entries.value()) {
        body.push_back({{"name", entry.name}, {"isDir", entry.isDir}});
    }
    writeJSON(resp, 200, body);
    return Error();
}

// 创建目录，新建返回201，已存在返回200
Error MkdirHandler(const Context& ctx, Response& resp) {
    std::string path;
    Error err = requirePath(ctx, path);
    if (err.Code() != 0) {
        return err;
    }
    if (path == ROOT_PATH) {
        return Error::ErrInvalidParameter.WithDetail("Path parameter is required and cannot be root (/)");
    }

    auto filesystem = openFileSystem(ctx);
    if (!filesystem.ok()) {
        return Error::FromFsError(filesystem.error());
    }

    auto created = filesystem.value()->Mkdir(path);
    if (!created.ok()) {
        return Error::FromFsError(created.error());
    }
    if (created.value()) {
        writeJSON(resp, 201, {{"success", true}});
    } else {
        writeJSON(resp, 200, {{"success", true}, {"message", "Directory already exists"}});
    }
    return Error();
}

// 按范围读取，返回原始字节
Error ReadHandler(const Context& ctx, Response& resp) {
    std::string path;
    Error err = requirePath(ctx, path);
    if (err.Code() != 0) {
        return err;
    }
    int64_t offset = 0;
    int64_t size = 0;
    err = parseNonNegative(ctx, "offset", true, offset);
    if (err.Code() != 0) {
        return err;
    }
    err = parseNonNegative(ctx, "size", true, size);
    if (err.Code() != 0) {
        return err;
    }

    auto filesystem = openFileSystem(ctx);
    if (!filesystem.ok()) {
        return Error::FromFsError(filesystem.error());
    }

    auto data = filesystem.value()->Read(path, offset, size);
    if (!data.ok()) {
        return Error::FromFsError(data.error());
    }

    resp.status = 200;
    resp.body.assign(data.value().begin(), data.value().end());
    resp.contentType = "application/octet-stream";
    return Error();
}

// 按范围写入，请求体为base64
Error WriteHandler(const Context& ctx, Response& resp) {
    std::string path;
    Error err = requirePath(ctx, path);
    if (err.Code() != 0) {
        return err;
    }
    int64_t offset = 0;
    err = parseNonNegative(ctx, "offset", true, offset);
    if (err.Code() != 0) {
        return err;
    }

    auto data = utils::Base64Decode(ctx.request.body);
    if (!data.ok()) {
        return Error::ErrMalformedBody.WithDetail("Invalid base64 data in request body: " + data.error().what());
    }

    auto filesystem = openFileSystem(ctx);
    if (!filesystem.ok()) {
        return Error::FromFsError(filesystem.error());
    }

    auto written = filesystem.value()->Write(path, offset, data.value());
    if (!written.ok()) {
        return Error::FromFsError(written.error());
    }

    utils::GetLogger().Debug("写入完成",
        utils::LogContext()
            .With("path", path)
            .With("offset", std::to_string(offset))
            .With("bytes", std::to_string(written.value())));
    writeJSON(resp, 200, {{"bytesWritten", written.value()}});
    return Error();
}

// 删除文件或空目录
Error DeleteHandler(const Context& ctx, Response& resp) {
    std::string path;
    Error err = requirePath(ctx, path);
    if (err.Code() != 0) {
        return err;
    }
    if (path == ROOT_PATH) {
        return Error::ErrInvalidParameter.WithDetail("Path parameter is required and cannot be root (/)");
    }

    auto filesystem = openFileSystem(ctx);
    if (!filesystem.ok()) {
        return Error::FromFsError(filesystem.error());
    }

    hpkvfs::Error deleteErr = filesystem.value()->Delete(path);
    if (!deleteErr.ok()) {
        return Error::FromFsError(deleteErr);
    }
    writeJSON(resp, 200, {{"success", true}});
    return Error();
}

} // namespace handlers
} // namespace server
} // namespace hpkvfs
