#include <iostream>
#include <string>
#include <CLI/CLI.hpp>
#include "hpkvfs/server/server.hpp"
#include "hpkvfs/utils/config.hpp"
#include "hpkvfs/utils/logger.hpp"

int main(int argc, char* argv[]) {
    CLI::App app{"hpkvfs服务器 - HPKV分块文件系统HTTP接口"};

    hpkvfs::utils::Config fileConfig;

    std::string configFile;
    std::string addr = fileConfig.addr;
    bool memory = false;
    int64_t uid = fileConfig.uid;
    int64_t gid = fileConfig.gid;
    size_t deleteConcurrency = fileConfig.deleteConcurrency;
    bool listResolve = fileConfig.listResolve;

    // 日志配置
    std::string logLevel = fileConfig.logging.level;
    std::string logFormat = fileConfig.logging.format;
    std::string logOutput = fileConfig.logging.output;
    std::string logFile = fileConfig.logging.file;

    // 添加命令行参数
    app.add_option("-c,--config", configFile, "配置文件路径(JSON)");
    auto addrOpt = app.add_option("--addr", addr, "服务器监听地址, 格式: host:port");
    app.add_flag("--memory", memory, "使用进程内存储, 忽略凭据请求头");
    auto uidOpt = app.add_option("--uid", uid, "新建文件和目录的属主uid");
    auto gidOpt = app.add_option("--gid", gid, "新建文件和目录的属组gid");
    auto concurrencyOpt = app.add_option("--delete-concurrency", deleteConcurrency, "删除分块时的最大并发数")
        ->check(CLI::PositiveNumber);
    auto resolveOpt = app.add_flag("--list-resolve,!--no-list-resolve", listResolve,
                                   "列举目录时读取子项元数据以区分文件和目录");

    // 添加日志配置选项
    auto levelOpt = app.add_option("--log-level", logLevel, "日志级别: debug, info, warn, error, fatal, panic");
    auto formatOpt = app.add_option("--log-format", logFormat, "日志格式: json, text");
    auto outputOpt = app.add_option("--log-output", logOutput, "日志输出: console, stderr, file");
    auto fileOpt = app.add_option("--log-file", logFile, "日志文件路径(当log-output为file时使用)");

    // 解析命令行参数
    try {
        app.parse(argc, argv);
    } catch(const CLI::ParseError& e) {
        return app.exit(e);
    }

    // 配置文件打底，显式给出的命令行参数覆盖
    if (!configFile.empty()) {
        auto err = hpkvfs::utils::LoadConfigFile(configFile, fileConfig);
        if (!err.ok()) {
            std::cerr << "Error loading configuration: " << err.what() << std::endl;
            return 1;
        }
    }
    if (addrOpt->count() > 0) fileConfig.addr = addr;
    if (uidOpt->count() > 0) fileConfig.uid = uid;
    if (gidOpt->count() > 0) fileConfig.gid = gid;
    if (concurrencyOpt->count() > 0) fileConfig.deleteConcurrency = deleteConcurrency;
    if (resolveOpt->count() > 0) fileConfig.listResolve = listResolve;
    if (levelOpt->count() > 0) fileConfig.logging.level = logLevel;
    if (formatOpt->count() > 0) fileConfig.logging.format = logFormat;
    if (outputOpt->count() > 0) fileConfig.logging.output = logOutput;
    if (fileOpt->count() > 0) fileConfig.logging.file = logFile;

    // 创建服务器配置
    hpkvfs::server::Config config;
    config.addr = fileConfig.addr;
    config.memory = memory;
    config.fsOptions.identity.uid = fileConfig.uid;
    config.fsOptions.identity.gid = fileConfig.gid;
    config.fsOptions.deleteConcurrency = fileConfig.deleteConcurrency;
    config.fsOptions.list.resolve = fileConfig.listResolve;
    config.logging = fileConfig.logging;

    // 创建并运行服务器
    hpkvfs::server::Server server(config);

    hpkvfs::utils::GetLogger().Info("hpkvfs服务器配置",
        hpkvfs::utils::LogContext()
            .With("addr", config.addr)
            .With("memory", memory ? "true" : "false")
            .With("uid", std::to_string(config.fsOptions.identity.uid))
            .With("gid", std::to_string(config.fsOptions.identity.gid))
            .With("deleteConcurrency", std::to_string(config.fsOptions.deleteConcurrency))
            .With("listResolve", config.fsOptions.list.resolve ? "true" : "false"));

    auto err = server.Run();
    if (!err.ok()) {
        hpkvfs::utils::GetLogger().Fatal("服务器启动失败",
            hpkvfs::utils::LogContext().With("error", err.what()));
        return 1;
    }

    return 0;
}
