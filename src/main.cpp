#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <CLI/CLI.hpp>
#include "hpkvfs/fs/filesystem.hpp"
#include "hpkvfs/storage/httpstore.hpp"
#include "hpkvfs/utils/config.hpp"
#include "hpkvfs/utils/logger.hpp"

using namespace hpkvfs;

namespace {

// 加载配置: 配置文件 < 环境变量 < 命令行
Error loadConfig(const std::string& configFile, const std::string& apiURL,
                 const std::string& apiKey, utils::Config& config) {
    if (!configFile.empty()) {
        auto err = utils::LoadConfigFile(configFile, config);
        if (!err.ok()) {
            return err;
        }
    }
    if (!apiURL.empty()) {
        config.apiURL = apiURL;
    }
    if (!apiKey.empty()) {
        config.apiKey = apiKey;
    }
    utils::ApplyEnvironment(config);

    if (config.apiURL.empty() || config.apiKey.empty()) {
        return Error(ErrorCode::Unauthorized,
                     "API URL and API key are required (--api-url/--api-key or HPKV_API_URL/HPKV_API_KEY)");
    }
    return Error();
}

// 读取本地文件或标准输入
Result<Bytes> readInput(const std::string& file) {
    if (file.empty() || file == "-") {
        std::istreambuf_iterator<char> begin(std::cin), end;
        std::string content(begin, end);
        return Result<Bytes>(Bytes(content.begin(), content.end()));
    }
    std::ifstream input(file, std::ios::binary);
    if (!input) {
        return Result<Bytes>(Error(ErrorCode::InvalidArgument, "Failed to open input file: " + file));
    }
    std::istreambuf_iterator<char> begin(input), end;
    std::string content(begin, end);
    return Result<Bytes>(Bytes(content.begin(), content.end()));
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"hpkvfs - HPKV chunked filesystem client"};
    app.require_subcommand(1);

    // 全局选项
    std::string configFile;
    std::string apiURL;
    std::string apiKey;
    int64_t uid = DEFAULT_UID;
    int64_t gid = DEFAULT_GID;
    bool debug = false;

    app.add_option("-c,--config", configFile, "Configuration file path");
    app.add_option("--api-url", apiURL, "HPKV API base URL");
    app.add_option("--api-key", apiKey, "HPKV API key");
    auto uidOpt = app.add_option("--uid", uid, "Owner uid for new files and directories");
    auto gidOpt = app.add_option("--gid", gid, "Owner gid for new files and directories");
    app.add_flag("-D,--debug", debug, "Enable debug output");

    int exitCode = 0;
    std::shared_ptr<fs::FileSystem> filesystem;

    // 每个子命令执行前建立文件系统
    auto open = [&]() -> bool {
        utils::LoggingConfig logging;
        logging.format = "text";
        logging.output = "stderr";
        logging.level = debug ? "debug" : "warn";
        utils::GetLogger().Initialize(logging);

        utils::Config config;
        auto err = loadConfig(configFile, apiURL, apiKey, config);
        if (!err.ok()) {
            utils::GetLogger().Error("Error loading configuration: " + err.what());
            exitCode = 1;
            return false;
        }
        if (uidOpt->count() > 0) config.uid = uid;
        if (gidOpt->count() > 0) config.gid = gid;

        fs::FileSystemOptions options;
        options.identity.uid = config.uid;
        options.identity.gid = config.gid;
        options.deleteConcurrency = config.deleteConcurrency;
        options.list.resolve = config.listResolve;

        filesystem = std::make_shared<fs::FileSystem>(
            std::make_shared<storage::HttpStore>(config.apiURL, config.apiKey), options);
        utils::GetLogger().Debug("Using HPKV endpoint",
            utils::LogContext().With("location", filesystem->Location()));
        return true;
    };

    auto fail = [&](const std::string& action, const Error& err) {
        std::cerr << "Error " << action << ": " << err.what()
                  << " (" << ErrorCodeToString(err.code()) << ")" << std::endl;
        exitCode = 1;
    };

    std::string path;

    // stat 命令
    auto stat = app.add_subcommand("stat", "Show metadata of a file or directory");
    stat->add_option("path", path, "Absolute path")->required();
    stat->callback([&]() {
        if (!open()) return;
        auto meta = filesystem->Stat(path);
        if (!meta.ok()) {
            fail("reading metadata", meta.error());
            return;
        }
        std::cout << meta.value().ToJson().dump(2) << std::endl;
    });

    // ls 命令
    auto ls = app.add_subcommand("ls", "List directory entries");
    ls->add_option("path", path, "Absolute directory path")->default_val(ROOT_PATH);
    ls->callback([&]() {
        if (!open()) return;
        auto entries = filesystem->List(path);
        if (!entries.ok()) {
            fail("listing directory", entries.error());
            return;
        }
        for (const auto& entry : entries.value()) {
            std::cout << entry.name << (entry.isDir ? "/" : "") << std::endl;
        }
    });

    // mkdir 命令
    auto mkdir = app.add_subcommand("mkdir", "Create a directory");
    mkdir->add_option("path", path, "Absolute directory path")->required();
    mkdir->callback([&]() {
        if (!open()) return;
        auto created = filesystem->Mkdir(path);
        if (!created.ok()) {
            fail("creating directory", created.error());
            return;
        }
        if (!created.value()) {
            std::cerr << "Directory already exists: " << path << std::endl;
        }
    });

    // cat 命令
    int64_t catOffset = 0;
    int64_t catSize = -1;
    auto cat = app.add_subcommand("cat", "Write file contents to stdout");
    cat->add_option("path", path, "Absolute file path")->required();
    cat->add_option("--offset", catOffset, "Start offset")->check(CLI::NonNegativeNumber);
    cat->add_option("--size", catSize, "Number of bytes to read (default: to end of file)");
    cat->callback([&]() {
        if (!open()) return;
        int64_t size = catSize;
        if (size < 0) {
            auto meta = filesystem->Stat(path);
            if (!meta.ok()) {
                fail("reading metadata", meta.error());
                return;
            }
            size = meta.value().size;
        }
        auto data = filesystem->Read(path, catOffset, size);
        if (!data.ok()) {
            fail("reading file", data.error());
            return;
        }
        std::cout.write(reinterpret_cast<const char*>(data.value().data()),
                        static_cast<std::streamsize>(data.value().size()));
        std::cout.flush();
    });

    // put 命令
    std::string inputFile;
    int64_t putOffset = 0;
    auto put = app.add_subcommand("put", "Write FILE (or stdin) into a file at an offset");
    put->add_option("path", path, "Absolute file path")->required();
    put->add_option("file", inputFile, "Local input file, '-' or omitted for stdin");
    put->add_option("--offset", putOffset, "Write offset")->check(CLI::NonNegativeNumber);
    put->callback([&]() {
        if (!open()) return;
        auto data = readInput(inputFile);
        if (!data.ok()) {
            fail("reading input", data.error());
            return;
        }
        auto written = filesystem->Write(path, putOffset, data.value());
        if (!written.ok()) {
            fail("writing file", written.error());
            return;
        }
        std::cerr << written.value() << " bytes written to " << path << std::endl;
    });

    // rm 命令
    auto rm = app.add_subcommand("rm", "Delete a file or an empty directory");
    rm->add_option("path", path, "Absolute path")->required();
    rm->callback([&]() {
        if (!open()) return;
        auto err = filesystem->Delete(path);
        if (!err.ok()) {
            fail("deleting path", err);
        }
    });

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    return exitCode;
}
