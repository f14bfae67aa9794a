#include "hpkvfs/storage/store.hpp"
#include "hpkvfs/utils/logger.hpp"

namespace hpkvfs {
namespace storage {

Result<std::vector<std::string>> ListAllKeys(KVStore& store, const std::string& prefix) {
    std::vector<std::string> allKeys;
    std::string marker;
    int pages = 0;

    do {
        auto pageResult = store.List(prefix, "", marker);
        if (!pageResult.ok()) {
            return Result<std::vector<std::string>>(
                pageResult.error().Wrap("Failed to list keys with prefix " + prefix));
        }
        const ListPage& page = pageResult.value();
        allKeys.insert(allKeys.end(), page.keys.begin(), page.keys.end());

        // 服务端返回相同marker时避免死循环
        if (!page.nextMarker.empty() && page.nextMarker == marker) {
            return Result<std::vector<std::string>>(Error(ErrorCode::StoreError,
                "List pagination did not advance at marker " + marker));
        }
        marker = page.nextMarker;
        ++pages;
    } while (!marker.empty());

    utils::GetLogger().Debug("前缀扫描完成",
        utils::LogContext()
            .With("prefix", prefix)
            .With("keys", std::to_string(allKeys.size()))
            .With("pages", std::to_string(pages)));

    return Result<std::vector<std::string>>(std::move(allKeys));
}

} // namespace storage
} // namespace hpkvfs
