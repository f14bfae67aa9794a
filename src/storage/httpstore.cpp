#include "hpkvfs/storage/httpstore.hpp"
#include <curl/curl.h>
#include <mutex>
#include "hpkvfs/utils/logger.hpp"

namespace hpkvfs {
namespace storage {

namespace {

// libcurl写入回调函数
size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append((char*)contents, size * nmemb);
    return size * nmemb;
}

std::once_flag curlInitFlag;

// 不能组成合法UTF-8的字节映射到私有区U+F780..U+F7FF
const uint32_t ESCAPE_FIRST = 0xF780;
const uint32_t ESCAPE_LAST  = 0xF7FF;
const uint32_t ESCAPE_BASE  = 0xF700;

// 返回从i开始的合法UTF-8序列长度并输出码点；非法返回0(过长编码、代理项、超出U+10FFFF)
size_t utf8SequenceAt(const uint8_t* data, size_t size, size_t i, uint32_t& cp) {
    uint8_t c = data[i];
    if (c < 0x80) {
        cp = c;
        return 1;
    }
    size_t len;
    uint32_t min;
    if ((c & 0xE0) == 0xC0) {
        len = 2;
        cp = c & 0x1F;
        min = 0x80;
    } else if ((c & 0xF0) == 0xE0) {
        len = 3;
        cp = c & 0x0F;
        min = 0x800;
    } else if ((c & 0xF8) == 0xF0) {
        len = 4;
        cp = c & 0x07;
        min = 0x10000;
    } else {
        return 0;
    }
    if (i + len > size) {
        return 0;
    }
    for (size_t k = 1; k < len; ++k) {
        uint8_t next = data[i + k];
        if ((next & 0xC0) != 0x80) {
            return 0;
        }
        cp = (cp << 6) | (next & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        return 0;
    }
    return len;
}

void appendEscapedByte(std::string& out, uint8_t byte) {
    uint32_t cp = ESCAPE_BASE + byte;
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
}

} // namespace

Error TranslateStatusToError(long statusCode, const std::string& body, const std::string& resource) {
    if (statusCode >= 200 && statusCode < 300) {
        return Error();
    }
    std::string snippet = body.substr(0, 200);
    if (statusCode == 404) {
        return Error(ErrorCode::NotFound, "Key not found: " + resource).WithUpstreamStatus(statusCode);
    }
    if (statusCode == 401 || statusCode == 403) {
        return Error(ErrorCode::Unauthorized,
                     "HPKV API Error (" + std::to_string(statusCode) + "): " + snippet)
            .WithUpstreamStatus(statusCode);
    }
    return Error(ErrorCode::StoreError,
                 "HPKV API Error (" + std::to_string(statusCode) + "): " + snippet)
        .WithUpstreamStatus(statusCode);
}

HttpStore::HttpStore(const std::string& baseURL, const std::string& apiKey)
    : baseURL_(baseURL)
    , apiKey_(apiKey) {
    // 进程内只初始化一次libcurl
    std::call_once(curlInitFlag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
    while (!baseURL_.empty() && baseURL_.back() == '/') {
        baseURL_.pop_back();
    }
}

std::string HttpStore::BuildURL(const std::string& endpoint,
                                const std::vector<std::pair<std::string, std::string>>& params) const {
    std::string url = baseURL_ + endpoint;
    if (params.empty()) {
        return url;
    }

    CURL* curl = curl_easy_init();
    char sep = '?';
    for (const auto& param : params) {
        url += sep;
        sep = '&';
        url += param.first;
        url += '=';
        char* escaped = curl ? curl_easy_escape(curl, param.second.c_str(),
                                                static_cast<int>(param.second.size()))
                             : nullptr;
        if (escaped) {
            url += escaped;
            curl_free(escaped);
        } else {
            url += param.second;
        }
    }
    if (curl) {
        curl_easy_cleanup(curl);
    }
    return url;
}

Result<HttpStore::Response> HttpStore::perform(const std::string& method, const std::string& url,
                                               const std::string& body) const {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return Result<Response>(Error("Failed to initialize CURL"));
    }

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, ("x-api-key: " + apiKey_).c_str());

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if (method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    } else if (method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    }

    Response response;
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        std::string errorMsg = curl_easy_strerror(res);
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);
        utils::GetLogger().Error("HPKV请求失败",
            utils::LogContext().With("method", method).With("error", errorMsg));
        return Result<Response>(Error("Network error: " + errorMsg));
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    utils::GetLogger().Debug("HPKV请求",
        utils::LogContext()
            .With("method", method)
            .With("url", url)
            .With("status", std::to_string(response.status)));
    return Result<Response>(std::move(response));
}

Result<Bytes> HttpStore::Get(const std::string& key) {
    auto response = perform("GET", BuildURL("/record", {{"key", key}}));
    if (!response.ok()) {
        return Result<Bytes>(response.error());
    }
    Error httpError = TranslateStatusToError(response.value().status, response.value().body, key);
    if (!httpError.ok()) {
        return Result<Bytes>(httpError);
    }

    try {
        json record = json::parse(response.value().body);
        if (!record.contains("value") || record["value"].is_null()) {
            return Result<Bytes>(Error(ErrorCode::NotFound, "Key not found: " + key));
        }
        const json& value = record["value"];
        if (value.is_string()) {
            auto decoded = DecodeValue(value.get<std::string>());
            if (!decoded.ok()) {
                return Result<Bytes>(decoded.error().Wrap("Invalid value for key " + key));
            }
            return decoded;
        }
        // 非字符串值按JSON文本返回
        std::string text = value.dump();
        return Result<Bytes>(Bytes(text.begin(), text.end()));
    } catch (const json::exception& e) {
        return Result<Bytes>(Error("Failed to parse record response: " + std::string(e.what())));
    }
}

Error HttpStore::Set(const std::string& key, const Bytes& value) {
    std::string encoded = EncodeValue(value);
    if (encoded.size() > HPKV_MAX_VALUE_SIZE) {
        return Error(ErrorCode::InvalidArgument,
                     "Encoded value for key " + key + " exceeds the HPKV limit: " +
                     std::to_string(encoded.size()) + " > " + std::to_string(HPKV_MAX_VALUE_SIZE) + " bytes");
    }

    json body;
    body["key"] = key;
    body["value"] = std::move(encoded);

    auto response = perform("POST", BuildURL("/record"), body.dump());
    if (!response.ok()) {
        return response.error();
    }
    return TranslateStatusToError(response.value().status, response.value().body, key);
}

Error HttpStore::Remove(const std::string& key) {
    auto response = perform("DELETE", BuildURL("/record", {{"key", key}}));
    if (!response.ok()) {
        return response.error();
    }
    if (response.value().status == 404) {
        return Error();
    }
    return TranslateStatusToError(response.value().status, response.value().body, key);
}

Result<ListPage> HttpStore::List(const std::string& prefix, const std::string& delimiter,
                                 const std::string& marker) {
    std::vector<std::pair<std::string, std::string>> params{{"prefix", prefix}};
    if (!delimiter.empty()) {
        params.emplace_back("delimiter", delimiter);
    }
    if (!marker.empty()) {
        params.emplace_back("marker", marker);
    }

    auto response = perform("GET", BuildURL("/list", params));
    if (!response.ok()) {
        return Result<ListPage>(response.error());
    }
    // 列举时404表示前缀下没有键
    if (response.value().status == 404) {
        return Result<ListPage>(ListPage());
    }
    Error httpError = TranslateStatusToError(response.value().status, response.value().body, prefix);
    if (!httpError.ok()) {
        return Result<ListPage>(httpError);
    }
    return ParseListResponse(response.value().body);
}

Result<ListPage> HttpStore::ParseListResponse(const std::string& body) {
    try {
        json j = json::parse(body);
        ListPage page;
        if (j.contains("items") && j["items"].is_array()) {
            for (const auto& item : j["items"]) {
                if (item.is_object() && item.contains("key") && item["key"].is_string()) {
                    page.keys.push_back(item["key"].get<std::string>());
                }
            }
        }
        if (j.contains("nextMarker") && j["nextMarker"].is_string()) {
            page.nextMarker = j["nextMarker"].get<std::string>();
        }
        return Result<ListPage>(std::move(page));
    } catch (const json::exception& e) {
        return Result<ListPage>(Error("Failed to parse list response: " + std::string(e.what())));
    }
}

std::string HttpStore::EncodeValue(const Bytes& value) {
    std::string out;
    out.reserve(value.size());
    size_t i = 0;
    while (i < value.size()) {
        uint32_t cp = 0;
        size_t len = utf8SequenceAt(value.data(), value.size(), i, cp);
        // 合法UTF-8原样写入；转义区内的码点本身也要转义，保证可逆
        if (len > 0 && (cp < ESCAPE_FIRST || cp > ESCAPE_LAST)) {
            out.append(reinterpret_cast<const char*>(value.data() + i), len);
            i += len;
            continue;
        }
        appendEscapedByte(out, value[i]);
        ++i;
    }
    return out;
}

Result<Bytes> HttpStore::DecodeValue(const std::string& value) {
    const uint8_t* data = reinterpret_cast<const uint8_t*>(value.data());
    Bytes out;
    out.reserve(value.size());
    size_t i = 0;
    while (i < value.size()) {
        uint32_t cp = 0;
        size_t len = utf8SequenceAt(data, value.size(), i, cp);
        if (len == 0) {
            return Result<Bytes>(Error(ErrorCode::StoreError,
                "Stored value is not valid UTF-8 at byte " + std::to_string(i)));
        }
        if (cp >= ESCAPE_FIRST && cp <= ESCAPE_LAST) {
            out.push_back(static_cast<uint8_t>(cp - ESCAPE_BASE));
        } else {
            out.insert(out.end(), data + i, data + i + len);
        }
        i += len;
    }
    return Result<Bytes>(std::move(out));
}

// 从baseURL_中提取主机名
std::string HttpStore::Location() const {
    std::string url = baseURL_;

    size_t protocolPos = url.find("://");
    if (protocolPos != std::string::npos) {
        url = url.substr(protocolPos + 3);
    }

    size_t atPos = url.find('@');
    if (atPos != std::string::npos) {
        url = url.substr(atPos + 1);
    }

    size_t pathPos = url.find_first_of("/?#");
    if (pathPos != std::string::npos) {
        url = url.substr(0, pathPos);
    }
    return url;
}

} // namespace storage
} // namespace hpkvfs
