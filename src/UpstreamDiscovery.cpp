#include "UpstreamDiscovery.hpp"
#include <curl/curl.h>
#include <iostream>
#include <memory>

namespace
{
    size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *response)
    {
        size_t total_size = size * nmemb;
        response->append(static_cast<char *>(contents), total_size);
        return total_size;
    }

    struct CurlDeleter
    {
        void operator()(CURL *curl) const
        {
            if (curl)
                curl_easy_cleanup(curl);
        }
    };
}

UpstreamDiscovery::UpstreamDiscovery(std::string discovery_url, long ttl_seconds, Fetcher fetcher, Clock clock)
    : discovery_url_(std::move(discovery_url)), ttl_seconds_(ttl_seconds), fetcher_(std::move(fetcher)),
      clock_(std::move(clock))
{
}

nlohmann::json UpstreamDiscovery::load()
{
    if (discovery_url_.empty())
        throw UpstreamError("未配置上游 discovery_url");

    std::string body = fetcher_(discovery_url_);
    nlohmann::json document = nlohmann::json::parse(body, nullptr, false);
    if (document.is_discarded() || !document.is_object())
        throw UpstreamError("上游 discovery 文档不是合法 JSON");

    for (const char *key : {"authorization_endpoint", "token_endpoint"})
    {
        if (!document.contains(key) || !document[key].is_string())
            throw UpstreamError(std::string("上游 discovery 文档缺少 ") + key);
    }
    return document;
}

nlohmann::json UpstreamDiscovery::get()
{
    std::lock_guard<std::mutex> lock(mutex_);
    long now = clock_();
    if (document_ && now - loaded_at_ < ttl_seconds_)
        return *document_;

    // 先丢弃过期数据，加载失败时不会再被读到
    document_.reset();
    nlohmann::json document = load();
    document_ = document;
    loaded_at_ = now;
    std::cout << "已加载上游 discovery 文档: " << discovery_url_ << std::endl;
    return document;
}

std::string UpstreamDiscovery::authorization_endpoint()
{
    return get()["authorization_endpoint"].get<std::string>();
}

std::string UpstreamDiscovery::token_endpoint()
{
    return get()["token_endpoint"].get<std::string>();
}

std::string UpstreamDiscovery::userinfo_endpoint()
{
    return get().value("userinfo_endpoint", "");
}

void UpstreamDiscovery::invalidate()
{
    std::lock_guard<std::mutex> lock(mutex_);
    document_.reset();
    loaded_at_ = 0;
}

bool UpstreamDiscovery::is_cached() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return document_.has_value();
}

UpstreamDiscovery::Fetcher UpstreamDiscovery::curl_fetcher(long timeout_seconds)
{
    return [timeout_seconds](const std::string &url) -> std::string
    {
        std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
        if (!curl)
            throw UpstreamError("curl_easy_init 失败");

        std::string response;
        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds);
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, timeout_seconds);
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "gzip, deflate");

        CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK)
            throw UpstreamError("上游请求失败: " + std::string(curl_easy_strerror(res)));

        long response_code = 0;
        if (curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response_code) != CURLE_OK ||
            response_code < 200 || response_code >= 300)
            throw UpstreamError("上游返回 HTTP " + std::to_string(response_code));

        return response;
    };
}
