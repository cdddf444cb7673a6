#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "OAuthTypes.hpp"

// 上游 OIDC discovery 文档缓存：首次读取时加载，每次读取检查 TTL，
// 过期后重新加载；加载失败抛出 UpstreamError，不回退到旧数据
class UpstreamDiscovery
{
public:
    // 按 URL 取回文档正文；失败时抛出 UpstreamError
    using Fetcher = std::function<std::string(const std::string &url)>;

    UpstreamDiscovery(std::string discovery_url, long ttl_seconds, Fetcher fetcher, Clock clock = system_clock());

    nlohmann::json get();

    std::string authorization_endpoint();
    std::string token_endpoint();
    std::string userinfo_endpoint();

    // 丢弃缓存，下次读取强制重新加载
    void invalidate();

    bool is_cached() const;

    // libcurl 实现的 GET
    static Fetcher curl_fetcher(long timeout_seconds);

private:
    nlohmann::json load();

    std::string discovery_url_;
    long ttl_seconds_;
    Fetcher fetcher_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::optional<nlohmann::json> document_;
    long loaded_at_ = 0;
};
