#pragma once

#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "ConfigManager.hpp"
#include "UpstreamDiscovery.hpp"

// 用上游授权码换取 id_token，并取出其中的身份声明
class UpstreamTokenClient
{
public:
    // 以 application/x-www-form-urlencoded 提交表单并返回响应正文；失败时抛出 UpstreamError
    using Poster = std::function<std::string(const std::string &url, const std::string &form_body)>;

    UpstreamTokenClient(std::shared_ptr<UpstreamDiscovery> discovery, UpstreamConfig config, Poster poster);

    // 调用上游 token 端点，返回 id_token 的 payload；任何失败抛出 UpstreamError
    nlohmann::json exchange_code(const std::string &code);

    // 解出 JWT payload，不校验签名：id_token 来自服务端直连 token 端点的响应
    static nlohmann::json decode_id_token_claims(const std::string &id_token);

    // libcurl 实现的 POST
    static Poster curl_poster(long timeout_seconds);

private:
    std::shared_ptr<UpstreamDiscovery> discovery_;
    UpstreamConfig config_;
    Poster poster_;
};
