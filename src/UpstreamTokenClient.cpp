#include "UpstreamTokenClient.hpp"
#include "Crypto.hpp"
#include "config.hpp"
#include "utils.hpp"
#include <curl/curl.h>
#include <iostream>

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

    struct HeaderListDeleter
    {
        void operator()(curl_slist *list) const
        {
            if (list)
                curl_slist_free_all(list);
        }
    };
}

UpstreamTokenClient::UpstreamTokenClient(std::shared_ptr<UpstreamDiscovery> discovery, UpstreamConfig config,
                                         Poster poster)
    : discovery_(std::move(discovery)), config_(std::move(config)), poster_(std::move(poster))
{
}

nlohmann::json UpstreamTokenClient::exchange_code(const std::string &code)
{
    if (!discovery_)
        throw UpstreamError("未配置上游 discovery_url");

    std::string form = utils::build_query({{"grant_type", config::GRANT_AUTHORIZATION_CODE},
                                           {"code", code},
                                           {"redirect_uri", config_.redirect_uri},
                                           {"client_id", config_.client_id},
                                           {"client_secret", config_.client_secret}});

    std::string body = poster_(discovery_->token_endpoint(), form);
    nlohmann::json response = nlohmann::json::parse(body, nullptr, false);
    if (response.is_discarded() || !response.is_object())
        throw UpstreamError("上游 token 响应不是合法 JSON");
    if (!response.contains("id_token") || !response["id_token"].is_string())
        throw UpstreamError("上游 token 响应缺少 id_token");

    return decode_id_token_claims(response["id_token"].get<std::string>());
}

nlohmann::json UpstreamTokenClient::decode_id_token_claims(const std::string &id_token)
{
    std::vector<std::string> parts = utils::split(id_token, '.');
    if (parts.size() != 3 || parts[1].empty())
        throw UpstreamError("id_token 格式错误");

    std::string payload = crypto::base64_url_decode(parts[1]);
    nlohmann::json claims = nlohmann::json::parse(payload, nullptr, false);
    if (claims.is_discarded() || !claims.is_object())
        throw UpstreamError("id_token payload 无法解析");
    return claims;
}

UpstreamTokenClient::Poster UpstreamTokenClient::curl_poster(long timeout_seconds)
{
    return [timeout_seconds](const std::string &url, const std::string &form_body) -> std::string
    {
        std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
        if (!curl)
            throw UpstreamError("curl_easy_init 失败");

        std::unique_ptr<curl_slist, HeaderListDeleter> headers(
            curl_slist_append(nullptr, "Content-Type: application/x-www-form-urlencoded"));
        if (!headers)
            throw UpstreamError("curl_slist_append 失败");

        std::string response;
        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, form_body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(form_body.size()));
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds);
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, timeout_seconds);

        CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK)
            throw UpstreamError("上游 token 请求失败: " + std::string(curl_easy_strerror(res)));

        long response_code = 0;
        if (curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response_code) != CURLE_OK ||
            response_code < 200 || response_code >= 300)
        {
            std::cerr << "❌ 上游 token 端点返回 HTTP " << response_code << ": " << response.substr(0, 200)
                      << std::endl;
            throw UpstreamError("上游 token 端点返回 HTTP " + std::to_string(response_code));
        }

        return response;
    };
}
