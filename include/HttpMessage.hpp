#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

// 解析后的 HTTP 请求；header 名称统一为小写
struct HttpRequest
{
    std::string method;
    std::string path;
    std::string query;
    std::map<std::string, std::string> headers;
    std::string body;

    std::string header(const std::string &name) const;

    std::map<std::string, std::string> query_params() const;
    std::map<std::string, std::string> form_params() const;

    // Cookie 头中的单个值，不存在时返回空串
    std::string cookie(const std::string &name) const;

    // 解析请求行和头部；raw 必须包含完整头部（\r\n\r\n）
    static bool parse(const std::string &raw, HttpRequest &out);
};

struct HttpResponse
{
    int status = 200;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    // 替换同名 header
    void set_header(const std::string &name, const std::string &value);
    // 追加，允许重复（Set-Cookie）
    void add_header(const std::string &name, const std::string &value);
    std::string header(const std::string &name) const;
    std::vector<std::string> header_values(const std::string &name) const;

    // 序列化为 HTTP/1.1 报文（Connection: close）
    std::string serialize() const;

    static HttpResponse json(int status, const nlohmann::json &body);
    static HttpResponse redirect(const std::string &location);
    static const char *reason_phrase(int status);
};
