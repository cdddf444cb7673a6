#pragma once

#include <map>
#include <string>
#include <vector>

namespace utils
{
    // 字符串工具
    std::string to_lower(const std::string &str);
    std::vector<std::string> split(const std::string &str, char delimiter);
    std::string join(const std::vector<std::string> &parts, const std::string &separator);
    std::string trim(const std::string &str);
    std::string trim(const std::string &str, const std::string &chars_to_trim);
    bool starts_with(const std::string &str, const std::string &prefix);
    bool ends_with(const std::string &str, const std::string &suffix);

    // URL 编解码
    std::string url_encode(const std::string &value);
    std::string url_decode(const std::string &value);

    // 解析 application/x-www-form-urlencoded 或查询字符串
    std::map<std::string, std::string> parse_form(const std::string &body);

    // 组装查询字符串，按参数顺序输出
    std::string build_query(const std::vector<std::pair<std::string, std::string>> &params);

    // 在 URL 后追加查询参数（已有 ? 时使用 &）
    std::string append_query(const std::string &url, const std::vector<std::pair<std::string, std::string>> &params);

    // 时间工具
    long get_current_timestamp();
    std::string get_formatted_timestamp();
}
