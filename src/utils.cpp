#include "utils.hpp"
#include <algorithm>
#include <chrono>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace utils
{
    std::string to_lower(const std::string &str)
    {
        std::string result = str;
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    std::vector<std::string> split(const std::string &str, char delimiter)
    {
        std::vector<std::string> tokens;
        std::stringstream ss(str);
        std::string token;

        while (std::getline(ss, token, delimiter))
        {
            if (!token.empty())
            {
                tokens.push_back(token);
            }
        }

        return tokens;
    }

    std::string join(const std::vector<std::string> &parts, const std::string &separator)
    {
        std::string out;
        for (size_t i = 0; i < parts.size(); ++i)
        {
            if (i > 0)
                out += separator;
            out += parts[i];
        }
        return out;
    }

    std::string trim(const std::string &str)
    {
        return trim(str, " \t\n\r");
    }

    std::string trim(const std::string &str, const std::string &chars_to_trim)
    {
        size_t start = str.find_first_not_of(chars_to_trim);
        if (start == std::string::npos)
            return "";

        size_t end = str.find_last_not_of(chars_to_trim);
        return str.substr(start, end - start + 1);
    }

    bool starts_with(const std::string &str, const std::string &prefix)
    {
        return str.size() >= prefix.size() &&
               str.compare(0, prefix.size(), prefix) == 0;
    }

    bool ends_with(const std::string &str, const std::string &suffix)
    {
        return str.size() >= suffix.size() &&
               str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    std::string url_encode(const std::string &value)
    {
        static const char *hex = "0123456789ABCDEF";
        std::string out;
        out.reserve(value.size() * 3);
        for (unsigned char c : value)
        {
            // RFC 3986 unreserved
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
            {
                out.push_back(static_cast<char>(c));
            }
            else
            {
                out.push_back('%');
                out.push_back(hex[(c >> 4) & 0xF]);
                out.push_back(hex[c & 0xF]);
            }
        }
        return out;
    }

    static int hex_value(char c)
    {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        return -1;
    }

    std::string url_decode(const std::string &value)
    {
        std::string out;
        out.reserve(value.size());
        for (size_t i = 0; i < value.size(); ++i)
        {
            char c = value[i];
            if (c == '+')
            {
                out.push_back(' ');
            }
            else if (c == '%' && i + 2 < value.size())
            {
                int hi = hex_value(value[i + 1]);
                int lo = hex_value(value[i + 2]);
                if (hi < 0 || lo < 0)
                {
                    out.push_back(c);
                    continue;
                }
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
            }
            else
            {
                out.push_back(c);
            }
        }
        return out;
    }

    std::map<std::string, std::string> parse_form(const std::string &body)
    {
        std::map<std::string, std::string> params;
        for (const auto &pair : split(body, '&'))
        {
            size_t eq = pair.find('=');
            std::string key = url_decode(eq == std::string::npos ? pair : pair.substr(0, eq));
            std::string value = eq == std::string::npos ? "" : url_decode(pair.substr(eq + 1));
            if (key.empty())
                continue;
            // 重复参数只保留第一次出现的值
            params.emplace(key, value);
        }
        return params;
    }

    std::string build_query(const std::vector<std::pair<std::string, std::string>> &params)
    {
        std::string out;
        for (const auto &kv : params)
        {
            if (!out.empty())
                out.push_back('&');
            out += url_encode(kv.first);
            out.push_back('=');
            out += url_encode(kv.second);
        }
        return out;
    }

    std::string append_query(const std::string &url, const std::vector<std::pair<std::string, std::string>> &params)
    {
        if (params.empty())
            return url;
        char sep = url.find('?') == std::string::npos ? '?' : '&';
        return url + sep + build_query(params);
    }

    long get_current_timestamp()
    {
        return static_cast<long>(std::time(nullptr));
    }

    std::string get_formatted_timestamp()
    {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        std::tm tm_buf{};
        localtime_r(&time_t, &tm_buf);

        std::stringstream ss;
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }
}
