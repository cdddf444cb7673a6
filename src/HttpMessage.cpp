#include "HttpMessage.hpp"
#include "utils.hpp"
#include <sstream>

std::string HttpRequest::header(const std::string &name) const
{
    auto it = headers.find(utils::to_lower(name));
    return it == headers.end() ? "" : it->second;
}

std::map<std::string, std::string> HttpRequest::query_params() const
{
    return utils::parse_form(query);
}

std::map<std::string, std::string> HttpRequest::form_params() const
{
    return utils::parse_form(body);
}

std::string HttpRequest::cookie(const std::string &name) const
{
    for (const auto &item : utils::split(header("cookie"), ';'))
    {
        std::string pair = utils::trim(item);
        size_t eq = pair.find('=');
        if (eq == std::string::npos)
            continue;
        if (pair.substr(0, eq) == name)
            return pair.substr(eq + 1);
    }
    return "";
}

bool HttpRequest::parse(const std::string &raw, HttpRequest &out)
{
    size_t header_end = raw.find("\r\n\r\n");
    if (header_end == std::string::npos)
        return false;

    size_t line_end = raw.find("\r\n");
    std::istringstream request_line(raw.substr(0, line_end));
    std::string target;
    std::string version;
    if (!(request_line >> out.method >> target >> version))
        return false;
    if (!utils::starts_with(version, "HTTP/"))
        return false;

    size_t question = target.find('?');
    if (question == std::string::npos)
    {
        out.path = target;
        out.query.clear();
    }
    else
    {
        out.path = target.substr(0, question);
        out.query = target.substr(question + 1);
    }

    out.headers.clear();
    size_t pos = line_end + 2;
    while (pos < header_end)
    {
        size_t next = raw.find("\r\n", pos);
        if (next == std::string::npos || next > header_end)
            next = header_end;

        std::string line = raw.substr(pos, next - pos);
        size_t colon = line.find(':');
        if (colon != std::string::npos)
            out.headers[utils::to_lower(utils::trim(line.substr(0, colon)))] = utils::trim(line.substr(colon + 1));
        pos = next + 2;
    }

    out.body = raw.substr(header_end + 4);
    return true;
}

void HttpResponse::set_header(const std::string &name, const std::string &value)
{
    for (auto &entry : headers)
    {
        if (utils::to_lower(entry.first) == utils::to_lower(name))
        {
            entry.second = value;
            return;
        }
    }
    headers.emplace_back(name, value);
}

void HttpResponse::add_header(const std::string &name, const std::string &value)
{
    headers.emplace_back(name, value);
}

std::vector<std::string> HttpResponse::header_values(const std::string &name) const
{
    std::vector<std::string> values;
    for (const auto &entry : headers)
    {
        if (utils::to_lower(entry.first) == utils::to_lower(name))
            values.push_back(entry.second);
    }
    return values;
}

std::string HttpResponse::header(const std::string &name) const
{
    for (const auto &entry : headers)
    {
        if (utils::to_lower(entry.first) == utils::to_lower(name))
            return entry.second;
    }
    return "";
}

std::string HttpResponse::serialize() const
{
    std::string out = "HTTP/1.1 " + std::to_string(status) + " " + reason_phrase(status) + "\r\n";
    for (const auto &entry : headers)
        out += entry.first + ": " + entry.second + "\r\n";
    out += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    out += "Connection: close\r\n";
    out += "\r\n";
    out += body;
    return out;
}

HttpResponse HttpResponse::json(int status, const nlohmann::json &body)
{
    HttpResponse response;
    response.status = status;
    response.set_header("Content-Type", "application/json");
    response.body = body.dump();
    return response;
}

HttpResponse HttpResponse::redirect(const std::string &location)
{
    HttpResponse response;
    response.status = 302;
    response.set_header("Location", location);
    return response;
}

const char *HttpResponse::reason_phrase(int status)
{
    switch (status)
    {
    case 200:
        return "OK";
    case 302:
        return "Found";
    case 400:
        return "Bad Request";
    case 401:
        return "Unauthorized";
    case 404:
        return "Not Found";
    case 405:
        return "Method Not Allowed";
    case 413:
        return "Payload Too Large";
    case 500:
        return "Internal Server Error";
    case 502:
        return "Bad Gateway";
    case 503:
        return "Service Unavailable";
    default:
        return "Unknown";
    }
}
