#pragma once

#include <memory>
#include <string>
#include <vector>
#include "ConfigManager.hpp"
#include "OAuthStore.hpp"

// 命令行参数：服务启动选项加上至多一个管理命令
struct CommandLine
{
    std::string config_path = "./config/hub_config.json";
    int port = 0;
    std::string host;

    std::string command;
    std::vector<std::string> arguments;
    std::vector<std::string> redirect_uris;
    bool is_public = false;
};

void print_usage();

// 解析失败时返回 false
bool parse_command_line(int argc, char *argv[], CommandLine &cli);

// 管理命令直接修改持久化存储；内存后端下的修改随进程退出丢失，因此拒绝
bool check_admin_backend(const CommandLine &cli, const DatabaseConfig &db_config, std::string &error);

// 返回进程退出码
int run_admin_command(const CommandLine &cli, const std::shared_ptr<OAuthStore> &store, Clock clock = system_clock());
