#include "AdminCommands.hpp"
#include "ConfigManager.hpp"
#include "DatabaseManager.hpp"
#include "MemoryOAuthStore.hpp"
#include "OAuthServer.hpp"
#include "UpstreamDiscovery.hpp"
#include <curl/curl.h>
#include <signal.h>
#include <iostream>
#include <memory>
#include <string>

// 全局服务器指针，用于信号处理
static OAuthServer *g_server = nullptr;

// 信号处理函数：只设置停止标志，主循环退出后清理
void signal_handler(int)
{
    if (g_server)
        g_server->stop();
}

std::shared_ptr<OAuthStore> open_store(const DatabaseConfig &db_config)
{
    if (db_config.backend == "memory")
    {
        std::cout << "⚠️  使用内存存储，重启后数据丢失" << std::endl;
        return std::make_shared<MemoryOAuthStore>();
    }

    auto database = std::make_shared<DatabaseManager>(db_config);
    if (!database->initialize())
        return nullptr;
    std::cout << "📊 " << database->get_pool_status() << std::endl;
    return database;
}

int main(int argc, char *argv[])
{
    for (int i = 1; i < argc; ++i)
    {
        if (std::string(argv[i]) == "--help")
        {
            print_usage();
            return 0;
        }
    }

    CommandLine cli;
    if (!parse_command_line(argc, argv, cli))
    {
        print_usage();
        return 1;
    }

    ConfigManager config(cli.config_path);
    if (!config.load_config())
    {
        std::cerr << "❌ 加载配置失败: " << cli.config_path << std::endl;
        return 1;
    }

    ServerConfig server_config = config.get_server_config();
    if (cli.port > 0)
        server_config.port = cli.port;
    if (!cli.host.empty())
        server_config.host = cli.host;
    config.set_server_config(server_config);

    std::string error;
    if (!check_admin_backend(cli, config.get_database_config(), error))
    {
        std::cerr << "❌ " << error << std::endl;
        return 1;
    }

    std::shared_ptr<OAuthStore> store = open_store(config.get_database_config());
    if (!store)
    {
        std::cerr << "❌ 存储初始化失败" << std::endl;
        return 1;
    }

    if (!cli.command.empty())
        return run_admin_command(cli, store);

    if (!config.validate(error))
    {
        std::cerr << "❌ 配置无效: " << error << std::endl;
        return 1;
    }

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
    {
        std::cerr << "❌ libcurl 初始化失败" << std::endl;
        return 1;
    }

    std::shared_ptr<UpstreamDiscovery> discovery;
    const UpstreamConfig &upstream = config.get_upstream_config();
    if (!upstream.discovery_url.empty())
    {
        discovery = std::make_shared<UpstreamDiscovery>(upstream.discovery_url, upstream.cache_ttl,
                                                        UpstreamDiscovery::curl_fetcher(upstream.request_timeout));
        if (upstream.client_secret.empty())
            std::cout << "⚠️  未设置上游 client_secret（HUB_UPSTREAM_CLIENT_SECRET），上游换码可能被拒绝" << std::endl;
    }
    else
    {
        std::cout << "⚠️  未配置上游 discovery_url，SSO 登录不可用" << std::endl;
    }

    OAuthServer server(config, store, discovery);
    g_server = &server;

    struct sigaction action;
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    if (sigaction(SIGINT, &action, nullptr) != 0 || sigaction(SIGTERM, &action, nullptr) != 0)
        std::cerr << "⚠️  注册信号处理失败，只能强制终止" << std::endl;

    std::cout << "🚀 启动 hub OAuth 授权服务..." << std::endl;
    bool started = server.start();

    g_server = nullptr;
    curl_global_cleanup();
    return started ? 0 : 1;
}
