#include "AdminCommands.hpp"
#include "AccessManager.hpp"
#include "ClientRegistry.hpp"
#include <iostream>
#include <set>

namespace
{
    const std::set<std::string> &single_argument_commands()
    {
        static const std::set<std::string> commands = {
            "--register-client", "--rotate-secret", "--deactivate-client", "--set-public",  "--set-private",
            "--create-group",    "--delete-group",  "--who-can-access",    "--accessible-clients"};
        return commands;
    }

    const std::set<std::string> &two_argument_commands()
    {
        static const std::set<std::string> commands = {"--add-member", "--remove-member", "--grant-user",
                                                       "--grant-group", "--revoke-user", "--revoke-group"};
        return commands;
    }

    void print_joined(const std::string &label, const std::set<std::string> &values)
    {
        std::cout << "   " << label << ": ";
        if (values.empty())
            std::cout << "(无)";
        bool first = true;
        for (const auto &value : values)
        {
            std::cout << (first ? "" : ", ") << value;
            first = false;
        }
        std::cout << std::endl;
    }

    void print_summary(const std::string &client_id, const AccessSummary &summary, OAuthStore &store)
    {
        std::cout << "🔐 " << client_id << (summary.is_public ? " (公开，所有激活用户可访问)" : "") << std::endl;

        std::set<std::string> group_names;
        for (const auto &group_id : summary.groups)
        {
            auto group = store.find_group(group_id);
            group_names.insert(group ? group->name : group_id);
        }

        print_joined("直接授权", summary.direct_subjects);
        print_joined("授权组", group_names);
        if (!summary.is_public)
            print_joined("全部用户", summary.subjects);
    }
}

void print_usage()
{
    std::cout << "用法: hub_oauth_server [选项]" << std::endl;
    std::cout << "选项:" << std::endl;
    std::cout << "  --config PATH                     配置文件路径 (默认: ./config/hub_config.json)" << std::endl;
    std::cout << "  --port PORT                       服务器监听端口 (默认: 8000)" << std::endl;
    std::cout << "  --host HOST                       服务器绑定地址 (默认: 0.0.0.0)" << std::endl;
    std::cout << "  --help                            显示此帮助信息" << std::endl;
    std::cout << std::endl;
    std::cout << "管理命令 (需要 mysql 存储后端):" << std::endl;
    std::cout << "  --register-client NAME --redirect-uri URI [--redirect-uri URI ...] [--public]" << std::endl;
    std::cout << "  --rotate-secret CLIENT_ID" << std::endl;
    std::cout << "  --deactivate-client CLIENT_ID" << std::endl;
    std::cout << "  --set-public CLIENT_ID | --set-private CLIENT_ID" << std::endl;
    std::cout << "  --create-group NAME | --delete-group NAME" << std::endl;
    std::cout << "  --add-member GROUP USER           USER 为内部用户 id 或上游 subject" << std::endl;
    std::cout << "  --remove-member GROUP USER" << std::endl;
    std::cout << "  --grant-user CLIENT_ID USER | --revoke-user CLIENT_ID USER" << std::endl;
    std::cout << "  --grant-group CLIENT_ID GROUP | --revoke-group CLIENT_ID GROUP" << std::endl;
    std::cout << "  --who-can-access CLIENT_ID        列出可访问该客户端的用户和组" << std::endl;
    std::cout << "  --accessible-clients USER         列出该用户可访问的客户端" << std::endl;
    std::cout << "  --cleanup                         删除过期的授权码和令牌" << std::endl;
    std::cout << std::endl;
    std::cout << "示例:" << std::endl;
    std::cout << "  hub_oauth_server --config ./config/hub_config.json --port 8000" << std::endl;
    std::cout << "  hub_oauth_server --register-client Wiki --redirect-uri https://wiki.example.com/callback" << std::endl;
}

bool parse_command_line(int argc, char *argv[], CommandLine &cli)
{
    auto take = [&](int &i, int count, const std::string &name) -> bool
    {
        if (i + count >= argc)
        {
            std::cerr << "❌ 参数不足: " << name << std::endl;
            return false;
        }
        if (!cli.command.empty())
        {
            std::cerr << "❌ 一次只能执行一个管理命令" << std::endl;
            return false;
        }
        cli.command = name;
        for (int k = 0; k < count; ++k)
            cli.arguments.push_back(argv[++i]);
        return true;
    };

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc)
        {
            cli.config_path = argv[++i];
        }
        else if (arg == "--port" && i + 1 < argc)
        {
            try
            {
                cli.port = std::stoi(argv[++i]);
            }
            catch (const std::exception &)
            {
                std::cerr << "❌ 无效端口: " << argv[i] << std::endl;
                return false;
            }
        }
        else if (arg == "--host" && i + 1 < argc)
        {
            cli.host = argv[++i];
        }
        else if (arg == "--redirect-uri" && i + 1 < argc)
        {
            cli.redirect_uris.push_back(argv[++i]);
        }
        else if (arg == "--public")
        {
            cli.is_public = true;
        }
        else if (single_argument_commands().count(arg))
        {
            if (!take(i, 1, arg))
                return false;
        }
        else if (two_argument_commands().count(arg))
        {
            if (!take(i, 2, arg))
                return false;
        }
        else if (arg == "--cleanup")
        {
            if (!take(i, 0, arg))
                return false;
        }
        else
        {
            std::cerr << "❌ 未知参数: " << arg << std::endl;
            return false;
        }
    }
    return true;
}

bool check_admin_backend(const CommandLine &cli, const DatabaseConfig &db_config, std::string &error)
{
    if (!cli.command.empty() && db_config.backend == "memory")
    {
        error = "管理命令 " + cli.command + " 需要持久化存储，当前 database.backend=memory";
        return false;
    }
    return true;
}

int run_admin_command(const CommandLine &cli, const std::shared_ptr<OAuthStore> &store, Clock clock)
{
    auto clients = std::make_shared<ClientRegistry>(store, clock);
    auto access = std::make_shared<AccessManager>(store, std::make_shared<AccessEvaluator>(store), clock);
    const auto &args = cli.arguments;

    try
    {
        if (cli.command == "--register-client")
        {
            if (cli.redirect_uris.empty())
            {
                std::cerr << "❌ 至少需要一个 --redirect-uri" << std::endl;
                return 1;
            }
            RegisteredClient registered = clients->register_client(args[0], cli.redirect_uris, cli.is_public);
            std::cout << "✅ 客户端已注册" << std::endl;
            std::cout << "   client_id:     " << registered.client.client_id << std::endl;
            std::cout << "   client_secret: " << registered.client_secret << std::endl;
            std::cout << "   (secret 只显示这一次)" << std::endl;
        }
        else if (cli.command == "--rotate-secret")
        {
            auto secret = clients->rotate_secret(args[0]);
            if (!secret)
            {
                std::cerr << "❌ 客户端不存在: " << args[0] << std::endl;
                return 1;
            }
            std::cout << "✅ 新 client_secret: " << *secret << std::endl;
        }
        else if (cli.command == "--deactivate-client")
        {
            if (!clients->deactivate(args[0]))
            {
                std::cerr << "❌ 客户端不存在: " << args[0] << std::endl;
                return 1;
            }
            std::cout << "✅ 客户端已停用" << std::endl;
        }
        else if (cli.command == "--set-public" || cli.command == "--set-private")
        {
            access->set_public(args[0], cli.command == "--set-public");
            std::cout << "✅ 已更新" << std::endl;
        }
        else if (cli.command == "--create-group")
        {
            Group group = access->create_group(args[0]);
            std::cout << "✅ 组 id: " << group.id << std::endl;
        }
        else if (cli.command == "--delete-group")
        {
            if (!access->delete_group(args[0]))
            {
                std::cerr << "❌ 组不存在: " << args[0] << std::endl;
                return 1;
            }
            std::cout << "✅ 组已删除" << std::endl;
        }
        else if (cli.command == "--add-member")
        {
            bool added = access->add_member(args[0], args[1]);
            std::cout << (added ? "✅ 已加入组" : "ℹ️  已是组成员") << std::endl;
        }
        else if (cli.command == "--remove-member")
        {
            bool removed = access->remove_member(args[0], args[1]);
            std::cout << (removed ? "✅ 已移出组" : "ℹ️  不是组成员") << std::endl;
        }
        else if (cli.command == "--grant-user")
        {
            bool added = access->grant_user(args[0], args[1]);
            std::cout << (added ? "✅ 已授权" : "ℹ️  授权已存在") << std::endl;
        }
        else if (cli.command == "--grant-group")
        {
            bool added = access->grant_group(args[0], args[1]);
            std::cout << (added ? "✅ 已授权" : "ℹ️  授权已存在") << std::endl;
        }
        else if (cli.command == "--revoke-user")
        {
            bool removed = access->revoke_user(args[0], args[1]);
            std::cout << (removed ? "✅ 已撤销授权" : "ℹ️  授权不存在") << std::endl;
        }
        else if (cli.command == "--revoke-group")
        {
            bool removed = access->revoke_group(args[0], args[1]);
            std::cout << (removed ? "✅ 已撤销授权" : "ℹ️  授权不存在") << std::endl;
        }
        else if (cli.command == "--who-can-access")
        {
            print_summary(args[0], access->principals_with_access(args[0]), *store);
        }
        else if (cli.command == "--accessible-clients")
        {
            std::vector<Client> reachable = access->accessible_clients(args[0]);
            std::cout << "🔐 " << args[0] << " 可访问 " << reachable.size() << " 个客户端" << std::endl;
            for (const auto &client : reachable)
                std::cout << "   " << client.client_id << "  " << client.name << std::endl;
        }
        else if (cli.command == "--cleanup")
        {
            PurgeStats stats = store->purge_expired(clock());
            std::cout << "✅ 已删除过期授权码 " << stats.deleted_codes << " 个，令牌 " << stats.deleted_tokens << " 个"
                      << std::endl;
        }
        else
        {
            std::cerr << "❌ 未知管理命令: " << cli.command << std::endl;
            return 1;
        }
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "❌ " << e.what() << std::endl;
        return 1;
    }
    catch (const StoreError &e)
    {
        std::cerr << "❌ 存储错误: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
