#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "OAuthStore.hpp"

// 新注册的客户端；明文 secret 只在此处出现一次
struct RegisteredClient
{
    Client client;
    std::string client_secret;
};

class ClientRegistry
{
public:
    explicit ClientRegistry(std::shared_ptr<OAuthStore> store, Clock clock = system_clock());

    // 按 client_id 查找处于激活状态的客户端
    std::optional<Client> find_active(const std::string &client_id) const;

    // 校验 client_id + secret。未知 id、停用、密钥错误统一返回 invalid_client，
    // 且三种情况都执行一次哈希和定长比较
    OAuthResult<Client> authenticate(const std::string &client_id, const std::string &client_secret) const;

    // 精确匹配，不做前缀或通配
    bool is_redirect_uri_allowed(const Client &client, const std::string &redirect_uri) const;

    RegisteredClient register_client(const std::string &name, const std::vector<std::string> &redirect_uris,
                                     bool is_public = false);

    // 生成新 secret 并原子替换哈希，旧 secret 立即失效；客户端不存在时返回空
    std::optional<std::string> rotate_secret(const std::string &client_id);

    bool deactivate(const std::string &client_id);

    static std::string hash_secret(const std::string &secret);

private:
    std::shared_ptr<OAuthStore> store_;
    Clock clock_;
};
