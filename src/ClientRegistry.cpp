#include "ClientRegistry.hpp"
#include "Crypto.hpp"
#include <iostream>

namespace
{
    // 未知客户端时参与比较的占位哈希，使各失败分支耗时一致
    const std::string &placeholder_hash()
    {
        static const std::string hash = crypto::sha256_hex("hub-oauth-placeholder-secret");
        return hash;
    }
}

ClientRegistry::ClientRegistry(std::shared_ptr<OAuthStore> store, Clock clock)
    : store_(std::move(store)), clock_(std::move(clock))
{
}

std::string ClientRegistry::hash_secret(const std::string &secret)
{
    return crypto::sha256_hex(secret);
}

std::optional<Client> ClientRegistry::find_active(const std::string &client_id) const
{
    if (client_id.empty())
        return std::nullopt;
    auto client = store_->find_client_by_client_id(client_id);
    if (!client || !client->active)
        return std::nullopt;
    return client;
}

OAuthResult<Client> ClientRegistry::authenticate(const std::string &client_id, const std::string &client_secret) const
{
    auto client = find_active(client_id);

    const std::string &stored_hash = client ? client->client_secret_hash : placeholder_hash();
    bool secret_ok = crypto::constant_time_equals(hash_secret(client_secret), stored_hash);

    if (!client || !secret_ok || client_secret.empty())
        return OAuthResult<Client>::failure(OAuthError::InvalidClient);

    return OAuthResult<Client>::success(*client);
}

bool ClientRegistry::is_redirect_uri_allowed(const Client &client, const std::string &redirect_uri) const
{
    if (redirect_uri.empty())
        return false;
    return client.redirect_uris.count(redirect_uri) > 0;
}

RegisteredClient ClientRegistry::register_client(const std::string &name, const std::vector<std::string> &redirect_uris,
                                                 bool is_public)
{
    RegisteredClient registered;
    Client &client = registered.client;
    client.id = crypto::random_hex();
    client.name = name;
    client.redirect_uris.insert(redirect_uris.begin(), redirect_uris.end());
    client.is_public = is_public;
    client.active = true;
    client.created_at = clock_();

    registered.client_secret = crypto::random_token(32);
    client.client_secret_hash = hash_secret(registered.client_secret);

    // client_id 冲突概率可忽略，仍重试几次
    for (int attempt = 0; attempt < 3; ++attempt)
    {
        client.client_id = "hub_" + crypto::random_token(16);
        if (store_->insert_client(client))
        {
            std::cout << "已注册客户端: " << client.client_id << " (" << name << ")" << std::endl;
            return registered;
        }
    }
    throw StoreError("无法为客户端分配唯一的 client_id");
}

std::optional<std::string> ClientRegistry::rotate_secret(const std::string &client_id)
{
    std::string secret = crypto::random_token(32);
    if (!store_->update_client_secret(client_id, hash_secret(secret)))
        return std::nullopt;

    std::cout << "客户端密钥已轮换: " << client_id << std::endl;
    return secret;
}

bool ClientRegistry::deactivate(const std::string &client_id)
{
    return store_->set_client_active(client_id, false);
}
