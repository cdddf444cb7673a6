#include "AccessManager.hpp"
#include "Crypto.hpp"
#include <iostream>

AccessManager::AccessManager(std::shared_ptr<OAuthStore> store, std::shared_ptr<AccessEvaluator> evaluator,
                             Clock clock)
    : store_(std::move(store)), evaluator_(std::move(evaluator)), clock_(std::move(clock))
{
}

Client AccessManager::require_client(const std::string &client_id)
{
    auto client = store_->find_client_by_client_id(client_id);
    if (!client)
        throw NotFoundError("客户端不存在: " + client_id);
    return *client;
}

Group AccessManager::require_group(const std::string &name)
{
    auto group = store_->find_group_by_name(name);
    if (!group)
        throw NotFoundError("组不存在: " + name);
    return *group;
}

std::string AccessManager::resolve_user(const std::string &reference)
{
    if (store_->find_user(reference))
        return reference;
    auto user = store_->find_user_by_external_id(reference);
    return user ? user->id : reference;
}

std::string AccessManager::require_user(const std::string &reference)
{
    if (store_->find_user(reference))
        return reference;
    auto user = store_->find_user_by_external_id(reference);
    if (!user)
        throw NotFoundError("用户不存在: " + reference);
    return user->id;
}

bool AccessManager::grant_user(const std::string &client_id, const std::string &subject_id)
{
    Client client = require_client(client_id);
    std::string user_id = require_user(subject_id);

    AccessGrant grant;
    grant.principal = DirectPrincipal{user_id};
    grant.client_pk = client.id;
    grant.granted_at = clock_();

    bool added = store_->insert_grant(grant);
    if (added)
        std::cout << "授权用户 " << user_id << " 访问 " << client_id << std::endl;
    return added;
}

bool AccessManager::grant_group(const std::string &client_id, const std::string &group_name)
{
    Client client = require_client(client_id);
    Group group = require_group(group_name);

    AccessGrant grant;
    grant.principal = GroupPrincipal{group.id};
    grant.client_pk = client.id;
    grant.granted_at = clock_();

    bool added = store_->insert_grant(grant);
    if (added)
        std::cout << "授权组 " << group_name << " 访问 " << client_id << std::endl;
    return added;
}

bool AccessManager::revoke_user(const std::string &client_id, const std::string &subject_id)
{
    Client client = require_client(client_id);
    return store_->delete_grant(DirectPrincipal{resolve_user(subject_id)}, client.id);
}

bool AccessManager::revoke_group(const std::string &client_id, const std::string &group_name)
{
    Client client = require_client(client_id);
    Group group = require_group(group_name);
    return store_->delete_grant(GroupPrincipal{group.id}, client.id);
}

void AccessManager::set_public(const std::string &client_id, bool is_public)
{
    if (!store_->set_client_public(client_id, is_public))
        throw NotFoundError("客户端不存在: " + client_id);
    std::cout << "客户端 " << client_id << (is_public ? " 设为公开" : " 取消公开") << std::endl;
}

Group AccessManager::create_group(const std::string &name)
{
    if (name.empty())
        throw std::invalid_argument("组名不能为空");

    Group group;
    group.id = crypto::random_hex();
    group.name = name;
    group.created_at = clock_();

    if (!store_->insert_group(group))
        throw std::invalid_argument("组名已存在: " + name);

    std::cout << "已创建组 " << name << " (" << group.id << ")" << std::endl;
    return group;
}

bool AccessManager::delete_group(const std::string &name)
{
    auto group = store_->find_group_by_name(name);
    if (!group)
        return false;
    return store_->delete_group(group->id);
}

bool AccessManager::add_member(const std::string &group_name, const std::string &subject_id)
{
    Group group = require_group(group_name);
    return store_->add_group_member(group.id, require_user(subject_id));
}

bool AccessManager::remove_member(const std::string &group_name, const std::string &subject_id)
{
    Group group = require_group(group_name);
    return store_->remove_group_member(group.id, resolve_user(subject_id));
}

AccessSummary AccessManager::principals_with_access(const std::string &client_id)
{
    return evaluator_->who_can_access(require_client(client_id));
}

std::vector<Client> AccessManager::accessible_clients(const std::string &subject_id)
{
    return evaluator_->accessible_clients(resolve_user(subject_id));
}
