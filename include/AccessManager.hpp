#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "AccessEvaluator.hpp"
#include "OAuthStore.hpp"

// 管理操作引用了不存在的客户端、组或用户
class NotFoundError : public std::invalid_argument
{
public:
    explicit NotFoundError(const std::string &message) : std::invalid_argument(message) {}
};

// 授权关系和组的管理入口。客户端按 client_id、组按名称引用，
// 用户可以用内部 id 或上游 subject 引用；只读查询委托给 AccessEvaluator
class AccessManager
{
public:
    AccessManager(std::shared_ptr<OAuthStore> store, std::shared_ptr<AccessEvaluator> evaluator,
                  Clock clock = system_clock());

    // 授权操作幂等，返回是否新增了记录
    bool grant_user(const std::string &client_id, const std::string &subject_id);
    bool grant_group(const std::string &client_id, const std::string &group_name);

    bool revoke_user(const std::string &client_id, const std::string &subject_id);
    bool revoke_group(const std::string &client_id, const std::string &group_name);

    void set_public(const std::string &client_id, bool is_public);

    // 组名已存在时抛出 std::invalid_argument
    Group create_group(const std::string &name);
    bool delete_group(const std::string &name);

    bool add_member(const std::string &group_name, const std::string &subject_id);
    bool remove_member(const std::string &group_name, const std::string &subject_id);

    AccessSummary principals_with_access(const std::string &client_id);

    std::vector<Client> accessible_clients(const std::string &subject_id);

private:
    Client require_client(const std::string &client_id);
    Group require_group(const std::string &name);
    std::string require_user(const std::string &reference);
    // 找不到用户时原样返回，用于清理已删除用户的残留记录
    std::string resolve_user(const std::string &reference);

    std::shared_ptr<OAuthStore> store_;
    std::shared_ptr<AccessEvaluator> evaluator_;
    Clock clock_;
};
