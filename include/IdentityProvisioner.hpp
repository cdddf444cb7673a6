#pragma once

#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "OAuthStore.hpp"

// 上游 SSO 交付的已验证身份
struct IdentityAssertion
{
    std::string external_subject_id; // 必需
    std::string email;               // 必需
    std::string display_name;
    std::string department;
    std::string job_title;
    std::vector<std::string> group_names;

    // 从上游声明构造。必需字段可来自别名（sub|oid|upn, email|upn|unique_name），
    // 缺失时抛出 UpstreamError；未知字段忽略
    static IdentityAssertion from_claims(const nlohmann::json &claims);
};

// 把身份断言落到本地用户：按外部 id 查找，存在则更新，否则创建
class IdentityProvisioner
{
public:
    IdentityProvisioner(std::shared_ptr<OAuthStore> store, Clock clock = system_clock());

    UserRecord provision(const IdentityAssertion &assertion);

private:
    std::shared_ptr<OAuthStore> store_;
    Clock clock_;
};
