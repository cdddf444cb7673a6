#include <gtest/gtest.h>
#include <set>
#include <tuple>
#include "TestSupport.hpp"

using namespace testing_support;

namespace
{
    Client make_client(const std::string &id, bool is_public)
    {
        Client client;
        client.id = id;
        client.client_id = "hub_" + id;
        client.is_public = is_public;
        return client;
    }

    AccessGrant direct(const std::string &subject, const std::string &client_pk)
    {
        AccessGrant grant;
        grant.principal = DirectPrincipal{subject};
        grant.client_pk = client_pk;
        return grant;
    }

    AccessGrant via_group(const std::string &group, const std::string &client_pk)
    {
        AccessGrant grant;
        grant.principal = GroupPrincipal{group};
        grant.client_pk = client_pk;
        return grant;
    }
}

// 三个输入（公开、直接授权、组授权）的全部组合
class AccessTruthTable : public ::testing::TestWithParam<std::tuple<bool, bool, bool>>
{
};

TEST_P(AccessTruthTable, AllowedIffAnySourceGrants)
{
    bool is_public = std::get<0>(GetParam());
    bool has_direct = std::get<1>(GetParam());
    bool in_granted_group = std::get<2>(GetParam());

    Client client = make_client("app", is_public);
    std::vector<AccessGrant> grants;
    if (has_direct)
        grants.push_back(direct("alice", "app"));
    grants.push_back(via_group("g1", "app"));

    std::vector<std::string> groups;
    if (in_granted_group)
        groups.push_back("g1");

    EXPECT_EQ(AccessEvaluator::evaluate("alice", client, groups, grants), is_public || has_direct || in_granted_group);
}

INSTANTIATE_TEST_SUITE_P(AllCombinations, AccessTruthTable,
                         ::testing::Combine(::testing::Bool(), ::testing::Bool(), ::testing::Bool()));

TEST(AccessEvaluatorTest, GrantsForOtherClientsDoNotApply)
{
    Client client = make_client("app", false);
    std::vector<AccessGrant> grants = {direct("alice", "other"), via_group("g1", "other")};
    EXPECT_FALSE(AccessEvaluator::evaluate("alice", client, {"g1"}, grants));
}

TEST(AccessEvaluatorTest, AddingGrantsNeverRemovesAccess)
{
    Client client = make_client("app", false);
    std::vector<AccessGrant> grants = {direct("alice", "app")};
    std::vector<std::string> subjects = {"alice", "bob", "carol"};

    std::vector<bool> before;
    for (const auto &s : subjects)
        before.push_back(AccessEvaluator::evaluate(s, client, {"g2"}, grants));

    grants.push_back(via_group("g2", "app"));
    grants.push_back(direct("bob", "other"));
    for (size_t i = 0; i < subjects.size(); ++i)
    {
        bool after = AccessEvaluator::evaluate(subjects[i], client, {"g2"}, grants);
        EXPECT_TRUE(!before[i] || after) << subjects[i];
    }
}

TEST(AccessEvaluatorTest, PublicClientAllowsEveryone)
{
    Client client = make_client("app", true);
    EXPECT_TRUE(AccessEvaluator::evaluate("anyone", client, {}, {}));
}

TEST(AccessEvaluatorTest, GroupMembershipScenario)
{
    auto store = std::make_shared<MemoryOAuthStore>();
    AccessEvaluator evaluator(store);

    Client wiki = make_client("wiki", false);
    store->insert_client(wiki);
    add_user(*store, "alice");
    add_user(*store, "bob");
    Group engineers = add_group(*store, "eng", {"alice"});
    grant(*store, GroupPrincipal{engineers.id}, wiki);

    EXPECT_TRUE(evaluator.can_access("alice", wiki));
    EXPECT_FALSE(evaluator.can_access("bob", wiki));

    ASSERT_TRUE(store->add_group_member(engineers.id, "bob"));
    EXPECT_TRUE(evaluator.can_access("bob", wiki));

    ASSERT_TRUE(store->remove_group_member(engineers.id, "alice"));
    EXPECT_FALSE(evaluator.can_access("alice", wiki));
}

TEST(AccessEvaluatorTest, DeletingGroupCascadesItsGrants)
{
    auto store = std::make_shared<MemoryOAuthStore>();
    AccessEvaluator evaluator(store);

    Client wiki = make_client("wiki", false);
    store->insert_client(wiki);
    add_user(*store, "alice");
    Group engineers = add_group(*store, "eng", {"alice"});
    grant(*store, GroupPrincipal{engineers.id}, wiki);
    ASSERT_TRUE(evaluator.can_access("alice", wiki));

    ASSERT_TRUE(store->delete_group(engineers.id));
    EXPECT_FALSE(evaluator.can_access("alice", wiki));
    EXPECT_TRUE(store->grants_for_client(wiki.id).empty());
}

TEST(AccessEvaluatorTest, WhoCanAccessExpandsGroups)
{
    auto store = std::make_shared<MemoryOAuthStore>();
    AccessEvaluator evaluator(store);

    Client wiki = make_client("wiki", false);
    store->insert_client(wiki);
    Group engineers = add_group(*store, "eng", {"bob", "carol"});
    grant(*store, DirectPrincipal{"alice"}, wiki);
    grant(*store, GroupPrincipal{engineers.id}, wiki);

    AccessSummary summary = evaluator.who_can_access(wiki);
    EXPECT_FALSE(summary.is_public);
    EXPECT_EQ(summary.direct_subjects, std::set<std::string>({"alice"}));
    EXPECT_EQ(summary.groups, std::set<std::string>({"eng"}));
    EXPECT_EQ(summary.subjects, std::set<std::string>({"alice", "bob", "carol"}));
}

TEST(AccessEvaluatorTest, AccessibleClientsSkipsInactive)
{
    auto store = std::make_shared<MemoryOAuthStore>();
    AccessEvaluator evaluator(store);

    Client wiki = make_client("wiki", false);
    Client portal = make_client("portal", true);
    Client legacy = make_client("legacy", true);
    legacy.active = false;
    Client secret = make_client("secret", false);
    for (const auto &c : {wiki, portal, legacy, secret})
        store->insert_client(c);
    grant(*store, DirectPrincipal{"alice"}, wiki);

    std::set<std::string> ids;
    for (const auto &client : evaluator.accessible_clients("alice"))
        ids.insert(client.id);
    EXPECT_EQ(ids, std::set<std::string>({"wiki", "portal"}));
}
