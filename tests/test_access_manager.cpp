#include <gtest/gtest.h>
#include <set>
#include "AccessManager.hpp"
#include "TestSupport.hpp"

using namespace testing_support;

class AccessManagerTest : public ::testing::Test
{
protected:
    FakeClock time;
    std::shared_ptr<MemoryOAuthStore> store = std::make_shared<MemoryOAuthStore>();
    std::shared_ptr<AccessEvaluator> evaluator = std::make_shared<AccessEvaluator>(store);
    ClientRegistry registry{store, time.clock()};
    AccessManager manager{store, evaluator, time.clock()};
    RegisteredClient wiki;

    void SetUp() override
    {
        wiki = registry.register_client("Wiki", {REDIRECT_URI});
        add_user(*store, "alice");
        add_user(*store, "bob");
    }
};

TEST_F(AccessManagerTest, GrantUserIsIdempotent)
{
    EXPECT_TRUE(manager.grant_user(wiki.client.client_id, "alice"));
    EXPECT_FALSE(manager.grant_user(wiki.client.client_id, "alice"));
    EXPECT_EQ(store->grants_for_client(wiki.client.id).size(), 1u);
    EXPECT_EQ(store->grants_for_client(wiki.client.id).front().granted_at, time.get());
}

TEST_F(AccessManagerTest, GroupGrantReachesMembers)
{
    manager.create_group("engineers");
    ASSERT_TRUE(manager.add_member("engineers", "bob"));
    EXPECT_FALSE(manager.add_member("engineers", "bob"));
    ASSERT_TRUE(manager.grant_group(wiki.client.client_id, "engineers"));

    EXPECT_TRUE(evaluator->can_access("bob", wiki.client));
    EXPECT_FALSE(evaluator->can_access("alice", wiki.client));

    ASSERT_TRUE(manager.remove_member("engineers", "bob"));
    EXPECT_FALSE(evaluator->can_access("bob", wiki.client));
}

TEST_F(AccessManagerTest, RevokeRemovesAccess)
{
    manager.grant_user(wiki.client.client_id, "alice");
    ASSERT_TRUE(evaluator->can_access("alice", wiki.client));

    EXPECT_TRUE(manager.revoke_user(wiki.client.client_id, "alice"));
    EXPECT_FALSE(manager.revoke_user(wiki.client.client_id, "alice"));
    EXPECT_FALSE(evaluator->can_access("alice", wiki.client));
}

TEST_F(AccessManagerTest, PublicFlagOpensClientToEveryone)
{
    manager.set_public(wiki.client.client_id, true);
    auto client = store->find_client(wiki.client.id);
    ASSERT_TRUE(client.has_value());
    EXPECT_TRUE(evaluator->can_access("bob", *client));

    AccessSummary summary = manager.principals_with_access(wiki.client.client_id);
    EXPECT_TRUE(summary.is_public);
}

TEST_F(AccessManagerTest, DuplicateGroupNameIsRejected)
{
    manager.create_group("engineers");
    EXPECT_THROW(manager.create_group("engineers"), std::invalid_argument);
    EXPECT_THROW(manager.create_group(""), std::invalid_argument);
}

TEST_F(AccessManagerTest, DeleteGroupByName)
{
    manager.create_group("engineers");
    manager.grant_group(wiki.client.client_id, "engineers");
    EXPECT_TRUE(manager.delete_group("engineers"));
    EXPECT_FALSE(manager.delete_group("engineers"));
    EXPECT_TRUE(store->grants_for_client(wiki.client.id).empty());
}

TEST_F(AccessManagerTest, UnknownTargetsThrowNotFound)
{
    EXPECT_THROW(manager.grant_user("hub_missing", "alice"), NotFoundError);
    EXPECT_THROW(manager.grant_user(wiki.client.client_id, "nobody"), NotFoundError);
    EXPECT_THROW(manager.grant_group(wiki.client.client_id, "no-such-group"), NotFoundError);
    EXPECT_THROW(manager.add_member("no-such-group", "alice"), NotFoundError);
    EXPECT_THROW(manager.set_public("hub_missing", true), NotFoundError);
}

TEST_F(AccessManagerTest, AccessibleClientsForSubject)
{
    RegisteredClient portal = registry.register_client("Portal", {REDIRECT_URI}, true);
    manager.grant_user(wiki.client.client_id, "alice");

    std::set<std::string> for_alice;
    for (const auto &client : manager.accessible_clients("alice"))
        for_alice.insert(client.client_id);
    EXPECT_EQ(for_alice, std::set<std::string>({wiki.client.client_id, portal.client.client_id}));

    std::set<std::string> for_bob;
    for (const auto &client : manager.accessible_clients("bob"))
        for_bob.insert(client.client_id);
    EXPECT_EQ(for_bob, std::set<std::string>({portal.client.client_id}));
}

TEST_F(AccessManagerTest, UsersCanBeReferencedByUpstreamSubject)
{
    EXPECT_TRUE(manager.grant_user(wiki.client.client_id, "ext-alice"));
    EXPECT_TRUE(evaluator->can_access("alice", wiki.client));
    EXPECT_FALSE(manager.grant_user(wiki.client.client_id, "alice"));

    manager.create_group("engineers");
    EXPECT_TRUE(manager.add_member("engineers", "ext-bob"));
    EXPECT_EQ(store->groups_of_subject("bob").size(), 1u);

    EXPECT_TRUE(manager.revoke_user(wiki.client.client_id, "ext-alice"));
    EXPECT_FALSE(evaluator->can_access("alice", wiki.client));
    EXPECT_THROW(manager.grant_user(wiki.client.client_id, "ext-nobody"), NotFoundError);
}
