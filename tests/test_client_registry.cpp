#include <gtest/gtest.h>
#include <set>
#include "TestSupport.hpp"

using namespace testing_support;

class ClientRegistryTest : public ::testing::Test
{
protected:
    FakeClock time;
    std::shared_ptr<MemoryOAuthStore> store = std::make_shared<MemoryOAuthStore>();
    ClientRegistry registry{store, time.clock()};
};

TEST_F(ClientRegistryTest, RegisterStoresOnlySecretHash)
{
    RegisteredClient registered = registry.register_client("Wiki", {REDIRECT_URI});

    EXPECT_EQ(registered.client.client_id.rfind("hub_", 0), 0u);
    EXPECT_EQ(registered.client_secret.size(), 43u);
    EXPECT_EQ(registered.client.created_at, time.get());

    auto stored = store->find_client_by_client_id(registered.client.client_id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->client_secret_hash, crypto::sha256_hex(registered.client_secret));
    EXPECT_NE(stored->client_secret_hash, registered.client_secret);
    EXPECT_TRUE(stored->active);
}

TEST_F(ClientRegistryTest, AuthenticateAcceptsCorrectSecret)
{
    RegisteredClient registered = registry.register_client("Wiki", {REDIRECT_URI});
    auto result = registry.authenticate(registered.client.client_id, registered.client_secret);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value.id, registered.client.id);
}

TEST_F(ClientRegistryTest, AllFailuresAreUniformInvalidClient)
{
    RegisteredClient registered = registry.register_client("Wiki", {REDIRECT_URI});

    EXPECT_EQ(registry.authenticate("hub_unknown", registered.client_secret).error, OAuthError::InvalidClient);
    EXPECT_EQ(registry.authenticate(registered.client.client_id, "wrong").error, OAuthError::InvalidClient);
    EXPECT_EQ(registry.authenticate(registered.client.client_id, "").error, OAuthError::InvalidClient);
    EXPECT_EQ(registry.authenticate("", "").error, OAuthError::InvalidClient);

    ASSERT_TRUE(registry.deactivate(registered.client.client_id));
    EXPECT_EQ(registry.authenticate(registered.client.client_id, registered.client_secret).error,
              OAuthError::InvalidClient);
}

TEST_F(ClientRegistryTest, DeactivatedClientIsNotResolvable)
{
    RegisteredClient registered = registry.register_client("Wiki", {REDIRECT_URI});
    ASSERT_TRUE(registry.find_active(registered.client.client_id).has_value());
    ASSERT_TRUE(registry.deactivate(registered.client.client_id));
    EXPECT_FALSE(registry.find_active(registered.client.client_id).has_value());
}

TEST_F(ClientRegistryTest, RedirectUriRequiresExactMatch)
{
    RegisteredClient registered = registry.register_client("Wiki", {REDIRECT_URI, "http://localhost:3000/cb"});
    const Client &client = registered.client;

    EXPECT_TRUE(registry.is_redirect_uri_allowed(client, REDIRECT_URI));
    EXPECT_TRUE(registry.is_redirect_uri_allowed(client, "http://localhost:3000/cb"));
    EXPECT_FALSE(registry.is_redirect_uri_allowed(client, REDIRECT_URI + "/extra"));
    EXPECT_FALSE(registry.is_redirect_uri_allowed(client, REDIRECT_URI + "?x=1"));
    EXPECT_FALSE(registry.is_redirect_uri_allowed(client, "https://app.example.com/"));
    EXPECT_FALSE(registry.is_redirect_uri_allowed(client, "HTTPS://APP.EXAMPLE.COM/callback"));
    EXPECT_FALSE(registry.is_redirect_uri_allowed(client, ""));
}

TEST_F(ClientRegistryTest, RotateSecretInvalidatesOldSecret)
{
    RegisteredClient registered = registry.register_client("Wiki", {REDIRECT_URI});

    auto rotated = registry.rotate_secret(registered.client.client_id);
    ASSERT_TRUE(rotated.has_value());
    EXPECT_NE(*rotated, registered.client_secret);

    EXPECT_FALSE(registry.authenticate(registered.client.client_id, registered.client_secret).ok());
    EXPECT_TRUE(registry.authenticate(registered.client.client_id, *rotated).ok());
}

TEST_F(ClientRegistryTest, RotateSecretOfUnknownClient)
{
    EXPECT_FALSE(registry.rotate_secret("hub_missing").has_value());
}

TEST_F(ClientRegistryTest, ClientIdsAreUnique)
{
    std::set<std::string> ids;
    for (int i = 0; i < 50; ++i)
        EXPECT_TRUE(ids.insert(registry.register_client("app", {REDIRECT_URI}).client.client_id).second);
    EXPECT_EQ(store->list_clients().size(), 50u);
}
