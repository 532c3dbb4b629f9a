#include <gtest/gtest.h>
#include <managers/registry_manager.hpp>
#include <registry/docker_config.hpp>
#include <core/constants.hpp>
#include "fake_cluster_client.hpp"
#include <algorithm>

class RegistryManagerTest : public ::testing::Test {
protected:
    FakeClusterClient client;
    RegistryConfig config;
    std::vector<std::string> lines;

    void SetUp() override {
        ServiceAccount sa;
        sa.ns = "default";
        sa.name = "default";
        sa.image_pull_secrets = {"unrelated"};
        client.set_service_account(sa);
    }

    RegistryManager manager() {
        return RegistryManager(client, config, [this](const std::string& l) { lines.push_back(l); });
    }

    void seed_registry_secret(const std::string& name, const std::string& server,
                              const std::string& user, bool managed = true) {
        Secret s;
        s.ns = "default";
        s.name = name;
        s.type = DOCKER_SECRET_TYPE;
        if (managed) s.labels = registry_labels();
        s.data[DOCKER_JSON_NAME] = to_json(make_docker_config(server, user, "pw"));
        client.add_secret(s);
    }

    bool printed(const std::string& line) const {
        return std::find(lines.begin(), lines.end(), line) != lines.end();
    }
};

TEST(RegistryNames, DefaultSecretName) {
    EXPECT_EQ(default_secret_name("Alice", "ghcr.io"), "registry-alice-ghcr-io");
    EXPECT_EQ(default_secret_name("bob", "https://reg.example.com:5000/"),
              "registry-bob-https-reg-example-com-5000");
    EXPECT_LE(default_secret_name(std::string(100, 'u'), "x").size(), 63u);
}

TEST(RegistryNames, Labels) {
    auto labels = registry_labels();
    ASSERT_EQ(labels.size(), 1u);
    EXPECT_EQ(labels["managed-by"], "kn-admin-registry");
}

// ── add ───────────────────────────────────────────────────

TEST_F(RegistryManagerTest, AddRequiresFlags) {
    RegistryAddOptions opts;
    opts.password = "pw";
    opts.server = "ghcr.io";
    auto result = manager().add(opts);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error, "'registry add' requires the registry username provided with the --username option");

    opts.username = "alice";
    opts.server.clear();
    EXPECT_EQ(manager().add(opts).error,
              "'registry add' requires the registry server url provided with the --server option");
}

TEST_F(RegistryManagerTest, AddCreatesSecretAndAttachesIt) {
    RegistryAddOptions opts;
    opts.username = "alice";
    opts.password = "s3cret";
    opts.server = "ghcr.io";

    auto result = manager().add(opts);
    ASSERT_TRUE(result.is_ok()) << result.error;

    EXPECT_TRUE(client.has_secret("default", "registry-alice-ghcr-io"));
    auto sa = client.service_account("default", "default");
    EXPECT_EQ(sa.image_pull_secrets, (std::vector<std::string>{"unrelated", "registry-alice-ghcr-io"}));
    EXPECT_TRUE(printed("Secret 'default/registry-alice-ghcr-io' created"));
    EXPECT_TRUE(printed("ImagePullSecrets of ServiceAccount 'default/default' updated"));

    // What add writes, remove can find
    auto found = manager().find_secrets("alice", "ghcr.io");
    ASSERT_TRUE(found.is_ok());
    EXPECT_EQ(found.value.count("registry-alice-ghcr-io"), 1u);
}

TEST_F(RegistryManagerTest, AddUsesExplicitSecretName) {
    RegistryAddOptions opts;
    opts.username = "alice";
    opts.password = "pw";
    opts.server = "ghcr.io";
    opts.secret_name = "my-pull-secret";

    ASSERT_TRUE(manager().add(opts).is_ok());
    EXPECT_TRUE(client.has_secret("default", "my-pull-secret"));
}

TEST_F(RegistryManagerTest, AddCreateFailure) {
    client.create_error = "forbidden";
    RegistryAddOptions opts{"alice", "pw", "ghcr.io", "", ""};
    auto result = manager().add(opts);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error, "failed to create secret: forbidden");
    EXPECT_EQ(client.update_calls(), 0);
}

// ── remove ────────────────────────────────────────────────

TEST_F(RegistryManagerTest, RemoveRequiresFlags) {
    EXPECT_EQ(manager().remove("", "ghcr.io").error,
              "'registry remove' requires the registry username provided with the --username option");
    EXPECT_EQ(manager().remove("alice", "").error,
              "'registry remove' requires the registry server url provided with the --server option");
}

TEST_F(RegistryManagerTest, RemoveWithNoMatchIsNoop) {
    seed_registry_secret("other", "ghcr.io", "bob");

    auto result = manager().remove("alice", "ghcr.io");

    EXPECT_TRUE(result.is_ok());
    EXPECT_TRUE(printed("No registry found for server: 'ghcr.io' and username: 'alice'"));
    EXPECT_EQ(client.update_calls(), 0);
    EXPECT_EQ(client.delete_calls(), 0);
}

TEST_F(RegistryManagerTest, RemoveMatchesOnlyManagedExactEntries) {
    seed_registry_secret("match-1", "ghcr.io", "alice");
    seed_registry_secret("match-2", "ghcr.io", "alice");
    seed_registry_secret("other-user", "ghcr.io", "bob");
    seed_registry_secret("other-server", "quay.io", "alice");
    seed_registry_secret("unmanaged", "ghcr.io", "alice", false);

    ServiceAccount sa;
    sa.ns = "default";
    sa.name = "default";
    sa.image_pull_secrets = {"match-1", "other-user", "match-2"};
    client.set_service_account(sa);

    auto result = manager().remove("alice", "ghcr.io");
    ASSERT_TRUE(result.is_ok()) << result.error;

    EXPECT_EQ(client.last_selector(), "managed-by=kn-admin-registry");
    EXPECT_EQ(client.service_account("default", "default").image_pull_secrets,
              std::vector<std::string>{"other-user"});
    EXPECT_FALSE(client.has_secret("default", "match-1"));
    EXPECT_FALSE(client.has_secret("default", "match-2"));
    EXPECT_TRUE(client.has_secret("default", "other-user"));
    EXPECT_TRUE(client.has_secret("default", "other-server"));
    EXPECT_TRUE(client.has_secret("default", "unmanaged"));
    EXPECT_TRUE(printed("ImagePullSecrets of ServiceAccount 'default/default' updated"));
    EXPECT_TRUE(printed("Secret 'default/match-1' deleted"));
}

TEST_F(RegistryManagerTest, RemoveListFailure) {
    client.list_error = "connection refused";
    auto result = manager().remove("alice", "ghcr.io");
    EXPECT_EQ(result.error, "failed to list secret: connection refused");
}

TEST_F(RegistryManagerTest, RemoveCorruptPayload) {
    Secret s;
    s.ns = "default";
    s.name = "broken";
    s.labels = registry_labels();
    s.data[DOCKER_JSON_NAME] = "[not, an, object]";
    client.add_secret(s);

    auto result = manager().remove("alice", "ghcr.io");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error.rfind("failed unmarshal secret data '.dockerconfigjson': ", 0), 0u);
}

TEST_F(RegistryManagerTest, RemoveServiceAccountFailures) {
    seed_registry_secret("match", "ghcr.io", "alice");

    client.get_sa_error = "not allowed";
    EXPECT_EQ(manager().remove("alice", "ghcr.io").error, "failed to get ServiceAccount: not allowed");

    client.get_sa_error.clear();
    client.update_sa_error = "conflict";
    EXPECT_EQ(manager().remove("alice", "ghcr.io").error,
              "failed to remove registry secret in default ServiceAccount: conflict");
    // Nothing deleted while the account still points at the secret
    EXPECT_TRUE(client.has_secret("default", "match"));
}

TEST_F(RegistryManagerTest, RemoveDeleteFailureIsWrapped) {
    seed_registry_secret("match", "ghcr.io", "alice");
    client.delete_errors["match"] = "forbidden";

    auto result = manager().remove("alice", "ghcr.io");
    EXPECT_EQ(result.error, "failed to delete secrets: failed to delete secret 'default/match': forbidden");
}
