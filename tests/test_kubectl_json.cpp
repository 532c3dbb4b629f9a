#include <gtest/gtest.h>
#include <cluster/kubectl_client.hpp>
#include <core/utils.hpp>
#include <yaml-cpp/yaml.h>

TEST(KubectlJson, ParseSecretList) {
    std::string payload = base64_encode(R"({"auths":{"ghcr.io":{"username":"alice"}}})");
    std::string json = R"({
        "apiVersion": "v1",
        "items": [
            {
                "metadata": {
                    "name": "registry-alice-ghcr-io",
                    "namespace": "default",
                    "labels": {"managed-by": "kn-admin-registry"}
                },
                "type": "kubernetes.io/dockerconfigjson",
                "data": {".dockerconfigjson": ")" + payload + R"("}
            }
        ],
        "kind": "List"
    })";

    auto parsed = parse_secret_list(json);
    ASSERT_TRUE(parsed.is_ok()) << parsed.error;
    ASSERT_EQ(parsed.value.size(), 1u);
    const auto& s = parsed.value[0];
    EXPECT_EQ(s.handle().qualified(), "default/registry-alice-ghcr-io");
    EXPECT_EQ(s.labels.at("managed-by"), "kn-admin-registry");
    EXPECT_EQ(s.data.at(".dockerconfigjson"), R"({"auths":{"ghcr.io":{"username":"alice"}}})");
}

TEST(KubectlJson, EmptyListAndGarbage) {
    auto empty = parse_secret_list(R"({"items": []})");
    ASSERT_TRUE(empty.is_ok());
    EXPECT_TRUE(empty.value.empty());

    EXPECT_TRUE(parse_secret_list(R"({"items": {)").is_err());
}

TEST(KubectlJson, ParseServiceAccount) {
    auto parsed = parse_service_account(R"({
        "metadata": {"name": "default", "namespace": "apps"},
        "imagePullSecrets": [{"name": "one"}, {"name": "two"}]
    })");
    ASSERT_TRUE(parsed.is_ok()) << parsed.error;
    EXPECT_EQ(parsed.value.ns, "apps");
    EXPECT_EQ(parsed.value.image_pull_secrets, (std::vector<std::string>{"one", "two"}));

    auto bare = parse_service_account(R"({"metadata": {"name": "default"}})");
    ASSERT_TRUE(bare.is_ok());
    EXPECT_TRUE(bare.value.image_pull_secrets.empty());
}

TEST(KubectlJson, SecretManifestEncodesData) {
    Secret s;
    s.ns = "default";
    s.name = "reg";
    s.type = "kubernetes.io/dockerconfigjson";
    s.labels = {{"managed-by", "kn-admin-registry"}};
    s.data = {{".dockerconfigjson", "{}"}};

    YAML::Node doc = YAML::Load(secret_manifest(s));
    EXPECT_EQ(doc["kind"].as<std::string>(), "Secret");
    EXPECT_EQ(doc["metadata"]["namespace"].as<std::string>(), "default");
    EXPECT_EQ(doc["metadata"]["labels"]["managed-by"].as<std::string>(), "kn-admin-registry");
    EXPECT_EQ(doc["data"][".dockerconfigjson"].as<std::string>(), base64_encode("{}"));
}

TEST(KubectlJson, PatchListsNames) {
    YAML::Node doc = YAML::Load(image_pull_secrets_patch({"a", "b"}));
    ASSERT_TRUE(doc["imagePullSecrets"].IsSequence());
    EXPECT_EQ(doc["imagePullSecrets"][1]["name"].as<std::string>(), "b");

    // An empty list must clear the field, not drop it
    YAML::Node cleared = YAML::Load(image_pull_secrets_patch({}));
    ASSERT_TRUE(cleared["imagePullSecrets"].IsSequence());
    EXPECT_EQ(cleared["imagePullSecrets"].size(), 0u);
}

TEST(KubectlJson, NotFoundDetection) {
    EXPECT_TRUE(is_not_found_error("Error from server (NotFound): secrets \"x\" not found"));
    EXPECT_FALSE(is_not_found_error("Error from server (Forbidden): secrets is forbidden"));
}
