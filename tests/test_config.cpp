#include <gtest/gtest.h>
#include <core/config.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

TEST(Config, EmptyTextGivesDefaults) {
    auto result = Config::parse("");
    ASSERT_TRUE(result.is_ok()) << result.error;
    const auto& c = result.value;
    EXPECT_EQ(c.cluster().port, 22);
    EXPECT_EQ(c.kubectl().path, "kubectl");
    EXPECT_EQ(c.registry().ns, "default");
    EXPECT_EQ(c.registry().service_account, "default");
    EXPECT_EQ(c.profiling().ns, "knative-serving");
    EXPECT_EQ(c.profiling().port, 8008);
    EXPECT_EQ(c.profiling().local_port, 18008);
}

TEST(Config, ParsesSections) {
    auto result = Config::parse(R"(
cluster:
  host: admin.example.com
  user: ops
  port: 2222
kubectl:
  path: /usr/local/bin/kubectl
  context: prod
registry:
  namespace: apps
  service_account: builder
profiling:
  namespace: knative-eventing
  port: 9090
  local_port: 19090
)");
    ASSERT_TRUE(result.is_ok()) << result.error;
    const auto& c = result.value;
    EXPECT_EQ(c.cluster().host, "admin.example.com");
    EXPECT_EQ(c.cluster().port, 2222);
    EXPECT_FALSE(c.cluster().ssh_key_path.has_value());
    EXPECT_EQ(c.kubectl().context, "prod");
    EXPECT_EQ(c.registry().ns, "apps");
    EXPECT_EQ(c.registry().service_account, "builder");
    EXPECT_EQ(c.profiling().port, 9090);
}

TEST(Config, ExpandsHomeInKeyPath) {
    auto result = Config::parse("cluster:\n  ssh_key_path: ~/.ssh/id_ed25519\n");
    ASSERT_TRUE(result.is_ok());
    auto key = result.value.cluster().ssh_key_path.value();
    EXPECT_EQ(key.find('~'), std::string::npos);
    EXPECT_NE(key.find(".ssh/id_ed25519"), std::string::npos);
}

TEST(Config, RejectsBadInput) {
    EXPECT_TRUE(Config::parse("- just\n- a list\n").is_err());
    EXPECT_TRUE(Config::parse("profiling:\n  local_port: 70000\n").is_err());
    EXPECT_TRUE(Config::parse("cluster: [unclosed\n").is_err());
}

TEST(Config, LoadFile) {
    fs::path dir = fs::temp_directory_path() / "knadmin_config_test";
    fs::create_directories(dir);
    std::ofstream(dir / "config.yaml") << "registry:\n  namespace: team\n";

    auto result = Config::load_file(dir / "config.yaml");
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value.registry().ns, "team");

    auto missing = Config::load_file(dir / "nope.yaml");
    EXPECT_TRUE(missing.is_err());

    fs::remove_all(dir);
}
