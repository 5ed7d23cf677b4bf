#include <gtest/gtest.h>
#include <core/config.hpp>
#include <cstdlib>
#include <fstream>

TEST(Config, EmptyDocumentKeepsDefaults) {
    auto r = Config::parse("");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const Config& c = r.value;
    EXPECT_EQ(c.pool().max_connections_per_host, POOL_MAX_CONNECTIONS_PER_HOST);
    EXPECT_EQ(c.pool().channels_per_connection, POOL_CHANNELS_PER_CONNECTION);
    EXPECT_EQ(c.cache().status_ttl_secs, CACHE_STATUS_TTL_SECS);
    EXPECT_EQ(c.collector().concurrency, COLLECTOR_CONCURRENCY);
    EXPECT_EQ(c.transfers().chunk_size, TRANSFER_CHUNK_SIZE);
    EXPECT_EQ(c.workers(), WORKER_THREADS);
    EXPECT_TRUE(c.hosts().empty());
    EXPECT_EQ(c.history_file().filename().string(), "history.yaml");
}

TEST(Config, ParsesSections) {
    auto r = Config::parse(R"(
pool:
  max_connections_per_host: 3
  channels_per_connection: 4
  retry_attempts: 5
sessions:
  history_size: 50
cache:
  status_ttl_secs: 10
collector:
  interval_secs: 60
  concurrency: 8
transfers:
  max_global: 6
  chunk_size: 65536
workers: 12
history_file: /tmp/fleet-history.yaml
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const Config& c = r.value;
    EXPECT_EQ(c.pool().max_connections_per_host, 3);
    EXPECT_EQ(c.pool().channels_per_connection, 4);
    EXPECT_EQ(c.pool().retry_attempts, 5);
    EXPECT_EQ(c.sessions().history_size, 50);
    EXPECT_EQ(c.cache().status_ttl_secs, 10);
    EXPECT_EQ(c.collector().interval_secs, 60);
    EXPECT_EQ(c.collector().concurrency, 8);
    EXPECT_EQ(c.transfers().max_global, 6);
    EXPECT_EQ(c.transfers().chunk_size, 65536u);
    EXPECT_EQ(c.workers(), 12);
    EXPECT_EQ(c.history_file().string(), "/tmp/fleet-history.yaml");
}

TEST(Config, ClampsNonsenseValues) {
    auto r = Config::parse(R"(
pool:
  max_connections_per_host: 0
  retry_attempts: -2
collector:
  concurrency: 0
transfers:
  max_per_host: 0
  chunk_size: 0
workers: 0
)");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.pool().max_connections_per_host, 1);
    EXPECT_EQ(r.value.pool().retry_attempts, 1);
    EXPECT_EQ(r.value.collector().concurrency, 1);
    EXPECT_EQ(r.value.transfers().max_per_host, 1);
    EXPECT_EQ(r.value.transfers().chunk_size, TRANSFER_CHUNK_SIZE);
    EXPECT_EQ(r.value.workers(), 1);
}

TEST(Config, PingTargetForms) {
    auto r = Config::parse(R"(
collector:
  ping_targets:
    - name: Google
      host: 8.8.8.8
    - 1.1.1.1
    - name: broken
)");
    ASSERT_TRUE(r.is_ok());
    const auto& targets = r.value.collector().ping_targets;
    ASSERT_EQ(targets.size(), 2u);
    EXPECT_EQ(targets[0].name, "Google");
    EXPECT_EQ(targets[0].host, "8.8.8.8");
    EXPECT_EQ(targets[1].name, "1.1.1.1");

    auto inline_form = Config::parse("collector:\n  ping_targets: \"Google=8.8.8.8, 1.1.1.1\"\n");
    ASSERT_TRUE(inline_form.is_ok());
    EXPECT_EQ(inline_form.value.collector().ping_targets.size(), 2u);
}

TEST(Config, ParsePingTargetSpec) {
    auto t = parse_ping_targets("Google=8.8.8.8, 1.1.1.1,,=9.9.9.9, Bad=");
    ASSERT_EQ(t.size(), 3u);
    EXPECT_EQ(t[0].name, "Google");
    EXPECT_EQ(t[0].host, "8.8.8.8");
    EXPECT_EQ(t[1].name, "1.1.1.1");
    EXPECT_EQ(t[2].name, "9.9.9.9");
    EXPECT_EQ(t[2].host, "9.9.9.9");
}

TEST(Config, HostsReadSecretsFromEnvironment) {
    ::setenv("FLEETLINK_TEST_PW", "hunter2", 1);
    auto r = Config::parse(R"(
hosts:
  - id: web1
    address: 10.0.0.5
    port: 2222
    username: deploy
    password_env: FLEETLINK_TEST_PW
  - address: 10.0.0.6
)");
    ::unsetenv("FLEETLINK_TEST_PW");
    ASSERT_TRUE(r.is_ok());
    const auto& hosts = r.value.hosts();
    ASSERT_EQ(hosts.size(), 2u);
    EXPECT_EQ(hosts[0].host_id, "web1");
    EXPECT_EQ(hosts[0].port, 2222);
    EXPECT_EQ(hosts[0].username, "deploy");
    EXPECT_EQ(hosts[0].auth_method, AuthMethod::Password);
    EXPECT_EQ(hosts[0].secret, "hunter2");

    // id falls back to the address
    EXPECT_EQ(hosts[1].host_id, "10.0.0.6");
    EXPECT_EQ(hosts[1].username, "root");
}

TEST(Config, MalformedYamlIsError) {
    EXPECT_TRUE(Config::parse("pool: [unterminated").is_err());

    // Unconvertible values fall back to the default
    auto r = Config::parse("pool:\n  max_connections_per_host: lots\n");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.pool().max_connections_per_host, POOL_MAX_CONNECTIONS_PER_HOST);
}

TEST(Config, LoadFile) {
    auto path = fs::temp_directory_path() / "fleetlink_config_test.yaml";
    std::ofstream(path) << "workers: 3\n";
    auto r = Config::load_file(path);
    fs::remove(path);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.workers(), 3);

    auto missing = Config::load_file(fs::temp_directory_path() / "fleetlink_no_such_config.yaml");
    EXPECT_EQ(missing.kind, ErrorKind::NotFound);
}
