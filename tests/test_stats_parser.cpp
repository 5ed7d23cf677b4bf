#include <gtest/gtest.h>
#include <managers/stats_parser.hpp>

TEST(StatsParser, DockerInfo) {
    auto info = parse_docker_info("24.0.7|3|5\n");
    EXPECT_TRUE(info.valid);
    EXPECT_EQ(info.version, "24.0.7");
    EXPECT_EQ(info.running, 3);
    EXPECT_EQ(info.total, 5);
}

TEST(StatsParser, DockerInfoWithoutDaemon) {
    auto info = parse_docker_info("Cannot connect to the Docker daemon at unix:///var/run/docker.sock\n");
    EXPECT_FALSE(info.valid);
    EXPECT_EQ(info.running, 0);

    EXPECT_FALSE(parse_docker_info("").valid);
}

TEST(StatsParser, ContainerList) {
    std::string out =
        "a1b2c3d4e5f6|web|nginx:1.25|Up 3 hours|running|0.0.0.0:80->80/tcp|2024-03-01 10:00:00 +0000 UTC\n"
        "0f9e8d7c6b5a|db|postgres:16|Exited (0) 2 days ago|exited||2024-02-28 09:00:00 +0000 UTC\n"
        "garbage line\n";

    auto list = parse_container_list(out);
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].id, "a1b2c3d4e5f6");
    EXPECT_EQ(list[0].name, "web");
    EXPECT_EQ(list[0].image, "nginx:1.25");
    EXPECT_EQ(list[0].state, "running");
    EXPECT_EQ(list[0].ports, "0.0.0.0:80->80/tcp");
    EXPECT_EQ(list[1].status, "Exited (0) 2 days ago");
    EXPECT_TRUE(list[1].ports.empty());
    EXPECT_EQ(list[1].created_at, "2024-02-28 09:00:00 +0000 UTC");
}

TEST(StatsParser, Percent) {
    EXPECT_DOUBLE_EQ(parse_percent("42%"), 42.0);
    EXPECT_DOUBLE_EQ(parse_percent(" 17.3 \n"), 17.3);
    EXPECT_DOUBLE_EQ(parse_percent("n/a"), -1.0);
    EXPECT_DOUBLE_EQ(parse_percent(""), -1.0);
}

TEST(StatsParser, PingLatency) {
    std::string out =
        "PING 8.8.8.8 (8.8.8.8) 56(84) bytes of data.\n"
        "64 bytes from 8.8.8.8: icmp_seq=1 ttl=117 time=12.3 ms\n";
    EXPECT_DOUBLE_EQ(parse_ping_latency(out), 12.3);
    EXPECT_DOUBLE_EQ(parse_ping_latency("64 bytes from 10.0.0.1: icmp_seq=1 ttl=64 time<1 ms"), 1.0);
    EXPECT_DOUBLE_EQ(parse_ping_latency("1 packets transmitted, 0 received, 100% packet loss"), -1.0);
}

TEST(StatsParser, AverageSkipsUnanswered) {
    EXPECT_DOUBLE_EQ(average_latency({{"a", 10.0}, {"b", 20.0}, {"c", -1.0}}), 15.0);
    EXPECT_DOUBLE_EQ(average_latency({{"a", -1.0}}), 0.0);
    EXPECT_DOUBLE_EQ(average_latency({}), 0.0);
}

TEST(StatsParser, PingCommandQuotesHost) {
    EXPECT_EQ(ping_command("8.8.8.8"), "ping -c 1 -W 1 '8.8.8.8'");
}

TEST(StatsParser, SizeBytes) {
    EXPECT_EQ(parse_size_bytes("0B"), 0);
    EXPECT_EQ(parse_size_bytes("648B"), 648);
    EXPECT_EQ(parse_size_bytes("1.5kB"), 1500);
    EXPECT_EQ(parse_size_bytes(" 4.1MB "), 4100000);
    EXPECT_EQ(parse_size_bytes("12.5MiB"), 13107200);
    EXPECT_EQ(parse_size_bytes("2GiB"), 2147483648LL);
    EXPECT_EQ(parse_size_bytes("--"), -1);
    EXPECT_EQ(parse_size_bytes("12 parsecs"), -1);
}

TEST(StatsParser, DockerStats) {
    std::string out =
        "a1b2c3d4e5f6|web|0.50%|12.5MiB / 2GiB|0.61%|1.5kB / 648B|0B / 4.1MB|3\n"
        "0f9e8d7c6b5a|db|103.20%|512MiB / 2GiB|25.00%|10MB / 2MB|1GB / 300MB|27\n"
        "garbage\n";

    auto rows = parse_docker_stats(out);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].container_id, "a1b2c3d4e5f6");
    EXPECT_EQ(rows[0].name, "web");
    EXPECT_DOUBLE_EQ(rows[0].cpu_percent, 0.5);
    EXPECT_EQ(rows[0].mem_usage_bytes, 13107200);
    EXPECT_EQ(rows[0].mem_limit_bytes, 2147483648LL);
    EXPECT_DOUBLE_EQ(rows[0].mem_percent, 0.61);
    EXPECT_EQ(rows[0].net_rx_bytes, 1500);
    EXPECT_EQ(rows[0].net_tx_bytes, 648);
    EXPECT_EQ(rows[0].block_read_bytes, 0);
    EXPECT_EQ(rows[0].block_write_bytes, 4100000);
    EXPECT_EQ(rows[0].pids, 3);
    EXPECT_TRUE(rows[0].host_id.empty());

    // Multi-core containers go past 100%
    EXPECT_DOUBLE_EQ(rows[1].cpu_percent, 103.2);
    EXPECT_EQ(rows[1].pids, 27);
}

TEST(StatsParser, DockerStatsOfStoppingContainer) {
    auto rows = parse_docker_stats("a1b2c3d4e5f6|web|--|-- / --|--|--|--|0\n");
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_DOUBLE_EQ(rows[0].cpu_percent, -1.0);
    EXPECT_EQ(rows[0].mem_usage_bytes, -1);
    EXPECT_EQ(rows[0].net_tx_bytes, -1);

    EXPECT_TRUE(parse_docker_stats("").empty());
}
