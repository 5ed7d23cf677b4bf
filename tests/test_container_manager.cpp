#include <gtest/gtest.h>
#include <managers/container_manager.hpp>
#include <managers/stats_parser.hpp>
#include "fake_transport.hpp"

namespace {

struct ContainerFixture : ::testing::Test {
    fake::FakeWorld world;
    std::unique_ptr<ConnectionPool> pool;
    std::unique_ptr<SessionMultiplexer> mux;
    StateCache cache{CacheConfig{}};
    std::unique_ptr<ContainerManager> containers;
    HostCredential cred = fake::host("5");

    void SetUp() override {
        world.reply(container_list_command(),
                    {"a1b2c3d4e5f6|web|nginx:1.25|Up 3 hours|running|0.0.0.0:80->80/tcp|2024-03-01\n", "", 0, 0});
        world.reply("docker stop 'web'", {"web\n", "", 0, 0});
        world.reply("docker start 'web'", {"web\n", "", 0, 0});
        world.reply("docker restart 'web'", {"web\n", "", 0, 0});
        world.reply("docker rm -f 'web'", {"web\n", "", 0, 0});
        world.reply("docker stop 'ghost'", {"", "Error response from daemon: No such container: ghost\n", 1, 0});
        world.reply("docker logs --tail 2 'web' 2>&1", {"GET / 200\nGET /health 200\n", "", 0, 0});
        world.reply("docker inspect 'web'", {"[{\"Id\": \"a1b2c3d4e5f6\"}]\n", "", 0, 0});

        pool = std::make_unique<ConnectionPool>(std::make_shared<fake::FakeTransportFactory>(world),
                                                fake::fast_pool());
        mux = std::make_unique<SessionMultiplexer>(*pool, SessionConfig{});
        containers = std::make_unique<ContainerManager>(*mux, cache, 5);
    }

    void TearDown() override {
        containers.reset();
        mux.reset();
        pool.reset();
    }

    int listings_run() {
        int n = 0;
        for (const auto& c : world.commands_seen()) {
            if (c == "5: " + container_list_command()) n++;
        }
        return n;
    }
};

}  // namespace

TEST_F(ContainerFixture, ListUsesCacheAfterFirstFetch) {
    auto first = containers->list_containers(cred);
    ASSERT_TRUE(first.is_ok()) << first.error;
    ASSERT_EQ(first.value.size(), 1u);
    EXPECT_EQ(first.value[0].name, "web");
    EXPECT_EQ(listings_run(), 1);

    auto second = containers->list_containers(cred);
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(listings_run(), 1);

    auto live = containers->list_containers(cred, false);
    ASSERT_TRUE(live.is_ok());
    EXPECT_EQ(listings_run(), 2);
}

TEST_F(ContainerFixture, ActionInvalidatesListing) {
    ASSERT_TRUE(containers->list_containers(cred).is_ok());
    ASSERT_TRUE(cache.get_containers("5").is_ok());

    auto r = containers->stop_container(cred, "web");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(cache.get_containers("5").kind, ErrorKind::CacheMiss);

    // Next listing is fetched live
    ASSERT_TRUE(containers->list_containers(cred).is_ok());
    EXPECT_EQ(listings_run(), 2);
}

TEST_F(ContainerFixture, AllActionsRun) {
    EXPECT_TRUE(containers->start_container(cred, "web").is_ok());
    EXPECT_TRUE(containers->restart_container(cred, "web").is_ok());
    EXPECT_TRUE(containers->remove_container(cred, "web").is_ok());

    auto seen = world.commands_seen();
    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0], "5: docker start 'web'");
    EXPECT_EQ(seen[1], "5: docker restart 'web'");
    EXPECT_EQ(seen[2], "5: docker rm -f 'web'");
}

TEST_F(ContainerFixture, FailedActionCarriesStderr) {
    auto r = containers->stop_container(cred, "ghost");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::CommandFailed);
    EXPECT_NE(r.error.find("No such container"), std::string::npos);
}

TEST_F(ContainerFixture, EmptyIdRejected) {
    EXPECT_EQ(containers->stop_container(cred, "").kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(containers->container_logs(cred, "").kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(containers->inspect_container(cred, "").kind, ErrorKind::InvalidArgument);
    EXPECT_TRUE(world.commands_seen().empty());
}

TEST_F(ContainerFixture, LogsAndInspect) {
    auto logs = containers->container_logs(cred, "web", 2);
    ASSERT_TRUE(logs.is_ok()) << logs.error;
    EXPECT_EQ(logs.value, "GET / 200\nGET /health 200");

    auto inspect = containers->inspect_container(cred, "web");
    ASSERT_TRUE(inspect.is_ok());
    EXPECT_NE(inspect.value.find("a1b2c3d4e5f6"), std::string::npos);
}

TEST_F(ContainerFixture, UnreachableHostPropagates) {
    world.reject_auth("5");
    auto r = containers->list_containers(cred);
    EXPECT_EQ(r.kind, ErrorKind::AuthError);
}
