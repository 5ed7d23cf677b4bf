#include <gtest/gtest.h>
#include <managers/state_cache.hpp>
#include <thread>

using namespace std::chrono_literals;

static ServerStatus online(const std::string& id, double cpu) {
    ServerStatus s;
    s.host_id = id;
    s.online = true;
    s.cpu_percent = cpu;
    return s;
}

namespace {

// Writes a fixed status for every host it is asked to refresh.
class RecordingRefresher : public CacheRefresher {
public:
    explicit RecordingRefresher(StateCache& cache) : cache_(cache) {}

    std::vector<std::string> refresh_targets() override { return targets; }

    int refresh_hosts(const std::vector<std::string>& host_ids) override {
        calls.push_back(host_ids);
        for (const auto& id : host_ids) {
            cache_.set_server_status(id, online(id, 5.0));
            cache_.set_containers(id, {});
        }
        return static_cast<int>(host_ids.size());
    }

    std::vector<std::string> targets;
    std::vector<std::vector<std::string>> calls;

private:
    StateCache& cache_;
};

}  // namespace

TEST(StateCache, MissThenHit) {
    StateCache cache(CacheConfig{});
    auto miss = cache.get_server_status("1");
    EXPECT_TRUE(miss.is_err());
    EXPECT_EQ(miss.kind, ErrorKind::CacheMiss);

    cache.set_server_status("1", online("1", 42.5));
    auto hit = cache.get_server_status("1");
    ASSERT_TRUE(hit.is_ok());
    EXPECT_DOUBLE_EQ(hit.value.cpu_percent, 42.5);

    auto st = cache.stats();
    EXPECT_EQ(st.hits, 1u);
    EXPECT_EQ(st.misses, 1u);
    EXPECT_EQ(st.status_entries, 1);
    EXPECT_EQ(st.container_entries, 0);
}

TEST(StateCache, EntriesExpire) {
    CacheConfig cfg;
    cfg.status_ttl_secs = 1;
    cfg.containers_ttl_secs = 60;
    StateCache cache(cfg);

    ContainerInfo c;
    c.id = "abc123";
    c.name = "web";
    cache.set_server_status("1", online("1", 1.0));
    cache.set_containers("1", {c});

    std::this_thread::sleep_for(1100ms);
    EXPECT_EQ(cache.get_server_status("1").kind, ErrorKind::CacheMiss);

    auto containers = cache.get_containers("1");
    ASSERT_TRUE(containers.is_ok());
    ASSERT_EQ(containers.value.size(), 1u);
    EXPECT_EQ(containers.value[0].name, "web");
}

TEST(StateCache, InvalidateDropsStaleWrites) {
    StateCache cache(CacheConfig{});
    uint64_t gen = cache.generation("1");

    // A mutation lands while a background fetch is in flight
    cache.invalidate("1");
    EXPECT_FALSE(cache.set_server_status_if("1", online("1", 99.0), gen));
    EXPECT_EQ(cache.get_server_status("1").kind, ErrorKind::CacheMiss);

    uint64_t fresh = cache.generation("1");
    EXPECT_GT(fresh, gen);
    EXPECT_TRUE(cache.set_server_status_if("1", online("1", 10.0), fresh));
    EXPECT_TRUE(cache.get_server_status("1").is_ok());
    EXPECT_EQ(cache.stats().stale_writes_dropped, 1u);
}

TEST(StateCache, InvalidateContainersKeepsStatus) {
    StateCache cache(CacheConfig{});
    cache.set_server_status("1", online("1", 1.0));
    cache.set_containers("1", {});

    uint64_t gen = cache.generation("1");
    cache.invalidate_containers("1");
    EXPECT_TRUE(cache.get_server_status("1").is_ok());
    EXPECT_EQ(cache.get_containers("1").kind, ErrorKind::CacheMiss);
    EXPECT_FALSE(cache.set_containers_if("1", {}, gen));
}

TEST(StateCache, HostsAreIndependent) {
    StateCache cache(CacheConfig{});
    cache.set_server_status("1", online("1", 1.0));
    cache.set_server_status("2", online("2", 2.0));
    cache.invalidate("1");

    EXPECT_TRUE(cache.get_server_status("1").is_err());
    EXPECT_TRUE(cache.get_server_status("2").is_ok());
}

TEST(StateCache, ClearDropsEverything) {
    StateCache cache(CacheConfig{});
    cache.set_server_status("1", online("1", 1.0));
    cache.set_containers("2", {});
    cache.clear();
    EXPECT_TRUE(cache.get_server_status("1").is_err());
    EXPECT_TRUE(cache.get_containers("2").is_err());
}

TEST(StateCache, UpdateRefreshesOnlyStaleHosts) {
    StateCache cache(CacheConfig{});
    RecordingRefresher refresher(cache);
    refresher.targets = {"1", "2", "3"};

    EXPECT_EQ(cache.update_all_caches(), 0);   // no refresher yet

    cache.set_refresher(&refresher);
    cache.set_server_status("2", online("2", 1.0));
    cache.set_containers("2", {});

    EXPECT_EQ(cache.update_all_caches(), 2);
    ASSERT_EQ(refresher.calls.size(), 1u);
    EXPECT_EQ(refresher.calls[0], (std::vector<std::string>{"1", "3"}));

    // Everything is fresh now
    EXPECT_EQ(cache.update_all_caches(), 0);
    EXPECT_EQ(refresher.calls.size(), 1u);
}

TEST(StateCache, ForceRefreshInvalidatesAll) {
    StateCache cache(CacheConfig{});
    RecordingRefresher refresher(cache);
    refresher.targets = {"1", "2"};
    cache.set_refresher(&refresher);

    cache.set_server_status("1", online("1", 1.0));
    uint64_t gen = cache.generation("1");

    EXPECT_EQ(cache.force_refresh_all_caches(), 2);
    EXPECT_GT(cache.generation("1"), gen);
    EXPECT_DOUBLE_EQ(cache.get_server_status("1").value.cpu_percent, 5.0);
    EXPECT_EQ(refresher.calls[0].size(), 2u);
}
