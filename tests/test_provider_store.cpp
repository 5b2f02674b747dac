#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "provider_store.h"
#include <chrono>
#include <string>
#include <thread>

using namespace kaddht;
using ::testing::ElementsAre;

class ProviderStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string bytes = std::string("\x12\x20", 2) + std::string(32, '\x07');
        cid_.emplace(*ContentId::parse(bytes));
    }

    std::optional<ContentId> cid_;
    RequestContext ctx_;
};

TEST_F(ProviderStoreTest, AddAndGetProviders) {
    ProviderStore store;
    EXPECT_TRUE(store.get_providers(ctx_, *cid_).empty());

    store.add_provider(ctx_, *cid_, "peer-a");
    store.add_provider(ctx_, *cid_, "peer-b");
    store.add_provider(ctx_, *cid_, "peer-a");

    EXPECT_THAT(store.get_providers(ctx_, *cid_), ElementsAre("peer-a", "peer-b"));
    EXPECT_EQ(store.content_count(), 1u);
    EXPECT_EQ(store.provider_count(), 2u);
}

TEST_F(ProviderStoreTest, ExpiredProvidersAreHiddenAndCleaned) {
    ProviderStore store(std::chrono::milliseconds(20));
    store.add_provider(ctx_, *cid_, "peer-a");
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    EXPECT_TRUE(store.get_providers(ctx_, *cid_).empty());
    EXPECT_EQ(store.cleanup_expired(), 1u);
    EXPECT_EQ(store.content_count(), 0u);
}

TEST_F(ProviderStoreTest, CancelledContextDoesNothing) {
    ProviderStore store;
    RequestContext cancelled;
    cancelled.cancel();

    store.add_provider(cancelled, *cid_, "peer-a");
    EXPECT_EQ(store.provider_count(), 0u);

    store.add_provider(ctx_, *cid_, "peer-a");
    EXPECT_TRUE(store.get_providers(cancelled, *cid_).empty());
}

TEST_F(ProviderStoreTest, CleanupThreadRemovesExpiredEntries) {
    ProviderStore store(std::chrono::milliseconds(10), std::chrono::milliseconds(10));
    store.add_provider(ctx_, *cid_, "peer-a");

    store.start();
    EXPECT_TRUE(store.is_running());

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (store.provider_count() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_EQ(store.provider_count(), 0u);

    store.stop();
    EXPECT_FALSE(store.is_running());
}
