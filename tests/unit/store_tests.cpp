#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "state/Store.h"

TEST(Store, UpdateIsVisibleInSnapshot) {
    Store store;
    store.update([](AppState &state) { state.viewer.id = "me"; });
    EXPECT_EQ(store.snapshot().viewer.id, "me");
}

TEST(Store, ListenersSeeEveryUpdate) {
    Store store;
    int calls = 0;
    store.subscribe([&calls](const AppState &) { ++calls; });

    store.update([](AppState &) {});
    store.update([](AppState &) {});
    EXPECT_EQ(calls, 2);
}

TEST(Store, SelectorFiresOnlyOnChange) {
    Store store;
    std::vector<std::string> seen;
    store.subscribe<std::string>([](const AppState &state) { return state.view.channelId; },
                                 [&seen](const std::string &channelId) { seen.push_back(channelId); });

    store.update([](AppState &state) { state.view.channelId = "c1"; });
    store.update([](AppState &state) { state.viewer.id = "me"; });
    store.update([](AppState &state) { state.view.channelId = "c2"; });

    EXPECT_EQ(seen, (std::vector<std::string>{"c1", "c2"}));
}

TEST(Store, SelectorCanFireImmediately) {
    Store store;
    store.update([](AppState &state) { state.view.channelId = "c1"; });

    std::vector<std::string> seen;
    store.subscribe<std::string>(
        [](const AppState &state) { return state.view.channelId; },
        [&seen](const std::string &channelId) { seen.push_back(channelId); }, std::equal_to<std::string>{}, true);

    EXPECT_EQ(seen, std::vector<std::string>{"c1"});
}

TEST(Store, UnsubscribedListenerIsNotCalled) {
    Store store;
    int calls = 0;
    auto id = store.subscribe([&calls](const AppState &) { ++calls; });

    store.update([](AppState &) {});
    store.unsubscribe(id);
    store.update([](AppState &) {});
    EXPECT_EQ(calls, 1);
}

TEST(Store, NotificationGoesThroughDispatcher) {
    std::vector<Store::Task> queued;
    Store store([&queued](Store::Task task) { queued.push_back(std::move(task)); });

    int calls = 0;
    store.subscribe([&calls](const AppState &) { ++calls; });
    store.update([](AppState &state) { state.viewer.id = "me"; });

    EXPECT_EQ(calls, 0);
    ASSERT_EQ(queued.size(), 1u);
    queued[0]();
    EXPECT_EQ(calls, 1);
}

TEST(Store, BurstOfUpdatesIsNotifiedOnce) {
    std::vector<Store::Task> queued;
    Store store([&queued](Store::Task task) { queued.push_back(std::move(task)); });

    std::vector<std::string> seen;
    store.subscribe([&seen](const AppState &state) { seen.push_back(state.viewer.id); });

    store.update([](AppState &state) { state.viewer.id = "a"; });
    store.update([](AppState &state) { state.viewer.id = "b"; });
    store.update([](AppState &state) { state.viewer.id = "c"; });

    ASSERT_EQ(queued.size(), 1u);
    queued[0]();
    EXPECT_EQ(seen, std::vector<std::string>{"c"});
    EXPECT_EQ(store.revision(), 3u);

    store.update([](AppState &state) { state.viewer.id = "d"; });
    ASSERT_EQ(queued.size(), 2u);
    queued[1]();
    EXPECT_EQ(seen, (std::vector<std::string>{"c", "d"}));
}
