#include <FL/Fl.H>
#include <FL/Fl_Double_Window.H>

#include <chrono>
#include <string>

#include "data/DemoFeed.h"
#include "data/FixtureConversation.h"
#include "data/FixturePostsSource.h"
#include "state/Actions.h"
#include "state/PostsLoader.h"
#include "state/RealtimeMerger.h"
#include "state/Store.h"
#include "ui/EventLoop.h"
#include "ui/Theme.h"
#include "ui/TypingSweeper.h"
#include "ui/components/MessageListView.h"
#include "utils/Logger.h"
#include "utils/Settings.h"
#include "utils/Time.h"

const int INITIAL_WINDOW_WIDTH = 900;
const int INITIAL_WINDOW_HEIGHT = 720;
const int GENERATED_POST_COUNT = 400;
const double FETCH_LATENCY_SECONDS = 0.6;
const double DEMO_EVENT_INTERVAL_SECONDS = 1.5;

int main(int argc, char **argv) {
    Fl::lock();

    Logger::info("Application started");

    const std::string settingsPath = argc > 1 ? argv[1] : "scrollback.json";
    Settings settings = Settings::loadFromFile(settingsPath);
    Logger::setLevel(settings.logLevel);

    Data::FixtureConversation conversation;
    bool loaded = false;
    if (argc > 2) {
        if (auto fromFile = Data::FixtureConversation::loadFromFile(argv[2])) {
            conversation = std::move(*fromFile);
            loaded = true;
        }
    }
    if (!loaded) {
        conversation =
            Data::FixtureConversation::generate("town-square", GENERATED_POST_COUNT, std::chrono::system_clock::now());
    }
    const std::string channelId = conversation.channel.id;

    init_theme();

    Store store([](Store::Task task) { EventLoop::post(std::move(task)); });
    store.update([&](AppState &state) {
        state.viewer = conversation.viewer;
        state.preferences.showJoinLeave = settings.showJoinLeave;
        state.preferences.nameDisplay = settings.nameDisplay;
        state.channels[channelId] = conversation.channel;
        for (const auto &user : conversation.users) {
            state.users[user.id] = user;
        }
        auto &posts = state.channelPosts[channelId];
        posts.lastViewedAt = TimeUtils::fromUnixMs(conversation.lastViewedAtMs);
        posts.unreadCount = conversation.countUnread();
    });

    Data::FixturePostsSource source(conversation, FETCH_LATENCY_SECONDS, 7);
    PostsLoader loader(store, source, settings.pageSize);
    loader.setErrorReporter([](const Feed::FetchRequest &request, const Feed::FetchError &error) {
        Logger::error(std::string("Could not load ") + Feed::toString(request.direction) + " messages: " +
                      error.message);
    });

    RealtimeMerger merger(store, settings.typingTimeout);
    TypingSweeper sweeper(merger);

    auto *window = new Fl_Double_Window(INITIAL_WINDOW_WIDTH, INITIAL_WINDOW_HEIGHT, "Scrollback");
    window->begin();
    auto *view = new MessageListView(0, 0, window->w(), window->h(), store, settings);
    window->end();
    window->resizable(view);
    window->size_range(320, 240);

    view->setOnRequestOlder([&loader]() { loader.loadOlder(); });
    view->setOnRequestNewer([&loader]() { loader.loadNewer(); });
    view->setOnReachedUnread([]() { Logger::info("Reached the first unread message"); });
    view->setOnAtBottom([&store, channelId]() {
        store.update([&](AppState &state) { Actions::markAsRead(state, channelId, std::chrono::system_clock::now()); });
    });

    view->setChannel(channelId);
    loader.openChannel(channelId);

    Data::DemoFeed feed(conversation, store, merger, DEMO_EVENT_INTERVAL_SECONDS);
    sweeper.start();
    feed.start();

    window->show();
    int result = Fl::run();

    feed.stop();
    sweeper.stop();
    size_t dropped = EventLoop::cancelDelayed();
    if (dropped > 0) {
        Logger::debug("Dropped " + std::to_string(dropped) + " pending delayed task(s)");
    }
    delete window;
    return result;
}
