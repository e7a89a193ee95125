#include <algorithm>
#include <cassert>
#include <deque>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "application/InteractiveSession.hpp"
#include "TestFakes.hpp"

using namespace finnews;
using application::InteractiveSession;
using application::MessageLevel;

namespace {

const std::string kBase = "https://news.test/economy";

class RecordingView : public application::SessionView {
public:
    void showWelcome() override { ++welcomes; }
    void showListing(int page, const std::vector<domain::Article>& articles) override {
        listedPages.push_back(page);
        lastListing = articles;
    }
    void showArticle(const domain::Article& article, const std::string& body) override {
        opened.push_back(article);
        bodies.push_back(body);
    }
    void showMessage(MessageLevel, const std::string& message) override {
        messages.push_back(message);
    }

    bool saw(const std::string& message) const {
        return std::find(messages.begin(), messages.end(), message) != messages.end();
    }

    int welcomes = 0;
    std::vector<int> listedPages;
    std::vector<domain::Article> lastListing;
    std::vector<domain::Article> opened;
    std::vector<std::string> bodies;
    std::vector<std::string> messages;
};

class ScriptedInput : public application::CommandSource {
public:
    explicit ScriptedInput(std::vector<std::string> lines = {}) : m_lines(lines.begin(), lines.end()) {}

    std::optional<std::string> nextLine(const std::string& prompt) override {
        prompts.push_back(prompt);
        if (onPrompt) onPrompt(prompts.size());
        if (m_lines.empty()) return std::nullopt;
        std::string line = m_lines.front();
        m_lines.pop_front();
        return line;
    }

    std::vector<std::string> prompts;
    std::function<void(size_t)> onPrompt; ///< Called with the prompt count before a line is returned.

private:
    std::deque<std::string> m_lines;
};

struct Fixture {
    std::shared_ptr<test::FakeFetcher> fetcher = std::make_shared<test::FakeFetcher>();
    application::NewsContext context;

    Fixture() {
        fetcher->setPage(kBase, test::ListingPage({{"https://news.test/a", "Alpha"}, {"https://news.test/b", "Bravo"}}));
        fetcher->setPage(kBase + "?page=2", test::ListingPage({{"https://news.test/c", "Charlie"}, {"https://news.test/d", "Delta"}}));
        fetcher->setPage(kBase + "?page=3", "");
        fetcher->setPage("https://news.test/a", "Body of Alpha");
        fetcher->setPage("https://news.test/c", "Body of Charlie");

        context.crawler = std::make_shared<application::PageCrawler>(fetcher, std::make_shared<test::LineParser>(), kBase);
        context.seenStore = std::make_shared<infrastructure::SeenStore>("unused_seen_links.json");
        context.registry = std::make_shared<application::ArticleRegistry>();
        context.shutdown = std::make_shared<application::ShutdownSignal>();

        domain::Article history;
        history.link = "https://news.test/old";
        history.title = "From a previous run";
        context.registry->appendIfAbsent(history);
    }
};

void TestWelcomeAcknowledgementDoesNotCrawl() {
    Fixture f;
    RecordingView view;
    ScriptedInput input;
    InteractiveSession session(f.context, view, input);

    assert(session.state() == InteractiveSession::State::Welcome);
    assert(session.handleInput("") == InteractiveSession::State::Listing);
    assert(session.currentPage() == 1);
    assert(f.fetcher->requests().empty());
    assert(f.context.registry->size() == 1);
}

void TestTurnThenReadOpensNewPage() {
    Fixture f;
    RecordingView view;
    ScriptedInput input;
    InteractiveSession session(f.context, view, input);
    session.handleInput("");

    session.handleInput("turn 2");
    assert(session.currentPage() == 2);
    assert(f.context.registry->size() == 2);

    assert(session.handleInput("read 1") == InteractiveSession::State::Reading);
    assert(view.opened.size() == 1);
    assert(view.opened[0].link == "https://news.test/c");
    assert(view.bodies[0] == "Body of Charlie");
    assert(session.openArticle() && session.openArticle()->title == "Charlie");

    // Any input returns to the same page
    assert(session.handleInput("whatever") == InteractiveSession::State::Listing);
    assert(session.currentPage() == 2);
    assert(!session.openArticle());
}

void TestInputErrorsLeaveStateAlone() {
    Fixture f;
    RecordingView view;
    ScriptedInput input;
    InteractiveSession session(f.context, view, input);
    session.handleInput("");
    const auto before = f.context.registry->snapshot();

    session.handleInput("read 5");
    assert(view.saw("Invalid index"));
    session.handleInput("read 0");
    session.handleInput("read two");
    assert(view.saw("Usage: read <n>"));
    session.handleInput("turn");
    session.handleInput("turn -1");
    session.handleInput("turn 1 2");
    assert(view.saw("Usage: turn <page_number>"));
    session.handleInput("dance");
    session.handleInput("   ");
    assert(view.saw("Unknown command"));

    session.handleInput("turn 3");
    assert(view.saw("No articles found on that page."));
    assert(session.currentPage() == 1);

    assert(session.state() == InteractiveSession::State::Listing);
    assert(f.context.registry->snapshot().size() == before.size());
    assert(f.context.registry->snapshot()[0].link == before[0].link);
    assert(view.opened.empty());
}

void TestListFailureKeepsRegistry() {
    Fixture f;
    f.fetcher->setFailure(kBase, "offline");
    RecordingView view;
    ScriptedInput input;
    InteractiveSession session(f.context, view, input);
    session.handleInput("");

    session.handleInput("LIST");
    assert(f.context.registry->size() == 1);
    assert(f.context.registry->at(0)->link == "https://news.test/old");
    assert(session.state() == InteractiveSession::State::Listing);
}

void TestReadFailureStaysInListing() {
    Fixture f;
    RecordingView view;
    ScriptedInput input;
    InteractiveSession session(f.context, view, input);
    session.handleInput("");
    session.handleInput("list");

    assert(session.handleInput("read 2") == InteractiveSession::State::Listing);
    assert(view.opened.empty());
    assert(view.messages.back() == "Could not load the article, try again later.");
}

void TestScriptedRun() {
    Fixture f;
    RecordingView view;
    ScriptedInput input({"", "turn 2", "read 1", "", "list", "read 1", "", "home", "", "quit", "never read"});
    InteractiveSession session(f.context, view, input);

    session.run();

    assert(session.state() == InteractiveSession::State::Terminated);
    assert(f.context.shutdown->isSet());
    assert(view.welcomes == 2);
    assert(view.opened.size() == 2);
    assert(view.opened[0].link == "https://news.test/c");
    assert(view.opened[1].link == "https://news.test/a");
    assert(view.saw("Exiting..."));
    assert(input.prompts.size() == 10);
    assert(input.prompts.front() == "Press Enter to load the latest financial news");

    // Listing is redrawn after navigation and after leaving an article
    assert(!view.listedPages.empty());
    assert(view.listedPages.front() == 1);
    assert(std::find(view.listedPages.begin(), view.listedPages.end(), 2) != view.listedPages.end());
    assert(view.lastListing.size() == 2);
}

void TestEndOfInputQuits() {
    Fixture f;
    RecordingView view;
    ScriptedInput input({"", "turn 2"});
    InteractiveSession session(f.context, view, input);

    session.run();
    assert(session.state() == InteractiveSession::State::Terminated);
    assert(f.context.shutdown->isSet());
}

void TestExternalShutdownEndsSession() {
    Fixture f;
    RecordingView view;
    ScriptedInput input({"", "turn 2", "read 1"});
    InteractiveSession session(f.context, view, input);
    f.context.shutdown->trigger();

    session.run();
    assert(session.state() == InteractiveSession::State::Terminated);
    assert(input.prompts.empty());
}

void TestListingShowsItemsAddedBetweenCommands() {
    Fixture f;
    f.fetcher->setPage("https://news.test/p", "Body of the poller item");
    RecordingView view;
    ScriptedInput input({"", "bogus", "read 0", "read 2"});
    input.onPrompt = [&f](size_t count) {
        // Second prompt is the first command prompt; the background poller appends here
        if (count == 2) {
            domain::Article added;
            added.link = "https://news.test/p";
            added.title = "Poller item";
            f.context.registry->appendIfAbsent(added);
        }
    };
    InteractiveSession session(f.context, view, input);

    session.run();

    assert(view.saw("Unknown command"));
    assert(view.saw("Usage: read <n>"));
    assert(view.lastListing.size() == 2);
    assert(view.lastListing[1].title == "Poller item");
    assert(view.listedPages.size() >= 3);
    assert(view.opened.size() == 1);
    assert(view.opened[0].link == "https://news.test/p");
}

void TestHomeKeepsCurrentPage() {
    Fixture f;
    RecordingView view;
    ScriptedInput input({"", "turn 2", "home", ""});
    InteractiveSession session(f.context, view, input);

    session.run();

    assert(view.welcomes == 2);
    assert(session.currentPage() == 2);
    assert(view.listedPages.back() == 2);
    assert(view.lastListing.size() == 2);
    assert(view.lastListing[0].link == "https://news.test/c");
    assert(f.fetcher->requests().size() == 1);
}

} // namespace

int main() {
    std::cout << "[Test] Starting InteractiveSession Test..." << std::endl;

    TestWelcomeAcknowledgementDoesNotCrawl();
    TestTurnThenReadOpensNewPage();
    TestInputErrorsLeaveStateAlone();
    TestListFailureKeepsRegistry();
    TestReadFailureStaysInListing();
    TestScriptedRun();
    TestEndOfInputQuits();
    TestExternalShutdownEndsSession();
    TestListingShowsItemsAddedBetweenCommands();
    TestHomeKeepsCurrentPage();

    std::cout << "[PASS] InteractiveSession Test." << std::endl;
    return 0;
}
