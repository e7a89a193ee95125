#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "application/ArticleRegistry.hpp"
#include "application/ShutdownSignal.hpp"

using namespace finnews;
using application::ArticleRegistry;
using application::ShutdownSignal;

namespace {

domain::Article MakeArticle(const std::string& link, const std::string& title = "Title") {
    domain::Article a;
    a.link = link;
    a.title = title;
    a.source = "APA.az";
    return a;
}

bool HasNoDuplicateLinks(const std::vector<domain::Article>& articles) {
    std::set<std::string> links;
    for (const auto& a : articles) {
        if (!links.insert(a.link).second) return false;
    }
    return true;
}

void TestBasicOperations() {
    ArticleRegistry registry;
    assert(registry.size() == 0);
    assert(!registry.at(0).has_value());

    assert(registry.appendIfAbsent(MakeArticle("https://x/1", "One")));
    assert(registry.appendIfAbsent(MakeArticle("https://x/2", "Two")));
    assert(!registry.appendIfAbsent(MakeArticle("https://x/1", "One again")));
    assert(registry.size() == 2);
    assert(registry.at(0)->title == "One");
    assert(registry.at(1)->link == "https://x/2");
    assert(!registry.at(2).has_value());

    registry.replaceAll({MakeArticle("https://x/9"), MakeArticle("https://x/8"), MakeArticle("https://x/9")});
    auto snapshot = registry.snapshot();
    assert(snapshot.size() == 2);
    assert(snapshot[0].link == "https://x/9");
    assert(snapshot[1].link == "https://x/8");
    assert(!registry.contains("https://x/1"));
}

void TestConcurrentAppendAndReplace() {
    ArticleRegistry registry;
    for (int i = 0; i < 20; ++i) {
        registry.appendIfAbsent(MakeArticle("https://x/seed/" + std::to_string(i)));
    }

    std::vector<domain::Article> page2;
    for (int i = 0; i < 20; ++i) {
        page2.push_back(MakeArticle("https://x/page2/" + std::to_string(i)));
    }

    const int kAppenders = 4;
    const int kPerThread = 200;
    std::atomic<bool> go{false};
    std::vector<std::thread> threads;

    for (int t = 0; t < kAppenders; ++t) {
        threads.emplace_back([&registry, &go, t]() {
            while (!go.load()) std::this_thread::yield();
            for (int i = 0; i < kPerThread; ++i) {
                // Threads overlap on the same links to race appendIfAbsent
                registry.appendIfAbsent(MakeArticle("https://x/new/" + std::to_string((i + t * 50) % 300)));
            }
        });
    }
    threads.emplace_back([&registry, &go, &page2]() {
        while (!go.load()) std::this_thread::yield();
        for (int i = 0; i < 50; ++i) {
            registry.replaceAll(page2);
            std::this_thread::yield();
        }
    });

    go = true;
    for (auto& th : threads) th.join();

    auto merged = registry.snapshot();
    assert(HasNoDuplicateLinks(merged));
    // The last replace happened after the seed, and appends never remove entries
    for (const auto& a : page2) {
        assert(registry.contains(a.link));
    }

    // A background append arriving right after a replace is kept, appended after it
    registry.replaceAll(page2);
    assert(registry.appendIfAbsent(MakeArticle("https://x/late")));
    auto afterLate = registry.snapshot();
    assert(afterLate.size() == page2.size() + 1);
    assert(afterLate.back().link == "https://x/late");
}

void TestShutdownSignal() {
    ShutdownSignal signal;
    assert(!signal.isSet());
    assert(!signal.waitFor(std::chrono::milliseconds(10)));

    auto start = std::chrono::steady_clock::now();
    std::thread waiter([&signal]() {
        bool fired = signal.waitFor(std::chrono::seconds(30));
        assert(fired);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    signal.trigger();
    waiter.join();
    auto elapsed = std::chrono::steady_clock::now() - start;
    assert(elapsed < std::chrono::seconds(5));

    signal.trigger(); // idempotent
    assert(signal.isSet());
    assert(signal.waitFor(std::chrono::hours(1)));
}

} // namespace

int main() {
    std::cout << "[Test] Starting ArticleRegistry Test..." << std::endl;

    TestBasicOperations();
    TestConcurrentAppendAndReplace();
    TestShutdownSignal();

    std::cout << "[PASS] ArticleRegistry Test." << std::endl;
    return 0;
}
