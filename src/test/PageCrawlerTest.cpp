#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>

#include "application/PageCrawler.hpp"
#include "TestFakes.hpp"

using namespace finnews;
using application::PageCrawler;

namespace {

const std::string kBase = "https://news.test/economy";

std::shared_ptr<test::FakeFetcher> ThreePageSite() {
    auto fetcher = std::make_shared<test::FakeFetcher>();
    fetcher->setPage(kBase, test::ListingPage({{"https://news.test/1", "One"}, {"https://news.test/2", "Two"}}));
    fetcher->setPage(kBase + "?page=2", test::ListingPage({{"https://news.test/3", "Three"}, {"https://news.test/4", "Four"}}));
    fetcher->setPage(kBase + "?page=3", test::ListingPage({{"https://news.test/5", "Five"}}));
    fetcher->setPage(kBase + "?page=4", "");
    fetcher->setPage(kBase + "?page=5", test::ListingPage({{"https://news.test/6", "Never reached"}}));
    return fetcher;
}

void TestPageUrls() {
    PageCrawler crawler(std::make_shared<test::FakeFetcher>(), std::make_shared<test::LineParser>(), kBase);
    assert(crawler.pageUrl(1) == kBase);
    assert(crawler.pageUrl(2) == kBase + "?page=2");
    assert(crawler.pageUrl(10) == kBase + "?page=10");

    PageCrawler withQuery(std::make_shared<test::FakeFetcher>(), std::make_shared<test::LineParser>(),
                          "https://news.test/list?cat=economy");
    assert(withQuery.pageUrl(3) == "https://news.test/list?cat=economy&page=3");
}

void TestCrawlStopsAtFirstEmptyPage() {
    auto fetcher = ThreePageSite();
    PageCrawler crawler(fetcher, std::make_shared<test::LineParser>(), kBase);

    auto items = crawler.crawlAllPages(10);
    assert(items.size() == 5);
    assert(items.front().link == "https://news.test/1");
    assert(items.back().link == "https://news.test/5");

    auto requests = fetcher->requests();
    assert(requests.size() == 4);
    assert(requests[0] == kBase);
    assert(requests[1] == kBase + "?page=2");
    assert(requests[2] == kBase + "?page=3");
    assert(requests[3] == kBase + "?page=4");
    assert(std::find(requests.begin(), requests.end(), kBase + "?page=5") == requests.end());
}

void TestCrawlRespectsPageCeiling() {
    auto fetcher = ThreePageSite();
    PageCrawler crawler(fetcher, std::make_shared<test::LineParser>(), kBase);

    auto items = crawler.crawlAllPages(2);
    assert(items.size() == 4);
    assert(fetcher->requests().size() == 2);

    fetcher->clearRequests();
    assert(crawler.crawlAllPages(0).empty());
    assert(fetcher->requests().empty());
}

void TestFetchFailureYieldsNoItems() {
    auto fetcher = std::make_shared<test::FakeFetcher>();
    fetcher->setFailure(kBase, "timeout");
    fetcher->setPage(kBase + "?page=2", test::ListingPage({{"https://news.test/9", "Nine"}}));
    PageCrawler crawler(fetcher, std::make_shared<test::LineParser>(), kBase);

    assert(crawler.crawlPage(1).empty());
    assert(crawler.crawlAllPages(5).empty());
    // A failed first page ends the crawl like an empty one
    assert(fetcher->requests().size() == 2);
}

void TestArticleBody() {
    auto fetcher = std::make_shared<test::FakeFetcher>();
    fetcher->setPage("https://news.test/1", "Qiymətlər artıb və bazar sabitdir.");
    PageCrawler crawler(fetcher, std::make_shared<test::LineParser>(), kBase, 10);

    domain::Article article;
    article.link = "https://news.test/1";
    auto body = crawler.loadArticleBody(article);
    assert(body && *body == "Qiymətlər ");

    article.link = "https://news.test/missing";
    assert(!crawler.loadArticleBody(article).has_value());
}

} // namespace

int main() {
    std::cout << "[Test] Starting PageCrawler Test..." << std::endl;

    TestPageUrls();
    TestCrawlStopsAtFirstEmptyPage();
    TestCrawlRespectsPageCeiling();
    TestFetchFailureYieldsNoItems();
    TestArticleBody();

    std::cout << "[PASS] PageCrawler Test." << std::endl;
    return 0;
}
