/**
 * @file PageCrawler.hpp
 * @brief Fetch-and-parse of listing pages and single articles.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/Article.hpp"
#include "domain/NewsParser.hpp"
#include "domain/PageFetcher.hpp"

namespace finnews::application {

/**
 * @class PageCrawler
 * @brief Turns page numbers into articles using the injected fetcher and parser.
 *
 * Network failures never escape: they are logged and read as "no items".
 * Safe to share between threads as long as the collaborators are.
 */
class PageCrawler {
public:
    PageCrawler(std::shared_ptr<domain::PageFetcher> fetcher,
                std::shared_ptr<domain::NewsParser> parser,
                std::string baseUrl,
                size_t articleCharLimit = 20000);

    /** @brief URL of a listing page; page 1 is the bare listing URL. */
    std::string pageUrl(int pageNumber) const;

    /** @brief Fetches and parses one listing page. Empty on any failure. */
    std::vector<domain::Article> crawlPage(int pageNumber);

    /**
     * @brief Crawls pages 1..maxPages in order, stopping at the first empty page.
     * @return All collected articles, in page order.
     */
    std::vector<domain::Article> crawlAllPages(int maxPages);

    /**
     * @brief Downloads an article and extracts its text.
     * @return nullopt if the page could not be fetched.
     */
    std::optional<std::string> loadArticleBody(const domain::Article& article);

private:
    std::shared_ptr<domain::PageFetcher> m_fetcher;
    std::shared_ptr<domain::NewsParser> m_parser;
    std::string m_baseUrl;
    size_t m_articleCharLimit;
};

} // namespace finnews::application
