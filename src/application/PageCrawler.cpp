/**
 * @file PageCrawler.cpp
 * @brief Implementation of PageCrawler.
 */

#include "application/PageCrawler.hpp"
#include "infrastructure/TextUtils.hpp"
#include <iostream>
#include <iterator>
#include <utility>

namespace finnews::application {

PageCrawler::PageCrawler(std::shared_ptr<domain::PageFetcher> fetcher,
                         std::shared_ptr<domain::NewsParser> parser,
                         std::string baseUrl,
                         size_t articleCharLimit)
    : m_fetcher(std::move(fetcher)),
      m_parser(std::move(parser)),
      m_baseUrl(std::move(baseUrl)),
      m_articleCharLimit(articleCharLimit) {}

std::string PageCrawler::pageUrl(int pageNumber) const {
    if (pageNumber <= 1) return m_baseUrl;
    const char joiner = m_baseUrl.find('?') == std::string::npos ? '?' : '&';
    return m_baseUrl + joiner + "page=" + std::to_string(pageNumber);
}

std::vector<domain::Article> PageCrawler::crawlPage(int pageNumber) {
    const std::string url = pageUrl(pageNumber);
    auto result = m_fetcher->fetch(url);
    if (!result.success) {
        std::cerr << "[PageCrawler] Fetch error for " << url << ": " << result.error << std::endl;
        return {};
    }
    if (result.content.empty()) return {};
    return m_parser->extractListing(result.content, m_baseUrl);
}

std::vector<domain::Article> PageCrawler::crawlAllPages(int maxPages) {
    std::vector<domain::Article> collected;
    for (int page = 1; page <= maxPages; ++page) {
        auto items = crawlPage(page);
        if (items.empty()) {
            break; // end of listing
        }
        collected.insert(collected.end(),
                         std::make_move_iterator(items.begin()),
                         std::make_move_iterator(items.end()));
    }
    return collected;
}

std::optional<std::string> PageCrawler::loadArticleBody(const domain::Article& article) {
    auto result = m_fetcher->fetch(article.link);
    if (!result.success) {
        std::cerr << "[PageCrawler] Fetch error for " << article.link << ": " << result.error << std::endl;
        return std::nullopt;
    }
    std::string text = m_parser->extractBody(result.content);
    if (m_articleCharLimit > 0) {
        text = infrastructure::TextUtils::Utf8Truncate(text, m_articleCharLimit);
    }
    return text;
}

} // namespace finnews::application
