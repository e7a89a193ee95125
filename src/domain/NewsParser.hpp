/**
 * @file NewsParser.hpp
 * @brief Interface for extracting articles and article text from raw HTML.
 */

#pragma once
#include <string>
#include <vector>
#include "Article.hpp"

namespace finnews::domain {

/**
 * @class NewsParser
 * @brief Pluggable extraction strategy. Implementations are pure: no I/O, no shared state.
 */
class NewsParser {
public:
    virtual ~NewsParser() = default;

    /**
     * @brief Extracts the listing entries of one page.
     * @param html Raw page content.
     * @param baseUrl URL used to resolve relative links.
     * @return Entries in page order, junk categories already filtered out.
     */
    virtual std::vector<Article> extractListing(const std::string& html, const std::string& baseUrl) const = 0;

    /**
     * @brief Extracts the readable body of a single article page.
     * @return Plain text, paragraphs separated by blank lines.
     */
    virtual std::string extractBody(const std::string& html) const = 0;
};

} // namespace finnews::domain
