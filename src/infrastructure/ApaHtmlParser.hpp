/**
 * @file ApaHtmlParser.hpp
 * @brief NewsParser for the APA.az listing and article markup, built on libxml2.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/NewsParser.hpp"

namespace finnews::infrastructure {

/**
 * @struct ListingRules
 * @brief Filtering policy applied while extracting listing entries.
 */
struct ListingRules {
    std::string sourceLabel = "APA.az";
    size_t minTitleLength = 5; ///< In code points.
    std::vector<std::string> excludedLinkMarkers = {"rates", "weather"};
};

/**
 * @class ApaHtmlParser
 * @brief Extracts `a.item` listing cards and the article body text.
 *
 * Listing cards look like:
 * <a class="item" href="..."><h2 class="title">...</h2><div class="date"><span>time</span><span>date</span></div></a>
 */
class ApaHtmlParser : public domain::NewsParser {
public:
    explicit ApaHtmlParser(ListingRules rules = {});

    std::vector<domain::Article> extractListing(const std::string& html, const std::string& baseUrl) const override;

    std::string extractBody(const std::string& html) const override;

    /** @brief Removes date digits glued to the end of a headline. */
    static std::string CleanTitle(const std::string& title);

    /** @brief True if `link` contains any non-empty marker (rates, weather and similar feeds). */
    static bool IsExcludedLink(const std::string& link, const std::vector<std::string>& markers);

private:
    ListingRules m_rules;
};

} // namespace finnews::infrastructure
