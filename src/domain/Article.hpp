/**
 * @file Article.hpp
 * @brief Domain entity representing one entry of the news listing.
 */

#pragma once
#include <string>

namespace finnews::domain {

/**
 * @struct Article
 * @brief A discovered listing entry. The link is its identity.
 */
struct Article {
    std::string title;       ///< Headline, stray date suffixes already stripped.
    std::string link;        ///< Absolute URL of the article page.
    std::string displayDate; ///< Free-text time and date as shown by the site (may be empty).
    std::string source;      ///< Fixed source label (e.g. "APA.az").

    /** @brief Two articles are the same entity when their links match. */
    bool sameAs(const Article& other) const { return link == other.link; }
};

} // namespace finnews::domain
