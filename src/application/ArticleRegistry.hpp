/**
 * @file ArticleRegistry.hpp
 * @brief The set of articles currently shown by the interactive view.
 */

#pragma once
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "domain/Article.hpp"

namespace finnews::application {

/**
 * @class ArticleRegistry
 * @brief Ordered, link-unique article list shared by the poller and the session.
 *
 * Every operation holds one mutex, so compound steps such as "append if the
 * link is absent" cannot interleave with a wholesale replace.
 */
class ArticleRegistry {
public:
    /** @brief Appends unless an article with the same link is already listed. */
    bool appendIfAbsent(const domain::Article& article);

    /**
     * @brief Replaces the whole content. Later duplicates of a link are dropped.
     */
    void replaceAll(const std::vector<domain::Article>& articles);

    bool contains(const std::string& link) const;

    /** @brief Article at a 0-based display position. */
    std::optional<domain::Article> at(size_t index) const;

    size_t size() const;

    /** @brief Thread-safe copy in display order. */
    std::vector<domain::Article> snapshot() const;

private:
    bool containsLocked(const std::string& link) const;

    std::vector<domain::Article> m_articles;
    mutable std::mutex m_mutex;
};

} // namespace finnews::application
