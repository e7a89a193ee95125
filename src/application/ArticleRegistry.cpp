#include "application/ArticleRegistry.hpp"
#include <algorithm>
#include <unordered_set>
#include <utility>

namespace finnews::application {

bool ArticleRegistry::containsLocked(const std::string& link) const {
    return std::any_of(m_articles.begin(), m_articles.end(),
                       [&link](const domain::Article& a) { return a.link == link; });
}

bool ArticleRegistry::appendIfAbsent(const domain::Article& article) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (containsLocked(article.link)) return false;
    m_articles.push_back(article);
    return true;
}

void ArticleRegistry::replaceAll(const std::vector<domain::Article>& articles) {
    std::vector<domain::Article> unique;
    unique.reserve(articles.size());
    std::unordered_set<std::string> links;
    for (const auto& article : articles) {
        if (links.insert(article.link).second) {
            unique.push_back(article);
        }
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_articles = std::move(unique);
}

bool ArticleRegistry::contains(const std::string& link) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return containsLocked(link);
}

std::optional<domain::Article> ArticleRegistry::at(size_t index) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (index >= m_articles.size()) return std::nullopt;
    return m_articles[index];
}

size_t ArticleRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_articles.size();
}

std::vector<domain::Article> ArticleRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_articles;
}

} // namespace finnews::application
