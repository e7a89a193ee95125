/**
 * @file HttpFetcher.hpp
 * @brief PageFetcher implementation over cpp-httplib.
 */

#pragma once
#include <string>
#include "domain/PageFetcher.hpp"

namespace finnews::infrastructure {

/**
 * @class HttpFetcher
 * @brief Implements PageFetcher with a fresh httplib client per request.
 */
class HttpFetcher : public domain::PageFetcher {
public:
    /**
     * @param timeoutSeconds Connection and read timeout.
     * @param userAgent Value of the User-Agent header.
     */
    explicit HttpFetcher(int timeoutSeconds = 25, std::string userAgent = "FinNews/1.0");

    /** @brief GET the URL, following redirects. @see domain::PageFetcher::fetch */
    domain::FetchResult fetch(const std::string& url) override;

    /**
     * @brief Splits an absolute URL into "scheme://host[:port]" and the path with query.
     * @return False if the URL has no scheme or host.
     */
    static bool SplitUrl(const std::string& url, std::string& origin, std::string& pathAndQuery);

private:
    int m_timeoutSeconds;
    std::string m_userAgent;
};

} // namespace finnews::infrastructure
