/**
 * @file PageFetcher.hpp
 * @brief Interface for retrieving raw page content over the network.
 */

#pragma once
#include <string>
#include <utility>

namespace finnews::domain {

/**
 * @struct FetchResult
 * @brief Outcome of a single fetch. Either content or an error description.
 */
struct FetchResult {
    std::string content;
    bool success = false;
    std::string error; ///< Human readable reason when success is false.

    static FetchResult Ok(std::string body) {
        FetchResult r;
        r.content = std::move(body);
        r.success = true;
        return r;
    }

    static FetchResult Failure(std::string reason) {
        FetchResult r;
        r.error = std::move(reason);
        return r;
    }
};

/**
 * @class PageFetcher
 * @brief Abstract interface for services that download a page by URL.
 *
 * Implementations never throw; transport problems are reported through FetchResult.
 */
class PageFetcher {
public:
    virtual ~PageFetcher() = default;

    /**
     * @brief Downloads the page at the given URL.
     * @param url Absolute http(s) URL.
     */
    virtual FetchResult fetch(const std::string& url) = 0;
};

} // namespace finnews::domain
