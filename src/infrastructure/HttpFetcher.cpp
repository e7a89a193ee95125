#include "infrastructure/HttpFetcher.hpp"
#include <httplib.h>
#include <utility>

namespace finnews::infrastructure {

HttpFetcher::HttpFetcher(int timeoutSeconds, std::string userAgent)
    : m_timeoutSeconds(timeoutSeconds), m_userAgent(std::move(userAgent)) {}

bool HttpFetcher::SplitUrl(const std::string& url, std::string& origin, std::string& pathAndQuery) {
    size_t protocolPos = url.find("://");
    if (protocolPos == std::string::npos || protocolPos == 0) return false;

    size_t hostStart = protocolPos + 3;
    size_t pathPos = url.find_first_of("/?#", hostStart);
    if (pathPos == hostStart) return false;

    if (pathPos == std::string::npos) {
        origin = url;
        pathAndQuery = "/";
    } else {
        origin = url.substr(0, pathPos);
        pathAndQuery = url.substr(pathPos);
        size_t fragment = pathAndQuery.find('#');
        if (fragment != std::string::npos) pathAndQuery.erase(fragment);
        if (pathAndQuery.empty() || pathAndQuery[0] != '/') pathAndQuery.insert(0, "/");
    }
    return true;
}

domain::FetchResult HttpFetcher::fetch(const std::string& url) {
    std::string origin;
    std::string path;
    if (!SplitUrl(url, origin, path)) {
        return domain::FetchResult::Failure("malformed URL");
    }

    httplib::Client cli(origin);
    if (!cli.is_valid()) {
        return domain::FetchResult::Failure("unsupported URL scheme");
    }
    cli.set_connection_timeout(m_timeoutSeconds, 0);
    cli.set_read_timeout(m_timeoutSeconds, 0);
    cli.set_follow_location(true);

    httplib::Headers headers = {{"User-Agent", m_userAgent}};
    auto res = cli.Get(path, headers);
    if (!res) {
        return domain::FetchResult::Failure("connection failed (error " + std::to_string(static_cast<int>(res.error())) + ")");
    }
    if (res->status != 200) {
        return domain::FetchResult::Failure("HTTP " + std::to_string(res->status));
    }
    return domain::FetchResult::Ok(std::move(res->body));
}

} // namespace finnews::infrastructure
