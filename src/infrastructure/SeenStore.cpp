/**
 * @file SeenStore.cpp
 * @brief Implementation of SeenStore.
 */

#include "infrastructure/SeenStore.hpp"
#include "infrastructure/TimeUtils.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace finnews::infrastructure {

SeenStore::SeenStore(std::string path, std::shared_ptr<AtomicFileWriter> writer)
    : m_path(std::move(path)),
      m_writer(writer ? std::move(writer) : std::make_shared<AtomicFileWriter>()) {}

size_t SeenStore::load(domain::TimePoint now, Retention retention) {
    std::map<std::string, domain::SeenRecord> loaded;

    std::error_code ec;
    if (fs::exists(m_path, ec)) {
        try {
            std::ifstream f(m_path);
            if (!f.is_open()) {
                std::cerr << "[SeenStore] Cannot open " << m_path << ", starting empty." << std::endl;
            } else {
                json j = json::parse(f);
                if (j.is_object()) {
                    for (auto it = j.begin(); it != j.end(); ++it) {
                        const json& info = it.value();
                        if (!info.is_object() || !info.contains("timestamp") || !info["timestamp"].is_string()) {
                            continue;
                        }
                        auto ts = TimeUtils::FromIsoString(info["timestamp"].get<std::string>());
                        if (!ts) continue;

                        std::string title;
                        if (info.contains("title") && info["title"].is_string()) {
                            title = info["title"].get<std::string>();
                        }
                        loaded[it.key()] = domain::SeenRecord{title, *ts};
                    }
                } else {
                    std::cerr << "[SeenStore] " << m_path << " is not a JSON object, starting empty." << std::endl;
                }
            }
        } catch (const json::exception& e) {
            std::cerr << "[SeenStore] Ignoring unreadable seen-log: " << e.what() << std::endl;
            loaded.clear();
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_records = std::move(loaded);
    }
    prune(now, retention);
    return size();
}

void SeenStore::prune(domain::TimePoint now, Retention retention) {
    const domain::TimePoint cutoff = now - retention;

    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto it = m_records.begin(); it != m_records.end();) {
        if (it->second.firstSeenAt > cutoff) {
            ++it;
        } else {
            it = m_records.erase(it);
        }
    }
}

bool SeenStore::add(const std::string& link, const std::string& title, domain::TimePoint now) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records.emplace(link, domain::SeenRecord{title, now}).second;
}

bool SeenStore::has(const std::string& link) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records.count(link) > 0;
}

std::optional<domain::SeenRecord> SeenStore::find(const std::string& link) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_records.find(link);
    if (it == m_records.end()) return std::nullopt;
    return it->second;
}

size_t SeenStore::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records.size();
}

std::vector<std::pair<std::string, domain::SeenRecord>> SeenStore::recordsByAge() const {
    std::vector<std::pair<std::string, domain::SeenRecord>> result;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        result.assign(m_records.begin(), m_records.end());
    }
    std::stable_sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
        return a.second.firstSeenAt < b.second.firstSeenAt;
    });
    return result;
}

bool SeenStore::persist() {
    std::lock_guard<std::mutex> persistLock(m_persistMutex);

    json j = json::object();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [link, record] : m_records) {
            j[link] = {
                {"title", record.title},
                {"timestamp", TimeUtils::ToIsoString(record.firstSeenAt)}
            };
        }
    }

    std::string content;
    try {
        content = j.dump(2, ' ', false, json::error_handler_t::replace);
    } catch (const json::exception& e) {
        std::cerr << "[SeenStore] Error serializing seen-log: " << e.what() << std::endl;
        return false;
    }

    if (!m_writer->write(m_path, content)) {
        std::cerr << "[SeenStore] Error saving seen file: " << m_path << std::endl;
        return false;
    }
    return true;
}

} // namespace finnews::infrastructure
