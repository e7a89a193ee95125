/**
 * @file SeenStore.hpp
 * @brief Durable record of links observed by previous crawls.
 */

#pragma once
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "domain/SeenRecord.hpp"
#include "infrastructure/AtomicFileWriter.hpp"

namespace finnews::infrastructure {

/**
 * @class SeenStore
 * @brief Thread-safe map of link -> SeenRecord backed by a JSON file.
 *
 * The backing file is a JSON object keyed by link, each value being
 * {"title": ..., "timestamp": ISO-8601}. It is rewritten in full on every persist.
 */
class SeenStore {
public:
    using Retention = std::chrono::hours;

    explicit SeenStore(std::string path, std::shared_ptr<AtomicFileWriter> writer = nullptr);

    /**
     * @brief Replaces the in-memory content with the backing file, then prunes.
     *
     * A missing or malformed file leaves the store empty. Entries without a
     * parsable timestamp are dropped.
     * @return Number of records that survived.
     */
    size_t load(domain::TimePoint now, Retention retention);

    /** @brief Drops every record not strictly newer than now - retention. */
    void prune(domain::TimePoint now, Retention retention);

    /**
     * @brief Records a link the first time it is seen.
     * @return True if the link was new. An existing record keeps its first snapshot.
     */
    bool add(const std::string& link, const std::string& title, domain::TimePoint now);

    bool has(const std::string& link) const;

    std::optional<domain::SeenRecord> find(const std::string& link) const;

    size_t size() const;

    /** @brief Snapshot of all records, oldest first. */
    std::vector<std::pair<std::string, domain::SeenRecord>> recordsByAge() const;

    /**
     * @brief Writes the whole store to the backing file.
     * @return False if the write failed; the previous file is left intact.
     */
    bool persist();

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
    std::shared_ptr<AtomicFileWriter> m_writer;
    std::map<std::string, domain::SeenRecord> m_records;
    mutable std::mutex m_mutex;
    std::mutex m_persistMutex; ///< Serializes snapshot+write so files land in order.
};

} // namespace finnews::infrastructure
