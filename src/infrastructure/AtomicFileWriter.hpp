/**
 * @file AtomicFileWriter.hpp
 * @brief Whole-file writes that never leave a half-written target behind.
 */

#pragma once
#include <mutex>
#include <string>

namespace finnews::infrastructure {

/**
 * @class AtomicFileWriter
 * @brief Writes content to a temp sibling and renames it over the target.
 *
 * Writes through one instance are serialized. If any step fails the
 * previous file content stays untouched.
 */
class AtomicFileWriter {
public:
    /**
     * @brief Replaces the file content.
     * @param filename Target path. Missing parent directories are created.
     * @param content Full new content.
     * @return True if the rename succeeded.
     */
    bool write(const std::string& filename, const std::string& content);

private:
    std::mutex m_mutex;
};

} // namespace finnews::infrastructure
