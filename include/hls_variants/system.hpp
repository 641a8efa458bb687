/**
 * @file system.hpp
 * @brief System utilities: CPU detection and file helpers
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Directory creation and whole-file reads
 *
 *          - Atomic file publication (write temporary, fsync, rename)
 *
 *          - Time formatting utilities
 */

#ifndef HLS_VARIANTS_SYSTEM_HPP
#define HLS_VARIANTS_SYSTEM_HPP

#include <string>

namespace hls_variants {

// **---- CPU Detection ----**

/**
 * @brief Detect the actual number of CPUs available to this process.
 *
 * @note In Docker containers, std::thread::hardware_concurrency() returns the
 *       HOST's total cores, not the container's cgroup limit. This function
 *       reads `/sys/fs/cgroup/cpu.max` (cgroup v2) first.
 *
 * @return Detected CPU limit, or hardware_concurrency() as fallback
 */
int detect_cpu_limit();

// **---- File Utilities ----**

/**
 * @brief Create a directory and its parents if missing.
 * @param path Directory to create
 * @param error Output: message when creation fails
 * @return true if the directory exists afterwards
 */
bool ensure_directory(const std::string &path, std::string &error);

/**
 * @brief Read a whole file into memory.
 * @param path File to read
 * @param content Output: file contents
 * @param error Output: message when the read fails
 * @return true on success
 */
bool read_text_file(const std::string &path, std::string &content,
                    std::string &error);

/**
 * @brief Publish a file so readers never observe it half-written.
 *
 * @note Writes `path + ".tmp"` in the same directory, fsyncs it, then renames
 *       it over `path`. rename(2) within one filesystem is atomic, so `path`
 *       either does not exist or holds the complete content.
 *
 * @return true on success; on failure the temporary file is removed
 */
bool write_file_atomic(const std::string &path, const std::string &content,
                       std::string &error);

/**
 * @brief Flush an already-complete file to disk and rename it over `to`.
 * @note Used for files written by another process, which cannot be fsynced
 *       through write_file_atomic().
 * @return true on success; on failure `from` is left in place
 */
bool publish_file(const std::string &from, const std::string &to,
                  std::string &error);

/**
 * @brief Remove a file if present.
 * @return false only when the file exists and could not be removed
 */
bool remove_if_exists(const std::string &path, std::string &error);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

} // namespace hls_variants

#endif // HLS_VARIANTS_SYSTEM_HPP
