/**
 * @file DirectoryLock.hpp
 * @brief RAII guard serialising access to a backup directory.
 */

#pragma once

#include <filesystem>
#include <memory>
#include <mutex>

namespace mproxy::internal
{

/**
 * @class DirectoryLock
 * @brief RAII helper holding exclusive access to a directory for the duration of a scope.
 *
 * On construction the lock is acquired in two layers:
 * - an in-process mutex shared by every DirectoryLock on the same (absolute, normalised) path,
 *   so threads of one process exclude each other;
 * - on POSIX, an advisory `flock(LOCK_EX)` on `<dir>/.mproxy.lock`, so separate processes
 *   sharing the directory exclude each other too.
 *
 * Both are released on destruction, in reverse order. The directory must already exist.
 *
 * ### Example
 * @code
 * {
 *     mproxy::internal::DirectoryLock guard("ais_backup");
 *     // append or sweep
 * } // released
 * @endcode
 *
 * @ingroup internal
 */
class DirectoryLock
{
  public:
    /// Name of the lock file created inside the locked directory.
    static constexpr const char* LockFileName = ".mproxy.lock";

    /**
     * @brief Block until the directory is exclusively held.
     *
     * @param directory Directory to lock.
     * @throws BackupException if the lock file cannot be opened or locked.
     */
    explicit DirectoryLock(const std::filesystem::path& directory);

    /**
     * @brief Release the file lock and the in-process mutex.
     *
     * @note Errors while unlocking are ignored; closing the descriptor drops the lock anyway.
     */
    ~DirectoryLock();

    DirectoryLock(const DirectoryLock&) = delete;
    DirectoryLock& operator=(const DirectoryLock&) = delete;
    DirectoryLock(DirectoryLock&&) = delete;
    DirectoryLock& operator=(DirectoryLock&&) = delete;

  private:
    std::shared_ptr<std::mutex> _mutex; ///< Registry entry for this directory; kept alive while held.
    std::unique_lock<std::mutex> _guard;
    int _fd = -1; ///< Lock file descriptor (POSIX only).
};

} // namespace mproxy::internal
