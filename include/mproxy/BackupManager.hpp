/**
 * @file BackupManager.hpp
 * @brief Date-bucketed append-only backup of forwarded chunks, with retention sweep.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace mproxy
{

/// Wall clock used for file naming and retention; replaceable in tests.
using BackupClock = std::function<std::chrono::system_clock::time_point()>;

/**
 * @brief `YYYY-MM-DD.log` for the UTC calendar date of @p when.
 * @ingroup backup
 */
[[nodiscard]] std::string dailyLogName(std::chrono::system_clock::time_point when);

/**
 * @brief Parse the leading `YYYY-MM-DD` of a backup file name.
 *
 * Only the first 10 characters are considered. Returns `std::nullopt` for names that are
 * shorter, not in that shape, or name a non-existent date (e.g. `2024-02-30`).
 *
 * @ingroup backup
 */
[[nodiscard]] std::optional<std::chrono::sys_days> parseBackupDate(std::string_view fileName);

/**
 * @brief Day-count retention test used by the default policy.
 *
 * A file is expired when it ends in `.log`, its date parses, and the midnight UTC of that
 * date is strictly older than `now - retentionDays * 86400 s`.
 *
 * @ingroup backup
 */
[[nodiscard]] bool isExpiredBackup(std::string_view fileName, std::chrono::system_clock::time_point now,
                                   unsigned int retentionDays);

/**
 * @struct RotationPolicy
 * @ingroup backup
 * @brief Where backups go, how they are named, and when they expire.
 */
struct RotationPolicy
{
    /// Directory holding the backup files; created on demand.
    std::filesystem::path directory;

    /// Maps the current time to the name of the file that receives the chunk.
    std::function<std::string(std::chrono::system_clock::time_point)> fileName;

    /// Decides whether a directory entry is expired. Empty: never sweep.
    std::function<bool(std::string_view, std::chrono::system_clock::time_point)> isExpired;

    /**
     * @brief Default `YYYY-MM-DD.log` policy.
     *
     * @param directory     Backup directory.
     * @param retentionDays Retention window; `std::nullopt` disables the sweep.
     */
    [[nodiscard]] static RotationPolicy daily(std::filesystem::path directory,
                                              std::optional<unsigned int> retentionDays);
};

/**
 * @brief When BackupManager::append() triggers a sweep.
 * @ingroup backup
 */
enum class SweepMode : std::uint8_t
{
    PerWrite, ///< Every append sweeps.
    Interval  ///< An append sweeps only if the last sweep is at least one interval old.
};

/**
 * @class BackupManager
 * @ingroup backup
 * @brief Appends chunks to the current backup file and deletes expired ones.
 *
 * Every append() and sweep() holds the directory's internal::DirectoryLock, so that sessions
 * sharing the directory cannot interleave a sweep with an append.
 *
 * @code
 * mproxy::BackupManager backup(mproxy::RotationPolicy::daily("ais_backup", 7));
 * backup.append(chunk); // ais_backup/2025-06-01.log, then sweep
 * @endcode
 */
class BackupManager
{
  public:
    /**
     * @param policy        Rotation policy.
     * @param mode          Sweep scheduling.
     * @param sweepInterval Minimum time between sweeps in SweepMode::Interval.
     * @param clock         Time source; defaults to `std::chrono::system_clock::now`.
     */
    explicit BackupManager(RotationPolicy policy, SweepMode mode = SweepMode::PerWrite,
                           std::chrono::seconds sweepInterval = std::chrono::seconds{0}, BackupClock clock = {});

    /**
     * @brief Append @p chunk to the current file, then sweep if scheduled.
     *
     * The directory is created if missing, on every call.
     *
     * @throws BackupException if the directory cannot be created or the file cannot be
     *         opened or written. Sweep failures are never reported.
     */
    void append(std::span<const std::byte> chunk);

    /**
     * @brief Delete every expired file in the backup directory.
     *
     * Entries the policy cannot interpret and failed deletions are skipped silently.
     * A missing directory is not an error.
     *
     * @return Number of files removed.
     */
    std::size_t sweep();

    /// Path the next append() would write to.
    [[nodiscard]] std::filesystem::path currentFile() const;

    [[nodiscard]] SweepMode sweepMode() const noexcept { return _mode; }

  private:
    void ensureDirectory() const;
    std::size_t sweepLocked(std::chrono::system_clock::time_point now);
    [[nodiscard]] bool sweepDue(std::chrono::system_clock::time_point now) const;

    RotationPolicy _policy;
    SweepMode _mode;
    std::chrono::seconds _sweepInterval;
    BackupClock _clock;
    std::optional<std::chrono::system_clock::time_point> _lastSweep;
};

} // namespace mproxy
