#include "mproxy/BackupManager.hpp"
#include "mproxy/Exceptions.hpp"
#include "mproxy/internal/DirectoryLock.hpp"

#include <cerrno>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>

using namespace mproxy;
using namespace std::chrono;

namespace
{

bool isDigits(const std::string_view s) noexcept
{
    for (const char c : s)
    {
        if (c < '0' || c > '9')
            return false;
    }
    return !s.empty();
}

int toInt(const std::string_view s) noexcept
{
    int value = 0;
    for (const char c : s)
        value = value * 10 + (c - '0');
    return value;
}

} // namespace

std::string mproxy::dailyLogName(const system_clock::time_point when)
{
    const year_month_day ymd{floor<days>(when)};

    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << '-' << std::setw(2)
        << static_cast<unsigned>(ymd.month()) << '-' << std::setw(2) << static_cast<unsigned>(ymd.day()) << ".log";
    return oss.str();
}

std::optional<sys_days> mproxy::parseBackupDate(const std::string_view fileName)
{
    if (fileName.size() < 10)
        return std::nullopt;

    const std::string_view date = fileName.substr(0, 10);
    if (date[4] != '-' || date[7] != '-')
        return std::nullopt;

    const auto y = date.substr(0, 4);
    const auto m = date.substr(5, 2);
    const auto d = date.substr(8, 2);
    if (!isDigits(y) || !isDigits(m) || !isDigits(d))
        return std::nullopt;

    const year_month_day ymd{year{toInt(y)}, month{static_cast<unsigned>(toInt(m))},
                             day{static_cast<unsigned>(toInt(d))}};
    if (!ymd.ok())
        return std::nullopt;

    return sys_days{ymd};
}

bool mproxy::isExpiredBackup(const std::string_view fileName, const system_clock::time_point now,
                             const unsigned int retentionDays)
{
    if (!fileName.ends_with(".log"))
        return false;

    const auto date = parseBackupDate(fileName);
    if (!date)
        return false;

    const auto cutoff = now - seconds{86400LL * retentionDays};
    return *date < cutoff;
}

RotationPolicy RotationPolicy::daily(std::filesystem::path directory, const std::optional<unsigned int> retentionDays)
{
    RotationPolicy policy;
    policy.directory = std::move(directory);
    policy.fileName = [](const system_clock::time_point when) { return dailyLogName(when); };
    if (retentionDays)
    {
        policy.isExpired = [window = *retentionDays](const std::string_view name, const system_clock::time_point now)
        { return isExpiredBackup(name, now, window); };
    }
    return policy;
}

BackupManager::BackupManager(RotationPolicy policy, const SweepMode mode, const seconds sweepInterval,
                             BackupClock clock)
    : _policy(std::move(policy)), _mode(mode), _sweepInterval(sweepInterval), _clock(std::move(clock))
{
    if (!_clock)
        _clock = [] { return system_clock::now(); };
    if (!_policy.fileName)
        _policy.fileName = [](const system_clock::time_point when) { return dailyLogName(when); };
}

std::filesystem::path BackupManager::currentFile() const
{
    return _policy.directory / _policy.fileName(_clock());
}

void BackupManager::ensureDirectory() const
{
    std::error_code ec;
    std::filesystem::create_directories(_policy.directory, ec);
    if (!ec && !std::filesystem::is_directory(_policy.directory, ec))
        ec = std::make_error_code(std::errc::not_a_directory);
    if (ec)
        throw BackupException(ec.value(), "Cannot create backup directory " + _policy.directory.string());
}

void BackupManager::append(const std::span<const std::byte> chunk)
{
    const auto now = _clock();
    ensureDirectory();

    const internal::DirectoryLock lock(_policy.directory);

    const std::filesystem::path path = _policy.directory / _policy.fileName(now);
    {
        // std::ofstream may leave errno untouched: the reported code is best-effort, 0 if unknown.
        errno = 0;
        std::ofstream out(path, std::ios::binary | std::ios::app);
        if (!out)
        {
            const int error = errno;
            throw BackupException(error, "Cannot open backup file " + path.string());
        }

        errno = 0;
        out.write(reinterpret_cast<const char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
        out.flush();
        if (!out)
        {
            const int error = errno;
            throw BackupException(error, "Cannot write backup file " + path.string());
        }
    }

    if (_policy.isExpired && sweepDue(now))
        sweepLocked(now);
}

std::size_t BackupManager::sweep()
{
    std::error_code ec;
    if (!std::filesystem::is_directory(_policy.directory, ec))
        return 0;

    const internal::DirectoryLock lock(_policy.directory);
    return sweepLocked(_clock());
}

bool BackupManager::sweepDue(const system_clock::time_point now) const
{
    if (_mode == SweepMode::PerWrite || !_lastSweep)
        return true;
    return now - *_lastSweep >= _sweepInterval;
}

std::size_t BackupManager::sweepLocked(const system_clock::time_point now)
{
    _lastSweep = now;
    if (!_policy.isExpired)
        return 0;

    std::size_t removed = 0;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(_policy.directory, ec), end; !ec && it != end; it.increment(ec))
    {
        std::error_code entryEc;
        if (!it->is_regular_file(entryEc))
            continue;

        if (!_policy.isExpired(it->path().filename().string(), now))
            continue;

        if (std::filesystem::remove(it->path(), entryEc))
            ++removed;
    }
    return removed;
}
