// GoogleTest unit tests for BackupManager, the daily rotation policy and DirectoryLock
#include "TestSupport.hpp"

#include "mproxy/BackupManager.hpp"
#include "mproxy/Exceptions.hpp"
#include "mproxy/internal/DirectoryLock.hpp"

#include <cerrno>
#include <gtest/gtest.h>
#include <thread>

using namespace mproxy;
using namespace mproxy::test;
using namespace std::chrono;

namespace
{

void touch(const std::filesystem::path& p)
{
    std::ofstream(p, std::ios::binary) << "old";
}

} // namespace

TEST(BackupNamingTest, DailyLogNameIsUtcDate)
{
    EXPECT_EQ(dailyLogName(fixedNoon()), "2024-06-15.log");
    EXPECT_EQ(dailyLogName(sys_days{year{2024} / June / 15}), "2024-06-15.log");
    EXPECT_EQ(dailyLogName(sys_days{year{2024} / June / 16} - seconds{1}), "2024-06-15.log");
    EXPECT_EQ(dailyLogName(sys_days{year{2025} / January / 3}), "2025-01-03.log");
}

TEST(BackupNamingTest, ParseBackupDate)
{
    EXPECT_EQ(parseBackupDate("2024-06-15.log"), sys_days{year{2024} / June / 15});
    EXPECT_EQ(parseBackupDate("2024-06-15"), sys_days{year{2024} / June / 15});
    EXPECT_EQ(parseBackupDate("2024-02-29.log"), sys_days{year{2024} / February / 29});

    EXPECT_FALSE(parseBackupDate("2023-02-29.log"));
    EXPECT_FALSE(parseBackupDate("2024-02-30.log"));
    EXPECT_FALSE(parseBackupDate("2024-13-01.log"));
    EXPECT_FALSE(parseBackupDate("2024-6-15.log"));
    EXPECT_FALSE(parseBackupDate("abcd-ef-gh.log"));
    EXPECT_FALSE(parseBackupDate("x.log"));
    EXPECT_FALSE(parseBackupDate(""));
}

TEST(BackupNamingTest, RetentionCutoff)
{
    // now = 2024-06-15 12:00 UTC, 7 days: cutoff is 2024-06-08 12:00 UTC.
    EXPECT_TRUE(isExpiredBackup("2024-06-01.log", fixedNoon(), 7));
    EXPECT_TRUE(isExpiredBackup("2024-06-08.log", fixedNoon(), 7));
    EXPECT_FALSE(isExpiredBackup("2024-06-09.log", fixedNoon(), 7));
    EXPECT_FALSE(isExpiredBackup("2024-06-15.log", fixedNoon(), 7));

    EXPECT_FALSE(isExpiredBackup("2024-06-01.txt", fixedNoon(), 7));
    EXPECT_FALSE(isExpiredBackup("bad.log", fixedNoon(), 7));
}

TEST(BackupManagerTest, AppendCreatesDirectoryAndFile)
{
    const TempDir tmp;
    const auto dir = tmp.path() / "nested" / "ais_backup";

    BackupManager backup(RotationPolicy::daily(dir, std::nullopt), SweepMode::PerWrite, seconds{0},
                         [] { return fixedNoon(); });

    EXPECT_EQ(backup.currentFile(), dir / "2024-06-15.log");
    backup.append(bytes("a"));
    backup.append(bytes("b\n"));
    backup.append(bytes("c"));

    EXPECT_EQ(readFile(dir / "2024-06-15.log"), "ab\nc");
}

TEST(BackupManagerTest, AppendRollsOverAtUtcMidnight)
{
    const TempDir tmp;
    system_clock::time_point now = sys_days{year{2024} / June / 16} - seconds{1};

    BackupManager backup(RotationPolicy::daily(tmp.path(), std::nullopt), SweepMode::PerWrite, seconds{0},
                         [&now] { return now; });

    backup.append(bytes("late"));
    now += seconds{2};
    backup.append(bytes("early"));

    EXPECT_EQ(readFile(tmp.path() / "2024-06-15.log"), "late");
    EXPECT_EQ(readFile(tmp.path() / "2024-06-16.log"), "early");
}

TEST(BackupManagerTest, SweepRemovesOnlyExpiredLogs)
{
    const TempDir tmp;
    for (const char* name : {"2024-06-01.log", "2024-06-08.log", "2024-06-09.log", "notes.txt", "bad.log",
                             "2024-13-01.log", "2024-06-01.log.gz"})
        touch(tmp.path() / name);

    BackupManager backup(RotationPolicy::daily(tmp.path(), 7), SweepMode::PerWrite, seconds{0},
                         [] { return fixedNoon(); });
    backup.append(bytes("today"));

    namespace fs = std::filesystem;
    EXPECT_FALSE(fs::exists(tmp.path() / "2024-06-01.log"));
    EXPECT_FALSE(fs::exists(tmp.path() / "2024-06-08.log"));
    EXPECT_TRUE(fs::exists(tmp.path() / "2024-06-09.log"));
    EXPECT_TRUE(fs::exists(tmp.path() / "2024-06-15.log"));
    EXPECT_TRUE(fs::exists(tmp.path() / "notes.txt"));
    EXPECT_TRUE(fs::exists(tmp.path() / "bad.log"));
    EXPECT_TRUE(fs::exists(tmp.path() / "2024-13-01.log"));
    EXPECT_TRUE(fs::exists(tmp.path() / "2024-06-01.log.gz"));
}

TEST(BackupManagerTest, NoRetentionNeverSweeps)
{
    const TempDir tmp;
    touch(tmp.path() / "2000-01-01.log");

    BackupManager backup(RotationPolicy::daily(tmp.path(), std::nullopt), SweepMode::PerWrite, seconds{0},
                         [] { return fixedNoon(); });
    backup.append(bytes("x"));

    EXPECT_EQ(backup.sweep(), 0U);
    EXPECT_TRUE(std::filesystem::exists(tmp.path() / "2000-01-01.log"));
}

TEST(BackupManagerTest, PublicSweep)
{
    const TempDir tmp;
    touch(tmp.path() / "2024-05-01.log");
    touch(tmp.path() / "2024-05-02.log");
    touch(tmp.path() / "2024-06-14.log");

    BackupManager backup(RotationPolicy::daily(tmp.path(), 3), SweepMode::Interval, hours{24},
                         [] { return fixedNoon(); });
    EXPECT_EQ(backup.sweep(), 2U);
    EXPECT_EQ(backup.sweep(), 0U);
    EXPECT_TRUE(std::filesystem::exists(tmp.path() / "2024-06-14.log"));

    BackupManager missing(RotationPolicy::daily(tmp.path() / "absent", 3));
    EXPECT_EQ(missing.sweep(), 0U);
    EXPECT_FALSE(std::filesystem::exists(tmp.path() / "absent"));
}

TEST(BackupManagerTest, IntervalModeThrottlesSweeps)
{
    const TempDir tmp;
    system_clock::time_point now = fixedNoon();

    BackupManager backup(RotationPolicy::daily(tmp.path(), 1), SweepMode::Interval, hours{1},
                         [&now] { return now; });
    EXPECT_EQ(backup.sweepMode(), SweepMode::Interval);

    backup.append(bytes("first")); // sweeps: no previous sweep
    touch(tmp.path() / "2024-06-01.log");

    now += minutes{10};
    backup.append(bytes("second")); // within the interval
    EXPECT_TRUE(std::filesystem::exists(tmp.path() / "2024-06-01.log"));

    now += minutes{50};
    backup.append(bytes("third")); // one interval after the first sweep
    EXPECT_FALSE(std::filesystem::exists(tmp.path() / "2024-06-01.log"));

    EXPECT_EQ(readFile(tmp.path() / "2024-06-15.log"), "firstsecondthird");
}

TEST(BackupManagerTest, DirectoryIsARegularFile)
{
    const TempDir tmp;
    const auto notADir = tmp.path() / "occupied";
    touch(notADir);

    BackupManager backup(RotationPolicy::daily(notADir, 7));
    try
    {
        backup.append(bytes("data"));
        FAIL() << "expected BackupException";
    }
    catch (const BackupException& ex)
    {
        EXPECT_EQ(ex.kind(), ErrorKind::BackupIO);
        EXPECT_EQ(ex.severity(), Severity::Recoverable);
    }
}

TEST(BackupManagerTest, OpenFailureReportsFreshErrorCode)
{
    const TempDir tmp;
    std::filesystem::create_directories(tmp.path() / "2024-06-15.log");

    BackupManager backup(RotationPolicy::daily(tmp.path(), std::nullopt), SweepMode::PerWrite, seconds{0},
                         [] { return fixedNoon(); });

    errno = EINTR;
    try
    {
        backup.append(bytes("data"));
        FAIL() << "expected BackupException";
    }
    catch (const BackupException& ex)
    {
        EXPECT_NE(std::string(ex.what()).find("Cannot open backup file"), std::string::npos);
        EXPECT_NE(ex.getErrorCode(), EINTR);
    }
}

TEST(BackupManagerTest, ConcurrentAppendsDoNotInterleave)
{
    const TempDir tmp;
    constexpr int Writes = 200;
    constexpr std::size_t ChunkLen = 512;

    auto writer = [&tmp](const char fill)
    {
        BackupManager backup(RotationPolicy::daily(tmp.path(), 30), SweepMode::PerWrite, seconds{0},
                             [] { return fixedNoon(); });
        const std::string chunk(ChunkLen, fill);
        for (int i = 0; i < Writes; ++i)
            backup.append(bytes(chunk));
    };

    std::thread a(writer, 'a');
    std::thread b(writer, 'b');
    a.join();
    b.join();

    const std::string content = readFile(tmp.path() / "2024-06-15.log");
    ASSERT_EQ(content.size(), 2 * Writes * ChunkLen);
    for (std::size_t off = 0; off < content.size(); off += ChunkLen)
    {
        const std::string block = content.substr(off, ChunkLen);
        EXPECT_EQ(block, std::string(ChunkLen, block.front())) << "torn chunk at offset " << off;
    }
    EXPECT_TRUE(std::filesystem::exists(tmp.path() / internal::DirectoryLock::LockFileName));
}
