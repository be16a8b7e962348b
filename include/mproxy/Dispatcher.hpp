/**
 * @file Dispatcher.hpp
 * @brief The streaming loop: read, back up, fan out, tee.
 */

#pragma once

#include "BackupManager.hpp"
#include "InputSource.hpp"
#include "InterfaceProvider.hpp"
#include "Target.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace mproxy
{

/**
 * @struct DispatcherOptions
 * @ingroup dispatch
 * @brief Everything one session needs to know.
 */
struct DispatcherOptions
{
    std::string inputPath{StdinPath};       ///< `-` for standard input.
    std::vector<std::string> destinations;  ///< `host:port` strings, in registration order.
    bool tee = false;                       ///< Copy every forwarded chunk to the tee stream.
    std::optional<unsigned int> retentionDays; ///< Enables backup and the retention sweep.
    bool backupAlways = false;              ///< Enables backup without a retention window.
    std::filesystem::path backupDirectory{DefaultBackupDirectory};
    SweepMode sweepMode = SweepMode::PerWrite;
    std::chrono::seconds sweepInterval{0};
    bool haltOnSendError = false; ///< Treat the first send failure as fatal.
    bool verbose = false;
    BackupClock clock; ///< Empty: system clock.

    /// Backup I/O happens only when a retention window is set or backup is explicitly requested.
    [[nodiscard]] bool backupEnabled() const noexcept { return retentionDays.has_value() || backupAlways; }
};

/**
 * @struct DispatchStats
 * @ingroup dispatch
 * @brief Counters of one session.
 */
struct DispatchStats
{
    std::uint64_t chunksRead = 0;      ///< Non-empty reads.
    std::uint64_t chunksSkipped = 0;   ///< Reads discarded by the blank-line rule.
    std::uint64_t chunksProcessed = 0; ///< Reads that went through backup, fan-out and tee.
    std::uint64_t bytesProcessed = 0;
    std::uint64_t chunksForwarded = 0; ///< Processed chunks that at least one target accepted.
    std::uint64_t bytesForwarded = 0;
    std::uint64_t backupFailures = 0;
    std::vector<std::uint64_t> sendFailures; ///< One counter per target, in registration order.

    [[nodiscard]] std::uint64_t totalSendFailures() const noexcept
    {
        std::uint64_t total = 0;
        for (const auto n : sendFailures)
            total += n;
        return total;
    }
};

/**
 * @class Dispatcher
 * @ingroup dispatch
 * @brief Streams one input to every registered Target.
 *
 * setup() binds all destinations through a SocketBinder before any data moves; if one fails,
 * nothing is kept and the exception propagates. run() then loops until a zero-byte read:
 *
 * 1. read at most MaxChunkSize bytes;
 * 2. drop a chunk that is exactly one `'\n'` (no backup, no send, no tee);
 * 3. back up the chunk, if backup is enabled;
 * 4. send it to every Target in registration order;
 * 5. write it to the tee stream and flush, if tee is enabled.
 *
 * Errors go through classify(): send and backup failures are logged, counted in
 * DispatchStats and the loop continues, unless DispatcherOptions::haltOnSendError is set, in
 * which case the SendException propagates. Everything else ends the session.
 *
 * @code
 * const auto provider = mproxy::makePlatformInterfaceProvider();
 * mproxy::DispatcherOptions opts;
 * opts.destinations = {"127.0.0.1:9920", "[ff02::1]:9921"};
 * mproxy::Dispatcher dispatcher(std::move(opts), *provider);
 * dispatcher.setup();
 * const auto stats = dispatcher.run();
 * @endcode
 */
class Dispatcher
{
  public:
    /**
     * @param options    Session configuration.
     * @param interfaces Platform answers for IPv6 multicast; must outlive the dispatcher.
     * @param teeOut     Destination of teed chunks.
     * @param log        Diagnostic stream.
     */
    Dispatcher(DispatcherOptions options, const InterfaceProvider& interfaces, std::ostream& teeOut = std::cout,
               std::ostream& log = std::cerr);

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /**
     * @brief Bind every destination, all or nothing.
     *
     * Each bound target is announced on the log stream as
     * `logging from <path>: sending to <destination>`.
     *
     * @throws AddressResolutionException, BindException, MulticastJoinException
     */
    void setup();

    /**
     * @brief Open DispatcherOptions::inputPath and stream it.
     * @throws ReadException if the input cannot be opened or read.
     */
    DispatchStats run();

    /**
     * @brief Stream @p reader until it returns 0. Calls setup() first if needed.
     */
    DispatchStats run(ChunkReader& reader);

    /// True for a chunk that is exactly one `'\n'` byte.
    [[nodiscard]] static bool isBlankLine(std::span<const std::byte> chunk) noexcept;

    [[nodiscard]] const std::vector<Target>& targets() const noexcept { return _targets; }
    [[nodiscard]] const DispatcherOptions& options() const noexcept { return _options; }
    [[nodiscard]] bool isSetUp() const noexcept { return _isSetUp; }

  private:
    void dispatch(std::span<const std::byte> chunk, DispatchStats& stats);
    void backup(std::span<const std::byte> chunk, DispatchStats& stats);
    void tee(std::span<const std::byte> chunk);
    void report(const ProxyException& ex, std::string_view where, std::uint64_t occurrence) const;

    DispatcherOptions _options;
    const InterfaceProvider& _interfaces;
    std::ostream& _teeOut;
    std::ostream& _log;
    std::vector<Target> _targets;
    std::optional<BackupManager> _backup;
    std::vector<std::byte> _buffer;
    bool _isSetUp = false;
};

} // namespace mproxy
