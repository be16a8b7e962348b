#include "mproxy/Dispatcher.hpp"
#include "mproxy/ErrorPolicy.hpp"
#include "mproxy/SocketBinder.hpp"

#include <utility>

using namespace mproxy;

Dispatcher::Dispatcher(DispatcherOptions options, const InterfaceProvider& interfaces, std::ostream& teeOut,
                       std::ostream& log)
    : _options(std::move(options)), _interfaces(interfaces), _teeOut(teeOut), _log(log), _buffer(MaxChunkSize)
{
    if (_options.backupEnabled())
    {
        _backup.emplace(RotationPolicy::daily(_options.backupDirectory, _options.retentionDays), _options.sweepMode,
                        _options.sweepInterval, _options.clock);
    }
}

void Dispatcher::setup()
{
    const SocketBinder binder(_interfaces);

    std::vector<Target> targets;
    targets.reserve(_options.destinations.size());
    for (const auto& destination : _options.destinations)
    {
        targets.push_back(binder.bind(destination));
        _log << "mproxy: logging from " << _options.inputPath << ": sending to " << destination << std::endl;
    }

    _targets = std::move(targets);
    _isSetUp = true;
}

DispatchStats Dispatcher::run()
{
    if (!_isSetUp)
        setup();

    InputSource input(_options.inputPath);
    return run(input);
}

DispatchStats Dispatcher::run(ChunkReader& reader)
{
    if (!_isSetUp)
        setup();

    DispatchStats stats;
    stats.sendFailures.assign(_targets.size(), 0);

    while (true)
    {
        const std::size_t n = reader.read(_buffer);
        if (n == 0)
        {
            if (_options.verbose)
                _log << "mproxy: encountered EOF in " << _options.inputPath << ", exiting..." << std::endl;
            break;
        }

        ++stats.chunksRead;
        const std::span<const std::byte> chunk(_buffer.data(), n);

        if (isBlankLine(chunk))
        {
            ++stats.chunksSkipped;
            continue;
        }

        dispatch(chunk, stats);
    }

    return stats;
}

bool Dispatcher::isBlankLine(const std::span<const std::byte> chunk) noexcept
{
    return chunk.size() == 1 && chunk[0] == std::byte{'\n'};
}

void Dispatcher::dispatch(const std::span<const std::byte> chunk, DispatchStats& stats)
{
    if (_backup)
        backup(chunk, stats);

    bool delivered = false;
    for (std::size_t i = 0; i < _targets.size(); ++i)
    {
        try
        {
            _targets[i].send(chunk);
            delivered = true;
        }
        catch (const SendException& ex)
        {
            if (_options.haltOnSendError || classify(ex.kind()) == Severity::SessionFatal)
                throw;
            report(ex, _targets[i].destination(), ++stats.sendFailures[i]);
        }
    }

    if (_options.tee)
        tee(chunk);

    ++stats.chunksProcessed;
    stats.bytesProcessed += chunk.size();
    if (delivered)
    {
        ++stats.chunksForwarded;
        stats.bytesForwarded += chunk.size();
    }
}

void Dispatcher::backup(const std::span<const std::byte> chunk, DispatchStats& stats)
{
    try
    {
        _backup->append(chunk);
    }
    catch (const BackupException& ex)
    {
        if (classify(ex.kind()) == Severity::SessionFatal)
            throw;
        report(ex, "backup", ++stats.backupFailures);
    }
}

void Dispatcher::tee(const std::span<const std::byte> chunk)
{
    _teeOut.write(reinterpret_cast<const char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
    _teeOut.flush();
    if (!_teeOut)
        throw TeeException("Failed to write " + std::to_string(chunk.size()) + " bytes to the tee stream");
}

void Dispatcher::report(const ProxyException& ex, const std::string_view where, const std::uint64_t occurrence) const
{
    // The first failure of each kind is always shown; repeats only in verbose mode.
    if (occurrence > 1 && !_options.verbose)
        return;

    _log << "mproxy: " << toString(ex.kind()) << " error (" << where << "): " << ex.what();
    if (occurrence == 1 && !_options.verbose)
        _log << " (further failures are counted silently)";
    _log << std::endl;
}
