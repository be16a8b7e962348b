#include "mproxy/CommandLine.hpp"

#include <charconv>
#include <limits>
#include <sstream>

using namespace mproxy;

namespace
{

template <typename T> T parseNumber(const std::string_view option, const std::string_view text, const T min)
{
    T value{};
    const char* b = text.data();
    const char* e = b + text.size();
    if (auto [ptr, ec] = std::from_chars(b, e, value); ec != std::errc{} || ptr != e || value < min)
        throw UsageException("invalid value '" + std::string(text) + "' for " + std::string(option));
    return value;
}

} // namespace

CommandLine mproxy::parseCommandLine(const int argc, const char* const argv[])
{
    CommandLine cmd;

    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];
        std::optional<std::string_view> inlineValue;

        if (arg.starts_with("--"))
        {
            if (const auto eq = arg.find('='); eq != std::string_view::npos)
            {
                inlineValue = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
            }
        }

        auto value = [&]() -> std::string_view
        {
            if (inlineValue)
                return *inlineValue;
            if (i + 1 >= argc)
                throw UsageException("missing value for " + std::string(arg));
            return argv[++i];
        };

        auto noValue = [&]
        {
            if (inlineValue)
                throw UsageException(std::string(arg) + " does not take a value");
        };

        if (arg == "-h" || arg == "--help")
        {
            noValue();
            cmd.help = true;
        }
        else if (arg == "-t" || arg == "--tee")
        {
            noValue();
            cmd.options.tee = true;
        }
        else if (arg == "-v" || arg == "--verbose")
        {
            noValue();
            cmd.options.verbose = true;
        }
        else if (arg == "--backup")
        {
            noValue();
            cmd.options.backupAlways = true;
        }
        else if (arg == "--halt-on-send-error")
        {
            noValue();
            cmd.options.haltOnSendError = true;
        }
        else if (arg == "--path")
        {
            cmd.options.inputPath = std::string(value());
            if (cmd.options.inputPath.empty())
                throw UsageException("--path must not be empty");
        }
        else if (arg == "--server-addr")
        {
            cmd.options.destinations.emplace_back(value());
        }
        else if (arg == "--backup-interval")
        {
            cmd.options.retentionDays = parseNumber<unsigned int>(arg, value(), 1U);
        }
        else if (arg == "--backup-dir")
        {
            cmd.options.backupDirectory = std::string(value());
            if (cmd.options.backupDirectory.empty())
                throw UsageException("--backup-dir must not be empty");
        }
        else if (arg == "--sweep-interval")
        {
            cmd.options.sweepMode = SweepMode::Interval;
            cmd.options.sweepInterval = std::chrono::seconds{parseNumber<long long>(arg, value(), 1LL)};
        }
        else if (arg == "--ipv6-interface")
        {
            cmd.ipv6Interface = parseNumber<unsigned int>(arg, value(), 0U);
        }
        else if (arg == "--ipv6-connect")
        {
            const std::string_view mode = value();
            if (mode == "group")
                cmd.ipv6Connect = Ipv6ConnectMode::FullTarget;
            else if (mode == "unspecified")
                cmd.ipv6Connect = Ipv6ConnectMode::UnspecifiedAtTargetPort;
            else
                throw UsageException("invalid value '" + std::string(mode) + "' for --ipv6-connect");
        }
        else
        {
            throw UsageException("unknown argument '" + std::string(argv[i]) + "'");
        }
    }

    if (!cmd.help && cmd.options.destinations.empty())
        throw UsageException("at least one --server-addr is required");

    return cmd;
}

std::string mproxy::usage(const std::string_view program)
{
    std::ostringstream oss;
    oss << "Stream local data to logging servers via UDP\n\n"
        << "Usage: " << program << " [FLAGS] [OPTIONS]\n\n"
        << "Flags:\n"
        << "  -t, --tee                  copy input to stdout\n"
        << "      --backup               back up chunks without a retention sweep\n"
        << "      --halt-on-send-error   stop the session at the first send failure\n"
        << "  -v, --verbose              log end-of-stream and every per-chunk failure\n"
        << "  -h, --help                 print this help\n\n"
        << "Options:\n"
        << "      --path <FILE|->            input path, \"-\" for stdin (default \"-\")\n"
        << "      --server-addr <HOST:PORT>  downstream UDP target, repeatable, at least one\n"
        << "      --backup-interval <DAYS>   back up chunks and delete files older than DAYS\n"
        << "      --backup-dir <DIR>         backup directory (default ./" << DefaultBackupDirectory << ")\n"
        << "      --sweep-interval <SECS>    sweep at most once per SECS instead of on every write\n"
        << "      --ipv6-interface <INDEX>   interface index for IPv6 multicast joins\n"
        << "      --ipv6-connect <MODE>      IPv6 multicast peer: \"group\" (default) or \"unspecified\"\n\n"
        << "Example:\n"
        << "  " << program << " --path - --server-addr '224.0.0.1:9922' --server-addr '[ff02::1]:9923' --tee\n";
    return oss.str();
}
