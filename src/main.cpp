#include "mproxy/CommandLine.hpp"
#include "mproxy/Dispatcher.hpp"
#include "mproxy/SocketInitializer.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>

#ifdef _WIN32
#include <fcntl.h>
#include <io.h>
#endif

using namespace mproxy;

namespace
{
constexpr int ExitFatal = 1;
constexpr int ExitUsage = 2;
} // namespace

int main(const int argc, char* argv[])
{
    const std::string_view program = argc > 0 ? argv[0] : "mproxy-client";

    CommandLine cmd;
    try
    {
        cmd = parseCommandLine(argc, argv);
    }
    catch (const UsageException& ex)
    {
        std::cerr << "mproxy: " << ex.what() << "\n\n" << usage(program);
        return ExitUsage;
    }

    if (cmd.help)
    {
        std::cout << usage(program);
        return EXIT_SUCCESS;
    }

#ifdef _WIN32
    // Chunks are raw bytes; keep the CRT from translating line endings.
    _setmode(_fileno(stdin), _O_BINARY);
    _setmode(_fileno(stdout), _O_BINARY);
#endif

    try
    {
        SocketInitializer sockInit;

        std::unique_ptr<InterfaceProvider> interfaces = makePlatformInterfaceProvider();
        if (cmd.ipv6Interface || cmd.ipv6Connect)
        {
            const unsigned int ifindex = cmd.ipv6Interface ? *cmd.ipv6Interface : interfaces->ipv6MulticastInterface();
            const Ipv6ConnectMode mode = cmd.ipv6Connect.value_or(interfaces->ipv6ConnectMode());
            interfaces = std::make_unique<FixedInterfaceProvider>(ifindex, mode);
        }

        Dispatcher dispatcher(std::move(cmd.options), *interfaces);
        dispatcher.setup();
        const DispatchStats stats = dispatcher.run();

        if (dispatcher.options().verbose)
        {
            std::cerr << "mproxy: " << stats.chunksProcessed << " chunks processed, " << stats.chunksForwarded
                      << " chunks (" << stats.bytesForwarded << " bytes) forwarded, " << stats.chunksSkipped
                      << " skipped, " << stats.totalSendFailures() << " send failures, " << stats.backupFailures << " backup failures" << std::endl;
        }
    }
    catch (const ProxyException& ex)
    {
        std::cerr << "mproxy: " << toString(ex.kind()) << " error: " << ex.what() << std::endl;
        return ExitFatal;
    }
    catch (const std::exception& ex)
    {
        std::cerr << "mproxy: " << ex.what() << std::endl;
        return ExitFatal;
    }

    return EXIT_SUCCESS;
}
