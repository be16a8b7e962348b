// GoogleTest unit tests for the mproxy socket layer: DatagramSocket, Endpoint, SocketBinder
#include "TestSupport.hpp"

#include "mproxy/Endpoint.hpp"
#include "mproxy/SocketBinder.hpp"
#include "mproxy/SocketInitializer.hpp"

#include <array>
#include <cstring>
#include <gtest/gtest.h>
#include <sstream>
#include <string>

using namespace mproxy;
using namespace mproxy::test;

TEST(DatagramSocketTest, InvalidFamily)
{
    SocketInitializer init;
    EXPECT_THROW({ DatagramSocket s(12345); }, BindException);
}

TEST(DatagramSocketTest, SendToReceiveLoopback)
{
    SocketInitializer init;
    const Listener server;
    DatagramSocket client(AF_INET);
    client.bindAny();
    EXPECT_NE(client.getLocalPort(), 0);

    const Endpoint to = Endpoint::parse(server.loopbackAddress());
    const std::string msg = "gtest-udp";
    EXPECT_NO_THROW(client.sendTo(bytes(msg), to.data(), to.length()));
    EXPECT_EQ(server.receive(), msg);
}

TEST(DatagramSocketTest, SendRequiresConnect)
{
    SocketInitializer init;
    DatagramSocket s(AF_INET);
    s.bindAny();
    EXPECT_FALSE(s.isConnected());
    EXPECT_THROW(s.send(bytes("x")), SendException);
}

TEST(DatagramSocketTest, WaitReadableTimesOut)
{
    SocketInitializer init;
    const Listener idle;
    EXPECT_FALSE(idle.receive(100).has_value());
}

TEST(DatagramSocketTest, MoveTransfersOwnership)
{
    SocketInitializer init;
    DatagramSocket a(AF_INET);
    a.bindAny();
    const Port port = a.getLocalPort();

    DatagramSocket b(std::move(a));
    EXPECT_FALSE(a.isOpen());
    EXPECT_TRUE(b.isOpen());
    EXPECT_EQ(b.getLocalPort(), port);
}

TEST(EndpointTest, SplitHostPort)
{
    EXPECT_EQ(Endpoint::splitHostPort("127.0.0.1:9910"), std::make_pair(std::string("127.0.0.1"), Port{9910}));
    EXPECT_EQ(Endpoint::splitHostPort("[ff02::1]:9920"), std::make_pair(std::string("ff02::1"), Port{9920}));
    EXPECT_EQ(Endpoint::splitHostPort("localhost:65535"), std::make_pair(std::string("localhost"), Port{65535}));
}

TEST(EndpointTest, MalformedTargets)
{
    for (const char* bad : {"localhost", "::1:80", "[::1]80", "[::1]:", "[::1", "host:0", "host:70000", "host:8o",
                            ":80", "[]:80", ""})
    {
        EXPECT_THROW((void)Endpoint::splitHostPort(bad), AddressResolutionException) << bad;
    }
}

TEST(EndpointTest, ParseUnicastAndMulticast)
{
    SocketInitializer init;

    const Endpoint v4 = Endpoint::parse("127.0.0.1:9910");
    EXPECT_TRUE(v4.isIPv4());
    EXPECT_FALSE(v4.isMulticast());
    EXPECT_EQ(v4.port(), 9910);
    EXPECT_EQ(v4.toString(), "127.0.0.1:9910");

    const Endpoint group4 = Endpoint::parse("224.0.0.1:9922");
    EXPECT_TRUE(group4.isIPv4());
    EXPECT_TRUE(group4.isMulticast());

    const Endpoint group6 = Endpoint::parse("[ff02::1]:9923");
    EXPECT_TRUE(group6.isIPv6());
    EXPECT_TRUE(group6.isMulticast());
    EXPECT_EQ(group6.ip(), "ff02::1");
    EXPECT_EQ(group6.toString(), "[ff02::1]:9923");
}

TEST(EndpointTest, UnresolvableHost)
{
    SocketInitializer init;
    EXPECT_THROW((void)Endpoint::parse("256.256.256.256.invalid:9910"), AddressResolutionException);
}

TEST(EndpointTest, Unspecified)
{
    const Endpoint any6 = Endpoint::unspecified(AF_INET6, 9920);
    EXPECT_TRUE(any6.isIPv6());
    EXPECT_FALSE(any6.isMulticast());
    EXPECT_EQ(any6.ip(), "::");
    EXPECT_EQ(any6.port(), 9920);
}

TEST(SocketBinderTest, UnicastIPv4)
{
    SocketInitializer init;
    const Listener server;
    const FixedInterfaceProvider provider(0);
    const SocketBinder binder(provider);

    const Target target = binder.bind(server.loopbackAddress());
    EXPECT_TRUE(target.socket().isBound());
    EXPECT_NE(target.socket().getLocalPort(), 0);
    EXPECT_FALSE(target.usesConnectedSend());
    EXPECT_EQ(target.destination(), server.loopbackAddress());

    target.send(bytes("hello\n"));
    EXPECT_EQ(server.receive(), "hello\n");
}

TEST(SocketBinderTest, UnicastIPv6)
{
    SocketInitializer init;
    if (!ipv6LoopbackAvailable())
        GTEST_SKIP() << "IPv6 loopback not available";

    const Listener server(AF_INET6);
    const FixedInterfaceProvider provider(0);
    const SocketBinder binder(provider);

    const Target target = binder.bind(server.loopbackAddress());
    EXPECT_TRUE(target.endpoint().isIPv6());
    EXPECT_FALSE(target.usesConnectedSend());

    target.send(bytes("v6 unicast"));
    EXPECT_EQ(server.receive(), "v6 unicast");
}

TEST(SocketBinderTest, BadAddressIsFatal)
{
    SocketInitializer init;
    const FixedInterfaceProvider provider(0);
    const SocketBinder binder(provider);

    try
    {
        (void)binder.bind("not-an-address");
        FAIL() << "expected AddressResolutionException";
    }
    catch (const AddressResolutionException& ex)
    {
        EXPECT_EQ(ex.kind(), ErrorKind::AddressResolution);
        EXPECT_EQ(ex.severity(), Severity::SessionFatal);
    }
}

TEST(SocketBinderTest, MulticastIPv4TwoMembers)
{
    SocketInitializer init;
    constexpr const char* group = "239.255.77.77";

    Listener first(AF_INET, 0, true);
    const Port port = first.port();
    Listener second(AF_INET, port, true);

    in_addr groupAddr{};
    in_addr any4{};
    any4.s_addr = htonl(INADDR_ANY);
    ASSERT_EQ(inet_pton(AF_INET, group, &groupAddr), 1);

    const FixedInterfaceProvider provider(0);
    const SocketBinder binder(provider);

    try
    {
        first.socket().joinGroupIPv4(groupAddr, any4);
        second.socket().joinGroupIPv4(groupAddr, any4);

        const Target target = binder.bind(std::string(group) + ":" + std::to_string(port));
        EXPECT_TRUE(target.endpoint().isMulticast());
        EXPECT_FALSE(target.usesConnectedSend());
        EXPECT_TRUE(target.socket().getMulticastLoopback());
        target.send(bytes("group chunk"));
    }
    catch (const ProxyException& ex)
    {
        GTEST_SKIP() << "IPv4 multicast unavailable: " << ex.what();
    }

    const auto a = first.receive();
    if (!a)
        GTEST_SKIP() << "IPv4 multicast is not looped back on this host";
    EXPECT_EQ(*a, "group chunk");
    EXPECT_EQ(second.receive(), "group chunk");
}

TEST(SocketBinderTest, MulticastIPv6UnspecifiedPeerStaysLocal)
{
    SocketInitializer init;
    if (!ipv6LoopbackAvailable())
        GTEST_SKIP() << "IPv6 loopback not available";

    const Listener member(AF_INET6);
    const FixedInterfaceProvider provider(0, Ipv6ConnectMode::UnspecifiedAtTargetPort);
    const SocketBinder binder(provider);

    std::optional<Target> target;
    try
    {
        target.emplace(binder.bind("[ff02::1234]:" + std::to_string(member.port())));
    }
    catch (const MulticastJoinException& ex)
    {
        GTEST_SKIP() << "IPv6 multicast unavailable: " << ex.what();
    }

    EXPECT_TRUE(target->usesConnectedSend());
    EXPECT_TRUE(target->socket().isConnected());
    ASSERT_NO_THROW(target->send(bytes("v6 group chunk")));

#ifdef __linux__
    // The peer "::" becomes "::1": only a listener on the local port sees the datagram.
    EXPECT_EQ(member.receive(), "v6 group chunk");
#endif
}

TEST(SocketBinderTest, MulticastIPv6ConnectsToGroup)
{
    SocketInitializer init;
    if (!ipv6LoopbackAvailable())
        GTEST_SKIP() << "IPv6 loopback not available";

    const FixedInterfaceProvider provider(0);
    EXPECT_EQ(provider.ipv6ConnectMode(), Ipv6ConnectMode::FullTarget);
    const SocketBinder binder(provider);

    std::optional<Target> target;
    try
    {
        target.emplace(binder.bind("[ff05::4d:7079]:9931"));
    }
    catch (const MulticastJoinException& ex)
    {
        GTEST_SKIP() << "IPv6 multicast unavailable: " << ex.what();
    }

    ASSERT_TRUE(target->socket().isConnected());
    sockaddr_in6 peer{};
    socklen_t len = sizeof(peer);
    ASSERT_EQ(::getpeername(target->socket().getSocketFd(), reinterpret_cast<sockaddr*>(&peer), &len), 0);
    const Endpoint connected = Endpoint::fromSockaddr(reinterpret_cast<const sockaddr*>(&peer), len);
    EXPECT_EQ(connected.toString(), "[ff05::4d:7079]:9931");
}

TEST(SocketBinderTest, ScopedGroupFillsLinkLocalScope)
{
    const Endpoint linkLocal = SocketBinder::scopedGroup(Endpoint::parse("[ff02::1]:9920"), 3);
    sockaddr_in6 addr{};
    std::memcpy(&addr, linkLocal.data(), sizeof(addr));
    EXPECT_EQ(addr.sin6_scope_id, 3U);
    EXPECT_EQ(linkLocal.port(), 9920);

    const Endpoint interfaceLocal = SocketBinder::scopedGroup(Endpoint::parse("[ff01::1]:9920"), 5);
    std::memcpy(&addr, interfaceLocal.data(), sizeof(addr));
    EXPECT_EQ(addr.sin6_scope_id, 5U);

    // Wider scopes and unset interfaces are left alone.
    const Endpoint site = SocketBinder::scopedGroup(Endpoint::parse("[ff05::4d:7078]:9920"), 3);
    std::memcpy(&addr, site.data(), sizeof(addr));
    EXPECT_EQ(addr.sin6_scope_id, 0U);

    const Endpoint unset = SocketBinder::scopedGroup(Endpoint::parse("[ff02::1]:9920"), 0);
    std::memcpy(&addr, unset.data(), sizeof(addr));
    EXPECT_EQ(addr.sin6_scope_id, 0U);

    const Endpoint v4 = SocketBinder::scopedGroup(Endpoint::parse("224.0.0.1:9920"), 3);
    EXPECT_TRUE(v4.isIPv4());
}

TEST(InterfaceProviderTest, PlatformProviderConnectsToGroup)
{
    SocketInitializer init;
    const auto provider = makePlatformInterfaceProvider();
    EXPECT_EQ(provider->ipv6ConnectMode(), Ipv6ConnectMode::FullTarget);

    unsigned int index = 0;
    try
    {
        index = provider->ipv6MulticastInterface();
    }
    catch (const MulticastJoinException& ex)
    {
        GTEST_SKIP() << "no usable network interface: " << ex.what();
    }

#ifndef _WIN32
    if (index != 0)
    {
        std::array<char, IF_NAMESIZE> name{};
        EXPECT_NE(if_indextoname(index, name.data()), nullptr) << index;
    }
#endif
}

#if !defined(_WIN32) && !defined(__APPLE__)
TEST(InterfaceProviderTest, DefaultRouteDevicePrefersIPv6)
{
    std::istringstream v6("00000000000000000000000000000000 00 00000000000000000000000000000000 00 "
                          "00000000000000000000000000000000 ffffffff 00000001 00000000 00200200       lo\n"
                          "fe800000000000000000000000000000 40 00000000000000000000000000000000 00 "
                          "00000000000000000000000000000000 00000100 00000001 00000000 00000001     eth0\n"
                          "00000000000000000000000000000000 00 00000000000000000000000000000000 00 "
                          "fe800000000000000000000000000001 00000400 00000001 00000000 00000003    wlan0\n"
                          "00000000000000000000000000000000 00 00000000000000000000000000000000 00 "
                          "fe800000000000000000000000000001 00000064 00000001 00000000 00000003     eth1\n");
    std::istringstream v4("Iface\tDestination\tGateway\tFlags\tRefCnt\tUse\tMetric\tMask\tMTU\tWindow\tIRTT\n"
                          "eth0\t00000000\t0100A8C0\t0003\t0\t0\t100\t00000000\t0\t0\t0\n");

    EXPECT_EQ(internal::defaultRouteDevice(v6, v4), "eth1");
}

TEST(InterfaceProviderTest, DefaultRouteDeviceFallsBackToIPv4)
{
    std::istringstream v6("00000000000000000000000000000000 00 00000000000000000000000000000000 00 "
                          "00000000000000000000000000000000 ffffffff 00000001 00000000 00200200       lo\n");
    std::istringstream v4("Iface\tDestination\tGateway\tFlags\tRefCnt\tUse\tMetric\tMask\tMTU\tWindow\tIRTT\n"
                          "eth0\t0000A8C0\t00000000\t0001\t0\t0\t0\t00FFFFFF\t0\t0\t0\n"
                          "wlan0\t00000000\t0100A8C0\t0003\t0\t0\t600\t00000000\t0\t0\t0\n"
                          "eth0\t00000000\t0100A8C0\t0003\t0\t0\t100\t00000000\t0\t0\t0\n");

    EXPECT_EQ(internal::defaultRouteDevice(v6, v4), "eth0");
}

TEST(InterfaceProviderTest, DefaultRouteDeviceEmptyWithoutTables)
{
    std::istringstream v6;
    std::istringstream v4;
    EXPECT_EQ(internal::defaultRouteDevice(v6, v4), "");
}
#endif
