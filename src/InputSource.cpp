#include "mproxy/InputSource.hpp"

#include <cerrno>
#include <fcntl.h>
#include <iostream>
#include <system_error>

#ifdef _WIN32
#include <io.h>
#endif

using namespace mproxy;

namespace
{

#ifdef _WIN32
constexpr int StdinFd = 0;

int openReadOnly(const char* path)
{
    return ::_open(path, _O_RDONLY | _O_BINARY);
}

long long readFd(const int fd, void* buf, const std::size_t len)
{
    // _read takes an unsigned int count.
    const auto n = len > 0x7fffffffU ? 0x7fffffffU : static_cast<unsigned int>(len);
    return ::_read(fd, buf, n);
}

int closeFd(const int fd)
{
    return ::_close(fd);
}
#else
constexpr int StdinFd = STDIN_FILENO;

int openReadOnly(const char* path)
{
    return ::open(path, O_RDONLY | O_CLOEXEC);
}

long long readFd(const int fd, void* buf, const std::size_t len)
{
    return ::read(fd, buf, len);
}

int closeFd(const int fd)
{
    return ::close(fd);
}
#endif

} // namespace

InputSource::InputSource(const std::string& path) : _path(path)
{
    if (path == StdinPath)
    {
        _fd = StdinFd;
        return;
    }

    do
    {
        _fd = openReadOnly(path.c_str());
    } while (_fd < 0 && errno == EINTR);

    if (_fd < 0)
    {
        const int error = errno;
        throw ReadException(error, "Cannot open input " + path + ": " + std::generic_category().message(error));
    }

    _ownsFd = true;
}

InputSource::~InputSource()
{
    if (_ownsFd && _fd >= 0 && closeFd(_fd) != 0)
        std::cerr << "mproxy: failed to close input " << _path << ": " << std::generic_category().message(errno) << std::endl;
}

std::size_t InputSource::read(const std::span<std::byte> out)
{
    long long n;
    do
    {
        n = readFd(_fd, out.data(), out.size());
    } while (n < 0 && errno == EINTR);

    if (n < 0)
    {
        const int error = errno;
        throw ReadException(error, "Read failed on " + _path + ": " + std::generic_category().message(error));
    }

    return static_cast<std::size_t>(n);
}
