#include "mproxy/internal/DirectoryLock.hpp"
#include "mproxy/Exceptions.hpp"

#include <cerrno>
#include <map>
#include <string>

#ifndef _WIN32
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#endif

using namespace mproxy::internal;

namespace
{

std::shared_ptr<std::mutex> mutexFor(const std::filesystem::path& directory)
{
    static std::mutex registryMutex;
    static std::map<std::string, std::shared_ptr<std::mutex>> registry;

    const std::string key = std::filesystem::absolute(directory).lexically_normal().string();

    std::lock_guard lock(registryMutex);
    auto& entry = registry[key];
    if (!entry)
        entry = std::make_shared<std::mutex>();
    return entry;
}

} // namespace

DirectoryLock::DirectoryLock(const std::filesystem::path& directory)
    : _mutex(mutexFor(directory)), _guard(*_mutex)
{
#ifndef _WIN32
    const std::filesystem::path lockPath = directory / LockFileName;

    do
    {
        _fd = ::open(lockPath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    } while (_fd < 0 && errno == EINTR);

    if (_fd < 0)
        throw mproxy::BackupException(errno, "Cannot open lock file " + lockPath.string());

    int rc;
    do
    {
        rc = ::flock(_fd, LOCK_EX);
    } while (rc != 0 && errno == EINTR);

    if (rc != 0)
    {
        const int error = errno;
        ::close(_fd);
        _fd = -1;
        throw mproxy::BackupException(error, "Cannot lock " + lockPath.string());
    }
#endif
}

DirectoryLock::~DirectoryLock()
{
#ifndef _WIN32
    if (_fd >= 0)
    {
        ::flock(_fd, LOCK_UN);
        ::close(_fd);
    }
#endif
}
