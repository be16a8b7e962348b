/**
 * @file InputSource.hpp
 * @brief The byte stream a session forwards: standard input or a file.
 */

#pragma once

#include "common.hpp"

#include <cstddef>
#include <span>
#include <string>

namespace mproxy
{

/**
 * @class ChunkReader
 * @ingroup dispatch
 * @brief Anything the Dispatcher can pull chunks from.
 */
class ChunkReader
{
  public:
    virtual ~ChunkReader() = default;

    /**
     * @brief Perform one raw read of at most `out.size()` bytes.
     *
     * @return Number of bytes stored in @p out; 0 means end of stream.
     * @throws ReadException on an I/O error.
     */
    virtual std::size_t read(std::span<std::byte> out) = 0;
};

/**
 * @class InputSource
 * @ingroup dispatch
 * @brief ChunkReader over a file descriptor: standard input for StdinPath, otherwise a file
 *        opened read-only.
 *
 * Each read() is a single `read(2)` (`_read` on Windows), retried on `EINTR`. Standard input
 * is never closed; an opened file is closed on destruction.
 */
class InputSource final : public ChunkReader
{
  public:
    /**
     * @param[in] path `-` for standard input, otherwise a file path.
     * @throws ReadException if the file cannot be opened.
     */
    explicit InputSource(const std::string& path);

    ~InputSource() override;

    InputSource(const InputSource&) = delete;
    InputSource& operator=(const InputSource&) = delete;

    std::size_t read(std::span<std::byte> out) override;

    [[nodiscard]] const std::string& path() const noexcept { return _path; }
    [[nodiscard]] bool isStdin() const noexcept { return !_ownsFd; }

  private:
    std::string _path;
    int _fd = -1;
    bool _ownsFd = false;
};

} // namespace mproxy
