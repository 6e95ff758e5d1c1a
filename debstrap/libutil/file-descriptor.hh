#pragma once
///@file

#include <string_view>

namespace debstrap {

/**
 * Write all of `s` to `fd`, retrying on short writes and EINTR.
 */
void writeFull(int fd, std::string_view s);

/**
 * Owns a file descriptor and closes it on destruction. Moving transfers
 * ownership.
 */
class AutoCloseFD
{
    int fd = -1;

public:
    AutoCloseFD() = default;
    explicit AutoCloseFD(int fd) : fd(fd) { }
    AutoCloseFD(const AutoCloseFD &) = delete;
    AutoCloseFD(AutoCloseFD && that) : fd(that.release()) { }
    ~AutoCloseFD();

    AutoCloseFD & operator =(const AutoCloseFD &) = delete;
    AutoCloseFD & operator =(AutoCloseFD && that) noexcept(false);

    int get() const { return fd; }
    explicit operator bool() const { return fd != -1; }
    int release();

    /**
     * Close now, throwing if close() fails. A no-op once closed.
     */
    void close();
};

}
