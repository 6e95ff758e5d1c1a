#include "debstrap/libutil/file-descriptor.hh"
#include "debstrap/libutil/error.hh"

#include <cerrno>
#include <poll.h>
#include <unistd.h>

namespace debstrap {

void writeFull(int fd, std::string_view s)
{
    while (!s.empty()) {
        ssize_t res = write(fd, s.data(), s.size());
        if (res >= 0) {
            s.remove_prefix(res);
        } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
            pollfd pfd = {.fd = fd, .events = POLLOUT, .revents = 0};
            if (poll(&pfd, 1, -1) == -1 && errno != EINTR)
                throw SysError("polling for writing to file");
        } else if (errno != EINTR) {
            throw SysError("writing to file");
        }
    }
}

AutoCloseFD::~AutoCloseFD()
{
    try {
        close();
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

AutoCloseFD & AutoCloseFD::operator =(AutoCloseFD && that) noexcept(false)
{
    if (this != &that) {
        close();
        fd = that.release();
    }
    return *this;
}

int AutoCloseFD::release()
{
    int oldFD = fd;
    fd = -1;
    return oldFD;
}

void AutoCloseFD::close()
{
    if (fd == -1) return;
    int oldFD = release();
    if (::close(oldFD) == -1)
        throw SysError("closing file descriptor %1%", oldFD);
}

}
