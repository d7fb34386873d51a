#include <yframe/writer.h>
#include <ytrace/ytrace.hpp>

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

namespace yframe {

Result<Writer::Ptr> FdWriter::create(int fd) noexcept {
    if (fd < 0 || fcntl(fd, F_GETFD) == -1) {
        return Err<Ptr>("FdWriter: invalid file descriptor " + std::to_string(fd));
    }
    return Ptr(new FdWriter(fd));
}

Result<void> FdWriter::write(std::string_view bytes) {
    const char* p = bytes.data();
    size_t remaining = bytes.size();

    while (remaining > 0) {
        ssize_t n = ::write(_fd, p, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ydebug("FdWriter: write to fd {} failed: {}", _fd, strerror(err));
            return Err(std::string("write failed: ") + strerror(err));
        }
        if (n == 0) {
            return Err("write failed: no progress");
        }
        p += n;
        remaining -= static_cast<size_t>(n);
    }
    return Ok();
}

} // namespace yframe
