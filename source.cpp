#include <cstdio>
#include <cstring>
#include <cerrno>
#include <climits>
#include <unistd.h>
#include "source.h"
#include "lib/debug.h"

using namespace std;
using namespace ae;

memory_source::memory_source(const void *buf, size_t len, size_t maxread)
    : pos(static_cast<const char *>(buf)), end(pos + len), maxread(maxread)
{
}

ssize_t memory_source::read(void *buf, size_t len)
{
    size_t left = end - pos;
    if (len > left) len = left;
    if (maxread != 0 && len > maxread) len = maxread;

    if (len > 0) memcpy(buf, pos, len);
    pos += len;
    return len;
}

fd_source::fd_source(int fd, bool owned) : fd(fd), owned(owned)
{
}

fd_source::~fd_source()
{
    if (owned && fd != -1) close(fd);
}

ssize_t fd_source::read(void *buf, size_t len)
{
    return safe_read(fd, buf, len);
}

gz_source::gz_source(const char *path) : file(gzopen(path, "rb"))
{
    if (file == nullptr)
    {
        fprintf(stderr, "gzopen %s failed with errno %d\n", path, errno);
    }
}

gz_source::gz_source(int fd) : file(gzdopen(fd, "rb"))
{
    if (file == nullptr)
    {
        fprintf(stderr, "gzdopen %d failed with errno %d\n", fd, errno);
    }
}

gz_source::~gz_source()
{
    if (file != nullptr) gzclose(file);
}

ssize_t gz_source::read(void *buf, size_t len)
{
    if (file == nullptr)
    {
        errno = EBADF;
        return -1;
    }

    if (len > INT_MAX) len = INT_MAX;
    int ret = gzread(file, buf, static_cast<unsigned>(len));
    if (ret < 0)
    {
        int saved = errno;
        int errnum;
        const char *msg = gzerror(file, &errnum);
        int err = errnum == Z_ERRNO ? saved : EIO;
        fprintf(stderr, "gzread failed with zlib error %d (%s)\n", errnum, msg);
        errno = err;
        return -1;
    }

    return ret;
}
