#include <cstring>
#include "chunk.h"
#include "lib/debug.h"
using namespace std;
using namespace ae;

chunk chunk::frombuffer(const void *buf, size_t len, uint64_t offset)
{
    chunk ret;

    ret.offset = offset;
    ret.blob.resize(len);
    if (len > 0) memcpy(&ret.blob[0], buf, len);

    return ret;
}

bool chunk::writeto(int fd) const
{
    if (blob.empty()) return true;
    return safe_write(fd, &blob[0], blob.size());
}
