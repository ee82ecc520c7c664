#pragma once

#include <cstddef>
#include <sys/types.h>
#include <zlib.h>

namespace ae
{
    using std::size_t;

    /*
    * pull based input of a chunking session
    * read returns the number of bytes stored in buf (possibly fewer than
    * len), 0 at end of input, or -1 with errno set on failure
    */
    class byte_source
    {
    public:
        virtual ~byte_source() = default;
        virtual ssize_t read(void *buf, size_t len) = 0;
    };

    class memory_source : public byte_source
    {
    private:
        const char *pos;
        const char *end;
        size_t maxread;
    public:
        // maxread caps every single read, 0 for no cap
        memory_source(const void *buf, size_t len, size_t maxread = 0);

        ssize_t read(void *buf, size_t len) override;
    };

    class fd_source : public byte_source
    {
    private:
        int fd;
        bool owned;
    public:
        explicit fd_source(int fd, bool owned = false);
        ~fd_source();
        fd_source(const fd_source &) = delete;
        fd_source &operator=(const fd_source &) = delete;

        ssize_t read(void *buf, size_t len) override;
    };

    // reads gzip files, and plain files unchanged
    class gz_source : public byte_source
    {
    private:
        gzFile file;
    public:
        explicit gz_source(const char *path);
        explicit gz_source(int fd);
        ~gz_source();
        gz_source(const gz_source &) = delete;
        gz_source &operator=(const gz_source &) = delete;

        bool is_open() const { return file != nullptr; }
        ssize_t read(void *buf, size_t len) override;
    };
}
