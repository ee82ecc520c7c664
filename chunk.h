#pragma once

#include <vector>
#include <cstdint>
#include <cstddef>

namespace ae
{
    using std::uint64_t;
    using std::size_t;
    using std::vector;

    struct chunk
    {
        // position of the first byte in the whole input
        uint64_t offset = 0;
        vector<char> blob;

        size_t size() const { return blob.size(); }
        uint64_t end() const { return offset + blob.size(); }

        static chunk frombuffer(const void *buf, size_t len, uint64_t offset);
        bool writeto(int fd) const;
    };
}
