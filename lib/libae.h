#ifndef _LIBAE_H_
#define _LIBAE_H_

#define AE_DEFAULT_AVG_SIZE 262144
#define AE_MIN_AVG_SIZE 3

#include <cstdint>
#include <cstddef>
#include <vector>

namespace ae
{
    enum class extremum : char
    {
        max,
        min
    };

    enum class config_status : char
    {
        ok,
        avg_too_small,
        max_below_avg
    };

    struct options
    {
        std::size_t avg_size = AE_DEFAULT_AVG_SIZE;
        extremum mode = extremum::max;
        // 0 means no hard ceiling
        std::size_t max_size = 0;
    };

    /*
    * progress of one chunk scan, kept between calls while the
    * caller is still collecting bytes for the same chunk
    */
    struct scan_state
    {
        bool started = false;
        std::size_t cursor = 0;
        std::size_t extreme_pos = 0;
        std::uint64_t extreme_value = 0;
    };

    struct params
    {
        std::size_t avg_size;
        extremum mode;
        std::size_t window_size;
        std::size_t width;
        std::size_t min_size;
        std::size_t max_size;
        bool bounded;

        // shortest chunk the scan can cut, the final chunk excepted
        std::size_t min_chunk_size() const { return window_size + width; }

        /*
        * find the end of the chunk starting at data[0]
        * returns the chunk length, or 0 if more than len bytes are needed
        * and eof is false
        */
        std::size_t scan(const unsigned char *data, std::size_t len, bool eof, scan_state &st) const;

    private:
        bool sample(const unsigned char *data, std::size_t len, bool eof,
            std::size_t pos, std::uint64_t &ret) const;
    };

    config_status configure(const options &opts, params &out);
    const char *describe(config_status status);

    /*
    * split a whole buffer, appending the end offset of every chunk to out
    */
    bool do_chunking(const void *buf, std::size_t len, std::vector<std::size_t> &out, const params &p);
}

#endif
