#include <cmath>
#include "libae.h"

namespace ae
{
    static constexpr double euler = 2.718281828459045;

    config_status configure(const options &opts, params &out)
    {
        if (opts.avg_size < AE_MIN_AVG_SIZE) return config_status::avg_too_small;
        if (opts.max_size != 0 && opts.max_size < opts.avg_size) return config_status::max_below_avg;

        out.avg_size = opts.avg_size;
        out.mode = opts.mode;
        out.window_size = static_cast<std::size_t>(std::llround(opts.avg_size / (euler - 1)));
        out.width = static_cast<std::size_t>(std::llround(out.window_size / 256.0));
        if (out.width == 0) out.width = 1;
        out.min_size = opts.avg_size > out.window_size ? opts.avg_size - out.window_size : 0;
        out.bounded = opts.max_size != 0;
        out.max_size = out.bounded ? opts.max_size : 2 * opts.avg_size;
        return config_status::ok;
    }

    const char *describe(config_status status)
    {
        switch (status)
        {
        case config_status::ok:
            return "ok";
        case config_status::avg_too_small:
            return "average size must not be less than 3";
        case config_status::max_below_avg:
            return "maximum size must not be less than average size";
        }
        return "unknown configuration error";
    }

    bool params::sample(const unsigned char *data, std::size_t len, bool eof,
        std::size_t pos, std::uint64_t &ret) const
    {
        std::size_t end = pos + width;
        if (bounded && end > max_size) end = max_size;
        if (end > len)
        {
            // a partial sample only counts once nothing more can arrive
            if (!eof) return false;
            end = len;
        }

        ret = 0;
        for (std::size_t i = pos; i < end; i++) ret += data[i];
        return true;
    }

    std::size_t params::scan(const unsigned char *data, std::size_t len, bool eof, scan_state &st) const
    {
        if (len <= min_size + window_size) return eof ? len : 0;

        if (!st.started)
        {
            if (!sample(data, len, eof, width, st.extreme_value)) return 0;
            st.extreme_pos = width;
            st.cursor = 2 * width;
            st.started = true;
        }

        for (;; st.cursor += width)
        {
            std::size_t i = st.cursor;
            // never past the end of a short final piece
            if (bounded && i >= max_size) return max_size < len ? max_size : len;
            if (i >= len) return eof ? len : 0;

            std::uint64_t value;
            if (!sample(data, len, eof, i, value)) return 0;

            bool extreme = mode == extremum::max ? value > st.extreme_value : value < st.extreme_value;
            if (extreme)
            {
                st.extreme_pos = i;
                st.extreme_value = value;
            }
            else if (i >= st.extreme_pos + window_size)
            {
                return i;
            }
        }
    }

    bool do_chunking(const void *buf, std::size_t len, std::vector<std::size_t> &out, const params &p)
    {
        if (!out.empty()) return false;
        const unsigned char *it_l = static_cast<const unsigned char *>(buf),
                            *it_end = it_l + len;
        while (it_l != it_end)
        {
            scan_state st;
            std::size_t cut = p.scan(it_l, it_end - it_l, true, st);
            it_l += cut;
            out.emplace_back(it_l - static_cast<const unsigned char *>(buf));
        }
        return true;
    }
}
