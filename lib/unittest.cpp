#include<stdio.h>
#include<string.h>
#include<stdlib.h>
#include<errno.h>
#include<fcntl.h>
#include<unistd.h>
#include<time.h>
#include<zlib.h>
#include<chrono>
#include<vector>
#include<utility>
#include<string>
#include "libae.h"
#include "../chunker.h"
#include "../source.h"

using namespace ae;

int failures = 0;

#define CHECK(cond) check((cond), #cond, __LINE__)

static bool check(bool ok, const char *what, int line)
{
    if(!ok)
    {
        printf("  FAILED line %d: %s\n", line, what);
        failures++;
    }
    return ok;
}

long long now()
{
    static auto t = std::chrono::high_resolution_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::high_resolution_clock::now() - t).count();
}

std::vector<char> rand_bytes(size_t n)
{
    std::vector<char> ret(n);
    for(size_t i=0;i<n;i++) ret[i] = rand()%256;
    return ret;
}

params make_params(size_t avg, extremum mode = extremum::max, size_t mx = 0)
{
    options opts;
    opts.avg_size = avg;
    opts.mode = mode;
    opts.max_size = mx;
    params p;
    if(configure(opts, p) != config_status::ok)
    {
        printf("configure(%zu, %zu) failed\n", avg, mx);
        exit(1);
    }
    return p;
}

/*
* chunk a source to the end, collecting the chunks
* returns the status that ended the session
*/
chunk_status drain(byte_source &src, const params &p, std::vector<chunk> &out)
{
    chunker session(src, p);
    chunk chk;
    chunk_status ret;
    while((ret = session.next(chk)) == chunk_status::ok) out.push_back(std::move(chk));
    return ret;
}

std::vector<size_t> stream_cuts(const std::vector<char> &data, const params &p, size_t maxread)
{
    memory_source src(data.data(), data.size(), maxread);
    std::vector<chunk> chunks;
    drain(src, p, chunks);
    std::vector<size_t> ret;
    for(auto &c : chunks) ret.push_back(c.end());
    return ret;
}

bool same_bytes(const std::vector<char> &data, const std::vector<chunk> &chunks)
{
    size_t c = 0;
    for(auto &chk : chunks)
    {
        if(chk.offset != c) return false;
        if(c + chk.size() > data.size()) return false;
        if(memcmp(&data[c], chk.blob.data(), chk.size())) return false;
        c += chk.size();
    }
    return c == data.size();
}

void test_config()
{
    puts("testing configuration");
    options opts;
    params p;

    for(size_t avg = 0; avg < 3; avg++)
    {
        opts.avg_size = avg;
        CHECK(configure(opts, p) == config_status::avg_too_small);
    }

    opts.avg_size = 512 * 1024;
    opts.max_size = 511 * 1024;
    CHECK(configure(opts, p) == config_status::max_below_avg);
    opts.max_size = 512 * 1024;
    CHECK(configure(opts, p) == config_status::ok);
    CHECK(p.bounded && p.max_size == 512 * 1024);

    p = make_params(10);
    CHECK(p.window_size == 6);
    CHECK(p.width == 1);
    CHECK(p.min_size == 4);
    CHECK(p.max_size == 20);
    CHECK(p.bounded == false);
    CHECK(p.min_chunk_size() == 7);

    p = make_params(3);
    CHECK(p.window_size == 2);
    CHECK(p.min_size == 1);

    p = make_params(171);
    CHECK(p.window_size == 100);
    CHECK(p.width == 1);

    p = make_params(256 * 1024);
    CHECK(p.window_size == 152562);
    CHECK(p.width == 596);
    CHECK(p.min_size == 256 * 1024 - 152562);
    CHECK(p.max_size == 512 * 1024);

    options defaults;
    CHECK(configure(defaults, p) == config_status::ok);
    CHECK(p.avg_size == AE_DEFAULT_AVG_SIZE);
    CHECK(p.mode == extremum::max);
    CHECK(p.bounded == false);
}

void test_degenerate()
{
    puts("testing degenerate inputs");
    auto p = make_params(256 * 1024 + 123);

    std::vector<char> empty;
    std::vector<chunk> chunks;
    memory_source none(empty.data(), 0);
    CHECK(drain(none, p, chunks) == chunk_status::end);
    CHECK(chunks.empty());

    std::vector<size_t> cuts;
    CHECK(do_chunking(empty.data(), 0, cuts, p));
    CHECK(cuts.empty());

    for(size_t n = 1; n < 5; n++)
    {
        auto data = rand_bytes(n);
        chunks.clear();
        memory_source src(data.data(), n);
        CHECK(drain(src, make_params(256 * 1024), chunks) == chunk_status::end);
        CHECK(chunks.size() == 1);
        CHECK(same_bytes(data, chunks));
    }

    // a session keeps reporting the end
    memory_source one("x", 1);
    chunker session(one, p);
    chunk chk;
    CHECK(session.next(chk) == chunk_status::ok);
    CHECK(session.next(chk) == chunk_status::end);
    CHECK(session.next(chk) == chunk_status::end);

    cuts = {1};
    CHECK(do_chunking("abc", 3, cuts, p) == false);
}

void test_rising()
{
    puts("testing strictly increasing bytes");
    std::vector<char> data(260, 0);
    for(int i=1;i<256;i++) data[4+i] = (char)i;

    std::vector<chunk> chunks;
    memory_source src(data.data(), data.size());
    drain(src, make_params(10), chunks);
    CHECK(chunks.size() == 1);
    CHECK(same_bytes(data, chunks));

    chunks.clear();
    memory_source bounded(data.data(), data.size());
    drain(bounded, make_params(10, extremum::max, 100), chunks);
    CHECK(chunks.size() == 3);
    if(chunks.size() == 3)
    {
        CHECK(chunks[0].size() == 100);
        CHECK(chunks[1].size() == 100);
        CHECK(chunks[2].size() == 60);
    }
    CHECK(same_bytes(data, chunks));

    std::vector<size_t> cuts;
    do_chunking(data.data(), data.size(), cuts, make_params(10, extremum::max, 100));
    CHECK((cuts == std::vector<size_t>{100, 200, 260}));

    // a stride of 2 steps over the ceiling, and a final piece ends just below it
    auto wide = make_params(700, extremum::max, 710);
    CHECK(wide.width == 2);
    size_t lengths[] = { 709, 710, 1500 };
    std::vector<size_t> expect[] = { {709}, {710}, {710, 1420, 1500} };
    for(int n=0;n<3;n++)
    {
        std::vector<char> ramp(lengths[n]);
        for(size_t i=0;i<ramp.size();i++) ramp[i] = (char)(i * 255 / ramp.size());

        cuts.clear();
        CHECK(do_chunking(ramp.data(), ramp.size(), cuts, wide));
        CHECK(cuts == expect[n]);
        CHECK(stream_cuts(ramp, wide, 1) == cuts);

        chunks.clear();
        memory_source rsrc(ramp.data(), ramp.size());
        CHECK(drain(rsrc, wide, chunks) == chunk_status::end);
        CHECK(same_bytes(ramp, chunks));
        for(auto &c : chunks) CHECK(c.size() <= wide.max_size);
    }
}

void test_ties()
{
    puts("testing tied extremes");
    // the extreme at 1 is tied at 3, the window elapses from 1
    std::vector<char> peaks(16, 0);
    peaks[1] = 5;
    peaks[3] = 5;
    std::vector<size_t> cuts;
    do_chunking(peaks.data(), peaks.size(), cuts, make_params(10));
    CHECK((cuts == std::vector<size_t>{7, 16}));

    std::vector<char> valleys(16, 9);
    valleys[1] = 1;
    valleys[3] = 1;
    cuts.clear();
    do_chunking(valleys.data(), valleys.size(), cuts, make_params(10, extremum::min));
    CHECK((cuts == std::vector<size_t>{7, 16}));

    // a flat input never renews its extreme
    std::vector<char> flat(16, 7);
    cuts.clear();
    do_chunking(flat.data(), flat.size(), cuts, make_params(10));
    CHECK((cuts == std::vector<size_t>{7, 16}));
}

#define lib_file_test_sz 8388608 //8MB
std::vector<char> libfile;

void lib_chunk_analysis(const std::vector<chunk> &chunks)
{
    printf("  number of chunks : %zu\n", chunks.size());
    printf("  average size of chunk : %lfB\n", (double) libfile.size() / (double) chunks.size());
    size_t mx = 0, mn = (size_t)-1;
    for(auto &c : chunks)
    {
        if(c.size() > mx) mx = c.size();
        if(c.size() < mn) mn = c.size();
    }
    printf("  largest chunk : %zuB\n", mx);
    printf("  smallest chunk : %zuB\n", mn);
}

std::vector<chunk> lib_chunk(const params &p)
{
    auto t = now();
    std::vector<chunk> chunks;
    memory_source src(libfile.data(), libfile.size());
    CHECK(drain(src, p, chunks) == chunk_status::end);
    printf("  chunking in %lld millisecond\n", now() - t);
    lib_chunk_analysis(chunks);
    return chunks;
}

void test_lib()
{
    bool yes;
    auto t = now();
    puts("testing lib");
    if(libfile.empty()) libfile = rand_bytes(lib_file_test_sz);
    printf("created random file of size %dKB in %lld millisecond\n", lib_file_test_sz/1024, now() - t);

    puts(" AE_MAX");
    auto p = make_params(64 * 1024);
    auto maxchunks = lib_chunk(p);
    CHECK(same_bytes(libfile, maxchunks));
    yes = maxchunks.size() > 1;
    for(size_t i = 0; i + 1 < maxchunks.size(); i++)
        yes &= maxchunks[i].size() >= p.min_chunk_size();
    CHECK(yes);

    puts(" AE_MIN");
    auto minchunks = lib_chunk(make_params(64 * 1024, extremum::min));
    CHECK(same_bytes(libfile, minchunks));
    CHECK(minchunks.size() > 1);

    yes = maxchunks.size() != minchunks.size();
    for(size_t i = 0; !yes && i < maxchunks.size(); i++)
        yes = maxchunks[i].offset != minchunks[i].offset;
    CHECK(yes);

    puts(" AE_MAX with ceiling");
    p = make_params(64 * 1024, extremum::max, 70 * 1024);
    auto bounded = lib_chunk(p);
    CHECK(same_bytes(libfile, bounded));
    yes = true;
    for(size_t i = 0; i < bounded.size(); i++)
    {
        yes &= bounded[i].size() <= p.max_size;
        if(i + 1 < bounded.size()) yes &= bounded[i].size() >= p.min_chunk_size();
    }
    CHECK(yes);
}

void test_determinism()
{
    puts("testing read granularity");
    auto data = rand_bytes(2 * 1024 * 1024);
    params configs[] = {
        make_params(16 * 1024),
        make_params(16 * 1024, extremum::min),
        make_params(16 * 1024, extremum::max, 20 * 1024),
        make_params(300),
    };
    size_t reads[] = { 1, 7, 4093, 65536, 0 };

    for(auto &p : configs)
    {
        std::vector<size_t> whole;
        do_chunking(data.data(), data.size(), whole, p);
        CHECK(!whole.empty() && whole.back() == data.size());
        for(size_t r : reads)
        {
            auto t = now();
            bool yes = stream_cuts(data, p, r) == whole;
            if(!check(yes, "stream_cuts(data, p, r) == whole", __LINE__))
                printf("  avg %zu read size %zu\n", p.avg_size, r);
            else if(r == 1) printf("  avg %zu by single bytes in %lld millisecond\n", p.avg_size, now() - t);
        }
    }

    // unbounded rising input spans several read blocks before its only cut
    std::vector<char> rising(100000);
    for(size_t i=0;i<rising.size();i++) rising[i] = (char)(i * 255 / rising.size());
    auto cuts = stream_cuts(rising, make_params(1000), 3);
    std::vector<size_t> whole;
    do_chunking(rising.data(), rising.size(), whole, make_params(1000));
    CHECK(cuts == whole);
}

void test_small_window()
{
    puts("testing window size << 256");
    auto p = make_params(171);
    auto data = rand_bytes(1024);
    std::vector<chunk> chunks;
    memory_source src(data.data(), data.size());
    CHECK(drain(src, p, chunks) == chunk_status::end);
    CHECK(same_bytes(data, chunks));
    for(size_t i = 0; i + 1 < chunks.size(); i++)
        CHECK(chunks[i].size() >= p.min_chunk_size());
}

// hands out a few bytes, then fails
class failing_source : public byte_source
{
public:
    size_t left;
    explicit failing_source(size_t left) : left(left) {}

    ssize_t read(void *buf, size_t len) override
    {
        if(left == 0)
        {
            errno = ENOSPC;
            return -1;
        }
        if(len > left) len = left;
        memset(buf, 1, len);
        left -= len;
        return len;
    }
};

void test_io_error()
{
    puts("testing source failures");
    failing_source src(500);
    chunker session(src, make_params(1024));
    chunk chk;
    chk.offset = 77;
    CHECK(session.next(chk) == chunk_status::io_error);
    CHECK(session.last_error() == ENOSPC);
    CHECK(chk.offset == 77 && chk.blob.empty());
    CHECK(session.next(chk) == chunk_status::io_error);

    // chunks cut before the failure are still delivered
    failing_source late(100000);
    std::vector<chunk> chunks;
    CHECK(drain(late, make_params(100), chunks) == chunk_status::io_error);
    CHECK(!chunks.empty());

    int fd = open("/tmp", O_RDONLY);
    if(check(fd != -1, "open(/tmp)", __LINE__))
    {
        fd_source bad(fd, true);
        chunker dsession(bad, make_params(1024));
        CHECK(dsession.next(chk) == chunk_status::io_error);
        CHECK(dsession.last_error() == EISDIR);
    }
}

void test_files()
{
    puts("testing file sources");
    auto data = rand_bytes(3 * 1024 * 1024 + 17);
    auto p = make_params(32 * 1024);
    std::vector<size_t> whole;
    do_chunking(data.data(), data.size(), whole, p);

    char plain[] = "/tmp/aechunk_plainXXXXXX";
    int fd = mkstemp(plain);
    if(!check(fd != -1, "mkstemp", __LINE__)) return;
    CHECK(write(fd, data.data(), data.size()) == (ssize_t)data.size());
    lseek(fd, 0, SEEK_SET);
    {
        fd_source src(fd, true);
        std::vector<chunk> chunks;
        CHECK(drain(src, p, chunks) == chunk_status::end);
        CHECK(same_bytes(data, chunks));
        CHECK(chunks.size() == whole.size());
    }

    char packed[] = "/tmp/aechunk_gzipXXXXXX";
    fd = mkstemp(packed);
    if(!check(fd != -1, "mkstemp", __LINE__)) return;
    close(fd);
    gzFile gz = gzopen(packed, "wb");
    CHECK(gz != nullptr);
    if(gz)
    {
        CHECK(gzwrite(gz, data.data(), data.size()) == (int)data.size());
        gzclose(gz);
    }

    std::vector<size_t> cuts[2];
    const char *names[2] = { packed, plain };
    for(int i=0;i<2;i++)
    {
        gz_source src(names[i]);
        CHECK(src.is_open());
        std::vector<chunk> chunks;
        CHECK(drain(src, p, chunks) == chunk_status::end);
        CHECK(same_bytes(data, chunks));
        for(auto &c : chunks) cuts[i].push_back(c.end());
        CHECK(cuts[i] == whole);
    }

    unlink(plain);
    unlink(packed);
}

struct suite
{
    const char *name;
    void (*run)();
};

suite suites[] = {
    {"config", test_config},
    {"degenerate", test_degenerate},
    {"rising", test_rising},
    {"ties", test_ties},
    {"lib", test_lib},
    {"determinism", test_determinism},
    {"window", test_small_window},
    {"io", test_io_error},
    {"files", test_files},
};

int main(int argc, char* argv[])
{
    unsigned seed = (unsigned)time(nullptr);
    srand(seed);
    printf("random seed %u\n", seed);

    std::vector<suite*> todo;
    if(argc == 1)
    {
        for(auto &s : suites) todo.push_back(&s);
    }
    else
    {
        for(int i=1;i<argc;i++)
        {
            suite *found = nullptr;
            for(auto &s : suites) if(!strcmp(argv[i], s.name)) found = &s;
            if(found) todo.push_back(found);
            else
            {
                printf("WRONG ARGUMENT : %s\n",argv[i]);
                printf("List of arguments:");
                for(auto &s : suites) printf(" %s", s.name);
                puts("");
                return 1;
            }
        }
    }

    for(auto s : todo)
    {
        auto t = now();
        int before = failures;
        s->run();
        printf("%s %s in %lld millisecond\n", s->name, failures == before ? "passed" : "FAILED", now() - t);
    }

    if(failures) printf("%d checks failed\n", failures);
    return failures ? 1 : 0;
}
