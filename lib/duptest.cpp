#include <cstdio>
#include <cstring>
#include <cstdlib>
#include <string>
#include <array>
#include <set>
#include <openssl/md5.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <fcntl.h>
#include <dirent.h>
#include <errno.h>
#include "libae.h"
#include "debug.h"
#include "../chunker.h"
#include "../source.h"
using namespace std;
using namespace ae;

using md5val = std::array<unsigned char, 16>;

set<md5val> seen;
unsigned int num_chunk, num_dup, num_file, num_fail;
unsigned long long size_dup, size_org;

static bool dedup(const char *path, const params &cfg)
{
    int fd = open(path, O_RDONLY);
    if (fd == -1)
    {
        fprintf(stderr, "%s open failed with errno %d\n", path, errno);
        return false;
    }

    fd_source src(fd, true);
    chunker session(src, cfg);
    chunk chk;
    chunk_status ret;
    while ((ret = session.next(chk)) == chunk_status::ok)
    {
        md5val hash;
        MD5(reinterpret_cast<const unsigned char *>(chk.blob.data()), chk.size(), &hash[0]);

        num_chunk++;
        size_org += chk.size();
        if (seen.insert(hash).second == false)
        {
            num_dup++;
            size_dup += chk.size();
        }
    }

    if (ret == chunk_status::io_error)
    {
        fprintf(stderr, "%s read failed: %s\n", path, strerror(session.last_error()));
        return false;
    }
    return true;
}

static void walk(const string &addr, const params &cfg)
{
    DIR *d = opendir(addr.c_str());
    if (d == nullptr)
    {
        fprintf(stderr, "%s opendir failed with errno %d\n", addr.c_str(), errno);
        num_fail++;
        return;
    }

    struct dirent *e;
    struct stat st;
    while ((e = readdir(d)) != NULL)
    {
        if (!strcmp(e->d_name, ".") || !strcmp(e->d_name, "..")) continue;
        string path = addr + "/" + e->d_name;
        if (lstat(path.c_str(), &st) == -1)
        {
            fprintf(stderr, "%s lstat failed with errno %d\n", path.c_str(), errno);
            num_fail++;
            continue;
        }

        if (S_ISDIR(st.st_mode))
        {
            walk(path, cfg);
        }
        else if (S_ISREG(st.st_mode))
        {
            if (dedup(path.c_str(), cfg)) num_file++;
            else num_fail++;
        }
    }
    closedir(d);
}

int main(int argc, char *argv[])
{
    options opts;
    int opt;
    while ((opt = getopt(argc, argv, "a:m:M:")) != -1)
    {
        switch (opt)
        {
        case 'a':
            opts.avg_size = strtoull(optarg, nullptr, 10);
            break;
        case 'M':
            opts.max_size = strtoull(optarg, nullptr, 10);
            break;
        case 'm':
            opts.mode = strcmp(optarg, "min") ? extremum::max : extremum::min;
            break;
        default:
            fprintf(stderr, "usage: %s [-a avg] [-m max|min] [-M max_size] dir\n", argv[0]);
            return 1;
        }
    }
    if (optind + 1 != argc)
    {
        fprintf(stderr, "usage: %s [-a avg] [-m max|min] [-M max_size] dir\n", argv[0]);
        return 1;
    }

    params cfg;
    auto status = configure(opts, cfg);
    if (status != config_status::ok)
    {
        fprintf(stderr, "%s\n", describe(status));
        return 1;
    }

    walk(argv[optind], cfg);
    printf("number of files:      %u (%u failed)\n", num_file, num_fail);
    printf("number of chunks:     %u\n", num_chunk);
    printf("number of dup chunks: %u\n", num_dup);
    printf("total memory if no dedup: %lluB\n", size_org);
    printf("memory saved if optimal:  %lluB\n", size_dup);
    return num_fail == 0 ? 0 : 1;
}
