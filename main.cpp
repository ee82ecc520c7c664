#include <stdio.h>
#include <string.h>
#include <errno.h>
#include <fcntl.h>
#include <stdlib.h>
#include <stdint.h>
#include <limits.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <string>
#include <memory>
#include "lib/libae.h"
#include "lib/debug.h"
#include "chunker.h"
#include "source.h"
using namespace std;
using namespace ae;

struct cmdline
{
	options opts;
	size_t readsize{ 0 };
	bool gzip{ false };
	bool quiet{ false };
	const char *outdir{ nullptr };
	const char *input{ nullptr };
};

// reads through another source, never handing out more than limit bytes at a time
class capped_source : public byte_source
{
private:
	byte_source &inner;
	size_t limit;
public:
	capped_source(byte_source &inner, size_t limit) : inner(inner), limit(limit) {}

	ssize_t read(void *buf, size_t len) override
	{
		if (limit != 0 && len > limit) len = limit;
		return inner.read(buf, len);
	}
};

static void usage(const char *prog)
{
	fprintf(stderr,
		"usage: %s [-a avg] [-m max|min] [-M max_size] [-b read_size] [-z] [-o dir] [-q] [file]\n"
		"  -a avg       desired average chunk size in bytes (default %d)\n"
		"  -m max|min   cut at local maxima or minima (default max)\n"
		"  -M max_size  hard ceiling on the chunk size (default none)\n"
		"  -b size      read at most size bytes per read call\n"
		"  -z           decompress gzip input\n"
		"  -o dir       write every chunk to dir/<index>\n"
		"  -q           print the summary only\n",
		prog, AE_DEFAULT_AVG_SIZE);
}

static bool parse_size(const char *arg, size_t &ret)
{
	char *end;
	errno = 0;
	unsigned long long val = strtoull(arg, &end, 10);
	if (errno != 0 || end == arg) return false;

	switch (*end)
	{
	case 'k': case 'K': val *= 1024; ++end; break;
	case 'm': case 'M': val *= 1024 * 1024; ++end; break;
	default: break;
	}

	if (*end != '\0' || val > SIZE_MAX) return false;
	ret = static_cast<size_t>(val);
	return true;
}

static bool parse_args(int argc, char *argv[], cmdline &cmd)
{
	int opt;
	while ((opt = getopt(argc, argv, "a:m:M:b:zo:qh")) != -1)
	{
		switch (opt)
		{
		case 'a':
			if (parse_size(optarg, cmd.opts.avg_size) == false)
			{
				fprintf(stderr, "bad average size: %s\n", optarg);
				return false;
			}
			break;
		case 'M':
			if (parse_size(optarg, cmd.opts.max_size) == false)
			{
				fprintf(stderr, "bad maximum size: %s\n", optarg);
				return false;
			}
			break;
		case 'b':
			if (parse_size(optarg, cmd.readsize) == false)
			{
				fprintf(stderr, "bad read size: %s\n", optarg);
				return false;
			}
			break;
		case 'm':
			if (!strcmp(optarg, "max")) cmd.opts.mode = extremum::max;
			else if (!strcmp(optarg, "min")) cmd.opts.mode = extremum::min;
			else
			{
				fprintf(stderr, "bad mode: %s\n", optarg);
				return false;
			}
			break;
		case 'z':
			cmd.gzip = true;
			break;
		case 'o':
			cmd.outdir = optarg;
			break;
		case 'q':
			cmd.quiet = true;
			break;
		default:
			return false;
		}
	}

	if (optind + 1 < argc) return false;
	if (optind < argc && strcmp(argv[optind], "-")) cmd.input = argv[optind];
	return true;
}

static bool write_chunk(const char *dir, size_t index, const chunk &chk)
{
	string name = dir;
	if (name.back() != '/') name.push_back('/');
	name += to_string(index);

	int fd = open(name.c_str(), O_WRONLY | O_TRUNC | O_CREAT, 0644);
	if (fd == -1)
	{
		fprintf(stderr, "chunk file %s open failed with errno %d\n", name.c_str(), errno);
		return false;
	}

	bool ret = chk.writeto(fd);
	if (close(fd) == -1) ret = false;
	return ret;
}

int main(int argc, char *argv[])
{
	cmdline cmd;
	if (parse_args(argc, argv, cmd) == false)
	{
		usage(argv[0]);
		return 1;
	}

	params cfg;
	auto status = configure(cmd.opts, cfg);
	if (status != config_status::ok)
	{
		fprintf(stderr, "%s\n", describe(status));
		return 1;
	}

	if (cmd.outdir && mkdir(cmd.outdir, 0755) == -1 && errno != EEXIST)
	{
		fprintf(stderr, "creating dir %s failed with errno %d\n", cmd.outdir, errno);
		return 1;
	}

	int fd = STDIN_FILENO;
	if (cmd.input)
	{
		fd = open(cmd.input, O_RDONLY);
		if (fd == -1)
		{
			fprintf(stderr, "%s open failed with errno %d\n", cmd.input, errno);
			return 1;
		}
	}

	unique_ptr<byte_source> raw;
	if (cmd.gzip)
	{
		auto gz = new gz_source(fd);
		raw.reset(gz);
		if (gz->is_open() == false)
		{
			if (cmd.input) close(fd);
			return 1;
		}
	}
	else
	{
		raw.reset(new fd_source(fd, fd != STDIN_FILENO));
	}

	capped_source src(*raw, cmd.readsize);
	chunker session(src, cfg);

	size_t count = 0, mx = 0, mn = SIZE_MAX;
	chunk chk;
	chunk_status ret;
	while ((ret = session.next(chk)) == chunk_status::ok)
	{
		if (!cmd.quiet) printf("%ju %zu\n", static_cast<uintmax_t>(chk.offset), chk.size());
		if (cmd.outdir && write_chunk(cmd.outdir, count, chk) == false)
		{
			print_backtrace();
			return 1;
		}

		++count;
		if (chk.size() > mx) mx = chk.size();
		if (chk.size() < mn) mn = chk.size();
	}

	if (ret == chunk_status::io_error)
	{
		fprintf(stderr, "%s: read error: %s\n", cmd.input ? cmd.input : "stdin", strerror(session.last_error()));
		return 1;
	}

	fprintf(stderr, "window %zu width %zu min %zu max %zu%s\n", cfg.window_size, cfg.width,
		cfg.min_chunk_size(), cfg.max_size, cfg.bounded ? "" : " (read block only)");
	fprintf(stderr, "number of chunks : %zu\n", count);
	if (count > 0)
	{
		fprintf(stderr, "average size of chunk : %lfB\n", (double)session.consumed() / (double)count);
		fprintf(stderr, "largest chunk : %zuB\n", mx);
		fprintf(stderr, "smallest chunk : %zuB\n", mn);
	}

	return 0;
}
