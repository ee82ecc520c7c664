#include <cstdio>
#include <cstring>
#include <cerrno>
#include "chunker.h"
using namespace std;
using namespace ae;

chunker::chunker(byte_source &src, const params &cfg)
	: src(src), cfg(cfg), head(0), emitted(0), eof(false), error(0)
{
	carry.reserve(cfg.max_size);
}

bool chunker::fill(size_t want)
{
	if (head > 0)
	{
		carry.erase(carry.begin(), carry.begin() + head);
		head = 0;
	}

	size_t have = carry.size();
	carry.resize(want);

	while (have < want)
	{
		ssize_t ret = src.read(&carry[have], want - have);
		if (ret == 0)
		{
			eof = true;
			break;
		}
		if (ret < 0)
		{
			error = errno != 0 ? errno : EIO;
			carry.clear();
			return false;
		}
		have += ret;
	}

	carry.resize(have);
	return true;
}

chunk_status chunker::next(chunk &out)
{
	if (error != 0) return chunk_status::io_error;

	for (;;)
	{
		size_t avail = carry.size() - head;
		auto data = reinterpret_cast<const unsigned char *>(carry.data() + head);

		size_t cut = cfg.scan(data, avail, eof, state);
		if (cut > 0)
		{
			out = chunk::frombuffer(data, cut, emitted);
			emitted += cut;
			head += cut;
			state = {};
			return chunk_status::ok;
		}

		if (eof) return chunk_status::end;

		// up to one max_size window first, then grow while no cut is found
		size_t want = avail < cfg.max_size ? cfg.max_size : avail + cfg.max_size;
		if (fill(want) == false)
		{
			fprintf(stderr, "chunk source failed after %ju bytes: %s\n",
				static_cast<uintmax_t>(emitted), strerror(error));
			return chunk_status::io_error;
		}
	}
}
