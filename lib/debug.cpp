#include <cstdio>
#include <cstdlib>
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <execinfo.h>
#include "debug.h"

using namespace std;

void print_backtrace()
{
	fprintf(stderr, "Backtrace:\n");

	void *buf[10];
	int ret = backtrace(buf, 10);
	auto strings = backtrace_symbols(buf, ret);
	if (strings == nullptr)
	{
		fprintf(stderr, "Backtrace failed with errno %d\n", errno);
		return;
	}

	for (int i = 0; i < ret; i++)
	{
		fprintf(stderr, "%s\n", strings[i]);
	}

	free(strings);
}

bool safe_write(int fd, const void *buf, size_t len)
{
	auto p = static_cast<const char *>(buf);
	while (len > 0)
	{
		auto ret = write(fd, p, len);
		if (ret == -1 && errno == EINTR) continue;
		if (ret <= 0)
		{
			fprintf(stderr, "write failed with errno %d (%s)\n", errno, strerror(errno));
			return false;
		}
		p += ret;
		len -= ret;
	}
	return true;
}

ssize_t safe_read(int fd, void *buf, size_t len)
{
	for (;;)
	{
		auto ret = read(fd, buf, len);
		if (ret == -1 && errno == EINTR) continue;
		if (ret == -1)
		{
			int err = errno;
			fprintf(stderr, "read failed with errno %d (%s)\n", err, strerror(err));
			errno = err;
		}
		return ret;
	}
}
