#pragma once

#include <cstddef>
#include <sys/types.h>

void print_backtrace();
bool safe_write(int fd, const void *buf, size_t len);
ssize_t safe_read(int fd, void *buf, size_t len);
