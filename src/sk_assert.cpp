/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "sk_assert.h"
#include <cstring>
#include <fcntl.h>
#include <iterator>
#include <string_view>
#include <unistd.h>

BEGIN_NAMESPACE_SK

const char* runtime_error::what() const noexcept
{
	if (!std::empty(buf))
		return buf.c_str();

	const char* const msg = std::runtime_error::what();
	try {
		ccast<decltype(buf)&>(buf) = fmt::format("{}:{}: {}", file, line, msg);
		return buf.c_str();
	} catch (const std::exception&) {
		return msg;
	}
}

bool is_debugger_running()
{
#if defined(__linux__)
	using namespace std::literals;

	int status_fd = open("/proc/self/status", O_RDONLY);
	if (status_fd == -1)
		return false;
	char buf[1024];
	ssize_t num_read = read(status_fd, buf, sizeof(buf) - 1);
	close(status_fd);
	if (num_read <= 0)
		return false;
	buf[num_read] = 0;
	auto tracer = "TracerPid:\t"sv;
	const char* pid = std::strstr(buf, tracer.data());
	if (pid == nullptr)
		return false;
	// TracerPid is 0 without a debugger.
	pid += std::size(tracer);
	return pid < std::end(buf) && *pid != '0';
#else
	return false;
#endif
}

END_NAMESPACE_SK
