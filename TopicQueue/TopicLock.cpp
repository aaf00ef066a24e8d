#include "TopicLock.h"

#include <cerrno>
#include <cstring>
#include <format>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

TopicLock::TopicLock(void)
	: fd_(-1)
	, locked_(false)
{
}

TopicLock::~TopicLock(void)
{
	release();
}

auto TopicLock::acquire(const std::string& lock_path, const bool& exclusive) -> std::tuple<bool, std::optional<std::string>>
{
	if (fd_ >= 0)
	{
		return { false, "lock already held" };
	}

	// Append mode: the lock file is never truncated or replaced
	fd_ = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_APPEND | O_CLOEXEC, 0600);
	if (fd_ < 0)
	{
		return { false, std::format("cannot open lock file {}: {}", lock_path, std::strerror(errno)) };
	}

	int operation = exclusive ? LOCK_EX : LOCK_SH;
	while (::flock(fd_, operation) != 0)
	{
		if (errno == EINTR)
		{
			continue;
		}

		auto message = std::format("cannot lock {}: {}", lock_path, std::strerror(errno));
		::close(fd_);
		fd_ = -1;
		return { false, message };
	}

	locked_ = true;

	return { true, std::nullopt };
}

auto TopicLock::release(void) -> void
{
	if (fd_ < 0)
	{
		return;
	}

	if (locked_)
	{
		// Best effort, close() below drops the lock regardless
		::flock(fd_, LOCK_UN);
		locked_ = false;
	}

	::close(fd_);
	fd_ = -1;
}

auto TopicLock::is_locked(void) const -> bool { return locked_; }
