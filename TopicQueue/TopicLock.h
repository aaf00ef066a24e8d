#pragma once

#include <optional>
#include <string>
#include <tuple>

// Scoped flock(2) on a topic's lock file. Closing the descriptor releases
// the lock, so the destructor covers every exit path.
class TopicLock
{
public:
	TopicLock(void);
	~TopicLock(void);

	TopicLock(const TopicLock&) = delete;
	TopicLock& operator=(const TopicLock&) = delete;

	auto acquire(const std::string& lock_path, const bool& exclusive) -> std::tuple<bool, std::optional<std::string>>;
	auto release(void) -> void;

	auto is_locked(void) const -> bool;

private:
	int fd_;
	bool locked_;
};
