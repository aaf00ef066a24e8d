#pragma once

#include "QueueMessage.h"
#include "QueueTypes.h"
#include "TopicLock.h"

#include <optional>
#include <string>
#include <tuple>
#include <vector>

// Per-topic FIFO queues under one directory. Processes sharing the directory
// coordinate only through the lock files, so no in-process mutex is needed.
class QueueStore
{
public:
	explicit QueueStore(const std::string& base_dir);
	~QueueStore(void);

	auto base_dir(void) const -> std::string;
	auto ensure_base_dir(void) -> std::tuple<bool, std::optional<QueueError>>;
	auto paths_for_topic(const std::string& topic) const -> std::tuple<std::optional<TopicPaths>, std::optional<QueueError>>;

	auto append(const std::string& topic, const std::string& content)
		-> std::tuple<std::optional<std::string>, std::optional<QueueError>>;
	auto pop_first(const std::string& topic) -> std::tuple<std::optional<QueueMessage>, std::optional<QueueError>>;
	auto peek_first(const std::string& topic) -> std::tuple<std::optional<QueueMessage>, std::optional<QueueError>>;
	auto get_by_uuid(const std::string& topic, const std::string& uuid)
		-> std::tuple<std::optional<QueueMessage>, std::optional<QueueError>>;
	auto list_messages(const std::string& topic) -> std::tuple<std::vector<QueueMessage>, std::optional<QueueError>>;
	auto delete_by_uuid(const std::string& topic, const std::string& uuid) -> std::tuple<bool, std::optional<QueueError>>;
	auto replace_by_uuid(const std::string& topic, const std::string& uuid, const std::string& content)
		-> std::tuple<bool, std::optional<QueueError>>;

	// Runs body() while holding the topic's lock; body returns the same tuple
	// shape as the caller.
	template <typename Result, typename Body>
	auto with_lock(const std::string& topic, const bool& exclusive, Body&& body)
		-> std::tuple<Result, std::optional<QueueError>>;

private:
	auto load_unlocked(const std::string& topic) -> std::tuple<std::vector<QueueMessage>, std::optional<QueueError>>;
	auto save_unlocked(const std::string& topic, const std::vector<QueueMessage>& messages)
		-> std::tuple<bool, std::optional<QueueError>>;

	auto parse_messages(const std::string& topic, const std::string& file_path, const std::string& raw)
		-> std::tuple<std::vector<QueueMessage>, std::optional<QueueError>>;
	auto write_temp_file(const std::string& data_path, const std::string& content)
		-> std::tuple<std::optional<std::string>, std::optional<QueueError>>;

private:
	std::string base_dir_;
};

template <typename Result, typename Body>
auto QueueStore::with_lock(const std::string& topic, const bool& exclusive, Body&& body)
	-> std::tuple<Result, std::optional<QueueError>>
{
	auto [paths, path_error] = paths_for_topic(topic);
	if (!paths.has_value())
	{
		return { Result {}, path_error };
	}

	auto [dir_ok, dir_error] = ensure_base_dir();
	if (!dir_ok)
	{
		return { Result {}, dir_error };
	}

	TopicLock lock;
	auto [locked, lock_error] = lock.acquire(paths->lock, exclusive);
	if (!locked)
	{
		return { Result {}, make_error(QueueErrorType::Io, lock_error.value_or("lock failed")) };
	}

	return body();
}
