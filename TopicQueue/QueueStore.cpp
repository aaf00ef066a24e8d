#include "QueueStore.h"

#include "TopicEncoder.h"

#include "Logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

using json = nlohmann::json;

namespace
{
	constexpr int ENVELOPE_VERSION = 1;

	auto is_blank(const std::string& text) -> bool
	{
		return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
	}

	auto corrupt(const std::string& topic, const std::string& file_path, const std::string& detail = "") -> QueueError
	{
		auto message = std::format("corrupt queue file for topic '{}': {}", topic, file_path);
		if (!detail.empty())
		{
			message += std::format(" ({})", detail);
		}

		Utilities::Logger::handle().write(Utilities::LogTypes::Error, message);

		return make_error(QueueErrorType::Corrupt, message);
	}

	auto io_error(const std::string& message) -> QueueError
	{
		Utilities::Logger::handle().write(Utilities::LogTypes::Error, message);

		return make_error(QueueErrorType::Io, message);
	}
}

QueueStore::QueueStore(const std::string& base_dir)
	: base_dir_(base_dir)
{
}

QueueStore::~QueueStore(void) {}

auto QueueStore::base_dir(void) const -> std::string { return base_dir_; }

auto QueueStore::ensure_base_dir(void) -> std::tuple<bool, std::optional<QueueError>>
{
	std::error_code ec;
	if (!std::filesystem::exists(base_dir_, ec))
	{
		std::filesystem::create_directories(base_dir_, ec);
		if (ec)
		{
			return { false, io_error(std::format("failed to create directory {}: {}", base_dir_, ec.message())) };
		}
	}

	// Best effort, some filesystems refuse chmod
	std::filesystem::permissions(base_dir_, std::filesystem::perms::owner_all, std::filesystem::perm_options::replace, ec);

	return { true, std::nullopt };
}

auto QueueStore::paths_for_topic(const std::string& topic) const
	-> std::tuple<std::optional<TopicPaths>, std::optional<QueueError>>
{
	return TopicEncoder::paths_for_topic(base_dir_, topic);
}

auto QueueStore::append(const std::string& topic, const std::string& content)
	-> std::tuple<std::optional<std::string>, std::optional<QueueError>>
{
	auto [valid_topic, topic_error] = TopicEncoder::validate_topic(topic);
	if (!valid_topic.has_value())
	{
		return { std::nullopt, topic_error };
	}

	auto name = valid_topic.value();
	auto message = QueueMessage::create(content);

	return with_lock<std::optional<std::string>>(name, true,
		[&]() -> std::tuple<std::optional<std::string>, std::optional<QueueError>>
		{
			auto [messages, load_error] = load_unlocked(name);
			if (load_error.has_value())
			{
				return { std::nullopt, load_error };
			}

			messages.push_back(message);

			auto [saved, save_error] = save_unlocked(name, messages);
			if (!saved)
			{
				return { std::nullopt, save_error };
			}

			return { message.uuid(), std::nullopt };
		});
}

auto QueueStore::pop_first(const std::string& topic) -> std::tuple<std::optional<QueueMessage>, std::optional<QueueError>>
{
	auto [valid_topic, topic_error] = TopicEncoder::validate_topic(topic);
	if (!valid_topic.has_value())
	{
		return { std::nullopt, topic_error };
	}

	auto name = valid_topic.value();

	return with_lock<std::optional<QueueMessage>>(name, true,
		[&]() -> std::tuple<std::optional<QueueMessage>, std::optional<QueueError>>
		{
			auto [messages, load_error] = load_unlocked(name);
			if (load_error.has_value())
			{
				return { std::nullopt, load_error };
			}

			if (messages.empty())
			{
				return { std::nullopt, std::nullopt };
			}

			auto first = messages.front();
			messages.erase(messages.begin());

			auto [saved, save_error] = save_unlocked(name, messages);
			if (!saved)
			{
				return { std::nullopt, save_error };
			}

			return { first, std::nullopt };
		});
}

auto QueueStore::peek_first(const std::string& topic) -> std::tuple<std::optional<QueueMessage>, std::optional<QueueError>>
{
	auto [valid_topic, topic_error] = TopicEncoder::validate_topic(topic);
	if (!valid_topic.has_value())
	{
		return { std::nullopt, topic_error };
	}

	auto name = valid_topic.value();

	return with_lock<std::optional<QueueMessage>>(name, false,
		[&]() -> std::tuple<std::optional<QueueMessage>, std::optional<QueueError>>
		{
			auto [messages, load_error] = load_unlocked(name);
			if (load_error.has_value())
			{
				return { std::nullopt, load_error };
			}

			if (messages.empty())
			{
				return { std::nullopt, std::nullopt };
			}

			return { messages.front(), std::nullopt };
		});
}

auto QueueStore::get_by_uuid(const std::string& topic, const std::string& uuid)
	-> std::tuple<std::optional<QueueMessage>, std::optional<QueueError>>
{
	auto [valid_topic, topic_error] = TopicEncoder::validate_topic(topic);
	if (!valid_topic.has_value())
	{
		return { std::nullopt, topic_error };
	}

	auto name = valid_topic.value();

	return with_lock<std::optional<QueueMessage>>(name, false,
		[&]() -> std::tuple<std::optional<QueueMessage>, std::optional<QueueError>>
		{
			auto [messages, load_error] = load_unlocked(name);
			if (load_error.has_value())
			{
				return { std::nullopt, load_error };
			}

			for (const auto& message : messages)
			{
				if (message.has_uuid(uuid))
				{
					return { message, std::nullopt };
				}
			}

			return { std::nullopt, std::nullopt };
		});
}

auto QueueStore::list_messages(const std::string& topic) -> std::tuple<std::vector<QueueMessage>, std::optional<QueueError>>
{
	auto [valid_topic, topic_error] = TopicEncoder::validate_topic(topic);
	if (!valid_topic.has_value())
	{
		return { std::vector<QueueMessage> {}, topic_error };
	}

	auto name = valid_topic.value();

	return with_lock<std::vector<QueueMessage>>(name, false,
		[&]() -> std::tuple<std::vector<QueueMessage>, std::optional<QueueError>>
		{
			return load_unlocked(name);
		});
}

auto QueueStore::delete_by_uuid(const std::string& topic, const std::string& uuid) -> std::tuple<bool, std::optional<QueueError>>
{
	auto [valid_topic, topic_error] = TopicEncoder::validate_topic(topic);
	if (!valid_topic.has_value())
	{
		return { false, topic_error };
	}

	auto name = valid_topic.value();

	return with_lock<bool>(name, true,
		[&]() -> std::tuple<bool, std::optional<QueueError>>
		{
			auto [messages, load_error] = load_unlocked(name);
			if (load_error.has_value())
			{
				return { false, load_error };
			}

			auto before = messages.size();
			messages.erase(std::remove_if(messages.begin(), messages.end(),
				[&uuid](const QueueMessage& message) { return message.has_uuid(uuid); }), messages.end());

			if (messages.size() == before)
			{
				return { false, std::nullopt };
			}

			return save_unlocked(name, messages);
		});
}

auto QueueStore::replace_by_uuid(const std::string& topic, const std::string& uuid, const std::string& content)
	-> std::tuple<bool, std::optional<QueueError>>
{
	auto [valid_topic, topic_error] = TopicEncoder::validate_topic(topic);
	if (!valid_topic.has_value())
	{
		return { false, topic_error };
	}

	auto name = valid_topic.value();

	return with_lock<bool>(name, true,
		[&]() -> std::tuple<bool, std::optional<QueueError>>
		{
			auto [messages, load_error] = load_unlocked(name);
			if (load_error.has_value())
			{
				return { false, load_error };
			}

			auto target = std::find_if(messages.begin(), messages.end(),
				[&uuid](const QueueMessage& message) { return message.has_uuid(uuid); });
			if (target == messages.end())
			{
				return { false, std::nullopt };
			}

			target->replace_content(content);

			return save_unlocked(name, messages);
		});
}

auto QueueStore::load_unlocked(const std::string& topic) -> std::tuple<std::vector<QueueMessage>, std::optional<QueueError>>
{
	auto [paths, path_error] = paths_for_topic(topic);
	if (!paths.has_value())
	{
		return { std::vector<QueueMessage> {}, path_error };
	}

	std::error_code ec;
	if (!std::filesystem::exists(paths->data, ec))
	{
		return { std::vector<QueueMessage> {}, std::nullopt };
	}

	if (!std::filesystem::is_regular_file(paths->data, ec))
	{
		return { std::vector<QueueMessage> {}, io_error(std::format("not a regular file: {}", paths->data)) };
	}

	std::ifstream file(paths->data, std::ios::in | std::ios::binary);
	if (!file.is_open())
	{
		// Lost a race with a rename, still an empty queue
		if (!std::filesystem::exists(paths->data, ec))
		{
			return { std::vector<QueueMessage> {}, std::nullopt };
		}

		return { std::vector<QueueMessage> {}, io_error(std::format("cannot open file: {}", paths->data)) };
	}

	std::string raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
	if (file.bad())
	{
		return { std::vector<QueueMessage> {}, io_error(std::format("cannot read file: {}", paths->data)) };
	}
	file.close();

	if (is_blank(raw))
	{
		return { std::vector<QueueMessage> {}, std::nullopt };
	}

	return parse_messages(topic, paths->data, raw);
}

auto QueueStore::parse_messages(const std::string& topic, const std::string& file_path, const std::string& raw)
	-> std::tuple<std::vector<QueueMessage>, std::optional<QueueError>>
{
	json data;
	try
	{
		data = json::parse(raw);
	}
	catch (const json::parse_error& e)
	{
		return { std::vector<QueueMessage> {}, corrupt(topic, file_path, e.what()) };
	}

	const json* entries = nullptr;
	if (data.is_object() && data.contains("messages"))
	{
		if (!data["messages"].is_array())
		{
			return { std::vector<QueueMessage> {}, corrupt(topic, file_path, "messages not a list") };
		}

		entries = &data["messages"];
	}
	else if (data.is_array())
	{
		// Files written before the envelope existed
		entries = &data;
	}
	else
	{
		return { std::vector<QueueMessage> {}, corrupt(topic, file_path) };
	}

	std::vector<QueueMessage> messages;
	messages.reserve(entries->size());
	for (const auto& entry : *entries)
	{
		auto message = QueueMessage::from_json(entry);
		if (message.has_value())
		{
			messages.push_back(message.value());
		}
	}

	return { messages, std::nullopt };
}

auto QueueStore::save_unlocked(const std::string& topic, const std::vector<QueueMessage>& messages)
	-> std::tuple<bool, std::optional<QueueError>>
{
	auto [paths, path_error] = paths_for_topic(topic);
	if (!paths.has_value())
	{
		return { false, path_error };
	}

	auto [dir_ok, dir_error] = ensure_base_dir();
	if (!dir_ok)
	{
		return { false, dir_error };
	}

	json envelope;
	envelope["version"] = ENVELOPE_VERSION;
	envelope["topic"] = topic;
	envelope["messages"] = json::array();
	for (const auto& message : messages)
	{
		envelope["messages"].push_back(message.to_json());
	}

	std::string content;
	try
	{
		content = envelope.dump(2) + "\n";
	}
	catch (const json::type_error& e)
	{
		return { false, make_error(QueueErrorType::Validation, std::format("cannot serialize topic '{}': {}", topic, e.what())) };
	}

	auto [temp_path, temp_error] = write_temp_file(paths->data, content);
	if (!temp_path.has_value())
	{
		return { false, temp_error };
	}

	// The only visible mutation: readers see the old file or the new one
	std::error_code ec;
	std::filesystem::rename(temp_path.value(), paths->data, ec);
	if (ec)
	{
		auto error = io_error(std::format("rename failed: {} -> {}: {}", temp_path.value(), paths->data, ec.message()));

		std::error_code remove_ec;
		std::filesystem::remove(temp_path.value(), remove_ec);

		return { false, error };
	}

	return { true, std::nullopt };
}

auto QueueStore::write_temp_file(const std::string& data_path, const std::string& content)
	-> std::tuple<std::optional<std::string>, std::optional<QueueError>>
{
	auto pattern = std::format("{}.XXXXXX.tmp", data_path);
	std::vector<char> name(pattern.begin(), pattern.end());
	name.push_back('\0');

	int fd = ::mkstemps(name.data(), 4);
	if (fd < 0)
	{
		return { std::nullopt, io_error(std::format("cannot create temp file for {}: {}", data_path, std::strerror(errno))) };
	}

	std::string temp_path(name.data());

	auto fail = [&](const std::string& step) -> std::tuple<std::optional<std::string>, std::optional<QueueError>>
	{
		auto error = io_error(std::format("{} failed for {}: {}", step, temp_path, std::strerror(errno)));
		::close(fd);
		::unlink(temp_path.c_str());
		return { std::nullopt, error };
	};

	size_t written = 0;
	while (written < content.size())
	{
		auto result = ::write(fd, content.data() + written, content.size() - written);
		if (result < 0)
		{
			if (errno == EINTR)
			{
				continue;
			}
			return fail("write");
		}
		written += static_cast<size_t>(result);
	}

	if (::fsync(fd) != 0)
	{
		return fail("fsync");
	}

	if (::fchmod(fd, S_IRUSR | S_IWUSR) != 0)
	{
		Utilities::Logger::handle().write(Utilities::LogTypes::Information, std::format("cannot restrict mode of {}: {}", temp_path, std::strerror(errno)));
	}

	if (::close(fd) != 0)
	{
		auto error = io_error(std::format("close failed for {}: {}", temp_path, std::strerror(errno)));
		::unlink(temp_path.c_str());
		return { std::nullopt, error };
	}

	return { temp_path, std::nullopt };
}
