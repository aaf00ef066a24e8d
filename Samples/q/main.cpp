#include "Configurations.h"
#include "Editor.h"
#include "QueueStore.h"
#include "TextHelpers.h"
#include "TopicEncoder.h"

#include "ArgumentParser.h"
#include "Logger.h"

#include <chrono>
#include <format>
#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <tuple>
#include <utility>

using namespace Utilities;

constexpr int EXIT_FOUND = 0;
constexpr int EXIT_NOTHING = 1;
constexpr int EXIT_FAILURE_STATUS = 2;

const std::string VERSION = "0.1.0";
const std::set<std::string> VALUE_OPTIONS = { "--base-dir", "--poll", "--log-root", "--write-console", "--write-file" };

auto print_usage() -> void
{
	std::cout << R"(Topic-based queues (file-backed, flock-locked).

Usage: q <command> [arguments] [options]

Commands:
  put [topic]          Open $EDITOR, enqueue message (first line is the topic when omitted)
  readto [topic]       Read stdin, enqueue message (first line is the topic when omitted)
  get <topic>          Dequeue first message to stdout
  peek <topic> [uuid]  Print message without removing it
  list <topic>         List messages with UUID and a summary
  del <topic> <uuid>   Delete message by UUID
  edit <topic> <uuid>  Open message in $EDITOR, then replace it
  replace <topic> <uuid>
                       Replace message content from stdin
  help                 Show this help message

Options:
  --base-dir <path>    Storage directory (overrides Q_DIR and XDG_STATE_HOME)
  --block              get: wait until a message exists
  --poll <sec>         get: polling interval with --block (default: 0.2)
  --quiet, -q          list: only print UUIDs
  --version, -V        Show version

Exit status: 0 success, 1 nothing found, 2 error.
)";
}

auto report(const QueueError& error) -> int
{
	std::cerr << CommandLine::error_line("q", error.message);
	return EXIT_FAILURE_STATUS;
}

auto report(const std::string& message) -> int
{
	Logger::handle().write(LogTypes::Error, message);
	std::cerr << CommandLine::error_line("q", message);
	return EXIT_FAILURE_STATUS;
}

auto validated_topic(const std::string& topic) -> std::tuple<std::optional<std::string>, std::optional<std::string>>
{
	auto [valid, error] = TopicEncoder::validate_topic(topic);
	if (!valid.has_value())
	{
		return { std::nullopt, error.has_value() ? error->message : "topic is empty" };
	}

	return { valid, std::nullopt };
}

auto enqueue(Configurations& config, const std::string& topic, const std::string& body) -> int
{
	QueueStore store(config.base_dir());

	auto [uuid, error] = store.append(topic, body);
	if (!uuid.has_value())
	{
		return report(error.value_or(make_error(QueueErrorType::Io, "append failed")));
	}

	std::cout << uuid.value() << "\n";
	return EXIT_FOUND;
}

auto cmd_put(int argc, char* argv[], Configurations& config) -> int
{
	auto positionals = CommandLine::positional_arguments(argc, argv, VALUE_OPTIONS);
	auto command = CommandLine::editor_command(config.editor());

	if (!positionals.empty() && !positionals[0].empty())
	{
		auto [topic, topic_error] = validated_topic(positionals[0]);
		if (!topic.has_value())
		{
			return report(topic_error.value());
		}

		auto [body, edit_error] = CommandLine::edit_text("", command);
		if (!body.has_value())
		{
			return report(edit_error.value_or("editor failed"));
		}

		return enqueue(config, topic.value(), body.value());
	}

	auto [text, edit_error] = CommandLine::edit_text("", command);
	if (!text.has_value())
	{
		return report(edit_error.value_or("editor failed"));
	}

	auto [topic, body, split_error] = CommandLine::split_topic_and_body(text.value());
	if (!topic.has_value())
	{
		return report(split_error.value_or("topic is empty"));
	}

	return enqueue(config, topic.value(), body);
}

auto cmd_readto(int argc, char* argv[], Configurations& config) -> int
{
	auto positionals = CommandLine::positional_arguments(argc, argv, VALUE_OPTIONS);
	auto text = CommandLine::read_stdin_text();

	if (!positionals.empty() && !positionals[0].empty())
	{
		auto [topic, topic_error] = validated_topic(positionals[0]);
		if (!topic.has_value())
		{
			return report(topic_error.value());
		}

		return enqueue(config, topic.value(), text);
	}

	auto [topic, body, split_error] = CommandLine::split_topic_and_body(text);
	if (!topic.has_value())
	{
		return report(split_error.value_or("topic is empty"));
	}

	return enqueue(config, topic.value(), body);
}

auto cmd_get(int argc, char* argv[], Configurations& config) -> int
{
	auto positionals = CommandLine::positional_arguments(argc, argv, VALUE_OPTIONS);
	if (positionals.empty())
	{
		return report("get requires a topic");
	}

	auto [topic, topic_error] = validated_topic(positionals[0]);
	if (!topic.has_value())
	{
		return report(topic_error.value());
	}

	bool block = CommandLine::has_flag(argc, argv, { "--block" });
	QueueStore store(config.base_dir());

	// Polling lives here; the store itself never waits for messages
	while (true)
	{
		auto [message, error] = store.pop_first(topic.value());
		if (error.has_value())
		{
			return report(error.value());
		}

		if (message.has_value())
		{
			std::cout << message->content() << std::flush;
			return EXIT_FOUND;
		}

		if (!block)
		{
			return EXIT_NOTHING;
		}

		std::this_thread::sleep_for(std::chrono::milliseconds(config.poll_interval_ms()));
	}
}

auto cmd_peek(int argc, char* argv[], Configurations& config) -> int
{
	auto positionals = CommandLine::positional_arguments(argc, argv, VALUE_OPTIONS);
	if (positionals.empty())
	{
		return report("peek requires a topic");
	}

	auto [topic, topic_error] = validated_topic(positionals[0]);
	if (!topic.has_value())
	{
		return report(topic_error.value());
	}

	QueueStore store(config.base_dir());

	std::optional<QueueMessage> message;
	std::optional<QueueError> error;
	if (positionals.size() > 1 && !positionals[1].empty())
	{
		std::tie(message, error) = store.get_by_uuid(topic.value(), positionals[1]);
	}
	else
	{
		std::tie(message, error) = store.peek_first(topic.value());
	}

	if (error.has_value())
	{
		return report(error.value());
	}

	if (!message.has_value())
	{
		return EXIT_NOTHING;
	}

	std::cout << message->content() << std::flush;
	return EXIT_FOUND;
}

auto cmd_list(int argc, char* argv[], Configurations& config) -> int
{
	auto positionals = CommandLine::positional_arguments(argc, argv, VALUE_OPTIONS);
	if (positionals.empty())
	{
		return report("list requires a topic");
	}

	auto [topic, topic_error] = validated_topic(positionals[0]);
	if (!topic.has_value())
	{
		return report(topic_error.value());
	}

	bool quiet = CommandLine::has_flag(argc, argv, { "--quiet", "-q" });
	QueueStore store(config.base_dir());

	auto [messages, error] = store.list_messages(topic.value());
	if (error.has_value())
	{
		return report(error.value());
	}

	for (const auto& message : messages)
	{
		if (quiet)
		{
			std::cout << message.uuid() << "\n";
			continue;
		}

		std::cout << std::format("{} {}\n", message.uuid(), CommandLine::summarize(message.content()));
	}

	return EXIT_FOUND;
}

auto cmd_del(int argc, char* argv[], Configurations& config) -> int
{
	auto positionals = CommandLine::positional_arguments(argc, argv, VALUE_OPTIONS);
	if (positionals.size() < 2)
	{
		return report("del requires a topic and a uuid");
	}

	auto [topic, topic_error] = validated_topic(positionals[0]);
	if (!topic.has_value())
	{
		return report(topic_error.value());
	}

	QueueStore store(config.base_dir());

	auto [deleted, error] = store.delete_by_uuid(topic.value(), positionals[1]);
	if (error.has_value())
	{
		return report(error.value());
	}

	return deleted ? EXIT_FOUND : EXIT_NOTHING;
}

auto cmd_edit(int argc, char* argv[], Configurations& config) -> int
{
	auto positionals = CommandLine::positional_arguments(argc, argv, VALUE_OPTIONS);
	if (positionals.size() < 2)
	{
		return report("edit requires a topic and a uuid");
	}

	auto [topic, topic_error] = validated_topic(positionals[0]);
	if (!topic.has_value())
	{
		return report(topic_error.value());
	}

	auto uuid = positionals[1];
	QueueStore store(config.base_dir());

	// Shared lock only while reading; nothing is held while the editor is open
	auto [message, get_error] = store.get_by_uuid(topic.value(), uuid);
	if (get_error.has_value())
	{
		return report(get_error.value());
	}

	if (!message.has_value())
	{
		return EXIT_NOTHING;
	}

	auto [edited, edit_error] = CommandLine::edit_text(message->content(), CommandLine::editor_command(config.editor()));
	if (!edited.has_value())
	{
		return report(edit_error.value_or("editor failed"));
	}

	auto [replaced, replace_error] = store.replace_by_uuid(topic.value(), uuid, edited.value());
	if (replace_error.has_value())
	{
		return report(replace_error.value());
	}

	if (!replaced)
	{
		std::cerr << "q edit: message changed before replace; edits discarded\n";
		return EXIT_NOTHING;
	}

	return EXIT_FOUND;
}

auto cmd_replace(int argc, char* argv[], Configurations& config) -> int
{
	auto positionals = CommandLine::positional_arguments(argc, argv, VALUE_OPTIONS);
	if (positionals.size() < 2)
	{
		return report("replace requires a topic and a uuid");
	}

	auto [topic, topic_error] = validated_topic(positionals[0]);
	if (!topic.has_value())
	{
		return report(topic_error.value());
	}

	QueueStore store(config.base_dir());

	auto body = CommandLine::read_stdin_text();
	auto [replaced, error] = store.replace_by_uuid(topic.value(), positionals[1], body);
	if (error.has_value())
	{
		return report(error.value());
	}

	return replaced ? EXIT_FOUND : EXIT_NOTHING;
}

auto main(int argc, char* argv[]) -> int
{
	if (CommandLine::has_flag(argc, argv, { "--version", "-V" }))
	{
		std::cout << std::format("q {}\n", VERSION);
		return EXIT_FOUND;
	}

	if (argc < 2 || CommandLine::has_flag(argc, argv, { "--help", "-h" }))
	{
		print_usage();
		return EXIT_FOUND;
	}

	ArgumentParser args(argc, argv);

	// Load configuration first
	Configurations config(std::move(args));

	Logger::handle().file_mode(config.write_file());
	Logger::handle().console_mode(config.write_console());
	Logger::handle().log_root(config.log_root());
	Logger::handle().start("q");

	std::string command = argv[1];
	int result = EXIT_FOUND;

	if (command == "help")
	{
		print_usage();
	}
	else if (command == "put")
	{
		result = cmd_put(argc, argv, config);
	}
	else if (command == "readto")
	{
		result = cmd_readto(argc, argv, config);
	}
	else if (command == "get")
	{
		result = cmd_get(argc, argv, config);
	}
	else if (command == "peek")
	{
		result = cmd_peek(argc, argv, config);
	}
	else if (command == "list")
	{
		result = cmd_list(argc, argv, config);
	}
	else if (command == "del")
	{
		result = cmd_del(argc, argv, config);
	}
	else if (command == "edit")
	{
		result = cmd_edit(argc, argv, config);
	}
	else if (command == "replace")
	{
		result = cmd_replace(argc, argv, config);
	}
	else
	{
		report(std::format("unknown command: {}", command));
		print_usage();
		result = EXIT_FAILURE_STATUS;
	}

	Logger::handle().stop();
	return result;
}
