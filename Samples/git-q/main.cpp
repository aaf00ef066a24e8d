#include "Configurations.h"
#include "Editor.h"
#include "GitTopic.h"
#include "QueueStore.h"
#include "TextHelpers.h"

#include "ArgumentParser.h"
#include "Logger.h"

#include <chrono>
#include <format>
#include <iostream>
#include <string>
#include <thread>
#include <utility>

using namespace Utilities;

const std::string VERSION = "0.1.0";

auto print_usage() -> void
{
	std::cout << R"(Git-aware queue operations (derives topic from remote:branch).

Usage: git-q <command> [options]

Commands:
  put                  Open $EDITOR, enqueue into the git-derived topic
  readto               Read stdin, enqueue into the git-derived topic
  get                  Dequeue from the git-derived topic
  help                 Show this help message

Options:
  --base-dir <path>    Storage directory (overrides Q_DIR and XDG_STATE_HOME)
  --block              get: wait until a message exists
  --poll <sec>         get: polling interval with --block (default: 0.2)
  --version, -V        Show version
)";
}

auto report(const std::string& message) -> int
{
	Logger::handle().write(LogTypes::Error, message);
	std::cerr << CommandLine::error_line("git q", message);
	return 2;
}

auto topic_or_exit(void) -> std::optional<std::string>
{
	auto [topic, error] = CommandLine::derive_topic();
	if (!topic.has_value())
	{
		std::cerr << CommandLine::error_line("git q", error.value_or("cannot derive topic"));
		return std::nullopt;
	}

	return topic;
}

auto enqueue(Configurations& config, const std::string& topic, const std::string& body) -> int
{
	QueueStore store(config.base_dir());

	auto [uuid, error] = store.append(topic, body);
	if (!uuid.has_value())
	{
		return report(error.has_value() ? error->message : "append failed");
	}

	std::cout << uuid.value() << "\n";
	return 0;
}

auto cmd_put(Configurations& config) -> int
{
	auto topic = topic_or_exit();
	if (!topic.has_value())
	{
		return 1;
	}

	auto [body, edit_error] = CommandLine::edit_text("", CommandLine::editor_command(config.editor()));
	if (!body.has_value())
	{
		return report(edit_error.value_or("editor failed"));
	}

	return enqueue(config, topic.value(), body.value());
}

auto cmd_readto(Configurations& config) -> int
{
	auto topic = topic_or_exit();
	if (!topic.has_value())
	{
		return 1;
	}

	return enqueue(config, topic.value(), CommandLine::read_stdin_text());
}

auto cmd_get(int argc, char* argv[], Configurations& config) -> int
{
	auto topic = topic_or_exit();
	if (!topic.has_value())
	{
		return 1;
	}

	bool block = CommandLine::has_flag(argc, argv, { "--block" });
	QueueStore store(config.base_dir());

	while (true)
	{
		auto [message, error] = store.pop_first(topic.value());
		if (error.has_value())
		{
			return report(error->message);
		}

		if (message.has_value())
		{
			std::cout << message->content() << std::flush;
			return 0;
		}

		if (!block)
		{
			return 1;
		}

		std::this_thread::sleep_for(std::chrono::milliseconds(config.poll_interval_ms()));
	}
}

auto main(int argc, char* argv[]) -> int
{
	if (CommandLine::has_flag(argc, argv, { "--version", "-V" }))
	{
		std::cout << std::format("git-q {}\n", VERSION);
		return 0;
	}

	if (argc < 2 || CommandLine::has_flag(argc, argv, { "--help", "-h" }))
	{
		print_usage();
		return 0;
	}

	ArgumentParser args(argc, argv);

	Configurations config(std::move(args));

	Logger::handle().file_mode(config.write_file());
	Logger::handle().console_mode(config.write_console());
	Logger::handle().log_root(config.log_root());
	Logger::handle().start("git-q");

	std::string command = argv[1];
	int result = 0;

	if (command == "help")
	{
		print_usage();
	}
	else if (command == "put")
	{
		result = cmd_put(config);
	}
	else if (command == "readto")
	{
		result = cmd_readto(config);
	}
	else if (command == "get")
	{
		result = cmd_get(argc, argv, config);
	}
	else
	{
		report(std::format("unknown command: {}", command));
		print_usage();
		result = 2;
	}

	Logger::handle().stop();
	return result;
}
