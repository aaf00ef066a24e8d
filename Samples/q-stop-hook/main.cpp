#include "Configurations.h"
#include "GitTopic.h"
#include "HookProtocol.h"
#include "QueueStore.h"

#include "ArgumentParser.h"
#include "Logger.h"

#include <format>
#include <iostream>
#include <utility>

using namespace Utilities;

// Agent stop hook: when the git-derived topic has a queued message, block the
// stop and hand the message back as the next prompt. Never fails the agent,
// so every path exits 0.
auto main(int argc, char* argv[]) -> int
{
	ArgumentParser args(argc, argv);

	Configurations config(std::move(args));

	Logger::handle().file_mode(config.write_file());
	Logger::handle().console_mode(LogTypes::None);
	Logger::handle().log_root(config.log_root());
	Logger::handle().start("q-stop-hook");

	auto [topic, topic_error] = CommandLine::derive_topic();
	if (!topic.has_value())
	{
		Logger::handle().stop();
		return 0;
	}

	QueueStore store(config.base_dir());

	auto [message, error] = store.pop_first(topic.value());
	if (error.has_value())
	{
		Logger::handle().write(LogTypes::Error, std::format("stop hook could not dequeue from '{}': {}", topic.value(), error->message));
		Logger::handle().stop();
		return 0;
	}

	if (!message.has_value())
	{
		Logger::handle().stop();
		return 0;
	}

	std::cout << CommandLine::block_decision(CommandLine::format_dequeue_reason(topic.value(), message->content()), false) << std::flush;

	Logger::handle().write(LogTypes::Information, std::format("dequeued {} from '{}'", message->uuid(), topic.value()));
	Logger::handle().stop();
	return 0;
}
