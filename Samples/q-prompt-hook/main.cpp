#include "Configurations.h"
#include "GitTopic.h"
#include "HookProtocol.h"
#include "QueueStore.h"
#include "TextHelpers.h"
#include "TopicEncoder.h"

#include "ArgumentParser.h"
#include "Logger.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <format>
#include <iostream>
#include <utility>

using namespace Utilities;
using json = nlohmann::json;

// Either a JSON block decision on stdout (exit 0) or, with CLAUDE_QPUT_EXIT2=1,
// the message on stderr with exit 2.
auto block_with_message(const std::string& message, const bool& use_exit2) -> int
{
	if (use_exit2)
	{
		std::cerr << message << "\n";
		return 2;
	}

	std::cout << CommandLine::block_decision(message, true) << std::flush;
	return 0;
}

auto prompt_text(const json& payload) -> std::string
{
	if (!payload.is_object() || !payload.contains("prompt") || payload["prompt"].is_null())
	{
		return "";
	}

	if (payload["prompt"].is_string())
	{
		return payload["prompt"].get<std::string>();
	}

	return payload["prompt"].dump();
}

auto run_hook(Configurations& config) -> int
{
	json payload;
	try
	{
		payload = json::parse(CommandLine::read_stdin_text());
	}
	catch (const json::parse_error&)
	{
		// Not a hook payload, let the prompt through
		return 0;
	}

	auto body = CommandLine::extract_qput_body(prompt_text(payload));
	if (!body.has_value())
	{
		return 0;
	}

	const char* exit2 = std::getenv("CLAUDE_QPUT_EXIT2");
	bool use_exit2 = exit2 != nullptr && std::string(exit2) == "1";

	auto [topic, topic_error] = CommandLine::derive_topic();
	if (!topic.has_value())
	{
		return block_with_message(std::format("qput: {}", topic_error.value_or("cannot derive topic")), use_exit2);
	}

	if (TopicEncoder::trim(body.value()).empty())
	{
		return block_with_message("qput: nothing to enqueue. Use '=qput <message>' or '=qput\\n<multi-line message>'.", use_exit2);
	}

	QueueStore store(config.base_dir());

	auto [uuid, error] = store.append(topic.value(), body.value());
	if (!uuid.has_value())
	{
		auto reason = error.has_value() ? error->message : "append failed";
		return block_with_message(std::format("qput: failed to enqueue to '{}': {}", topic.value(), reason), use_exit2);
	}

	Logger::handle().write(LogTypes::Information, std::format("queued {} to '{}'", uuid.value(), topic.value()));

	return block_with_message(std::format("Queued to '{}'.", topic.value()), use_exit2);
}

auto main(int argc, char* argv[]) -> int
{
	ArgumentParser args(argc, argv);

	Configurations config(std::move(args));

	Logger::handle().file_mode(config.write_file());
	Logger::handle().console_mode(LogTypes::None);
	Logger::handle().log_root(config.log_root());
	Logger::handle().start("q-prompt-hook");

	int result = run_hook(config);

	Logger::handle().stop();
	return result;
}
