#include "HookProtocol.h"

#include <nlohmann/json.hpp>

#include <format>

using json = nlohmann::json;

namespace CommandLine
{
	auto extract_qput_body(const std::string& prompt, const std::string& prefix) -> std::optional<std::string>
	{
		auto start = prompt.find_first_not_of(" \t\n\r\f\v");
		if (start == std::string::npos)
		{
			return std::nullopt;
		}

		auto stripped = prompt.substr(start);
		if (stripped.compare(0, prefix.size(), prefix) != 0)
		{
			return std::nullopt;
		}

		// "=qputx" is an ordinary prompt
		if (stripped.size() > prefix.size())
		{
			char next = stripped[prefix.size()];
			if (next != ' ' && next != '\t' && next != '\r' && next != '\n')
			{
				return std::nullopt;
			}
		}

		auto body = stripped.substr(prefix.size());
		if (!body.empty() && (body[0] == ' ' || body[0] == '\t'))
		{
			return body.substr(1);
		}

		auto first = body.find_first_not_of("\r\n");
		if (first == std::string::npos)
		{
			return std::string();
		}

		return body.substr(first);
	}

	auto format_dequeue_reason(const std::string& topic, const std::string& content) -> std::string
	{
		return std::format(
			"Dequeued a queued task from topic '{}'. "
			"Treat the following as the user's next prompt and complete it.\n\n"
			"--- BEGIN QUEUED MESSAGE ---\n"
			"{}\n"
			"--- END QUEUED MESSAGE ---\n",
			topic, content);
	}

	auto block_decision(const std::string& reason, const bool& suppress_output) -> std::string
	{
		json output;
		output["decision"] = "block";
		output["reason"] = reason;
		if (suppress_output)
		{
			output["suppressOutput"] = true;
		}

		return output.dump(-1, ' ', true, json::error_handler_t::replace);
	}
}
