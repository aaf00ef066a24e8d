#pragma once

#include <optional>
#include <string>

namespace CommandLine
{
	inline const std::string QPUT_PREFIX = "=qput";

	// Body of a "=qput ..." prompt, or nullopt when the prompt is something else
	auto extract_qput_body(const std::string& prompt, const std::string& prefix = QPUT_PREFIX) -> std::optional<std::string>;

	auto format_dequeue_reason(const std::string& topic, const std::string& content) -> std::string;

	// {"decision":"block","reason":...} as written to the hook's stdout
	auto block_decision(const std::string& reason, const bool& suppress_output) -> std::string;
}
