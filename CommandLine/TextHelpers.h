#pragma once

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace CommandLine
{
	// One-line preview for `q list`: first line, collapsed whitespace, ellipsis
	// when cut or when more lines follow. width counts code points.
	auto summarize(const std::string& content, const size_t& width = 80) -> std::string;

	// First line is the topic, the rest after the first newline is the body
	auto split_topic_and_body(const std::string& text)
		-> std::tuple<std::optional<std::string>, std::string, std::optional<std::string>>;

	// "<program>: <message>\n" as written to stderr by the tools
	auto error_line(const std::string& program, const std::string& message) -> std::string;

	auto split_lines(const std::string& text) -> std::vector<std::string>;
	auto read_stdin_text(void) -> std::string;

	// Arguments after the command word that are neither options nor option values
	auto positional_arguments(int argc, char* argv[], const std::set<std::string>& value_options) -> std::vector<std::string>;
	auto has_flag(int argc, char* argv[], const std::set<std::string>& names) -> bool;
}
