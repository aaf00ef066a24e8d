#include "TextHelpers.h"

#include "TopicEncoder.h"

#include <algorithm>
#include <format>
#include <iostream>
#include <iterator>

namespace
{
	const std::string ELLIPSIS = "\xE2\x80\xA6";

	auto collapse_whitespace(const std::string& text) -> std::string
	{
		std::string collapsed;
		bool in_space = false;
		size_t index = 0;
		while (index < text.size())
		{
			auto length = TopicEncoder::whitespace_length(text, index);
			if (length > 0)
			{
				in_space = true;
				index += length;
				continue;
			}

			if (in_space && !collapsed.empty())
			{
				collapsed.push_back(' ');
			}
			in_space = false;
			collapsed.push_back(text[index]);
			++index;
		}

		return collapsed;
	}

	// Splits UTF-8 into code points; stray continuation bytes count as one each
	auto code_points(const std::string& text) -> std::vector<std::string>
	{
		std::vector<std::string> points;
		size_t index = 0;
		while (index < text.size())
		{
			auto lead = static_cast<unsigned char>(text[index]);
			size_t length = 1;
			if (lead >= 0xF0)
			{
				length = 4;
			}
			else if (lead >= 0xE0)
			{
				length = 3;
			}
			else if (lead >= 0xC0)
			{
				length = 2;
			}

			length = std::min(length, text.size() - index);
			points.push_back(text.substr(index, length));
			index += length;
		}

		return points;
	}

	auto take(const std::vector<std::string>& points, const size_t& count) -> std::string
	{
		std::string result;
		for (size_t i = 0; i < count && i < points.size(); ++i)
		{
			result += points[i];
		}
		return result;
	}
}

namespace CommandLine
{
	auto split_lines(const std::string& text) -> std::vector<std::string>
	{
		std::vector<std::string> lines;
		std::string current;
		size_t index = 0;
		while (index < text.size())
		{
			char c = text[index];
			if (c == '\n' || c == '\r')
			{
				lines.push_back(current);
				current.clear();
				if (c == '\r' && index + 1 < text.size() && text[index + 1] == '\n')
				{
					++index;
				}
				++index;
				continue;
			}

			current.push_back(c);
			++index;
		}

		if (!current.empty())
		{
			lines.push_back(current);
		}

		return lines;
	}

	auto summarize(const std::string& content, const size_t& width) -> std::string
	{
		auto lines = split_lines(content);
		auto first = collapse_whitespace(lines.empty() ? std::string() : lines.front());
		if (first.empty())
		{
			first = "(empty)";
		}

		bool more = lines.size() > 1;
		auto points = code_points(first);
		auto keep = width > 0 ? width - 1 : 0;

		if (points.size() > width)
		{
			return take(points, keep) + ELLIPSIS;
		}

		if (more && points.size() + 2 <= width)
		{
			return first + " " + ELLIPSIS;
		}

		if (more)
		{
			return take(points, keep) + ELLIPSIS;
		}

		return first;
	}

	auto split_topic_and_body(const std::string& text)
		-> std::tuple<std::optional<std::string>, std::string, std::optional<std::string>>
	{
		std::string first = text;
		std::string rest;

		auto newline = text.find('\n');
		if (newline != std::string::npos)
		{
			first = text.substr(0, newline);
			rest = text.substr(newline + 1);
		}

		auto topic = TopicEncoder::trim(first);
		if (topic.empty())
		{
			return { std::nullopt, "", "topic is empty" };
		}

		return { topic, rest, std::nullopt };
	}

	auto error_line(const std::string& program, const std::string& message) -> std::string
	{
		return std::format("{}: {}\n", program, message);
	}

	auto read_stdin_text(void) -> std::string
	{
		return std::string((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
	}

	auto positional_arguments(int argc, char* argv[], const std::set<std::string>& value_options) -> std::vector<std::string>
	{
		std::vector<std::string> positionals;
		for (int index = 2; index < argc; ++index)
		{
			std::string argument = argv[index];
			if (argument.size() > 1 && argument[0] == '-')
			{
				if (value_options.find(argument) != value_options.end())
				{
					++index;
				}
				continue;
			}

			positionals.push_back(argument);
		}

		return positionals;
	}

	auto has_flag(int argc, char* argv[], const std::set<std::string>& names) -> bool
	{
		for (int index = 1; index < argc; ++index)
		{
			if (names.find(argv[index]) != names.end())
			{
				return true;
			}
		}

		return false;
	}
}
