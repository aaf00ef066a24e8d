#include "GitTopic.h"

#include "TextHelpers.h"
#include "TopicEncoder.h"

#include <array>
#include <cstdio>
#include <format>

#include <sys/wait.h>

namespace
{
	auto shell_quote(const std::string& argument) -> std::string
	{
		std::string quoted = "'";
		for (const char c : argument)
		{
			if (c == '\'')
			{
				quoted += "'\\''";
				continue;
			}
			quoted.push_back(c);
		}
		quoted += "'";
		return quoted;
	}
}

namespace CommandLine
{
	auto run_git(const std::vector<std::string>& args) -> std::optional<std::string>
	{
		std::string command = "git";
		for (const auto& arg : args)
		{
			command += " " + shell_quote(arg);
		}
		command += " 2>/dev/null";

		FILE* pipe = ::popen(command.c_str(), "r");
		if (pipe == nullptr)
		{
			return std::nullopt;
		}

		std::string output;
		std::array<char, 4096> buffer;
		size_t count = 0;
		while ((count = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0)
		{
			output.append(buffer.data(), count);
		}

		int status = ::pclose(pipe);
		if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0)
		{
			return std::nullopt;
		}

		return output;
	}

	auto is_in_git_worktree(void) -> bool
	{
		auto output = run_git({ "rev-parse", "--is-inside-work-tree" });
		if (!output.has_value())
		{
			return false;
		}

		return TopicEncoder::trim(output.value()) == "true";
	}

	auto first_remote(void) -> std::string
	{
		auto output = run_git({ "remote" });
		if (!output.has_value())
		{
			return "";
		}

		for (const auto& line : split_lines(output.value()))
		{
			auto remote = TopicEncoder::trim(line);
			if (!remote.empty())
			{
				return remote;
			}
		}

		return "";
	}

	auto current_branch(void) -> std::string
	{
		auto output = run_git({ "branch", "--show-current" });
		if (!output.has_value())
		{
			return "";
		}

		// Detached HEAD
		auto branch = TopicEncoder::trim(output.value());
		if (branch == "HEAD")
		{
			return "";
		}

		return branch;
	}

	auto combine_topic(const std::string& remote, const std::string& branch) -> std::string
	{
		if (!remote.empty() && !branch.empty())
		{
			return std::format("{}:{}", remote, branch);
		}

		if (!remote.empty())
		{
			return remote;
		}

		return branch;
	}

	auto derive_topic(void) -> std::tuple<std::optional<std::string>, std::optional<std::string>>
	{
		if (!is_in_git_worktree())
		{
			return { std::nullopt, "not in a git worktree (cannot derive topic)" };
		}

		auto topic = combine_topic(first_remote(), current_branch());
		if (topic.empty())
		{
			return { std::nullopt, "cannot derive topic (no remote and no branch)" };
		}

		return { topic, std::nullopt };
	}
}
