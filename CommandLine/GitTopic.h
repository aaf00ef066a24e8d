#pragma once

#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace CommandLine
{
	// stdout of `git <args>` when it ran and exited 0
	auto run_git(const std::vector<std::string>& args) -> std::optional<std::string>;

	auto is_in_git_worktree(void) -> bool;
	auto first_remote(void) -> std::string;
	auto current_branch(void) -> std::string;

	auto combine_topic(const std::string& remote, const std::string& branch) -> std::string;

	// "<remote>:<branch>" for the current directory, or why it cannot be built
	auto derive_topic(void) -> std::tuple<std::optional<std::string>, std::optional<std::string>>;
}
