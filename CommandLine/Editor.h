#pragma once

#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace CommandLine
{
	// Shell-style word split; quotes group, backslash escapes outside single
	// quotes. Unbalanced quotes yield the whole string as one word.
	auto split_shell_words(const std::string& text) -> std::vector<std::string>;

	// configured editor, else $VISUAL, else $EDITOR, else vi
	auto editor_command(const std::optional<std::string>& configured = std::nullopt) -> std::vector<std::string>;

	// Opens initial text in the editor and returns what was saved
	auto edit_text(const std::string& initial, const std::vector<std::string>& command)
		-> std::tuple<std::optional<std::string>, std::optional<std::string>>;
}
