#include "Editor.h"

#include "Logger.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>

#include <sys/wait.h>
#include <unistd.h>

namespace
{
	auto env_value(const char* name) -> std::optional<std::string>
	{
		const char* value = std::getenv(name);
		if (value == nullptr || value[0] == '\0')
		{
			return std::nullopt;
		}

		return std::string(value);
	}

	auto create_temp_file(const std::string& initial) -> std::tuple<std::optional<std::string>, std::optional<std::string>>
	{
		std::error_code ec;
		auto directory = std::filesystem::temp_directory_path(ec);
		if (ec)
		{
			directory = "/tmp";
		}

		auto pattern = (directory / "q.XXXXXX.txt").string();
		std::vector<char> name(pattern.begin(), pattern.end());
		name.push_back('\0');

		int fd = ::mkstemps(name.data(), 4);
		if (fd < 0)
		{
			return { std::nullopt, std::format("cannot create temp file: {}", std::strerror(errno)) };
		}
		::close(fd);

		std::string path(name.data());

		std::ofstream file(path, std::ios::out | std::ios::trunc | std::ios::binary);
		if (!file.is_open())
		{
			std::filesystem::remove(path, ec);
			return { std::nullopt, std::format("cannot open temp file: {}", path) };
		}

		file << initial;
		file.close();

		return { path, std::nullopt };
	}

	auto run_editor(const std::vector<std::string>& command, const std::string& path) -> std::tuple<bool, std::optional<std::string>>
	{
		std::vector<std::string> words = command;
		words.push_back(path);

		std::vector<char*> argv;
		for (auto& word : words)
		{
			argv.push_back(word.data());
		}
		argv.push_back(nullptr);

		pid_t pid = ::fork();
		if (pid < 0)
		{
			return { false, std::format("cannot start editor: {}", std::strerror(errno)) };
		}

		if (pid == 0)
		{
			::execvp(argv[0], argv.data());
			::_exit(127);
		}

		int status = 0;
		while (::waitpid(pid, &status, 0) < 0)
		{
			if (errno != EINTR)
			{
				return { false, std::format("waiting for editor failed: {}", std::strerror(errno)) };
			}
		}

		int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
		if (exit_code != 0)
		{
			std::string joined;
			for (const auto& word : words)
			{
				joined += joined.empty() ? word : " " + word;
			}
			return { false, std::format("editor exited with status {}: {}", exit_code, joined) };
		}

		return { true, std::nullopt };
	}
}

namespace CommandLine
{
	auto split_shell_words(const std::string& text) -> std::vector<std::string>
	{
		std::vector<std::string> words;
		std::string current;
		bool has_word = false;
		char quote = '\0';

		for (size_t index = 0; index < text.size(); ++index)
		{
			char c = text[index];

			if (quote == '\'')
			{
				if (c == '\'')
				{
					quote = '\0';
					continue;
				}
				current.push_back(c);
				continue;
			}

			if (c == '\\' && index + 1 < text.size())
			{
				current.push_back(text[++index]);
				has_word = true;
				continue;
			}

			if (quote == '"')
			{
				if (c == '"')
				{
					quote = '\0';
					continue;
				}
				current.push_back(c);
				continue;
			}

			if (c == '\'' || c == '"')
			{
				quote = c;
				has_word = true;
				continue;
			}

			if (c == ' ' || c == '\t' || c == '\n')
			{
				if (has_word)
				{
					words.push_back(current);
					current.clear();
					has_word = false;
				}
				continue;
			}

			current.push_back(c);
			has_word = true;
		}

		if (quote != '\0')
		{
			return { text };
		}

		if (has_word)
		{
			words.push_back(current);
		}

		return words;
	}

	auto editor_command(const std::optional<std::string>& configured) -> std::vector<std::string>
	{
		auto editor = configured;
		if (!editor.has_value() || editor->empty())
		{
			editor = env_value("VISUAL");
		}
		if (!editor.has_value())
		{
			editor = env_value("EDITOR");
		}

		auto words = split_shell_words(editor.value_or("vi"));
		if (words.empty())
		{
			return { "vi" };
		}

		return words;
	}

	auto edit_text(const std::string& initial, const std::vector<std::string>& command)
		-> std::tuple<std::optional<std::string>, std::optional<std::string>>
	{
		if (command.empty())
		{
			return { std::nullopt, "no editor configured" };
		}

		auto [path, create_error] = create_temp_file(initial);
		if (!path.has_value())
		{
			return { std::nullopt, create_error };
		}

		Utilities::Logger::handle().write(Utilities::LogTypes::Information, std::format("Opening {} in {}", path.value(), command.front()));

		auto [edited, editor_error] = run_editor(command, path.value());

		std::optional<std::string> content;
		if (edited)
		{
			std::ifstream file(path.value(), std::ios::in | std::ios::binary);
			if (file.is_open())
			{
				content = std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
			}
			else
			{
				editor_error = std::format("cannot read back {}", path.value());
			}
		}

		std::error_code ec;
		std::filesystem::remove(path.value(), ec);

		if (!content.has_value())
		{
			return { std::nullopt, editor_error };
		}

		return { content, std::nullopt };
	}
}
