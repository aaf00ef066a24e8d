#include "StateDirectory.h"

#include <cstdlib>
#include <filesystem>

namespace
{
	auto read_env(const char* name) -> std::optional<std::string>
	{
		const char* value = std::getenv(name);
		if (value == nullptr || value[0] == '\0')
		{
			return std::nullopt;
		}

		return std::string(value);
	}

	auto non_empty(const std::optional<std::string>& value) -> bool
	{
		return value.has_value() && !value->empty();
	}
}

namespace StateDirectory
{
	auto from_process_environment(void) -> Environment
	{
		Environment environment;
		environment.q_dir = read_env("Q_DIR");
		environment.xdg_state_home = read_env("XDG_STATE_HOME");
		environment.home = read_env("HOME");
		return environment;
	}

	auto expand_user(const std::string& path, const std::optional<std::string>& home) -> std::string
	{
		if (!non_empty(home) || path.empty() || path[0] != '~')
		{
			return path;
		}

		if (path.size() == 1)
		{
			return home.value();
		}

		if (path[1] != '/')
		{
			// ~otheruser is not supported
			return path;
		}

		return (std::filesystem::path(home.value()) / path.substr(2)).string();
	}

	auto resolve(const std::optional<std::string>& override_dir, const Environment& environment) -> std::string
	{
		if (non_empty(override_dir))
		{
			return expand_user(override_dir.value(), environment.home);
		}

		if (non_empty(environment.q_dir))
		{
			return expand_user(environment.q_dir.value(), environment.home);
		}

		if (non_empty(environment.xdg_state_home))
		{
			return (std::filesystem::path(expand_user(environment.xdg_state_home.value(), environment.home)) / "q").string();
		}

		std::filesystem::path home = environment.home.value_or(".");
		return (home / ".local" / "state" / "q").string();
	}
}
