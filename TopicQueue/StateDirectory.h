#pragma once

#include <optional>
#include <string>

namespace StateDirectory
{
	struct Environment
	{
		std::optional<std::string> q_dir;
		std::optional<std::string> xdg_state_home;
		std::optional<std::string> home;
	};

	auto from_process_environment(void) -> Environment;

	// "~" and "~/..." become $HOME-relative; anything else is returned as is
	auto expand_user(const std::string& path, const std::optional<std::string>& home) -> std::string;

	// explicit override, then Q_DIR, then $XDG_STATE_HOME/q, then ~/.local/state/q
	auto resolve(const std::optional<std::string>& override_dir, const Environment& environment) -> std::string;
}
