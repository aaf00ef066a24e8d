#pragma once

#include "ArgumentParser.h"
#include "Logger.h"

#include <cstdint>
#include <optional>
#include <string>

using namespace Utilities;

class Configurations
{
public:
	Configurations(ArgumentParser&& arguments);
	virtual ~Configurations(void);

	auto write_file() -> LogTypes;
	auto write_console() -> LogTypes;
	auto log_root() -> std::string;

	auto root_path() -> std::string;

	auto base_dir() -> std::string;
	auto poll_interval_ms() -> int32_t;
	auto editor() -> std::optional<std::string>;

protected:
	auto load() -> void;
	auto parse(ArgumentParser& arguments) -> void;

private:
	LogTypes write_file_;
	LogTypes write_console_;
	std::string log_root_;
	std::string root_path_;

	std::optional<std::string> base_dir_override_;
	std::string base_dir_;
	int32_t poll_interval_ms_;
	std::optional<std::string> editor_;
};
