#include "Configurations.h"

#include "StateDirectory.h"

#include "Converter.h"
#include "File.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <format>

using json = nlohmann::json;

Configurations::Configurations(ArgumentParser&& arguments)
	: write_file_(LogTypes::None)
	, write_console_(LogTypes::None)
	, log_root_("./logs")
	, root_path_("")
	, base_dir_override_(std::nullopt)
	, base_dir_("")
	, poll_interval_ms_(200)
	, editor_(std::nullopt)
{
	root_path_ = arguments.program_folder();

	load();
	parse(arguments);

	base_dir_ = StateDirectory::resolve(base_dir_override_, StateDirectory::from_process_environment());
}

Configurations::~Configurations(void) {}

auto Configurations::write_file() -> LogTypes { return write_file_; }
auto Configurations::write_console() -> LogTypes { return write_console_; }
auto Configurations::log_root() -> std::string { return log_root_; }

auto Configurations::root_path() -> std::string { return root_path_; }

auto Configurations::base_dir() -> std::string { return base_dir_; }
auto Configurations::poll_interval_ms() -> int32_t { return poll_interval_ms_; }
auto Configurations::editor() -> std::optional<std::string> { return editor_; }

auto Configurations::load() -> void
{
	std::filesystem::path path = root_path_ + "q_configuration.json";
	if (!std::filesystem::exists(path))
	{
		return;
	}

	File source;
	auto [opened, open_error] = source.open(path.string(), std::ios::in | std::ios::binary);
	if (!opened)
	{
		Logger::handle().write(LogTypes::Error, std::format("cannot open {}: {}", path.string(), open_error.value_or("unknown")));
		return;
	}

	auto [source_data, read_error] = source.read_bytes();
	source.close();

	if (source_data == std::nullopt)
	{
		return;
	}

	try
	{
		json config = json::parse(Converter::to_string(source_data.value()));

		if (config.contains("baseDir") && config["baseDir"].is_string())
		{
			base_dir_override_ = config["baseDir"].get<std::string>();
		}
		if (config.contains("pollIntervalMs") && config["pollIntervalMs"].is_number() && config["pollIntervalMs"].get<double>() >= 1.0)
		{
			poll_interval_ms_ = config["pollIntervalMs"].get<int32_t>();
		}
		if (config.contains("editor") && config["editor"].is_string())
		{
			editor_ = config["editor"].get<std::string>();
		}

		if (config.contains("logging") && config["logging"].is_object())
		{
			auto& logging = config["logging"];
			if (logging.contains("writeConsole") && logging["writeConsole"].is_number())
			{
				write_console_ = static_cast<LogTypes>(logging["writeConsole"].get<int32_t>());
			}
			if (logging.contains("writeFile") && logging["writeFile"].is_number())
			{
				write_file_ = static_cast<LogTypes>(logging["writeFile"].get<int32_t>());
			}
			if (logging.contains("logRoot") && logging["logRoot"].is_string())
			{
				log_root_ = logging["logRoot"].get<std::string>();
			}
		}
	}
	catch (const json::exception& e)
	{
		Logger::handle().write(LogTypes::Error, std::format("ignoring {}: {}", path.string(), e.what()));
	}
}

auto Configurations::parse(ArgumentParser& arguments) -> void
{
	auto string_target = arguments.to_string("--base-dir");
	if (string_target != std::nullopt)
	{
		base_dir_override_ = string_target.value();
	}

	// Seconds, fractions allowed: --poll 0.5
	string_target = arguments.to_string("--poll");
	if (string_target != std::nullopt)
	{
		char* end = nullptr;
		double seconds = std::strtod(string_target->c_str(), &end);
		if (end != string_target->c_str() && seconds > 0.0)
		{
			// Never a zero interval, --block would spin on the lock
			poll_interval_ms_ = std::max(static_cast<int32_t>(std::lround(seconds * 1000.0)), 1);
		}
	}

	string_target = arguments.to_string("--log-root");
	if (string_target != std::nullopt)
	{
		log_root_ = string_target.value();
	}

	auto int_target = arguments.to_int("--write-console");
	if (int_target != std::nullopt)
	{
		write_console_ = static_cast<LogTypes>(int_target.value());
	}

	int_target = arguments.to_int("--write-file");
	if (int_target != std::nullopt)
	{
		write_file_ = static_cast<LogTypes>(int_target.value());
	}
}
