#include "Timestamp.h"

#include <ctime>
#include <format>

namespace Timestamp
{
	auto to_iso_utc(const std::chrono::system_clock::time_point& time_point) -> std::string
	{
		std::time_t seconds = std::chrono::system_clock::to_time_t(time_point);

		std::tm utc {};
		gmtime_r(&seconds, &utc);

		return std::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}+00:00",
			utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
			utc.tm_hour, utc.tm_min, utc.tm_sec);
	}

	auto utc_now_iso(void) -> std::string
	{
		return to_iso_utc(std::chrono::system_clock::now());
	}
}
