#pragma once

#include <chrono>
#include <string>

namespace Timestamp
{
	// ISO-8601, second precision, explicit UTC offset: 2024-05-01T09:30:00+00:00
	auto to_iso_utc(const std::chrono::system_clock::time_point& time_point) -> std::string;
	auto utc_now_iso(void) -> std::string;
}
