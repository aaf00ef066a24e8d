#pragma once

#include "QueueTypes.h"

#include <cstddef>
#include <optional>
#include <string>
#include <tuple>

namespace TopicEncoder
{
	constexpr size_t MAX_FILENAME_LENGTH = 180;
	constexpr size_t TRUNCATED_PREFIX_LENGTH = 150;
	constexpr size_t DIGEST_LENGTH = 16;

	// Byte length of the Unicode whitespace code point at index, 0 when there is none
	auto whitespace_length(const std::string& text, const size_t& index) -> size_t;

	// Strips Unicode whitespace (ASCII, NEL, NBSP, the U+2000 block, ideographic space)
	auto trim(const std::string& text) -> std::string;

	// Returns the trimmed topic, or a validation error when nothing is left
	auto validate_topic(const std::string& topic) -> std::tuple<std::optional<std::string>, std::optional<QueueError>>;

	// First 16 hex chars of SHA-256(topic)
	auto topic_digest(const std::string& topic) -> std::string;

	auto encode(const std::string& topic) -> std::tuple<std::optional<std::string>, std::optional<QueueError>>;
	auto paths_for_topic(const std::string& base_dir, const std::string& topic)
		-> std::tuple<std::optional<TopicPaths>, std::optional<QueueError>>;
}
