#include "TopicEncoder.h"

#include <openssl/sha.h>

#include <algorithm>
#include <filesystem>
#include <format>

namespace
{
	auto is_allowed(const unsigned char& c) -> bool
	{
		return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
			|| c == '.' || c == '_' || c == '-';
	}

	auto percent_encode(const std::string& text) -> std::string
	{
		std::string encoded;
		encoded.reserve(text.size() * 3);

		for (const unsigned char c : text)
		{
			if (is_allowed(c))
			{
				encoded.push_back(static_cast<char>(c));
				continue;
			}

			encoded += std::format("%{:02X}", static_cast<unsigned int>(c));
		}

		return encoded;
	}

	auto strip_dots(const std::string& text) -> std::string
	{
		auto first = text.find_first_not_of('.');
		if (first == std::string::npos)
		{
			return "";
		}

		auto last = text.find_last_not_of('.');
		return text.substr(first, last - first + 1);
	}
}

namespace TopicEncoder
{
	auto whitespace_length(const std::string& text, const size_t& index) -> size_t
	{
		if (index >= text.size())
		{
			return 0;
		}

		auto byte = [&text](const size_t& offset) -> unsigned char
		{
			return offset < text.size() ? static_cast<unsigned char>(text[offset]) : 0;
		};

		unsigned char lead = byte(index);
		if (lead == ' ' || (lead >= 0x09 && lead <= 0x0D) || (lead >= 0x1C && lead <= 0x1F))
		{
			return 1;
		}

		// U+0085, U+00A0
		if (lead == 0xC2 && (byte(index + 1) == 0x85 || byte(index + 1) == 0xA0))
		{
			return 2;
		}

		// U+1680
		if (lead == 0xE1 && byte(index + 1) == 0x9A && byte(index + 2) == 0x80)
		{
			return 3;
		}

		// U+2000..U+200A, U+2028, U+2029, U+202F, U+205F
		if (lead == 0xE2 && byte(index + 1) == 0x80)
		{
			unsigned char last = byte(index + 2);
			if ((last >= 0x80 && last <= 0x8A) || last == 0xA8 || last == 0xA9 || last == 0xAF)
			{
				return 3;
			}
		}
		if (lead == 0xE2 && byte(index + 1) == 0x81 && byte(index + 2) == 0x9F)
		{
			return 3;
		}

		// U+3000
		if (lead == 0xE3 && byte(index + 1) == 0x80 && byte(index + 2) == 0x80)
		{
			return 3;
		}

		return 0;
	}

	auto trim(const std::string& text) -> std::string
	{
		size_t start = 0;
		size_t length = 0;
		while ((length = whitespace_length(text, start)) > 0)
		{
			start += length;
		}

		size_t end = start;
		size_t index = start;
		while (index < text.size())
		{
			length = whitespace_length(text, index);
			if (length > 0)
			{
				index += length;
				continue;
			}

			auto lead = static_cast<unsigned char>(text[index]);
			size_t step = lead >= 0xF0 ? 4 : lead >= 0xE0 ? 3 : lead >= 0xC0 ? 2 : 1;
			index = std::min(index + step, text.size());
			end = index;
		}

		return text.substr(start, end - start);
	}

	auto validate_topic(const std::string& topic) -> std::tuple<std::optional<std::string>, std::optional<QueueError>>
	{
		auto trimmed = trim(topic);
		if (trimmed.empty())
		{
			return { std::nullopt, make_error(QueueErrorType::Validation, "topic is empty") };
		}

		return { trimmed, std::nullopt };
	}

	auto topic_digest(const std::string& topic) -> std::string
	{
		unsigned char hash[SHA256_DIGEST_LENGTH];
		SHA256(reinterpret_cast<const unsigned char*>(topic.data()), topic.size(), hash);

		std::string hex;
		hex.reserve(DIGEST_LENGTH);
		for (size_t i = 0; i < DIGEST_LENGTH / 2; ++i)
		{
			hex += std::format("{:02x}", static_cast<unsigned int>(hash[i]));
		}

		return hex;
	}

	auto encode(const std::string& topic) -> std::tuple<std::optional<std::string>, std::optional<QueueError>>
	{
		auto [trimmed, error] = validate_topic(topic);
		if (!trimmed.has_value())
		{
			return { std::nullopt, error };
		}

		// '.' and '..' must never name a file
		auto safe = strip_dots(percent_encode(trimmed.value()));
		if (safe.empty())
		{
			safe = topic_digest(trimmed.value());
		}

		if (safe.size() > MAX_FILENAME_LENGTH)
		{
			safe = std::format("{}__{}", safe.substr(0, TRUNCATED_PREFIX_LENGTH), topic_digest(trimmed.value()));
		}

		return { safe, std::nullopt };
	}

	auto paths_for_topic(const std::string& base_dir, const std::string& topic)
		-> std::tuple<std::optional<TopicPaths>, std::optional<QueueError>>
	{
		auto [safe, error] = encode(topic);
		if (!safe.has_value())
		{
			return { std::nullopt, error };
		}

		std::filesystem::path base = base_dir;

		TopicPaths paths;
		paths.data = (base / std::format("{}.json", safe.value())).string();
		paths.lock = (base / std::format("{}.lock", safe.value())).string();

		return { paths, std::nullopt };
	}
}
