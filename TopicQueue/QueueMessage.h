#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

// One queued entry. The on-disk record is kept whole so that fields this
// version does not know about survive a rewrite.
class QueueMessage
{
public:
	QueueMessage(void);
	~QueueMessage(void);

	static auto create(const std::string& content) -> QueueMessage;
	static auto from_json(const nlohmann::json& record) -> std::optional<QueueMessage>;

	auto uuid(void) const -> std::string;
	auto content(void) const -> std::string;
	auto created(void) const -> std::string;
	auto updated(void) const -> std::optional<std::string>;

	auto has_uuid(const std::string& uuid) const -> bool;
	auto replace_content(const std::string& content) -> void;

	auto to_json(void) const -> const nlohmann::json&;

private:
	auto field_text(const std::string& key) const -> std::string;

private:
	nlohmann::json record_;
};
