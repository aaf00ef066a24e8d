#include "QueueMessage.h"

#include "Timestamp.h"

#include "Generator.h"

#include <algorithm>
#include <cctype>

using json = nlohmann::json;

QueueMessage::QueueMessage(void)
	: record_(json::object())
{
}

QueueMessage::~QueueMessage(void) {}

auto QueueMessage::create(const std::string& content) -> QueueMessage
{
	auto uuid = Utilities::Generator::guid();
	std::transform(uuid.begin(), uuid.end(), uuid.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

	QueueMessage message;
	message.record_["uuid"] = uuid;
	message.record_["created"] = Timestamp::utc_now_iso();
	message.record_["content"] = content;

	return message;
}

auto QueueMessage::from_json(const json& record) -> std::optional<QueueMessage>
{
	if (!record.is_object() || !record.contains("uuid") || !record.contains("content"))
	{
		return std::nullopt;
	}

	QueueMessage message;
	message.record_ = record;

	return message;
}

auto QueueMessage::uuid(void) const -> std::string { return field_text("uuid"); }
auto QueueMessage::content(void) const -> std::string { return field_text("content"); }
auto QueueMessage::created(void) const -> std::string { return field_text("created"); }

auto QueueMessage::updated(void) const -> std::optional<std::string>
{
	if (!record_.contains("updated"))
	{
		return std::nullopt;
	}

	return field_text("updated");
}

auto QueueMessage::has_uuid(const std::string& uuid) const -> bool
{
	auto iter = record_.find("uuid");
	if (iter == record_.end() || !iter->is_string())
	{
		return false;
	}

	return iter->get<std::string>() == uuid;
}

auto QueueMessage::replace_content(const std::string& content) -> void
{
	record_["content"] = content;
	record_["updated"] = Timestamp::utc_now_iso();
}

auto QueueMessage::to_json(void) const -> const json& { return record_; }

auto QueueMessage::field_text(const std::string& key) const -> std::string
{
	auto iter = record_.find(key);
	if (iter == record_.end() || iter->is_null())
	{
		return "";
	}

	// Older or hand-edited files may carry non-string values; show them as JSON text
	if (!iter->is_string())
	{
		return iter->dump();
	}

	return iter->get<std::string>();
}
