#include "TestHelpers.h"
#include "QueueMessage.h"
#include "Timestamp.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <string>

using json = nlohmann::json;

class QueueMessageTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		init_test_logger();
	}
};

TEST_F(QueueMessageTest, CreateFillsFields)
{
	auto message = QueueMessage::create("payload");

	EXPECT_EQ(message.content(), "payload");
	EXPECT_EQ(message.uuid().size(), 36u);
	EXPECT_FALSE(message.updated().has_value());

	// Lowercase identifiers
	for (const char c : message.uuid())
	{
		EXPECT_FALSE(c >= 'A' && c <= 'Z') << message.uuid();
	}

	EXPECT_NE(QueueMessage::create("payload").uuid(), message.uuid());
}

TEST_F(QueueMessageTest, FromJsonRequiresUuidAndContent)
{
	EXPECT_TRUE(QueueMessage::from_json(json({ { "uuid", "a" }, { "content", "" } })).has_value());
	EXPECT_FALSE(QueueMessage::from_json(json({ { "uuid", "a" } })).has_value());
	EXPECT_FALSE(QueueMessage::from_json(json({ { "content", "b" } })).has_value());
	EXPECT_FALSE(QueueMessage::from_json(json::array()).has_value());
	EXPECT_FALSE(QueueMessage::from_json(json("text")).has_value());
}

TEST_F(QueueMessageTest, ExtraFieldsPreserved)
{
	auto message = QueueMessage::from_json(json({ { "uuid", "a" }, { "content", "b" }, { "tag", "keep" } }));
	ASSERT_TRUE(message.has_value());

	message->replace_content("c");

	EXPECT_EQ(message->to_json()["tag"], "keep");
	EXPECT_EQ(message->content(), "c");
	EXPECT_TRUE(message->updated().has_value());
}

TEST_F(QueueMessageTest, NonStringFieldsShownAsJson)
{
	auto message = QueueMessage::from_json(json({ { "uuid", 7 }, { "content", { 1, 2 } } }));
	ASSERT_TRUE(message.has_value());

	EXPECT_EQ(message->uuid(), "7");
	EXPECT_EQ(message->content(), "[1,2]");
	EXPECT_EQ(message->created(), "");

	// Only string identifiers match
	EXPECT_FALSE(message->has_uuid("7"));
}

TEST_F(QueueMessageTest, TimestampFormat)
{
	std::chrono::system_clock::time_point epoch_plus { std::chrono::seconds(1714555800) };
	EXPECT_EQ(Timestamp::to_iso_utc(epoch_plus), "2024-05-01T09:30:00+00:00");

	auto now = Timestamp::utc_now_iso();
	ASSERT_EQ(now.size(), 25u);
	EXPECT_EQ(now.substr(19), "+00:00");
	EXPECT_EQ(now[10], 'T');
}
