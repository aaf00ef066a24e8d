#include "TestHelpers.h"
#include "QueueStore.h"
#include "TopicEncoder.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <csignal>
#include <filesystem>
#include <memory>
#include <set>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include <sys/resource.h>

using json = nlohmann::json;

namespace fs = std::filesystem;

// RAII FileSizeLimitGuard: lowers RLIMIT_FSIZE so writes past the limit fail
// with EFBIG instead of raising SIGXFSZ; restores both on destruction.
class FileSizeLimitGuard
{
public:
	explicit FileSizeLimitGuard(const rlim_t& limit)
	{
		::getrlimit(RLIMIT_FSIZE, &previous_);
		previous_handler_ = std::signal(SIGXFSZ, SIG_IGN);

		struct rlimit lowered = previous_;
		lowered.rlim_cur = limit;
		::setrlimit(RLIMIT_FSIZE, &lowered);
	}

	~FileSizeLimitGuard()
	{
		::setrlimit(RLIMIT_FSIZE, &previous_);
		std::signal(SIGXFSZ, previous_handler_);
	}

	FileSizeLimitGuard(const FileSizeLimitGuard&) = delete;
	FileSizeLimitGuard& operator=(const FileSizeLimitGuard&) = delete;

private:
	struct rlimit previous_;
	void (*previous_handler_)(int);
};

class QueueStoreTest : public ::testing::Test
{
protected:
	std::unique_ptr<TempDir> temp_dir_;
	std::unique_ptr<QueueStore> store_;

	void SetUp() override
	{
		init_test_logger();

		temp_dir_ = std::make_unique<TempDir>("queue_store_test");
		store_ = std::make_unique<QueueStore>(base_dir());
	}

	void TearDown() override
	{
		store_.reset();
		temp_dir_.reset();
	}

	auto base_dir() const -> std::string { return temp_dir_->path() + "/q"; }

	auto data_path(const std::string& topic) const -> std::string
	{
		auto [paths, error] = TopicEncoder::paths_for_topic(base_dir(), topic);
		return paths.has_value() ? paths->data : "";
	}

	auto append(const std::string& topic, const std::string& content) -> std::string
	{
		auto [uuid, error] = store_->append(topic, content);
		EXPECT_TRUE(uuid.has_value()) << "append failed: " << (error.has_value() ? error->message : "unknown");
		return uuid.value_or("");
	}

	auto contents(const std::string& topic) -> std::vector<std::string>
	{
		auto [messages, error] = store_->list_messages(topic);
		EXPECT_FALSE(error.has_value());

		std::vector<std::string> result;
		for (const auto& message : messages)
		{
			result.push_back(message.content());
		}
		return result;
	}
};

// ---------------------------------------------------------------------------
// AppendReturnsUuid: canonical 8-4-4-4-12 identifier
// ---------------------------------------------------------------------------
TEST_F(QueueStoreTest, AppendReturnsUuid)
{
	auto uuid = append("test-topic", "Hello, world!");

	ASSERT_EQ(uuid.size(), 36u);
	EXPECT_EQ(uuid[8], '-');
	EXPECT_EQ(uuid[13], '-');
	EXPECT_EQ(uuid[18], '-');
	EXPECT_EQ(uuid[23], '-');
}

// ---------------------------------------------------------------------------
// ConcreteScenario: a, b listed in order, pop returns a, b remains
// ---------------------------------------------------------------------------
TEST_F(QueueStoreTest, ConcreteScenario)
{
	append("t", "a");
	append("t", "b");

	EXPECT_EQ(contents("t"), (std::vector<std::string> { "a", "b" }));

	auto [message, error] = store_->pop_first("t");
	ASSERT_FALSE(error.has_value());
	ASSERT_TRUE(message.has_value());
	EXPECT_EQ(message->content(), "a");

	EXPECT_EQ(contents("t"), (std::vector<std::string> { "b" }));
}

// ---------------------------------------------------------------------------
// FifoOrder: N appends come back in order, then nothing
// ---------------------------------------------------------------------------
TEST_F(QueueStoreTest, FifoOrder)
{
	std::vector<std::string> sent = { "first", "second", "third", "fourth", "fifth" };
	for (const auto& content : sent)
	{
		append("fifo-topic", content);
	}

	for (const auto& expected : sent)
	{
		auto [message, error] = store_->pop_first("fifo-topic");
		ASSERT_FALSE(error.has_value());
		ASSERT_TRUE(message.has_value());
		EXPECT_EQ(message->content(), expected);
	}

	auto [last, error] = store_->pop_first("fifo-topic");
	EXPECT_FALSE(error.has_value());
	EXPECT_FALSE(last.has_value());
}

TEST_F(QueueStoreTest, PopEmptyQueue)
{
	auto [message, error] = store_->pop_first("empty-topic");
	EXPECT_FALSE(error.has_value());
	EXPECT_FALSE(message.has_value());

	// Reading an empty topic writes nothing
	EXPECT_FALSE(fs::exists(data_path("empty-topic")));
}

TEST_F(QueueStoreTest, PeekDoesNotRemove)
{
	append("peek-topic", "Peek me");

	auto [first, first_error] = store_->peek_first("peek-topic");
	ASSERT_TRUE(first.has_value());
	EXPECT_EQ(first->content(), "Peek me");

	auto [second, second_error] = store_->peek_first("peek-topic");
	ASSERT_TRUE(second.has_value());
	EXPECT_EQ(second->uuid(), first->uuid());

	auto [popped, pop_error] = store_->pop_first("peek-topic");
	ASSERT_TRUE(popped.has_value());
	EXPECT_EQ(popped->uuid(), first->uuid());
}

TEST_F(QueueStoreTest, PeekEmptyQueue)
{
	auto [message, error] = store_->peek_first("nothing-here");
	EXPECT_FALSE(error.has_value());
	EXPECT_FALSE(message.has_value());
}

// ---------------------------------------------------------------------------
// RoundTrip: get, replace, get again
// ---------------------------------------------------------------------------
TEST_F(QueueStoreTest, RoundTrip)
{
	auto uuid = append("rt", "original");

	auto [message, error] = store_->get_by_uuid("rt", uuid);
	ASSERT_FALSE(error.has_value());
	ASSERT_TRUE(message.has_value());
	EXPECT_EQ(message->content(), "original");
	EXPECT_FALSE(message->updated().has_value());
	EXPECT_FALSE(message->created().empty());

	auto [replaced, replace_error] = store_->replace_by_uuid("rt", uuid, "changed");
	ASSERT_FALSE(replace_error.has_value());
	EXPECT_TRUE(replaced);

	auto [after, after_error] = store_->get_by_uuid("rt", uuid);
	ASSERT_TRUE(after.has_value());
	EXPECT_EQ(after->content(), "changed");
	EXPECT_TRUE(after->updated().has_value());
	EXPECT_EQ(after->created(), message->created());
	EXPECT_EQ(after->uuid(), uuid);
}

TEST_F(QueueStoreTest, GetByUuidMissing)
{
	append("lookup", "x");

	auto [message, error] = store_->get_by_uuid("lookup", "00000000-0000-0000-0000-000000000000");
	EXPECT_FALSE(error.has_value());
	EXPECT_FALSE(message.has_value());
}

TEST_F(QueueStoreTest, ReplaceMissingUuidDoesNotWrite)
{
	append("replace-topic", "keep");
	auto before = fs::last_write_time(data_path("replace-topic"));
	auto before_text = read_text(data_path("replace-topic"));

	auto [replaced, error] = store_->replace_by_uuid("replace-topic", "nope", "new");
	EXPECT_FALSE(error.has_value());
	EXPECT_FALSE(replaced);

	EXPECT_EQ(fs::last_write_time(data_path("replace-topic")), before);
	EXPECT_EQ(read_text(data_path("replace-topic")), before_text);
}

TEST_F(QueueStoreTest, ReplaceKeepsPosition)
{
	append("order", "one");
	auto uuid = append("order", "two");
	append("order", "three");

	auto [replaced, error] = store_->replace_by_uuid("order", uuid, "TWO");
	EXPECT_TRUE(replaced);

	EXPECT_EQ(contents("order"), (std::vector<std::string> { "one", "TWO", "three" }));
}

// ---------------------------------------------------------------------------
// IdempotentDelete: true once, then false; list excludes it
// ---------------------------------------------------------------------------
TEST_F(QueueStoreTest, IdempotentDelete)
{
	append("del", "keep-1");
	auto uuid = append("del", "remove");
	append("del", "keep-2");

	auto [first, first_error] = store_->delete_by_uuid("del", uuid);
	EXPECT_FALSE(first_error.has_value());
	EXPECT_TRUE(first);

	auto [second, second_error] = store_->delete_by_uuid("del", uuid);
	EXPECT_FALSE(second_error.has_value());
	EXPECT_FALSE(second);

	auto [messages, error] = store_->list_messages("del");
	ASSERT_EQ(messages.size(), 2u);
	for (const auto& message : messages)
	{
		EXPECT_NE(message.uuid(), uuid);
	}
	EXPECT_EQ(contents("del"), (std::vector<std::string> { "keep-1", "keep-2" }));
}

TEST_F(QueueStoreTest, TopicsAreIsolated)
{
	append("topic-a", "for a");
	append("topic-b", "for b");

	EXPECT_EQ(contents("topic-a"), (std::vector<std::string> { "for a" }));
	EXPECT_EQ(contents("topic-b"), (std::vector<std::string> { "for b" }));

	auto [popped, error] = store_->pop_first("topic-a");
	ASSERT_TRUE(popped.has_value());

	EXPECT_TRUE(contents("topic-a").empty());
	EXPECT_EQ(contents("topic-b"), (std::vector<std::string> { "for b" }));
}

TEST_F(QueueStoreTest, PersistenceAcrossInstances)
{
	auto uuid = append("persist", "survives");

	QueueStore other(base_dir());
	auto [message, error] = other.get_by_uuid("persist", uuid);
	ASSERT_TRUE(message.has_value());
	EXPECT_EQ(message->content(), "survives");

	auto [messages, list_error] = other.list_messages("persist");
	ASSERT_EQ(messages.size(), 1u);
	EXPECT_EQ(messages[0].uuid(), uuid);
}

// ---------------------------------------------------------------------------
// SpecialTopicNames: spaces, slashes, colons and a 300 char topic
// ---------------------------------------------------------------------------
TEST_F(QueueStoreTest, SpecialTopicNames)
{
	std::vector<std::string> topics = {
		"origin:main",
		"origin/feature/x",
		"with space",
		"a/b:c d",
		"..",
		std::string(300, 'x'),
		std::string(300, 'x') + "y",
		"\xED\x95\x9C\xEA\xB8\x80 topic"
	};

	std::set<std::string> paths;
	for (const auto& topic : topics)
	{
		append(topic, "content for " + topic);

		auto path = data_path(topic);
		EXPECT_TRUE(fs::exists(path)) << path;
		EXPECT_EQ(fs::path(path).parent_path(), fs::path(base_dir()));
		EXPECT_LE(fs::path(path).filename().string().size(), 255u);
		paths.insert(path);
	}

	EXPECT_EQ(paths.size(), topics.size());

	for (const auto& topic : topics)
	{
		auto [message, error] = store_->pop_first(topic);
		ASSERT_TRUE(message.has_value()) << topic;
		EXPECT_EQ(message->content(), "content for " + topic);
	}
}

TEST_F(QueueStoreTest, EmptyContentAllowed)
{
	auto uuid = append("empty-content", "");

	auto [message, error] = store_->get_by_uuid("empty-content", uuid);
	ASSERT_TRUE(message.has_value());
	EXPECT_EQ(message->content(), "");
}

TEST_F(QueueStoreTest, MultilineAndUnicodeContent)
{
	std::string content = "line 1\nline 2\n\n\xF0\x9F\x9A\x80 \xC3\xA9t\xC3\xA9\n";
	append("text", content);

	auto [message, error] = store_->pop_first("text");
	ASSERT_TRUE(message.has_value());
	EXPECT_EQ(message->content(), content);
}

TEST_F(QueueStoreTest, EmptyTopicRejectedBeforeIo)
{
	for (const std::string topic : { "", "   ", "\t\n" })
	{
		auto [uuid, error] = store_->append(topic, "x");
		EXPECT_FALSE(uuid.has_value());
		ASSERT_TRUE(error.has_value());
		EXPECT_EQ(error->type, QueueErrorType::Validation);

		auto [message, pop_error] = store_->pop_first(topic);
		ASSERT_TRUE(pop_error.has_value());
		EXPECT_EQ(pop_error->type, QueueErrorType::Validation);

		auto [deleted, delete_error] = store_->delete_by_uuid(topic, "x");
		ASSERT_TRUE(delete_error.has_value());
		EXPECT_EQ(delete_error->type, QueueErrorType::Validation);
	}

	// Base directory is only created once a lock is taken
	EXPECT_FALSE(fs::exists(base_dir()));
}

TEST_F(QueueStoreTest, TopicIsTrimmed)
{
	append("  padded  ", "x");

	EXPECT_EQ(contents("padded"), (std::vector<std::string> { "x" }));

	auto envelope = json::parse(read_text(data_path("padded")));
	EXPECT_EQ(envelope["topic"], "padded");
}

// ---------------------------------------------------------------------------
// FileFormat: versioned envelope, lock file beside it, owner-only perms
// ---------------------------------------------------------------------------
TEST_F(QueueStoreTest, FileFormat)
{
	auto uuid = append("format-topic", "hello");

	auto envelope = json::parse(read_text(data_path("format-topic")));
	EXPECT_EQ(envelope["version"], 1);
	EXPECT_EQ(envelope["topic"], "format-topic");
	ASSERT_TRUE(envelope["messages"].is_array());
	ASSERT_EQ(envelope["messages"].size(), 1u);
	EXPECT_EQ(envelope["messages"][0]["uuid"], uuid);
	EXPECT_EQ(envelope["messages"][0]["content"], "hello");
	EXPECT_TRUE(envelope["messages"][0]["created"].is_string());
	EXPECT_FALSE(envelope["messages"][0].contains("updated"));

	EXPECT_TRUE(fs::exists(base_dir() + "/format-topic.lock"));

	auto data_perms = fs::status(data_path("format-topic")).permissions();
	EXPECT_EQ(data_perms & (fs::perms::group_all | fs::perms::others_all), fs::perms::none);

	auto dir_perms = fs::status(base_dir()).permissions();
	EXPECT_EQ(dir_perms & (fs::perms::group_all | fs::perms::others_all), fs::perms::none);

	// No temp files left behind
	size_t entries = 0;
	for (const auto& entry : fs::directory_iterator(base_dir()))
	{
		EXPECT_EQ(entry.path().string().find(".tmp"), std::string::npos) << entry.path();
		entries++;
	}
	EXPECT_EQ(entries, 2u);
}

// ---------------------------------------------------------------------------
// Corrupt files: reported as Corrupt, never treated as empty
// ---------------------------------------------------------------------------
TEST_F(QueueStoreTest, CorruptSyntaxDetected)
{
	append("broken", "x");
	write_text(data_path("broken"), "{ this is not json");

	auto [message, error] = store_->pop_first("broken");
	ASSERT_TRUE(error.has_value());
	EXPECT_EQ(error->type, QueueErrorType::Corrupt);
	EXPECT_NE(error->message.find("broken"), std::string::npos);

	auto [messages, list_error] = store_->list_messages("broken");
	ASSERT_TRUE(list_error.has_value());
	EXPECT_EQ(list_error->type, QueueErrorType::Corrupt);

	auto [uuid, append_error] = store_->append("broken", "y");
	ASSERT_TRUE(append_error.has_value());
	EXPECT_EQ(append_error->type, QueueErrorType::Corrupt);

	// Untouched by the failed append
	EXPECT_EQ(read_text(data_path("broken")), "{ this is not json");
}

TEST_F(QueueStoreTest, CorruptMessagesNotAList)
{
	fs::create_directories(base_dir());
	write_text(data_path("shape"), R"({"version": 1, "topic": "shape", "messages": {"a": 1}})");

	auto [message, error] = store_->peek_first("shape");
	ASSERT_TRUE(error.has_value());
	EXPECT_EQ(error->type, QueueErrorType::Corrupt);
	EXPECT_NE(error->message.find("messages not a list"), std::string::npos);
}

TEST_F(QueueStoreTest, CorruptTopLevelShape)
{
	fs::create_directories(base_dir());

	for (const std::string raw : { R"({"version": 1})", "42", R"("text")", "null" })
	{
		write_text(data_path("scalar"), raw);

		auto [messages, error] = store_->list_messages("scalar");
		ASSERT_TRUE(error.has_value()) << raw;
		EXPECT_EQ(error->type, QueueErrorType::Corrupt) << raw;
	}
}

TEST_F(QueueStoreTest, WhitespaceFileIsEmptyQueue)
{
	fs::create_directories(base_dir());
	write_text(data_path("blank"), "  \n\t\n");

	auto [messages, error] = store_->list_messages("blank");
	EXPECT_FALSE(error.has_value());
	EXPECT_TRUE(messages.empty());

	append("blank", "now real");
	EXPECT_EQ(contents("blank"), (std::vector<std::string> { "now real" }));
}

// ---------------------------------------------------------------------------
// Lenient reader: bare lists, dropped entries, preserved extra fields
// ---------------------------------------------------------------------------
TEST_F(QueueStoreTest, BareListAccepted)
{
	fs::create_directories(base_dir());
	write_text(data_path("legacy"), R"([
		{"uuid": "u-1", "created": "2024-01-01T00:00:00+00:00", "content": "old one"},
		{"uuid": "u-2", "created": "2024-01-01T00:00:01+00:00", "content": "old two"}
	])");

	EXPECT_EQ(contents("legacy"), (std::vector<std::string> { "old one", "old two" }));

	auto [message, error] = store_->pop_first("legacy");
	ASSERT_TRUE(message.has_value());
	EXPECT_EQ(message->uuid(), "u-1");

	// Rewritten with the envelope
	auto envelope = json::parse(read_text(data_path("legacy")));
	EXPECT_EQ(envelope["version"], 1);
	ASSERT_EQ(envelope["messages"].size(), 1u);
	EXPECT_EQ(envelope["messages"][0]["uuid"], "u-2");
}

TEST_F(QueueStoreTest, MalformedEntriesDroppedExtraFieldsKept)
{
	fs::create_directories(base_dir());
	write_text(data_path("mixed"), R"({"version": 1, "topic": "mixed", "messages": [
		{"uuid": "keep-1", "content": "first", "priority": "high"},
		{"content": "no uuid"},
		{"uuid": "no-content"},
		"just a string",
		42,
		{"uuid": "not-a-real-uuid", "content": "second", "created": "whenever"}
	]})");

	auto [messages, error] = store_->list_messages("mixed");
	ASSERT_FALSE(error.has_value());
	ASSERT_EQ(messages.size(), 2u);
	EXPECT_EQ(messages[0].uuid(), "keep-1");
	EXPECT_EQ(messages[1].uuid(), "not-a-real-uuid");

	auto [deleted, delete_error] = store_->delete_by_uuid("mixed", "not-a-real-uuid");
	EXPECT_TRUE(deleted);

	auto envelope = json::parse(read_text(data_path("mixed")));
	ASSERT_EQ(envelope["messages"].size(), 1u);
	EXPECT_EQ(envelope["messages"][0]["priority"], "high");
	EXPECT_FALSE(envelope["messages"][0].contains("created"));
}

TEST_F(QueueStoreTest, LockFileNeverReplaced)
{
	append("stable", "one");

	auto lock_path = base_dir() + "/stable.lock";
	write_text(lock_path, "marker");

	append("stable", "two");
	auto [message, error] = store_->pop_first("stable");
	ASSERT_TRUE(message.has_value());

	EXPECT_EQ(read_text(lock_path), "marker");
}

// ---------------------------------------------------------------------------
// NoWriteOnMissOrRead: shared operations and misses leave the file alone
// ---------------------------------------------------------------------------
TEST_F(QueueStoreTest, NoWriteOnMissOrRead)
{
	append("quiet", "one");
	auto uuid = append("quiet", "two");

	auto before = fs::last_write_time(data_path("quiet"));
	auto before_text = read_text(data_path("quiet"));

	auto [deleted, delete_error] = store_->delete_by_uuid("quiet", "missing");
	EXPECT_FALSE(delete_error.has_value());
	EXPECT_FALSE(deleted);

	auto [peeked, peek_error] = store_->peek_first("quiet");
	ASSERT_TRUE(peeked.has_value());

	auto [found, get_error] = store_->get_by_uuid("quiet", uuid);
	ASSERT_TRUE(found.has_value());

	auto [missing, missing_error] = store_->get_by_uuid("quiet", "missing");
	EXPECT_FALSE(missing.has_value());

	auto [messages, list_error] = store_->list_messages("quiet");
	EXPECT_EQ(messages.size(), 2u);

	EXPECT_EQ(fs::last_write_time(data_path("quiet")), before);
	EXPECT_EQ(read_text(data_path("quiet")), before_text);
}

// ---------------------------------------------------------------------------
// FailedSaveKeepsOriginal: Io error, temp file removed, data untouched
// ---------------------------------------------------------------------------
TEST_F(QueueStoreTest, FailedSaveKeepsOriginal)
{
	append("limited", "small");
	append("other", "untouched");

	auto before_text = read_text(data_path("limited"));
	std::string large(64 * 1024, 'x');

	std::optional<std::string> uuid;
	std::optional<QueueError> error;
	{
		FileSizeLimitGuard limit(4096);
		std::tie(uuid, error) = store_->append("limited", large);
	}

	EXPECT_FALSE(uuid.has_value());
	ASSERT_TRUE(error.has_value());
	EXPECT_EQ(error->type, QueueErrorType::Io);

	EXPECT_EQ(read_text(data_path("limited")), before_text);
	EXPECT_EQ(contents("limited"), (std::vector<std::string> { "small" }));
	EXPECT_EQ(contents("other"), (std::vector<std::string> { "untouched" }));

	for (const auto& entry : fs::directory_iterator(base_dir()))
	{
		EXPECT_EQ(entry.path().string().find(".tmp"), std::string::npos) << entry.path();
	}
}

// ---------------------------------------------------------------------------
// DirectoryAtDataPath: reported as Io, never read as an empty queue
// ---------------------------------------------------------------------------
TEST_F(QueueStoreTest, DirectoryAtDataPath)
{
	append("other", "untouched");

	fs::create_directories(fs::path(data_path("squatted")) / "child");

	auto [messages, list_error] = store_->list_messages("squatted");
	ASSERT_TRUE(list_error.has_value());
	EXPECT_EQ(list_error->type, QueueErrorType::Io);

	auto [uuid, append_error] = store_->append("squatted", "x");
	EXPECT_FALSE(uuid.has_value());
	ASSERT_TRUE(append_error.has_value());
	EXPECT_EQ(append_error->type, QueueErrorType::Io);

	EXPECT_TRUE(fs::is_directory(data_path("squatted")));
	EXPECT_EQ(contents("other"), (std::vector<std::string> { "untouched" }));

	for (const auto& entry : fs::directory_iterator(base_dir()))
	{
		EXPECT_EQ(entry.path().string().find(".tmp"), std::string::npos) << entry.path();
	}
}
