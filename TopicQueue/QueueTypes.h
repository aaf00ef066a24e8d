#pragma once

#include <string>

enum class QueueErrorType
{
	Validation,
	Corrupt,
	Io
};

struct QueueError
{
	QueueErrorType type = QueueErrorType::Io;
	std::string message;
};

// Derived from the topic on every access, never persisted
struct TopicPaths
{
	std::string data;
	std::string lock;
};

inline auto make_error(const QueueErrorType& type, const std::string& message) -> QueueError
{
	QueueError error;
	error.type = type;
	error.message = message;
	return error;
}
