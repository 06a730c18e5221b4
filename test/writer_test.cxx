#include <Bufio/writer.hxx>
#include <StormByte/string.hxx>
#include <StormByte/test_handlers.h>

#include "mock_streams.hxx"

#include <iostream>
#include <random>
#include <sstream>

using Bufio::BufferedWriter;
using Bufio::DataType;

static std::string ToString(const DataType& data) {
	return StormByte::String::FromByteVector(data);
}

int test_writer_buffers_until_full() {
	SinkRecord sink;
	BufferedWriter writer(std::make_unique<MemorySink>(sink), 2);

	ASSERT_TRUE("write [0,1]", writer.Write(Bytes({0, 1})).has_value());
	ASSERT_EQUAL("sink empty while buffer holds [0,1]", ToString(DataType{}), ToString(sink.data));

	ASSERT_TRUE("write [2]", writer.Write(Bytes({2})).has_value());
	ASSERT_EQUAL("full buffer flushed before [2]", ToString(Bytes({0, 1})), ToString(sink.data));

	ASSERT_TRUE("write [3]", writer.Write(Bytes({3})).has_value());
	ASSERT_EQUAL("[3] buffered", ToString(Bytes({0, 1})), ToString(sink.data));

	ASSERT_TRUE("flush", writer.Flush().has_value());
	ASSERT_EQUAL("flushed", ToString(Bytes({0, 1, 2, 3})), ToString(sink.data));

	ASSERT_TRUE("write [4]", writer.Write(Bytes({4})).has_value());
	ASSERT_TRUE("write [5]", writer.Write(Bytes({5})).has_value());
	ASSERT_EQUAL("[4,5] buffered", ToString(Bytes({0, 1, 2, 3})), ToString(sink.data));

	ASSERT_TRUE("write [6]", writer.Write(Bytes({6})).has_value());
	ASSERT_EQUAL("[4,5] flushed by [6]", ToString(Bytes({0, 1, 2, 3, 4, 5})), ToString(sink.data));

	ASSERT_TRUE("write [7,8]", writer.Write(Bytes({7, 8})).has_value());
	ASSERT_EQUAL("[6] flushed by [7,8]", ToString(Bytes({0, 1, 2, 3, 4, 5, 6})), ToString(sink.data));

	ASSERT_TRUE("write [9,10,11]", writer.Write(Bytes({9, 10, 11})).has_value());
	ASSERT_EQUAL("[7,8] flushed and [9,10,11] passed through", ToString(Bytes({0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11})), ToString(sink.data));

	ASSERT_TRUE("final flush", writer.Flush().has_value());
	ASSERT_EQUAL("final content", ToString(Bytes({0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11})), ToString(sink.data));
	RETURN_TEST("test_writer_buffers_until_full", 0);
}

int test_writer_large_write_passes_through() {
	SinkRecord sink;
	BufferedWriter writer(std::make_unique<MemorySink>(sink), 4);
	ASSERT_TRUE("small write", writer.Write("ab").has_value());
	ASSERT_EQUAL("no sink write yet", static_cast<std::size_t>(0), sink.writes);

	ASSERT_TRUE("large write", writer.Write("0123456789").has_value());
	ASSERT_EQUAL("one flush then one pass-through", static_cast<std::size_t>(2), sink.writes);
	ASSERT_EQUAL("order preserved", std::string("ab0123456789"), ToString(sink.data));
	ASSERT_EQUAL("nothing pending", static_cast<std::size_t>(0), writer.PendingBytes());

	ASSERT_TRUE("large write on empty buffer", writer.Write("abcdefgh").has_value());
	ASSERT_EQUAL("single pass-through write", static_cast<std::size_t>(3), sink.writes);
	RETURN_TEST("test_writer_large_write_passes_through", 0);
}

int test_writer_write_of_exact_capacity_is_buffered() {
	SinkRecord sink;
	BufferedWriter writer(std::make_unique<MemorySink>(sink), 4);
	ASSERT_TRUE("write x", writer.Write("x").has_value());
	ASSERT_TRUE("write capacity sized", writer.Write("abcd").has_value());
	ASSERT_EQUAL("only the previous content was written", std::string("x"), ToString(sink.data));
	ASSERT_EQUAL("capacity sized write buffered", static_cast<std::size_t>(4), writer.PendingBytes());
	RETURN_TEST("test_writer_write_of_exact_capacity_is_buffered", 0);
}

int test_writer_flush_idempotent() {
	SinkRecord sink;
	BufferedWriter writer(std::make_unique<MemorySink>(sink), 16);
	ASSERT_TRUE("write", writer.Write("hello").has_value());
	ASSERT_TRUE("flush 1", writer.Flush().has_value());
	ASSERT_EQUAL("one write after first flush", static_cast<std::size_t>(1), sink.writes);
	ASSERT_TRUE("flush 2", writer.Flush().has_value());
	ASSERT_EQUAL("no extra write after second flush", static_cast<std::size_t>(1), sink.writes);
	ASSERT_EQUAL("sink flushed each time", static_cast<std::size_t>(2), sink.flushes);
	ASSERT_EQUAL("content", std::string("hello"), ToString(sink.data));
	RETURN_TEST("test_writer_flush_idempotent", 0);
}

int test_writer_release_flushes() {
	SinkRecord sink;
	BufferedWriter writer(std::make_unique<MemorySink>(sink), 3);
	ASSERT_TRUE("write", writer.Write(Bytes({0, 1})).has_value());
	ASSERT_EQUAL("buffered", ToString(DataType{}), ToString(sink.data));
	auto released = writer.Release();
	ASSERT_TRUE("release ok", released.has_value());
	ASSERT_TRUE("sink returned", *released != nullptr);
	ASSERT_TRUE("no inner sink after release", writer.Inner() == nullptr);
	ASSERT_EQUAL("release wrote pending bytes", ToString(Bytes({0, 1})), ToString(sink.data));
	ASSERT_EQUAL("release does not flush the sink itself", static_cast<std::size_t>(0), sink.flushes);
	ASSERT_FALSE("writes fail after release", writer.Write("x").has_value());
	ASSERT_FALSE("flush fails after release", writer.Flush().has_value());
	RETURN_TEST("test_writer_release_flushes", 0);
}

int test_writer_drop_discards_pending() {
	SinkRecord sink;
	{
		BufferedWriter writer(std::make_unique<MemorySink>(sink), 8);
		ASSERT_TRUE("write", writer.Write("lost").has_value());
	}
	ASSERT_EQUAL("no write on destruction", static_cast<std::size_t>(0), sink.writes);
	ASSERT_TRUE("nothing delivered", sink.data.empty());
	RETURN_TEST("test_writer_drop_discards_pending", 0);
}

int test_writer_sink_failure_keeps_pending() {
	SinkRecord sink;
	BufferedWriter writer(std::make_unique<FailingSink>(sink, 1), 4);
	ASSERT_TRUE("write 1", writer.Write("abcd").has_value());
	ASSERT_TRUE("write 2 flushes first", writer.Write("ef").has_value());
	ASSERT_EQUAL("first flush delivered", std::string("abcd"), ToString(sink.data));

	auto res = writer.Flush();
	ASSERT_FALSE("failing flush reported", res.has_value());
	ASSERT_EQUAL("pending kept after failure", static_cast<std::size_t>(2), writer.PendingBytes());

	auto released = writer.Release();
	ASSERT_FALSE("failing release reported", released.has_value());
	ASSERT_EQUAL("pending still kept", static_cast<std::size_t>(2), writer.PendingBytes());

	res = writer.Write("0123456789");
	ASSERT_FALSE("pass-through failure reported", res.has_value());
	RETURN_TEST("test_writer_sink_failure_keeps_pending", 0);
}

int test_writer_random_writes_concatenate() {
	std::mt19937_64 rng(777);
	std::uniform_int_distribution<int> byte(0, 255);
	std::uniform_int_distribution<std::size_t> size(0, 40);

	for (std::size_t capacity : {0, 1, 2, 5, 16, 1024}) {
		SinkRecord sink;
		BufferedWriter writer(std::make_unique<MemorySink>(sink), capacity);
		DataType expected;
		for (int i = 0; i < 200; ++i) {
			DataType chunk(size(rng));
			for (auto& b : chunk) b = static_cast<std::byte>(byte(rng));
			expected.insert(expected.end(), chunk.begin(), chunk.end());
			ASSERT_TRUE("random write ok", writer.Write(chunk).has_value());
			ASSERT_TRUE("pending within capacity", writer.PendingBytes() <= capacity);
		}
		ASSERT_TRUE("random flush ok", writer.Flush().has_value());
		ASSERT_EQUAL("sink holds concatenation", ToString(expected), ToString(sink.data));
	}
	RETURN_TEST("test_writer_random_writes_concatenate", 0);
}

int test_writer_stacks_on_writer() {
	SinkRecord sink;
	auto inner = std::make_unique<BufferedWriter>(std::make_unique<MemorySink>(sink), 8);
	BufferedWriter& inner_ref = *inner;
	BufferedWriter outer(std::move(inner), 2);
	ASSERT_TRUE("write", outer.Write("abc").has_value());
	ASSERT_EQUAL("outer passed through to inner buffer", static_cast<std::size_t>(3), inner_ref.PendingBytes());
	ASSERT_TRUE("sink untouched", sink.data.empty());
	ASSERT_TRUE("flush propagates", outer.Flush().has_value());
	ASSERT_EQUAL("flush reached the sink", std::string("abc"), ToString(sink.data));
	ASSERT_EQUAL("sink flushed once", static_cast<std::size_t>(1), sink.flushes);
	RETURN_TEST("test_writer_stacks_on_writer", 0);
}

int test_writer_logs_flushes_and_faults() {
	std::ostringstream out;
	auto log = std::make_shared<StormByte::Logger::Log>(out, StormByte::Logger::Level::Debug, "%L");

	SinkRecord good;
	BufferedWriter writer(std::make_unique<MemorySink>(good), 4, log);
	ASSERT_TRUE("write", writer.Write("abc").has_value());
	ASSERT_TRUE("nothing logged for a buffered write", out.str().empty());
	ASSERT_TRUE("flush", writer.Flush().has_value());
	ASSERT_TRUE("flush logged", out.str().find("flushed 3 bytes") != std::string::npos);

	SinkRecord bad;
	BufferedWriter failing(std::make_unique<FailingSink>(bad, 0), 4, log);
	ASSERT_FALSE("pass-through fails", failing.Write("0123456789").has_value());
	ASSERT_TRUE("fault logged", out.str().find("sink write failed") != std::string::npos);
	RETURN_TEST("test_writer_logs_flushes_and_faults", 0);
}

int main() {
	int result = 0;
	result += test_writer_buffers_until_full();
	result += test_writer_large_write_passes_through();
	result += test_writer_write_of_exact_capacity_is_buffered();
	result += test_writer_flush_idempotent();
	result += test_writer_release_flushes();
	result += test_writer_drop_discards_pending();
	result += test_writer_sink_failure_keeps_pending();
	result += test_writer_random_writes_concatenate();
	result += test_writer_stacks_on_writer();
	result += test_writer_logs_flushes_and_faults();

	if (result == 0) {
		std::cout << "BufferedWriter tests passed!" << std::endl;
	} else {
		std::cout << result << " BufferedWriter tests failed." << std::endl;
	}
	return result;
}
