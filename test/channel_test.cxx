#include <Trickle/stream/channel.hxx>
#include <StormByte/string.hxx>
#include <StormByte/test_handlers.h>

#include <atomic>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

using Trickle::Stream::Channel;
using Trickle::Stream::DataType;
using Trickle::Stream::EndOfStream;
using Trickle::Stream::ReadError;

using namespace std::chrono_literals;

int test_channel_handoff_in_order() {
	Channel channel;
	std::thread producer([&]() {
		(void)channel.Send(StormByte::String::ToByteVector("ab"));
		(void)channel.Send(StormByte::String::ToByteVector("cd"));
		channel.Close(std::make_shared<EndOfStream>(EndOfStream("done")));
	});

	std::string collected;
	DataType chunk;
	Channel::Status status;
	while ((status = channel.Receive(chunk, 1s)) == Channel::Status::Received)
		collected += StormByte::String::FromByteVector(chunk);
	producer.join();

	ASSERT_TRUE("test_channel_handoff_in_order closed", status == Channel::Status::Closed);
	ASSERT_EQUAL("test_channel_handoff_in_order content", collected, std::string("abcd"));
	ASSERT_TRUE("test_channel_handoff_in_order reason is end of stream",
		std::dynamic_pointer_cast<EndOfStream>(channel.CloseReason()) != nullptr);
	RETURN_TEST("test_channel_handoff_in_order", 0);
}

int test_channel_receive_times_out() {
	Channel channel;
	DataType chunk;
	auto start = std::chrono::steady_clock::now();
	auto status = channel.Receive(chunk, 20ms);
	auto elapsed = std::chrono::steady_clock::now() - start;
	ASSERT_TRUE("test_channel_receive_times_out status", status == Channel::Status::Timeout);
	ASSERT_TRUE("test_channel_receive_times_out waited", elapsed >= 20ms);
	RETURN_TEST("test_channel_receive_times_out", 0);
}

int test_channel_zero_timeout_polls() {
	Channel channel;
	DataType chunk;
	auto start = std::chrono::steady_clock::now();
	auto status = channel.Receive(chunk, std::chrono::steady_clock::duration::zero());
	auto elapsed = std::chrono::steady_clock::now() - start;
	ASSERT_TRUE("test_channel_zero_timeout_polls status", status == Channel::Status::Timeout);
	ASSERT_TRUE("test_channel_zero_timeout_polls no wait", elapsed < 50ms);

	status = channel.Receive(chunk, -5ms);
	ASSERT_TRUE("test_channel_zero_timeout_polls negative", status == Channel::Status::Timeout);
	RETURN_TEST("test_channel_zero_timeout_polls", 0);
}

int test_channel_send_blocks_until_received() {
	Channel channel;
	std::atomic<bool> sent{false};
	std::thread producer([&]() {
		(void)channel.Send(StormByte::String::ToByteVector("x"));
		sent.store(true);
	});

	std::this_thread::sleep_for(30ms);
	ASSERT_FALSE("test_channel_send_blocks_until_received still blocked", sent.load());

	DataType chunk;
	auto status = channel.Receive(chunk, 1s);
	producer.join();
	ASSERT_TRUE("test_channel_send_blocks_until_received received", status == Channel::Status::Received);
	ASSERT_TRUE("test_channel_send_blocks_until_received sent", sent.load());
	RETURN_TEST("test_channel_send_blocks_until_received", 0);
}

int test_channel_pending_chunk_before_close() {
	Channel channel;
	std::thread producer([&]() {
		(void)channel.Send(StormByte::String::ToByteVector("last"));
		channel.Close();
	});

	// Give the producer time to park its chunk
	std::this_thread::sleep_for(20ms);
	DataType chunk;
	auto first = channel.Receive(chunk, 1s);
	producer.join();
	auto second = channel.Receive(chunk, 1s);
	ASSERT_TRUE("test_channel_pending_chunk_before_close first", first == Channel::Status::Received);
	ASSERT_EQUAL("test_channel_pending_chunk_before_close content", StormByte::String::FromByteVector(chunk), std::string("last"));
	ASSERT_TRUE("test_channel_pending_chunk_before_close second", second == Channel::Status::Closed);
	ASSERT_TRUE("test_channel_pending_chunk_before_close no reason", channel.CloseReason() == nullptr);
	RETURN_TEST("test_channel_pending_chunk_before_close", 0);
}

int test_channel_cancel_unblocks_sender() {
	Channel channel;
	std::atomic<bool> send_result{true};
	std::thread producer([&]() {
		send_result.store(channel.Send(StormByte::String::ToByteVector("lost")));
	});

	std::this_thread::sleep_for(20ms);
	channel.Cancel();
	producer.join();

	DataType chunk;
	ASSERT_FALSE("test_channel_cancel_unblocks_sender send failed", send_result.load());
	ASSERT_TRUE("test_channel_cancel_unblocks_sender receive closed", channel.Receive(chunk, 10ms) == Channel::Status::Closed);
	ASSERT_TRUE("test_channel_cancel_unblocks_sender cancelled", channel.IsCancelled());
	ASSERT_FALSE("test_channel_cancel_unblocks_sender later send", channel.Send(StormByte::String::ToByteVector("y")));
	RETURN_TEST("test_channel_cancel_unblocks_sender", 0);
}

int test_channel_close_once() {
	Channel channel;
	channel.Close(std::make_shared<ReadError>(ReadError("device failure")));
	channel.Close(std::make_shared<EndOfStream>(EndOfStream("ignored")));
	ASSERT_TRUE("test_channel_close_once closed", channel.IsClosed());
	ASSERT_TRUE("test_channel_close_once keeps first reason",
		std::dynamic_pointer_cast<EndOfStream>(channel.CloseReason()) == nullptr);
	ASSERT_FALSE("test_channel_close_once send after close", channel.Send(StormByte::String::ToByteVector("z")));
	RETURN_TEST("test_channel_close_once", 0);
}

int main() {
	int result = 0;
	result += test_channel_handoff_in_order();
	result += test_channel_receive_times_out();
	result += test_channel_zero_timeout_polls();
	result += test_channel_send_blocks_until_received();
	result += test_channel_pending_chunk_before_close();
	result += test_channel_cancel_unblocks_sender();
	result += test_channel_close_once();

	if (result == 0) {
		std::cout << "Channel tests passed!" << std::endl;
	} else {
		std::cout << result << " Channel tests failed." << std::endl;
	}
	return result;
}
