#include <Trickle/stream/reader.hxx>

#include <algorithm>

using namespace Trickle::Stream;
using StormByte::Logger::Level;

namespace {
	inline long long Milliseconds(const Duration& duration) noexcept {
		return static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(duration).count());
	}
}

Reader::Reader(std::shared_ptr<Source> source, const std::size_t& block_size, const Options& options):
m_options(options), m_block_size(block_size), m_channel(std::make_shared<Channel>()) {
	if (!source)
		throw ConfigError("Reader requires a source");

	auto valid = m_options.Validate(m_block_size);
	if (!valid)
		throw *valid.error();

	m_producer = std::make_unique<Producer>(std::move(source), m_channel, m_block_size);

	if (const auto& log = m_options.Log()) {
		*log << Level::Debug << "Reader started: block size " << m_block_size
			<< ", timeout " << Milliseconds(m_options.Timeout()) << "ms"
			<< ", chunk timeout " << Milliseconds(m_options.ChunkTimeout()) << "ms" << std::endl;
	}
}

Reader::Reader(const ExternalReadFunction& function, const std::size_t& block_size, const Options& options):
Reader(std::make_shared<FunctionSource>(function), block_size, options) {}

Reader::~Reader() noexcept {
	if (m_producer)
		m_producer->Stop();
}

void Reader::Cancel() noexcept {
	if (m_eof)
		return;

	m_producer->Stop();
	m_eof = true;
	if (const auto& log = m_options.Log())
		*log << Level::Debug << "Reader cancelled with " << m_buffer.AvailableBytes() << " bytes buffered" << std::endl;
}

ExpectedCount<ReadError> Reader::Read(std::span<std::byte> buffer) noexcept {
	auto ready = Ready(buffer.size());
	if (!ready)
		return std::unexpected(ready.error());

	return m_buffer.Extract(buffer.first(*ready));
}

ExpectedData<ReadError> Reader::Read(const std::size_t& count) noexcept {
	auto ready = Ready(count);
	if (!ready)
		return std::unexpected(ready.error());

	// Sized from what was received, never from the request
	DataType data(*ready);
	(void)m_buffer.Extract(std::span<std::byte>(data));
	return data;
}

ExpectedCount<ReadError> Reader::Ready(const std::size_t& count) noexcept {
	if (m_buffer.AvailableBytes() >= count)
		return count;

	if (m_eof)
		return Drain();

	Fill(count);
	// End of stream seen during this call is reported by the next one
	return std::min(count, m_buffer.AvailableBytes());
}

ExpectedCount<ReadError> Reader::Drain() noexcept {
	const std::size_t available = m_buffer.AvailableBytes();
	if (available > 0)
		return available;

	if (m_options.StrictErrors() && m_source_error)
		return std::unexpected(m_source_error);

	return StormByte::Unexpected(EndOfStream("End of stream reached"));
}

void Reader::Fill(const std::size_t& count) noexcept {
	const auto start = Clock::now();
	DataType chunk;

	while (m_buffer.AvailableBytes() < count) {
		const auto iteration_start = Clock::now();
		const auto status = m_channel->Receive(chunk, NextTimeout(iteration_start - start));
		const auto now = Clock::now();

		switch (status) {
			case Channel::Status::Received:
				m_buffer.Write(std::move(chunk));
				chunk.clear();
				break;
			case Channel::Status::Timeout:
				if (now - iteration_start >= m_options.ChunkTimeout())
					return;
				break;
			case Channel::Status::Closed:
				MarkEndOfStream();
				return;
		}

		if (now - start >= m_options.Timeout())
			return;
	}
}

void Reader::MarkEndOfStream() noexcept {
	m_eof = true;

	auto reason = m_channel->CloseReason();
	if (reason && !std::dynamic_pointer_cast<EndOfStream>(reason))
		m_source_error = std::move(reason);

	if (const auto& log = m_options.Log()) {
		if (m_source_error)
			*log << Level::Warning << "Source failed, treating as end of stream: " << m_source_error->what() << std::endl;
		else
			*log << Level::Debug << "End of stream with " << m_buffer.AvailableBytes() << " bytes buffered" << std::endl;
	}
}

Duration Reader::NextTimeout(const Duration& elapsed) const noexcept {
	const Duration remaining = m_options.Timeout() - elapsed;
	const Duration& chunk_timeout = m_options.ChunkTimeout();
	if (chunk_timeout == Duration::zero() || chunk_timeout > remaining)
		return remaining;

	return chunk_timeout;
}
