#include <Trickle/stream/fifo.hxx>

#include <algorithm>
#include <cstring>

using namespace Trickle::Stream;

std::size_t FIFO::Extract(std::span<std::byte> out) noexcept {
	const std::size_t real_count = std::min(out.size(), AvailableBytes());
	if (real_count == 0)
		return 0;

	std::memcpy(out.data(), m_buffer.data() + m_position_offset, real_count);
	Consume(real_count);
	return real_count;
}

void FIFO::Write(DataType&& data) noexcept {
	if (data.empty())
		return;

	if (Empty()) {
		m_buffer = std::move(data);
		m_position_offset = 0;
		return;
	}
	m_buffer.insert(m_buffer.end(), data.begin(), data.end());
}

void FIFO::Consume(const std::size_t& count) noexcept {
	m_position_offset += count;
	if (m_position_offset == m_buffer.size()) {
		m_buffer.clear();
		m_position_offset = 0;
	}
	else if (m_position_offset * 2 >= m_buffer.size())
		Compact();
}

void FIFO::Compact() noexcept {
	// Read bytes are a prefix of at least half the storage; the tail fits in place
	m_buffer.erase(m_buffer.begin(), m_buffer.begin() + static_cast<std::ptrdiff_t>(m_position_offset));
	m_position_offset = 0;
}
