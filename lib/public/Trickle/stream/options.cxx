#include <Trickle/stream/options.hxx>

using namespace Trickle::Stream;

namespace {
	inline long long Milliseconds(const Duration& duration) noexcept {
		return static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(duration).count());
	}
}

ExpectedVoid<ConfigError> Options::Validate(const std::size_t& block_size) const noexcept {
	if (block_size == 0)
		return StormByte::Unexpected(ConfigError("Block size must be greater than 0"));

	if (m_timeout < Duration::zero())
		return StormByte::Unexpected(ConfigError("Timeout must not be negative ({}ms)", Milliseconds(m_timeout)));

	if (m_chunk_timeout < Duration::zero())
		return StormByte::Unexpected(ConfigError("Chunk timeout must not be negative ({}ms)", Milliseconds(m_chunk_timeout)));

	if (m_chunk_timeout > m_timeout)
		return StormByte::Unexpected(ConfigError("Chunk timeout ({}ms) must not exceed timeout ({}ms)", Milliseconds(m_chunk_timeout), Milliseconds(m_timeout)));

	return {};
}
