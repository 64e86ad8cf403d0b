#pragma once

#include <Trickle/stream/typedefs.hxx>

#include <span>

/**
 * @namespace Stream
 * @brief Namespace for the non-blocking stream components of the Trickle library.
 */
namespace Trickle::Stream {
	/**
	* @class FIFO
	* @brief Byte-oriented FIFO buffer with grow-on-demand.
	*
	* @par Overview
	*  A contiguous growable buffer implemented atop @c DataType that tracks
	*  a logical read position. Writes append at the back, extracts consume
	*  from the read position. Consumed bytes are compacted away lazily, once
	*  they make up at least half of the storage.
	*
	* @par Thread safety
	*  This class is **not thread-safe**. @ref Reader owns one exclusively and
	*  only touches it from the caller thread.
	*/
	class TRICKLE_STREAM_PUBLIC FIFO {
		public:
			/**
			 * 	@brief Construct FIFO.
			 */
			FIFO() noexcept 										= default;

			FIFO(const FIFO& other)									= default;
			FIFO(FIFO&& other) noexcept								= default;
			~FIFO() noexcept 										= default;
			FIFO& operator=(const FIFO& other)						= default;
			FIFO& operator=(FIFO&& other) noexcept					= default;

			/**
			 * @brief Get the number of bytes available for reading.
			 * @return The number of bytes that can be extracted from the current read position.
			 */
			inline std::size_t 										AvailableBytes() const noexcept {
				return m_buffer.size() - m_position_offset;
			}

			/**
			 * @brief Check if there is no unread data.
			 */
			inline bool 											Empty() const noexcept {
				return AvailableBytes() == 0;
			}

			/**
			 * @brief Destructive read into a caller-owned region.
			 * @param out Region to fill; at most `out.size()` bytes are copied.
			 * @return Number of bytes copied, which is `min(out.size(), AvailableBytes())`.
			 */
			std::size_t 											Extract(std::span<std::byte> out) noexcept;

			/**
			 * @brief Append `data`, moving it in when the buffer holds no unread bytes.
			 */
			void 													Write(DataType&& data) noexcept;

		private:
			DataType m_buffer;										///< Internal storage.
			std::size_t m_position_offset {0};						///< Read position inside @ref m_buffer.

			void 													Consume(const std::size_t& count) noexcept;
			void 													Compact() noexcept;
	};
}
