#pragma once

#include <Trickle/stream/typedefs.hxx>
#include <StormByte/logger/log.hxx>

#include <memory>

/**
 * @namespace Stream
 * @brief Namespace for the non-blocking stream components of the Trickle library.
 */
namespace Trickle::Stream {
	/**
	 * @class Options
	 * @brief Construction settings for a @ref Reader.
	 *
	 * @par Timeouts
	 *  - @ref Timeout(const Duration&) bounds how long a single read may wait
	 *    overall. Zero (the default) makes every read return immediately with
	 *    whatever is buffered.
	 *  - @ref ChunkTimeout(const Duration&) makes a read return early once no
	 *    chunk arrived for that long. Zero (the default) disables it. It must
	 *    not exceed the overall timeout.
	 *
	 * @par Example
	 * @code{.cpp}
	 * // Return after 200ms without new data, or after 2s at the latest
	 * Reader reader(source, 1 << 16, Options()
	 * 	.Timeout(std::chrono::seconds(2))
	 * 	.ChunkTimeout(std::chrono::milliseconds(200)));
	 * @endcode
	 */
	class TRICKLE_STREAM_PUBLIC Options final {
		public:
			Options() noexcept 										= default;
			Options(const Options& other) 							= default;
			Options(Options&& other) noexcept 						= default;
			~Options() noexcept 									= default;
			Options& operator=(const Options& other) 				= default;
			Options& operator=(Options&& other) noexcept 			= default;

			inline const Duration& 									ChunkTimeout() const noexcept {
				return m_chunk_timeout;
			}

			/**
			 * @brief Set the chunk (idle) timeout.
			 * @return Reference to this Options for chaining.
			 */
			inline Options& 										ChunkTimeout(const Duration& timeout) noexcept {
				m_chunk_timeout = timeout;
				return *this;
			}

			inline const std::shared_ptr<StormByte::Logger::Log>& 	Log() const noexcept {
				return m_log;
			}

			/**
			 * @brief Set the logger used by the reader.
			 * @details The logger is only written from the thread calling into the
			 *          @ref Reader (construction, reads, cancellation).
			 * @return Reference to this Options for chaining.
			 */
			inline Options& 										Log(std::shared_ptr<StormByte::Logger::Log> log) noexcept {
				m_log = std::move(log);
				return *this;
			}

			inline bool 											StrictErrors() const noexcept {
				return m_strict_errors;
			}

			/**
			 * @brief Report source failures as themselves.
			 * @details By default a failing source looks exactly like an exhausted
			 *          one: once the buffer drains, reads return @ref EndOfStream.
			 *          With strict errors the source's own @ref ReadError is
			 *          returned instead.
			 * @return Reference to this Options for chaining.
			 */
			inline Options& 										StrictErrors(bool strict) noexcept {
				m_strict_errors = strict;
				return *this;
			}

			inline const Duration& 									Timeout() const noexcept {
				return m_timeout;
			}

			/**
			 * @brief Set the overall timeout.
			 * @return Reference to this Options for chaining.
			 */
			inline Options& 										Timeout(const Duration& timeout) noexcept {
				m_timeout = timeout;
				return *this;
			}

			/**
			 * @brief Check these options against a block size.
			 * @param block_size Block size the reader will use.
			 * @return A @ref ConfigError when the block size is zero, a timeout is
			 *         negative or the chunk timeout exceeds the overall timeout.
			 */
			ExpectedVoid<ConfigError> 								Validate(const std::size_t& block_size) const noexcept;

		private:
			Duration m_timeout {Duration::zero()};					///< Overall timeout.
			Duration m_chunk_timeout {Duration::zero()};			///< Chunk timeout, zero disables it.
			bool m_strict_errors {false};							///< Surface source failures distinctly.
			std::shared_ptr<StormByte::Logger::Log> m_log;			///< Optional logger.
	};
}
