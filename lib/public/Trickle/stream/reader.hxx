#pragma once

#include <Trickle/stream/fifo.hxx>
#include <Trickle/stream/options.hxx>
#include <Trickle/stream/producer.hxx>

#include <span>

/**
 * @namespace Stream
 * @brief Namespace for the non-blocking stream components of the Trickle library.
 */
namespace Trickle::Stream {
	/**
	 * @class Reader
	 * @brief Bounded-latency reader in front of a blocking @ref Source.
	 *
	 * @par Overview
	 *  A background @ref Producer reads the source greedily, `block_size` bytes
	 *  at a time, and hands chunks over a @ref Channel. Every @ref Read pulls
	 *  those chunks into an internal @ref FIFO and returns as soon as one of
	 *  the following holds:
	 *  - the buffer holds enough bytes for the request;
	 *  - no chunk arrived for the chunk timeout;
	 *  - the overall timeout elapsed since the call started;
	 *  - the source ended.
	 *
	 *  Short reads, including zero-byte reads, are the normal outcome and are
	 *  not errors. Bytes are delivered exactly once, in source order.
	 *
	 * @par End of stream
	 *  Once the source ended, reads keep returning buffered bytes without
	 *  error. The first read that finds nothing left returns @ref EndOfStream,
	 *  and so does every read after it. With @ref Options::StrictErrors a
	 *  source failure is returned as its own @ref ReadError instead.
	 *
	 * @par Thread safety
	 *  @ref Read and the other members must not be called concurrently; the
	 *  producer thread only talks to the reader through the channel.
	 */
	class TRICKLE_STREAM_PUBLIC Reader final {
		public:
			/**
			 * @brief Construct a Reader and start its producer.
			 * @param source Source to read from.
			 * @param block_size Maximum chunk size read from the source at once.
			 * @param options Timeouts, error reporting and logging.
			 * @throws ConfigError if @p source is null or the options are invalid.
			 */
			Reader(std::shared_ptr<Source> source, const std::size_t& block_size, const Options& options = Options());

			/**
			 * @brief Construct a Reader over an @ref ExternalReadFunction.
			 * @details The function cannot be interrupted: @ref Cancel and the
			 *          destructor wait for a pending call to return. Build a
			 *          @ref FunctionSource with an interrupt function to avoid that.
			 * @see FunctionSource
			 */
			Reader(const ExternalReadFunction& function, const std::size_t& block_size, const Options& options = Options());
			Reader(const Reader&)									= delete;
			Reader(Reader&&)										= delete;

			/**
			 * @brief Destructor, stops the producer and waits for its thread.
			 */
			~Reader() noexcept;
			Reader& operator=(const Reader&)						= delete;
			Reader& operator=(Reader&&)								= delete;

			/**
			 * @brief Bytes already received and not yet read.
			 */
			inline std::size_t 										AvailableBytes() const noexcept {
				return m_buffer.AvailableBytes();
			}

			inline const std::size_t& 								BlockSize() const noexcept {
				return m_block_size;
			}

			/**
			 * @brief Stop the producer.
			 * @details Already received bytes stay readable; after them reads
			 *          return @ref EndOfStream. Blocks until a pending source
			 *          read returns when the source cannot be interrupted.
			 */
			void 													Cancel() noexcept;

			/**
			 * @brief Whether the end of the stream was seen and every byte was read.
			 */
			inline bool 											EoF() const noexcept {
				return m_eof && m_buffer.Empty();
			}

			/**
			 * @brief Read up to `buffer.size()` bytes.
			 * @param buffer Region to fill.
			 * @return The number of bytes written to @p buffer, possibly zero, or
			 *         @ref EndOfStream when the stream ended and nothing is left.
			 */
			ExpectedCount<ReadError> 								Read(std::span<std::byte> buffer) noexcept;

			/**
			 * @brief Read up to @p count bytes into a new vector.
			 * @return The bytes read, possibly fewer than @p count or none, or
			 *         @ref EndOfStream when the stream ended and nothing is left.
			 */
			ExpectedData<ReadError> 								Read(const std::size_t& count) noexcept;

			/**
			 * @brief The failure that stopped the source, if any.
			 * @return null while the source is running, after a clean end or after
			 *         @ref Cancel.
			 */
			inline const std::shared_ptr<ReadError>& 				SourceError() const noexcept {
				return m_source_error;
			}

		private:
			Options m_options;										///< Immutable settings.
			std::size_t m_block_size;								///< Chunk size read from the source.
			std::shared_ptr<Channel> m_channel;						///< Handoff from the producer.
			FIFO m_buffer;											///< Received, unread bytes.
			bool m_eof {false};										///< Channel closure observed.
			std::shared_ptr<ReadError> m_source_error;				///< Reason the source failed.
			std::unique_ptr<Producer> m_producer;					///< Background producer.

			ExpectedCount<ReadError> 								Drain() noexcept;
			void 													Fill(const std::size_t& count) noexcept;
			void 													MarkEndOfStream() noexcept;
			Duration 												NextTimeout(const Duration& elapsed) const noexcept;
			ExpectedCount<ReadError> 								Ready(const std::size_t& count) noexcept;
	};
}
