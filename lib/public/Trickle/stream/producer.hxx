#pragma once

#include <Trickle/stream/channel.hxx>
#include <Trickle/stream/source.hxx>

#include <atomic>
#include <thread>

/**
 * @namespace Stream
 * @brief Namespace for the non-blocking stream components of the Trickle library.
 */
namespace Trickle::Stream {
	/**
	 * @class Producer
	 * @brief Background loop pumping a @ref Source into a @ref Channel.
	 *
	 * @par Overview
	 *  On construction a thread is started which repeatedly reads up to
	 *  `block_size` bytes from the source and sends every non-empty chunk on
	 *  the channel. Empty reads are skipped. The first error returned by the
	 *  source, clean @ref EndOfStream or not, ends the loop and closes the
	 *  channel with that error as reason.
	 *
	 * @par Shutdown
	 *  @ref Stop cancels the channel, interrupts the source and joins the
	 *  thread. A source that does not support @ref Source::Interrupt makes
	 *  @ref Stop wait until its pending read returns.
	 */
	class TRICKLE_STREAM_PUBLIC Producer final {
		public:
			/**
			 * @brief Start producing.
			 * @param source Source to read from.
			 * @param channel Channel to send chunks to; closed when the loop ends.
			 * @param block_size Maximum number of bytes requested per read.
			 */
			Producer(std::shared_ptr<Source> source, std::shared_ptr<Channel> channel, const std::size_t& block_size);
			Producer(const Producer&)								= delete;
			Producer(Producer&&)									= delete;

			/**
			 * @brief Destructor, calls @ref Stop.
			 */
			~Producer() noexcept;
			Producer& operator=(const Producer&)					= delete;
			Producer& operator=(Producer&&)							= delete;

			/**
			 * @brief Whether the loop is still running.
			 */
			inline bool 											IsRunning() const noexcept {
				return m_running->load();
			}

			/**
			 * @brief Stop the loop and release the thread. Safe to call more than once.
			 */
			void 													Stop() noexcept;

		private:
			std::shared_ptr<Source> m_source;						///< Source being pumped.
			std::shared_ptr<Channel> m_channel;						///< Destination channel.
			std::shared_ptr<std::atomic<bool>> m_running;			///< Cleared by the thread when the loop ends.
			std::thread m_thread;									///< Producer thread.

			static void 											Loop(std::shared_ptr<Source> source, std::shared_ptr<Channel> channel, std::size_t block_size, std::shared_ptr<std::atomic<bool>> running) noexcept;
	};
}
