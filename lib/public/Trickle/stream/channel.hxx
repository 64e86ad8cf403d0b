#pragma once

#include <Trickle/stream/typedefs.hxx>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

/**
 * @namespace Stream
 * @brief Namespace for the non-blocking stream components of the Trickle library.
 */
namespace Trickle::Stream {
	/**
	 * @class Channel
	 * @brief Single-slot rendezvous channel handing chunks from one producer to one consumer.
	 *
	 * @par Overview
	 *  The channel holds at most one in-flight chunk. @ref Send parks the chunk
	 *  in the slot and blocks until the consumer took it, so the producer can
	 *  never run more than one chunk ahead of the consumer.
	 *
	 * @par Close behavior
	 *  @ref Close is called once by the producer when it stops producing. It
	 *  records the error that ended the source (an @ref EndOfStream on clean
	 *  end). A chunk still in the slot is delivered before the closure is
	 *  reported to the consumer.
	 *
	 * @par Cancel behavior
	 *  @ref Cancel is the consumer-side shutdown. It wakes a blocked sender
	 *  (which then gives up) and makes every later @ref Receive report
	 *  @ref Status::Closed once the slot is empty.
	 *
	 * @par Thread safety
	 *  Safe for exactly one sending thread and one receiving thread.
	 */
	class TRICKLE_STREAM_PUBLIC Channel final {
		public:
			/**
			 * @enum Status
			 * @brief Outcome of a @ref Receive call.
			 */
			enum class Status: unsigned short {
				Received,		///< A chunk was taken from the slot.
				Timeout,		///< Nothing arrived within the timeout.
				Closed			///< The channel is closed or cancelled and the slot is empty.
			};

			Channel() noexcept										= default;
			Channel(const Channel&)									= delete;
			Channel(Channel&&)										= delete;
			~Channel() noexcept										= default;
			Channel& operator=(const Channel&)						= delete;
			Channel& operator=(Channel&&)							= delete;

			/**
			 * @brief Cancel the channel from the consumer side.
			 * @details Wakes a blocked @ref Send. A chunk not yet taken is discarded.
			 */
			void 													Cancel() noexcept;

			/**
			 * @brief Close the channel for further sends.
			 * @param reason Error that ended the source; kept for @ref CloseReason().
			 */
			void 													Close(std::shared_ptr<ReadError> reason = nullptr) noexcept;

			/**
			 * @brief Error recorded by @ref Close, or null.
			 */
			std::shared_ptr<ReadError> 								CloseReason() const noexcept;

			bool 													IsCancelled() const noexcept;

			bool 													IsClosed() const noexcept;

			/**
			 * @brief Wait up to @p timeout for a chunk.
			 * @param out Receives the chunk when @ref Status::Received is returned.
			 * @param timeout Maximum wait. Zero or negative polls without blocking.
			 * @return What happened; see @ref Status.
			 */
			Status 													Receive(DataType& out, const Duration& timeout) noexcept;

			/**
			 * @brief Hand @p chunk to the consumer, blocking until it is taken.
			 * @return true if the consumer took the chunk, false if the channel
			 *         was closed or cancelled first.
			 */
			bool 													Send(DataType&& chunk) noexcept;

		private:
			mutable std::mutex m_mutex;								///< Mutex protecting internal state.
			std::condition_variable_any m_cv;						///< Signals slot and state changes both ways.
			std::optional<DataType> m_slot;							///< The in-flight chunk.
			bool m_closed {false};									///< Closed by the producer.
			bool m_cancelled {false};								///< Cancelled by the consumer.
			std::shared_ptr<ReadError> m_reason;					///< Why the producer closed the channel.
	};
}
