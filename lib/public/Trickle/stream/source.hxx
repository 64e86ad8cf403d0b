#pragma once

#include <Trickle/stream/typedefs.hxx>

/**
 * @namespace Stream
 * @brief Namespace for the non-blocking stream components of the Trickle library.
 */
namespace Trickle::Stream {
	/**
	 * @class Source
	 * @brief Interface for blocking, sequential byte sources.
	 * @details A source is read by the background producer of a @ref Reader,
	 *          always from the same thread. It may block for as long as it
	 *          needs to; bounding the caller's latency is the reader's job.
	 * @note This class is intended to be used as a base class for specific
	 *       implementations that handle different kinds of devices.
	 */
	class TRICKLE_STREAM_PUBLIC Source {
		public:
			Source() noexcept 														= default;
			Source(const Source& other) 											= delete;
			Source(Source&& other) noexcept 										= default;
			virtual ~Source() noexcept 												= default;
			Source& operator=(const Source& other) 									= delete;
			Source& operator=(Source&& other) noexcept 								= default;

			/**
			 * @brief Ask a blocked @ref Read to return early.
			 * @return true if the source supports interruption and a pending or
			 *         future @ref Read will return promptly, false otherwise.
			 * @details Called from a thread other than the reading one. After a
			 *          successful interrupt @ref Read returns an error.
			 */
			virtual bool 															Interrupt() noexcept {
				return false;
			}

			/**
			 * @brief Blocking read of up to @p count bytes.
			 * @param count Maximum number of bytes to return.
			 * @return The bytes read (an empty vector means nothing this time),
			 *         an @ref EndOfStream error once the source is exhausted, or
			 *         another @ref ReadError on failure.
			 */
			virtual ExpectedData<ReadError> 										Read(const std::size_t& count) noexcept = 0;
	};

	/**
	 * @class FunctionSource
	 * @brief Source that delegates every read to an @ref ExternalReadFunction.
	 *
	 * @details Without an interrupt function a blocked read cannot be aborted, so
	 *          stopping the owning @ref Producer waits for it to return.
	 */
	class TRICKLE_STREAM_PUBLIC FunctionSource final: public Source {
		public:
			/**
			 * @brief Construct a FunctionSource.
			 * @param function Callable servicing @ref Read. It is only ever called
			 *        from the producer thread.
			 * @param interrupt Optional callable servicing @ref Interrupt.
			 */
			inline FunctionSource(ExternalReadFunction function, ExternalInterruptFunction interrupt = nullptr) noexcept:
				m_function(std::move(function)), m_interrupt(std::move(interrupt)) {}

			FunctionSource(FunctionSource&& other) noexcept 						= default;
			~FunctionSource() noexcept 												= default;
			FunctionSource& operator=(FunctionSource&& other) noexcept 				= default;

			/**
			 * @brief Forward to the interrupt function, if any.
			 * @return false when no interrupt function was given.
			 */
			bool 																	Interrupt() noexcept override;

			ExpectedData<ReadError> 												Read(const std::size_t& count) noexcept override;

		private:
			ExternalReadFunction m_function;										///< Delegated read function.
			ExternalInterruptFunction m_interrupt;									///< Delegated interrupt function.
	};

#ifndef WINDOWS
	/**
	 * @class FileDescriptorSource
	 * @brief Source reading a POSIX file descriptor (pipe, socket, tty or file).
	 *
	 * @details Every @ref Read waits with `poll()` on both the descriptor and an
	 *          internal wake-up pipe, so @ref Interrupt can abort a read that
	 *          would otherwise block forever. `read()` returning zero is reported
	 *          as @ref EndOfStream.
	 */
	class TRICKLE_STREAM_PUBLIC FileDescriptorSource final: public Source {
		public:
			/**
			 * @brief Construct a FileDescriptorSource.
			 * @param fd Descriptor to read from.
			 * @param owned Close @p fd on destruction.
			 * @throws Error if the wake-up pipe cannot be created.
			 */
			FileDescriptorSource(int fd, bool owned = false);
			FileDescriptorSource(FileDescriptorSource&& other)						= delete;
			~FileDescriptorSource() noexcept;
			FileDescriptorSource& operator=(FileDescriptorSource&& other)			= delete;

			/**
			 * @brief Wake a blocked @ref Read. Always supported.
			 * @return true.
			 */
			bool 																	Interrupt() noexcept override;

			ExpectedData<ReadError> 												Read(const std::size_t& count) noexcept override;

		private:
			int m_fd;																///< Descriptor being read.
			bool m_owned;															///< Whether @ref m_fd is closed on destruction.
			int m_wakeup[2] {-1, -1};												///< Read and write ends of the wake-up pipe.
	};
#endif
}
