#pragma once

#include <Trickle/stream/exception.hxx>
#include <StormByte/expected.hxx>

#include <chrono>
#include <cstddef>
#include <expected>
#include <functional>
#include <vector>

/**
 * @namespace Stream
 * @brief Namespace for the non-blocking stream components of the Trickle library.
 */
namespace Trickle::Stream {
	using DataType = std::vector<std::byte>;

	using Clock = std::chrono::steady_clock;
	using Duration = Clock::duration;

	template<typename T, class Exception>
	using Expected = StormByte::Expected<T, Exception>;

	template<class Exception>
	using ExpectedVoid = Expected<void, Exception>;

	template<class Exception>
	using ExpectedData = Expected<DataType, Exception>;

	template<class Exception>
	using ExpectedCount = Expected<std::size_t, Exception>;

	/**
	 * @brief Type alias for external blocking read functions.
	 *
	 * @details Called with the maximum number of bytes wanted. Returns the bytes
	 *          read (possibly fewer, possibly none), an @ref EndOfStream error when
	 *          the source is exhausted, or any other @ref ReadError on failure.
	 *
	 * @see FunctionSource
	 */
	using ExternalReadFunction = std::function<ExpectedData<ReadError>(const std::size_t&)>;

	/**
	 * @brief Type alias for functions waking a blocked @ref ExternalReadFunction.
	 * @details Called from a thread other than the reading one. Returns true when
	 *          the pending or next read is guaranteed to return promptly.
	 */
	using ExternalInterruptFunction = std::function<bool()>;
}
