#pragma once

#include <Trickle/stream/visibility.h>
#include <StormByte/exception.hxx>

#include <format>
#include <string>

/**
 * @namespace Stream
 * @brief Namespace for the non-blocking stream components of the Trickle library.
 *
 * The Stream namespace provides the pieces needed to put a bounded-latency
 * read interface in front of a blocking byte source: sources, the handoff
 * channel, the background producer and the timeout-arbitrating reader.
 */
namespace Trickle::Stream {
	// Generic Stream exceptions
	class TRICKLE_STREAM_PUBLIC Exception: public StormByte::Exception {
		public:
			template <typename... Args>
			Exception(const std::string& component, std::format_string<Args...> fmt, Args&&... args):
			StormByte::Exception("Stream::" + component, fmt, std::forward<Args>(args)...) {}
	};

	/**
	 * @class Error
	 * @brief General exception class for stream errors.
	 */
	class TRICKLE_STREAM_PUBLIC Error: public Exception {
		public:
			using Exception::Exception;
	};

	/**
	 * @class ReadError
	 * @brief Exception class for read errors from sources and readers.
	 *
	 * @details Returned by a @ref Source when its underlying device fails, and
	 *          by @ref Reader when strict error reporting is enabled.
	 */
	class TRICKLE_STREAM_PUBLIC ReadError: public Error {
		public:
			template <typename... Args>
			ReadError(std::format_string<Args...> fmt, Args&&... args):
			Error("ReadError", fmt, std::forward<Args>(args)...) {}
	};

	/**
	 * @class EndOfStream
	 * @brief Clean, permanent exhaustion of a byte source.
	 *
	 * @details Sources return it when no more bytes will ever be produced.
	 *          @ref Reader::Read returns it once the stream ended and every
	 *          buffered byte has been delivered.
	 */
	class TRICKLE_STREAM_PUBLIC EndOfStream: public ReadError {
		public:
			template <typename... Args>
			EndOfStream(std::format_string<Args...> fmt, Args&&... args):
			ReadError(fmt, std::forward<Args>(args)...) {}
	};

	/**
	 * @class ConfigError
	 * @brief Exception class for invalid reader configuration.
	 *
	 * @details Thrown when a @ref Reader is constructed with invalid
	 *          @ref Options or without a source.
	 */
	class TRICKLE_STREAM_PUBLIC ConfigError: public Error {
		public:
			template <typename... Args>
			ConfigError(std::format_string<Args...> fmt, Args&&... args):
			Error("ConfigError", fmt, std::forward<Args>(args)...) {}
	};
}
