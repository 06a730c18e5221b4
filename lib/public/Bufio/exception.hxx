#pragma once

#include <Bufio/visibility.h>
#include <StormByte/exception.hxx>

/**
 * @namespace Bufio
 * @brief Namespace for the buffered byte-stream decorators.
 *
 * The Bufio namespace provides buffering wrappers for byte sources and sinks:
 * buffered readers, buffered and line buffered writers, and buffered duplex streams.
 */
namespace Bufio {
	// Generic Bufio exceptions
	class BUFIO_PUBLIC Exception: public StormByte::Exception {
		public:
			template <typename... Args>
			Exception(const std::string& component, std::format_string<Args...> fmt, Args&&... args):
			StormByte::Exception("Bufio::" + component, fmt, std::forward<Args>(args)...) {}
	};

	/**
	 * @class Error
	 * @brief General exception class for buffered stream errors.
	 */
	class BUFIO_PUBLIC Error: public Exception {
		public:
			using Exception::Exception;
	};

	/**
	 * @class ReadError
	 * @brief Exception class for read errors from sources.
	 *
	 * @details Reported when a source fails to deliver bytes or when a caller
	 *          tries to consume more bytes than were filled.
	 */
	class BUFIO_PUBLIC ReadError: public Error {
		public:
			template <typename... Args>
			ReadError(std::format_string<Args...> fmt, Args&&... args):
			Error("ReadError", fmt, std::forward<Args>(args)...) {}
	};

	/**
	 * @class WriteError
	 * @brief Exception class for write errors to sinks.
	 *
	 * @details Reported when a sink fails to accept or flush bytes.
	 */
	class BUFIO_PUBLIC WriteError: public Error {
		public:
			template <typename... Args>
			WriteError(std::format_string<Args...> fmt, Args&&... args):
			Error("WriteError", fmt, std::forward<Args>(args)...) {}
	};
}
