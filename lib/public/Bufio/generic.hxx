#pragma once

#include <Bufio/typedefs.hxx>

#include <string_view>

/**
 * @namespace Bufio
 * @brief Namespace for the buffered byte-stream decorators.
 *
 * The Bufio namespace provides buffering wrappers for byte sources and sinks:
 * buffered readers, buffered and line buffered writers, and buffered duplex streams.
 */
namespace Bufio {
	/**
	* @class Generic
	* @brief Generic class to maintain common API guarantees across stream capabilities.
	* @par Overview
	*  Generic is the common virtual base of @ref Source and @ref Sink so that an
	*  object implementing both (@ref Duplex) holds a single base subobject.
	*  Streams are identity objects: they are neither copyable nor movable and
	*  are owned through `std::unique_ptr`.
	*/
	class BUFIO_PUBLIC Generic {
		public:
			/**
			 * 	@brief Construct Generic.
			 */
			Generic() noexcept												= default;

			/**
			 * 	@brief Copy construct deleted
			 */
			Generic(const Generic&) noexcept 								= delete;

			/**
			 * 	@brief Move construct deleted
			 */
			Generic(Generic&&) noexcept										= delete;

			/**
			 * 	@brief Virtual destructor.
			 */
			virtual ~Generic() noexcept 									= 0;

			/**
			 * 	@brief Copy assign deleted
			 */
			Generic& operator=(const Generic& other) 						= delete;

			/**
			 * 	@brief Move assign deleted
			 */
			Generic& operator=(Generic&&) noexcept							= delete;
	};

	/**
	 * @class Source
	 * @brief Capability of an object bytes can be read from.
	 * @par Overview
	 *  A source delivers bytes on request. Reads may be short: a call can
	 *  produce fewer bytes than the destination holds without being an error.
	 *  A read that produces no bytes reports `std::nullopt`; whether that is a
	 *  permanent end-of-stream is answered separately by @ref EoF().
	 */
	class BUFIO_PUBLIC Source: virtual public Generic {
		public:
			/**
			 * 	@brief Construct Source.
			 */
			inline Source() noexcept: Generic() {};

			Source(const Source&) noexcept 									= delete;
			Source(Source&&) noexcept										= delete;

			/**
			 * 	@brief Virtual destructor.
			 */
			virtual ~Source() noexcept 										= default;

			Source& operator=(const Source&) 								= delete;
			Source& operator=(Source&&) noexcept							= delete;

			/**
			 * @brief Check if the source has reached end-of-stream.
			 * @return true when no more bytes will ever be produced.
			 */
			virtual bool 													EoF() noexcept = 0;

			/**
			 * @brief Read bytes into `destination`.
			 * @param destination Buffer to fill; at most `destination.size()` bytes are written.
			 * @return Number of bytes written into `destination`, `std::nullopt` when no
			 *         bytes were produced, or a `ReadError` if the source failed.
			 * @details Short reads are legal. Implementations must not report a count
			 *          larger than `destination.size()`.
			 */
			virtual ExpectedCount<ReadError> 								Read(std::span<std::byte> destination) noexcept = 0;
	};

	/**
	 * @class Sink
	 * @brief Capability of an object bytes can be written to.
	 * @par Overview
	 *  A sink either accepts a whole write or fails; there are no partial writes.
	 *  Sinks may buffer internally, @ref Flush() forces delivery.
	 */
	class BUFIO_PUBLIC Sink: virtual public Generic {
		public:
			/**
			 * 	@brief Construct Sink.
			 */
			inline Sink() noexcept: Generic() {};

			Sink(const Sink&) 												= delete;
			Sink(Sink&&) noexcept											= delete;

			/**
			 * 	@brief Virtual destructor.
			 */
			virtual ~Sink() noexcept 										= default;

			Sink& operator=(const Sink&) 									= delete;
			Sink& operator=(Sink&&) noexcept								= delete;

			/**
			 * @brief Force delivery of any bytes held by the sink.
			 * @return ExpectedVoid<WriteError> indicating success or failure.
			 */
			virtual ExpectedVoid<WriteError> 								Flush() noexcept = 0;

			/**
			 * @brief Write all of `data`.
			 * @param data Bytes to write.
			 * @return ExpectedVoid<WriteError> indicating success or failure.
			 */
			virtual ExpectedVoid<WriteError> 								Write(std::span<const std::byte> data) noexcept = 0;

			/**
			 * @note Convenience overloads
			 *
			 * These non-virtual overloads convert their argument to a byte span and
			 * forward to the canonical `Write(std::span<const std::byte>)`. Derived
			 * classes overriding `Write` must bring them back with `using Sink::Write;`.
			 */

			/**
			 * @brief Write a whole byte vector.
			 */
			inline ExpectedVoid<WriteError> 								Write(const DataType& data) noexcept {
				return Write(std::span<const std::byte>(data.data(), data.size()));
			}

			/**
			 * @brief Write from a string view (does not include terminating NUL).
			 */
			inline ExpectedVoid<WriteError> 								Write(std::string_view sv) noexcept {
				return Write(std::as_bytes(std::span<const char>(sv.data(), sv.size())));
			}

			/**
			 * @brief Write from a C string pointer (null-terminated). Uses `std::string_view`.
			 */
			inline ExpectedVoid<WriteError> 								Write(const char* s) noexcept {
				if (!s) return {};
				return Write(std::string_view(s));
			}
	};

	/**
	 * @class Duplex
	 * @brief Capability of an object that is both a @ref Source and a @ref Sink.
	 * @details Typical duplex objects are sockets and pipes pairs. Reading and
	 *          writing are independent directions over the same channel.
	 *          @ref Source and @ref Sink are virtual bases so a buffered source
	 *          can also be a duplex object with a single @ref Source subobject.
	 */
	class BUFIO_PUBLIC Duplex: virtual public Source, virtual public Sink {
		public:
			/**
			 * 	@brief Construct Duplex.
			 */
			inline Duplex() noexcept: Generic() {};

			Duplex(const Duplex& other) noexcept 							= delete;
			Duplex(Duplex&& other) noexcept									= delete;

			/**
			 * 	@brief Virtual destructor.
			 */
			virtual ~Duplex() noexcept 										= default;

			Duplex& operator=(const Duplex& other) 							= delete;
			Duplex& operator=(Duplex&& other) noexcept						= delete;
	};
}
