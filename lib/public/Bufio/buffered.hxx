#pragma once

#include <Bufio/generic.hxx>

/**
 * @namespace Bufio
 * @brief Namespace for the buffered byte-stream decorators.
 *
 * The Bufio namespace provides buffering wrappers for byte sources and sinks:
 * buffered readers, buffered and line buffered writers, and buffered duplex streams.
 */
namespace Bufio {
	/**
	 * @class BufferedSource
	 * @brief A @ref Source that exposes its internal buffer through a fill/consume protocol.
	 * @par Overview
	 *  `Fill()` hands out the buffered bytes without copying them and `Consume()`
	 *  marks some of them as used. Record oriented reads (`ReadUntil()`,
	 *  `ReadLine()`) and draining reads (`ReadUntilEoF()`) are built on top of
	 *  those two operations, so any implementation gets them for free.
	 */
	class BUFIO_PUBLIC BufferedSource: virtual public Source {
		public:
			/**
			 * 	@brief Construct BufferedSource.
			 */
			inline BufferedSource() noexcept: Generic() {};

			BufferedSource(const BufferedSource&) noexcept 					= delete;
			BufferedSource(BufferedSource&&) noexcept						= delete;

			/**
			 * 	@brief Virtual destructor.
			 */
			virtual ~BufferedSource() noexcept 								= default;

			BufferedSource& operator=(const BufferedSource&) 				= delete;
			BufferedSource& operator=(BufferedSource&&) noexcept			= delete;

			/**
			 * @brief Mark `amount` buffered bytes as consumed.
			 * @param amount Number of bytes, at most the size of the last `Fill()` view.
			 * @return ExpectedVoid<ReadError>; consuming more than was filled is
			 *         rejected and leaves the buffer unchanged.
			 * @details Pure bookkeeping, never performs I/O.
			 */
			virtual ExpectedVoid<ReadError> 								Consume(const std::size_t& amount) noexcept = 0;

			/**
			 * @brief Get the buffered, unread bytes, refilling the buffer if it is exhausted.
			 * @return A view of the available bytes (empty at end-of-stream), or the
			 *         `ReadError` reported by the wrapped source.
			 * @details At most one read is issued to the wrapped source, and only
			 *          when nothing is left in the buffer.
			 * @warning The view is only valid until the next call on this object.
			 */
			virtual ExpectedView<ReadError> 								Fill() noexcept = 0;

			/**
			 * @brief Read up to and including the next `delimiter` byte.
			 * @param delimiter Byte terminating the record.
			 * @return The record including its delimiter; the remaining bytes when
			 *         end-of-stream is reached before a delimiter; `std::nullopt`
			 *         when end-of-stream is reached before any byte.
			 */
			ExpectedRecord<ReadError> 										ReadUntil(const std::byte& delimiter) noexcept;

			/**
			 * @brief Read the next `'\n'` terminated line.
			 * @return The line text with its newline (the last line may lack one),
			 *         or `std::nullopt` at end-of-stream.
			 */
			ExpectedLine<ReadError> 										ReadLine() noexcept;

			/**
			 * @brief Read every remaining byte into an existing buffer.
			 * @param outBuffer Vector the bytes are appended to.
			 * @return ExpectedVoid<ReadError> indicating success or failure. On failure
			 *         `outBuffer` keeps the bytes read before the fault.
			 */
			ExpectedVoid<ReadError>											ReadUntilEoF(DataType& outBuffer) noexcept;
	};
}
