#pragma once

#include <Bufio/cursor.hxx>
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
	* @class BufferedWriter
	* @brief Wraps a @ref Sink and buffers output to it.
	*
	* @par Overview
	*  Writes are accumulated in a fixed-capacity buffer and handed to the wrapped
	*  sink in a single write when the buffer cannot take more, or when the
	*  caller flushes.
	*
	* @par Buffer behavior
	*  - A write that does not fit in the free space first flushes the buffered
	*    bytes to the sink (one sink write).
	*  - A write larger than the whole capacity is then passed straight to the
	*    sink, skipping the buffer.
	*  - Anything else is copied into the buffer.
	*  - `Flush()` with nothing pending issues no sink write.
	*
	* @warning `BufferedWriter` does **NOT** flush its buffer when destroyed.
	*          Pending bytes are silently dropped unless the caller invokes
	*          `Flush()` or `Release()` first. `Release()` is the only operation
	*          that flushes implicitly.
	*
	* @par Thread safety
	*  This class is **not thread-safe**. The writer exclusively owns the wrapped sink.
	*
	* @code{.cpp}
	* Bufio::BufferedWriter writer(std::make_unique<Socket>(fd));
	* (void)writer.Write("hello, world");
	* auto res = writer.Flush();
	* @endcode
	*/
	class BUFIO_PUBLIC BufferedWriter: public Sink {
		public:
			/**
			 * @brief Construct a BufferedWriter.
			 * @param sink Sink to wrap; the writer takes ownership. Must not be null.
			 * @param capacity Buffer capacity in bytes.
			 * @param log Optional logger for flush and fault records.
			 */
			BufferedWriter(std::unique_ptr<Sink> sink, const std::size_t& capacity = DefaultCapacity, LogPointer log = nullptr);

			BufferedWriter(const BufferedWriter& other) 					= delete;
			BufferedWriter(BufferedWriter&& other) noexcept					= delete;

			/**
			 * @brief Destructor.
			 * @warning Does not flush: pending bytes are lost.
			 */
			virtual ~BufferedWriter() noexcept 								= default;

			BufferedWriter& operator=(const BufferedWriter& other) 			= delete;
			BufferedWriter& operator=(BufferedWriter&& other) noexcept		= delete;

			/**
			 * @brief Get the buffer capacity.
			 */
			inline std::size_t 												Capacity() const noexcept {
				return m_cursor.Capacity();
			}

			/**
			 * @brief Write pending bytes to the sink and flush the sink itself.
			 * @return ExpectedVoid<WriteError> indicating success or failure.
			 * @details On a failed sink write the pending bytes stay buffered.
			 */
			ExpectedVoid<WriteError> 										Flush() noexcept override;

			/**
			 * @brief Get the wrapped sink.
			 * @return The sink, or `nullptr` once it was released.
			 * @warning Writing to it directly bypasses the buffered bytes.
			 */
			inline Sink* 													Inner() noexcept {
				return m_sink.get();
			}

			/**
			 * @brief Get the wrapped sink.
			 * @return The sink, or `nullptr` once it was released.
			 */
			inline const Sink* 												Inner() const noexcept {
				return m_sink.get();
			}

			/**
			 * @brief Get the number of bytes buffered and not yet written to the sink.
			 */
			inline std::size_t 												PendingBytes() const noexcept {
				return m_cursor.End();
			}

			/**
			 * @brief Flush pending bytes and give back ownership of the wrapped sink.
			 * @return The sink, or the `WriteError` of the flush. On failure the writer
			 *         keeps both the sink and the pending bytes.
			 * @details The sink's own `Flush()` is not invoked.
			 */
			StormByte::Expected<std::unique_ptr<Sink>, WriteError>			Release() noexcept;

			/**
			 * @brief Write bytes through the buffer.
			 * @param data Bytes to write.
			 * @return ExpectedVoid<WriteError> indicating success or failure.
			 */
			ExpectedVoid<WriteError> 										Write(std::span<const std::byte> data) noexcept override;

			using Sink::Write;

		private:
			std::unique_ptr<Sink> m_sink;									///< Wrapped sink.
			Cursor m_cursor;												///< Output buffer, `End()` is the write position.
			LogPointer m_log;												///< Optional logger.

			/**
			 * @brief Write the buffered bytes to the sink, without flushing the sink.
			 * @return ExpectedVoid<WriteError> indicating success or failure.
			 */
			ExpectedVoid<WriteError> 										FlushBuffer() noexcept;
	};
}
