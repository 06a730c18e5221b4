#pragma once

#include <Bufio/writer.hxx>

/**
 * @namespace Bufio
 * @brief Namespace for the buffered byte-stream decorators.
 *
 * The Bufio namespace provides buffering wrappers for byte sources and sinks:
 * buffered readers, buffered and line buffered writers, and buffered duplex streams.
 */
namespace Bufio {
	/**
	* @class LineBufferedWriter
	* @brief Wraps a @ref Sink and buffers output to it, flushing whenever a newline is written.
	*
	* @par Overview
	*  Every write containing a `'\n'` byte reaches the sink, and is flushed,
	*  up to and including its last newline. Bytes after the last newline stay
	*  buffered until a later newline or an explicit `Flush()`.
	*
	*  Internally a @ref BufferedWriter with a small buffer (@ref LineCapacity by
	*  default) does the buffering.
	*
	* @warning Like @ref BufferedWriter, this class does **NOT** flush when destroyed.
	*
	* @par Thread safety
	*  This class is **not thread-safe**.
	*/
	class BUFIO_PUBLIC LineBufferedWriter: public Sink {
		public:
			/**
			 * @brief Construct a LineBufferedWriter.
			 * @param sink Sink to wrap; the writer takes ownership. Must not be null.
			 * @param capacity Buffer capacity in bytes.
			 * @param log Optional logger forwarded to the inner @ref BufferedWriter.
			 */
			LineBufferedWriter(std::unique_ptr<Sink> sink, const std::size_t& capacity = LineCapacity, LogPointer log = nullptr);

			LineBufferedWriter(const LineBufferedWriter& other) 			= delete;
			LineBufferedWriter(LineBufferedWriter&& other) noexcept			= delete;
			virtual ~LineBufferedWriter() noexcept 							= default;
			LineBufferedWriter& operator=(const LineBufferedWriter& other) 	= delete;
			LineBufferedWriter& operator=(LineBufferedWriter&& other) noexcept	= delete;

			inline std::size_t 												Capacity() const noexcept {
				return m_writer.Capacity();
			}

			/**
			 * @brief Write pending bytes to the sink and flush the sink itself.
			 * @return ExpectedVoid<WriteError> indicating success or failure.
			 */
			inline ExpectedVoid<WriteError> 								Flush() noexcept override {
				return m_writer.Flush();
			}

			/**
			 * @brief Get the wrapped sink, `nullptr` once it was released.
			 */
			inline Sink* 													Inner() noexcept {
				return m_writer.Inner();
			}

			inline const Sink* 												Inner() const noexcept {
				return m_writer.Inner();
			}

			inline std::size_t 												PendingBytes() const noexcept {
				return m_writer.PendingBytes();
			}

			/**
			 * @brief Flush pending bytes and give back ownership of the wrapped sink.
			 * @see BufferedWriter::Release()
			 */
			inline StormByte::Expected<std::unique_ptr<Sink>, WriteError>	Release() noexcept {
				return m_writer.Release();
			}

			/**
			 * @brief Write bytes, flushing through the last newline they contain.
			 * @param data Bytes to write.
			 * @return ExpectedVoid<WriteError> indicating success or failure.
			 */
			ExpectedVoid<WriteError> 										Write(std::span<const std::byte> data) noexcept override;

			using Sink::Write;

		private:
			BufferedWriter m_writer;										///< Inner buffered writer.
	};
}
