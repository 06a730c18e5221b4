#pragma once

#include <Bufio/buffered.hxx>
#include <Bufio/cursor.hxx>

/**
 * @namespace Bufio
 * @brief Namespace for the buffered byte-stream decorators.
 *
 * The Bufio namespace provides buffering wrappers for byte sources and sinks:
 * buffered readers, buffered and line buffered writers, and buffered duplex streams.
 */
namespace Bufio {
	/**
	* @class BufferedReader
	* @brief Wraps a @ref Source and buffers input from it.
	*
	* @par Overview
	*  Working directly with a source can be very inefficient when every read is
	*  a system call. `BufferedReader` reads from the wrapped source in blocks of
	*  `Capacity()` bytes and serves smaller reads from its buffer.
	*
	* @par Buffer behavior
	*  - The buffer is allocated once at construction and never grows or shrinks.
	*  - It is refilled lazily: only when every buffered byte was consumed, and
	*    with exactly one read from the source.
	*  - `Read()` is a short read: it never refills more than once per call, so
	*    it may return fewer bytes than requested even before end-of-stream.
	*
	* @par End of stream
	*  `EoF()` is true only when the buffer is drained **and** the wrapped source
	*  reports end-of-stream. A non-empty buffer never reports end-of-stream.
	*
	* @par Thread safety
	*  This class is **not thread-safe**. The reader exclusively owns the wrapped
	*  source; callers sharing a reader between threads must synchronize.
	*
	* @code{.cpp}
	* Bufio::BufferedReader reader(std::make_unique<Socket>(fd));
	* std::array<std::byte, 100> buffer;
	* auto nread = reader.Read(buffer);
	* if (nread && nread->has_value())
	* 	std::cout << "Read " << **nread << " bytes" << std::endl;
	* @endcode
	*/
	class BUFIO_PUBLIC BufferedReader: public BufferedSource {
		public:
			/**
			 * @brief Construct a BufferedReader.
			 * @param source Source to wrap; the reader takes ownership. Must not be null.
			 * @param capacity Buffer capacity in bytes.
			 * @param log Optional logger for refill and fault records.
			 */
			BufferedReader(std::unique_ptr<Source> source, const std::size_t& capacity = DefaultCapacity, LogPointer log = nullptr);

			BufferedReader(const BufferedReader& other) 					= delete;
			BufferedReader(BufferedReader&& other) noexcept					= delete;

			/**
			 * @brief Destructor.
			 * @details Buffered unread bytes are discarded; no action is taken on the source.
			 */
			virtual ~BufferedReader() noexcept 								= default;

			BufferedReader& operator=(const BufferedReader& other) 			= delete;
			BufferedReader& operator=(BufferedReader&& other) noexcept		= delete;

			/**
			 * @brief Get the number of buffered bytes not yet consumed.
			 * @return Bytes that can be served without reading from the source.
			 */
			inline std::size_t 												AvailableBytes() const noexcept {
				return m_cursor.AvailableBytes();
			}

			/**
			 * @brief Get the buffer capacity.
			 */
			inline std::size_t 												Capacity() const noexcept {
				return m_cursor.Capacity();
			}

			/**
			 * @copydoc BufferedSource::Consume
			 */
			ExpectedVoid<ReadError> 										Consume(const std::size_t& amount) noexcept override;

			/**
			 * @brief Check if the reader has reached end-of-stream.
			 * @return true when the buffer is drained and the wrapped source is at end-of-stream.
			 */
			bool 															EoF() noexcept override;

			/**
			 * @copydoc BufferedSource::Fill
			 */
			ExpectedView<ReadError> 										Fill() noexcept override;

			/**
			 * @brief Get the wrapped source.
			 * @return The source, or `nullptr` once it was released.
			 * @warning Reading from it directly bypasses the buffered bytes.
			 */
			inline Source* 													Inner() noexcept {
				return m_source.get();
			}

			/**
			 * @brief Get the wrapped source.
			 * @return The source, or `nullptr` once it was released.
			 */
			inline const Source* 											Inner() const noexcept {
				return m_source.get();
			}

			/**
			 * @brief Read buffered bytes into `destination`.
			 * @param destination Buffer to copy bytes into.
			 * @return Number of bytes copied (`min(available, destination.size())`),
			 *         `std::nullopt` at end-of-stream, or the source `ReadError`.
			 */
			ExpectedCount<ReadError> 										Read(std::span<std::byte> destination) noexcept override;

			/**
			 * @brief Give back ownership of the wrapped source.
			 * @return The source; buffered unread bytes are discarded.
			 * @details After this call every read reports a `ReadError` and `EoF()` is true.
			 */
			std::unique_ptr<Source> 										Release() noexcept;

		private:
			std::unique_ptr<Source> m_source;								///< Wrapped source.
			Cursor m_cursor;												///< Input buffer.
			LogPointer m_log;												///< Optional logger.
	};
}
