#pragma once

#include <Bufio/reader.hxx>
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
	* @class BufferedStream
	* @brief Wraps a @ref Duplex object and buffers input from it and output to it.
	*
	* @par Overview
	*  Input and output are buffered independently, each with its own capacity.
	*  The stream is built from the existing decorators: a @ref BufferedReader
	*  whose source is an internal adapter holding a @ref BufferedWriter, which
	*  in turn owns the duplex object.
	*
	*  - `Read()`, `Fill()`, `Consume()` and `EoF()` go through the reader.
	*  - `Write()` and `Flush()` go through the writer held by the adapter.
	*  - The adapter forwards reads and end-of-stream checks straight to the
	*    duplex object; buffered output is never read back.
	*
	*  A `BufferedStream` is itself a @ref Duplex, so it can be wrapped by
	*  another `BufferedStream` or handed to anything expecting a duplex object.
	*
	* @warning `BufferedStream` does **NOT** flush its output buffer when destroyed.
	*          Call `Flush()` or `Release()` before dropping it.
	*
	* @par Thread safety
	*  This class is **not thread-safe**.
	*
	* @code{.cpp}
	* Bufio::BufferedStream stream(std::make_unique<Socket>(fd));
	* (void)stream.Write("hello, world");
	* (void)stream.Flush();
	* auto line = stream.ReadLine();
	* @endcode
	*/
	class BUFIO_PUBLIC BufferedStream: public BufferedSource, public Duplex {
		public:
			/**
			 * @brief Construct a BufferedStream.
			 * @param duplex Object to wrap; the stream takes ownership. Must not be null.
			 * @param reader_capacity Input buffer capacity in bytes.
			 * @param writer_capacity Output buffer capacity in bytes.
			 * @param log Optional logger shared by the input and output buffers.
			 */
			BufferedStream(std::unique_ptr<Duplex> duplex, const std::size_t& reader_capacity = DefaultCapacity, const std::size_t& writer_capacity = DefaultCapacity, LogPointer log = nullptr);

			BufferedStream(const BufferedStream& other) 					= delete;
			BufferedStream(BufferedStream&& other) noexcept					= delete;

			/**
			 * @brief Destructor.
			 * @warning Does not flush: pending output is lost.
			 */
			virtual ~BufferedStream() noexcept;

			BufferedStream& operator=(const BufferedStream& other) 			= delete;
			BufferedStream& operator=(BufferedStream&& other) noexcept		= delete;

			/**
			 * @brief Get the number of buffered input bytes not yet consumed.
			 */
			inline std::size_t 												AvailableBytes() const noexcept {
				return m_reader.AvailableBytes();
			}

			/**
			 * @copydoc BufferedSource::Consume
			 */
			inline ExpectedVoid<ReadError> 									Consume(const std::size_t& amount) noexcept override {
				return m_reader.Consume(amount);
			}

			/**
			 * @brief Check if the input side has reached end-of-stream.
			 */
			inline bool 													EoF() noexcept override {
				return m_reader.EoF();
			}

			/**
			 * @copydoc BufferedSource::Fill
			 */
			inline ExpectedView<ReadError> 									Fill() noexcept override {
				return m_reader.Fill();
			}

			/**
			 * @brief Write pending output to the duplex object and flush it.
			 * @return ExpectedVoid<WriteError> indicating success or failure.
			 */
			ExpectedVoid<WriteError> 										Flush() noexcept override;

			/**
			 * @brief Get the wrapped duplex object.
			 * @return The duplex object, or `nullptr` once it was released.
			 * @warning Using it directly bypasses both buffers.
			 */
			Duplex* 														Inner() noexcept;

			/**
			 * @brief Get the wrapped duplex object.
			 * @return The duplex object, or `nullptr` once it was released.
			 */
			const Duplex* 													Inner() const noexcept;

			/**
			 * @brief Get the number of output bytes buffered and not yet written.
			 */
			std::size_t 													PendingBytes() const noexcept;

			/**
			 * @brief Read buffered input into `destination`.
			 * @see BufferedReader::Read()
			 */
			inline ExpectedCount<ReadError> 								Read(std::span<std::byte> destination) noexcept override {
				return m_reader.Read(destination);
			}

			inline std::size_t 												ReaderCapacity() const noexcept {
				return m_reader.Capacity();
			}

			/**
			 * @brief Flush pending output and give back ownership of the duplex object.
			 * @return The duplex object, or the `WriteError` of the flush. Buffered
			 *         unread input is discarded on success.
			 */
			StormByte::Expected<std::unique_ptr<Duplex>, WriteError>		Release() noexcept;

			/**
			 * @brief Write bytes through the output buffer.
			 * @see BufferedWriter::Write()
			 */
			ExpectedVoid<WriteError> 										Write(std::span<const std::byte> data) noexcept override;

			using Sink::Write;

			std::size_t 													WriterCapacity() const noexcept;

		private:
			class WriterSource;												///< Presents the output writer as the reader's source.

			BufferedReader m_reader;										///< Input side, owns the adapter.
			WriterSource* m_adapter;										///< Adapter owned by `m_reader`.
	};
}
