#include <Bufio/stream.hxx>

using namespace Bufio;

/**
 * @brief Source adapter over the output writer of a BufferedStream.
 * @details Owns the BufferedWriter (which owns the duplex object) and forwards
 *          reads straight to the duplex object, bypassing the output buffer.
 */
class BufferedStream::WriterSource final: public Source {
	public:
		WriterSource(std::unique_ptr<Duplex> duplex, const std::size_t& capacity, LogPointer log):
		m_duplex(duplex.get()), m_writer(std::move(duplex), capacity, std::move(log)) {}

		bool EoF() noexcept override {
			return !m_duplex || m_duplex->EoF();
		}

		ExpectedCount<ReadError> Read(std::span<std::byte> destination) noexcept override {
			if (!m_duplex)
				return StormByte::Unexpected(ReadError("Stream has been released"));

			return m_duplex->Read(destination);
		}

		inline Duplex* Inner() noexcept {
			return m_duplex;
		}

		inline const Duplex* Inner() const noexcept {
			return m_duplex;
		}

		StormByte::Expected<std::unique_ptr<Duplex>, WriteError> Release() noexcept {
			auto sink = m_writer.Release();
			if (!sink)
				return std::unexpected(sink.error());

			// The writer handed back the same object as a Sink; retake it as a Duplex
			(void)sink->release();
			std::unique_ptr<Duplex> duplex(m_duplex);
			m_duplex = nullptr;
			return duplex;
		}

		inline BufferedWriter& Writer() noexcept {
			return m_writer;
		}

		inline const BufferedWriter& Writer() const noexcept {
			return m_writer;
		}

	private:
		Duplex* m_duplex;				///< Owned through m_writer.
		BufferedWriter m_writer;
};

BufferedStream::BufferedStream(std::unique_ptr<Duplex> duplex, const std::size_t& reader_capacity, const std::size_t& writer_capacity, LogPointer log):
m_reader(std::make_unique<WriterSource>(std::move(duplex), writer_capacity, log), reader_capacity, log),
m_adapter(static_cast<WriterSource*>(m_reader.Inner())) {}

BufferedStream::~BufferedStream() noexcept = default;

ExpectedVoid<WriteError> BufferedStream::Flush() noexcept {
	return m_adapter->Writer().Flush();
}

Duplex* BufferedStream::Inner() noexcept {
	return m_adapter->Inner();
}

const Duplex* BufferedStream::Inner() const noexcept {
	return m_adapter->Inner();
}

std::size_t BufferedStream::PendingBytes() const noexcept {
	return m_adapter->Writer().PendingBytes();
}

StormByte::Expected<std::unique_ptr<Duplex>, WriteError> BufferedStream::Release() noexcept {
	auto duplex = m_adapter->Release();
	if (!duplex)
		return std::unexpected(duplex.error());

	// Discard unread input
	(void)m_reader.Consume(m_reader.AvailableBytes());
	return std::move(*duplex);
}

ExpectedVoid<WriteError> BufferedStream::Write(std::span<const std::byte> data) noexcept {
	return m_adapter->Writer().Write(data);
}

std::size_t BufferedStream::WriterCapacity() const noexcept {
	return m_adapter->Writer().Capacity();
}
