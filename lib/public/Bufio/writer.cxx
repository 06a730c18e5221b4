#include <Bufio/writer.hxx>

using namespace Bufio;
using StormByte::Logger::Level;

BufferedWriter::BufferedWriter(std::unique_ptr<Sink> sink, const std::size_t& capacity, LogPointer log):
m_sink(std::move(sink)), m_cursor(capacity), m_log(std::move(log)) {}

ExpectedVoid<WriteError> BufferedWriter::Flush() noexcept {
	if (!m_sink)
		return StormByte::Unexpected(WriteError("Sink has been released"));

	auto flushed = FlushBuffer();
	if (!flushed)
		return std::unexpected(flushed.error());

	return m_sink->Flush();
}

StormByte::Expected<std::unique_ptr<Sink>, WriteError> BufferedWriter::Release() noexcept {
	auto flushed = FlushBuffer();
	if (!flushed)
		return std::unexpected(flushed.error());

	return std::move(m_sink);
}

ExpectedVoid<WriteError> BufferedWriter::Write(std::span<const std::byte> data) noexcept {
	if (!m_sink)
		return StormByte::Unexpected(WriteError("Sink has been released"));

	if (data.size() > m_cursor.FreeBytes()) {
		auto flushed = FlushBuffer();
		if (!flushed)
			return std::unexpected(flushed.error());
	}

	// Too big to ever be buffered: skip the copy
	if (data.size() > m_cursor.Capacity()) {
		if (m_log)
			*m_log << Level::Debug << "BufferedWriter: passing " << data.size() << " bytes through" << std::endl;

		auto written = m_sink->Write(data);
		if (!written && m_log)
			*m_log << Level::Error << "BufferedWriter: sink write failed: " << written.error()->what() << std::endl;
		return written;
	}

	(void)m_cursor.Append(data);
	return {};
}

ExpectedVoid<WriteError> BufferedWriter::FlushBuffer() noexcept {
	if (m_cursor.End() == 0)
		return {};

	if (!m_sink)
		return StormByte::Unexpected(WriteError("Sink has been released"));

	auto written = m_sink->Write(m_cursor.Pending());
	if (!written) {
		if (m_log)
			*m_log << Level::Error << "BufferedWriter: sink write failed: " << written.error()->what() << std::endl;
		return written;
	}

	if (m_log)
		*m_log << Level::Debug << "BufferedWriter: flushed " << m_cursor.End() << " bytes" << std::endl;

	m_cursor.Clear();
	return {};
}
