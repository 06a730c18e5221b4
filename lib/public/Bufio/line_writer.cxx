#include <Bufio/line_writer.hxx>

#include <algorithm>

using namespace Bufio;

LineBufferedWriter::LineBufferedWriter(std::unique_ptr<Sink> sink, const std::size_t& capacity, LogPointer log):
m_writer(std::move(sink), capacity, std::move(log)) {}

ExpectedVoid<WriteError> LineBufferedWriter::Write(std::span<const std::byte> data) noexcept {
	const auto last_newline = std::find(data.rbegin(), data.rend(), std::byte{'\n'});
	if (last_newline == data.rend())
		return m_writer.Write(data);

	// Everything up to and including the last newline goes out now
	const std::size_t line_end = data.size() - static_cast<std::size_t>(last_newline - data.rbegin());

	auto written = m_writer.Write(data.first(line_end));
	if (!written)
		return written;

	auto flushed = m_writer.Flush();
	if (!flushed)
		return flushed;

	return m_writer.Write(data.subspan(line_end));
}
