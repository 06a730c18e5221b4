#include <Bufio/reader.hxx>

#include <algorithm>

using namespace Bufio;
using StormByte::Logger::Level;

BufferedReader::BufferedReader(std::unique_ptr<Source> source, const std::size_t& capacity, LogPointer log):
m_source(std::move(source)), m_cursor(capacity), m_log(std::move(log)) {}

ExpectedVoid<ReadError> BufferedReader::Consume(const std::size_t& amount) noexcept {
	if (!m_cursor.Advance(amount))
		return StormByte::Unexpected(ReadError("Cannot consume {} bytes, only {} available", amount, m_cursor.AvailableBytes()));

	return {};
}

bool BufferedReader::EoF() noexcept {
	return m_cursor.Exhausted() && (!m_source || m_source->EoF());
}

ExpectedView<ReadError> BufferedReader::Fill() noexcept {
	// Only refill once everything buffered was consumed
	if (m_cursor.Exhausted()) {
		if (!m_source)
			return StormByte::Unexpected(ReadError("Source has been released"));

		auto nread = m_source->Read(m_cursor.Storage());
		if (!nread) {
			if (m_log)
				*m_log << Level::Error << "BufferedReader: source read failed: " << nread.error()->what() << std::endl;
			return std::unexpected(nread.error());
		}

		// No bytes leaves the (exhausted) cursor untouched
		if (nread->has_value()) {
			const std::size_t count = nread->value();
			if (!m_cursor.Reset(count))
				return StormByte::Unexpected(ReadError("Source reported {} bytes for a {} bytes buffer", count, m_cursor.Capacity()));

			if (m_log)
				*m_log << Level::Debug << "BufferedReader: refilled " << count << " bytes" << std::endl;
		}
	}

	return m_cursor.Available();
}

ExpectedCount<ReadError> BufferedReader::Read(std::span<std::byte> destination) noexcept {
	auto filled = Fill();
	if (!filled)
		return std::unexpected(filled.error());

	const std::span<const std::byte> available = *filled;
	if (available.empty())
		return std::nullopt;

	const std::size_t count = std::min(available.size(), destination.size());
	std::copy_n(available.begin(), count, destination.begin());
	(void)m_cursor.Advance(count);
	return count;
}

std::unique_ptr<Source> BufferedReader::Release() noexcept {
	m_cursor.Clear();
	return std::move(m_source);
}
