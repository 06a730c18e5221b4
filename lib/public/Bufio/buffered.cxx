#include <Bufio/buffered.hxx>

#include <algorithm>
#include <iterator>

using namespace Bufio;

ExpectedRecord<ReadError> BufferedSource::ReadUntil(const std::byte& delimiter) noexcept {
	DataType record;
	bool found = false;

	while (!found) {
		auto filled = Fill();
		if (!filled)
			return std::unexpected(filled.error());

		const std::span<const std::byte> available = *filled;
		if (available.empty())
			break; // End of stream

		const auto it = std::find(available.begin(), available.end(), delimiter);
		found = it != available.end();
		const std::size_t used = found ? static_cast<std::size_t>(it - available.begin()) + 1 : available.size();

		record.insert(record.end(), available.begin(), available.begin() + used);
		auto consumed = Consume(used);
		if (!consumed)
			return std::unexpected(consumed.error());
	}

	if (record.empty())
		return std::nullopt;

	return std::move(record);
}

ExpectedLine<ReadError> BufferedSource::ReadLine() noexcept {
	auto record = ReadUntil(std::byte{'\n'});
	if (!record)
		return std::unexpected(record.error());

	if (!record->has_value())
		return std::nullopt;

	const DataType& line = record->value();
	std::string text;
	text.reserve(line.size());
	std::transform(line.begin(), line.end(), std::back_inserter(text), [] (std::byte b) noexcept { return static_cast<char>(b); });
	return std::move(text);
}

ExpectedVoid<ReadError> BufferedSource::ReadUntilEoF(DataType& outBuffer) noexcept {
	while (true) {
		auto filled = Fill();
		if (!filled)
			return std::unexpected(filled.error());

		const std::span<const std::byte> available = *filled;
		if (available.empty())
			return {};

		outBuffer.insert(outBuffer.end(), available.begin(), available.end());
		auto consumed = Consume(available.size());
		if (!consumed)
			return std::unexpected(consumed.error());
	}
}
