#include <Bufio/cursor.hxx>

#include <algorithm>

using namespace Bufio;

Cursor::Cursor(const std::size_t& capacity): m_storage(capacity), m_position(0), m_end(0) {}

bool Cursor::Advance(const std::size_t& amount) noexcept {
	if (amount > AvailableBytes())
		return false;

	m_position += amount;
	return true;
}

bool Cursor::Append(std::span<const std::byte> data) noexcept {
	if (data.size() > FreeBytes())
		return false;

	std::copy(data.begin(), data.end(), Free().begin());
	return Commit(data.size());
}

bool Cursor::Commit(const std::size_t& amount) noexcept {
	if (amount > FreeBytes())
		return false;

	m_end += amount;
	return true;
}

bool Cursor::Reset(const std::size_t& end) noexcept {
	if (end > m_storage.size())
		return false;

	m_position = 0;
	m_end = end;
	return true;
}
