#pragma once

#include <Bufio/typedefs.hxx>

/**
 * @namespace Bufio
 * @brief Namespace for the buffered byte-stream decorators.
 *
 * The Bufio namespace provides buffering wrappers for byte sources and sinks:
 * buffered readers, buffered and line buffered writers, and buffered duplex streams.
 */
namespace Bufio {
	/**
	* @class Cursor
	* @brief Fixed-capacity byte storage with a consume position and a valid-data watermark.
	*
	* @par Overview
	*  The storage is allocated once at construction and never reallocated. Two
	*  indexes describe it:
	*  - `Position()`: next byte to consume.
	*  - `End()`: watermark of meaningful bytes.
	*
	*  `Position() <= End() <= Capacity()` holds at all times: every operation
	*  that would break it is rejected and leaves the cursor untouched.
	*
	* @par Usage
	*  Readers refill the whole storage with @ref Storage() and @ref Reset(), then
	*  hand out @ref Available() and @ref Advance(). Writers append with
	*  @ref Append() and drain @ref Pending() followed by @ref Clear().
	*
	* @par Thread safety
	*  This class is **not thread-safe**.
	*/
	class BUFIO_PUBLIC Cursor {
		public:
			/**
			 * @brief Construct a Cursor with `capacity` bytes of storage.
			 * @param capacity Storage size in bytes.
			 */
			explicit Cursor(const std::size_t& capacity);

			Cursor(const Cursor& other) 									= default;
			Cursor(Cursor&& other) noexcept									= default;
			~Cursor() noexcept 												= default;
			Cursor& operator=(const Cursor& other) 							= default;
			Cursor& operator=(Cursor&& other) noexcept						= default;

			/**
			 * @brief Advance the consume position.
			 * @param amount Number of bytes consumed.
			 * @return false (and no change) if `Position() + amount > End()`.
			 */
			bool 															Advance(const std::size_t& amount) noexcept;

			/**
			 * @brief Copy `data` into the free region and move the watermark past it.
			 * @param data Bytes to append.
			 * @return false (and no change) if `data` does not fit in @ref FreeBytes().
			 */
			bool 															Append(std::span<const std::byte> data) noexcept;

			/**
			 * @brief Bytes between the consume position and the watermark.
			 */
			inline std::size_t 												AvailableBytes() const noexcept {
				return m_end - m_position;
			}

			/**
			 * @brief View of the unread bytes `[Position(), End())`.
			 */
			inline std::span<const std::byte> 								Available() const noexcept {
				return std::span<const std::byte>(m_storage.data() + m_position, m_end - m_position);
			}

			inline std::size_t 												Capacity() const noexcept {
				return m_storage.size();
			}

			/**
			 * @brief Reset both indexes to zero.
			 */
			inline void 													Clear() noexcept {
				m_position = 0;
				m_end = 0;
			}

			/**
			 * @brief Move the watermark after bytes were written into @ref Free().
			 * @param amount Number of bytes written.
			 * @return false (and no change) if `End() + amount > Capacity()`.
			 */
			bool 															Commit(const std::size_t& amount) noexcept;

			inline std::size_t 												End() const noexcept {
				return m_end;
			}

			/**
			 * @brief Check whether every valid byte has been consumed.
			 */
			inline bool 													Exhausted() const noexcept {
				return m_position == m_end;
			}

			/**
			 * @brief Writable view of the unused region `[End(), Capacity())`.
			 */
			inline std::span<std::byte> 									Free() noexcept {
				return std::span<std::byte>(m_storage.data() + m_end, m_storage.size() - m_end);
			}

			inline std::size_t 												FreeBytes() const noexcept {
				return m_storage.size() - m_end;
			}

			/**
			 * @brief View of all valid bytes `[0, End())`, consumed or not.
			 */
			inline std::span<const std::byte> 								Pending() const noexcept {
				return std::span<const std::byte>(m_storage.data(), m_end);
			}

			inline std::size_t 												Position() const noexcept {
				return m_position;
			}

			/**
			 * @brief Start over with `end` valid bytes at the front of the storage.
			 * @param end New watermark.
			 * @return false (and no change) if `end > Capacity()`.
			 */
			bool 															Reset(const std::size_t& end) noexcept;

			/**
			 * @brief Writable view of the whole storage, used to refill it.
			 * @note Follow with @ref Reset() to publish the bytes written.
			 */
			inline std::span<std::byte> 									Storage() noexcept {
				return std::span<std::byte>(m_storage.data(), m_storage.size());
			}

		private:
			DataType m_storage;												///< Fixed-size storage.
			std::size_t m_position {0};										///< Next byte to consume.
			std::size_t m_end {0};											///< Valid data watermark.
	};
}
