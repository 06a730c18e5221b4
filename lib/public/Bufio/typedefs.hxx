#pragma once

#include <Bufio/exception.hxx>
#include <StormByte/logger/log.hxx>
#include <StormByte/expected.hxx>

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

/**
 * @namespace Bufio
 * @brief Namespace for the buffered byte-stream decorators.
 *
 * The Bufio namespace provides buffering wrappers for byte sources and sinks:
 * buffered readers, buffered and line buffered writers, and buffered duplex streams.
 */
namespace Bufio {
	using DataType = std::vector<std::byte>;

	/**
	 * @brief Default buffer capacity for readers, writers and streams (64 KiB).
	 * @details Large enough to keep the number of system calls low for
	 *          socket and file backed sources and sinks.
	 */
	inline constexpr std::size_t DefaultCapacity = 64 * 1024;

	/**
	 * @brief Default buffer capacity for line buffered writers (1 KiB).
	 * @details Lines are usually short and latency sensitive.
	 */
	inline constexpr std::size_t LineCapacity = 1024;

	template<class Exception>
	using ExpectedVoid = StormByte::Expected<void, Exception>;

	/**
	 * @brief Result of a read: a byte count, or `std::nullopt` when no bytes
	 *        were produced (end-of-stream).
	 */
	template<class Exception>
	using ExpectedCount = StormByte::Expected<std::optional<std::size_t>, Exception>;

	/**
	 * @brief Result of a fill: a view of the buffered, unread bytes.
	 * @warning The view is invalidated by the next operation on the owner.
	 */
	template<class Exception>
	using ExpectedView = StormByte::Expected<std::span<const std::byte>, Exception>;

	/**
	 * @brief Result of a record read: the record bytes, or `std::nullopt`
	 *        at end-of-stream.
	 */
	template<class Exception>
	using ExpectedRecord = StormByte::Expected<std::optional<DataType>, Exception>;

	/**
	 * @brief Result of a line read: the line text, or `std::nullopt`
	 *        at end-of-stream.
	 */
	template<class Exception>
	using ExpectedLine = StormByte::Expected<std::optional<std::string>, Exception>;

	/**
	 * @brief Shared logger handle accepted by every decorator.
	 * @details A null pointer disables logging.
	 */
	using LogPointer = std::shared_ptr<StormByte::Logger::Log>;
}
