/*
 * Copyright 2025 TierOne Software
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <array>
#include <vector>
#include <cinttypes>
#include <cstddef>
#include <limits>

#include "tap.h"
#include "tape_exceptions.h"

namespace tierone::tap2tzx {

/// "ZXTape!" followed by the end-of-text marker 0x1A
constexpr std::array<uint8_t, 8> TZX_SIGNATURE = {'Z', 'X', 'T', 'a', 'p', 'e', '!', 0x1A};
/// TZX revision 1.20
constexpr uint8_t TZX_VERSION_MAJOR = 1;
constexpr uint8_t TZX_VERSION_MINOR = 20;
/// Signature plus version bytes
constexpr size_t TZX_HEADER_SIZE = TZX_SIGNATURE.size() + 2;
/// Silence after each block in milliseconds; TAP images carry no timing
constexpr uint16_t DEFAULT_PAUSE_MS = 1000;

/**
 * @brief Base class for TZX blocks
 *
 * Every TZX block starts with a one byte ID followed by block specific
 * data. Derived classes append both straight into the output buffer.
 */
class TzxBlock {
public:
	/**
	 * @brief TZX block ID enumeration
	 */
	enum class Type : uint8_t {
		STANDARD_SPEED_DATA = 0x10 ///< Standard speed data block, ROM loader timings
	};

	explicit TzxBlock(Type block_type) : type(block_type) {};
	virtual ~TzxBlock() = default;

	Type getType() const {
		return type;
	}

	uint8_t getId() const {
		return static_cast<uint8_t>(type);
	}

	/**
	 * @brief Append the complete block (ID and body) to a buffer
	 * @param out Buffer to append to
	 * @note This is a pure virtual function implemented by derived classes
	 */
	virtual void writeTo(std::vector<uint8_t> &out) const = 0;

	std::vector<uint8_t> toBytes() const {
		std::vector<uint8_t> out;
		writeTo(out);
		return out;
	}

private:
	Type type;
};

/**
 * @brief TZX block 0x10, standard speed data
 *
 * Layout after the ID byte:
 *
 *   +-+-+-+-+-----...
 *   | P.| L.| data
 *   +-+-+-+-+-----...
 *
 * P - pause after this block in milliseconds (little endian)
 * L - length of the data that follows (little endian)
 *
 * The data is a TAP block payload, flag and checksum included, so the
 * length field can only describe payloads of up to 65535 bytes. The block
 * only refers to the data; it must not outlive it.
 */
class StandardSpeedDataBlock final : public TzxBlock {
	uint16_t pause;
	const std::vector<uint8_t> &data;
public:
	static constexpr size_t MAX_DATA_SIZE = std::numeric_limits<uint16_t>::max();
	/// Pause and length fields
	static constexpr size_t FIELDS_SIZE = 4;

	/**
	 * @brief Construct a block over raw data
	 * @param pause_ms Pause after the block in milliseconds
	 * @param block_data Data bytes of the block
	 */
	StandardSpeedDataBlock(uint16_t pause_ms, const std::vector<uint8_t> &block_data)
		: TzxBlock(Type::STANDARD_SPEED_DATA), pause(pause_ms), data(block_data) {}
	StandardSpeedDataBlock(uint16_t pause_ms, std::vector<uint8_t> &&block_data) = delete;

	/**
	 * @brief Construct a block carrying a TAP block
	 * @param pause_ms Pause after the block in milliseconds
	 * @param block TAP block whose payload becomes the block data
	 */
	StandardSpeedDataBlock(uint16_t pause_ms, const TapBlock &block)
		: StandardSpeedDataBlock(pause_ms, block.getPayload()) {}
	StandardSpeedDataBlock(uint16_t pause_ms, TapBlock &&block) = delete;

	/**
	 * @brief Append ID, pause, length and data to a buffer
	 * @param out Buffer to append to
	 * @throws PayloadTooLargeException if the data exceeds 65535 bytes
	 */
	void writeTo(std::vector<uint8_t> &out) const override;
};

/**
 * @brief Append the TZX signature and version to a buffer
 * @param out Buffer to append to
 */
void write_header(std::vector<uint8_t> &out);

/**
 * @brief Encode TAP blocks as a TZX image
 *
 * Emits the TZX header followed by one standard speed data block per TAP
 * block, in the given order. Output depends only on the blocks and the
 * pause value.
 *
 * @param blocks Blocks in tape order
 * @param pause_ms Pause after each block in milliseconds
 * @return Complete TZX image
 * @throws PayloadTooLargeException if any block payload exceeds 65535 bytes
 */
std::vector<uint8_t> encode(const std::vector<TapBlock> &blocks, uint16_t pause_ms = DEFAULT_PAUSE_MS);

/**
 * @brief Convert a TAP image to a TZX image in memory
 * @param tap Complete TAP image
 * @param pause_ms Pause after each block in milliseconds
 * @return Complete TZX image
 * @throws FormatException if the TAP image cannot be decoded
 */
std::vector<uint8_t> tap_to_tzx(const std::vector<uint8_t> &tap, uint16_t pause_ms = DEFAULT_PAUSE_MS);

} // namespace tierone::tap2tzx
