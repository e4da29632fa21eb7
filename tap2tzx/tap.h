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

#include <vector>
#include <cinttypes>
#include <cstddef>
#include <limits>
#include <utility>

#include "tape_exceptions.h"

namespace tierone::tap2tzx {

/**
 * @brief One data block of a TAP cassette image
 *
 * A TAP image is a plain sequence of blocks, each stored as a 2-byte
 * little-endian length followed by that many bytes. The payload keeps the
 * flag byte and the trailing XOR checksum exactly as they were read; the
 * converter never reinterprets them.
 */
class TapBlock {
public:
	static constexpr size_t LENGTH_SIZE = 2; //in bytes
	static constexpr size_t MAX_PAYLOAD_SIZE = std::numeric_limits<uint16_t>::max();

	/// Flag byte of a standard ROM header block
	static constexpr uint8_t FLAG_HEADER = 0x00;
	/// Flag byte of a standard ROM data block
	static constexpr uint8_t FLAG_DATA = 0xFF;
	/// Size of a standard ROM header block: flag + 17 header bytes + checksum
	static constexpr size_t HEADER_BLOCK_SIZE = 19;

	TapBlock() = default;

	/**
	 * @brief Construct a block from its raw payload
	 * @param data Payload bytes including flag and checksum bytes
	 */
	explicit TapBlock(std::vector<uint8_t> data) : payload(std::move(data)) {}

	/**
	 * @brief Construct a block by copying a range of bytes
	 * @param data Pointer to the first payload byte
	 * @param length Number of bytes to copy
	 */
	TapBlock(const uint8_t *data, size_t length) : payload(data, data + length) {}

	const std::vector<uint8_t> &getPayload() const {
		return payload;
	}

	size_t size() const {
		return payload.size();
	}

	bool empty() const {
		return payload.empty();
	}

	/**
	 * @brief Get the flag byte of the block
	 * @return First payload byte, or 0 for an empty block
	 */
	uint8_t flag() const {
		return payload.empty() ? 0 : payload.front();
	}

	/**
	 * @brief Check whether this looks like a standard ROM header block
	 * @return true if the flag byte is 0x00 and the block is 19 bytes long
	 */
	bool isHeader() const {
		return payload.size() == HEADER_BLOCK_SIZE && payload.front() == FLAG_HEADER;
	}

	bool operator==(const TapBlock &other) const {
		return payload == other.payload;
	}

	bool operator!=(const TapBlock &other) const {
		return !(*this == other);
	}

private:
	std::vector<uint8_t> payload;
};

/**
 * @brief Decode a TAP image into its blocks
 *
 * Walks the buffer from offset 0, reading a 2-byte little-endian length and
 * then that many payload bytes, until the end of the buffer is reached
 * exactly. Zero-length blocks are accepted and yield an empty TapBlock.
 *
 * @param input Complete TAP image
 * @return Blocks in tape order
 * @throws TruncatedLengthException if a single byte is left where a length was expected
 * @throws TruncatedBlockException if a block runs past the end of the input
 */
std::vector<TapBlock> decode(const std::vector<uint8_t> &input);

/**
 * @brief Decode a TAP image held in a raw buffer
 * @param data Pointer to the TAP image
 * @param length Size of the TAP image in bytes
 * @return Blocks in tape order
 * @throws TruncatedLengthException if a single byte is left where a length was expected
 * @throws TruncatedBlockException if a block runs past the end of the input
 */
std::vector<TapBlock> decode(const uint8_t *data, size_t length);

} // namespace tierone::tap2tzx
