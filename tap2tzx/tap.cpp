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

#include "tap.h"

namespace tierone::tap2tzx {

std::vector<TapBlock> decode(const std::vector<uint8_t> &input) {
	return decode(input.data(), input.size());
}

std::vector<TapBlock> decode(const uint8_t *data, size_t length) {
	std::vector<TapBlock> blocks;
	size_t pos = 0;

	while (pos < length) {
		size_t remaining = length - pos;
		if (remaining < TapBlock::LENGTH_SIZE) {
			throw TruncatedLengthException(pos, remaining);
		}

		// little endian block length
		size_t block_len = static_cast<size_t>(data[pos]) | (static_cast<size_t>(data[pos + 1]) << 8);
		remaining -= TapBlock::LENGTH_SIZE;
		if (block_len > remaining) {
			throw TruncatedBlockException(pos, block_len, remaining);
		}

		blocks.emplace_back(data + pos + TapBlock::LENGTH_SIZE, block_len);
		pos += TapBlock::LENGTH_SIZE + block_len;
	}

	return blocks;
}

} // namespace tierone::tap2tzx
