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

#include "tzx.h"

namespace tierone::tap2tzx {

namespace {

void put_le16(std::vector<uint8_t> &out, size_t value) {
	out.push_back(static_cast<uint8_t>(value & 0xFF));
	out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
}

} // namespace

void StandardSpeedDataBlock::writeTo(std::vector<uint8_t> &out) const {
	if (data.size() > MAX_DATA_SIZE) {
		throw PayloadTooLargeException(data.size(), MAX_DATA_SIZE);
	}

	out.reserve(out.size() + 1 + FIELDS_SIZE + data.size());
	out.push_back(getId());
	put_le16(out, pause);
	put_le16(out, data.size());
	out.insert(out.end(), data.begin(), data.end());
}

void write_header(std::vector<uint8_t> &out) {
	out.insert(out.end(), TZX_SIGNATURE.begin(), TZX_SIGNATURE.end());
	out.push_back(TZX_VERSION_MAJOR);
	out.push_back(TZX_VERSION_MINOR);
}

std::vector<uint8_t> encode(const std::vector<TapBlock> &blocks, uint16_t pause_ms) {
	// Pre-allocate the whole image: header, then ID + pause + length + data per block
	size_t total = TZX_HEADER_SIZE;
	for (const auto &block : blocks) {
		total += 1 + StandardSpeedDataBlock::FIELDS_SIZE + block.size();
	}

	std::vector<uint8_t> out;
	out.reserve(total);
	write_header(out);

	for (size_t i = 0; i < blocks.size(); ++i) {
		try {
			StandardSpeedDataBlock(pause_ms, blocks[i]).writeTo(out);
		} catch (const PayloadTooLargeException &e) {
			throw PayloadTooLargeException(e.getSize(), e.getMaxSize(), i);
		}
	}

	return out;
}

std::vector<uint8_t> tap_to_tzx(const std::vector<uint8_t> &tap, uint16_t pause_ms) {
	return encode(decode(tap), pause_ms);
}

} // namespace tierone::tap2tzx
