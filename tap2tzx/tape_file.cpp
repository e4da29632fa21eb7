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

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

#include "tape_file.h"
#include "tap.h"

namespace tierone::tap2tzx {

std::vector<uint8_t> read_file(const std::string &filename) {
	std::ifstream input(filename, std::ios::binary);
	if (!input.is_open()) {
		throw FileException("Failed to open input file", filename);
	}

	std::vector<uint8_t> data((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
	if (input.bad()) {
		throw FileException("Failed to read input file", filename);
	}

	return data;
}

namespace {

// First of "<filename>.tmp", "<filename>.tmp.1", ... that names no existing file
std::string unused_temp_name(const std::string &filename) {
	std::string base = filename + ".tmp";
	std::string candidate = base;
	std::error_code ec;
	for (unsigned int i = 1; std::filesystem::exists(candidate, ec); ++i) {
		candidate = base + "." + std::to_string(i);
	}
	return candidate;
}

} // namespace

void write_file(const std::string &filename, const std::vector<uint8_t> &data) {
	std::string tempfilename = unused_temp_name(filename);
	std::ofstream output(tempfilename, std::ios::binary | std::ios::trunc);
	if (!output.is_open()) {
		throw FileException("Failed to open output file", tempfilename);
	}

	output.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
	output.flush();
	bool ok = output.good();
	output.close();
	if (!ok || output.fail()) {
		std::remove(tempfilename.c_str());
		throw FileException("Failed to write output file", tempfilename);
	}

	// Rename the temp file to the target
	std::error_code ec;
	std::filesystem::rename(tempfilename, filename, ec);
	if (ec) {
		std::remove(tempfilename.c_str());
		throw FileException("Failed to replace output file: " + ec.message(), filename);
	}
}

std::string default_output_path(const std::string &input_file) {
	return std::filesystem::path(input_file).replace_extension(TZX_EXTENSION).string();
}

size_t convert_tap_to_tzx(const std::string &input_file, const std::string &output_file, uint16_t pause_ms,
                          const BlockCallback &on_block) {
	// Never overwrite the TAP with its own conversion
	std::error_code ec;
	if (std::filesystem::exists(output_file, ec) && std::filesystem::equivalent(input_file, output_file, ec)) {
		throw FileException("Not overwriting input file", input_file);
	}

	std::vector<uint8_t> tap = read_file(input_file);
	std::vector<TapBlock> blocks = decode(tap);
	if (on_block) {
		for (size_t i = 0; i < blocks.size(); ++i) {
			on_block(i, blocks[i]);
		}
	}
	write_file(output_file, encode(blocks, pause_ms));

	return blocks.size();
}

} // namespace tierone::tap2tzx
