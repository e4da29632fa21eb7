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

#include <iomanip>
#include <iostream>
#include <string>

#include <argparse/argparse.hpp>

#include "tap2tzx/tap.h"
#include "tap2tzx/tzx.h"
#include "tap2tzx/tape_file.h"

// One progress line per block, e.g. "  Block 1: header, 19 bytes"
static void print_block(size_t index, const tierone::tap2tzx::TapBlock &block) {
	std::cout << "  Block " << (index + 1) << ": ";
	if (block.empty()) {
		std::cout << "empty";
	} else if (block.isHeader()) {
		std::cout << "header, " << block.size() << " bytes";
	} else if (block.flag() == tierone::tap2tzx::TapBlock::FLAG_DATA) {
		std::cout << "data, " << block.size() << " bytes";
	} else {
		std::cout << "flag 0x" << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
		          << static_cast<unsigned int>(block.flag()) << std::dec << std::setfill(' ')
		          << ", " << block.size() << " bytes";
	}
	std::cout << std::endl;
}

int main(int argc, char *argv[]) {

	// Define arguments
	argparse::ArgumentParser program("tap2tzx");
	program.add_argument("-i", "--input")
		.help("Input file in TAP format");
	program.add_argument("-o", "--output")
		.help("Output file in TZX format (default: input with a .tzx extension)");
	program.add_argument("-p", "--pause")
		.help("Pause after each block in milliseconds")
		.default_value(static_cast<int>(tierone::tap2tzx::DEFAULT_PAUSE_MS))
		.nargs(1)
		.scan<'i', int>();

	// Parse arguments
	try {
		program.parse_args(argc, argv);
	} catch (const std::exception &err) {
		std::cerr << "Parsing command line arguments failed" << std::endl;
		std::cerr << err.what() << std::endl;
		std::cerr << program;
		return 1;
	}

	// Check if input file is specified
	if (!program.present("-i")) {
		std::cerr << "Input file is not specified" << std::endl;
		std::cerr << program;
		return 1;
	}

	std::string input_file = program.get<std::string>("-i");
	std::string output_file;
	if (auto output = program.present("-o")) {
		output_file = *output;
	} else {
		output_file = tierone::tap2tzx::default_output_path(input_file);
	}

	int pause = program.get<int>("--pause");
	if (pause < 0 || pause > 0xFFFF) {
		std::cerr << "Pause must be between 0 and 65535 milliseconds" << std::endl;
		return 1;
	}

	std::cout << "Converting TAP \"" << input_file << "\" to TZX at \"" << output_file << "\"" << std::endl;

	try {
		size_t block_count = tierone::tap2tzx::convert_tap_to_tzx(input_file, output_file, static_cast<uint16_t>(pause),
		                                                                    print_block);
		std::cout << "Successfully converted " << block_count << " blocks!" << std::endl;
	} catch (const tierone::tap2tzx::FormatException &err) {
		std::cerr << "Error converting TAP file: " << err.what() << std::endl;
		return 1;
	} catch (const tierone::tap2tzx::FileException &err) {
		std::cerr << "Error converting TAP file: " << err.what() << std::endl;
		return 1;
	} catch (const std::exception &err) {
		std::cerr << "Error converting TAP file: " << err.what() << std::endl;
		return 1;
	}

	return 0;
}
