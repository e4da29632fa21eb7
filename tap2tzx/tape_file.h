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

#include <functional>
#include <string>
#include <vector>
#include <cinttypes>
#include <cstddef>

#include "tzx.h"
#include "tape_exceptions.h"

namespace tierone::tap2tzx {

/**
 * @brief Callback invoked once per decoded block, in tape order
 * @param index Zero-based position of the block on the tape
 * @param block The decoded block
 */
using BlockCallback = std::function<void(size_t index, const TapBlock &block)>;

/// Extension given to derived output files
constexpr const char *TZX_EXTENSION = ".tzx";

/**
 * @brief Read a whole file into memory
 * @param filename Path of the file to read
 * @return File contents
 * @throws FileException if the file cannot be opened or read
 */
std::vector<uint8_t> read_file(const std::string &filename);

/**
 * @brief Write a buffer to a file
 *
 * The data goes to a temporary file next to the target, "<filename>.tmp"
 * or, if that already exists, "<filename>.tmp.N". It is renamed over the
 * target only once everything has been written, and existing files other
 * than the target are never touched.
 *
 * @param filename Path of the file to create or replace
 * @param data Bytes to write
 * @throws FileException if the file cannot be written
 */
void write_file(const std::string &filename, const std::vector<uint8_t> &data);

/**
 * @brief Derive the TZX output path for a TAP input path
 * @param input_file Path of the TAP file
 * @return input_file with its extension replaced by ".tzx"
 * @example default_output_path("games/manic.tap") returns "games/manic.tzx"
 */
std::string default_output_path(const std::string &input_file);

/**
 * @brief Convert a TAP file to a TZX file
 * @param input_file Path to the TAP file
 * @param output_file Path to the TZX file to write
 * @param pause_ms Pause after each block in milliseconds
 * @param on_block Optional callback receiving each decoded block before anything is written
 * @return Number of TAP blocks converted, empty blocks included
 * @throws FileException if input and output are the same file or on I/O errors
 * @throws FormatException if the TAP image is malformed
 * @note Nothing is written unless the whole image converts
 */
size_t convert_tap_to_tzx(const std::string &input_file, const std::string &output_file,
                          uint16_t pause_ms = DEFAULT_PAUSE_MS,
                          const BlockCallback &on_block = nullptr);

} // namespace tierone::tap2tzx
