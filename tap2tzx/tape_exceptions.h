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

#include <cstddef>
#include <exception>
#include <string>
#include <sstream>

namespace tierone::tap2tzx {

/**
 * Base exception class for all tape conversion errors
 */
class TapeException : public std::exception {
protected:
    mutable std::string message_;
    
public:
    explicit TapeException(const std::string& msg) : message_(msg) {}
    
    const char* what() const noexcept override {
        return message_.c_str();
    }
};

/**
 * Exception thrown when a tape image cannot be decoded or encoded
 */
class FormatException : public TapeException {
public:
    enum class FormatError {
        TRUNCATED_LENGTH,  ///< fewer than 2 bytes left where a length prefix was expected
        TRUNCATED_BLOCK,   ///< declared block length runs past the end of the input
        PAYLOAD_TOO_LARGE  ///< payload does not fit the 16-bit TZX length field
    };
    
private:
    FormatError error_type_;
    size_t offset_;
    
public:
    FormatException(const std::string& msg, FormatError error_type, size_t offset = 0)
        : TapeException(msg), error_type_(error_type), offset_(offset) {}
    
    FormatError getErrorType() const { return error_type_; }
    size_t getOffset() const { return offset_; }
};

/**
 * Exception thrown when a TAP length prefix is cut short
 */
class TruncatedLengthException : public FormatException {
private:
    size_t remaining_;

public:
    TruncatedLengthException(size_t offset, size_t remaining)
        : FormatException(
            createMessage(offset, remaining),
            FormatError::TRUNCATED_LENGTH,
            offset
          ),
          remaining_(remaining) {}

    size_t getRemaining() const { return remaining_; }

private:
    static std::string createMessage(size_t offset, size_t remaining) {
        std::ostringstream oss;
        oss << "Expected a 2-byte block length at offset " << offset
            << " but only " << remaining << " byte(s) remain";
        return oss.str();
    }
};

/**
 * Exception thrown when a TAP block is shorter than its length prefix says
 */
class TruncatedBlockException : public FormatException {
private:
    size_t declared_;
    size_t remaining_;

public:
    TruncatedBlockException(size_t offset, size_t declared, size_t remaining)
        : FormatException(
            createMessage(offset, declared, remaining),
            FormatError::TRUNCATED_BLOCK,
            offset
          ),
          declared_(declared),
          remaining_(remaining) {}

    size_t getDeclaredLength() const { return declared_; }
    size_t getRemaining() const { return remaining_; }

private:
    static std::string createMessage(size_t offset, size_t declared, size_t remaining) {
        std::ostringstream oss;
        oss << "Block at offset " << offset << " declares " << declared
            << " byte(s) but only " << remaining << " remain";
        return oss.str();
    }
};

/**
 * Exception thrown when a payload is too large for a TZX data block
 */
class PayloadTooLargeException : public FormatException {
private:
    size_t size_;
    size_t max_size_;
    size_t block_index_;

public:
    PayloadTooLargeException(size_t size, size_t max_size, size_t block_index = 0)
        : FormatException(
            createMessage(size, max_size, block_index),
            FormatError::PAYLOAD_TOO_LARGE
          ),
          size_(size),
          max_size_(max_size),
          block_index_(block_index) {}

    size_t getSize() const { return size_; }
    size_t getMaxSize() const { return max_size_; }
    size_t getBlockIndex() const { return block_index_; }

private:
    static std::string createMessage(size_t size, size_t max_size, size_t block_index) {
        std::ostringstream oss;
        oss << "Block " << block_index << " payload of " << size
            << " bytes exceeds maximum of " << max_size << " bytes";
        return oss.str();
    }
};

/**
 * Exception thrown for file I/O related errors
 */
class FileException : public TapeException {
private:
    std::string filename_;
    
public:
    FileException(const std::string& msg, const std::string& filename = "")
        : TapeException(msg), filename_(filename) {
        
        if (!filename_.empty()) {
            message_ = message_ + " (file: " + filename_ + ")";
        }
    }
    
    const std::string& getFilename() const { return filename_; }
};

} // namespace tierone::tap2tzx
