/**
 * @file crc32.hpp
 * @brief CRC-32 checksum calculation (internal)
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace fwpipe
{
namespace internal
{

/**
 * @brief CRC-32 polynomial (reflected form of 0x04C11DB7)
 */
constexpr uint32_t CRC32_POLY = 0xEDB88320;

/**
 * @brief Calculate CRC-32 checksum
 *
 * IEEE 802.3 CRC-32: reflected, initial value 0xFFFFFFFF, final XOR
 * 0xFFFFFFFF. Pass a previous result as crc to continue a running checksum.
 *
 * @param data Pointer to data buffer
 * @param len  Length of data in bytes
 * @param crc  Checksum of the preceding data (0 to start)
 * @return CRC-32 checksum value
 */
uint32_t calc_crc32(const uint8_t* data, size_t len, uint32_t crc = 0);

/**
 * @brief Calculate size and CRC-32 of a file
 *
 * @param path File to read
 * @param size Receives the file size in bytes
 * @param crc  Receives the checksum
 * @return true on success, false if the file could not be read
 */
bool file_crc32(const std::filesystem::path& path, uintmax_t& size, uint32_t& crc);

}  // namespace internal
}  // namespace fwpipe
