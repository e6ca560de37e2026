/**
 * @file crc32.cpp
 * @brief CRC-32 checksum implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "crc32.hpp"

#include <fstream>

namespace fwpipe
{
namespace internal
{

uint32_t calc_crc32(const uint8_t* data, size_t len, uint32_t crc)
{
  crc = ~crc;

  for (size_t i = 0; i < len; ++i)
  {
    crc ^= data[i];

    for (int bit = 0; bit < 8; ++bit)
    {
      if (crc & 1)
      {
        crc = (crc >> 1) ^ CRC32_POLY;
      }
      else
      {
        crc >>= 1;
      }
    }
  }

  return ~crc;
}

bool file_crc32(const std::filesystem::path& path, uintmax_t& size, uint32_t& crc)
{
  std::ifstream in(path, std::ios::binary);
  if (!in)
  {
    return false;
  }

  size = 0;
  crc = 0;

  char buffer[4096];
  while (in)
  {
    in.read(buffer, sizeof(buffer));
    const std::streamsize n = in.gcount();
    if (n <= 0)
    {
      break;
    }
    crc = calc_crc32(reinterpret_cast<const uint8_t*>(buffer), static_cast<size_t>(n), crc);
    size += static_cast<uintmax_t>(n);
  }

  return !in.bad();
}

}  // namespace internal
}  // namespace fwpipe
