/**
 * @file toolchain.cpp
 * @brief Stage and error code names
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "fwpipe/toolchain.hpp"

namespace fwpipe
{

const char* stage_name(Stage stage)
{
  switch (stage)
  {
    case Stage::NONE:
      return "none";
    case Stage::COMPILE:
      return "compile";
    case Stage::LINK:
      return "link";
    case Stage::EXTRACT:
      return "extract";
    case Stage::INSTALL:
      return "install";
  }
  return "unknown";
}

const char* error_message(ErrorCode code)
{
  switch (code)
  {
#define ERR(name, val, msg) \
  case ErrorCode::name:     \
    return msg;
#include "fwpipe/errors.def"
#undef ERR
  }
  return "unknown error";
}

}  // namespace fwpipe
