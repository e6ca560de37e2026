/**
 * @file fixture.hpp
 * @brief Shared test fixtures: temporary firmware tree and fake toolchain
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <stdlib.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <vector>

#include "fwpipe/process.hpp"
#include "fwpipe/toolchain.hpp"

namespace fwpipe_test
{

namespace fs = std::filesystem;

inline std::string read_file(const fs::path& path)
{
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline void write_file(const fs::path& path, const std::string& data)
{
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(data.data(), static_cast<std::streamsize>(data.size()));
}

/**
 * @brief Count entries of dir whose name starts with the scratch prefix
 */
inline size_t count_scratch_dirs(const fs::path& dir)
{
  size_t count = 0;
  for (const auto& entry : fs::directory_iterator(dir))
  {
    if (entry.path().filename().string().rfind(fwpipe::SCRATCH_PREFIX, 0) == 0)
    {
      ++count;
    }
  }
  return count;
}

/**
 * @brief Temporary firmware tree
 *
 * <root>/firmware/c-userspace/c-output  working directory with inputs
 * <root>/firmware/kernel/appbins        install directory (../../kernel/appbins)
 */
class TempTree
{
 public:
  explicit TempTree(bool with_appbins = true)
  {
    std::string pattern = (fs::temp_directory_path() / "fwpipe-test-XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (mkdtemp(buffer.data()) != nullptr)
    {
      root = buffer.data();
    }

    work = root / "firmware" / "c-userspace" / "c-output";
    appbins = root / "firmware" / "kernel" / "appbins";

    fs::create_directories(work);
    if (with_appbins)
    {
      fs::create_directories(appbins);
    }

    write_file(work / "test.c", "int entry(void) { return 0; }\n");
    write_file(work / "link.x", "ENTRY(entry)\n");
    write_file(work / "libc_userspace.a", "!<arch>\n");
  }

  ~TempTree()
  {
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  TempTree(const TempTree&) = delete;
  TempTree& operator=(const TempTree&) = delete;

  fs::path root;
  fs::path work;
  fs::path appbins;
};

/* ========================================================================= */
/* Fake toolchain                                                            */
/* ========================================================================= */

constexpr size_t FAKE_ELF_HEADER_SIZE = 52;
constexpr size_t FAKE_ELF_SYMTAB_SIZE = 64;

inline std::string arg_after(const std::vector<std::string>& argv, const std::string& flag)
{
  const auto it = std::find(argv.begin(), argv.end(), flag);
  if (it == argv.end() || std::next(it) == argv.end())
  {
    return std::string();
  }
  return *std::next(it);
}

/**
 * @brief Process runner that imitates compiler, linker and objcopy
 *
 * compile: object = "OBJ:" + source
 * link:    image = header + object + symbol table, map = text
 * extract: binary = image without header and symbol table
 */
struct FakeToolchain
{
  std::vector<fwpipe::Stage> calls;
  std::vector<std::vector<std::string>> commands;

  fwpipe::Stage fail_stage = fwpipe::Stage::NONE;
  int fail_status = 1;

  static fwpipe::Stage classify(const std::vector<std::string>& argv)
  {
    if (std::find(argv.begin(), argv.end(), "-c") != argv.end())
    {
      return fwpipe::Stage::COMPILE;
    }
    if (std::find(argv.begin(), argv.end(), "--static") != argv.end())
    {
      return fwpipe::Stage::LINK;
    }
    if (std::find(argv.begin(), argv.end(), "-O") != argv.end())
    {
      return fwpipe::Stage::EXTRACT;
    }
    return fwpipe::Stage::NONE;
  }

  int operator()(const std::vector<std::string>& argv)
  {
    const fwpipe::Stage stage = classify(argv);
    calls.push_back(stage);
    commands.push_back(argv);

    if (stage == fail_stage)
    {
      return fail_status;
    }

    switch (stage)
    {
      case fwpipe::Stage::COMPILE:
        write_file(arg_after(argv, "-o"), "OBJ:" + read_file(arg_after(argv, "-c")));
        return 0;

      case fwpipe::Stage::LINK:
      {
        std::string image("\x7f" "ELF", 4);
        image.resize(FAKE_ELF_HEADER_SIZE, '\0');
        image += read_file(argv[argv.size() - 2]);
        image += std::string(FAKE_ELF_SYMTAB_SIZE, 'S');
        write_file(arg_after(argv, "-o"), image);

        for (const auto& arg : argv)
        {
          if (arg.rfind("-Wl,-Map=", 0) == 0)
          {
            write_file(arg.substr(9), "Memory Configuration\n");
          }
        }
        return 0;
      }

      case fwpipe::Stage::EXTRACT:
      {
        const std::string image = read_file(argv[3]);
        if (image.size() < FAKE_ELF_HEADER_SIZE + FAKE_ELF_SYMTAB_SIZE)
        {
          return 1;
        }
        write_file(argv[4], image.substr(FAKE_ELF_HEADER_SIZE, image.size() -
                                                                   FAKE_ELF_HEADER_SIZE -
                                                                   FAKE_ELF_SYMTAB_SIZE));
        return 0;
      }

      default:
        return 1;
    }
  }

  fwpipe::RunFn runner()
  {
    return [this](const std::vector<std::string>& argv) { return (*this)(argv); };
  }
};

}  // namespace fwpipe_test
