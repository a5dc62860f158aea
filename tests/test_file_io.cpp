#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "shiproute/util/file_io.h"
#include "test_fakes.h"

#define SR_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_file_io() {
  namespace fs = std::filesystem;
  using namespace shiproute;

  testing::ScratchDir dir("file_io");
  SR_ASSERT(is_readable_dir(dir.str()));

  const std::string target = join_path(join_path(dir.str(), "nested"), "atomic.txt");
  SR_ASSERT(!file_exists(target));

  // Parent directories are created on demand.
  write_text_file(target, "hello\n");
  SR_ASSERT(file_exists(target));
  SR_ASSERT(read_text_file(target) == "hello\n");

  // Overwrite goes through temp file + rename.
  write_text_file(target, "world\n");
  SR_ASSERT(read_text_file(target) == "world\n");

  const std::string tmp_prefix = fs::path(target).filename().string() + ".tmp";
  for (const auto& entry : fs::directory_iterator(fs::path(target).parent_path())) {
    SR_ASSERT(entry.path().filename().string().rfind(tmp_prefix, 0) != 0);
  }

  // A regular file is not a readable directory; neither is a missing path.
  SR_ASSERT(!is_readable_dir(target));
  SR_ASSERT(!is_readable_dir(dir.file("does_not_exist")));
  SR_ASSERT(!is_readable_dir(""));

  bool threw = false;
  try {
    (void)read_text_file(dir.file("missing.txt"));
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("missing.txt") != std::string::npos;
  }
  SR_ASSERT(threw);

  return 0;
}
