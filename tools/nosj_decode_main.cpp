#include <nosj/nosj.hpp>

#include "log.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>

namespace {

constexpr int kExitFailure = 66;

// Directories and other non-regular paths open fine as streams but read nothing.
bool slurp_file(const char* path, std::string& out) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec) || ec) return false;
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad() || ss.bad()) return false;
  out = ss.str();
  return true;
}

} // namespace

int main(int argc, char** argv) {
  if (argc != 2) {
    NOSJ_LOG_ERROR("missing input file");
    return kExitFailure;
  }

  std::string text;
  if (!slurp_file(argv[1], text)) {
    NOSJ_LOG_ERROR("file not found");
    return kExitFailure;
  }

  auto r = nosj::parse(std::string_view{text.data(), text.size()});
  if (r.err) {
    NOSJ_LOG_ERROR("%s", nosj::error_message(r.err.code));
    return kExitFailure;
  }

  const std::string out = nosj::dump_events(r.events);
  if (std::fwrite(out.data(), 1, out.size(), stdout) != out.size() || std::fflush(stdout) != 0) {
    NOSJ_LOG_ERROR("failed to write output");
    return kExitFailure;
  }
  return 0;
}
