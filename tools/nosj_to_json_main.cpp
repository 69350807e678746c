#include <nosj/nosj.hpp>

#include <nlohmann/json.hpp>

#include "log.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>

namespace {

constexpr int kExitFailure = 66;

using ordered_json = nlohmann::ordered_json;

// Numbers wider than 64 bits keep their exact decimal text as a JSON string.
ordered_json to_json(const nosj::value& v) {
  switch (v.type()) {
    case nosj::value::kind::number:
      if (v.is_int()) return ordered_json(v.as_int());
      return ordered_json(v.as_decimal());
    case nosj::value::kind::string: {
      std::string utf8;
      nosj::detail::append_latin1_as_utf8(utf8, v.as_string());
      return ordered_json(std::move(utf8));
    }
    case nosj::value::kind::map: {
      ordered_json obj = ordered_json::object();
      for (const auto& kv : v.as_map()) obj[kv.first] = to_json(kv.second);
      return obj;
    }
  }
  return ordered_json();
}

bool read_file(const char* path, std::string& text) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec) || ec) return false;
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return false;
  ifs.seekg(0, std::ios::end);
  const auto end = ifs.tellg();
  if (end < 0) return false;
  text.resize(static_cast<std::size_t>(end));
  ifs.seekg(0, std::ios::beg);
  if (!text.empty()) {
    if (!ifs.read(text.data(), static_cast<std::streamsize>(text.size()))) return false;
  }
  return true;
}

} // namespace

int main(int argc, char** argv) {
  bool pretty = false;
  const char* path = nullptr;
  if (argc == 3 && std::string_view{argv[1]} == "--pretty") {
    pretty = true;
    path = argv[2];
  } else if (argc == 2) {
    path = argv[1];
  } else {
    NOSJ_LOG_ERROR("usage: nosj_to_json [--pretty] <file.nosj>");
    return kExitFailure;
  }

  std::string text;
  if (!read_file(path, text)) {
    NOSJ_LOG_ERROR("file not found");
    return kExitFailure;
  }

  auto r = nosj::parse_value(text);
  if (r.err) {
    NOSJ_LOG_ERROR("%s (line %zu, column %zu)", nosj::error_message(r.err.code), r.err.line, r.err.column);
    return kExitFailure;
  }

  std::cout << to_json(r.val).dump(pretty ? 2 : -1) << "\n";
  return 0;
}
