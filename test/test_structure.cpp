#include "test_common.hpp"

#include <string>
#include <vector>

using namespace nosj;

// begin-map/end-map must pair up and a map key must be followed by begin-map.
static void check_balanced(const std::vector<event>& events) {
  long depth = 0;
  for (std::size_t k = 0; k < events.size(); ++k) {
    const event& ev = events[k];
    if (ev.kind == event_kind::begin_map) ++depth;
    if (ev.kind == event_kind::end_map) --depth;
    NOSJ_CHECK(depth >= 0);
    if (ev.kind == event_kind::map_key) {
      NOSJ_CHECK(k + 1 < events.size());
      NOSJ_CHECK(events[k + 1].kind == event_kind::begin_map);
    }
    if (depth == 0) NOSJ_CHECK(k + 1 == events.size());
  }
  NOSJ_CHECK(depth == 0);
}

static void test_nested_maps() {
  {
    const std::vector<std::string> want = {
        "begin-map", "x -- map -- ", "begin-map", "y -- num -- -8", "end-map", "end-map"};
    NOSJ_CHECK(nosj_test::lines_of("(<x:(<y:1000>)>)") == want);
  }
  {
    const char* text = "(<a:(<b:(<c:01s,d:(<>)>),e:1>),f:%21>)";
    const std::vector<std::string> want = {
        "begin-map",
        "a -- map -- ",
        "begin-map",
        "b -- map -- ",
        "begin-map",
        "c -- string -- 01",
        "d -- map -- ",
        "begin-map",
        "end-map",
        "end-map",
        "e -- num -- -1",
        "end-map",
        "f -- string -- !",
        "end-map",
    };
    NOSJ_CHECK(nosj_test::lines_of(text) == want);
    check_balanced(parse(text).events);
  }
}

static void test_empty_maps() {
  const std::vector<std::string> want = {"begin-map", "end-map"};
  NOSJ_CHECK(nosj_test::lines_of("(<>)") == want);

  const std::vector<std::string> nested = {"begin-map", "a -- map -- ", "begin-map", "end-map", "end-map"};
  NOSJ_CHECK(nosj_test::lines_of("(<a:(<>)>)") == nested);
}

static void test_outer_whitespace() {
  const auto plain = nosj_test::lines_of("(<a:0>)");
  NOSJ_CHECK(nosj_test::lines_of("  (<a:0>)  ") == plain);
  NOSJ_CHECK(nosj_test::lines_of("   \t(<a:0>)  \n") == plain);
  NOSJ_CHECK(nosj_test::lines_of("\r\n(<a:0>)\r\n\r\n") == plain);
  NOSJ_CHECK(nosj_test::lines_of("\x1c\x1f\v(<a:0>)\f\x1d") == plain);
  // U+00A0, U+0085, U+2003 and U+3000 in UTF-8.
  NOSJ_CHECK(nosj_test::lines_of("\xC2\xA0(<a:0>)\xC2\xA0") == plain);
  NOSJ_CHECK(nosj_test::lines_of("\xC2\x85\xE2\x80\x83(<a:0>)\xE3\x80\x80\n") == plain);

  // Only whole sequences are whitespace.
  auto r = parse("(<a:0>)\xC2");
  nosj_test::check_err(r.err, error_code::trailing_characters);
  r = parse("(<a:0>)\xE2\x80\x8B");
  nosj_test::check_err(r.err, error_code::trailing_characters);
  r = parse("(<a:0>)\xE2\x80" "A");
  nosj_test::check_err(r.err, error_code::trailing_characters);
  r = parse("\xC2\xA0 <a:0>)");
  nosj_test::check_err(r.err, error_code::expected_map_open);
  NOSJ_CHECK(r.err.offset == 3);

  const std::vector<std::string> want = {"begin-map", "a -- num -- 0", "end-map"};
  NOSJ_CHECK(plain == want);
}

static void test_keys_across_frames() {
  // Uniqueness is per frame: the same key may repeat in parent, child and sibling maps.
  const char* text = "(<a:(<a:0,b:(<a:1>)>),b:(<a:01>)>)";
  auto r = parse(text);
  NOSJ_CHECK(!r.err);
  check_balanced(r.events);

  const std::vector<std::string> want = {
      "begin-map",
      "a -- map -- ",
      "begin-map",
      "a -- num -- 0",
      "b -- map -- ",
      "begin-map",
      "a -- num -- -1",
      "end-map",
      "end-map",
      "b -- map -- ",
      "begin-map",
      "a -- num -- 1",
      "end-map",
      "end-map",
  };
  NOSJ_CHECK(to_lines(r.events) == want);
}

static void test_insertion_order_is_kept() {
  const std::vector<std::string> want = {
      "begin-map", "z -- num -- 0", "m -- string -- hi", "a -- num -- 1", "end-map"};
  NOSJ_CHECK(nosj_test::lines_of("(<z:0,m:his,a:01>)") == want);
}

static void test_dump_events_text() {
  auto r = parse("(<a:1010>)");
  NOSJ_CHECK(!r.err);
  NOSJ_CHECK(dump_events(r.events) == "begin-map\na -- num -- -6\nend-map\n");

  auto n = parse("(<x:(<y:1000>)>)");
  NOSJ_CHECK(!n.err);
  NOSJ_CHECK(dump_events(n.events) == "begin-map\nx -- map -- \nbegin-map\ny -- num -- -8\nend-map\nend-map\n");
}

static void test_require_eof_option() {
  {
    auto r = parse("(<a:0>)junk");
    nosj_test::check_err(r.err, error_code::trailing_characters);
    NOSJ_CHECK(r.events.empty());
  }
  {
    parse_options opt;
    opt.require_eof = false;
    auto r = parse("(<a:0>)junk", opt);
    NOSJ_CHECK(!r.err);
    const std::vector<std::string> want = {"begin-map", "a -- num -- 0", "end-map"};
    NOSJ_CHECK(to_lines(r.events) == want);
  }
}

static void test_max_depth_option() {
  parse_options opt;
  opt.max_depth = 2;
  {
    auto r = parse("(<a:(<b:0>)>)", opt);
    NOSJ_CHECK(!r.err);
  }
  {
    auto r = parse("(<a:(<b:(<c:0>)>)>)", opt);
    nosj_test::check_err(r.err, error_code::nesting_too_deep);
    NOSJ_CHECK(r.events.empty());
    // Reported where the third map opens.
    NOSJ_CHECK(r.err.offset == 8);
  }
}

static void test_deep_nesting_is_bounded() {
  // Far deeper than the default bound: must fail cleanly, not exhaust the stack.
  std::string text = "(<";
  for (int k = 0; k < 100000; ++k) text += "a:(<";
  text += "b:0";
  for (int k = 0; k < 100000; ++k) text += ">)";
  text += ">)";

  auto r = parse(text);
  nosj_test::check_err(r.err, error_code::nesting_too_deep);
  NOSJ_CHECK(r.events.empty());

  parse_options opt;
  opt.max_depth = 201;
  std::string shallow = "(<";
  for (int k = 0; k < 200; ++k) shallow += "a:(<";
  shallow += "b:0";
  for (int k = 0; k < 200; ++k) shallow += ">)";
  shallow += ">)";
  auto s = parse(shallow, opt);
  NOSJ_CHECK(!s.err);
  check_balanced(s.events);
}

void test_structure() {
  test_nested_maps();
  test_empty_maps();
  test_outer_whitespace();
  test_keys_across_frames();
  test_insertion_order_is_kept();
  test_dump_events_text();
  test_require_eof_option();
  test_max_depth_option();
  test_deep_nesting_is_bounded();
}
