#pragma once

// nosj: a small, header-only C++17 decoder for marshalled maps.
// Goals: strict grammar, deterministic event output, precise errors.

#include <charconv>
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <system_error>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace nosj {

// Config: default bound on map nesting (top-level map counts as depth 1).
// Override by defining NOSJ_DEFAULT_MAX_DEPTH before including this header.
#ifndef NOSJ_DEFAULT_MAX_DEPTH
  #define NOSJ_DEFAULT_MAX_DEPTH 256
#endif

enum class error_code {
  ok = 0,
  expected_map_open,
  expected_map_close,
  expected_close_paren,
  expected_colon,
  expected_comma,
  invalid_key,
  duplicate_key,
  structural_char_in_value,
  invalid_complex_string,
  whitespace_outside_simple_string,
  unrecognized_token,
  trailing_characters,
  nesting_too_deep
};

inline const char* error_message(error_code code) noexcept {
  switch (code) {
    case error_code::ok: return "ok";
    case error_code::expected_map_open: return "Map must start with '(<'";
    case error_code::expected_map_close: return "Map must end with ')'";
    case error_code::expected_close_paren: return "Expected ')' after nested map";
    case error_code::expected_colon: return "Expected ':' after key";
    case error_code::expected_comma: return "Expected ',' between key-value pairs";
    case error_code::invalid_key: return "Missing key";
    case error_code::duplicate_key: return "Duplicate key in map";
    case error_code::structural_char_in_value: return "Unexpected structural character inside value";
    case error_code::invalid_complex_string: return "Invalid percent-encoding in complex string";
    case error_code::whitespace_outside_simple_string: return "Whitespace outside simple-string";
    case error_code::unrecognized_token: return "Unrecognized value token";
    case error_code::trailing_characters: return "Trailing characters after top-level map";
    case error_code::nesting_too_deep: return "Maximum nesting depth exceeded";
  }
  return "unknown error";
}

struct error {
  error_code code{error_code::ok};
  std::size_t offset{0};
  std::size_t line{1};
  std::size_t column{1};

  constexpr explicit operator bool() const noexcept { return code != error_code::ok; }
};

class parse_error : public std::runtime_error {
public:
  explicit parse_error(const error& e) : std::runtime_error(error_message(e.code)), err_(e) {}

  const error& err() const noexcept { return err_; }

private:
  error err_;
};

namespace detail {

inline void update_line_col(std::string_view s, std::size_t pos, std::size_t& line, std::size_t& col) {
  line = 1;
  col = 1;
  for (std::size_t i = 0; i < pos && i < s.size(); ++i) {
    if (s[i] == '\n') {
      ++line;
      col = 1;
    } else {
      ++col;
    }
  }
}

// Whitespace stripped around the whole input: ASCII 09-0D, 1C-20 and the
// Unicode space separators, matched as UTF-8 sequences.
inline bool is_outer_ws(char c) noexcept {
  const unsigned char uc = static_cast<unsigned char>(c);
  return (uc >= 0x09u && uc <= 0x0Du) || (uc >= 0x1Cu && uc <= 0x20u);
}

// Length of the whitespace sequence at the start of `s`, or 0.
inline std::size_t outer_ws_prefix(std::string_view s) noexcept {
  if (s.empty()) return 0;
  if (is_outer_ws(s[0])) return 1;
  const auto b = [&](std::size_t i) { return static_cast<unsigned char>(s[i]); };
  if (s.size() >= 2 && b(0) == 0xC2u && (b(1) == 0x85u || b(1) == 0xA0u)) return 2; // U+0085, U+00A0
  if (s.size() < 3) return 0;
  if (b(0) == 0xE1u && b(1) == 0x9Au && b(2) == 0x80u) return 3; // U+1680
  if (b(0) == 0xE2u && b(1) == 0x80u) {
    const unsigned char t = b(2);
    if ((t >= 0x80u && t <= 0x8Au) || t == 0xA8u || t == 0xA9u || t == 0xAFu) return 3; // U+2000..200A, 2028, 2029, 202F
    return 0;
  }
  if (b(0) == 0xE2u && b(1) == 0x81u && b(2) == 0x9Fu) return 3; // U+205F
  if (b(0) == 0xE3u && b(1) == 0x80u && b(2) == 0x80u) return 3; // U+3000
  return 0;
}

// Length of the whitespace sequence at the end of `s`, or 0.
inline std::size_t outer_ws_suffix(std::string_view s) noexcept {
  for (std::size_t n = 1; n <= 3 && n <= s.size(); ++n) {
    if (outer_ws_prefix(s.substr(s.size() - n)) == n) return n;
  }
  return 0;
}

// Whitespace allowed inside a simple-string token.
inline bool is_inline_ws(char c) noexcept { return c == ' ' || c == '\t'; }

inline bool is_structural(char c) noexcept {
  return c == '(' || c == ')' || c == '<' || c == ':';
}

inline bool is_lower(char c) noexcept { return c >= 'a' && c <= 'z'; }

inline bool is_alnum(char c) noexcept {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

inline int hex_val(char c) noexcept {
  const unsigned char uc = static_cast<unsigned char>(c);
  if (uc >= static_cast<unsigned char>('0') && uc <= static_cast<unsigned char>('9')) {
    return static_cast<int>(uc - static_cast<unsigned char>('0'));
  }
  const unsigned char lc = static_cast<unsigned char>(uc | 0x20u); // ASCII to-lower
  if (lc >= static_cast<unsigned char>('a') && lc <= static_cast<unsigned char>('f')) {
    return 10 + static_cast<int>(lc - static_cast<unsigned char>('a'));
  }
  return -1;
}

// Code points U+0080..U+00FF are exactly the two-byte sequences C2 80 .. C3 BF.
inline bool decode_latin1_utf8(std::string_view s, std::size_t& i, unsigned char& out) noexcept {
  const unsigned char lead = static_cast<unsigned char>(s[i]);
  if ((lead != 0xC2u && lead != 0xC3u) || i + 1 >= s.size()) return false;
  const unsigned char cont = static_cast<unsigned char>(s[i + 1]);
  if ((cont & 0xC0u) != 0x80u) return false;
  out = static_cast<unsigned char>(((lead & 0x1Fu) << 6) | (cont & 0x3Fu));
  i += 2;
  return true;
}

inline void append_latin1_as_utf8(std::string& out, std::string_view bytes) {
  for (const char c : bytes) {
    const unsigned char uc = static_cast<unsigned char>(c);
    if (uc <= 0x7Fu) {
      out.push_back(c);
    } else {
      out.push_back(static_cast<char>(0xC0u | (uc >> 6)));
      out.push_back(static_cast<char>(0x80u | (uc & 0x3Fu)));
    }
  }
}

inline void append_int64(std::string& out, std::int64_t v) {
  char buf[32];
  auto r = std::to_chars(buf, buf + sizeof(buf), v);
  if (r.ec != std::errc{}) {
    throw std::runtime_error("nosj: failed to format integer");
  }
  out.append(buf, static_cast<std::size_t>(r.ptr - buf));
}

inline bool is_bits(std::string_view s) noexcept {
  if (s.empty()) return false;
  for (const char c : s) {
    if (c != '0' && c != '1') return false;
  }
  return true;
}

// Drops leading bits that only repeat the sign; the value is unchanged.
inline std::string_view strip_sign_extension(std::string_view bits) noexcept {
  std::size_t k = 0;
  while (k + 1 < bits.size() && bits[k] == bits[k + 1]) ++k;
  return bits.substr(k);
}

// Requires is_bits(bits) and bits.size() <= 64.
inline std::int64_t bits_to_int64(std::string_view bits) noexcept {
  std::uint64_t acc = 0;
  for (const char c : bits) acc = (acc << 1) | (c == '1' ? 1u : 0u);
  const std::size_t n = bits.size();
  if (bits[0] == '1' && n < 64) acc |= ~std::uint64_t{0} << n;
  std::int64_t v = 0;
  std::memcpy(&v, &acc, sizeof(v));
  return v;
}

// Unsigned binary -> decimal, base 1e9 limbs (little endian).
inline void append_unsigned_decimal(std::string& out, std::string_view magnitude) {
  constexpr std::uint32_t kBase = 1000000000u;
  std::vector<std::uint32_t> limbs(1, 0u);
  for (const char c : magnitude) {
    std::uint64_t carry = (c == '1') ? 1u : 0u;
    for (auto& limb : limbs) {
      const std::uint64_t v = static_cast<std::uint64_t>(limb) * 2u + carry;
      limb = static_cast<std::uint32_t>(v % kBase);
      carry = v / kBase;
    }
    if (carry != 0) limbs.push_back(static_cast<std::uint32_t>(carry));
  }

  out += std::to_string(limbs.back());
  for (std::size_t k = limbs.size() - 1; k-- > 0;) {
    const std::string part = std::to_string(limbs[k]);
    out.append(9 - part.size(), '0');
    out += part;
  }
}

} // namespace detail

// ---------------------------------------------------------------------------
// Scalars
// ---------------------------------------------------------------------------

// Two's complement of arbitrary width: unsigned(bits) - 2^n when the MSB is set.
inline bool decode_twos_complement(std::string_view bits, std::string& decimal) {
  if (!detail::is_bits(bits)) return false;
  decimal.clear();

  const std::string_view norm = detail::strip_sign_extension(bits);
  if (norm.size() <= 64) {
    detail::append_int64(decimal, detail::bits_to_int64(norm));
    return true;
  }

  if (norm[0] == '0') {
    detail::append_unsigned_decimal(decimal, norm);
    return true;
  }

  // Negative: magnitude = ~bits + 1.
  std::string magnitude(norm);
  for (auto& c : magnitude) c = (c == '1') ? '0' : '1';
  for (std::size_t k = magnitude.size(); k-- > 0;) {
    if (magnitude[k] == '0') {
      magnitude[k] = '1';
      break;
    }
    magnitude[k] = '0';
  }
  decimal.push_back('-');
  detail::append_unsigned_decimal(decimal, magnitude);
  return true;
}

inline bool twos_complement_to_int64(std::string_view bits, std::int64_t& out) noexcept {
  if (!detail::is_bits(bits)) return false;
  const std::string_view norm = detail::strip_sign_extension(bits);
  if (norm.size() > 64) return false;
  out = detail::bits_to_int64(norm);
  return true;
}

// Shortest two's-complement bitstring holding v.
inline std::string to_twos_complement(std::int64_t v) {
  std::uint64_t u = 0;
  std::memcpy(&u, &v, sizeof(u));
  std::string bits(64, '0');
  for (std::size_t k = 0; k < 64; ++k) {
    if ((u >> (63 - k)) & 1u) bits[k] = '1';
  }
  return std::string(detail::strip_sign_extension(bits));
}

// [A-Za-z0-9 \t]+ followed by a literal 's'; the 's' is not part of the value.
inline bool match_simple_string(std::string_view token, std::string& out) {
  if (token.size() < 2 || token.back() != 's') return false;
  const std::string_view body = token.substr(0, token.size() - 1);
  for (const char c : body) {
    if (!detail::is_alnum(c) && !detail::is_inline_ws(c)) return false;
  }
  out.assign(body.data(), body.size());
  return true;
}

// Decodes %XX escapes to bytes. Fails on a malformed escape, on a raw character
// outside U+0000..U+00FF, or when the token holds no escape at all.
inline bool percent_decode(std::string_view token, std::string& out) {
  out.clear();
  bool had_escape = false;
  std::size_t i = 0;
  const std::size_t n = token.size();
  while (i < n) {
    const char c = token[i];
    if (c == '%') {
      if (i + 2 >= n) return false;
      const int hi = detail::hex_val(token[i + 1]);
      const int lo = detail::hex_val(token[i + 2]);
      if ((hi | lo) < 0) return false;
      out.push_back(static_cast<char>((hi << 4) | lo));
      i += 3;
      had_escape = true;
      continue;
    }
    if (static_cast<unsigned char>(c) >= 0x80u) {
      unsigned char b = 0;
      if (!detail::decode_latin1_utf8(token, i, b)) return false;
      out.push_back(static_cast<char>(b));
      continue;
    }
    out.push_back(c);
    ++i;
  }
  return had_escape;
}

enum class scalar_kind { number, simple_string, complex_string };

struct scalar {
  scalar_kind kind{scalar_kind::number};
  // Decimal text for numbers, decoded bytes for strings.
  std::string text;
};

// Precedence: '%' -> complex string; space/tab -> simple string; [01]+ -> number;
// otherwise simple string or nothing.
inline error_code classify_scalar(std::string_view token, scalar& out) {
  if (token.find('%') != std::string_view::npos) {
    if (!percent_decode(token, out.text)) return error_code::invalid_complex_string;
    out.kind = scalar_kind::complex_string;
    return error_code::ok;
  }

  if (token.find_first_of(" \t") != std::string_view::npos) {
    if (!match_simple_string(token, out.text)) return error_code::whitespace_outside_simple_string;
    out.kind = scalar_kind::simple_string;
    return error_code::ok;
  }

  if (decode_twos_complement(token, out.text)) {
    out.kind = scalar_kind::number;
    return error_code::ok;
  }

  if (match_simple_string(token, out.text)) {
    out.kind = scalar_kind::simple_string;
    return error_code::ok;
  }
  return error_code::unrecognized_token;
}

// ---------------------------------------------------------------------------
// Events
// ---------------------------------------------------------------------------

enum class event_kind { begin_map, end_map, map_key, number, string };

struct event {
  event_kind kind{event_kind::begin_map};
  std::string key;
  // Decimal text for numbers, decoded bytes for strings.
  std::string text;
  // Source token of a scalar, as it appeared in the input.
  std::string raw;
};

enum class text_encoding {
  utf8,   // each decoded byte written as the UTF-8 encoding of U+0000..U+00FF
  latin1  // decoded bytes written unchanged
};

struct output_options {
  text_encoding encoding{text_encoding::utf8};
};

inline void append_line(std::string& out, const event& ev, const output_options& opt = {}) {
  switch (ev.kind) {
    case event_kind::begin_map:
      out += "begin-map";
      return;
    case event_kind::end_map:
      out += "end-map";
      return;
    case event_kind::map_key:
      out += ev.key;
      out += " -- map -- ";
      return;
    case event_kind::number:
      out += ev.key;
      out += " -- num -- ";
      out += ev.text;
      return;
    case event_kind::string:
      out += ev.key;
      out += " -- string -- ";
      if (opt.encoding == text_encoding::utf8) {
        detail::append_latin1_as_utf8(out, ev.text);
      } else {
        out += ev.text;
      }
      return;
  }
}

inline std::string to_line(const event& ev, const output_options& opt = {}) {
  std::string out;
  append_line(out, ev, opt);
  return out;
}

inline std::vector<std::string> to_lines(const std::vector<event>& events, const output_options& opt = {}) {
  std::vector<std::string> lines;
  lines.reserve(events.size());
  for (const auto& ev : events) lines.push_back(to_line(ev, opt));
  return lines;
}

// One LF-terminated line per event.
inline std::string dump_events(const std::vector<event>& events, const output_options& opt = {}) {
  std::string out;
  out.reserve(events.size() * 24u);
  for (const auto& ev : events) {
    append_line(out, ev, opt);
    out.push_back('\n');
  }
  return out;
}

// ---------------------------------------------------------------------------
// Parser
// ---------------------------------------------------------------------------

struct parse_options {
  std::size_t max_depth{NOSJ_DEFAULT_MAX_DEPTH};
  bool require_eof{true};
};

struct parse_result {
  std::vector<event> events;
  error err;
};

struct cursor {
  static constexpr int eof = -1;

  std::string_view s;
  std::size_t i{0};

  int peek(std::size_t k = 0) const noexcept {
    const std::size_t j = i + k;
    return j < s.size() ? static_cast<int>(static_cast<unsigned char>(s[j])) : eof;
  }

  bool at_end() const noexcept { return i >= s.size(); }

  bool starts_with(std::string_view lit) const noexcept {
    return s.size() - i >= lit.size() && s.compare(i, lit.size(), lit) == 0;
  }

  bool consume_exact(char c) noexcept {
    if (peek() != static_cast<int>(static_cast<unsigned char>(c))) return false;
    ++i;
    return true;
  }

  bool consume_exact(std::string_view lit) noexcept {
    if (!starts_with(lit)) return false;
    i += lit.size();
    return true;
  }
};

struct parser {
  std::string_view input;
  // Offset of the trimmed text inside `input`.
  std::size_t base{0};
  cursor cur;
  parse_options opt;
  std::vector<event>* out{nullptr};

  parse_result run() {
    parse_result r;
    out = &r.events;

    std::size_t first = 0;
    std::size_t last = input.size();
    while (first < last) {
      const std::size_t n = detail::outer_ws_prefix(input.substr(first, last - first));
      if (n == 0) break;
      first += n;
    }
    while (last > first) {
      const std::size_t n = detail::outer_ws_suffix(input.substr(first, last - first));
      if (n == 0) break;
      last -= n;
    }
    base = first;
    cur.s = input.substr(first, last - first);
    cur.i = 0;

    if (!parse_top_level(r.err)) r.events.clear();
    return r;
  }

  bool parse_top_level(error& e) {
    if (!cur.consume_exact("(<")) {
      set_error(e, error_code::expected_map_open);
      return false;
    }
    if (opt.max_depth < 1) {
      set_error(e, error_code::nesting_too_deep, 0);
      return false;
    }
    emit(event_kind::begin_map);
    if (!parse_map_body(1, e)) return false;

    if (!cur.consume_exact(')')) {
      set_error(e, error_code::expected_map_close);
      return false;
    }
    if (opt.require_eof && !cur.at_end()) {
      set_error(e, error_code::trailing_characters);
      return false;
    }
    emit(event_kind::end_map);
    return true;
  }

  void set_error(error& e, error_code code, std::size_t at = std::numeric_limits<std::size_t>::max()) {
    if (e) return;
    e.code = code;
    e.offset = base + ((at == std::numeric_limits<std::size_t>::max()) ? cur.i : at);
    detail::update_line_col(input, e.offset, e.line, e.column);
  }

  void emit(event_kind kind, std::string_view key = {}) {
    event ev;
    ev.kind = kind;
    ev.key.assign(key.data(), key.size());
    out->push_back(std::move(ev));
  }

  // Cursor is just past '<'. Consumes through the closing '>'.
  bool parse_map_body(std::size_t depth, error& e) {
    std::unordered_set<std::string_view> seen;
    bool first = true;
    while (true) {
      if (cur.consume_exact('>')) return true;

      if (!first && !cur.consume_exact(',')) {
        set_error(e, error_code::expected_comma);
        return false;
      }
      first = false;

      const std::size_t key_pos = cur.i;
      std::string_view key;
      if (!parse_key(key, e)) return false;
      if (!seen.insert(key).second) {
        set_error(e, error_code::duplicate_key, key_pos);
        return false;
      }

      if (!cur.consume_exact(':')) {
        set_error(e, error_code::expected_colon);
        return false;
      }

      if (cur.starts_with("(<")) {
        if (depth >= opt.max_depth) {
          set_error(e, error_code::nesting_too_deep);
          return false;
        }
        emit(event_kind::map_key, key);
        emit(event_kind::begin_map);
        cur.i += 2;
        if (!parse_map_body(depth + 1, e)) return false;
        if (!cur.consume_exact(')')) {
          set_error(e, error_code::expected_close_paren);
          return false;
        }
        emit(event_kind::end_map);
        continue;
      }

      if (!parse_scalar(key, e)) return false;
    }
  }

  bool parse_key(std::string_view& key, error& e) {
    const std::size_t start = cur.i;
    while (!cur.at_end() && detail::is_lower(cur.s[cur.i])) ++cur.i;
    if (cur.i == start) {
      set_error(e, error_code::invalid_key);
      return false;
    }
    key = cur.s.substr(start, cur.i - start);
    return true;
  }

  // Maximal run up to ',' or '>' or end of input; the cursor stays on the delimiter.
  bool scan_token(std::string_view& token, error& e) {
    const std::size_t start = cur.i;
    while (!cur.at_end()) {
      const char c = cur.s[cur.i];
      if (c == ',' || c == '>') break;
      if (detail::is_structural(c)) {
        set_error(e, error_code::structural_char_in_value);
        return false;
      }
      ++cur.i;
    }
    token = cur.s.substr(start, cur.i - start);
    return true;
  }

  bool parse_scalar(std::string_view key, error& e) {
    const std::size_t start = cur.i;
    std::string_view token;
    if (!scan_token(token, e)) return false;

    scalar sc;
    const error_code code = classify_scalar(token, sc);
    if (code != error_code::ok) {
      set_error(e, code, start);
      return false;
    }

    event ev;
    ev.kind = (sc.kind == scalar_kind::number) ? event_kind::number : event_kind::string;
    ev.key.assign(key.data(), key.size());
    ev.text = std::move(sc.text);
    ev.raw.assign(token.data(), token.size());
    out->push_back(std::move(ev));
    return true;
  }
};

// Decodes one marshalled map. On failure `events` is empty and `err` is set.
inline parse_result parse(std::string_view text, parse_options opt = {}) {
  parser p;
  p.input = text;
  p.opt = opt;
  return p.run();
}

inline std::vector<event> parse_or_throw(std::string_view text, parse_options opt = {}) {
  auto r = parse(text, opt);
  if (r.err) throw parse_error(r.err);
  return std::move(r.events);
}

// ---------------------------------------------------------------------------
// DOM
// ---------------------------------------------------------------------------

struct number_value {
  // Two's-complement bits, as written or as produced by to_twos_complement.
  std::string bits;
  std::string decimal;
  bool is_int{false};
  std::int64_t i{0};
};

namespace detail {

inline number_value make_number(std::string bits) {
  number_value n;
  if (!decode_twos_complement(bits, n.decimal)) {
    throw std::runtime_error("nosj: number bits must match [01]+");
  }
  n.is_int = twos_complement_to_int64(bits, n.i);
  n.bits = std::move(bits);
  return n;
}

} // namespace detail

class value {
public:
  using map = std::vector<std::pair<std::string, value>>;

  enum class kind { number, string, map };

  value() : data_(map{}) {}
  value(std::string s) : data_(std::move(s)) {}
  value(const char* s) : data_(std::string(s)) {}
  value(map m) : data_(std::move(m)) {}

  static value integer(std::int64_t i) {
    value v;
    v.data_ = detail::make_number(to_twos_complement(i));
    return v;
  }

  static value from_bits(std::string bits) {
    value v;
    v.data_ = detail::make_number(std::move(bits));
    return v;
  }

  kind type() const noexcept {
    switch (data_.index()) {
      case 0: return kind::number;
      case 1: return kind::string;
      default: return kind::map;
    }
  }

  bool is_number() const noexcept { return std::holds_alternative<number_value>(data_); }
  bool is_string() const noexcept { return std::holds_alternative<std::string>(data_); }
  bool is_map() const noexcept { return std::holds_alternative<map>(data_); }

  bool is_int() const noexcept {
    if (!is_number()) return false;
    return std::get<number_value>(data_).is_int;
  }

  std::int64_t as_int() const {
    const auto& n = std::get<number_value>(data_);
    if (!n.is_int) throw std::runtime_error("nosj: number does not fit in int64");
    return n.i;
  }

  const std::string& as_decimal() const { return std::get<number_value>(data_).decimal; }
  const std::string& bits() const { return std::get<number_value>(data_).bits; }

  const std::string& as_string() const { return std::get<std::string>(data_); }
  const map& as_map() const { return std::get<map>(data_); }

  std::string& as_string() { return std::get<std::string>(data_); }
  map& as_map() { return std::get<map>(data_); }

  const value* find(std::string_view key) const noexcept {
    if (!is_map()) return nullptr;
    for (const auto& kv : std::get<map>(data_)) {
      if (kv.first == key) return &kv.second;
    }
    return nullptr;
  }

  value* find(std::string_view key) noexcept {
    if (!is_map()) return nullptr;
    for (auto& kv : std::get<map>(data_)) {
      if (kv.first == key) return &kv.second;
    }
    return nullptr;
  }

private:
  // index: 0 number, 1 string, 2 map
  std::variant<number_value, std::string, map> data_;
};

// Rebuilds the map described by a balanced event stream.
inline value build_value(const std::vector<event>& events) {
  value root;
  std::vector<value::map*> stack;
  bool started = false;
  bool pending_key = false;

  for (const auto& ev : events) {
    if (started && stack.empty()) throw std::runtime_error("nosj: events after top-level end-map");
    switch (ev.kind) {
      case event_kind::begin_map:
        if (!started) {
          started = true;
          stack.push_back(&root.as_map());
          break;
        }
        if (!pending_key) throw std::runtime_error("nosj: begin-map without a map key");
        pending_key = false;
        stack.push_back(&stack.back()->back().second.as_map());
        break;
      case event_kind::end_map:
        if (stack.empty() || pending_key) throw std::runtime_error("nosj: unbalanced end-map");
        stack.pop_back();
        break;
      case event_kind::map_key:
        if (stack.empty() || pending_key) throw std::runtime_error("nosj: misplaced map key");
        stack.back()->emplace_back(ev.key, value());
        pending_key = true;
        break;
      case event_kind::number:
        if (stack.empty() || pending_key) throw std::runtime_error("nosj: misplaced scalar");
        stack.back()->emplace_back(ev.key, value::from_bits(ev.raw));
        break;
      case event_kind::string:
        if (stack.empty() || pending_key) throw std::runtime_error("nosj: misplaced scalar");
        stack.back()->emplace_back(ev.key, value(ev.text));
        break;
    }
  }
  if (!started || !stack.empty()) throw std::runtime_error("nosj: incomplete event stream");
  return root;
}

struct value_parse_result {
  value val;
  error err;
};

inline value_parse_result parse_value(std::string_view text, parse_options opt = {}) {
  value_parse_result r;
  auto pr = parse(text, opt);
  if (pr.err) {
    r.err = pr.err;
    return r;
  }
  r.val = build_value(pr.events);
  return r;
}

// ---------------------------------------------------------------------------
// Marshal
// ---------------------------------------------------------------------------

namespace detail {

inline void marshal_string(std::string& out, const std::string& s) {
  if (s.empty()) throw std::runtime_error("nosj: empty string has no marshalled form");

  bool simple = true;
  for (const char c : s) {
    if (!is_alnum(c) && !is_inline_ws(c)) {
      simple = false;
      break;
    }
  }
  if (simple) {
    out += s;
    out.push_back('s');
    return;
  }

  static constexpr char hex[] = "0123456789ABCDEF";
  for (const char c : s) {
    if (is_alnum(c)) {
      out.push_back(c);
      continue;
    }
    const unsigned char uc = static_cast<unsigned char>(c);
    out.push_back('%');
    out.push_back(hex[(uc >> 4) & 0xF]);
    out.push_back(hex[uc & 0xF]);
  }
}

inline void marshal_map(std::string& out, const value::map& m) {
  std::unordered_set<std::string_view> seen;
  out.append("(<", 2);
  bool first = true;
  for (const auto& kv : m) {
    const std::string& key = kv.first;
    if (key.empty()) throw std::runtime_error("nosj: empty key");
    for (const char c : key) {
      if (!is_lower(c)) throw std::runtime_error("nosj: keys must be lowercase letters: " + key);
    }
    if (!seen.insert(key).second) throw std::runtime_error("nosj: duplicate key: " + key);

    if (!first) out.push_back(',');
    first = false;
    out += key;
    out.push_back(':');

    const value& v = kv.second;
    switch (v.type()) {
      case value::kind::number: out += v.bits(); break;
      case value::kind::string: marshal_string(out, v.as_string()); break;
      case value::kind::map: marshal_map(out, v.as_map()); break;
    }
  }
  out.append(">)", 2);
}

} // namespace detail

// Encodes a map value as marshalled text; throws std::runtime_error for values
// the format cannot represent.
inline std::string marshal(const value& v) {
  if (!v.is_map()) throw std::runtime_error("nosj: top-level value must be a map");
  std::string out;
  detail::marshal_map(out, v.as_map());
  return out;
}

} // namespace nosj
