#include "autotile/Json.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <utility>

namespace autotile {

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key)
{
  if (!obj.isObject()) return nullptr;
  for (const auto& kv : obj.objectValue) {
    if (kv.first == key) return &kv.second;
  }
  return nullptr;
}

std::string JsonEscape(const std::string& s)
{
  static const char* kHex = "0123456789abcdef";
  std::string out;
  out.reserve(s.size());
  for (unsigned char ch : s) {
    switch (ch) {
    case '\\': out += "\\\\"; break;
    case '"': out += "\\\""; break;
    case '\n': out += "\\n"; break;
    case '\r': out += "\\r"; break;
    case '\t': out += "\\t"; break;
    default:
      if (ch < 0x20) {
        out += "\\u00";
        out.push_back(kHex[(ch >> 4) & 0xF]);
        out.push_back(kHex[ch & 0xF]);
      } else {
        out.push_back(static_cast<char>(ch));
      }
      break;
    }
  }
  return out;
}

namespace {

class Reader {
public:
  explicit Reader(const std::string& text) : m_s(text) {}

  bool value(JsonValue& out, int depth)
  {
    if (depth > kMaxDepth) return fail("nesting too deep");
    ws();
    if (eof()) return fail("unexpected end of input");

    const char c = m_s[m_i];
    switch (c) {
    case '{': return object(out, depth);
    case '[': return array(out, depth);
    case '"':
      out.type = JsonValue::Type::String;
      return string(out.stringValue);
    case 't': return literal("true", out, JsonValue::Type::Bool, true);
    case 'f': return literal("false", out, JsonValue::Type::Bool, false);
    case 'n': return literal("null", out, JsonValue::Type::Null, false);
    default: break;
    }
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) return number(out);
    return fail(std::string("unexpected character '") + c + "'");
  }

  void ws()
  {
    while (!eof() && std::isspace(static_cast<unsigned char>(m_s[m_i])) != 0) ++m_i;
  }

  bool eof() const { return m_i >= m_s.size(); }
  std::size_t pos() const { return m_i; }
  const std::string& error() const { return m_err; }

private:
  static constexpr int kMaxDepth = 64;

  bool fail(const std::string& msg)
  {
    if (m_err.empty()) {
      std::ostringstream oss;
      oss << "JSON parse error @" << m_i << ": " << msg;
      m_err = oss.str();
    }
    return false;
  }

  bool eat(char c)
  {
    ws();
    if (eof() || m_s[m_i] != c) return false;
    ++m_i;
    return true;
  }

  bool literal(const char* word, JsonValue& out, JsonValue::Type type, bool b)
  {
    const std::string w(word);
    if (m_s.compare(m_i, w.size(), w) != 0) return fail("expected '" + w + "'");
    m_i += w.size();
    out.type = type;
    out.boolValue = b;
    return true;
  }

  bool digits()
  {
    const std::size_t start = m_i;
    while (!eof() && std::isdigit(static_cast<unsigned char>(m_s[m_i])) != 0) ++m_i;
    return m_i > start;
  }

  bool number(JsonValue& out)
  {
    const std::size_t start = m_i;
    if (m_s[m_i] == '-') ++m_i;
    if (!eof() && m_s[m_i] == '0') {
      ++m_i;
    } else if (!digits()) {
      return fail("expected digit");
    }
    if (!eof() && m_s[m_i] == '.') {
      ++m_i;
      if (!digits()) return fail("expected digit after '.'");
    }
    if (!eof() && (m_s[m_i] == 'e' || m_s[m_i] == 'E')) {
      ++m_i;
      if (!eof() && (m_s[m_i] == '+' || m_s[m_i] == '-')) ++m_i;
      if (!digits()) return fail("expected exponent digits");
    }

    const std::string num = m_s.substr(start, m_i - start);
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(num.c_str(), &end);
    if (errno != 0 || !end || *end != '\0') return fail("invalid number");

    out.type = JsonValue::Type::Number;
    out.numberValue = v;
    return true;
  }

  bool string(std::string& out)
  {
    if (!eat('"')) return fail("expected string");
    out.clear();
    while (!eof()) {
      const char c = m_s[m_i++];
      if (c == '"') return true;
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      if (eof()) break;
      const char e = m_s[m_i++];
      switch (e) {
      case '"': out.push_back('"'); break;
      case '\\': out.push_back('\\'); break;
      case '/': out.push_back('/'); break;
      case 'b': out.push_back('\b'); break;
      case 'f': out.push_back('\f'); break;
      case 'n': out.push_back('\n'); break;
      case 'r': out.push_back('\r'); break;
      case 't': out.push_back('\t'); break;
      case 'u': {
        if (m_i + 4 > m_s.size()) return fail("invalid \\u escape");
        unsigned int code = 0;
        for (int k = 0; k < 4; ++k) {
          const char h = m_s[m_i++];
          code <<= 4;
          if (h >= '0' && h <= '9') code |= static_cast<unsigned int>(h - '0');
          else if (h >= 'a' && h <= 'f') code |= static_cast<unsigned int>(h - 'a' + 10);
          else if (h >= 'A' && h <= 'F') code |= static_cast<unsigned int>(h - 'A' + 10);
          else return fail("invalid hex digit in \\u escape");
        }
        // Config strings are labels and patterns; non-ASCII is kept as a placeholder.
        out.push_back(code <= 0x7F ? static_cast<char>(code) : '?');
        break;
      }
      default: return fail("unknown escape sequence");
      }
    }
    return fail("unterminated string");
  }

  bool array(JsonValue& out, int depth)
  {
    ++m_i; // '['
    out.type = JsonValue::Type::Array;
    out.arrayValue.clear();
    if (eat(']')) return true;

    while (true) {
      JsonValue v;
      if (!value(v, depth + 1)) return false;
      out.arrayValue.push_back(std::move(v));
      if (eat(']')) return true;
      if (!eat(',')) return fail("expected ',' or ']'");
    }
  }

  bool object(JsonValue& out, int depth)
  {
    ++m_i; // '{'
    out.type = JsonValue::Type::Object;
    out.objectValue.clear();
    if (eat('}')) return true;

    while (true) {
      std::string key;
      if (!string(key)) return false;
      if (!eat(':')) return fail("expected ':'");
      JsonValue v;
      if (!value(v, depth + 1)) return false;
      out.objectValue.emplace_back(std::move(key), std::move(v));
      if (eat('}')) return true;
      if (!eat(',')) return fail("expected ',' or '}'");
    }
  }

  const std::string& m_s;
  std::size_t m_i = 0;
  std::string m_err;
};

} // namespace

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError)
{
  Reader r(text);
  JsonValue v;
  if (!r.value(v, 0)) {
    outError = r.error();
    return false;
  }
  r.ws();
  if (!r.eof()) {
    outError = "JSON parse error @" + std::to_string(r.pos()) + ": trailing characters";
    return false;
  }

  outValue = std::move(v);
  outError.clear();
  return true;
}

} // namespace autotile
