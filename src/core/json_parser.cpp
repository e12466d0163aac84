// Implementation of the JSON tree parser.

#include "core/json_parser.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace calib {

const JsonValue* JsonValue::find(const std::string& key) const {
  if (type != Object) return nullptr;
  for (const auto& member : members) {
    if (member.first == key) return &member.second;
  }
  return nullptr;
}

double JsonValue::asDouble(double default_val) const {
  if (type == Number) return number_val;
  return default_val;
}

int JsonValue::asInt(int default_val) const {
  if (type == Number) return static_cast<int>(number_val);
  return default_val;
}

bool JsonValue::asBool(bool default_val) const {
  if (type == Bool) return bool_val;
  return default_val;
}

std::string JsonValue::asString(const std::string& default_val) const {
  if (type == String) return string_val;
  return default_val;
}

namespace {

/// Nesting limit; deeper documents are rejected rather than recursed into.
constexpr int kMaxDepth = 64;

/// @brief Recursive-descent parser over a single input buffer.
class Parser {
 public:
  explicit Parser(const std::string& text) : text_(text) {}

  bool parseDocument(JsonValue& out) {
    skipWhitespace();
    if (!parseValue(out, 0)) return false;
    skipWhitespace();
    if (pos_ != text_.size()) return fail("unexpected trailing characters");
    return true;
  }

  const std::string& error() const { return error_; }

 private:
  bool fail(const std::string& reason) {
    if (error_.empty()) {
      error_ = "offset " + std::to_string(pos_) + ": " + reason;
    }
    return false;
  }

  void skipWhitespace() {
    while (pos_ < text_.size() &&
           std::isspace(static_cast<unsigned char>(text_[pos_]))) {
      ++pos_;
    }
  }

  bool consumeLiteral(const char* literal) {
    size_t len = std::char_traits<char>::length(literal);
    if (text_.compare(pos_, len, literal) != 0) return false;
    pos_ += len;
    return true;
  }

  bool parseValue(JsonValue& out, int depth) {
    if (depth > kMaxDepth) return fail("nesting too deep");
    if (pos_ >= text_.size()) return fail("unexpected end of input");

    char chr = text_[pos_];
    switch (chr) {
      case '{':
        return parseObject(out, depth);
      case '[':
        return parseArray(out, depth);
      case '"':
        out.type = JsonValue::String;
        return parseString(out.string_val);
      case 't':
        if (!consumeLiteral("true")) return fail("invalid literal");
        out.type = JsonValue::Bool;
        out.bool_val = true;
        return true;
      case 'f':
        if (!consumeLiteral("false")) return fail("invalid literal");
        out.type = JsonValue::Bool;
        out.bool_val = false;
        return true;
      case 'n':
        if (!consumeLiteral("null")) return fail("invalid literal");
        out.type = JsonValue::Null;
        return true;
      default:
        if (chr == '-' || std::isdigit(static_cast<unsigned char>(chr))) {
          return parseNumber(out);
        }
        return fail(std::string("unexpected character '") + chr + "'");
    }
  }

  bool parseObject(JsonValue& out, int depth) {
    out.type = JsonValue::Object;
    ++pos_;  // skip '{'
    skipWhitespace();
    if (pos_ < text_.size() && text_[pos_] == '}') {
      ++pos_;
      return true;
    }

    while (true) {
      skipWhitespace();
      if (pos_ >= text_.size() || text_[pos_] != '"') {
        return fail("expected object key");
      }
      std::string key;
      if (!parseString(key)) return false;

      skipWhitespace();
      if (pos_ >= text_.size() || text_[pos_] != ':') return fail("expected ':'");
      ++pos_;
      skipWhitespace();

      JsonValue member;
      if (!parseValue(member, depth + 1)) return false;
      out.members.emplace_back(std::move(key), std::move(member));

      skipWhitespace();
      if (pos_ >= text_.size()) return fail("unterminated object");
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == '}') {
        ++pos_;
        return true;
      }
      return fail("expected ',' or '}'");
    }
  }

  bool parseArray(JsonValue& out, int depth) {
    out.type = JsonValue::Array;
    ++pos_;  // skip '['
    skipWhitespace();
    if (pos_ < text_.size() && text_[pos_] == ']') {
      ++pos_;
      return true;
    }

    while (true) {
      skipWhitespace();
      JsonValue item;
      if (!parseValue(item, depth + 1)) return false;
      out.array_items.push_back(std::move(item));

      skipWhitespace();
      if (pos_ >= text_.size()) return fail("unterminated array");
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == ']') {
        ++pos_;
        return true;
      }
      return fail("expected ',' or ']'");
    }
  }

  /// Parse a string literal (pos_ at opening quote) into out.
  bool parseString(std::string& out) {
    ++pos_;  // skip opening quote
    out.clear();
    while (pos_ < text_.size() && text_[pos_] != '"') {
      char chr = text_[pos_];
      if (static_cast<unsigned char>(chr) < 0x20) {
        return fail("control character in string");
      }
      if (chr != '\\') {
        out += chr;
        ++pos_;
        continue;
      }
      ++pos_;
      if (pos_ >= text_.size()) return fail("unterminated escape");
      switch (text_[pos_]) {
        case '"':  out += '"'; break;
        case '\\': out += '\\'; break;
        case '/':  out += '/'; break;
        case 'b':  out += '\b'; break;
        case 'f':  out += '\f'; break;
        case 'n':  out += '\n'; break;
        case 'r':  out += '\r'; break;
        case 't':  out += '\t'; break;
        case 'u': {
          unsigned code = 0;
          if (!parseHex4(code)) return false;
          appendUtf8(out, code);
          continue;  // parseHex4 already advanced past the digits
        }
        default:
          return fail("invalid escape sequence");
      }
      ++pos_;
    }
    if (pos_ >= text_.size()) return fail("unterminated string");
    ++pos_;  // skip closing quote
    return true;
  }

  /// Parse the four hex digits after "\u" (pos_ at 'u').
  bool parseHex4(unsigned& code) {
    ++pos_;  // skip 'u'
    if (pos_ + 4 > text_.size()) return fail("truncated unicode escape");
    code = 0;
    for (int idx = 0; idx < 4; ++idx) {
      char chr = text_[pos_++];
      code <<= 4;
      if (chr >= '0' && chr <= '9') {
        code |= static_cast<unsigned>(chr - '0');
      } else if (chr >= 'a' && chr <= 'f') {
        code |= static_cast<unsigned>(chr - 'a' + 10);
      } else if (chr >= 'A' && chr <= 'F') {
        code |= static_cast<unsigned>(chr - 'A' + 10);
      } else {
        return fail("invalid unicode escape");
      }
    }
    return true;
  }

  /// Encode a BMP code point as UTF-8. Surrogates are kept as-is.
  static void appendUtf8(std::string& out, unsigned code) {
    if (code < 0x80) {
      out += static_cast<char>(code);
    } else if (code < 0x800) {
      out += static_cast<char>(0xC0 | (code >> 6));
      out += static_cast<char>(0x80 | (code & 0x3F));
    } else {
      out += static_cast<char>(0xE0 | (code >> 12));
      out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (code & 0x3F));
    }
  }

  bool parseNumber(JsonValue& out) {
    size_t start = pos_;
    if (text_[pos_] == '-') ++pos_;
    if (pos_ >= text_.size() || !std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
      return fail("invalid number");
    }
    while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
    if (pos_ < text_.size() && text_[pos_] == '.') {
      ++pos_;
      if (pos_ >= text_.size() || !std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
        return fail("invalid fraction");
      }
      while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
    }
    if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
      ++pos_;
      if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) ++pos_;
      if (pos_ >= text_.size() || !std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
        return fail("invalid exponent");
      }
      while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
    }

    std::string num_str = text_.substr(start, pos_ - start);
    errno = 0;
    char* end = nullptr;
    double val = std::strtod(num_str.c_str(), &end);
    if (errno == ERANGE || end != num_str.c_str() + num_str.size()) {
      return fail("number out of range");
    }
    out.type = JsonValue::Number;
    out.number_val = val;
    return true;
  }

  const std::string& text_;
  size_t pos_ = 0;
  std::string error_;
};

}  // namespace

bool parseJson(const std::string& text, JsonValue& out, std::string& error) {
  Parser parser(text);
  JsonValue result;
  if (!parser.parseDocument(result)) {
    error = parser.error();
    return false;
  }
  out = std::move(result);
  return true;
}

bool parseJsonFile(const std::string& path, JsonValue& out, std::string& error) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    error = "cannot open " + path;
    return false;
  }
  std::ostringstream contents;
  contents << file.rdbuf();
  if (!parseJson(contents.str(), out, error)) {
    error = path + ": " + error;
    return false;
  }
  return true;
}

}  // namespace calib
