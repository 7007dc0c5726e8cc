#include "JsonPayload.hpp"

namespace sb {
namespace {
bool isDigit(char c) { return c >= '0' && c <= '9'; }

bool isHexDigit(char c) {
  return isDigit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

bool isTypeSuffix(char c) {
  return c == 'f' || c == 'F' || c == 'd' || c == 'D';
}

// Consumes [+-]?digits+ starting at pos
bool readExponent(const string& s, size_t* pos) {
  size_t i = *pos;
  if (i < s.size() && (s[i] == '+' || s[i] == '-')) {
    i++;
  }
  size_t digitsStart = i;
  while (i < s.size() && isDigit(s[i])) {
    i++;
  }
  if (i == digitsStart) {
    return false;
  }
  *pos = i;
  return true;
}

// Accepts an optional f/F/d/D and requires the end of the string after it
bool atEndWithOptionalSuffix(const string& s, size_t pos) {
  if (pos < s.size() && isTypeSuffix(s[pos])) {
    pos++;
  }
  return pos == s.size();
}

bool parsesAsHexDouble(const string& s, size_t pos) {
  // 0x already consumed by the caller
  size_t intDigits = 0;
  while (pos < s.size() && isHexDigit(s[pos])) {
    pos++;
    intDigits++;
  }
  size_t fracDigits = 0;
  if (pos < s.size() && s[pos] == '.') {
    pos++;
    while (pos < s.size() && isHexDigit(s[pos])) {
      pos++;
      fracDigits++;
    }
  }
  if (intDigits == 0 && fracDigits == 0) {
    return false;
  }
  // The binary exponent is mandatory for hex floats
  if (pos >= s.size() || (s[pos] != 'p' && s[pos] != 'P')) {
    return false;
  }
  pos++;
  if (!readExponent(s, &pos)) {
    return false;
  }
  return atEndWithOptionalSuffix(s, pos);
}
}  // namespace

string escapeJson(const string& text) {
  string builder;
  builder.reserve(text.size() + 2);
  builder.push_back('"');
  for (char chr : text) {
    switch (chr) {
      case '"':
      case '\\':
        builder.push_back('\\');
        builder.push_back(chr);
        break;
      case '\b':
        builder.append("\\b");
        break;
      case '\t':
        builder.append("\\t");
        break;
      case '\n':
        builder.append("\\n");
        break;
      case '\r':
        builder.append("\\r");
        break;
      default:
        if (static_cast<unsigned char>(chr) < ' ') {
          char hex[8];
          snprintf(hex, sizeof(hex), "\\u%04x",
                   static_cast<unsigned int>(static_cast<unsigned char>(chr)));
          builder.append(hex);
        } else {
          builder.push_back(chr);
        }
        break;
    }
  }
  builder.push_back('"');
  return builder;
}

bool parsesAsDouble(const string& value) {
  // Leading and trailing control characters and spaces are ignored
  size_t begin = 0;
  size_t end = value.size();
  while (begin < end && static_cast<unsigned char>(value[begin]) <= ' ') {
    begin++;
  }
  while (end > begin && static_cast<unsigned char>(value[end - 1]) <= ' ') {
    end--;
  }
  const string s = value.substr(begin, end - begin);
  if (s.empty()) {
    return false;
  }

  size_t pos = 0;
  if (s[pos] == '+' || s[pos] == '-') {
    pos++;
  }
  const string rest = s.substr(pos);
  if (rest == "NaN" || rest == "Infinity") {
    return true;
  }
  if (startsWith(rest, "0x") || startsWith(rest, "0X")) {
    return parsesAsHexDouble(s, pos + 2);
  }

  size_t mantissaDigits = 0;
  while (pos < s.size() && isDigit(s[pos])) {
    pos++;
    mantissaDigits++;
  }
  if (pos < s.size() && s[pos] == '.') {
    pos++;
    while (pos < s.size() && isDigit(s[pos])) {
      pos++;
      mantissaDigits++;
    }
  }
  if (mantissaDigits == 0) {
    return false;
  }
  if (pos < s.size() && (s[pos] == 'e' || s[pos] == 'E')) {
    pos++;
    if (!readExponent(s, &pos)) {
      return false;
    }
  }
  return atEndWithOptionalSuffix(s, pos);
}

bool isNumericLiteral(const string& value) {
  if (value != "0" && endsWith(value, "0")) {
    return false;
  }
  return parsesAsDouble(value);
}

void appendJsonPair(string* json, const string& key, const string& value) {
  if (json->empty() || json->back() != '{') {
    json->push_back(',');
  }
  json->append(escapeJson(key));
  json->push_back(':');
  if (isNumericLiteral(value)) {
    json->append(value);
  } else {
    json->append(escapeJson(value));
  }
}
}  // namespace sb
