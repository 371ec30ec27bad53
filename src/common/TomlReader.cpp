#include "common/TomlReader.hpp"

#include "common/Errors.hpp"

#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace gov::common {

namespace {

/// Cursor over the document text with line tracking for error messages.
class Scanner {
 public:
  explicit Scanner(const std::string& sText) : _sText(sText) {}

  bool atEnd() const { return _nPos >= _sText.size(); }
  char peek(size_t nAhead = 0) const {
    return _nPos + nAhead < _sText.size() ? _sText[_nPos + nAhead] : '\0';
  }
  char next() {
    const char c = _sText[_nPos++];
    if (c == '\n') ++_iLine;
    return c;
  }
  bool startsWith(const char* pLiteral) const {
    return _sText.compare(_nPos, std::char_traits<char>::length(pLiteral), pLiteral) == 0;
  }
  void advance(size_t n) {
    for (size_t i = 0; i < n && !atEnd(); ++i) next();
  }
  size_t pos() const { return _nPos; }
  const std::string& text() const { return _sText; }

  [[noreturn]] void fail(const std::string& sMsg) const {
    throw ConfigError("check.toml line " + std::to_string(_iLine) + ": " + sMsg);
  }

  void skipInlineSpace() {
    while (!atEnd() && (peek() == ' ' || peek() == '\t')) next();
  }

  void skipComment() {
    if (peek() == '#') {
      while (!atEnd() && peek() != '\n') next();
    }
  }

  /// Whitespace, newlines and comments.
  void skipBlank() {
    while (!atEnd()) {
      const char c = peek();
      if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
        next();
      } else if (c == '#') {
        skipComment();
      } else {
        break;
      }
    }
  }

 private:
  const std::string& _sText;
  size_t _nPos = 0;
  int _iLine = 1;
};

std::string trim(const std::string& sValue) {
  const auto nBegin = sValue.find_first_not_of(" \t");
  if (nBegin == std::string::npos) return {};
  const auto nEnd = sValue.find_last_not_of(" \t");
  return sValue.substr(nBegin, nEnd - nBegin + 1);
}

/// Normalize a dotted name: trims segments and strips quotes.
std::string normalizeName(Scanner& scn, const std::string& sRaw) {
  std::string sOut;
  std::stringstream ss(sRaw);
  std::string sSegment;
  while (std::getline(ss, sSegment, '.')) {
    sSegment = trim(sSegment);
    if (sSegment.size() >= 2 && (sSegment.front() == '"' || sSegment.front() == '\'') &&
        sSegment.back() == sSegment.front()) {
      sSegment = sSegment.substr(1, sSegment.size() - 2);
    }
    if (sSegment.empty()) {
      scn.fail("empty name segment in '" + sRaw + "'");
    }
    if (!sOut.empty()) sOut += '.';
    sOut += sSegment;
  }
  if (sOut.empty()) {
    scn.fail("empty name");
  }
  return sOut;
}

std::string parseBasicString(Scanner& scn) {
  scn.next();  // opening quote
  std::string sOut;
  while (true) {
    if (scn.atEnd() || scn.peek() == '\n') {
      scn.fail("unterminated string");
    }
    const char c = scn.next();
    if (c == '"') break;
    if (c != '\\') {
      sOut += c;
      continue;
    }
    const char cEsc = scn.atEnd() ? '\0' : scn.next();
    switch (cEsc) {
      case 'n': sOut += '\n'; break;
      case 't': sOut += '\t'; break;
      case 'r': sOut += '\r'; break;
      case '"': sOut += '"'; break;
      case '\\': sOut += '\\'; break;
      default: scn.fail(std::string("unsupported escape '\\") + cEsc + "'");
    }
  }
  return sOut;
}

std::string parseLiteralString(Scanner& scn) {
  scn.next();  // opening quote
  std::string sOut;
  while (true) {
    if (scn.atEnd() || scn.peek() == '\n') {
      scn.fail("unterminated string");
    }
    const char c = scn.next();
    if (c == '\'') break;
    sOut += c;
  }
  return sOut;
}

/// Consume a multi-line string delimited by pDelim (""" or ''').
std::string consumeMultiline(Scanner& scn, const char* pDelim) {
  const size_t nStart = scn.pos();
  scn.advance(3);
  while (!scn.atEnd() && !scn.startsWith(pDelim)) scn.next();
  if (scn.atEnd()) {
    scn.fail("unterminated multi-line string");
  }
  scn.advance(3);
  return scn.text().substr(nStart, scn.pos() - nStart);
}

/// Consume a bracketed value ([...] or {...}) respecting strings; returns its
/// text from nStart. iDepth is the nesting already entered before the cursor.
std::string consumeBalanced(Scanner& scn, size_t nStart, int iDepth = 0) {
  while (!scn.atEnd()) {
    const char c = scn.peek();
    if (c == '"') {
      parseBasicString(scn);
      continue;
    }
    if (c == '\'') {
      parseLiteralString(scn);
      continue;
    }
    if (c == '#') {
      scn.skipComment();
      continue;
    }
    scn.next();
    if (c == '[' || c == '{') ++iDepth;
    if (c == ']' || c == '}') {
      if (--iDepth <= 0) {
        return scn.text().substr(nStart, scn.pos() - nStart);
      }
    }
  }
  scn.fail("unterminated array or inline table");
}

TomlDocument::Value parseArray(Scanner& scn) {
  const size_t nStart = scn.pos();
  scn.next();  // '['
  std::vector<std::string> vItems;
  while (true) {
    scn.skipBlank();
    if (scn.atEnd()) {
      scn.fail("unterminated array");
    }
    if (scn.peek() == ']') {
      scn.next();
      return vItems;
    }
    if (scn.peek() == '"' && !scn.startsWith("\"\"\"")) {
      vItems.push_back(parseBasicString(scn));
    } else if (scn.peek() == '\'' && !scn.startsWith("'''")) {
      vItems.push_back(parseLiteralString(scn));
    } else {
      // Not a plain string array: keep the whole array as raw text
      return TomlDocument::Raw{consumeBalanced(scn, nStart, 1)};
    }
    scn.skipBlank();
    if (scn.peek() == ',') {
      scn.next();
    } else if (scn.peek() != ']') {
      scn.fail("expected ',' or ']' in array");
    }
  }
}

TomlDocument::Value parseScalar(Scanner& scn) {
  const size_t nStart = scn.pos();
  while (!scn.atEnd()) {
    const char c = scn.peek();
    if (c == '\n' || c == '\r' || c == '#' || c == ' ' || c == '\t') break;
    scn.next();
  }
  const std::string sToken = scn.text().substr(nStart, scn.pos() - nStart);
  if (sToken.empty()) {
    scn.fail("missing value");
  }
  if (sToken == "true" || sToken == "false") {
    return TomlDocument::Value(std::in_place_type<bool>, sToken == "true");
  }

  std::string sDigits;
  for (char c : sToken) {
    if (c != '_') sDigits += c;
  }
  size_t nFirst = (sDigits[0] == '+' || sDigits[0] == '-') ? 1 : 0;
  bool bInteger = sDigits.size() > nFirst;
  for (size_t i = nFirst; i < sDigits.size() && bInteger; ++i) {
    bInteger = std::isdigit(static_cast<unsigned char>(sDigits[i])) != 0;
  }
  if (bInteger) {
    try {
      return TomlDocument::Value(std::in_place_type<int64_t>, std::stoll(sDigits));
    } catch (const std::out_of_range&) {
      scn.fail("integer out of range: " + sToken);
    }
  }
  // Floats, dates and other forms are kept but not interpreted
  return TomlDocument::Raw{sToken};
}

TomlDocument::Value parseValue(Scanner& scn) {
  if (scn.startsWith("\"\"\"")) return TomlDocument::Raw{consumeMultiline(scn, "\"\"\"")};
  if (scn.startsWith("'''")) return TomlDocument::Raw{consumeMultiline(scn, "'''")};
  if (scn.peek() == '"') return parseBasicString(scn);
  if (scn.peek() == '\'') return parseLiteralString(scn);
  if (scn.peek() == '[') return parseArray(scn);
  if (scn.peek() == '{') return TomlDocument::Raw{consumeBalanced(scn, scn.pos())};
  return parseScalar(scn);
}

const char* typeName(const TomlDocument::Value& value) {
  switch (value.index()) {
    case 0: return "string";
    case 1: return "integer";
    case 2: return "boolean";
    case 3: return "string array";
    default: return "unsupported value";
  }
}

template <typename T>
std::optional<T> typedGet(const std::map<std::string, TomlDocument::Value>& mValues,
                          const std::string& sKey, const char* pExpected) {
  auto it = mValues.find(sKey);
  if (it == mValues.end()) {
    return std::nullopt;
  }
  if (const auto* pValue = std::get_if<T>(&it->second)) {
    return *pValue;
  }
  throw ConfigError("check.toml: '" + sKey + "' must be a " + pExpected + " (found " +
                    typeName(it->second) + ")");
}

}  // namespace

TomlDocument TomlDocument::parse(const std::string& sText) {
  TomlDocument td;
  Scanner scn(sText);
  std::string sTable;
  bool bIgnoreTable = false;

  while (true) {
    scn.skipBlank();
    if (scn.atEnd()) break;

    if (scn.peek() == '[') {
      const bool bArrayOfTables = scn.peek(1) == '[';
      scn.advance(bArrayOfTables ? 2 : 1);
      std::string sName;
      while (!scn.atEnd() && scn.peek() != ']' && scn.peek() != '\n') sName += scn.next();
      if (scn.peek() != ']') {
        scn.fail("unterminated table header");
      }
      scn.advance(bArrayOfTables ? 2 : 1);
      sTable = normalizeName(scn, sName);
      bIgnoreTable = bArrayOfTables;
      if (!bIgnoreTable) {
        td._vTables.push_back(sTable);
      }
    } else {
      std::string sKeyRaw;
      while (!scn.atEnd() && scn.peek() != '=' && scn.peek() != '\n') sKeyRaw += scn.next();
      if (scn.peek() != '=') {
        scn.fail("expected '=' after key '" + trim(sKeyRaw) + "'");
      }
      scn.next();
      scn.skipInlineSpace();

      const std::string sKey = normalizeName(scn, sKeyRaw);
      Value value = parseValue(scn);

      if (!bIgnoreTable) {
        const std::string sFullKey = sTable.empty() ? sKey : sTable + "." + sKey;
        if (!td._mValues.emplace(sFullKey, std::move(value)).second) {
          scn.fail("duplicate key '" + sFullKey + "'");
        }
      }
    }

    scn.skipInlineSpace();
    scn.skipComment();
    if (!scn.atEnd() && scn.peek() != '\n' && scn.peek() != '\r') {
      scn.fail("unexpected trailing content");
    }
  }
  return td;
}

TomlDocument TomlDocument::parseFile(const std::string& sPath) {
  std::ifstream ifs(sPath);
  if (!ifs.is_open()) {
    throw ConfigError("Cannot open policy file: " + sPath);
  }
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return parse(oss.str());
}

bool TomlDocument::hasTable(const std::string& sTable) const {
  const std::string sPrefix = sTable + ".";
  for (const auto& sName : _vTables) {
    if (sName == sTable || sName.rfind(sPrefix, 0) == 0) return true;
  }
  auto it = _mValues.lower_bound(sPrefix);
  return it != _mValues.end() && it->first.rfind(sPrefix, 0) == 0;
}

bool TomlDocument::has(const std::string& sKey) const {
  return _mValues.count(sKey) > 0;
}

std::optional<std::string> TomlDocument::getString(const std::string& sKey) const {
  return typedGet<std::string>(_mValues, sKey, "string");
}

std::optional<int64_t> TomlDocument::getInt(const std::string& sKey) const {
  return typedGet<int64_t>(_mValues, sKey, "integer");
}

std::optional<bool> TomlDocument::getBool(const std::string& sKey) const {
  return typedGet<bool>(_mValues, sKey, "boolean");
}

std::optional<std::vector<std::string>> TomlDocument::getStringArray(
    const std::string& sKey) const {
  return typedGet<std::vector<std::string>>(_mValues, sKey, "string array");
}

}  // namespace gov::common
