#ifndef STX_STRING_H
#define STX_STRING_H

#include <string>
#include <vector>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cerrno>

// Wrapper around std::string to provide additional functionality
class stx_string
{
  std::string str;
public:
  // npos
  static const size_t npos = std::string::npos;
  stx_string() : str() {}
  stx_string(const char* s) : str(s) {}
  stx_string(const char* s, size_t len) : str(s, len) {}
  stx_string(const std::string& s) : str(s) {}

  // from long:
  stx_string(long i) : str(std::to_string(i)) {}
  stx_string(long long i) : str(std::to_string(i)) {}
  // single char
  stx_string(char c) : str(1, c) {}

  const std::string& to_std_const() const { return str; }
  const char* c_str() const { return str.c_str(); }

  stx_string operator+(const stx_string& s) const { return str + s.str; }
  stx_string operator+(const char* s) const { return str + s; }
  stx_string& operator+=(const stx_string& s) { str += s.str; return *this; }
  bool operator==(const stx_string& s) const { return str == s.str; }
  bool operator!=(const stx_string& s) const { return str != s.str; }
  bool operator<(const stx_string& s) const { return str < s.str; }

  bool empty() const { return str.empty(); }
  size_t size() const { return str.size(); }

  char& operator[](size_t i) { return str[i]; }
  char operator[](size_t i) const { return str[i]; }

  stx_string substr(size_t pos, size_t len = npos) const { return str.substr(pos, len); }

  void clear() { str.clear(); }

  // Whole-token parse: the entire (trimmed) string must be one number.
  bool parse_double(double& out) const
  {
    stx_string token = trim();
    if (token.empty()) return false;
    const char* begin = token.c_str();
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || errno == ERANGE) return false;
    out = value;
    return true;
  }

  // Whole-token integer parse, optional sign.
  bool parse_integer(long& out) const
  {
    stx_string token = trim();
    if (token.empty()) return false;
    const char* begin = token.c_str();
    char* end = nullptr;
    errno = 0;
    long value = std::strtol(begin, &end, 10);
    if (end == begin || *end != '\0' || errno == ERANGE) return false;
    out = value;
    return true;
  }

  size_t find(const stx_string& s, size_t pos = 0) const { return str.find(s.str, pos); }
  size_t find_first_of(const stx_string& chars, size_t pos = 0) const { return str.find_first_of(chars.str, pos); }

  bool contains(const stx_string& s) const { return str.find(s.str) != std::string::npos; }

  stx_string to_lower() const
  {
    stx_string res = *this;
    for (size_t i = 0; i < res.size(); ++i)
    {
      res[i] = tolower(res[i]);
    }
    return res;
  }

  stx_string& replace(const stx_string& from, const stx_string& to) { for (size_t pos = 0; (pos = str.find(from.str, pos)) != std::string::npos; pos += to.size()) str.replace(pos, from.size(), to.str); return *this; }

  stx_string& append(const stx_string& s)
  {
    str.append(s.str);
    return *this;
  }

  stx_string& append(const char* s, size_t len)
  {
    str.append(s, len);
    return *this;
  }

  size_t split(const stx_string& delim, std::vector<stx_string>& out) const
  {
    size_t pos = 0;
    size_t lastPos = 0;
    while ((pos = str.find(delim.str, lastPos)) != std::string::npos)
    {
      out.push_back(str.substr(lastPos, pos - lastPos));
      lastPos = pos + delim.size();
    }
    out.push_back(str.substr(lastPos));
    return out.size();
  }

  std::vector<stx_string> split(const stx_string& delim) const
  {
    std::vector<stx_string> out;
    split(delim, out);
    return out;
  }

  // Split on the first occurrence only; the delimiter is dropped.
  // Without a delimiter the whole string is the head and tail is empty.
  void partition(const stx_string& delim, stx_string& head, stx_string& tail) const
  {
    size_t pos = str.find(delim.str);
    if (pos == std::string::npos) {
      head = *this;
      tail = stx_string();
      return;
    }
    head = str.substr(0, pos);
    tail = str.substr(pos + delim.size());
  }

  stx_string trim() const
  {
    size_t start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return stx_string();
    size_t end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
  }

  // Removes one pair of matching surrounding quotes ('...' or "...").
  stx_string unquote() const
  {
    if (str.size() >= 2) {
      char first = str.front();
      char last = str.back();
      if ((first == '\'' || first == '"') && first == last) {
        return str.substr(1, str.size() - 2);
      }
    }
    return *this;
  }

  bool starts_with(const stx_string& prefix) const
  {
    return str.size() >= prefix.size() && str.substr(0, prefix.size()) == prefix.str;
  }

  bool ends_with(const stx_string& suffix) const
  {
    return str.size() >= suffix.size() && str.substr(str.size() - suffix.size()) == suffix.str;
  }

  stx_string join(const std::vector<stx_string>& parts) const
  {
    if (parts.empty()) return stx_string();
    if (parts.size() == 1) return parts[0];

    stx_string result = parts[0];
    for (size_t i = 1; i < parts.size(); ++i) {
      result += *this + parts[i];
    }
    return result;
  }
};

// Global operators for const char* + stx_string
inline stx_string operator+(const char* lhs, const stx_string& rhs) {
    return stx_string(lhs) + rhs;
}

#endif // STX_STRING_H
