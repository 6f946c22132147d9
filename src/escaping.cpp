#include <feedbacker/escaping.h>

#include <cstdio>

namespace feedbacker {

std::string Escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    switch (character) {
    case '\\':
      escaped.append("\\\\");
      break;
    case '\t':
      escaped.append("\\t");
      break;
    case '\n':
      escaped.append("\\n");
      break;
    default:
      escaped.push_back(character);
    }
  }
  return escaped;
}

std::string Unescape(const std::string &value) {
  std::string unescaped;
  unescaped.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '\\' && i + 1 < value.size()) {
      const auto next = value[++i];
      if (next == 't') {
        unescaped.push_back('\t');
      } else if (next == 'n') {
        unescaped.push_back('\n');
      } else {
        unescaped.push_back(next);
      }
      continue;
    }
    unescaped.push_back(value[i]);
  }
  return unescaped;
}

std::string JoinEscaped(const std::vector<std::string> &values) {
  std::string line;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      line.push_back('\t');
    }
    line.append(Escape(values[i]));
  }
  return line;
}

std::vector<std::string> SplitEscaped(const std::string &line) {
  std::vector<std::string> fields;
  if (line.empty()) {
    return fields;
  }
  std::string current;
  for (std::size_t i = 0; i < line.size(); ++i) {
    if (line[i] == '\\' && i + 1 < line.size()) {
      current.push_back(line[i]);
      current.push_back(line[++i]);
      continue;
    }
    if (line[i] == '\t') {
      fields.push_back(Unescape(current));
      current.clear();
      continue;
    }
    current.push_back(line[i]);
  }
  fields.push_back(Unescape(current));
  return fields;
}

std::string EscapeJson(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    switch (character) {
    case '"':
      escaped.append("\\\"");
      break;
    case '\\':
      escaped.append("\\\\");
      break;
    case '\n':
      escaped.append("\\n");
      break;
    case '\r':
      escaped.append("\\r");
      break;
    case '\t':
      escaped.append("\\t");
      break;
    default:
      if (static_cast<unsigned char>(character) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x",
                      static_cast<unsigned>(character));
        escaped.append(buffer);
      } else {
        escaped.push_back(character);
      }
    }
  }
  return escaped;
}

} // namespace feedbacker
