#include <gitscope/sections.hpp>

namespace gitscope {

static bool is_unreserved(unsigned char c) {
  if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9'))
    return true;
  switch (c) {
  case '-':
  case '_':
  case '.':
  case '!':
  case '~':
  case '*':
  case '\'':
  case '(':
  case ')':
    return true;
  default:
    return false;
  }
}

static int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

static bool valid_utf8(std::string_view s) {
  size_t i = 0;
  while (i < s.size()) {
    auto c = static_cast<unsigned char>(s[i]);
    size_t len = 0;
    unsigned cp = 0;
    if (c < 0x80) {
      ++i;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      len = 2;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
      cp = c & 0x07;
    } else {
      return false;
    }
    if (i + len > s.size())
      return false;
    for (size_t k = 1; k < len; ++k) {
      auto cc = static_cast<unsigned char>(s[i + k]);
      if ((cc & 0xC0) != 0x80)
        return false;
      cp = (cp << 6) | (cc & 0x3F);
    }
    // overlong, surrogates, out of range
    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
        (len == 4 && cp < 0x10000) || cp > 0x10FFFF ||
        (cp >= 0xD800 && cp <= 0xDFFF))
      return false;
    i += len;
  }
  return true;
}

std::string percent_encode(std::string_view s) {
  static const char *kHex = "0123456789ABCDEF";
  std::string out;
  out.reserve(s.size());
  for (char ch : s) {
    auto c = static_cast<unsigned char>(ch);
    if (is_unreserved(c)) {
      out.push_back(ch);
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    }
  }
  return out;
}

std::string percent_decode(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] != '%') {
      out.push_back(s[i]);
      continue;
    }
    if (i + 2 >= s.size())
      return std::string(s);
    int hi = hex_value(s[i + 1]);
    int lo = hex_value(s[i + 2]);
    if (hi < 0 || lo < 0)
      return std::string(s);
    out.push_back(static_cast<char>((hi << 4) | lo));
    i += 2;
  }
  if (!valid_utf8(out))
    return std::string(s);
  return out;
}

std::string trim(std::string_view s) {
  const char *ws = " \t\n\r\f\v";
  auto b = s.find_first_not_of(ws);
  if (b == std::string_view::npos)
    return {};
  auto e = s.find_last_not_of(ws);
  return std::string(s.substr(b, e - b + 1));
}

std::string wrap_section(std::string_view repo, std::string_view output) {
  std::string out;
  out += kSectionPrefix;
  out += percent_encode(repo);
  out += '\n';
  auto body = trim(output);
  if (!body.empty()) {
    out += body;
    out += '\n';
  }
  out += kSectionEnd;
  return out;
}

std::vector<RepoSection> split_sections(std::string_view text) {
  std::vector<RepoSection> sections;
  std::optional<std::string> current;
  std::string lines;
  bool has_markers = false;

  auto flush = [&] {
    if (!current)
      return;
    sections.push_back({std::move(current), trim(lines)});
    current.reset();
    lines.clear();
  };

  size_t pos = 0;
  while (pos <= text.size()) {
    auto nl = text.find('\n', pos);
    if (nl == std::string_view::npos)
      nl = text.size();
    std::string_view line = text.substr(pos, nl - pos);
    pos = nl + 1;

    if (line.substr(0, kSectionPrefix.size()) == kSectionPrefix) {
      has_markers = true;
      flush();
      current = percent_decode(trim(line.substr(kSectionPrefix.size())));
      continue;
    }
    if (trim(line) == kSectionEnd) {
      has_markers = true;
      flush();
      continue;
    }
    // строки вне секций после первого маркера отбрасываются
    if (current) {
      lines.append(line);
      lines.push_back('\n');
    }
  }

  if (has_markers) {
    flush();
    return sections;
  }
  return {RepoSection{std::nullopt, trim(text)}};
}

std::unordered_map<std::string, std::string>
section_bodies_by_repo(const std::vector<RepoSection> &sections) {
  std::unordered_map<std::string, std::string> out;
  for (const auto &s : sections)
    out[s.repo.value_or("")] = s.body;
  return out;
}

} // namespace gitscope
