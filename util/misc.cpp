#include "util/misc.hpp"

#include <kj/debug.h>

namespace util {

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

std::function<bool()> setBool(bool* var) {
  return [var]() {
    *var = true;
    return true;
  };
};

std::function<bool(kj::StringPtr)> setString(std::string* var) {
  return [var](kj::StringPtr p) {
    *var = p;
    return true;
  };
};

std::function<bool(kj::StringPtr)> addString(std::vector<std::string>* var) {
  return [var](kj::StringPtr p) {
    var->emplace_back(p);
    return true;
  };
};

std::function<bool(kj::StringPtr)> setInt(int32_t* var) {
  return [var](kj::StringPtr p) {
    kj::Maybe<int32_t> parsed = p.tryParseAs<int32_t>();
    KJ_IF_MAYBE(value, parsed) {
      *var = *value;
      return true;
    }
    return false;
  };
};

std::function<bool(kj::StringPtr)> setUint(uint32_t* var) {
  return [var](kj::StringPtr p) {
    kj::Maybe<uint32_t> parsed = p.tryParseAs<uint32_t>();
    KJ_IF_MAYBE(value, parsed) {
      *var = *value;
      return true;
    }
    return false;
  };
};

std::string dedent(const std::string& text) {
  std::vector<std::string> lines;
  size_t start = 0;
  while (start <= text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string::npos) {
      lines.push_back(text.substr(start));
      break;
    }
    lines.push_back(text.substr(start, end - start));
    start = end + 1;
  }

  bool has_margin = false;
  std::string margin;
  for (auto& line : lines) {
    size_t indent = line.find_first_not_of(" \t");
    if (indent == std::string::npos) {
      line.clear();
      continue;
    }
    std::string prefix = line.substr(0, indent);
    if (!has_margin) {
      margin = prefix;
      has_margin = true;
      continue;
    }
    size_t common = 0;
    while (common < margin.size() && common < prefix.size() &&
           margin[common] == prefix[common]) {
      common++;
    }
    margin.resize(common);
  }

  std::string result;
  result.reserve(text.size());
  for (size_t i = 0; i < lines.size(); i++) {
    if (i != 0) result += '\n';
    if (!lines[i].empty()) result += lines[i].substr(margin.size());
  }
  return result;
}

std::string sanitizeUtf8(const std::string& text) {
  static const constexpr char* kReplacement = "\xEF\xBF\xBD";
  std::string result;
  result.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    auto c = static_cast<unsigned char>(text[i]);
    size_t len = 0;
    uint32_t min_value = 0;
    if (c < 0x80) {
      result += text[i++];
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      len = 2;
      min_value = 0x80;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
      min_value = 0x800;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
      min_value = 0x10000;
    } else {
      result += kReplacement;
      i++;
      continue;
    }
    uint32_t value = c & (0xFF >> (len + 1));
    size_t j = 1;
    for (; j < len && i + j < text.size(); j++) {
      auto cc = static_cast<unsigned char>(text[i + j]);
      if ((cc & 0xC0) != 0x80) break;
      value = (value << 6) | (cc & 0x3F);
    }
    if (j != len || value < min_value || value > 0x10FFFF ||
        (value >= 0xD800 && value <= 0xDFFF)) {
      // Skip only the bytes that were consumed as part of the broken sequence.
      result += kReplacement;
      i += j;
      continue;
    }
    result.append(text, i, len);
    i += len;
  }
  return result;
}

}  // namespace util
