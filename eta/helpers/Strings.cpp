/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "Strings.h"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <cstring>

#include <algorithm>

namespace eta {
namespace helpers {

using namespace std;

string trim(const string& text, const char* whiteChars) {
  size_t end = text.length();
  while (end > 0 && strchr(whiteChars, text[end - 1]) != nullptr) {
    end--;
  }
  if (end == 0) {
    return {};
  }
  size_t start = 0;
  while (start < end && strchr(whiteChars, text[start]) != nullptr) {
    start++;
  }
  if (start > 0 || end < text.length()) {
    return text.substr(start, end - start);
  }
  return text;
}

inline bool isdigit(char c) {
  return std::isdigit(static_cast<uint8_t>(c));
}

static uint32_t lastDigitIndex(const char* str, uint32_t index) {
  while (isdigit(str[index + 1])) {
    index++;
  }
  return index;
}

inline char paddedChar(const char* str, uint32_t pos, uint32_t pad, uint32_t index) {
  return index < pad ? '0' : str[pos + index - pad];
}

bool beforeFileName(const char* left, const char* right) {
  uint32_t leftPos = 0;
  uint32_t rightPos = 0;
  bool bothDigits = false;
  while ((bothDigits = (isdigit(left[leftPos]) && isdigit(right[rightPos]))) ||
         (left[leftPos] == right[rightPos] && left[leftPos] != 0)) {
    if (bothDigits) {
      uint32_t leftDigitLength = lastDigitIndex(left, leftPos) - leftPos;
      uint32_t rightDigitLength = lastDigitIndex(right, rightPos) - rightPos;
      uint32_t leftPad =
          leftDigitLength < rightDigitLength ? rightDigitLength - leftDigitLength : 0;
      uint32_t rightPad =
          rightDigitLength < leftDigitLength ? leftDigitLength - rightDigitLength : 0;
      uint32_t lastDigitIndex = max<uint32_t>(leftDigitLength, rightDigitLength);
      for (uint32_t digitIndex = 0; digitIndex <= lastDigitIndex; digitIndex++) {
        char lc = paddedChar(left, leftPos, leftPad, digitIndex);
        char rc = paddedChar(right, rightPos, rightPad, digitIndex);
        if (lc != rc) {
          return lc < rc;
        }
      }
      leftPos += leftDigitLength;
      rightPos += rightDigitLength;
    }
    leftPos++, rightPos++;
  }
  if (left[leftPos] == 0) {
    return right[rightPos] != 0;
  }
  return left[leftPos] < right[rightPos];
}

bool readDouble(const string& str, double& outValue) {
  string text = trim(str, " \t\n\r");
  if (!text.empty()) {
    char* next = nullptr;
    errno = 0;
    double value = strtod(text.c_str(), &next);
    if (next != text.c_str() && *next == 0 && errno != ERANGE && std::isfinite(value)) {
      outValue = value;
      return true;
    }
  }
  outValue = 0;
  return false;
}

bool readBool(const string& str) {
  string text = trim(str, " \t\n\r");
  const char* kFalseValues[] = {"", "0", "false", "no", "off", "none"};
  for (const char* falseValue : kFalseValues) {
    if (strcasecmp(text.c_str(), falseValue) == 0) {
      return false;
    }
  }
  return true;
}

string make_printable(const string& str) {
  string sanitized;
  if (!str.empty()) {
    sanitized.reserve(str.size() + 10);
    for (unsigned char c : str) {
      if (c < 128 && isprint(c)) {
        sanitized.push_back(c);
      } else if (c == '\n') {
        sanitized += "\\n"; // LF
      } else if (c == '\r') {
        sanitized += "\\r"; // CR
      } else if (c == '\t') {
        sanitized += "\\t"; // tab
      } else if (c == '\b') {
        sanitized += "\\b"; // backspace
      } else if (c == 0x1B) {
        sanitized += "\\e"; // esc
      } else {
        static const char* digits = "0123456789abcdef";
        sanitized += "\\x";
        sanitized.push_back(digits[(c >> 4) & 0xf]);
        sanitized.push_back(digits[c & 0xf]);
      }
    }
  }
  return sanitized;
}

} // namespace helpers
} // namespace eta
