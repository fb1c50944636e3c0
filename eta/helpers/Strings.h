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

#pragma once

#include <cstdint>
#include <string>

#include <eta/os/Platform.h>

#if !IS_WINDOWS_PLATFORM()
#include <strings.h>
#endif

/*
 * Compatibility helpers along with non-fully standardized string utilities.
 */
namespace eta {
namespace helpers {

// strcasecmp is named _stricmp on Windows...
#if IS_WINDOWS_PLATFORM()
inline int strcasecmp(const char* first, const char* second) {
  return _stricmp(first, second);
}
#else
inline int strcasecmp(const char* first, const char* second) {
  return ::strcasecmp(first, second);
}
#endif

/// Compare strings, as you'd expect in a modern desktop OS (Explorer/Finder), treating digit
/// sections as numbers, so that "image1.png" is before "image02.png", and "image010.png" is the
/// same as "image00010.png".
/// Note: This is not a total order, since beforeFileName("image1.png", "image01.png") and
/// beforeFileName("image01.png", "image1.png") are both false!
bool beforeFileName(const char* left, const char* right);

/// Returns a copy of the string from which all the characters in whiteChars
/// at the beginning or at the end of the string have been removed.
/// @param text: some utf8 text string to trim
/// @param whiteChars: a series of 1-byte chars to remove
/// @return the trimmed string
std::string trim(const std::string& text, const char* whiteChars = " \t");

/// Helper method to parse a string containing a double value strictly.
/// Leading & trailing spaces are ignored, but anything else makes the parsing fail.
/// "nan", "inf" and out of range values are rejected.
/// @param str: the string that needs to be parsed.
/// @param outValue: the parsed value, or 0 on failure.
/// @return True if the string was parsed successfully and the string was a number only.
bool readDouble(const std::string& str, double& outValue);

/// Interpret a text as a boolean. "", "0", "false", "no", "off" and "none" (case insensitive)
/// are false, anything else is true. This conversion can't fail.
bool readBool(const std::string& str);

/// Helper method to make a string printable to expose control characters.
/// This conversion is meant to make string problems visible, rather than be a proper encoding,
/// for instance, you can't differentiate between "\n" and string that would contain a newline char.
std::string make_printable(const std::string& str);

} // namespace helpers
} // namespace eta
