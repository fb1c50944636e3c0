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

#include <eta/DataFileSequence.h>

#include <cctype>

#include <map>
#include <tuple>
#include <vector>

#include <fmt/format.h>

#define DEFAULT_LOG_CHANNEL "DataFileSequence"
#include <logging/Log.h>

#include <eta/ErrorCode.h>
#include <eta/helpers/FileMacros.h>
#include <eta/helpers/Strings.h>
#include <eta/os/FileList.h>
#include <eta/os/Utils.h>

using namespace std;

namespace {

// Beyond that, indices might not fit in an int64_t
const size_t kMaxIndexDigits = 18;

struct SequencePattern {
  string prefix;
  string suffix;
  int width{0};
  bool zeroPad{false};

  string formatIndex(int64_t index) const {
    if (width <= 0) {
      return fmt::format("{}", index);
    }
    return zeroPad ? fmt::format("{:0{}d}", index, width) : fmt::format("{:>{}d}", index, width);
  }
};

int parsePattern(const string& sequence, SequencePattern& outPattern) {
  SequencePattern pattern;
  bool found = false;
  size_t pos = 0;
  while (pos < sequence.size()) {
    char c = sequence[pos++];
    if (c != '%') {
      (found ? pattern.suffix : pattern.prefix).push_back(c);
      continue;
    }
    if (pos < sequence.size() && sequence[pos] == '%') {
      (found ? pattern.suffix : pattern.prefix).push_back('%');
      ++pos;
      continue;
    }
    if (found) {
      ETA_LOGW("Sequence '{}' has more than one placeholder", sequence);
      return eta::INVALID_SEQUENCE_PATTERN;
    }
    if (pos < sequence.size() && sequence[pos] == '0') {
      pattern.zeroPad = true;
      ++pos;
    }
    size_t widthStart = pos;
    while (pos < sequence.size() && isdigit(static_cast<unsigned char>(sequence[pos]))) {
      ++pos;
    }
    if (pos - widthStart > 2) {
      ETA_LOGW("Sequence '{}' has an unreasonable placeholder width", sequence);
      return eta::INVALID_SEQUENCE_PATTERN;
    }
    if (pos > widthStart) {
      pattern.width = stoi(sequence.substr(widthStart, pos - widthStart));
    }
    if (pos >= sequence.size() || sequence[pos] != 'd') {
      ETA_LOGW("Sequence '{}' has an invalid placeholder", sequence);
      return eta::INVALID_SEQUENCE_PATTERN;
    }
    ++pos;
    found = true;
  }
  if (!found) {
    ETA_LOGW("Sequence '{}' has no integer placeholder", sequence);
    return eta::INVALID_SEQUENCE_PATTERN;
  }
  if (pattern.suffix.find_first_of("/\\") != string::npos) {
    ETA_LOGW("Sequence '{}' has its placeholder in a folder name", sequence);
    return eta::INVALID_SEQUENCE_PATTERN;
  }
  outPattern = pattern;
  return eta::SUCCESS;
}

// Split "path/to/frame-" into "path/to" & "frame-"
void splitPrefix(const string& prefix, string& outFolder, string& outFilePrefix) {
  size_t slash = prefix.find_last_of("/\\");
  if (slash == string::npos) {
    outFolder = ".";
    outFilePrefix = prefix;
  } else {
    outFolder = slash == 0 ? prefix.substr(0, 1) : prefix.substr(0, slash);
    outFilePrefix = prefix.substr(slash + 1);
  }
}

bool matchIndex(
    const string& name,
    const string& filePrefix,
    const SequencePattern& pattern,
    int64_t& outIndex) {
  if (name.size() <= filePrefix.size() + pattern.suffix.size() ||
      name.compare(0, filePrefix.size(), filePrefix) != 0 ||
      name.compare(name.size() - pattern.suffix.size(), string::npos, pattern.suffix) != 0) {
    return false;
  }
  string number =
      name.substr(filePrefix.size(), name.size() - filePrefix.size() - pattern.suffix.size());
  size_t firstDigit = number.find_first_not_of(' ');
  if (firstDigit == string::npos || number.size() - firstDigit > kMaxIndexDigits) {
    return false;
  }
  for (size_t k = firstDigit; k < number.size(); ++k) {
    if (!isdigit(static_cast<unsigned char>(number[k]))) {
      return false;
    }
  }
  int64_t index = stoll(number.substr(firstDigit));
  // only accept the exact text the pattern would generate
  if (pattern.formatIndex(index) != number) {
    return false;
  }
  outIndex = index;
  return true;
}

string escapePercents(const string& text) {
  string escaped;
  escaped.reserve(text.size());
  for (char c : text) {
    if (c == '%') {
      escaped.push_back('%');
    }
    escaped.push_back(c);
  }
  return escaped;
}

} // namespace

namespace eta {

string DataFileSequence::Iterator::operator*() const {
  return sequence_->formatPath(index_);
}

int DataFileSequence::open(const string& sequence, bool immutableBounds) {
  SequencePattern pattern;
  IF_ERROR_RETURN(parsePattern(sequence, pattern));
  string folder, filePrefix;
  splitPrefix(pattern.prefix, folder, filePrefix);
  vector<string> names;
  if (os::isDir(folder)) {
    IF_ERROR_LOG_AND_RETURN(os::getFileNames(folder, names));
  }
  bool found = false;
  int64_t lower = 0;
  int64_t upper = 0;
  for (const string& name : names) {
    int64_t index = 0;
    if (matchIndex(name, filePrefix, pattern, index)) {
      if (!found) {
        lower = upper = index;
        found = true;
      } else {
        lower = min(lower, index);
        upper = max(upper, index);
      }
    }
  }
  if (!found) {
    ETA_LOGW("Sequence '{}' did not match any files on disk", sequence);
    return PATTERN_MISMATCH;
  }
  sequence_ = sequence;
  immutableBounds_ = immutableBounds;
  opened_ = true;
  extension_ = os::getExtension(sequence);
  lower_ = lower;
  upper_ = upper;
  prefix_ = pattern.prefix;
  suffix_ = pattern.suffix;
  width_ = pattern.width;
  zeroPad_ = pattern.zeroPad;
  ETA_LOGD("Opened sequence '{}' with bounds [{}, {}]", sequence, lower, upper);
  return SUCCESS;
}

int DataFileSequence::buildForDir(
    const string& dir,
    DataFileSequence& outSequence,
    bool immutableBounds) {
  vector<string> names;
  IF_ERROR_LOG_AND_RETURN(os::getFileNames(dir, names));
  // Candidate patterns, as (prefix, suffix, width) -> number of files matching.
  // Width 0 means "%d", which matches the numbers without leading zeros.
  map<tuple<string, string, size_t>, size_t> candidates;
  for (const string& name : names) {
    size_t end = name.find_last_of("0123456789");
    if (end == string::npos) {
      continue;
    }
    size_t start = end;
    while (start > 0 && isdigit(static_cast<unsigned char>(name[start - 1]))) {
      --start;
    }
    size_t length = end + 1 - start;
    if (length > kMaxIndexDigits) {
      continue;
    }
    string prefix = name.substr(0, start);
    string suffix = name.substr(end + 1);
    if (length > 1) {
      candidates[make_tuple(prefix, suffix, length)]++;
    }
    if (length == 1 || name[start] != '0') {
      candidates[make_tuple(prefix, suffix, 0)]++;
    }
  }
  const tuple<string, string, size_t>* best = nullptr;
  size_t bestCount = 0;
  for (const auto& candidate : candidates) {
    // on ties, prefer fixed width patterns
    size_t width = get<2>(candidate.first);
    if (candidate.second > bestCount ||
        (best != nullptr && candidate.second == bestCount && width > get<2>(*best))) {
      best = &candidate.first;
      bestCount = candidate.second;
    }
  }
  if (best == nullptr) {
    ETA_LOGW("No numbered file in '{}'", dir);
    return PATTERN_MISMATCH;
  }
  size_t width = get<2>(*best);
  string placeholder = width > 0 ? fmt::format("%0{}d", width) : "%d";
  string fileName = escapePercents(get<0>(*best)) + placeholder + escapePercents(get<1>(*best));
  return outSequence.open(os::pathJoin(dir, fileName), immutableBounds);
}

int DataFileSequence::setLowerBound(int64_t lower) {
  if (!opened_) {
    return INVALID_REQUEST;
  }
  if (immutableBounds_) {
    ETA_LOGW("Cannot set bounds of immutable sequence '{}'", sequence_);
    return IMMUTABLE_BOUNDS;
  }
  lower_ = min(lower, upper_);
  return SUCCESS;
}

int DataFileSequence::setUpperBound(int64_t upper) {
  if (!opened_) {
    return INVALID_REQUEST;
  }
  if (immutableBounds_) {
    ETA_LOGW("Cannot set bounds of immutable sequence '{}'", sequence_);
    return IMMUTABLE_BOUNDS;
  }
  upper_ = max(upper, lower_);
  return SUCCESS;
}

int DataFileSequence::genPath(int64_t index, string& outPath) {
  if (!opened_) {
    return INVALID_REQUEST;
  }
  if (immutableBounds_) {
    if (!checkBounds(index)) {
      ETA_LOGW("Index {} out of bounds [{}, {}]", index, lower_, upper_);
      return INDEX_OUT_OF_BOUNDS;
    }
  } else if (index < 0) {
    ETA_LOGW("Sequence indices must be nonnegative, not {}", index);
    return INVALID_INDEX;
  } else if (index == lower_ - 1) {
    lower_ = index;
  } else if (index == upper_ + 1) {
    upper_ = index;
  } else if (!checkBounds(index)) {
    ETA_LOGW(
        "Index {} out of bounds [{}, {}]; mutable sequences can be extended by one index only",
        index,
        lower_,
        upper_);
    return INDEX_OUT_OF_BOUNDS;
  }
  outPath = formatPath(index);
  return SUCCESS;
}

string DataFileSequence::formatPath(int64_t index) const {
  SequencePattern pattern;
  pattern.width = width_;
  pattern.zeroPad = zeroPad_;
  return prefix_ + pattern.formatIndex(index) + suffix_;
}

void DataFileSequence::serialize(JsonWrapper& rj) const {
  rj.addMember("sequence", sequence_);
  rj.addMember("immutable_bounds", immutableBounds_);
}

string DataFileSequence::toJson(JsonFormat format) const {
  JDocument doc;
  JsonWrapper rj{doc};
  serialize(rj);
  return jDocumentToJsonString(doc, format);
}

int DataFileSequence::fromJValue(const JValue& jsequence, DataFileSequence& outSequence) {
  string sequence;
  if (!getJString(sequence, jsequence, "sequence")) {
    ETA_LOGW("Data file sequence has no 'sequence' member");
    return INVALID_JSON;
  }
  bool immutableBounds = true;
  if (findJMember(jsequence, "immutable_bounds") != nullptr &&
      !getJBool(immutableBounds, jsequence, "immutable_bounds")) {
    ETA_LOGW("Invalid 'immutable_bounds' value for sequence '{}'", sequence);
    return INVALID_JSON;
  }
  return outSequence.open(sequence, immutableBounds);
}

int DataFileSequence::fromJson(const string& json, DataFileSequence& outSequence) {
  JDocument doc;
  if (!jParse(doc, json) || !doc.IsObject()) {
    ETA_LOGW("Invalid data file sequence json: {}", helpers::make_printable(json));
    return INVALID_JSON;
  }
  return fromJValue(doc, outSequence);
}

} // namespace eta
