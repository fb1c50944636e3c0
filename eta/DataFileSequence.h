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

#include <iterator>
#include <string>

#include <eta/helpers/Rapidjson.hpp>

namespace eta {

using std::string;

/// \brief A sequence of numbered data files on disk, such as "/path/to/video/frame-%05d.png".
///
/// The pattern holds exactly one printf-style integer placeholder: "%d", "%5d" or "%05d".
/// "%%" stands for a literal percent sign. The placeholder must be in the file name part of the
/// pattern.
///
/// When opened, the sequence's folder is scanned, and the lower & upper bounds are set to the
/// smallest & largest index of the matching files. Files with indices in between need not exist.
///
/// With immutable bounds (the default), only indices within the bounds are valid.
/// With mutable bounds, genPath() may extend the sequence by one index below or above the
/// current bounds, so that the sequence never has gaps.
class DataFileSequence {
 public:
  /// Lazy, restartable cursor over the paths of a sequence, from lower to upper bound inclusive.
  /// The cursor is independent from the sequence: the sequence holds no iteration state.
  class Iterator {
   public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = string;
    using difference_type = int64_t;
    using pointer = const string*;
    using reference = string;

    Iterator(const DataFileSequence& sequence, int64_t index)
        : sequence_{&sequence}, index_{index} {}

    string operator*() const;
    int64_t getIndex() const {
      return index_;
    }
    Iterator& operator++() {
      ++index_;
      return *this;
    }
    Iterator operator++(int) {
      Iterator previous(*this);
      ++index_;
      return previous;
    }
    bool operator==(const Iterator& rhs) const {
      return sequence_ == rhs.sequence_ && index_ == rhs.index_;
    }
    bool operator!=(const Iterator& rhs) const {
      return !operator==(rhs);
    }

   private:
    const DataFileSequence* sequence_;
    int64_t index_;
  };

  DataFileSequence() = default;

  /// Open a sequence, by scanning the folder of the pattern for matching files.
  /// @param sequence: the pattern, such as "/path/to/frame-%05d.png".
  /// @param immutableBounds: true if the bounds may not change after opening.
  /// @return 0 on success, INVALID_SEQUENCE_PATTERN if the pattern doesn't have exactly one
  /// integer placeholder in its file name part, PATTERN_MISMATCH if no file matches.
  /// On failure, the sequence is unchanged.
  int open(const string& sequence, bool immutableBounds = true);

  /// Open a sequence by inferring the pattern from the numbered files in a folder.
  /// When several naming schemes coexist, the one with the most files wins.
  /// The placeholder is "%0Nd" if all the numbers have N digits, "%d" otherwise.
  /// @return 0 on success, PATTERN_MISMATCH if the folder holds no numbered file.
  static int
  buildForDir(const string& dir, DataFileSequence& outSequence, bool immutableBounds = true);

  bool isOpened() const {
    return opened_;
  }
  const string& getSequence() const {
    return sequence_;
  }
  bool hasImmutableBounds() const {
    return immutableBounds_;
  }
  /// Extension of the pattern, including the dot, such as ".png". May be empty.
  const string& getExtension() const {
    return extension_;
  }
  int64_t getLowerBound() const {
    return lower_;
  }
  int64_t getUpperBound() const {
    return upper_;
  }
  /// Number of indices in the bounds.
  size_t size() const {
    return opened_ ? static_cast<size_t>(upper_ - lower_ + 1) : 0;
  }

  /// Change the lower bound, clamped to the upper bound.
  /// @return 0 on success, IMMUTABLE_BOUNDS for immutable sequences.
  int setLowerBound(int64_t lower);
  /// Change the upper bound, clamped to the lower bound.
  /// @return 0 on success, IMMUTABLE_BOUNDS for immutable sequences.
  int setUpperBound(int64_t upper);

  bool startsAtZero() const {
    return opened_ && lower_ == 0;
  }
  bool startsAtOne() const {
    return opened_ && lower_ == 1;
  }

  /// Tell if an index is within the current bounds.
  bool checkBounds(int64_t index) const {
    return opened_ && index >= lower_ && index <= upper_;
  }

  /// Generate the path of a file of the sequence.
  /// For mutable sequences, an index just below or just above the bounds extends the bounds.
  /// @param index: a sequence index.
  /// @param outPath: on success, the file's path.
  /// @return 0 on success, INDEX_OUT_OF_BOUNDS if the index is out of bounds (and can't extend
  /// them), INVALID_INDEX if the index is negative for a mutable sequence, INVALID_REQUEST if the
  /// sequence isn't opened.
  int genPath(int64_t index, string& outPath);

  /// Format the path for an index, with no bounds check.
  string formatPath(int64_t index) const;

  Iterator begin() const {
    return Iterator(*this, opened_ ? lower_ : 0);
  }
  Iterator end() const {
    return Iterator(*this, opened_ ? upper_ + 1 : 0);
  }

  /// Json form: {"sequence": "...", "immutable_bounds": bool}
  void serialize(JsonWrapper& rj) const;
  string toJson(JsonFormat format = JsonFormat::Compact) const;
  /// Rebuild a sequence from its json form. The file system is scanned again.
  static int fromJValue(const JValue& jsequence, DataFileSequence& outSequence);
  static int fromJson(const string& json, DataFileSequence& outSequence);

 private:
  string sequence_;
  bool immutableBounds_{true};
  bool opened_{false};
  string extension_;
  int64_t lower_{0};
  int64_t upper_{0};

  // Parsed pattern: prefix + number + suffix
  string prefix_;
  string suffix_;
  int width_{0};
  bool zeroPad_{false};
};

} // namespace eta
