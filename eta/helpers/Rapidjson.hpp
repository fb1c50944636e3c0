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

#include <cstring>

#include <string>
#include <vector>

#include <eta/helpers/Serialization.h>

namespace eta {

using std::string;
using std::vector;

/// Output profile of the json documents generated by eta.
enum class JsonFormat {
  Compact, ///< Everything on a single line, no spaces.
  Pretty, ///< Indented, one member per line.
};

/// rapidjson::Document's default MemoryPoolAllocator crashes on some platforms
/// as documented in https://github.com/cocos2d/cocos2d-x/issues/16492
using JUtf8Encoding = eta_rapidjson::UTF8<>;
using JCrtAllocator = eta_rapidjson::CrtAllocator;
using JDocument = eta_rapidjson::GenericDocument<JUtf8Encoding, JCrtAllocator>;
using JValue = eta_rapidjson::GenericValue<JUtf8Encoding, JCrtAllocator>;
using JStringRef = eta_rapidjson::GenericStringRef<char>;

static inline JStringRef jStringRef(const char* str) {
  return JStringRef(str, strlen(str));
}
static inline JStringRef jStringRef(const string& str) {
  return JStringRef(str.c_str(), str.size());
}

/// Parse a json text into a document.
/// @return True if the text is valid json.
template <class T>
static inline bool jParse(JDocument& document, const T& str) {
  document.Parse(str.data(), str.size());
  return !document.HasParseError();
}

/// Describe the parse error of a document, for logging.
static inline string jParseErrorMessage(const JDocument& document) {
  return string(eta_rapidjson::GetParseError_En(document.GetParseError())) + " at offset " +
      std::to_string(document.GetErrorOffset());
}

/// Helper class to generate json messages using RapidJson.
/// For use by eta only.
/// @internal
struct JsonWrapper {
  explicit JsonWrapper(JDocument& doc) : value{doc}, alloc{doc.GetAllocator()} {
    doc.SetObject();
  }
  JsonWrapper(JValue& v, JDocument::AllocatorType& a) : value{v}, alloc{a} {}

  JValue& value;
  JDocument::AllocatorType& alloc;

  template <typename T>
  inline JValue jValue(const T& v) {
    return JValue(v);
  }

  template <typename T>
  inline JValue jValue(const std::vector<T>& vect) {
    JValue jv(eta_rapidjson::kArrayType);
    jv.Reserve(static_cast<eta_rapidjson::SizeType>(vect.size()), alloc);
    for (const auto& v : vect) {
      jv.PushBack(jValue(v), alloc);
    }
    return jv;
  }

  template <typename JSTR>
  inline void addMember(const JSTR& name, JValue& v) {
    value.AddMember(jStringRef(name), v, alloc);
  }

  template <typename JSTR>
  inline void addMember(const JSTR& name, const char* str) {
    value.AddMember(jStringRef(name), jStringRef(str), alloc);
  }

  template <typename JSTR, typename T>
  inline void addMember(const JSTR& name, const T& v) {
    value.AddMember(jStringRef(name), jValue(v), alloc);
  }
};

template <>
inline JValue JsonWrapper::jValue<string>(const string& str) {
  JValue jstring;
  jstring.SetString(str.c_str(), static_cast<eta_rapidjson::SizeType>(str.length()), alloc);
  return jstring;
}

template <typename T, typename JSTR>
inline void serializeVector(const vector<T>& vect, JsonWrapper& rj, const JSTR& name) {
  using namespace eta_rapidjson;
  JValue arrayValues(kArrayType);
  arrayValues.Reserve(static_cast<SizeType>(vect.size()), rj.alloc);
  for (const auto& element : vect) {
    arrayValues.PushBack(rj.jValue(element), rj.alloc);
  }
  rj.addMember(name, arrayValues);
}

template <typename JSTR>
inline const JValue* findJMember(const JValue& piece, const JSTR& name) {
  if (!piece.IsObject()) {
    return nullptr;
  }
  const JValue::ConstMemberIterator member = piece.FindMember(name);
  return member != piece.MemberEnd() ? &member->value : nullptr;
}

template <typename JSTR>
inline bool getJString(string& outString, const JValue& piece, const JSTR& name) {
  const JValue* member = findJMember(piece, name);
  if (member != nullptr && member->IsString()) {
    outString.assign(member->GetString(), member->GetStringLength());
    return true;
  }
  outString.clear();
  return false;
}

template <typename JSTR>
inline bool getJBool(bool& outBool, const JValue& piece, const JSTR& name) {
  const JValue* member = findJMember(piece, name);
  if (member != nullptr && member->IsBool()) {
    outBool = member->GetBool();
    return true;
  }
  outBool = false;
  return false;
}

template <typename JSTR>
inline bool getJStringVector(vector<string>& outVector, const JValue& piece, const JSTR& name) {
  outVector.clear();
  const JValue* member = findJMember(piece, name);
  if (member != nullptr && member->IsArray()) {
    outVector.reserve(member->Size());
    for (JValue::ConstValueIterator itr = member->Begin(); itr != member->End(); ++itr) {
      if (!itr->IsString()) {
        outVector.clear();
        return false;
      }
      outVector.emplace_back(itr->GetString(), itr->GetStringLength());
    }
    return true;
  }
  return false;
}

template <class T>
inline string jToJsonString(const T& value) {
  using namespace eta_rapidjson;
  StringBuffer buffer;
  using JWriter = eta_rapidjson::
      Writer<StringBuffer, JUtf8Encoding, JUtf8Encoding, JCrtAllocator, kWriteNanAndInfFlag>;
  JWriter writer(buffer);
  value.Accept(writer);
  return buffer.GetString();
}

template <class T>
inline string jToJsonStringPretty(const T& value) {
  using namespace eta_rapidjson;
  StringBuffer buffer;
  using JPrettyWriter = eta_rapidjson::
      PrettyWriter<StringBuffer, JUtf8Encoding, JUtf8Encoding, JCrtAllocator, kWriteNanAndInfFlag>;
  JPrettyWriter prettyWriter(buffer);
  prettyWriter.SetIndent(' ', 2);
  value.Accept(prettyWriter);
  return buffer.GetString();
}

inline string jDocumentToJsonString(const JDocument& document, JsonFormat format) {
  return format == JsonFormat::Pretty ? jToJsonStringPretty(document) : jToJsonString(document);
}

} // namespace eta
