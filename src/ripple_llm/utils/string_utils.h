/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/
#pragma once

#include <sstream>
#include <string>
#include <vector>

namespace ripple_llm {

// Split string to a vector.
inline std::vector<std::string> Str2Vector(const std::string& str, const std::string& delimiters = " ") {
  std::vector<std::string> results;

  std::string::size_type last_pos = str.find_first_not_of(delimiters, 0);
  std::string::size_type pos = str.find_first_of(delimiters, last_pos);
  while (std::string::npos != pos || std::string::npos != last_pos) {
    results.push_back(str.substr(last_pos, pos - last_pos));
    last_pos = str.find_first_not_of(delimiters, pos);
    pos = str.find_first_of(delimiters, last_pos);
  }

  return results;
}

template <typename T>
inline std::string Vector2Str(const std::vector<T>& vec) {
  std::stringstream ss;
  ss << "(";
  if (!vec.empty()) {
    for (size_t i = 0; i < vec.size() - 1; ++i) {
      ss << vec[i] << ", ";
    }
    ss << vec.back();
  }
  ss << ")";
  return ss.str();
}

}  // namespace ripple_llm
