/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/
#pragma once

#include <string>
#include <vector>

#include "fmt/core.h"
#include "yaml-cpp/yaml.h"

#include "ripple_llm/utils/ret_code.h"
#include "ripple_llm/utils/status.h"

namespace ripple_llm {

// Read values of a YAML config by dotted domain, such as "setting.cache_manager.block_num".
// A missing key leaves the output untouched, so the caller's default stays in place.
class YamlReader {
 public:
  // Load yaml file from disk, the top level must be a map.
  Status LoadFile(const std::string& yaml_file);

  template <typename T>
  Status GetScalar(const std::string& domain, T& value) const {
    YAML::Node node = GetNode(domain);
    if (!node) {
      return Status();
    }

    if (!node.IsScalar()) {
      return Status(RET_INVALID_ARGUMENT, fmt::format("Config {} of {} should be a scalar.", domain, yaml_file_));
    }

    try {
      value = node.as<T>();
    } catch (const YAML::BadConversion& e) {
      return Status(RET_INVALID_ARGUMENT,
                    fmt::format("Config {} of {} has invalid value '{}'.", domain, yaml_file_, node.Scalar()));
    }
    return Status();
  }

  // A single scalar is accepted as a list of one element.
  template <typename T>
  Status GetScalarList(const std::string& domain, std::vector<T>& values) const {
    YAML::Node node = GetNode(domain);
    if (!node || node.IsNull()) {
      return Status();
    }

    std::vector<T> results;
    try {
      if (node.IsScalar()) {
        results.push_back(node.as<T>());
      } else if (node.IsSequence()) {
        for (const auto& item : node) {
          results.push_back(item.as<T>());
        }
      } else {
        return Status(RET_INVALID_ARGUMENT, fmt::format("Config {} of {} should be a list.", domain, yaml_file_));
      }
    } catch (const YAML::BadConversion& e) {
      return Status(RET_INVALID_ARGUMENT, fmt::format("Config {} of {} has invalid list item.", domain, yaml_file_));
    }

    values.swap(results);
    return Status();
  }

 private:
  // Return an invalid node if any part of the domain is missing.
  YAML::Node GetNode(const std::string& domain) const;

 private:
  std::string yaml_file_;

  YAML::Node root_node_;
};

}  // namespace ripple_llm
