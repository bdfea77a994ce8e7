/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/

#include "ripple_llm/utils/yaml_reader.h"

#include "ripple_llm/utils/logger.h"
#include "ripple_llm/utils/string_utils.h"

namespace ripple_llm {

Status YamlReader::LoadFile(const std::string& yaml_file) {
  yaml_file_ = yaml_file;

  // yaml-cpp reports a missing file or a syntax error by exception.
  try {
    root_node_ = YAML::LoadFile(yaml_file);
  } catch (const YAML::BadFile& e) {
    return Status(RET_INVALID_ARGUMENT, fmt::format("Config file {} not exist.", yaml_file));
  } catch (const YAML::ParserException& e) {
    return Status(RET_INVALID_ARGUMENT, fmt::format("Config file {} parse error: {}", yaml_file, e.what()));
  }

  if (!root_node_.IsMap()) {
    return Status(RET_INVALID_ARGUMENT, fmt::format("Config file {} should be a map of settings.", yaml_file));
  }

  RLLM_LOG_DEBUG << "Config file " << yaml_file << " loaded.";
  return Status();
}

YAML::Node YamlReader::GetNode(const std::string& domain) const {
  YAML::Node node = root_node_;
  for (const std::string& key : Str2Vector(domain, ".")) {
    if (!node.IsMap()) {
      return YAML::Node(YAML::NodeType::Undefined);
    }

    const YAML::Node& parent = node;
    YAML::Node child = parent[key];
    if (!child) {
      return YAML::Node(YAML::NodeType::Undefined);
    }

    // Rebind instead of assign, assignment would overwrite the parent's content.
    node.reset(child);
  }
  return node;
}

}  // namespace ripple_llm
