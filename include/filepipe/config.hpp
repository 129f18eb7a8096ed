#pragma once

#include "filepipe/options.hpp"
#include "util/result.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace filepipe::config {

// Keys: offset, limit, raw, buf_size. Missing keys keep the current value.
Result ReadOptionsFromJson(const nlohmann::json& j, ReadOptions& opts);

// Keys: raw, buf_size, deflate_level, zip_offset, zip_comment. The result
// is range-checked with ValidateWriteOptions.
Result WriteOptionsFromJson(const nlohmann::json& j, WriteOptions& opts);

// Loads a file whose root object has optional "read" and "write" sections.
// Either output may be null to skip its section.
Result LoadOptionsFile(const std::string& path, ReadOptions* read, WriteOptions* write);

} // namespace filepipe::config
