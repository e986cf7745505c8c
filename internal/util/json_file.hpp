#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

namespace mc3d::util {

/*
  JSON file helpers on top of google::protobuf::Value.

  Parsing goes through protobuf's JSON parser. Output is produced with
  object keys sorted so files diff cleanly between curation cycles.
*/

google::protobuf::Value ParseJson(const std::string& json);

// Throws NotFound if the file is missing, FormatError if it is not JSON.
google::protobuf::Value ReadJsonFile(const std::filesystem::path& path);

// indent = 0 writes a single line.
std::string ToJson(const google::protobuf::Value& value, int indent = 0);

/*
  Atomic write:
      write tmp → flush → rename

  A reader never observes a partially written file.
*/
void WriteJsonFileAtomic(const std::filesystem::path& path, const google::protobuf::Value& value, int indent = 0);

google::protobuf::Value StringValue(const std::string& s);
google::protobuf::Value StringListValue(const std::vector<std::string>& items);

// Throws FormatError unless every element is a string.
std::vector<std::string> ToStringList(const google::protobuf::Value& value, const std::string& what);

} // namespace mc3d::util
