#pragma once

#include <map>
#include <string>
#include <vector>

namespace vaultd::db::sql {

/*
  JSON text columns shared by both backends.

  Decoding is tolerant: rows written by other clients may hold null,
  empty strings or non-string scalars. Those decode to empty/stringified
  values instead of failing the read.
*/

std::string EncodeStringMap(const std::map<std::string, std::string>& values);
std::map<std::string, std::string> DecodeStringMap(const std::string& json);

std::string EncodeStringList(const std::vector<std::string>& values);
std::vector<std::string> DecodeStringList(const std::string& json);

} // namespace vaultd::db::sql
