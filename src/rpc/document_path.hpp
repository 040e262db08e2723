// SPDX-License-Identifier: Apache-2.0
// Document paths: "collection/doc[/collection/doc...]" relative to the database.
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace firetick::rpc {

// Non-empty segments, even count, no leading/trailing '/'.
bool valid_document_path(std::string_view path);

std::vector<std::string> split_path(std::string_view path);

// projects/<project>/databases/(default)
std::string database_name(std::string_view project_id);

// <database>/documents/<path>
std::string document_name(std::string_view database, std::string_view path);

} // namespace firetick::rpc
