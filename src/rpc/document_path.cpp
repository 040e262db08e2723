// SPDX-License-Identifier: Apache-2.0
#include "rpc/document_path.hpp"

namespace firetick::rpc {

std::vector<std::string> split_path(std::string_view path)
{
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= path.size()) {
        size_t slash = path.find('/', start);
        if (slash == std::string_view::npos)
            slash = path.size();
        out.emplace_back(path.substr(start, slash - start));
        start = slash + 1;
    }
    return out;
}

bool valid_document_path(std::string_view path)
{
    if (path.empty())
        return false;
    auto segs = split_path(path);
    if (segs.size() % 2 != 0)
        return false;
    for (const auto &s : segs) {
        if (s.empty() || s == "." || s == "..")
            return false;
    }
    return true;
}

std::string database_name(std::string_view project_id)
{
    std::string out = "projects/";
    out += project_id;
    out += "/databases/(default)";
    return out;
}

std::string document_name(std::string_view database, std::string_view path)
{
    std::string out(database);
    out += "/documents/";
    out += path;
    return out;
}

} // namespace firetick::rpc
