#pragma once

#include <string>

namespace blobup {

// Media type for a file extension (with or without the leading dot),
// case-insensitive. application/octet-stream when unknown.
std::string mime_type_for_extension(const std::string& extension);

// Media type for a file path, by its extension
std::string mime_type_for_path(const std::string& path);

// "type/subtype" with RFC 7230 token characters on both sides.
// Parameters (";charset=...") are accepted after the subtype.
bool is_valid_mime_type(const std::string& mime);

} // namespace blobup
