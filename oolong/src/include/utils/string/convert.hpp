//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#pragma once

#include <string>
#include <string_view>

namespace conv {
// Replace byte sequences that are not valid UTF-8, the catalog only stores UTF-8 text
auto ToValidUtf8(std::string_view bytes) -> std::string;

// Reversible form of a filesystem name for use as a catalog key. Bytes that are not
// part of valid UTF-8 become "%XX" and a literal '%' becomes "%25".
auto EscapeInvalidUtf8(std::string_view bytes) -> std::string;

// "%20" -> ' '. Malformed sequences are kept verbatim.
auto UrlUnquote(std::string_view value) -> std::string;

// "\x20" -> ' '. Malformed sequences are kept verbatim.
auto UnescapeHex(std::string_view value) -> std::string;

auto Trim(std::string_view value) -> std::string;
auto ToLower(std::string_view value) -> std::string;
};  // namespace conv
