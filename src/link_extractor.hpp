#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace textseg {

struct LinkMatch {
    std::string text;
    size_t offset;      // byte offset into the scanned text
};

// http://, https:// and ftp:// URLs in order of appearance
std::vector<LinkMatch> extract_urls(std::string_view text);

// Bare domains such as example.com that are not part of a literal URL.
// Common false positives ("version.info", "table.top") are skipped.
std::vector<LinkMatch> extract_suspect_links(std::string_view text);

// Scheme of the last http:// or https:// before `position`, else `fallback`
std::string infer_protocol(std::string_view text, size_t position, std::string_view fallback = "https://");

std::string complete_link(std::string_view link, std::string_view protocol);

struct RestructuredText {
    std::string text;
    std::vector<std::string> links;     // links[n] was replaced by {{LINK_n}}
};

// Replaces every occurrence of each distinct link, longest first
RestructuredText replace_links(std::string_view text, std::vector<std::string> links);

std::string link_placeholder(size_t index);
bool is_link_placeholder(std::string_view token);

} // namespace textseg
