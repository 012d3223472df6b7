#include "link_extractor.hpp"
#include "unicode.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <initializer_list>

namespace textseg {

namespace {

constexpr std::array<std::string_view, 3> kSchemes{"https://", "http://", "ftp://"};

constexpr std::array<std::string_view, 16> kDomainSuffixes{
    "com", "org", "net", "cn", "io", "cc", "co", "gov",
    "edu", "app", "dev", "info", "xyz", "top", "online", "site"};

constexpr std::array<std::string_view, 16> kExcludedLabels{
    "version", "release", "chapter", "section", "figure", "table",
    "algorithm", "function", "method", "class", "object", "property",
    "copyright", "trademark", "trademarked", "registered"};

char ascii_lower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool starts_with_nocase(std::string_view text, size_t pos, std::string_view prefix) {
    if (pos + prefix.size() > text.size()) return false;
    for (size_t k = 0; k < prefix.size(); ++k) {
        if (ascii_lower(text[pos + k]) != prefix[k]) return false;
    }
    return true;
}

bool is_word_byte(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return u < 0x80 && is_word_char(u);
}

bool is_label_byte(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return (u < 0x80 && std::isalnum(u)) || c == '-';
}

bool is_url_terminator(char32_t c) {
    switch (c) {
        case '<': case '>': case '"': case '{': case '}':
        case '|': case '\\': case '^': case '`': case '[': case ']':
            return true;
        default:
            return is_whitespace(c);
    }
}

// Length of the URL starting at `pos`, 0 if none
size_t match_url(std::string_view text, size_t pos) {
    for (std::string_view scheme : kSchemes) {
        if (!starts_with_nocase(text, pos, scheme)) continue;

        size_t end = pos + scheme.size();
        while (end < text.size()) {
            auto [cp, len] = get_char_at(text, end);
            if (len == 0 || is_url_terminator(cp)) break;
            end += len;
        }
        // Host must be non-empty
        size_t host = pos + scheme.size();
        if (host < end && text[host] != '/' && text[host] != '?' && text[host] != '#') {
            return end - pos;
        }
        return 0;
    }
    return 0;
}

// Length of a suffix from kDomainSuffixes at `pos` followed by a word boundary
size_t match_suffix(std::string_view text, size_t pos) {
    for (std::string_view suffix : kDomainSuffixes) {
        if (!starts_with_nocase(text, pos, suffix)) continue;
        size_t end = pos + suffix.size();
        if (end == text.size() || !is_word_byte(text[end])) return suffix.size();
    }
    return 0;
}

// Length of the domain starting at `pos`, 0 if none. The last label that is
// a known suffix wins, so "example.com.au" yields "example.com".
size_t match_domain(std::string_view text, size_t pos) {
    size_t best = 0;
    size_t i = pos;
    size_t labels = 0;
    while (i < text.size() && std::isalnum(static_cast<unsigned char>(text[i]))) {
        size_t end = i;
        while (end < text.size() && is_label_byte(text[end])) end++;

        if (labels > 0) {
            size_t suffix = match_suffix(text, i);
            if (suffix > 0) best = i + suffix - pos;
        }
        if (end >= text.size() || text[end] != '.') break;
        labels++;
        i = end + 1;
    }
    return best;
}

bool is_excluded(std::string_view domain) {
    std::string first(domain.substr(0, domain.find('.')));
    std::transform(first.begin(), first.end(), first.begin(), ascii_lower);
    return std::find(kExcludedLabels.begin(), kExcludedLabels.end(), first) != kExcludedLabels.end();
}

} // namespace

std::vector<LinkMatch> extract_urls(std::string_view text) {
    std::vector<LinkMatch> urls;
    size_t i = 0;
    while (i < text.size()) {
        size_t len = match_url(text, i);
        if (len > 0) {
            urls.push_back({std::string(text.substr(i, len)), i});
            i += len;
        } else {
            i++;
        }
    }
    return urls;
}

std::vector<LinkMatch> extract_suspect_links(std::string_view text) {
    std::vector<LinkMatch> links;
    auto urls = extract_urls(text);
    size_t next_url = 0;

    size_t i = 0;
    while (i < text.size()) {
        // Skip over literal URLs
        if (next_url < urls.size() && i >= urls[next_url].offset) {
            i = std::max(i, urls[next_url].offset + urls[next_url].text.size());
            next_url++;
            continue;
        }

        bool at_boundary = i == 0 || !is_word_byte(text[i - 1]);
        size_t len = at_boundary ? match_domain(text, i) : 0;
        if (len == 0) {
            i++;
            continue;
        }

        size_t limit = next_url < urls.size() ? urls[next_url].offset : text.size();
        if (i + len <= limit) {
            std::string_view domain = text.substr(i, len);
            if (!is_excluded(domain)) {
                links.push_back({std::string(domain), i});
            }
        }
        i += len;
    }
    return links;
}

std::string infer_protocol(std::string_view text, size_t position, std::string_view fallback) {
    position = std::min(position, text.size());
    for (size_t i = position; i > 0; --i) {
        size_t start = i - 1;
        for (std::string_view scheme : {std::string_view("https://"), std::string_view("http://")}) {
            if (start + scheme.size() <= position && starts_with_nocase(text, start, scheme)) {
                return std::string(text.substr(start, scheme.size()));
            }
        }
    }
    return std::string(fallback);
}

std::string complete_link(std::string_view link, std::string_view protocol) {
    if (starts_with_nocase(link, 0, "http://") || starts_with_nocase(link, 0, "https://")) {
        return std::string(link);
    }
    std::string out(protocol);
    out.append(link);
    return out;
}

std::string link_placeholder(size_t index) {
    return "{{LINK_" + std::to_string(index) + "}}";
}

bool is_link_placeholder(std::string_view token) {
    return token.compare(0, 7, "{{LINK_") == 0;
}

RestructuredText replace_links(std::string_view text, std::vector<std::string> links) {
    // Distinct, longest first so a shorter link never splits a longer one
    std::stable_sort(links.begin(), links.end(),
                     [](const std::string& a, const std::string& b) { return a.size() > b.size(); });
    std::vector<std::string> distinct;
    for (auto& link : links) {
        if (link.empty()) continue;
        if (std::find(distinct.begin(), distinct.end(), link) == distinct.end()) {
            distinct.push_back(std::move(link));
        }
    }

    RestructuredText result;
    result.text = std::string(text);
    for (size_t n = 0; n < distinct.size(); ++n) {
        const std::string& link = distinct[n];
        std::string placeholder = link_placeholder(n);
        std::string replaced;
        size_t pos = 0;
        while (true) {
            size_t hit = result.text.find(link, pos);
            if (hit == std::string::npos) break;
            replaced.append(result.text, pos, hit - pos);
            replaced += placeholder;
            pos = hit + link.size();
        }
        replaced.append(result.text, pos, std::string::npos);
        result.text = std::move(replaced);
    }
    result.links = std::move(distinct);
    return result;
}

} // namespace textseg
