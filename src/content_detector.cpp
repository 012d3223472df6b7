#include "content_detector.hpp"
#include "unicode.hpp"
#include <algorithm>
#include <regex>

namespace textseg {

namespace {

const std::regex& url_pattern() {
    static const std::regex re(R"(https?://)", std::regex::ECMAScript | std::regex::icase);
    return re;
}

const std::regex& email_pattern() {
    static const std::regex re(R"([a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\.[a-zA-Z]{2,})",
                               std::regex::ECMAScript | std::regex::icase);
    return re;
}

const std::regex& path_pattern() {
    static const std::regex re(R"([a-zA-Z]:[\\/]|/(?:home|Users|usr)[\\/])",
                               std::regex::ECMAScript | std::regex::icase);
    return re;
}

const std::regex& repo_pattern() {
    static const std::regex re(R"([\w-]+/[\w-]+)", std::regex::ECMAScript);
    return re;
}

const std::regex& phone_pattern() {
    static const std::regex re(R"((?:\+86[-\s]?)?(?:1[3-9]\d{9}|0\d{2,3}[-\s]?\d{7,8}))",
                               std::regex::ECMAScript);
    return re;
}

bool search(std::string_view text, const std::regex& re) {
    return std::regex_search(text.begin(), text.end(), re);
}

std::vector<std::string> distinct_matches(std::string_view text, const std::regex& re) {
    std::vector<std::string> out;
    using Iter = std::regex_iterator<std::string_view::const_iterator>;
    for (Iter it(text.begin(), text.end(), re), end; it != end; ++it) {
        std::string match = it->str();
        if (std::find(out.begin(), out.end(), match) == out.end()) {
            out.push_back(std::move(match));
        }
    }
    return out;
}

ContentFeatures collect_features(std::string_view text) {
    ContentFeatures f;
    f.has_url = search(text, url_pattern());
    f.has_email = search(text, email_pattern());
    f.has_path = search(text, path_pattern());
    f.has_repo = search(text, repo_pattern());

    size_t i = 0;
    while (i < text.size()) {
        auto [cp, len] = get_char_at(text, i);
        if (len == 0) {
            i++;
            continue;
        }
        f.length++;
        if (cp >= 0x4E00 && cp <= 0x9FA5) f.chinese_count++;
        else if (is_ascii_letter(cp)) f.english_count++;
        i += len;
    }
    if (f.length > 0) {
        f.chinese_ratio = static_cast<double>(f.chinese_count) / f.length;
        f.english_ratio = static_cast<double>(f.english_count) / f.length;
    }
    return f;
}

} // namespace

const char* content_type_name(ContentType type) {
    switch (type) {
        case ContentType::Empty: return "empty";
        case ContentType::UrlCollection: return "url_collection";
        case ContentType::ContactInfo: return "contact_info";
        case ContentType::Repository: return "repository";
        case ContentType::FilePath: return "file_path";
        case ContentType::ChineseText: return "chinese_text";
        case ContentType::EnglishText: return "english_text";
        case ContentType::MixedText: return "mixed_text";
    }
    return "mixed_text";
}

ContentDetection detect_content_type(std::string_view text) {
    ContentDetection out;
    if (is_blank(text)) {
        return out;
    }

    out.features = collect_features(text);
    const ContentFeatures& f = out.features;

    if (f.has_url && !f.has_email) {
        out.type = ContentType::UrlCollection;
        out.confidence = 0.9;
    } else if (f.has_email) {
        out.type = ContentType::ContactInfo;
        out.confidence = 0.9;
    } else if (f.has_repo) {
        out.type = ContentType::Repository;
        out.confidence = 0.85;
    } else if (f.has_path) {
        out.type = ContentType::FilePath;
        out.confidence = 0.8;
    } else if (f.chinese_ratio > 0.5) {
        out.type = ContentType::ChineseText;
        out.confidence = std::min(0.95, f.chinese_ratio + 0.3);
    } else if (f.english_ratio > 0.5) {
        out.type = ContentType::EnglishText;
        out.confidence = std::min(0.95, f.english_ratio + 0.3);
    } else {
        out.type = ContentType::MixedText;
        out.confidence = 0.5;
    }
    return out;
}

std::vector<std::string> extract_emails(std::string_view text) {
    return distinct_matches(text, email_pattern());
}

std::vector<std::string> extract_phone_numbers(std::string_view text) {
    return distinct_matches(text, phone_pattern());
}

} // namespace textseg
