#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace textseg {

enum class ContentType {
    Empty,
    UrlCollection,
    ContactInfo,
    Repository,
    FilePath,
    ChineseText,
    EnglishText,
    MixedText
};

// "empty", "url_collection", "contact_info", ...
const char* content_type_name(ContentType type);

struct ContentFeatures {
    bool has_url = false;       // http:// or https://
    bool has_email = false;
    bool has_path = false;      // drive letter or /home, /Users, /usr
    bool has_repo = false;      // owner/name
    size_t chinese_count = 0;   // U+4E00..U+9FA5
    size_t english_count = 0;   // ASCII letters
    size_t length = 0;          // code points
    double chinese_ratio = 0.0;
    double english_ratio = 0.0;
};

struct ContentDetection {
    ContentType type = ContentType::Empty;
    double confidence = 1.0;
    ContentFeatures features;
};

// Classifies text by the first matching feature: URL, e-mail, repository,
// path, then the dominant script.
ContentDetection detect_content_type(std::string_view text);

// Distinct addresses in order of first appearance
std::vector<std::string> extract_emails(std::string_view text);

// Mainland mobile and landline numbers with an optional +86 prefix
std::vector<std::string> extract_phone_numbers(std::string_view text);

} // namespace textseg
