/**
 * Unit tests for content type detection and contact extraction.
 */

#include "test_harness.hpp"
#include "content_detector.hpp"

using textseg::ContentType;

class ContentDetectorTest : public TestSuite {
public:
    ContentDetectorTest() : TestSuite("Content Detector Tests") {}

    void testEmpty() {
        runTest("Blank text is empty with full confidence", []() {
            auto a = textseg::detect_content_type("");
            auto b = textseg::detect_content_type(" \n\t");
            return a.type == ContentType::Empty && a.confidence == 1.0
                && b.type == ContentType::Empty
                && std::string(textseg::content_type_name(a.type)) == "empty";
        });
    }

    void testUrlCollection() {
        runTest("URLs without e-mail", []() {
            auto d = textseg::detect_content_type("see https://a.com and HTTP://b.org");
            return d.type == ContentType::UrlCollection && d.confidence == 0.9 && d.features.has_url
                && std::string(textseg::content_type_name(d.type)) == "url_collection";
        });
    }

    void testContactInfo() {
        runTest("E-mail wins over URL", []() {
            auto d = textseg::detect_content_type("mail a.b@x.org or visit https://x.org");
            return d.type == ContentType::ContactInfo && d.confidence == 0.9
                && d.features.has_email && d.features.has_url;
        });
    }

    void testRepository() {
        runTest("owner/name is a repository", []() {
            auto d = textseg::detect_content_type("clone torvalds/linux now");
            return d.type == ContentType::Repository && d.confidence == 0.85;
        });
    }

    void testFilePath() {
        runTest("Drive letter path", []() {
            auto d = textseg::detect_content_type("open C:\\temp\\log.txt");
            return d.type == ContentType::FilePath && d.confidence == 0.8
                && d.features.has_path && !d.features.has_repo;
        });
    }

    void testScriptRatios() {
        runTest("Dominant script decides plain text", []() {
            auto zh = textseg::detect_content_type("中文分词很好");
            auto en = textseg::detect_content_type("hello world");
            auto mixed = textseg::detect_content_type("中文 abc 123 !!");
            return zh.type == ContentType::ChineseText && zh.confidence == 0.95
                && zh.features.chinese_count == 6 && zh.features.length == 6
                && en.type == ContentType::EnglishText && en.confidence == 0.95
                && en.features.english_count == 10
                && mixed.type == ContentType::MixedText && mixed.confidence == 0.5
                && mixed.features.length == 13;
        });
    }

    void testExtractEmails() {
        runTest("Distinct e-mails in order", []() {
            return expectTokens(textseg::extract_emails("a@x.com, B@Y.org; a@x.com and bad@host"),
                                {"a@x.com", "B@Y.org"})
                && textseg::extract_emails("no addresses").empty();
        });
    }

    void testExtractPhoneNumbers() {
        runTest("Mobile and landline numbers", []() {
            return expectTokens(
                textseg::extract_phone_numbers(
                    "call 13812345678 or +86 13912345678 or 010-12345678, again 13812345678"),
                {"13812345678", "+86 13912345678", "010-12345678"})
                && textseg::extract_phone_numbers("12345").empty();
        });
    }

protected:
    void runAll() override {
        testEmpty();
        testUrlCollection();
        testContactInfo();
        testRepository();
        testFilePath();
        testScriptRatios();
        testExtractEmails();
        testExtractPhoneNumbers();
    }
};

int main() {
    return runSuite<ContentDetectorTest>();
}
