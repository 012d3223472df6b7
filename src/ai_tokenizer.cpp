#include "ai_tokenizer.hpp"
#include "basic_modes.hpp"
#include "link_extractor.hpp"
#include "unicode.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <future>
#include <iostream>
#include <thread>

using json = nlohmann::json;

namespace textseg {

const char* const AiTokenizer::STRICT_TOKENIZER_PROMPT =
    "You are a strict tokenizer. Split the input text into tokens.\n"
    "\n"
    "Rules:\n"
    "1. Every Chinese character is its own token.\n"
    "2. Consecutive English letters form one word token.\n"
    "3. Consecutive digits form one token.\n"
    "4. Every punctuation mark is its own token.\n"
    "5. Remove all whitespace; it never forms a token.\n"
    "6. Keep the original order and never change any character.\n"
    "7. Placeholders of the form {{LINK_n}} are single tokens.\n"
    "\n"
    "Output: a JSON array of strings and nothing else, for example\n"
    "[\"中\", \"文\", \"English\", \"123\", \"，\", \".\"]\n"
    "\n"
    "Never add explanations, numbering or markdown code fences.\n"
    "\n"
    "Example input: Hello世界123！\n"
    "Example output: [\"Hello\", \"世\", \"界\", \"123\", \"！\"]";

AiTokenizer::AiTokenizer(std::shared_ptr<CompletionClient> client)
    : client_(std::move(client))
{
}

std::vector<std::string> AiTokenizer::parse_token_array(std::string_view response) {
    std::string body = trim_utf8(response);

    // ```json ... ``` fence
    if (body.compare(0, 3, "```") == 0) {
        size_t first_newline = body.find('\n');
        size_t closing = body.rfind("```");
        if (first_newline == std::string::npos || closing <= first_newline) {
            throw AiTokenizerError("unterminated code fence in completion response");
        }
        body = trim_utf8(std::string_view(body).substr(first_newline + 1, closing - first_newline - 1));
    }

    json doc;
    try {
        doc = json::parse(body);
    } catch (const json::parse_error& e) {
        throw AiTokenizerError(std::string("completion response is not JSON: ") + e.what());
    }

    if (!doc.is_array()) {
        throw AiTokenizerError("completion response is not a JSON array");
    }

    std::vector<std::string> tokens;
    tokens.reserve(doc.size());
    for (const auto& item : doc) {
        if (!item.is_string()) {
            throw AiTokenizerError("completion response contains a non-string token");
        }
        tokens.push_back(item.get<std::string>());
    }
    return tokens;
}

std::string AiTokenizer::call_with_timeout(const CompletionRequest& request, std::chrono::milliseconds timeout) const {
    auto cancelled = std::make_shared<std::atomic<bool>>(false);
    auto promise = std::make_shared<std::promise<std::string>>();
    std::future<std::string> result = promise->get_future();

    // The worker owns everything it touches, so it may outlive this call
    std::shared_ptr<CompletionClient> client = client_;
    std::thread([client, request, cancelled, promise]() {
        try {
            promise->set_value(client->complete(request, *cancelled));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    if (result.wait_for(timeout) != std::future_status::ready) {
        cancelled->store(true);
        throw AiTokenizerError("completion timed out after " + std::to_string(timeout.count()) + " ms");
    }

    try {
        return result.get();
    } catch (const std::exception& e) {
        throw AiTokenizerError(std::string("completion failed: ") + e.what());
    }
}

AiPipelineResult AiTokenizer::run(std::string_view text, const SegmentOptions& options) const {
    if (!client_) {
        throw AiTokenizerError("no completion client configured");
    }

    AiPipelineResult out;

    // 1-3. Links, suspect domains, scheme completion
    std::vector<std::string> all_links;
    for (auto& url : extract_urls(text)) {
        all_links.push_back(url.text);
        out.urls.push_back(std::move(url.text));
    }
    for (auto& suspect : extract_suspect_links(text)) {
        std::string protocol = infer_protocol(text, suspect.offset, options.ai_default_protocol());
        out.completed_links.push_back(complete_link(suspect.text, protocol));
        all_links.push_back(std::move(suspect.text));
    }

    // 4. Placeholders
    RestructuredText restructured = replace_links(text, std::move(all_links));
    out.restructured_text = restructured.text;

    // 5. Remote tokenization of what is left
    std::vector<std::string> ai_tokens;
    if (!is_blank(out.restructured_text)) {
        CompletionRequest request;
        request.system_prompt = STRICT_TOKENIZER_PROMPT;
        request.user_text = out.restructured_text;
        request.model = options.ai_model();
        request.temperature = 0.1;
        request.max_tokens = 4096;

        ai_tokens = parse_token_array(call_with_timeout(request, options.ai_timeout()));
    }

    // 6. URLs, completed links, then tokens
    out.tokens = out.urls;
    for (const auto& link : out.completed_links) {
        if (std::find(out.urls.begin(), out.urls.end(), link) == out.urls.end()) {
            out.tokens.push_back(link);
        }
    }
    for (auto& token : ai_tokens) {
        if (token.empty() || is_link_placeholder(token)) continue;
        out.tokens.push_back(std::move(token));
    }
    return out;
}

std::vector<std::string> AiTokenizer::segment(std::string_view text, const SegmentOptions& options) const {
    if (!options.ai_enabled() || !client_) {
        return smart_segment(text);
    }

    try {
        return run(text, options).tokens;
    } catch (const std::exception& e) {
        std::cerr << "AI tokenization failed, falling back to smart mode: " << e.what() << std::endl;
        return smart_segment(text);
    } catch (...) {
        std::cerr << "AI tokenization failed with a non-standard exception, falling back to smart mode"
                  << std::endl;
        return smart_segment(text);
    }
}

} // namespace textseg
