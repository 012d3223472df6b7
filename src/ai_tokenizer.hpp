#pragma once

#include "options.hpp"
#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace textseg {

struct CompletionRequest {
    std::string system_prompt;
    std::string user_text;
    std::string model;
    double temperature = 0.1;
    int max_tokens = 4096;
};

// Remote text-completion service. Implementations throw on transport
// failure and should give up early once `cancelled` is set.
class CompletionClient {
public:
    virtual ~CompletionClient() = default;
    virtual std::string complete(const CompletionRequest& request, const std::atomic<bool>& cancelled) = 0;
};

class AiTokenizerError : public std::runtime_error {
public:
    explicit AiTokenizerError(const std::string& what) : std::runtime_error(what) {}
};

struct AiPipelineResult {
    std::vector<std::string> urls;              // literal URLs in order
    std::vector<std::string> completed_links;   // suspect domains with a scheme
    std::string restructured_text;              // links replaced by {{LINK_n}}
    std::vector<std::string> tokens;            // final ordered output
};

class AiTokenizer {
public:
    static const char* const STRICT_TOKENIZER_PROMPT;

    explicit AiTokenizer(std::shared_ptr<CompletionClient> client);

    // Runs the link pipeline and the remote call; throws AiTokenizerError
    AiPipelineResult run(std::string_view text, const SegmentOptions& options) const;

    // run(), falling back to smart mode on any failure or timeout
    std::vector<std::string> segment(std::string_view text, const SegmentOptions& options) const;

    // Accepts a bare JSON array of strings, optionally inside a ``` fence
    static std::vector<std::string> parse_token_array(std::string_view response);

private:
    std::shared_ptr<CompletionClient> client_;

    std::string call_with_timeout(const CompletionRequest& request, std::chrono::milliseconds timeout) const;
};

} // namespace textseg
