#include "segmenter.hpp"
#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include <chrono>
#include <omp.h>
#include <optional>

// ============================================================================
// JSONL writer using thread_local buffers
// ============================================================================

#if defined(_MSC_VER)
    #define TEXTSEG_FORCE_INLINE __forceinline
#elif defined(__GNUC__) || defined(__clang__)
    #define TEXTSEG_FORCE_INLINE __attribute__((always_inline)) inline
#else
    #define TEXTSEG_FORCE_INLINE inline
#endif

static constexpr char HEX_DIGITS[] = "0123456789abcdef";

TEXTSEG_FORCE_INLINE void append_int(std::string& out, int64_t val) {
    if (val == 0) {
        out += '0';
        return;
    }
    if (val < 0) {
        out += '-';
        val = -val;
    }
    char buf[20];
    char* p = buf + 20;
    while (val > 0) {
        *--p = static_cast<char>('0' + (val % 10));
        val /= 10;
    }
    out.append(p, buf + 20 - p);
}

TEXTSEG_FORCE_INLINE void escape_json_to(std::string& out, std::string_view s) {
    for (unsigned char c : s) {
        switch (c) {
            case '\"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    out += "\\u00";
                    out += HEX_DIGITS[(c >> 4) & 0xF];
                    out += HEX_DIGITS[c & 0xF];
                } else {
                    out += static_cast<char>(c);
                }
        }
    }
}

// {"id":N,"input":"...","mode":"...","segments":["...", ...]}
TEXTSEG_FORCE_INLINE std::string build_json_record(
    int64_t id,
    const std::string& input,
    std::string_view mode,
    const std::vector<std::string>& segments
) {
    thread_local std::string buffer;
    buffer.clear();
    buffer.reserve(512);

    buffer += "{\"id\":";
    append_int(buffer, id);
    buffer += ",\"input\":\"";
    escape_json_to(buffer, input);
    buffer += "\",\"mode\":\"";
    escape_json_to(buffer, mode);
    buffer += "\",\"segments\":[";

    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) buffer += ',';
        buffer += '"';
        escape_json_to(buffer, segments[i]);
        buffer += '"';
    }

    buffer += "]}";
    return buffer;
}

struct Args {
    std::string mode = "smart";
    std::string text;
    std::string input_path;
    std::string output_path;
    std::string dict_path;
    std::string stopwords_path;
    std::string settings_path;
    std::string rules;
    std::optional<size_t> char_limit;
    std::optional<int> random_min;
    std::optional<int> random_max;
    std::optional<int> min_tokens;
    std::optional<uint64_t> seed;
    int limit = -1;
    bool threads_set = false;
    int threads = 4;
};

Args parse_args(int argc, char* argv[]) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--mode" && i + 1 < argc) {
            args.mode = argv[++i];
        } else if (arg == "--text" && i + 1 < argc) {
            args.text = argv[++i];
        } else if (arg == "--input" && i + 1 < argc) {
            args.input_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--dict" && i + 1 < argc) {
            args.dict_path = argv[++i];
        } else if (arg == "--stopwords" && i + 1 < argc) {
            args.stopwords_path = argv[++i];
        } else if (arg == "--settings" && i + 1 < argc) {
            args.settings_path = argv[++i];
        } else if (arg == "--rules" && i + 1 < argc) {
            args.rules = argv[++i];
        } else if (arg == "--char-limit" && i + 1 < argc) {
            args.char_limit = std::stoul(argv[++i]);
        } else if (arg == "--random-min" && i + 1 < argc) {
            args.random_min = std::stoi(argv[++i]);
        } else if (arg == "--random-max" && i + 1 < argc) {
            args.random_max = std::stoi(argv[++i]);
        } else if (arg == "--min-tokens" && i + 1 < argc) {
            args.min_tokens = std::stoi(argv[++i]);
        } else if (arg == "--seed" && i + 1 < argc) {
            args.seed = std::stoull(argv[++i]);
        } else if (arg == "--limit" && i + 1 < argc) {
            args.limit = std::stoi(argv[++i]);
        } else if (arg == "--threads" && i + 1 < argc) {
            args.threads = std::stoi(argv[++i]);
            args.threads_set = true;
        } else {
            std::cerr << "Warning: ignoring argument " << arg << std::endl;
        }
    }
    return args;
}

textseg::SegmentOptions build_options(const Args& args) {
    textseg::SegmentOptions base;
    if (!args.settings_path.empty()) {
        base = textseg::load_settings(args.settings_path, base);
    }

    textseg::SegmentOptions::Builder builder(base);
    if (args.random_min || args.random_max) {
        builder.random_length(args.random_min.value_or(base.random_min_length()),
                              args.random_max.value_or(base.random_max_length()));
    }
    if (args.min_tokens) builder.chaos_min_tokens(*args.min_tokens);
    if (args.char_limit) builder.line_char_limit(*args.char_limit);
    if (args.seed) builder.random_seed(*args.seed);
    if (!args.rules.empty()) builder.rules(textseg::parse_rule_list(args.rules));
    return builder.build();
}

void print_resolution(const textseg::Segmenter& segmenter, textseg::RuleSet rules) {
    // Resolution does not depend on the text
    auto result = segmenter.compose("x", rules);
    std::cout << "Applied rules:";
    for (auto id : result.applied_rules) {
        std::cout << " " << textseg::rule_key(id);
    }
    std::cout << std::endl;
    for (const auto& c : result.conflicts) {
        std::cout << "Conflict: " << textseg::rule_key(c.rule) << " " << c.action
                  << " (" << c.reason << ")" << std::endl;
    }
}

int main(int argc, char* argv[]) {
    std::ios_base::sync_with_stdio(false);
    std::cin.tie(NULL);

    Args args;
    try {
        args = parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid numeric argument (" << e.what() << ")" << std::endl;
        return 1;
    }

    if (args.input_path.empty() && args.text.empty()) {
        std::cerr << "Usage: " << argv[0]
                  << " [--mode <m>] (--text <s> | --input <file>) [--output <file>]"
                  << " [--dict <file>] [--stopwords <file>] [--settings <file>] [--rules a,b,c]"
                  << " [--char-limit <n>] [--random-min <n>] [--random-max <n>] [--min-tokens <n>]"
                  << " [--seed <n>] [--limit <n>] [--threads <n>]" << std::endl;
        return 1;
    }

    if (args.threads_set) {
        omp_set_num_threads(args.threads);
    }

    // 1. Load Dictionary
    auto start_load = std::chrono::high_resolution_clock::now();
    textseg::Dictionary dict = textseg::Dictionary::with_defaults();
    if (!args.dict_path.empty() && !dict.load_words(args.dict_path)) {
        return 1;
    }
    if (!args.stopwords_path.empty() && !dict.load_stop_words(args.stopwords_path)) {
        return 1;
    }
    std::cout << "Dictionary: " << dict.word_count() << " words, "
              << dict.stop_word_count() << " stop words" << std::endl;
    textseg::DictionaryStore store(std::move(dict));
    auto end_load = std::chrono::high_resolution_clock::now();

    std::cout << "Dictionary loaded in "
              << std::chrono::duration<double>(end_load - start_load).count()
              << "s" << std::endl;

    // 2. Initialize Segmenter
    textseg::Segmenter segmenter(store);
    textseg::SegmentOptions options = build_options(args);
    textseg::Mode mode = textseg::parse_mode(args.mode);
    std::string_view mode_name = textseg::mode_name(mode);
    if (mode_name != args.mode) {
        std::cerr << "Warning: unknown mode '" << args.mode << "', using smart" << std::endl;
    }

    if (mode == textseg::Mode::Multi) {
        try {
            print_resolution(segmenter, options.rules());
        } catch (const textseg::RuleConfigError& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }
    }

    // Single text
    if (!args.text.empty()) {
        auto segments = segmenter.segment(args.text, mode, options);
        std::cout << build_json_record(0, args.text, mode_name, segments) << std::endl;
        return 0;
    }

    // 3. Read Input
    std::vector<std::string> lines;
    {
        std::ifstream infile(args.input_path);
        if (!infile.is_open()) {
            std::cerr << "Error opening input file: " << args.input_path << std::endl;
            return 1;
        }
        std::string line;
        while (std::getline(infile, line)) {
            if (!line.empty()) {
                if (line.back() == '\r') line.pop_back();
                lines.push_back(line);
                if (args.limit > 0 && lines.size() >= static_cast<size_t>(args.limit)) break;
            }
        }
    }
    std::cout << "Loaded " << lines.size() << " lines." << std::endl;

    // 4. Process
    std::vector<std::string> results(lines.size());

    auto start_proc = std::chrono::high_resolution_clock::now();

    #pragma omp parallel for schedule(dynamic, 100)
    for (int64_t i = 0; i < static_cast<int64_t>(lines.size()); ++i) {
        auto segments = segmenter.segment(lines[i], mode, options);
        results[i] = build_json_record(i, lines[i], mode_name, segments);
    }

    auto end_proc = std::chrono::high_resolution_clock::now();
    double duration = std::chrono::duration<double>(end_proc - start_proc).count();

    std::cout << "Processed " << lines.size() << " lines in " << duration << "s" << std::endl;
    if (duration > 0) {
        std::cout << "Speed: " << (lines.size() / duration) << " lines/sec" << std::endl;
    }

    // 5. Output
    if (!args.output_path.empty()) {
        std::ofstream outfile(args.output_path);
        if (!outfile.is_open()) {
            std::cerr << "Error opening output file: " << args.output_path << std::endl;
            return 1;
        }
        char buffer[65536];
        outfile.rdbuf()->pubsetbuf(buffer, sizeof(buffer));
        for (const auto& res : results) {
            outfile << res << "\n";
        }
        std::cout << "Done. Saved to " << args.output_path << std::endl;
    } else {
        for (const auto& res : results) {
            std::cout << res << "\n";
        }
    }

    return 0;
}
