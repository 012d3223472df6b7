#pragma once

#include <array>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace textseg {

enum class RuleId : uint8_t {
    SymbolSplit = 0,
    WhitespaceSplit,
    NewlineSplit,
    ChineseEnglishSplit,
    UppercaseSplit,
    NamingSplit,
    DigitSplit,
    RemoveWhitespace,
    RemoveSymbols,
    RemoveChinese,
    RemoveEnglish,
    RemoveDigits,
};

constexpr size_t kRuleCount = 12;

enum class RuleGroup : uint8_t {
    Split,
    Remove,
};

// Small bitset over RuleId, usable in constexpr tables
class RuleSet {
public:
    constexpr RuleSet() = default;
    constexpr RuleSet(std::initializer_list<RuleId> ids) {
        for (RuleId id : ids) bits_ |= bit(id);
    }

    constexpr bool contains(RuleId id) const { return (bits_ & bit(id)) != 0; }
    constexpr void insert(RuleId id) { bits_ |= bit(id); }
    constexpr void erase(RuleId id) { bits_ &= ~bit(id); }
    constexpr bool empty() const { return bits_ == 0; }
    constexpr uint32_t bits() const { return bits_; }

    size_t size() const;
    std::vector<RuleId> to_vector() const;

    friend constexpr bool operator==(RuleSet a, RuleSet b) { return a.bits_ == b.bits_; }
    friend constexpr bool operator!=(RuleSet a, RuleSet b) { return a.bits_ != b.bits_; }

private:
    static constexpr uint32_t bit(RuleId id) { return uint32_t{1} << static_cast<uint8_t>(id); }

    uint32_t bits_ = 0;
};

struct RuleDescriptor {
    RuleId id;
    std::string_view key;
    RuleGroup group;
    int priority;
    RuleSet depends_on;
    RuleSet conflicts_with;     // rules dropped when this one is selected
    std::string_view conflict_reason;
};

inline constexpr std::array<RuleDescriptor, kRuleCount> kRuleTable{{
    {RuleId::SymbolSplit,         "symbolSplit",         RuleGroup::Split,  1,  {}, {}, ""},
    {RuleId::WhitespaceSplit,     "whitespaceSplit",     RuleGroup::Split,  2,  {}, {}, ""},
    {RuleId::NewlineSplit,        "newlineSplit",        RuleGroup::Split,  3,  {}, {}, ""},
    {RuleId::ChineseEnglishSplit, "chineseEnglishSplit", RuleGroup::Split,  4,  {}, {}, ""},
    {RuleId::UppercaseSplit,      "uppercaseSplit",      RuleGroup::Split,  5,  {}, {}, ""},
    {RuleId::NamingSplit,         "namingSplit",         RuleGroup::Split,  6,  {RuleId::UppercaseSplit}, {}, ""},
    {RuleId::DigitSplit,          "digitSplit",          RuleGroup::Split,  7,  {}, {}, ""},
    {RuleId::RemoveWhitespace,    "removeWhitespace",    RuleGroup::Remove, 8,  {}, {}, ""},
    {RuleId::RemoveSymbols,       "removeSymbols",       RuleGroup::Remove, 9,  {}, {RuleId::SymbolSplit},
        "removeSymbols makes symbolSplit a no-op; symbolSplit skipped"},
    {RuleId::RemoveChinese,       "removeChinese",       RuleGroup::Remove, 10, {}, {}, ""},
    {RuleId::RemoveEnglish,       "removeEnglish",       RuleGroup::Remove, 11, {}, {}, ""},
    {RuleId::RemoveDigits,        "removeDigits",        RuleGroup::Remove, 12, {}, {}, ""},
}};

// Table rows are indexed by RuleId
constexpr bool rule_table_is_ordered() {
    for (size_t i = 0; i < kRuleTable.size(); ++i) {
        if (static_cast<size_t>(kRuleTable[i].id) != i) return false;
    }
    return true;
}
static_assert(rule_table_is_ordered(), "kRuleTable rows must follow RuleId order");

inline const RuleDescriptor& rule_descriptor(RuleId id) {
    return kRuleTable[static_cast<size_t>(id)];
}

std::string_view rule_key(RuleId id);
std::optional<RuleId> parse_rule(std::string_view key);

// Comma separated rule keys; unknown keys are reported on std::cerr and skipped
RuleSet parse_rule_list(std::string_view keys);

// Rule transforms. Each maps every input element independently and flattens.
std::vector<std::string> apply_symbol_split(const std::vector<std::string>& input);
std::vector<std::string> apply_whitespace_split(const std::vector<std::string>& input);
std::vector<std::string> apply_newline_split(const std::vector<std::string>& input);
std::vector<std::string> apply_chinese_english_split(const std::vector<std::string>& input);
std::vector<std::string> apply_uppercase_split(const std::vector<std::string>& input);
std::vector<std::string> apply_naming_split(const std::vector<std::string>& input, bool strip_separators);
std::vector<std::string> apply_digit_split(const std::vector<std::string>& input);
std::vector<std::string> apply_remove_whitespace(const std::vector<std::string>& input);
std::vector<std::string> apply_remove_symbols(const std::vector<std::string>& input);
std::vector<std::string> apply_remove_chinese(const std::vector<std::string>& input);
std::vector<std::string> apply_remove_english(const std::vector<std::string>& input);
std::vector<std::string> apply_remove_digits(const std::vector<std::string>& input);

std::vector<std::string> apply_rule(RuleId id, const std::vector<std::string>& input, bool naming_strip_separators);

// Naming convention split shared with the english mode
std::vector<std::string> split_naming(std::u32string_view word, bool strip_separators);

} // namespace textseg
