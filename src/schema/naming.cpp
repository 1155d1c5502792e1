//! # Naming Conventions Implementation

#include "schema/naming.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <utility>
#include <vector>

namespace schemly::schema {

namespace {

auto is_upper(char c) -> bool {
    return std::isupper(static_cast<unsigned char>(c)) != 0;
}

auto is_lower(char c) -> bool {
    return std::islower(static_cast<unsigned char>(c)) != 0;
}

auto is_digit(char c) -> bool {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

auto is_alpha(char c) -> bool {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

auto lower_char(char c) -> char {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

auto upper_char(char c) -> char {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

auto ends_with(std::string_view s, std::string_view suffix) -> bool {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

/// Splits `input` into lowercase words at case and separator boundaries.
auto split_words(std::string_view input) -> std::vector<std::string> {
    std::vector<std::string> words;
    std::string snake = snake_case(input);
    std::string current;
    for (char c : snake) {
        if (c == '_') {
            if (!current.empty()) {
                words.push_back(std::move(current));
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        words.push_back(std::move(current));
    }
    return words;
}

auto capitalize(std::string word) -> std::string {
    if (!word.empty()) {
        word[0] = upper_char(word[0]);
    }
    return word;
}

// ============================================================================
// Inflection Tables
// ============================================================================

constexpr std::pair<std::string_view, std::string_view> IRREGULAR_WORDS[] = {
    {"person", "people"},
    {"child", "children"},
    {"man", "men"},
    {"woman", "women"},
    {"mouse", "mice"},
    {"goose", "geese"},
    {"foot", "feet"},
    {"tooth", "teeth"},
    {"ox", "oxen"},
};

constexpr std::string_view UNCOUNTABLE_WORDS[] = {
    "data",  "media",    "metadata", "information", "equipment", "news",
    "series", "species", "sheep",    "fish",        "feedback",  "software",
};

constexpr std::string_view PHP_RESERVED_WORDS[] = {
    "abstract",   "and",          "array",      "as",         "break",     "callable",
    "case",       "catch",        "class",      "clone",      "const",     "continue",
    "declare",    "default",      "die",        "do",         "echo",      "else",
    "elseif",     "empty",        "enddeclare", "endfor",     "endforeach", "endif",
    "endswitch",  "endwhile",     "eval",       "exit",       "extends",   "final",
    "finally",    "for",          "foreach",    "function",   "global",    "goto",
    "if",         "implements",   "include",    "include_once", "instanceof", "insteadof",
    "interface",  "isset",        "list",       "namespace",  "new",       "or",
    "print",      "private",      "protected",  "public",     "require",   "require_once",
    "return",     "static",       "switch",     "throw",      "trait",     "try",
    "unset",      "use",          "var",        "while",      "xor",       "yield",
    "int",        "float",        "bool",       "string",     "true",      "false",
    "null",       "void",         "iterable",   "object",     "mixed",     "never",
};

auto is_uncountable(std::string_view lower) -> bool {
    return std::find(std::begin(UNCOUNTABLE_WORDS), std::end(UNCOUNTABLE_WORDS), lower) !=
           std::end(UNCOUNTABLE_WORDS);
}

/// Copies the case of `original`'s first letter onto `word`.
auto match_case(std::string_view original, std::string word) -> std::string {
    if (!original.empty() && is_upper(original[0])) {
        return capitalize(std::move(word));
    }
    return word;
}

auto pluralize_word(std::string_view word) -> std::string {
    std::string lower = to_lower(word);
    if (is_uncountable(lower)) {
        return std::string(word);
    }
    for (const auto& [singular, plural] : IRREGULAR_WORDS) {
        if (lower == singular) {
            return match_case(word, std::string(plural));
        }
    }

    std::string stem(word);
    if (ends_with(lower, "y") && lower.size() > 1 &&
        std::string_view("aeiou").find(lower[lower.size() - 2]) == std::string_view::npos) {
        return stem.substr(0, stem.size() - 1) + "ies";
    }
    if (ends_with(lower, "s") || ends_with(lower, "sh") || ends_with(lower, "ch") ||
        ends_with(lower, "x") || ends_with(lower, "z")) {
        return stem + "es";
    }
    if (ends_with(lower, "f") && !ends_with(lower, "ff")) {
        return stem.substr(0, stem.size() - 1) + "ves";
    }
    if (ends_with(lower, "fe")) {
        return stem.substr(0, stem.size() - 2) + "ves";
    }
    return stem + "s";
}

auto singularize_word(std::string_view word) -> std::string {
    std::string lower = to_lower(word);
    if (is_uncountable(lower)) {
        return std::string(word);
    }
    for (const auto& [singular, plural] : IRREGULAR_WORDS) {
        if (lower == plural) {
            return match_case(word, std::string(singular));
        }
    }

    std::string stem(word);
    if (ends_with(lower, "ss") || ends_with(lower, "us") || ends_with(lower, "is")) {
        return stem;
    }
    if (ends_with(lower, "ies") && lower.size() > 3) {
        return stem.substr(0, stem.size() - 3) + "y";
    }
    if (ends_with(lower, "ives") && lower.size() > 4) {
        return stem.substr(0, stem.size() - 4) + "ife";
    }
    if (ends_with(lower, "ves") && lower.size() > 3) {
        return stem.substr(0, stem.size() - 3) + "f";
    }
    if (ends_with(lower, "sses") || ends_with(lower, "shes") || ends_with(lower, "ches") ||
        ends_with(lower, "xes") || ends_with(lower, "zes") || ends_with(lower, "uses")) {
        return stem.substr(0, stem.size() - 2);
    }
    if (ends_with(lower, "s") && lower.size() > 1) {
        return stem.substr(0, stem.size() - 1);
    }
    return stem;
}

/// Applies `inflect` to the part after the last `_`.
template <typename F> auto inflect_last_segment(std::string_view word, F inflect) -> std::string {
    auto pos = word.rfind('_');
    if (pos == std::string_view::npos) {
        return inflect(word);
    }
    return std::string(word.substr(0, pos + 1)) + inflect(word.substr(pos + 1));
}

} // namespace

// ============================================================================
// Case Conversion
// ============================================================================

auto to_lower(std::string_view input) -> std::string {
    std::string out;
    out.reserve(input.size());
    for (char c : input) {
        out += lower_char(c);
    }
    return out;
}

auto snake_case(std::string_view input) -> std::string {
    std::string out;
    out.reserve(input.size() + 4);

    for (size_t i = 0; i < input.size(); ++i) {
        char c = input[i];
        if (c == '_' || c == '-' || c == ' ') {
            if (!out.empty() && out.back() != '_') {
                out += '_';
            }
            continue;
        }
        if (is_upper(c) && i > 0) {
            char prev = input[i - 1];
            bool after_lower = is_lower(prev) || is_digit(prev);
            bool acronym_end = is_upper(prev) && i + 1 < input.size() && is_lower(input[i + 1]);
            if ((after_lower || acronym_end) && !out.empty() && out.back() != '_') {
                out += '_';
            }
        }
        out += lower_char(c);
    }

    while (!out.empty() && out.back() == '_') {
        out.pop_back();
    }
    return out;
}

auto camel_case(std::string_view input) -> std::string {
    auto words = split_words(input);
    std::string out;
    for (size_t i = 0; i < words.size(); ++i) {
        out += i == 0 ? words[i] : capitalize(words[i]);
    }
    return out;
}

auto pascal_case(std::string_view input) -> std::string {
    std::string out;
    for (auto& word : split_words(input)) {
        out += capitalize(std::move(word));
    }
    return out;
}

auto kebab_case(std::string_view input) -> std::string {
    std::string out = snake_case(input);
    std::replace(out.begin(), out.end(), '_', '-');
    return out;
}

// ============================================================================
// Inflection
// ============================================================================

auto pluralize(std::string_view word) -> std::string {
    if (word.empty()) {
        return {};
    }
    return inflect_last_segment(word, pluralize_word);
}

auto singularize(std::string_view word) -> std::string {
    if (word.empty()) {
        return {};
    }
    return inflect_last_segment(word, singularize_word);
}

auto singular_snake_case(std::string_view name) -> std::string {
    return singularize(snake_case(name));
}

// ============================================================================
// Derived Names
// ============================================================================

auto table_name_for(std::string_view entity_name) -> std::string {
    return pluralize(snake_case(entity_name));
}

auto foreign_key_for(std::string_view entity_name) -> std::string {
    return singular_snake_case(entity_name) + "_id";
}

auto pivot_name_for(std::string_view table_a, std::string_view table_b) -> std::string {
    if (table_b < table_a) {
        std::swap(table_a, table_b);
    }
    std::string name(table_a);
    name += '_';
    name += table_b;
    return name;
}

// ============================================================================
// Identifier Checks
// ============================================================================

auto is_valid_identifier(std::string_view name) -> bool {
    if (name.empty() || name.size() > 64) {
        return false;
    }
    if (!is_alpha(name[0]) && name[0] != '_') {
        return false;
    }
    return std::all_of(name.begin(), name.end(),
                       [](char c) { return is_alpha(c) || is_digit(c) || c == '_'; });
}

auto is_valid_table_name(std::string_view name) -> bool {
    if (name.empty() || name.size() > 128) {
        return false;
    }
    return std::all_of(name.begin(), name.end(),
                       [](char c) { return is_alpha(c) || is_digit(c) || c == '_'; });
}

auto is_reserved_word(std::string_view name) -> bool {
    std::string lower = to_lower(name);
    return std::find(std::begin(PHP_RESERVED_WORDS), std::end(PHP_RESERVED_WORDS), lower) !=
           std::end(PHP_RESERVED_WORDS);
}

} // namespace schemly::schema
