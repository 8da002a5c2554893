#include "answer_validator.hpp"
#include "answer_patterns.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>
#include <unordered_map>

namespace doc_qa {

namespace {

const char* const kPercentageNotFound = "The percentage could not be found in the document.";
const char* const kCountNotFound = "The count could not be found in the document.";
const char* const kDateNotFound = "The date could not be found in the document.";
const char* const kNameNotFound = "The name could not be found in the document.";
const char* const kNoSpecificAnswer = "I found relevant information but could not extract a specific answer.";
const char* const kNoAnswer = "I could not find a relevant answer in the document.";

constexpr int kMaxDirectAnswerWords = 30;
constexpr int kMaxUnpunctuatedWords = 15;
constexpr int kMaxCountAnswerWords = 10;
constexpr int kMaxSalvagedSentenceWords = 20;
constexpr int kAggregateMin = 30;
constexpr int kAggregateMax = 100;

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n\f\v");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n\f\v");
    return s.substr(begin, end - begin + 1);
}

size_t word_count(const std::string& s) {
    std::istringstream stream(s);
    size_t n = 0;
    std::string word;
    while (stream >> word) ++n;
    return n;
}

// Code points, not bytes.
size_t utf8_length(const std::string& s) {
    return static_cast<size_t>(std::count_if(s.begin(), s.end(), [](unsigned char c) { return (c & 0xC0) != 0x80; }));
}

bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

std::vector<std::string> find_all(const std::string& text, const std::regex& re) {
    std::vector<std::string> found;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), re); it != std::sregex_iterator(); ++it) {
        found.push_back(it->str());
    }
    return found;
}

// Most frequent element; ties go to the one seen first.
template<typename T>
T most_common(const std::vector<T>& values) {
    std::unordered_map<T, int> counts;
    for (const auto& v : values) ++counts[v];
    T best = values.front();
    int best_count = 0;
    for (const auto& v : values) {
        if (counts[v] > best_count) {
            best = v;
            best_count = counts[v];
        }
    }
    return best;
}

std::string strip_spaces(std::string s) {
    s.erase(std::remove_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); }), s.end());
    return s;
}

// A usable generation is neither garbage nor an echoed context.
bool is_usable(const std::string& answer) {
    return !AnswerValidator::looks_like_garbage(answer) && !AnswerValidator::is_context_dump(answer);
}

std::optional<ExtractionResult> first_fraction_as_count(const std::string& context) {
    std::smatch m;
    if (std::regex_search(context, m, patterns::fraction_value())) {
        return ExtractionResult{m.str(1) + " out of " + m.str(2), AnswerSource::ContextFraction};
    }
    return std::nullopt;
}

// First sentence, split after '.', '!' or '?' followed by whitespace.
std::string first_sentence(const std::string& text) {
    for (size_t i = 0; i + 1 < text.size(); ++i) {
        char c = text[i];
        if ((c == '.' || c == '!' || c == '?') && std::isspace(static_cast<unsigned char>(text[i + 1]))) {
            return text.substr(0, i + 1);
        }
    }
    return text;
}

using Policy = ExtractionResult (*)(const std::string&, const std::string&, const std::string&);

// Indexed by AnswerType.
const std::array<Policy, 5> kPolicies = {
    &AnswerValidator::reconcile_percentage,
    &AnswerValidator::reconcile_count,
    &AnswerValidator::reconcile_date,
    &AnswerValidator::reconcile_name,
    &AnswerValidator::reconcile_general,
};

} // namespace

const char* to_string(AnswerSource source) {
    switch (source) {
        case AnswerSource::Verbatim: return "verbatim";
        case AnswerSource::ContextPercentage: return "context_percentage";
        case AnswerSource::ContextFraction: return "context_fraction";
        case AnswerSource::ContextInteger: return "context_integer";
        case AnswerSource::ContextDate: return "context_date";
        case AnswerSource::ContextName: return "context_name";
        case AnswerSource::Fallback: return "fallback";
    }
    return "fallback";
}

bool AnswerValidator::looks_like_garbage(const std::string& answer) {
    std::string s = trim(answer);
    if (s.empty()) return true;
    if (utf8_length(s) <= 2 && !all_digits(s)) return true;
    // Only ASCII punctuation and whitespace count as noise; any byte of a
    // multi-byte sequence belongs to a real character.
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return c < 0x80 && !std::isalnum(c);
    });
}

bool AnswerValidator::is_context_dump(const std::string& text) {
    std::string stripped = trim(text);
    if (stripped.empty()) return false;

    size_t words = word_count(stripped);
    if (words > kMaxDirectAnswerWords) return true;

    auto endings = std::count_if(stripped.begin(), stripped.end(),
                                 [](char c) { return c == '.' || c == '!' || c == '?'; });
    if (words > kMaxUnpunctuatedWords && endings == 0) return true;

    return std::regex_search(stripped, patterns::record_metadata());
}

std::optional<std::string> AnswerValidator::extract_denominator(const std::string& question) {
    std::smatch m;
    if (std::regex_search(question, m, patterns::question_denominator())) return m.str(1);
    return std::nullopt;
}

std::vector<int> AnswerValidator::find_standalone_ints(const std::string& text, int min_val, int max_val) {
    std::string masked = std::regex_replace(text, patterns::fraction_value(), "FRACTION");
    masked = std::regex_replace(masked, patterns::decimal_value(), "DECIMAL");

    std::vector<int> results;
    for (const auto& token : find_all(masked, patterns::integer_value())) {
        // Anything longer than nine digits is outside every useful range.
        if (token.size() > 9) continue;
        int val = std::stoi(token);
        if (val >= min_val && val <= max_val) results.push_back(val);
    }
    return results;
}

ExtractionResult AnswerValidator::reconcile_percentage(const std::string& answer, const std::string&,
                                                       const std::string& context) {
    if (is_usable(answer) && std::regex_search(answer, patterns::percent_value())) {
        return {answer, AnswerSource::Verbatim};
    }

    auto explicit_pct = find_all(context, patterns::percent_value());
    if (!explicit_pct.empty()) {
        std::transform(explicit_pct.begin(), explicit_pct.end(), explicit_pct.begin(), strip_spaces);
        return {most_common(explicit_pct), AnswerSource::ContextPercentage};
    }

    // Aggregate printed next to its component fractions: "22/25 35.63/75 58".
    auto standalone = find_standalone_ints(context, kAggregateMin, kAggregateMax);
    if (!standalone.empty()) {
        return {std::to_string(most_common(standalone)) + "%", AnswerSource::ContextPercentage};
    }

    std::smatch m;
    if (std::regex_search(context, m, patterns::fraction_value())) {
        return {m.str(1) + "/" + m.str(2), AnswerSource::ContextFraction};
    }
    return {kPercentageNotFound, AnswerSource::Fallback};
}

ExtractionResult AnswerValidator::reconcile_count(const std::string& raw, const std::string& question,
                                                  const std::string& context) {
    if (auto denom = extract_denominator(question)) {
        std::regex specific("(\\d+(?:\\.\\d+)?)\\s*/\\s*" + *denom + "\\b");
        std::smatch m;
        if (std::regex_search(context, m, specific)) {
            return {m.str(1) + " out of " + *denom, AnswerSource::ContextFraction};
        }
        if (auto any = first_fraction_as_count(context)) return *any;
    }

    std::string answer = raw;
    if (std::regex_search(answer, patterns::range_answer())) {
        answer.clear();
    }

    if (std::any_of(answer.begin(), answer.end(), [](unsigned char c) { return std::isdigit(c); }) &&
        is_usable(answer) && word_count(answer) <= kMaxCountAnswerWords) {
        return {answer, AnswerSource::Verbatim};
    }

    if (auto fraction = first_fraction_as_count(context)) return *fraction;

    auto ints = find_standalone_ints(context, 0, 999999999);
    if (!ints.empty()) {
        return {std::to_string(ints.front()), AnswerSource::ContextInteger};
    }
    return {kCountNotFound, AnswerSource::Fallback};
}

ExtractionResult AnswerValidator::reconcile_date(const std::string& answer, const std::string&,
                                                 const std::string& context) {
    if (is_usable(answer) && std::regex_search(answer, patterns::date_value())) {
        return {answer, AnswerSource::Verbatim};
    }

    std::smatch m;
    if (std::regex_search(context, m, patterns::date_value())) {
        return {m.str(0), AnswerSource::ContextDate};
    }
    return {kDateNotFound, AnswerSource::Fallback};
}

ExtractionResult AnswerValidator::reconcile_name(const std::string& answer, const std::string&,
                                                 const std::string& context) {
    if (is_usable(answer) &&
        (std::regex_search(answer, patterns::title_case_phrase()) ||
         std::regex_search(answer, patterns::all_caps_phrase()))) {
        return {answer, AnswerSource::Verbatim};
    }

    // Longest ALL-CAPS run wins so a full name beats a short label.
    std::string best;
    for (const auto& candidate : find_all(context, patterns::all_caps_phrase())) {
        if (std::regex_search(candidate, patterns::record_code_token())) continue;
        if (candidate.size() > best.size()) best = candidate;
    }
    if (!best.empty()) return {best, AnswerSource::ContextName};

    std::smatch m;
    if (std::regex_search(context, m, patterns::title_case_phrase())) {
        return {m.str(0), AnswerSource::ContextName};
    }
    return {kNameNotFound, AnswerSource::Fallback};
}

ExtractionResult AnswerValidator::reconcile_general(const std::string& answer, const std::string&,
                                                    const std::string&) {
    if (is_context_dump(answer)) {
        std::string sentence = first_sentence(answer);
        if (word_count(sentence) <= kMaxSalvagedSentenceWords) {
            return {sentence, AnswerSource::Fallback};
        }
        return {kNoSpecificAnswer, AnswerSource::Fallback};
    }
    if (looks_like_garbage(answer)) {
        return {kNoAnswer, AnswerSource::Fallback};
    }
    return {answer, AnswerSource::Verbatim};
}

ExtractionResult AnswerValidator::reconcile_as(AnswerType type, const std::string& raw_answer,
                                               const std::string& question, const std::string& context) {
    Policy policy = kPolicies[static_cast<size_t>(type)];
    return policy(trim(raw_answer), question, context);
}

ExtractionResult AnswerValidator::reconcile(const std::string& raw_answer, const std::string& question,
                                            const std::string& context) {
    return reconcile_as(QueryPlanner::classify_answer_type(question), raw_answer, question, context);
}

} // namespace doc_qa
