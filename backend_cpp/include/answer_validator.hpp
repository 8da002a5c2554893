#pragma once

#include "query_planner.hpp"
#include <optional>
#include <string>
#include <vector>

namespace doc_qa {

// Where the final answer came from.
enum class AnswerSource {
    Verbatim,          // generation trusted as-is
    ContextPercentage,
    ContextFraction,
    ContextInteger,
    ContextDate,
    ContextName,
    Fallback           // not-found or generic message, or a salvaged sentence
};

const char* to_string(AnswerSource source);

struct ExtractionResult {
    std::string text;
    AnswerSource source;
};

// Post-generation correction stage. Every function is pure: the result
// depends only on (raw answer, question, context).
class AnswerValidator {
public:
    // Classifies the question and dispatches to the per-type policy.
    static ExtractionResult reconcile(const std::string& raw_answer,
                                      const std::string& question,
                                      const std::string& context);

    static ExtractionResult reconcile_as(AnswerType type,
                                         const std::string& raw_answer,
                                         const std::string& question,
                                         const std::string& context);

    static ExtractionResult reconcile_percentage(const std::string& answer, const std::string& question, const std::string& context);
    static ExtractionResult reconcile_count(const std::string& answer, const std::string& question, const std::string& context);
    static ExtractionResult reconcile_date(const std::string& answer, const std::string& question, const std::string& context);
    static ExtractionResult reconcile_name(const std::string& answer, const std::string& question, const std::string& context);
    static ExtractionResult reconcile_general(const std::string& answer, const std::string& question, const std::string& context);

    // Empty, at most two non-digit characters, or punctuation only.
    static bool looks_like_garbage(const std::string& answer);

    // Over 30 words, over 15 words without sentence punctuation, or a
    // certificate/record metadata line.
    static bool is_context_dump(const std::string& text);

    // N from "from N", "out of N", "in N marks".
    static std::optional<std::string> extract_denominator(const std::string& question);

    // Integers in [min_val, max_val] that are not part of a fraction or a
    // decimal, in order of appearance.
    static std::vector<int> find_standalone_ints(const std::string& text, int min_val, int max_val);
};

} // namespace doc_qa
