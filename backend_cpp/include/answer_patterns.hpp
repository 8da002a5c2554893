#pragma once

#include <regex>

// Shared question detectors and answer-value matchers. The word lists are
// the disambiguation policy between answer types; keep them narrow.
namespace doc_qa::patterns {

// Question detectors

// Only explicit percent / aggregate / (C)GPA wording, or a standalone '%'.
// "marks" and "score" deliberately belong to the count family.
inline const std::regex& question_percentage() {
    static const std::regex re(
        R"(\b(?:percent(?:age)?|cgpa|gpa|aggregate)\b|(?:^|[^\w/])%(?![\w/]))",
        std::regex::ECMAScript | std::regex::icase);
    return re;
}

inline const std::regex& question_date() {
    static const std::regex re(
        R"(\b(?:when|date|year|month|day|born|issued|expir(?:y|ed|ation)|valid(?:ity)?)\b)",
        std::regex::ECMAScript | std::regex::icase);
    return re;
}

inline const std::regex& question_name() {
    static const std::regex re(
        R"(\b(?:who|name|author|issued\s+to|student|candidate|person|organization|college|university|institute)\b)",
        std::regex::ECMAScript | std::regex::icase);
    return re;
}

inline const std::regex& question_count() {
    static const std::regex re(
        R"(\b(?:how\s+many|how\s+much|count|total\s+number|number\s+of|quantity|amount|)"
        R"(assignment|submission|complet|marks?|score|grade|result|obtained|got)\b)",
        std::regex::ECMAScript | std::regex::icase);
    return re;
}

// "from 25", "out of 75", "in 25 marks"
inline const std::regex& question_denominator() {
    static const std::regex re(
        R"(\b(?:from|out\s+of|in)\s+(\d+)(?:\s+marks?)?\b)",
        std::regex::ECMAScript | std::regex::icase);
    return re;
}

// Value matchers

// "69%", "92.5 %"
inline const std::regex& percent_value() {
    static const std::regex re(R"(\d[\d.,]*\s*%)");
    return re;
}

// 45/75, 22/25, 35.63/75
inline const std::regex& fraction_value() {
    static const std::regex re(R"((\d+(?:\.\d+)?)\s*/\s*(\d+(?:\.\d+)?))");
    return re;
}

inline const std::regex& decimal_value() {
    static const std::regex re(R"(\d+\.\d+)");
    return re;
}

inline const std::regex& integer_value() {
    static const std::regex re(R"(\b(\d+)\b)");
    return re;
}

inline const std::regex& date_value() {
    static const std::regex re(
        R"(\b\d{1,2}[/\-]\d{1,2}[/\-]\d{2,4}\b)"
        R"(|\b\d{4}[/\-]\d{2}[/\-]\d{2}\b)"
        R"(|\b(?:jan|feb|mar|apr|may|jun|jul|aug|sep|oct|nov|dec)\w*[\s,]+\d{4}\b)",
        std::regex::ECMAScript | std::regex::icase);
    return re;
}

// Title Case phrase of two or more words: "John Doe"
inline const std::regex& title_case_phrase() {
    static const std::regex re(R"(\b[A-Z][a-z]+(?:\s+[A-Z][a-z]+)+)");
    return re;
}

// ALL-CAPS run of two to five words: "RADADIYA HETVI HASMUKHBHAI"
inline const std::regex& all_caps_phrase() {
    static const std::regex re(R"(\b[A-Z]{2,}(?:\s+[A-Z]{2,}){1,4}\b)");
    return re;
}

// "2 or 3" comes from recommendation text, never a definitive count.
inline const std::regex& range_answer() {
    static const std::regex re(R"(\b\d+\s+or\s+\d+\b)", std::regex::ECMAScript | std::regex::icase);
    return re;
}

// Certificate and transcript record lines: roll numbers, course codes,
// verification footers, credit recommendations.
inline const std::regex& record_metadata() {
    static const std::regex re(
        R"(NPTEL\d+[A-Z0-9]+)"
        R"(|Roll\s+No)"
        R"(|To verify.*certificate)"
        R"(|No\.\s*of\s*credits)"
        R"(|recommended\s*:\s*\d)"
        R"(|\b[A-Z]{2,}\d{4}[A-Z]{2}\d+S\w+\b)",
        std::regex::ECMAScript | std::regex::icase);
    return re;
}

// Roll-number or course-code fragments inside an ALL-CAPS match.
inline const std::regex& record_code_token() {
    static const std::regex re(R"(NPTEL\d|[A-Z]\d{4})", std::regex::ECMAScript | std::regex::icase);
    return re;
}

} // namespace doc_qa::patterns
