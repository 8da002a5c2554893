#include "query_planner.hpp"
#include "answer_patterns.hpp"
#include <algorithm>
#include <utility>

namespace doc_qa {

namespace {

const char* const kPercentageKeywords = "percentage % score marks grade aggregate total";
const char* const kDateKeywords = "date year month issued valid";
const char* const kNameKeywords = "name person author candidate organization";
const char* const kCountKeywords = "total number count assignments submissions";

const char* const kAllKeywordSets[] = {kPercentageKeywords, kDateKeywords, kNameKeywords, kCountKeywords};

bool is_fraction_without_percent(const std::string& text) {
    return std::regex_search(text, patterns::fraction_value()) &&
           !std::regex_search(text, patterns::percent_value());
}

std::string rstrip(const std::string& s) {
    auto end = s.find_last_not_of(" \t\r\n");
    return end == std::string::npos ? std::string() : s.substr(0, end + 1);
}

} // namespace

const char* to_string(AnswerType type) {
    switch (type) {
        case AnswerType::Percentage: return "percentage";
        case AnswerType::Count: return "count";
        case AnswerType::Date: return "date";
        case AnswerType::Name: return "name";
        case AnswerType::General: return "general";
    }
    return "general";
}

AnswerSignals QueryPlanner::detect(const std::string& question) {
    AnswerSignals s;
    s.percentage = std::regex_search(question, patterns::question_percentage());
    s.count = std::regex_search(question, patterns::question_count());
    s.date = std::regex_search(question, patterns::question_date());
    s.name = std::regex_search(question, patterns::question_name());
    return s;
}

AnswerType QueryPlanner::classify_answer_type(const std::string& question) {
    auto s = detect(question);
    if (s.percentage) return AnswerType::Percentage;
    if (s.count) return AnswerType::Count;
    if (s.date) return AnswerType::Date;
    if (s.name) return AnswerType::Name;
    return AnswerType::General;
}

std::string QueryPlanner::expand_query(const std::string& question) {
    // Detect on the question without synonyms appended by an earlier pass,
    // otherwise one family's synonyms would trigger another family.
    std::string base = question;
    for (const char* keywords : kAllKeywordSets) {
        const std::string appended = std::string(" ") + keywords;
        for (auto pos = base.find(appended); pos != std::string::npos; pos = base.find(appended)) {
            base.erase(pos, appended.size());
        }
    }

    auto s = detect(base);
    std::vector<const char*> sets;
    if (s.percentage) sets.push_back(kPercentageKeywords);
    if (s.date) sets.push_back(kDateKeywords);
    if (s.name) sets.push_back(kNameKeywords);
    if (s.count) sets.push_back(kCountKeywords);

    std::string expanded = rstrip(question);
    bool changed = false;
    for (const char* keywords : sets) {
        if (question.find(keywords) != std::string::npos) continue;
        expanded += " ";
        expanded += keywords;
        changed = true;
    }
    return changed ? expanded : question;
}

double QueryPlanner::score_chunk(const std::string& text, const std::string& question) {
    auto s = detect(question);
    double score = 1.0;

    if (s.percentage) {
        if (std::regex_search(text, patterns::percent_value())) score += 3.0;
        if (is_fraction_without_percent(text)) score -= 1.0;
    }
    if (s.date && std::regex_search(text, patterns::date_value())) {
        score += 2.0;
    }
    if (s.name && std::regex_search(text, patterns::title_case_phrase())) {
        score += 1.5;
    }
    return score;
}

std::vector<Chunk> QueryPlanner::rerank(std::vector<Chunk> chunks, const std::string& question, int top_k) {
    if (top_k <= 0) return {};

    std::vector<std::pair<double, Chunk>> scored;
    scored.reserve(chunks.size());
    for (auto& chunk : chunks) {
        double score = score_chunk(chunk.text, question);
        scored.emplace_back(score, std::move(chunk));
    }

    std::stable_sort(scored.begin(), scored.end(), [](const auto& a, const auto& b) {
        return a.first > b.first;
    });

    std::vector<Chunk> ranked;
    size_t keep = std::min(scored.size(), static_cast<size_t>(top_k));
    ranked.reserve(keep);
    for (size_t i = 0; i < keep; ++i) {
        ranked.push_back(std::move(scored[i].second));
    }
    return ranked;
}

std::string QueryPlanner::answer_type_hint(const std::string& question) {
    switch (classify_answer_type(question)) {
        case AnswerType::Percentage: return "percentage value (e.g. 58%)";
        case AnswerType::Count: return "number or count";
        case AnswerType::Date: return "date or year";
        case AnswerType::Name: return "person or organization name";
        case AnswerType::General: return "";
    }
    return "";
}

} // namespace doc_qa
