#pragma once

#include "chunk.hpp"
#include <string>
#include <vector>

namespace doc_qa {

// Expected answer category of a question, in classification precedence order.
enum class AnswerType {
    Percentage,
    Count,
    Date,
    Name,
    General
};

const char* to_string(AnswerType type);

// Raw detector results. Several families can fire for one question.
struct AnswerSignals {
    bool percentage = false;
    bool count = false;
    bool date = false;
    bool name = false;
};

class QueryPlanner {
public:
    static AnswerSignals detect(const std::string& question);

    // Percentage > Count > Date > Name > General.
    static AnswerType classify_answer_type(const std::string& question);

    // Appends the synonym set of every detected family that is not already
    // present, so repeated expansion converges.
    static std::string expand_query(const std::string& question);

    // Stable by input order for equal scores; keeps at most top_k.
    static std::vector<Chunk> rerank(std::vector<Chunk> chunks, const std::string& question, int top_k);

    static double score_chunk(const std::string& text, const std::string& question);

    // Log-only description of the expected answer.
    static std::string answer_type_hint(const std::string& question);
};

} // namespace doc_qa
