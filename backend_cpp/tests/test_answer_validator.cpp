#include <gtest/gtest.h>

#include "answer_validator.hpp"

using doc_qa::AnswerSource;
using doc_qa::AnswerType;
using doc_qa::AnswerValidator;

namespace {

// Certificate text as it comes out of the PDF extractor: component scores
// as fractions, the aggregate as a bare integer, then record metadata.
const std::string kCertificate =
    "Jan-Mar 2025 (8 week course) Design and analysis of algorithms "
    "RADADIYA HETVI HASMUKHBHAI 22/25 35.63/75 58 1696 "
    "NPTEL25CS23S334600098 Roll No: No. of credits recommended: 2 or 3 "
    "To verify the certificate visit nptel.ac.in/noc";

const std::string kScoreSheet =
    "Assignment Score: 22/25  Exam Score: 35.63/75  "
    "Total Score: 58  "
    "Course: Design and Analysis of Algorithms  "
    "Duration: Jan-Mar 2025";

const std::string kMarksheet =
    "Subject: Mathematics  Marks: 87/100  Grade: A  "
    "Subject: Physics  Marks: 72/100  Grade: B  "
    "Aggregate percentage: 79.5%  "
    "Student: John Doe  Roll: 2023001";

std::string repeat_words(const std::string& word, int n) {
    std::string out;
    for (int i = 0; i < n; ++i) {
        if (i > 0) out += " ";
        out += word;
    }
    return out;
}

} // namespace

TEST(AnswerValidatorTest, ExplicitPercentAnswerIsTrusted) {
    auto result = AnswerValidator::reconcile("58%", "how much percentage did I get?", kCertificate);
    EXPECT_EQ(result.text, "58%");
    EXPECT_EQ(result.source, AnswerSource::Verbatim);
}

TEST(AnswerValidatorTest, GarbagePercentRecoversStandaloneAggregate) {
    auto result = AnswerValidator::reconcile("%", "how much percentage did I get?", kCertificate);
    EXPECT_EQ(result.text, "58%");
    EXPECT_EQ(result.source, AnswerSource::ContextPercentage);
}

TEST(AnswerValidatorTest, WrongComponentFractionIsReplacedForPercentage) {
    auto result = AnswerValidator::reconcile("22/25", "how much percentage i got?", kCertificate);
    EXPECT_EQ(result.text, "58%");
}

TEST(AnswerValidatorTest, PercentageQuestionWithDenominatorStillUsesPercentagePath) {
    auto result = AnswerValidator::reconcile("%", "How much percentage i got from 100", kCertificate);
    EXPECT_EQ(result.text, "58%");
}

TEST(AnswerValidatorTest, ExplicitPercentInContextWins) {
    auto result = AnswerValidator::reconcile("%", "What is the aggregate percentage?", kMarksheet);
    EXPECT_EQ(result.text, "79.5%");
    EXPECT_EQ(result.source, AnswerSource::ContextPercentage);
}

TEST(AnswerValidatorTest, MostFrequentPercentInContextWins) {
    auto result = AnswerValidator::reconcile(
        "", "what percentage did I get?", "Attendance 90% in term one. Result 75% overall, confirmed 75 %.");
    EXPECT_EQ(result.text, "75%");
}

TEST(AnswerValidatorTest, PercentageFallsBackToFirstFraction) {
    auto result = AnswerValidator::reconcile("", "what percentage?", "Score 22/25 and 7/10");
    EXPECT_EQ(result.text, "22/25");
    EXPECT_EQ(result.source, AnswerSource::ContextFraction);
}

TEST(AnswerValidatorTest, PercentageNotFoundMessage) {
    auto result = AnswerValidator::reconcile("", "what percentage?", "No numbers here.");
    EXPECT_EQ(result.text, "The percentage could not be found in the document.");
    EXPECT_EQ(result.source, AnswerSource::Fallback);
}

TEST(AnswerValidatorTest, RangeAnswerIsRejectedForCount) {
    auto result = AnswerValidator::reconcile("2 or 3", "how many assignments have I done?", kCertificate);
    EXPECT_NE(result.text, "2 or 3");
    EXPECT_NE(result.text.find("22"), std::string::npos);
    EXPECT_EQ(result.text, "22 out of 25");
    EXPECT_EQ(result.source, AnswerSource::ContextFraction);
}

TEST(AnswerValidatorTest, DenominatorHintSelectsMatchingFraction) {
    auto from25 = AnswerValidator::reconcile("58%", "how many marks from 25 i got?", kCertificate);
    EXPECT_EQ(from25.text, "22 out of 25");

    auto outOf75 = AnswerValidator::reconcile("", "how many marks out of 75 did I get?", kCertificate);
    EXPECT_EQ(outOf75.text, "35.63 out of 75");
}

TEST(AnswerValidatorTest, DenominatorHintWithoutMatchUsesAnyFraction) {
    auto result = AnswerValidator::reconcile("", "how many marks out of 50?", kCertificate);
    EXPECT_EQ(result.text, "22 out of 25");
}

TEST(AnswerValidatorTest, ShortNumericCountAnswerIsTrusted) {
    auto result = AnswerValidator::reconcile("8 assignments", "how many assignments did I submit?", kCertificate);
    EXPECT_EQ(result.text, "8 assignments");
    EXPECT_EQ(result.source, AnswerSource::Verbatim);
}

TEST(AnswerValidatorTest, CountFallsBackToStandaloneInteger) {
    auto result = AnswerValidator::reconcile("several", "how many pages are there?", "The report has 12 pages.");
    EXPECT_EQ(result.text, "12");
    EXPECT_EQ(result.source, AnswerSource::ContextInteger);
}

TEST(AnswerValidatorTest, CountNotFoundMessage) {
    auto result = AnswerValidator::reconcile("", "how many pages are there?", "Nothing numeric.");
    EXPECT_EQ(result.text, "The count could not be found in the document.");
}

TEST(AnswerValidatorTest, DateExtractedFromContext) {
    auto result = AnswerValidator::reconcile("", "When was this course completed?", kScoreSheet);
    EXPECT_EQ(result.text, "Mar 2025");
    EXPECT_EQ(result.source, AnswerSource::ContextDate);
}

TEST(AnswerValidatorTest, DateAnswerIsTrusted) {
    auto result = AnswerValidator::reconcile("12/03/2025", "When was the certificate issued?", kCertificate);
    EXPECT_EQ(result.text, "12/03/2025");
    EXPECT_EQ(result.source, AnswerSource::Verbatim);
}

TEST(AnswerValidatorTest, DateNotFoundMessage) {
    auto result = AnswerValidator::reconcile("soon", "When does it expire?", "No dates at all.");
    EXPECT_EQ(result.text, "The date could not be found in the document.");
}

TEST(AnswerValidatorTest, NameQuestionExtractsAllCapsName) {
    auto result = AnswerValidator::reconcile("?", "What is the student name?", kCertificate);
    EXPECT_EQ(result.text, "RADADIYA HETVI HASMUKHBHAI");
    EXPECT_EQ(result.source, AnswerSource::ContextName);
}

TEST(AnswerValidatorTest, ContextDumpUnderNameQuestionIsReplaced) {
    ASSERT_TRUE(AnswerValidator::is_context_dump(kCertificate));
    auto result = AnswerValidator::reconcile(kCertificate, "What is the student name?", kCertificate);
    EXPECT_EQ(result.text, "RADADIYA HETVI HASMUKHBHAI");
    EXPECT_NE(result.source, AnswerSource::Verbatim);
}

TEST(AnswerValidatorTest, NameAnswerIsTrusted) {
    auto result = AnswerValidator::reconcile("John Doe", "Who is the author?", kMarksheet);
    EXPECT_EQ(result.text, "John Doe");
    EXPECT_EQ(result.source, AnswerSource::Verbatim);
}

TEST(AnswerValidatorTest, NameFallsBackToTitleCasePhrase) {
    auto result = AnswerValidator::reconcile(
        "?", "Who prepared the report?", "This report was prepared by Alice Smith for the board.");
    EXPECT_EQ(result.text, "Alice Smith");
}

TEST(AnswerValidatorTest, CodesWithDigitsAreNotTreatedAsNames) {
    auto result = AnswerValidator::reconcile(
        "", "Who is the candidate?", "CODE CS2023 ISSUED then Jane Roe signed");
    EXPECT_EQ(result.text, "Jane Roe");
}

TEST(AnswerValidatorTest, GeneralAnswerIsReturnedAsIs) {
    auto result = AnswerValidator::reconcile(
        "The document describes a sorting algorithm.", "What is this document about?", kScoreSheet);
    EXPECT_EQ(result.text, "The document describes a sorting algorithm.");
    EXPECT_EQ(result.source, AnswerSource::Verbatim);
}

TEST(AnswerValidatorTest, GeneralDumpSalvagesShortFirstSentence) {
    std::string dump = "The course covers sorting. " + repeat_words("graph", 35);
    auto result = AnswerValidator::reconcile(dump, "What is this document about?", kScoreSheet);
    EXPECT_EQ(result.text, "The course covers sorting.");
    EXPECT_EQ(result.source, AnswerSource::Fallback);
}

TEST(AnswerValidatorTest, GeneralDumpWithoutShortSentenceGivesGenericMessage) {
    auto result = AnswerValidator::reconcile(repeat_words("graph", 40), "What is this document about?", kScoreSheet);
    EXPECT_EQ(result.text, "I found relevant information but could not extract a specific answer.");
}

TEST(AnswerValidatorTest, GeneralEmptyAnswerGivesFallback) {
    auto result = AnswerValidator::reconcile("   ", "What is this document about?", kScoreSheet);
    EXPECT_EQ(result.text, "I could not find a relevant answer in the document.");
    EXPECT_EQ(result.source, AnswerSource::Fallback);
}

TEST(AnswerValidatorTest, ResultIsNeverEmpty) {
    const std::vector<std::string> questions = {
        "how much percentage did I get?", "how many assignments?", "when was it issued?",
        "who is the author?", "what is this about?"};
    const std::vector<std::string> answers = {"", "%", "?", kCertificate, "2 or 3"};
    const std::vector<std::string> contexts = {"", "plain words only", kCertificate};

    for (const auto& q : questions) {
        for (const auto& a : answers) {
            for (const auto& c : contexts) {
                EXPECT_FALSE(AnswerValidator::reconcile(a, q, c).text.empty())
                    << "question=" << q << " answer=" << a;
            }
        }
    }
}

TEST(AnswerValidatorTest, ReconcileIsDeterministic) {
    auto first = AnswerValidator::reconcile("%", "how much percentage did I get?", kCertificate);
    auto second = AnswerValidator::reconcile("%", "how much percentage did I get?", kCertificate);
    EXPECT_EQ(first.text, second.text);
    EXPECT_EQ(first.source, second.source);
}

TEST(AnswerValidatorTest, ReconcileAsOverridesClassification) {
    auto result = AnswerValidator::reconcile_as(AnswerType::Name, "?", "anything", kCertificate);
    EXPECT_EQ(result.text, "RADADIYA HETVI HASMUKHBHAI");
}

TEST(AnswerValidatorTest, NonLatinAnswersAreKept) {
    const std::string cyrillic = "\xD0\x94\xD0\xBE\xD0\xBA\xD1\x83\xD0\xBC\xD0\xB5\xD0\xBD\xD1\x82 "
                                 "\xD0\xBE\xD0\xB1 \xD0\xB0\xD0\xBB\xD0\xB3\xD0\xBE\xD1\x80\xD0\xB8"
                                 "\xD1\x82\xD0\xBC\xD0\xB0\xD1\x85.";
    auto result = AnswerValidator::reconcile(cyrillic, "What is this document about?", "ctx");
    EXPECT_EQ(result.text, cyrillic);
    EXPECT_EQ(result.source, AnswerSource::Verbatim);

    const std::string japanese = "\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E";
    EXPECT_EQ(AnswerValidator::reconcile(japanese, "What is this document about?", "ctx").text, japanese);

    // "Moskva"
    EXPECT_FALSE(AnswerValidator::looks_like_garbage(
        "\xD0\x9C\xD0\xBE\xD1\x81\xD0\xBA\xD0\xB2\xD0\xB0"));
}

TEST(AnswerValidatorTest, TwoCharacterNonLatinAnswerIsStillGarbage) {
    EXPECT_TRUE(AnswerValidator::looks_like_garbage("\xD0\xB4\xD0\xB0"));
}

TEST(AnswerValidatorTest, GarbageDetection) {
    EXPECT_TRUE(AnswerValidator::looks_like_garbage(""));
    EXPECT_TRUE(AnswerValidator::looks_like_garbage("%"));
    EXPECT_TRUE(AnswerValidator::looks_like_garbage("a"));
    EXPECT_TRUE(AnswerValidator::looks_like_garbage("?!"));
    EXPECT_TRUE(AnswerValidator::looks_like_garbage("  ...  "));
    EXPECT_FALSE(AnswerValidator::looks_like_garbage("7"));
    EXPECT_FALSE(AnswerValidator::looks_like_garbage("58"));
    EXPECT_FALSE(AnswerValidator::looks_like_garbage("yes"));
}

TEST(AnswerValidatorTest, ContextDumpDetection) {
    EXPECT_TRUE(AnswerValidator::is_context_dump(kCertificate));
    EXPECT_TRUE(AnswerValidator::is_context_dump(repeat_words("word", 20)));
    EXPECT_TRUE(AnswerValidator::is_context_dump("Roll No: 1234"));
    EXPECT_FALSE(AnswerValidator::is_context_dump(repeat_words("word", 20) + "."));
    EXPECT_FALSE(AnswerValidator::is_context_dump("58%"));
    EXPECT_FALSE(AnswerValidator::is_context_dump(""));
}

TEST(AnswerValidatorTest, DenominatorExtraction) {
    EXPECT_EQ(AnswerValidator::extract_denominator("how many marks from 25 i got"), "25");
    EXPECT_EQ(AnswerValidator::extract_denominator("score out of 75"), "75");
    EXPECT_EQ(AnswerValidator::extract_denominator("what did I get in 25 marks"), "25");
    EXPECT_FALSE(AnswerValidator::extract_denominator("what is the percentage").has_value());
}

TEST(AnswerValidatorTest, StandaloneIntegersSkipFractionsAndDecimals) {
    auto ints = AnswerValidator::find_standalone_ints(
        "STUDENT 22/25 35.63/75 58 1696 NPTEL25CS23S334600098", 30, 100);
    ASSERT_EQ(ints.size(), 1u);
    EXPECT_EQ(ints[0], 58);

    auto all = AnswerValidator::find_standalone_ints("7 items, 3.5 kg, 10/20 done, 42", 0, 1000);
    EXPECT_EQ(all, (std::vector<int>{7, 42}));
}
