#pragma once

#include "embedding_service.hpp"
#include "errors.hpp"
#include <atomic>
#include <cctype>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace doc_qa::testing {

// Bag-of-words hashed into a small vector, plus a constant bias component so
// no text maps to the zero vector. Identical texts embed identically.
class HashingEmbedding : public EmbeddingFunction {
public:
    explicit HashingEmbedding(int dimension = 64) : dimension_(dimension) {}

    std::vector<float> embed(const std::string& text) override {
        ++calls_;
        std::vector<float> v(static_cast<size_t>(dimension_), 0.0f);
        v.back() = 0.5f;
        std::string word;
        auto flush = [&]() {
            if (word.empty()) return;
            size_t slot = std::hash<std::string>{}(word) % static_cast<size_t>(dimension_ - 1);
            v[slot] += 1.0f;
            word.clear();
        };
        for (unsigned char c : text) {
            if (std::isalnum(c)) word += static_cast<char>(std::tolower(c));
            else flush();
        }
        flush();
        return v;
    }

    int dimension() const override { return dimension_; }
    int calls() const { return calls_.load(); }

private:
    int dimension_;
    std::atomic<int> calls_{0};
};

// Succeeds for the first `successes` calls, then throws.
class FailingEmbedding : public EmbeddingFunction {
public:
    explicit FailingEmbedding(int successes = 0) : remaining_(successes) {}

    std::vector<float> embed(const std::string& text) override {
        if (remaining_-- <= 0) throw std::runtime_error("embedding backend offline");
        return inner_.embed(text);
    }
    int dimension() const override { return inner_.dimension(); }

private:
    std::atomic<int> remaining_;
    HashingEmbedding inner_;
};

// Returns a fixed answer and remembers the last prompt.
class ScriptedGeneration : public GenerationFunction {
public:
    explicit ScriptedGeneration(std::string answer) : answer_(std::move(answer)) {}

    std::string generate(const std::string& prompt, int max_tokens) override {
        std::lock_guard<std::mutex> lock(mutex_);
        last_prompt_ = prompt;
        last_max_tokens_ = max_tokens;
        ++calls_;
        return answer_;
    }

    std::string last_prompt() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_prompt_;
    }
    int last_max_tokens() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_max_tokens_;
    }
    int calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

private:
    std::string answer_;
    std::string last_prompt_;
    int last_max_tokens_ = 0;
    int calls_ = 0;
    mutable std::mutex mutex_;
};

class UnavailableGeneration : public GenerationFunction {
public:
    std::string generate(const std::string&, int) override {
        throw ModelUnavailable("Generation model unavailable");
    }
};

} // namespace doc_qa::testing
