#pragma once
// Generates synthetic Markdown question banks for benchmarks, dry runs and
// tests. Deterministic per seed. Questions cycle through
//   multiple choice (options from a shared pool, so duplicates occur),
//   true/false, fill-in-the-blank, subjective with formulas,
// with images from a small shared URL pool and a "---" rule every
// rule_every questions.
#include <cstdint>
#include <ostream>
#include <string>

namespace mdingest {

struct BankConfig {
    size_t num_questions = 1000;
    uint64_t seed = 42;             // PRNG seed for reproducibility
    size_t option_pool = 200;       // Distinct option strings
    size_t image_pool = 20;         // Distinct image URLs
    size_t formula_pool = 50;       // Distinct display formulas
    size_t rule_every = 50;         // 0 disables rules
};

class BankGenerator {
public:
    explicit BankGenerator(const BankConfig& cfg = {}) : cfg_(cfg) { seed_prng(cfg_.seed); }

    // Writes the bank to path; false (logged) on I/O failure
    bool generate(const std::string& path);

    // Whole bank as a string
    std::string generate_text();

    [[nodiscard]] size_t questions_written() const { return questions_; }
    [[nodiscard]] uint64_t bytes_written() const { return bytes_; }

private:
    BankConfig cfg_;
    size_t questions_ = 0;
    uint64_t bytes_ = 0;

    // PRNG state (xoshiro256**)
    uint64_t prng_state_[4]{};
    void seed_prng(uint64_t seed);
    uint64_t next_u64();
    size_t pick(size_t n) { return n > 0 ? static_cast<size_t>(next_u64() % n) : 0; }

    void write_bank(std::ostream& out);
    std::string question(size_t number);
    std::string option_text(size_t idx) const;
};

} // namespace mdingest
