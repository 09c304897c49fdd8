#include "bank_generator.hpp"
#include "../utils/logger.hpp"
#include "../utils/timer.hpp"
#include <fstream>
#include <sstream>
#include <vector>

namespace mdingest {

// ---- xoshiro256** PRNG (fast, reproducible, period 2^256-1) ----

static uint64_t splitmix64(uint64_t& state) {
    uint64_t z = (state += 0x9e3779b97f4a7c15ULL);
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31);
}

void BankGenerator::seed_prng(uint64_t seed) {
    uint64_t s = seed;
    prng_state_[0] = splitmix64(s);
    prng_state_[1] = splitmix64(s);
    prng_state_[2] = splitmix64(s);
    prng_state_[3] = splitmix64(s);
}

static uint64_t rotl64(uint64_t x, int k) {
    return (x << k) | (x >> (64 - k));
}

uint64_t BankGenerator::next_u64() {
    const uint64_t result = rotl64(prng_state_[1] * 5, 7) * 9;
    const uint64_t t = prng_state_[1] << 17;
    prng_state_[2] ^= prng_state_[0];
    prng_state_[3] ^= prng_state_[1];
    prng_state_[1] ^= prng_state_[2];
    prng_state_[0] ^= prng_state_[3];
    prng_state_[2] ^= t;
    prng_state_[3] = rotl64(prng_state_[3], 45);
    return result;
}

// ---- Question templates ----

static const char* const TOPICS[] = {
    "thermodynamics", "linear algebra", "organic chemistry", "probability",
    "cell biology", "classical mechanics", "number theory", "optics",
    "数据结构", "计算机网络"
};
static constexpr size_t NUM_TOPICS = sizeof(TOPICS) / sizeof(TOPICS[0]);

std::string BankGenerator::option_text(size_t idx) const {
    static const char* const STEMS[] = {
        "The quantity is conserved", "The rate doubles", "It depends on temperature",
        "None of the listed effects", "The system reaches equilibrium",
        "The value is undefined", "选项取决于初始条件", "Both forces cancel"
    };
    constexpr size_t n = sizeof(STEMS) / sizeof(STEMS[0]);
    return std::string(STEMS[idx % n]) + " (case " + std::to_string(idx) + ")";
}

std::string BankGenerator::question(size_t number) {
    std::ostringstream q;
    const char* topic = TOPICS[pick(NUM_TOPICS)];
    const size_t variant = pick(1000);

    switch (number % 4) {
        case 1: {
            q << number << ". In " << topic << ", which statement holds for setup "
              << variant << "?\n";
            std::vector<size_t> used;
            const char labels[] = {'A', 'B', 'C', 'D'};
            for (char label : labels) {
                size_t idx;
                bool dup;
                do {
                    idx = pick(cfg_.option_pool);
                    dup = false;
                    for (size_t u : used) dup = dup || u == idx;
                } while (dup && used.size() < cfg_.option_pool);
                used.push_back(idx);
                q << label << ". " << option_text(idx) << "\n";
            }
            q << "Answer: " << labels[pick(4)] << "\n";
            break;
        }
        case 2:
            q << number << ". In " << topic << ", statement " << variant
              << " is either true or false. Decide.\n";
            q << "Answer: " << (pick(2) ? "True" : "False") << "\n";
            break;
        case 3:
            q << number << ". In " << topic << ", the measured value for sample "
              << variant << " is ____ units.\n";
            q << "Answer: " << pick(500) << "\n";
            break;
        default: {
            size_t f = pick(cfg_.formula_pool);
            q << number << ". In " << topic << ", derive $x_{" << variant
              << "}^2 + y$ from first principles.\n";
            q << "$$\\int_0^{" << f << "} x^" << (f % 5 + 1) << " \\, dx$$\n";
            q << "Answer: See the derivation.\n";
            q << "Explanation: Apply the power rule to case " << f << ".\n";
            break;
        }
    }

    if (cfg_.image_pool > 0 && number % 3 == 0) {
        size_t img = pick(cfg_.image_pool);
        q << "![figure " << img << "](https://img.example.com/bank/fig-" << img << ".png)\n";
    }
    return q.str();
}

void BankGenerator::write_bank(std::ostream& out) {
    questions_ = 0;
    bytes_ = 0;
    seed_prng(cfg_.seed);

    std::string header = "# Generated question bank (seed " + std::to_string(cfg_.seed) + ")\n\n";
    out << header;
    bytes_ += header.size();

    for (size_t n = 1; n <= cfg_.num_questions; ++n) {
        std::string text = question(n);
        if (cfg_.rule_every > 0 && n % cfg_.rule_every == 0 && n < cfg_.num_questions)
            text += "\n---\n";
        text += "\n";
        out << text;
        bytes_ += text.size();
        ++questions_;
    }
}

std::string BankGenerator::generate_text() {
    std::ostringstream out;
    write_bank(out);
    return out.str();
}

bool BankGenerator::generate(const std::string& path) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) {
        LOG_ERR("[generator] Cannot write %s", path.c_str());
        return false;
    }

    Timer timer;
    timer.start();
    write_bank(f);
    f.flush();
    timer.stop();

    if (!f.good()) {
        LOG_ERR("[generator] Write error on %s", path.c_str());
        return false;
    }
    LOG_INF("[generator] Wrote %zu questions (%llu bytes) to %s in %lld ms",
        questions_, static_cast<unsigned long long>(bytes_), path.c_str(),
        static_cast<long long>(timer.elapsed_ms()));
    return true;
}

} // namespace mdingest
