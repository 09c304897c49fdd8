// =============================================================================
// md-ingest -- parallel ingestion of large Markdown question banks
//
// Splits the bank into byte ranges aligned to question boundaries, parses
// them on a bounded worker pool, deduplicates options / images / formulas by
// content hash and bulk-writes questions to the document store.
//
// Progress is recorded per chunk; an interrupted run (SIGINT/SIGTERM, crash)
// resumes where it stopped when started again on the same file.
// =============================================================================

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <memory>
#include <string>

#include "config.hpp"
#include "utils/logger.hpp"
#include "store/memory_store.hpp"
#include "store/postgres_store.hpp"
#include "ingest/bank_generator.hpp"
#include "ingest/coordinator.hpp"
#include "ingest/file_progress_store.hpp"
#include "ingest/redis_progress_store.hpp"

static std::atomic<mdingest::Coordinator*> g_coordinator{nullptr};

static void handle_signal(int) {
    if (auto* c = g_coordinator.load()) c->cancel();
}

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [OPTIONS] FILE\n"
        "       %s --generate-bank PATH [--num-questions N] [--seed N]\n"
        "\n"
        "Options:\n"
        "  --config PATH          JSON config file (flags override its values)\n"
        "  --chunk-size N         Target chunk size in bytes (default: 10 MiB)\n"
        "  --search-window N      Boundary search window in bytes (default: 10000)\n"
        "  --workers N            Parse workers (default: hardware concurrency)\n"
        "  --queue-depth N        Task queue depth (default: 2 x workers)\n"
        "  --batch-size N         Questions per bulk write (default: 1000)\n"
        "  --retry-limit N        Retries per failed chunk (default: 2)\n"
        "  --store NAME           postgresql | memory (default: postgresql)\n"
        "  --host HOST            PostgreSQL host (default: localhost)\n"
        "  --port N               PostgreSQL port (default: 5432)\n"
        "  --user NAME            PostgreSQL user (default: postgres)\n"
        "  --password PW          PostgreSQL password\n"
        "  --database NAME        PostgreSQL database (default: postgres)\n"
        "  --schema NAME          Schema holding the collections (default: md_ingest)\n"
        "  --progress-backend B   file | redis | none (default: file)\n"
        "  --progress-file PATH   Progress log (default: FILE.progress.jsonl)\n"
        "  --no-resume            Ignore saved progress, process every chunk\n"
        "  --reset                Drop and recreate the collections first\n"
        "  --report PATH          Write a JSON report\n"
        "  --dry-run              In-memory store, no progress persistence\n"
        "  --generate-bank PATH   Write a synthetic question bank and exit\n"
        "  --num-questions N      Questions to generate (default: 1000)\n"
        "  --seed N               PRNG seed for the generator (default: 42)\n"
        "  --verbose              Enable debug logging\n"
        "  --help                 Show this help\n",
        prog, prog);
}

static void print_summary(const mdingest::ProcessingResult& r) {
    std::printf("\n%-28s %s\n", "File", r.file_path.c_str());
    std::printf("%.60s\n", "------------------------------------------------------------");
    std::printf("%-28s %s\n", "Status", mdingest::run_status_str(r.status));
    if (!r.error.empty()) std::printf("%-28s %s\n", "Error", r.error.c_str());
    std::printf("%-28s %llu\n", "Bytes", static_cast<unsigned long long>(r.file_size));
    std::printf("%-28s %zu total, %zu processed, %zu skipped, %zu failed, %zu pending\n",
        "Chunks", r.chunks_total, r.chunks_processed, r.chunks_skipped,
        r.chunks_failed.size(), r.chunks_pending);
    std::printf("%-28s %lld parsed, %lld written, %lld already present\n", "Questions",
        static_cast<long long>(r.questions_parsed), static_cast<long long>(r.questions_written),
        static_cast<long long>(r.questions_duplicate));
    std::printf("%-28s %zu\n", "Write failures", r.write_failures.size());
    std::printf("%-28s %zu\n", "Unaligned chunk boundaries", r.chunking_warnings.size());

    for (const char* kind : {"option", "image", "formula"}) {
        if (!r.dedup_stats.contains(kind)) continue;
        const auto& s = r.dedup_stats[kind];
        std::printf("Dedup %-22s %lld lookups, %lld cached, %lld found, %lld inserted, "
                    "%lld conflicts\n", kind,
            s.value("lookups", 0LL), s.value("cache_hits", 0LL), s.value("store_hits", 0LL),
            s.value("inserts", 0LL), s.value("conflicts", 0LL));
    }

    std::printf("%-28s %.2f s (%.1f MB/s, %.0f questions/s)\n", "Elapsed",
        r.elapsed_sec(), r.throughput_mb_s(), r.questions_per_sec());

    for (const auto& f : r.chunks_failed) {
        std::printf("  failed chunk [%llu, %llu) after %d attempts: %s\n",
            static_cast<unsigned long long>(f.range.start),
            static_cast<unsigned long long>(f.range.end), f.attempts, f.error.c_str());
    }
}

int main(int argc, char* argv[]) {
    std::string input;
    std::string generate_path;
    mdingest::BankConfig bank;

    // The config file is loaded first so that flags override it
    mdingest::IngestConfig cfg;
    try {
        for (int i = 1; i < argc; i++) {
            if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
                cfg = mdingest::IngestConfig::from_file(argv[i + 1]);
                break;
            }
        }
    } catch (const mdingest::ConfigError& e) {
        LOG_ERR("%s", e.what());
        return 1;
    }
    mdingest::g_log_level = mdingest::parse_log_level(cfg.log_level);

    try {
        for (int i = 1; i < argc; i++) {
            if (std::strcmp(argv[i], "--help") == 0) {
                print_usage(argv[0]);
                return 0;
            } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
                ++i;
            } else if (std::strcmp(argv[i], "--chunk-size") == 0 && i + 1 < argc) {
                cfg.chunk_size_bytes = std::stoull(argv[++i]);
            } else if (std::strcmp(argv[i], "--search-window") == 0 && i + 1 < argc) {
                cfg.max_boundary_search_bytes = std::stoull(argv[++i]);
            } else if (std::strcmp(argv[i], "--workers") == 0 && i + 1 < argc) {
                cfg.workers = static_cast<unsigned>(std::stoul(argv[++i]));
            } else if (std::strcmp(argv[i], "--queue-depth") == 0 && i + 1 < argc) {
                cfg.queue_depth = static_cast<unsigned>(std::stoul(argv[++i]));
            } else if (std::strcmp(argv[i], "--batch-size") == 0 && i + 1 < argc) {
                cfg.batch_size = std::stoul(argv[++i]);
            } else if (std::strcmp(argv[i], "--retry-limit") == 0 && i + 1 < argc) {
                cfg.retry_limit = std::stoi(argv[++i]);
            } else if (std::strcmp(argv[i], "--store") == 0 && i + 1 < argc) {
                cfg.store.system = mdingest::parse_store_system(argv[++i]);
            } else if (std::strcmp(argv[i], "--host") == 0 && i + 1 < argc) {
                cfg.store.host = argv[++i];
            } else if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
                cfg.store.port = static_cast<uint16_t>(std::stoul(argv[++i]));
            } else if (std::strcmp(argv[i], "--user") == 0 && i + 1 < argc) {
                cfg.store.user = argv[++i];
            } else if (std::strcmp(argv[i], "--password") == 0 && i + 1 < argc) {
                cfg.store.password = argv[++i];
            } else if (std::strcmp(argv[i], "--database") == 0 && i + 1 < argc) {
                cfg.store.database = argv[++i];
            } else if (std::strcmp(argv[i], "--schema") == 0 && i + 1 < argc) {
                cfg.store.schema = argv[++i];
            } else if (std::strcmp(argv[i], "--progress-backend") == 0 && i + 1 < argc) {
                cfg.progress.backend = mdingest::parse_progress_backend(argv[++i]);
            } else if (std::strcmp(argv[i], "--progress-file") == 0 && i + 1 < argc) {
                cfg.progress.path = argv[++i];
            } else if (std::strcmp(argv[i], "--no-resume") == 0) {
                cfg.resume = false;
            } else if (std::strcmp(argv[i], "--reset") == 0) {
                cfg.reset_collections = true;
            } else if (std::strcmp(argv[i], "--report") == 0 && i + 1 < argc) {
                cfg.report_path = argv[++i];
            } else if (std::strcmp(argv[i], "--dry-run") == 0) {
                cfg.dry_run = true;
            } else if (std::strcmp(argv[i], "--generate-bank") == 0 && i + 1 < argc) {
                generate_path = argv[++i];
            } else if (std::strcmp(argv[i], "--num-questions") == 0 && i + 1 < argc) {
                bank.num_questions = std::stoul(argv[++i]);
            } else if (std::strcmp(argv[i], "--seed") == 0 && i + 1 < argc) {
                bank.seed = std::stoull(argv[++i]);
            } else if (std::strcmp(argv[i], "--verbose") == 0) {
                cfg.log_level = "debug";
            } else if (argv[i][0] == '-' || !input.empty()) {
                std::fprintf(stderr, "Unknown option: %s\n", argv[i]);
                print_usage(argv[0]);
                return 1;
            } else {
                input = argv[i];
            }
        }
    } catch (const mdingest::ConfigError& e) {
        LOG_ERR("%s", e.what());
        return 1;
    } catch (const std::logic_error& e) {
        // std::stoul and friends: invalid_argument / out_of_range
        LOG_ERR("Invalid numeric argument (%s)", e.what());
        return 1;
    }
    mdingest::g_log_level = mdingest::parse_log_level(cfg.log_level);

    // Bank generation is a standalone operation
    if (!generate_path.empty()) {
        mdingest::BankGenerator gen(bank);
        return gen.generate(generate_path) ? 0 : 1;
    }

    if (input.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    if (cfg.dry_run) {
        LOG_INF("=== DRY RUN MODE === (in-memory store, no progress persistence)");
        cfg.store.system = mdingest::StoreSystem::MEMORY;
        cfg.progress.backend = mdingest::ProgressBackend::NONE;
    }

    try {
        cfg.validate();
    } catch (const mdingest::ConfigError& e) {
        LOG_ERR("Invalid configuration: %s", e.what());
        return 1;
    }

    LOG_INF("=== md-ingest: %s ===", input.c_str());

    // Stores: one handle per writing thread (the coordinator resolves entities,
    // the batch writer inserts questions). The memory store is shared.
    std::unique_ptr<mdingest::DocumentStore> entity_owner;
    std::unique_ptr<mdingest::DocumentStore> question_owner;
    std::shared_ptr<mdingest::MemoryStore> memory;
    mdingest::DocumentStore* entity_store = nullptr;
    mdingest::DocumentStore* question_store = nullptr;

    if (cfg.store.system == mdingest::StoreSystem::MEMORY) {
        memory = std::make_shared<mdingest::MemoryStore>();
        memory->connect(cfg.store);
        entity_store = question_store = memory.get();
    } else {
        entity_owner = std::make_unique<mdingest::PostgresStore>();
        question_owner = std::make_unique<mdingest::PostgresStore>();
        if (!entity_owner->connect(cfg.store) || !question_owner->connect(cfg.store)) {
            LOG_ERR("Cannot connect to %s at %s:%u", mdingest::store_system_str(cfg.store.system),
                cfg.store.host.c_str(), cfg.store.port);
            return 1;
        }
        entity_store = entity_owner.get();
        question_store = question_owner.get();
    }

    bool collections_ok = cfg.reset_collections ? entity_store->reset_collections()
                                                : entity_store->create_collections();
    if (!collections_ok) {
        LOG_ERR("Cannot prepare collections in %s", entity_store->system_name());
        return 1;
    }

    // Progress persistence
    std::unique_ptr<mdingest::ProgressStore> progress;
    switch (cfg.progress.backend) {
        case mdingest::ProgressBackend::FILE:
            progress = std::make_unique<mdingest::FileProgressStore>(cfg.progress_path_for(input));
            break;
        case mdingest::ProgressBackend::REDIS: {
            auto redis = std::make_unique<mdingest::RedisProgressStore>(cfg.progress.key_prefix);
            if (redis->connect(cfg.progress.redis_host, cfg.progress.redis_port,
                               cfg.progress.redis_password)) {
                progress = std::move(redis);
            } else {
                LOG_WRN("Redis progress store unavailable, continuing without resume support");
            }
            break;
        }
        case mdingest::ProgressBackend::NONE:
            break;
    }
    if (!progress) progress = std::make_unique<mdingest::NullProgressStore>();

    mdingest::MarkdownQuestionParser parser;
    mdingest::FileRangeReader reader;
    mdingest::Coordinator coordinator(cfg, *entity_store, *question_store, *progress,
                                      parser, reader);

    g_coordinator.store(&coordinator);
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    mdingest::ProcessingResult result = coordinator.process(input);

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_coordinator.store(nullptr);

    if (!cfg.report_path.empty()) {
        std::ofstream f(cfg.report_path);
        if (f.is_open()) {
            f << result.to_json().dump(2) << "\n";
            LOG_INF("Report written to %s", cfg.report_path.c_str());
        } else {
            LOG_ERR("Failed to write report %s", cfg.report_path.c_str());
        }
    }

    print_summary(result);

    if (cfg.store.system == mdingest::StoreSystem::POSTGRESQL) {
        LOG_INF("Collections: %lld questions, %lld options, %lld images, %lld formulas",
            static_cast<long long>(entity_store->count(mdingest::collection::QUESTIONS)),
            static_cast<long long>(entity_store->count(mdingest::collection::OPTIONS)),
            static_cast<long long>(entity_store->count(mdingest::collection::IMAGES)),
            static_cast<long long>(entity_store->count(mdingest::collection::FORMULAS)));
    }

    return result.status == mdingest::RunStatus::FAILED ? 1 : 0;
}
