#include "mediaprobe/range_cache.hpp"
#include "mediaprobe/memory_reader.hpp"
#include "mediaprobe/settings.hpp"
#include "mediaprobe/errors.hpp"

#include <cxxopts.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <vector>
#include <string>
#include <random>
#include <thread>
#include <atomic>
#include <chrono>
#include <functional>

struct BenchConfig {
    int num_threads = 4;
    int num_sessions = 200;
    int num_resources = 8;
    int object_mb = 32;
    int chunk_kb = 4096;
    int capacity_mb = 32;
    int reads_per_session = 32;
    double seek_ratio = 0.25;
    int latency_us = 0;
};

struct Stats {
    std::atomic<int> sessions{0};
    std::atomic<int> reads{0};
    std::atomic<int> errors{0};
};

// Replays one engine-like session: mostly reads that continue after the
// previous range, with occasional jumps to a random offset.
void replay_session(mediaprobe::RangeCache& cache,
                    const BenchConfig& cfg,
                    const std::string& resource,
                    std::int64_t object_len,
                    std::mt19937& rng,
                    Stats& stats) {
    std::uniform_real_distribution<> op_dist(0.0, 1.0);
    std::uniform_int_distribution<std::int64_t> offset_dist(0, object_len - 1);

    std::int64_t offset = 0;
    for (int i = 0; i < cfg.reads_per_session; ++i) {
        auto range = cache.GetOrFetch(resource, offset);
        stats.reads++;

        if (op_dist(rng) < cfg.seek_ratio) {
            offset = offset_dist(rng);
        } else {
            offset = range->range.End();
        }
        if (offset >= object_len) {
            break;
        }
    }
    stats.sessions++;
}

void worker_thread(mediaprobe::RangeCache& cache,
                   const BenchConfig& cfg,
                   Stats& stats,
                   const std::vector<std::string>& resources,
                   int thread_id) {
    std::mt19937 rng(thread_id);
    std::uniform_int_distribution<int> resource_dist(0, static_cast<int>(resources.size()) - 1);
    const std::int64_t object_len = static_cast<std::int64_t>(cfg.object_mb) * 1024 * 1024;

    int sessions_per_thread = cfg.num_sessions / cfg.num_threads;

    for (int i = 0; i < sessions_per_thread; ++i) {
        const auto& resource = resources[resource_dist(rng)];
        try {
            replay_session(cache, cfg, resource, object_len, rng, stats);
        } catch (const mediaprobe::AnalysisError& e) {
            stats.errors++;
            spdlog::error("session on {} failed: {}", resource, e.what());
        }
    }
}

int main(int argc, char** argv) {
    cxxopts::Options options("rangebench", "Replay benchmark for the mediaprobe RangeCache");
    options.add_options()
        ("t,threads", "Number of worker threads", cxxopts::value<int>()->default_value("4"))
        ("s,sessions", "Total number of replayed sessions", cxxopts::value<int>()->default_value("200"))
        ("r,resources", "Number of distinct objects", cxxopts::value<int>()->default_value("8"))
        ("object-mb", "Size of each object in MiB", cxxopts::value<int>()->default_value("32"))
        ("chunk-kb", "Fetch chunk length in KiB", cxxopts::value<int>()->default_value("4096"))
        ("capacity-mb", "Cache capacity in MiB", cxxopts::value<int>()->default_value("32"))
        ("reads", "Reads per session", cxxopts::value<int>()->default_value("32"))
        ("seek-ratio", "Probability that a read is a random seek (0.0 to 1.0)", cxxopts::value<double>()->default_value("0.25"))
        ("latency-us", "Simulated fetch latency in microseconds", cxxopts::value<int>()->default_value("0"))
        ("log-level", "spdlog level", cxxopts::value<std::string>()->default_value("warn"))
        ("h,help", "Print usage");

    cxxopts::ParseResult result;
    try {
        result = options.parse(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 2;
    }

    if (result.count("help")) {
      std::cout << options.help() << std::endl;
      return 0;
    }

    BenchConfig cfg;
    cfg.num_threads = result["threads"].as<int>();
    cfg.num_sessions = result["sessions"].as<int>();
    cfg.num_resources = result["resources"].as<int>();
    cfg.object_mb = result["object-mb"].as<int>();
    cfg.chunk_kb = result["chunk-kb"].as<int>();
    cfg.capacity_mb = result["capacity-mb"].as<int>();
    cfg.reads_per_session = result["reads"].as<int>();
    cfg.seek_ratio = result["seek-ratio"].as<double>();
    cfg.latency_us = result["latency-us"].as<int>();

    if (cfg.num_threads <= 0 || cfg.num_resources <= 0 || cfg.object_mb <= 0 ||
        cfg.chunk_kb <= 0 || cfg.capacity_mb <= 0) {
        std::cerr << "threads, resources, object-mb, chunk-kb and capacity-mb must be positive" << std::endl;
        return 2;
    }

    mediaprobe::Config probe_cfg;
    probe_cfg.chunk_length_bytes = static_cast<std::uint64_t>(cfg.chunk_kb) * 1024;
    probe_cfg.capacity_bytes = static_cast<std::uint64_t>(cfg.capacity_mb) * 1024 * 1024;
    probe_cfg.log_level = result["log-level"].as<std::string>();
    try {
        mediaprobe::ConfigureLogging(probe_cfg);
    } catch (const mediaprobe::AnalysisError& e) {
        std::cerr << e.what() << std::endl;
        return 2;
    }

    std::cout << "--- Benchmark Configuration ---" << std::endl;
    std::cout << "Threads: " << cfg.num_threads << std::endl;
    std::cout << "Sessions: " << cfg.num_sessions << std::endl;
    std::cout << "Objects: " << cfg.num_resources << " x " << cfg.object_mb << " MiB" << std::endl;
    std::cout << "Chunk: " << cfg.chunk_kb << " KiB, Capacity: " << cfg.capacity_mb << " MiB" << std::endl;
    std::cout << "Reads/session: " << cfg.reads_per_session << ", Seek ratio: " << cfg.seek_ratio << std::endl;
    std::cout << "Fetch latency: " << cfg.latency_us << " us" << std::endl;
    std::cout << "-----------------------------" << std::endl;

    // Populate the objects
    mediaprobe::MemoryReader reader;
    reader.SetFetchDelay(std::chrono::microseconds(cfg.latency_us));
    std::vector<std::string> resources;
    const std::size_t object_len = static_cast<std::size_t>(cfg.object_mb) * 1024 * 1024;
    for (int i = 0; i < cfg.num_resources; ++i) {
        std::string name = "bench/object-" + std::to_string(i) + ".mp4";
        reader.Put(name, mediaprobe::MakePatternBytes(object_len, static_cast<std::uint32_t>(i)));
        resources.push_back(name);
    }

    mediaprobe::RangeCache cache(probe_cfg, reader);

    std::vector<std::thread> threads;
    std::vector<Stats> thread_stats(cfg.num_threads);

    auto start_time = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < cfg.num_threads; ++i) {
        threads.emplace_back(worker_thread, std::ref(cache), std::cref(cfg), std::ref(thread_stats[i]), std::cref(resources), i);
    }

    for (auto& t : threads) {
        t.join();
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    double total_duration_s = std::chrono::duration<double>(end_time - start_time).count();

    int sessions = 0, reads = 0, errors = 0;
    for (const auto& s : thread_stats) {
        sessions += s.sessions.load();
        reads += s.reads.load();
        errors += s.errors.load();
    }

    const mediaprobe::CacheStats cs = cache.Stats();
    const std::uint64_t lookups = cs.hits + cs.misses;
    double hit_rate = (lookups > 0) ? (double)cs.hits / lookups * 100.0 : 0.0;
    double reads_per_sec = (total_duration_s > 0) ? reads / total_duration_s : 0.0;

    std::cout << "----------- Results -----------" << std::endl;
    std::cout << "Total duration: " << total_duration_s << " s" << std::endl;
    std::cout << "Sessions completed: " << sessions << " (" << errors << " failed)" << std::endl;
    std::cout << "Reads per second: " << reads_per_sec << std::endl;
    std::cout << "Cache hit rate: " << hit_rate << " %" << std::endl;
    std::cout << "Remote fetches: " << cs.fetches << std::endl;
    std::cout << "Bytes fetched: " << cs.fetched_bytes << std::endl;
    std::cout << "Flushes: " << cs.flushes << std::endl;
    std::cout << "-----------------------------" << std::endl;

    return errors == 0 ? 0 : 1;
}
