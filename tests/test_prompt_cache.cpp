/**
 * Prompt cache tests: normalization, key stability, TTL, LRU and stats.
 *
 * Run from build dir: ./test_prompt_cache
 */

#include "prompt_cache.h"
#include "token_estimator.h"
#include "logger.h"
#include <atomic>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace parley;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    Logger::initialize(LogLevel::WARN);

    // --- volatile fields do not change the key ---
    {
        std::string a = "You are helpful.\nsession_id=abc123\nToday is 2024-05-01T10:15:00Z.";
        std::string b = "You are helpful.\nsession_id=zz-999\nToday is 2025-11-30T23:59:59Z.";
        ASSERT(ContentNormalizer::cache_key(SegmentKind::SystemInstructions, a) ==
               ContentNormalizer::cache_key(SegmentKind::SystemInstructions, b));

        std::string c = "Request 123e4567-e89b-12d3-a456-426614174000 at 10:15";
        std::string d = "Request 00000000-1111-2222-3333-444444444444 at 23:01";
        ASSERT(ContentNormalizer::normalize_text(c) == ContentNormalizer::normalize_text(d));

        std::string e = "Be concise.   \r\n\r\n\r\n\r\nUse   tools  when needed.  ";
        std::string f = "Be concise.\n\nUse tools when needed.";
        ASSERT(ContentNormalizer::normalize_text(e) == f);
        ASSERT(ContentNormalizer::cache_key(SegmentKind::SystemInstructions, e) ==
               ContentNormalizer::cache_key(SegmentKind::SystemInstructions, f));

        // Idempotent: normalizing twice changes nothing
        std::string once = ContentNormalizer::normalize_text(a);
        ASSERT(ContentNormalizer::normalize_text(once) == once);
    }

    // --- different content or kind gives different keys ---
    {
        std::string key_a = ContentNormalizer::cache_key(SegmentKind::SystemInstructions, "Be brief.");
        std::string key_b = ContentNormalizer::cache_key(SegmentKind::SystemInstructions, "Be thorough.");
        std::string key_c = ContentNormalizer::cache_key(SegmentKind::Identity, "Be brief.");
        ASSERT(key_a != key_b);
        ASSERT(key_a != key_c);
        ASSERT(key_a.rfind("system_prompt:", 0) == 0);
        ASSERT(key_a.size() == std::string("system_prompt:").size() + 16);
    }

    // --- tool schema order and key order do not matter ---
    {
        std::string s1 = R"([{"type":"function","function":{"name":"b_tool","description":"B","parameters":{"type":"object"}}},
                            {"type":"function","function":{"name":"a_tool","parameters":{"type":"object"},"description":"A"}}])";
        std::string s2 = R"([{"function":{"description":"A","name":"a_tool","parameters":{"type":"object"}},"type":"function"},
                            {"type":"function","function":{"name":"b_tool","description":"B","parameters":{"type":"object"}}}])";
        ASSERT(ContentNormalizer::cache_key(SegmentKind::ToolSchemas, s1) ==
               ContentNormalizer::cache_key(SegmentKind::ToolSchemas, s2));
        std::string normalized = ContentNormalizer::normalize_tool_schemas(s1);
        ASSERT(normalized.find("a_tool") < normalized.find("b_tool"));
    }

    // --- get/put, hits and misses ---
    {
        PromptCache cache;
        ASSERT(!cache.get(SegmentKind::SystemInstructions, "prompt v1").has_value());
        cache.put(SegmentKind::SystemInstructions, "prompt v1", "rendered v1");

        auto hit = cache.get(SegmentKind::SystemInstructions, "prompt   v1 ");
        ASSERT(hit.has_value());
        ASSERT(hit.has_value() && *hit == "rendered v1");

        CacheStats s = cache.stats();
        ASSERT(s.hits == 1);
        ASSERT(s.misses == 1);
        ASSERT(s.entries == 1);
        ASSERT(s.tokens_saved > 0);
        ASSERT(s.hit_rate() > 0.49 && s.hit_rate() < 0.51);
    }

    // --- get_or_compute only computes on a miss ---
    {
        PromptCache cache;
        int computed = 0;
        auto compute = [&computed]() { computed++; return std::string("value"); };
        bool was_hit = true;
        ASSERT(cache.get_or_compute(SegmentKind::Identity, "who", compute, -1, &was_hit) == "value");
        ASSERT(!was_hit);
        ASSERT(cache.get_or_compute(SegmentKind::Identity, "who", compute, -1, &was_hit) == "value");
        ASSERT(was_hit);
        ASSERT(computed == 1);
    }

    // --- TTL expiry is checked on read ---
    {
        std::atomic<int64_t> fake_now{1000};
        PromptCache cache(CacheConfig(), [&fake_now]() { return fake_now.load(); });
        cache.put(SegmentKind::SystemInstructions, "short lived", "v", 1);
        cache.put(SegmentKind::SystemInstructions, "forever", "v", 0);

        fake_now += 30 * 1000;
        ASSERT(cache.get(SegmentKind::SystemInstructions, "short lived").has_value());

        fake_now += 31 * 1000;
        ASSERT(!cache.get(SegmentKind::SystemInstructions, "short lived").has_value());
        ASSERT(cache.get(SegmentKind::SystemInstructions, "forever").has_value());
        ASSERT(cache.stats().expirations == 1);
        ASSERT(cache.size() == 1);
    }

    // --- LRU eviction beyond the cap ---
    {
        CacheConfig config;
        config.max_entries = 2;
        PromptCache cache(config);
        cache.put(SegmentKind::SystemInstructions, "one", "1");
        cache.put(SegmentKind::SystemInstructions, "two", "2");
        ASSERT(cache.get(SegmentKind::SystemInstructions, "one").has_value());  // "two" is now LRU
        cache.put(SegmentKind::SystemInstructions, "three", "3");

        ASSERT(cache.size() == 2);
        ASSERT(cache.get(SegmentKind::SystemInstructions, "one").has_value());
        ASSERT(!cache.get(SegmentKind::SystemInstructions, "two").has_value());
        ASSERT(cache.get(SegmentKind::SystemInstructions, "three").has_value());
        ASSERT(cache.stats().evictions == 1);
    }

    // --- invalidate_kind and clear ---
    {
        PromptCache cache;
        cache.put(SegmentKind::ToolSchemas, "[]", "[]");
        cache.put(SegmentKind::Identity, "me", "About me");
        ASSERT(cache.invalidate_kind(SegmentKind::ToolSchemas) == 1);
        ASSERT(cache.size() == 1);
        cache.clear();
        ASSERT(cache.size() == 0);
        ASSERT(cache.stats().hits == 0);
    }

    // --- concurrent readers ---
    {
        PromptCache cache;
        cache.put(SegmentKind::SystemInstructions, "shared", "fragment");
        std::atomic<int> found{0};
        std::vector<std::thread> readers;
        for (int t = 0; t < 4; ++t) {
            readers.emplace_back([&]() {
                for (int i = 0; i < 200; ++i) {
                    if (cache.get(SegmentKind::SystemInstructions, "shared")) found++;
                }
            });
        }
        for (auto& r : readers) r.join();
        ASSERT(found == 800);
        ASSERT(cache.stats().hits == 800);
    }

    // --- token estimator weights and calibration ---
    {
        TokenEstimator estimator;
        ASSERT(estimator.estimate(std::string(400, 'a')) == 100);
        ASSERT(TokenEstimator::raw_estimate("\xE4\xBD\xA0\xE5\xA5\xBD") > TokenEstimator::raw_estimate("ab"));

        // Provider consistently reports twice the heuristic
        const std::string prompt(400, 'a');
        for (int i = 0; i < 50; ++i) {
            estimator.calibrate(estimator.estimate(prompt), 200);
        }
        ASSERT(estimator.scale() > 1.9 && estimator.scale() <= 2.0);
        ASSERT(estimator.estimate(prompt) > 190);

        estimator.calibrate(estimator.estimate(prompt), 100000);
        ASSERT(estimator.scale() <= 3.0);
        ASSERT(estimator.calibration_samples() == 51);
    }

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed\n";
        return 1;
    }
    std::cout << "test_prompt_cache: all passed\n";
    return 0;
}
