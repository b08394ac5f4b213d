/**
 * Memory tests: vector store round trip, tombstones and rebuild, durable
 * user tier recovery, keyword fallback, tiered retrieval and session
 * compression.
 *
 * Run from build dir: ./test_vector_memory
 */

#include "memory/vector_memory_store.h"
#include "memory/tiered_memory.h"
#include "memory/conversation_memory.h"
#include "memory/memory_maintenance.h"
#include "logger.h"
#include "test_fakes.h"
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>

using namespace parley;
using namespace parley::memory;
using parley::testing::FlakyEmbedder;
using parley::testing::ScriptedProvider;
using parley::testing::TempDir;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static StoreOptions durable_options(const std::string& dir) {
    StoreOptions opts;
    opts.tier = Tier::User;
    opts.storage_dir = dir;
    opts.file_stem = "alice";
    opts.snapshot_every = 2;
    return opts;
}

int main() {
    Logger::initialize(LogLevel::WARN);
    auto embedder = std::make_shared<HashingEmbeddingProvider>(256);

    // --- round trip: stored text is found with near-perfect similarity ---
    {
        StoreOptions opts;
        opts.tier = Tier::Session;
        VectorMemoryStore store(opts, embedder);
        ASSERT(store.add("likes hiking on weekends").is_ok());
        auto id = store.add("prefers dark mode", RecordMetadata{0.7f, {"preference"}});
        ASSERT(store.add("works as a nurse").is_ok());
        ASSERT(id.is_ok());

        auto hits = store.search("prefers dark mode", 1, 0.0f);
        ASSERT(hits.size() == 1);
        ASSERT(!hits.empty() && hits[0].record.id == id.value());
        ASSERT(!hits.empty() && hits[0].score >= 0.99f);
        ASSERT(!hits.empty() && hits[0].record.has_tag("preference"));
        ASSERT(!hits.empty() && hits[0].record.embedding.size() == embedder->dimensions());

        // min_score filters weak matches
        ASSERT(store.search("quantum chromodynamics lecture", 3, 0.9f).empty());
        ASSERT(!store.add("   ").is_ok());
    }

    // --- tombstones and maintenance ---
    {
        StoreOptions opts;
        opts.tier = Tier::Session;
        opts.rebuild_tombstone_ratio = 0.25f;
        VectorMemoryStore store(opts, embedder);
        std::vector<RecordId> ids;
        for (int i = 0; i < 8; ++i) {
            ids.push_back(store.add("note number " + std::to_string(i)).value());
        }
        ASSERT(store.remove(ids[0]));
        ASSERT(!store.remove(ids[0]));
        ASSERT(!store.get(ids[0]).has_value());
        ASSERT(!store.needs_maintenance());   // 1/8 below ratio
        ASSERT(store.remove(ids[1]));
        ASSERT(store.needs_maintenance());    // 2/8 reaches ratio

        for (const auto& hit : store.search("note number 0", 8, 0.0f)) {
            ASSERT(hit.record.id != ids[0]);
        }

        ASSERT(store.run_maintenance() == 2);
        ASSERT(!store.needs_maintenance());
        ASSERT(store.stats().live_records == 6);
        ASSERT(store.stats().tombstones == 0);
        ASSERT(store.get(ids[5]).has_value());
    }

    // --- capacity tombstones the oldest record ---
    {
        StoreOptions opts;
        opts.tier = Tier::Context;
        opts.capacity = 3;
        VectorMemoryStore store(opts, embedder);
        RecordId first = store.add("first exchange").value();
        store.add("second exchange");
        store.add("third exchange");
        store.add("fourth exchange");
        ASSERT(store.stats().live_records == 3);
        ASSERT(!store.get(first).has_value());
    }

    // --- durable user tier survives a restart ---
    {
        TempDir dir;
        RecordId kept_id = 0;
        RecordId deleted_id = 0;
        {
            VectorMemoryStore store(durable_options(dir.path()), embedder);
            ASSERT(store.open().is_ok());
            kept_id = store.add("my name is Alice").value();
            deleted_id = store.add("temporary fact").value();
            store.add("I prefer tea over coffee");
            ASSERT(store.remove(deleted_id));
        }

        std::ifstream log(dir.path() + "/alice.backup.jsonl");
        ASSERT(log.good());
        std::string line;
        int lines = 0;
        while (std::getline(log, line)) ++lines;
        ASSERT(lines == 4);   // three adds, one delete

        VectorMemoryStore reopened(durable_options(dir.path()), embedder);
        ASSERT(reopened.open().is_ok());
        ASSERT(reopened.stats().live_records == 2);
        ASSERT(reopened.stats().index_available);
        ASSERT(reopened.get(kept_id).has_value());
        ASSERT(!reopened.get(deleted_id).has_value());
        auto hits = reopened.search("my name is Alice", 1, 0.5f);
        ASSERT(hits.size() == 1 && hits[0].record.id == kept_id);

        // New ids continue after the recovered ones
        auto next = reopened.add("another fact");
        ASSERT(next.is_ok() && next.value() > deleted_id);
    }

    // --- corrupted index is rebuilt from the backup log ---
    {
        TempDir dir;
        {
            VectorMemoryStore store(durable_options(dir.path()), embedder);
            ASSERT(store.open().is_ok());
            store.add("I use vim for everything");
            store.add("my favorite color is green");
            ASSERT(store.snapshot().is_ok());
        }
        {
            std::ofstream corrupt(dir.path() + "/alice.index", std::ios::binary | std::ios::trunc);
            corrupt << "garbage";
        }
        VectorMemoryStore reopened(durable_options(dir.path()), embedder);
        ASSERT(reopened.open().is_ok());
        ASSERT(reopened.stats().live_records == 2);
        ASSERT(reopened.stats().index_available);
        auto hits = reopened.search("favorite color", 1, 0.1f);
        ASSERT(hits.size() == 1 && hits[0].record.text == "my favorite color is green");
    }

    // --- embedder outage during recovery degrades to keyword search ---
    {
        TempDir dir;
        auto flaky = std::make_shared<FlakyEmbedder>(64);
        {
            VectorMemoryStore store(durable_options(dir.path()), flaky);
            ASSERT(store.open().is_ok());
            store.add("I work at the observatory");
            store.add("remember the dentist appointment on friday");
        }
        std::remove((dir.path() + "/alice.index").c_str());
        flaky->failing = true;

        VectorMemoryStore reopened(durable_options(dir.path()), flaky);
        ASSERT(reopened.open().is_ok());
        ASSERT(!reopened.stats().index_available);
        ASSERT(reopened.stats().live_records == 2);

        auto hits = reopened.search("when is the dentist appointment", 5, 0.9f);
        ASSERT(!hits.empty());
        ASSERT(!hits.empty() && hits[0].record.text.find("dentist") != std::string::npos);
    }

    // --- query embedding failure on a healthy store also falls back ---
    {
        auto flaky = std::make_shared<FlakyEmbedder>(64);
        StoreOptions opts;
        opts.tier = Tier::Session;
        VectorMemoryStore store(opts, flaky);
        store.add("the wifi password is on the fridge");
        flaky->failing = true;
        auto hits = store.search("wifi password", 3, 0.5f);
        ASSERT(hits.size() == 1);
        ASSERT(!store.add("cannot embed this").is_ok());
    }

    // --- compression: provider summary and local fallback ---
    {
        StoreOptions opts;
        opts.tier = Tier::Session;
        VectorMemoryStore store(opts, embedder);
        ScriptedProvider provider;
        provider.summary_text = "Planned a trip to Lisbon.";

        std::vector<Message> turns = {
            Message::user("I want to visit Lisbon"),
            Message::assistant("Great choice, spring is nice there.")
        };
        auto result = store.compress(turns, provider, RequestOptions());
        ASSERT(result.is_ok());
        ASSERT(result.is_ok() && !result.value().used_fallback);
        ASSERT(result.is_ok() && result.value().summary.rfind("[memory summary]", 0) == 0);
        auto stored = store.get(result.value().id);
        ASSERT(stored.has_value() && stored->has_tag("summary"));

        provider.summarize_error = make_transient_error("timeout");
        auto fallback = store.compress(turns, provider, RequestOptions());
        ASSERT(fallback.is_ok() && fallback.value().used_fallback);
        ASSERT(fallback.is_ok() && fallback.value().summary.find("Lisbon") != std::string::npos);
    }

    // --- tiered memory: remember intent ranks first six turns later ---
    {
        TempDir dir;
        MemoryConfig config;
        TieredMemory tiers(config, embedder, dir.path(), false);
        ASSERT(tiers.open().is_ok());

        auto written = tiers.commit_exchange("Remember I prefer dark mode", "Got it, dark mode it is.");
        ASSERT(written.size() == 2);
        ASSERT(tiers.store(Tier::User).stats().live_records == 1);

        const char* unrelated[][2] = {
            {"What is the capital of France?", "Paris."},
            {"How tall is Mount Everest?", "About 8849 meters."},
            {"Tell me a joke", "Why did the chicken cross the road?"},
            {"What time zone is Tokyo in?", "Japan Standard Time."},
            {"Convert 10 miles to km", "About 16.09 km."},
            {"Who wrote Hamlet?", "Shakespeare."}
        };
        for (const auto& turn : unrelated) {
            tiers.commit_exchange(turn[0], turn[1]);
        }
        ASSERT(tiers.store(Tier::User).stats().live_records == 1);

        auto results = tiers.retrieve("What do I prefer?", 5, config.min_score);
        ASSERT(!results.empty());
        ASSERT(!results.empty() && results[0].record.text == "Remember I prefer dark mode");
        ASSERT(!results.empty() && results[0].record.tier == Tier::User);
    }

    // --- classification and importance ---
    {
        ASSERT(TieredMemory::has_remember_intent("Remember that my flight is at 9"));
        ASSERT(TieredMemory::has_remember_intent("please don't forget the milk"));
        ASSERT(!TieredMemory::has_remember_intent("What is 2 + 2?"));
        ASSERT(TieredMemory::contains_personal_fact("My name is Dana"));
        ASSERT(TieredMemory::contains_personal_fact("I prefer short answers"));
        ASSERT(!TieredMemory::contains_personal_fact("Do I prefer short answers?"));

        float plain = TieredMemory::evaluate_importance("ok", {});
        float rich = TieredMemory::evaluate_importance("I always prefer my favorite editor", {"important"});
        ASSERT(plain == 0.5f);
        ASSERT(rich > plain);
        ASSERT(rich <= 1.0f);
    }

    // --- user identity comes from identity statements only ---
    {
        TempDir dir;
        MemoryConfig config;
        TieredMemory tiers(config, embedder, dir.path(), false);
        tiers.commit_exchange("My name is Dana and I live in Oslo", "Nice to meet you, Dana.");
        tiers.commit_exchange("I prefer metric units", "Noted.");
        auto identity = tiers.user_identity(3);
        ASSERT(identity.size() == 1);
        ASSERT(!identity.empty() && identity[0].text.find("Dana") != std::string::npos);
    }

    // --- session compression runs in the background and keeps recent turns ---
    {
        TempDir dir;
        MemoryConfig config;
        config.compress_threshold = 6;
        config.keep_recent = 2;
        TieredMemory tiers(config, embedder, dir.path(), false);
        ConversationMemory conversation;
        auto provider = std::make_shared<ScriptedProvider>();
        provider->summary_text = "The user asked about gardening.";
        MemoryMaintenance maintenance(tiers, conversation, provider, config, 1000);

        for (int i = 0; i < 3; ++i) {
            conversation.add_messages({Message::user("question " + std::to_string(i)),
                                       Message::assistant("answer " + std::to_string(i))});
        }
        ASSERT(!maintenance.maybe_schedule_compression());   // 6 is not over the threshold

        conversation.add_messages({Message::user("question 3"), Message::assistant("answer 3")});
        ASSERT(maintenance.maybe_schedule_compression());
        ASSERT(maintenance.wait_idle(5000));

        ASSERT(maintenance.compressions_completed() == 1);
        ASSERT(!maintenance.compression_pending());
        auto messages = conversation.get_messages();
        ASSERT(messages.size() == 3);
        ASSERT(!messages.empty() && is_summary_message(messages[0]));
        ASSERT(messages.size() == 3 && messages[2].content == "answer 3");
        ASSERT(tiers.store(Tier::Session).stats().live_records == 1);
        ASSERT(conversation.verbatim_count() == 2);
    }

    // --- compression never splits a tool call from its results ---
    {
        ConversationMemory conversation;
        conversation.add_message(Message::user("find my notes"));
        conversation.add_message(Message::assistant_with_tools("", {ToolCall{"call_1", "search_notes", "{}"}}));
        conversation.add_message(Message::tool("call_1", "Found 1 note"));
        conversation.add_message(Message::assistant("You have one note."));
        auto candidate = conversation.compression_candidate(2);
        ASSERT(candidate.messages.size() == 1);
        ASSERT(!candidate.messages.empty() && candidate.messages.back().role == MessageRole::User);
    }

    // --- index maintenance is scheduled once per tier ---
    {
        TempDir dir;
        MemoryConfig config;
        config.rebuild_tombstone_ratio = 0.5f;
        TieredMemory tiers(config, embedder, dir.path(), false);
        ConversationMemory conversation;
        MemoryMaintenance maintenance(tiers, conversation, nullptr, config, 1000);

        auto a = tiers.store(Tier::Session).add("alpha").value();
        tiers.store(Tier::Session).add("beta");
        tiers.store(Tier::Session).remove(a);
        ASSERT(maintenance.maybe_schedule_index_maintenance() == 1);
        ASSERT(maintenance.wait_idle(5000));
        ASSERT(tiers.store(Tier::Session).stats().tombstones == 0);
        ASSERT(maintenance.maybe_schedule_index_maintenance() == 0);
    }

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed\n";
        return 1;
    }
    std::cout << "test_vector_memory: all passed\n";
    return 0;
}
