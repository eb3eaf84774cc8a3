/**
 * Transcript turn assembly: running updates, turn completion, speaker changes.
 */

#include "transcript_aggregator.h"
#include "logger.h"
#include <iostream>

using namespace duplex_voice;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static TranscriptFragment fragment(Speaker speaker, const std::string& text, bool is_final = false) {
    TranscriptFragment f;
    f.speaker = speaker;
    f.text = text;
    f.is_final = is_final;
    return f;
}

int main() {
    Logger::initialize(LogLevel::WARN);

    // --- Deltas accumulate into one turn ---
    {
        TranscriptAggregator agg;
        auto u1 = agg.append(fragment(Speaker::Local, "I saw"));
        ASSERT(u1.size() == 1);
        ASSERT(u1[0].speaker == Speaker::Local && u1[0].text == "I saw" && !u1[0].turn_complete);

        auto u2 = agg.append(fragment(Speaker::Local, " a bird"));
        ASSERT(u2.size() == 1);
        ASSERT(u2[0].text == "I saw a bird" && !u2[0].turn_complete);
        ASSERT(agg.pending(Speaker::Local) == "I saw a bird");

        auto u3 = agg.append(fragment(Speaker::Local, "", true));
        ASSERT(u3.size() == 1);
        ASSERT(u3[0].text == "I saw a bird" && u3[0].turn_complete);
        ASSERT(agg.pending(Speaker::Local).empty());

        auto u4 = agg.append(fragment(Speaker::Remote, "Nice!", true));
        ASSERT(u4.size() == 1);
        ASSERT(u4[0].speaker == Speaker::Remote && u4[0].text == "Nice!" && u4[0].turn_complete);
        ASSERT(agg.completed_turns() == 2);
    }

    // --- Speaker change closes the other open turn first ---
    {
        TranscriptAggregator agg;
        agg.append(fragment(Speaker::Local, "hello there"));
        auto updates = agg.append(fragment(Speaker::Remote, "Hi"));
        ASSERT(updates.size() == 2);
        ASSERT(updates[0].speaker == Speaker::Local && updates[0].turn_complete);
        ASSERT(updates[0].text == "hello there");
        ASSERT(updates[1].speaker == Speaker::Remote && !updates[1].turn_complete);
        ASSERT(updates[1].text == "Hi");
        ASSERT(agg.pending(Speaker::Local).empty());
        ASSERT(agg.pending(Speaker::Remote) == "Hi");
    }

    // --- Completed text is trimmed; whitespace-only turns emit nothing ---
    {
        TranscriptAggregator agg;
        agg.append(fragment(Speaker::Remote, "  Sure thing "));
        auto done = agg.append(fragment(Speaker::Remote, "", true));
        ASSERT(done.size() == 1 && done[0].text == "Sure thing");

        ASSERT(agg.append(fragment(Speaker::Remote, "   ")).size() == 1);  // running update still surfaces
        auto blank = agg.append(fragment(Speaker::Remote, "", true));
        ASSERT(blank.empty());
        ASSERT(agg.completed_turns() == 1);

        ASSERT(agg.append(fragment(Speaker::Local, "")).empty());  // empty delta, nothing new
    }

    // --- Repeated fragments are not deduplicated ---
    {
        TranscriptAggregator agg;
        agg.append(fragment(Speaker::Remote, "ha"));
        auto again = agg.append(fragment(Speaker::Remote, "ha"));
        ASSERT(again.size() == 1 && again[0].text == "haha");
    }

    // --- reset() drops open turns silently ---
    {
        TranscriptAggregator agg;
        agg.append(fragment(Speaker::Local, "half a sen"));
        agg.reset();
        ASSERT(agg.pending(Speaker::Local).empty());
        auto after = agg.append(fragment(Speaker::Remote, "Fresh start", true));
        ASSERT(after.size() == 1 && after[0].text == "Fresh start");
    }

    Logger::shutdown();

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All transcript aggregator tests passed.\n";
    return 0;
}
