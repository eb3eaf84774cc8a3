#pragma once

#include "common.h"
#include <string>
#include <vector>

namespace duplex_voice {

/**
 * @brief Running or completed turn text for one speaker
 */
struct TranscriptUpdate {
    Speaker speaker = Speaker::Remote;
    std::string text;          ///< Whole turn so far, not just the latest delta
    bool turn_complete = false;
};

/**
 * @brief Accumulates transcript deltas into per-speaker turns
 *
 * One buffer per speaker. A final fragment, or a fragment from the other
 * speaker, closes the open turn. Fragments are applied in arrival order with
 * no reordering or deduplication. Not thread-safe; owned by the receive path.
 */
class TranscriptAggregator {
public:
    TranscriptAggregator();

    /**
     * @brief Apply one fragment
     * @return Updates in the order the caller should surface them (0 to 2)
     */
    std::vector<TranscriptUpdate> append(const TranscriptFragment& fragment);

    /// Text of the open turn for `speaker` (empty between turns)
    const std::string& pending(Speaker speaker) const;

    /// Drop both open turns without emitting anything
    void reset();

    size_t completed_turns() const { return completed_turns_; }

private:
    std::string& buffer_for(Speaker speaker);
    bool close_turn(Speaker speaker, std::vector<TranscriptUpdate>& out);

    std::string local_;
    std::string remote_;
    bool has_last_speaker_;
    Speaker last_speaker_;
    size_t completed_turns_;
};

} // namespace duplex_voice
