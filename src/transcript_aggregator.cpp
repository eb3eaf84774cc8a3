#include "transcript_aggregator.h"
#include "logger.h"
#include "utils.h"

namespace duplex_voice {

TranscriptAggregator::TranscriptAggregator()
    : has_last_speaker_(false), last_speaker_(Speaker::Remote), completed_turns_(0) {}

std::vector<TranscriptUpdate> TranscriptAggregator::append(const TranscriptFragment& fragment) {
    std::vector<TranscriptUpdate> updates;

    // Speaker change closes the other side's open turn first
    if (has_last_speaker_ && last_speaker_ != fragment.speaker) {
        close_turn(last_speaker_, updates);
    }
    has_last_speaker_ = true;
    last_speaker_ = fragment.speaker;

    std::string& buffer = buffer_for(fragment.speaker);
    buffer += fragment.text;

    if (fragment.is_final) {
        close_turn(fragment.speaker, updates);
    } else if (!fragment.text.empty()) {
        TranscriptUpdate running;
        running.speaker = fragment.speaker;
        running.text = buffer;
        running.turn_complete = false;
        updates.push_back(std::move(running));
    }
    return updates;
}

const std::string& TranscriptAggregator::pending(Speaker speaker) const {
    return speaker == Speaker::Local ? local_ : remote_;
}

void TranscriptAggregator::reset() {
    local_.clear();
    remote_.clear();
    has_last_speaker_ = false;
}

std::string& TranscriptAggregator::buffer_for(Speaker speaker) {
    return speaker == Speaker::Local ? local_ : remote_;
}

bool TranscriptAggregator::close_turn(Speaker speaker, std::vector<TranscriptUpdate>& out) {
    std::string& buffer = buffer_for(speaker);
    if (utils::is_empty_or_whitespace(buffer)) {
        buffer.clear();
        return false;
    }

    TranscriptUpdate done;
    done.speaker = speaker;
    done.text = utils::trim_copy(buffer);
    done.turn_complete = true;
    buffer.clear();
    completed_turns_++;

    LOG_TRANSCRIPT(std::string(speaker_name(speaker)) + " turn: " + utils::truncate_for_log(done.text, 80));
    out.push_back(std::move(done));
    return true;
}

} // namespace duplex_voice
