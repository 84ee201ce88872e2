#include "pipeline/TranscriptBuffer.hpp"

TranscriptBuffer::TranscriptBuffer(size_t maxLines)
    : maxLines_(maxLines > 0 ? maxLines : 1) {}

void TranscriptBuffer::commit(std::deque<std::string>& lines, const std::string& text,
                              size_t maxLines) {
    lines.push_back(text);
    while (lines.size() > maxLines)
        lines.pop_front();
}

void TranscriptBuffer::apply(const TranslationResult& result) {
    std::lock_guard lock(mtx_);

    if (!result.sourceText.empty()) {
        if (result.isFinal) {
            commit(source_, result.sourceText, maxLines_);
            liveSource_.clear();
        } else {
            liveSource_ = result.sourceText;
        }
    }

    if (!result.translatedText.empty()) {
        if (result.isFinal) {
            commit(translation_, result.translatedText, maxLines_);
            liveTranslation_.clear();
        } else {
            liveTranslation_ += result.translatedText;
        }
    }
}

void TranscriptBuffer::clear() {
    std::lock_guard lock(mtx_);
    source_.clear();
    translation_.clear();
    liveSource_.clear();
    liveTranslation_.clear();
}

TranscriptBuffer::Snapshot TranscriptBuffer::snapshot() const {
    std::lock_guard lock(mtx_);
    Snapshot s;
    s.source.assign(source_.begin(), source_.end());
    s.translation.assign(translation_.begin(), translation_.end());
    s.liveSource      = liveSource_;
    s.liveTranslation = liveTranslation_;
    return s;
}
