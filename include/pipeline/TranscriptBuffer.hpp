#pragma once
#include "core/TranslationResult.hpp"
#include <deque>
#include <mutex>
#include <string>
#include <vector>

// Merges a channel's interim/final results into display lines.
//
//   final source       -> committed source line, live source cleared
//   interim source     -> replaces the live source line
//   translation delta  -> appended to the live translation line
//   final translation  -> committed translation line, live translation cleared
//
// Thread-safe: apply() runs on a network thread, snapshot() on the UI thread.
class TranscriptBuffer {
public:
    struct Snapshot {
        std::vector<std::string> source;        // committed, oldest first
        std::vector<std::string> translation;
        std::string liveSource;
        std::string liveTranslation;
    };

    explicit TranscriptBuffer(size_t maxLines = 500);

    void apply(const TranslationResult& result);
    void clear();

    Snapshot snapshot() const;

private:
    static void commit(std::deque<std::string>& lines, const std::string& text,
                       size_t maxLines);

    size_t maxLines_;

    mutable std::mutex mtx_;
    std::deque<std::string> source_;
    std::deque<std::string> translation_;
    std::string liveSource_;
    std::string liveTranslation_;
};
