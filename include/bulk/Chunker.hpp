#pragma once
#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

namespace bulk {

// chunk[i] holds the elements of source i that fall in the window; empty means absent
template <typename T>
using Chunk = std::vector<std::vector<T>>;

// Lazy, single-pass split of N sources into windows of `size` elements over the
// concatenation source 0, source 1, ... Every chunk is full except possibly the last.
template <typename T>
class ChunkGenerator {
public:
    ChunkGenerator(std::vector<std::vector<T>> sources, int size)
        : sources_(std::move(sources)) {
        if (size <= 0) throw std::invalid_argument("chunk size must be positive");
        size_ = (size_t)size;
    }

    // false once every source is exhausted; out is left untouched in that case
    bool next(Chunk<T>& out) {
        skip_exhausted();
        if (src_ >= sources_.size()) return false;

        Chunk<T> chunk(sources_.size());
        size_t taken = 0;
        while (taken < size_ && src_ < sources_.size()) {
            const auto& s = sources_[src_];
            if (pos_ < s.size()) {
                chunk[src_].push_back(s[pos_++]);
                ++taken;
            } else {
                ++src_;
                pos_ = 0;
            }
        }

        out = std::move(chunk);
        return true;
    }

    size_t num_sources() const { return sources_.size(); }
    size_t chunk_size() const { return size_; }

private:
    std::vector<std::vector<T>> sources_;
    size_t size_ = 0;
    size_t src_ = 0;
    size_t pos_ = 0;

    void skip_exhausted() {
        while (src_ < sources_.size() && pos_ >= sources_[src_].size()) {
            ++src_;
            pos_ = 0;
        }
    }
};

template <typename T>
ChunkGenerator<T> gen_chunks(std::vector<std::vector<T>> sources, int size = 10) {
    return ChunkGenerator<T>(std::move(sources), size);
}

} // namespace bulk
