#ifndef CHUNKED_CONTAINER_HPP
#define CHUNKED_CONTAINER_HPP

#include <algorithm>
#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace pcimport {

constexpr std::ptrdiff_t kDefaultChunkCapacity = 100000;
constexpr std::ptrdiff_t kDefaultYieldInterval = 50000;

class OutOfRange : public std::out_of_range {
   public:
    OutOfRange(std::ptrdiff_t index, size_t length)
        : std::out_of_range("index " + std::to_string(index) + " out of range for length " +
                            std::to_string(length)),
          index_(index) {}

    std::ptrdiff_t index() const { return index_; }

   private:
    std::ptrdiff_t index_;
};

struct ContainerOptions {
    std::ptrdiff_t chunk_capacity = kDefaultChunkCapacity;
    std::ptrdiff_t yield_interval = kDefaultYieldInterval;
    // invoked between bounded units of work; empty means never yield
    std::function<void()> yielder;

    ContainerOptions Normalized() const {
        ContainerOptions options = *this;
        if (options.chunk_capacity < 1)
            options.chunk_capacity = 1;
        if (options.yield_interval < 1)
            options.yield_interval = kDefaultYieldInterval;
        return options;
    }
};

// Array-like storage split into chunks of at most chunk_capacity elements.
// Every chunk except the last one is full, so index i always lives in chunk
// i / chunk_capacity at offset i % chunk_capacity.
//
// The last chunk is either sealed (stored size == logical size) or growable
// while AppendOne fills it, in which case its stored size may run ahead of
// the logical size. TrimLastChunk() seals it again.
//
// AppendOne and TrimLastChunk require T to be default constructible.
template <typename T>
class ChunkedContainer {
   public:
    using Chunk = std::vector<T>;
    using value_type = T;

    struct Sealed {};

    struct Growable {
        size_t last_len;
    };

    using TailState = std::variant<Sealed, Growable>;

    class const_iterator {
       public:
        using iterator_category = std::forward_iterator_tag;
        using iterator_concept = std::forward_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;

        const_iterator() = default;

        const_iterator(const ChunkedContainer* owner, size_t remaining)
            : owner_(owner), chunk_(0), offset_(0), remaining_(remaining), chunk_end_(0) {
            EnterChunk();
        }

        reference operator*() const { return owner_->chunks_[chunk_][offset_]; }

        pointer operator->() const { return &owner_->chunks_[chunk_][offset_]; }

        const_iterator& operator++() {
            ++offset_;
            --remaining_;
            if (offset_ >= chunk_end_) {
                ++chunk_;
                offset_ = 0;
                EnterChunk();
            }
            return *this;
        }

        const_iterator operator++(int) {
            const_iterator tmp = *this;
            ++(*this);
            return tmp;
        }

        bool operator==(const const_iterator& other) const { return remaining_ == other.remaining_; }

        size_t remaining() const { return remaining_; }

       private:
        // skips to the next chunk with something left to emit
        void EnterChunk() {
            while (remaining_ > 0) {
                if (chunk_ >= owner_->chunks_.size()) {
                    remaining_ = 0;
                    return;
                }
                chunk_end_ = std::min(owner_->LogicalChunkSize(chunk_), remaining_);
                if (chunk_end_ > 0)
                    return;
                ++chunk_;
            }
        }

        const ChunkedContainer* owner_ = nullptr;
        size_t chunk_ = 0;
        size_t offset_ = 0;
        size_t remaining_ = 0;
        size_t chunk_end_ = 0;
    };

    // Same sequence as begin()/end(), running the yielder after every
    // `every` elements.
    class YieldingRange {
       public:
        class iterator {
           public:
            using iterator_category = std::forward_iterator_tag;
            using iterator_concept = std::forward_iterator_tag;
            using value_type = T;
            using difference_type = std::ptrdiff_t;
            using pointer = const T*;
            using reference = const T&;

            iterator() = default;

            iterator(const_iterator it, const YieldingRange* range) : it_(it), range_(range), since_yield_(0) {}

            reference operator*() const { return *it_; }

            pointer operator->() const { return it_.operator->(); }

            iterator& operator++() {
                ++it_;
                if (++since_yield_ >= range_->every_) {
                    since_yield_ = 0;
                    if (range_->yielder_ && it_.remaining() > 0)
                        range_->yielder_();
                }
                return *this;
            }

            iterator operator++(int) {
                iterator tmp = *this;
                ++(*this);
                return tmp;
            }

            bool operator==(const iterator& other) const { return it_ == other.it_; }

           private:
            const_iterator it_;
            const YieldingRange* range_ = nullptr;
            size_t since_yield_ = 0;
        };

        YieldingRange(const ChunkedContainer* owner, size_t every, std::function<void()> yielder)
            : owner_(owner), every_(every), yielder_(std::move(yielder)) {}

        iterator begin() const { return iterator(owner_->begin(), this); }

        iterator end() const { return iterator(owner_->end(), this); }

        size_t every() const { return every_; }

       private:
        const ChunkedContainer* owner_;
        size_t every_;
        std::function<void()> yielder_;
    };

    explicit ChunkedContainer(std::ptrdiff_t chunk_capacity = kDefaultChunkCapacity)
        : ChunkedContainer(ContainerOptions{chunk_capacity, kDefaultYieldInterval, {}}) {}

    explicit ChunkedContainer(const ContainerOptions& options) {
        ContainerOptions normalized = options.Normalized();
        chunk_capacity_ = static_cast<size_t>(normalized.chunk_capacity);
        yield_interval_ = static_cast<size_t>(normalized.yield_interval);
        yielder_ = std::move(normalized.yielder);
    }

    // Absent when the index does not resolve into [0, size()).
    std::optional<T> Get(std::ptrdiff_t index) const {
        auto resolved = ResolveIndex(index);
        if (!resolved)
            return std::nullopt;
        return chunks_[*resolved / chunk_capacity_][*resolved % chunk_capacity_];
    }

    T& At(std::ptrdiff_t index) {
        auto resolved = ResolveIndex(index);
        if (!resolved)
            throw OutOfRange(index, length_);
        return chunks_[*resolved / chunk_capacity_][*resolved % chunk_capacity_];
    }

    const T& At(std::ptrdiff_t index) const {
        auto resolved = ResolveIndex(index);
        if (!resolved)
            throw OutOfRange(index, length_);
        return chunks_[*resolved / chunk_capacity_][*resolved % chunk_capacity_];
    }

    void Set(std::ptrdiff_t index, T value) { At(index) = std::move(value); }

    // Takes ownership of the batch. When it fits in one chunk and the tail
    // is full, the vector itself becomes the chunk without copying elements.
    void AppendBatch(Chunk&& batch, std::optional<std::ptrdiff_t> valid_length = std::nullopt) {
        size_t count = ClampValidLength(batch.size(), valid_length);
        if (count == 0)
            return;

        ReconcileTail();
        if (TailRoom() == 0 && count <= chunk_capacity_) {
            batch.erase(batch.begin() + static_cast<std::ptrdiff_t>(count), batch.end());
            chunks_.push_back(std::move(batch));
            length_ += count;
            tail_ = Sealed{};
            CountForYield(count);
            return;
        }
        AppendCopies(batch.data(), count);
    }

    void AppendBatch(std::span<const T> batch, std::optional<std::ptrdiff_t> valid_length = std::nullopt) {
        size_t count = ClampValidLength(batch.size(), valid_length);
        if (count == 0)
            return;

        ReconcileTail();
        AppendCopies(batch.data(), count);
    }

    void AppendBatch(const T* data, size_t size) {
        if (data == nullptr || size == 0)
            return;
        AppendBatch(std::span<const T>(data, size));
    }

    T& AppendOne(T value) {
        auto* growable = std::get_if<Growable>(&tail_);
        if (chunks_.empty() || growable == nullptr || growable->last_len >= chunk_capacity_) {
            if (!chunks_.empty() && growable == nullptr && chunks_.back().size() < chunk_capacity_) {
                // reopen a short sealed tail, a new chunk would leave it in the interior
                tail_ = Growable{chunks_.back().size()};
            } else {
                chunks_.emplace_back();
                tail_ = Growable{0};
            }
            growable = std::get_if<Growable>(&tail_);
        }

        Chunk& chunk = chunks_.back();
        if (chunk.size() <= growable->last_len)
            Grow(chunk, growable->last_len + 1);

        T& slot = chunk[growable->last_len];
        slot = std::move(value);
        ++growable->last_len;
        ++length_;
        return slot;
    }

    void TrimLastChunk() {
        if (chunks_.empty()) {
            tail_ = Sealed{};
            return;
        }

        if (auto* growable = std::get_if<Growable>(&tail_)) {
            Chunk& chunk = chunks_.back();
            if (growable->last_len == 0) {
                chunks_.pop_back();
            } else if (growable->last_len < chunk.size()) {
                chunk.erase(chunk.begin() + static_cast<std::ptrdiff_t>(growable->last_len), chunk.end());
                chunk.shrink_to_fit();
            }
        }
        tail_ = Sealed{};
    }

    void Clear() {
        chunks_.clear();
        length_ = 0;
        tail_ = Sealed{};
        since_yield_ = 0;
    }

    const_iterator begin() const { return const_iterator(this, length_); }

    const_iterator end() const { return const_iterator(this, 0); }

    // every <= 0 falls back to the configured yield interval.
    YieldingRange EachYielding(std::ptrdiff_t every = 0) const {
        size_t step = every > 0 ? static_cast<size_t>(every) : yield_interval_;
        return YieldingRange(this, step, yielder_);
    }

    // Logical contents of one chunk, excluding growable over-allocation.
    std::span<const T> ChunkSpan(size_t chunk_index) const {
        if (chunk_index >= chunks_.size())
            return {};
        return std::span<const T>(chunks_[chunk_index].data(), LogicalChunkSize(chunk_index));
    }

    // Raw chunks. The last one may carry unused storage while growable.
    const std::vector<Chunk>& Chunks() const { return chunks_; }

    void SetYielder(std::function<void()> yielder) { yielder_ = std::move(yielder); }

    size_t size() const { return length_; }

    bool empty() const { return length_ == 0; }

    size_t chunk_capacity() const { return chunk_capacity_; }

    size_t yield_interval() const { return yield_interval_; }

    size_t ChunkCount() const { return chunks_.size(); }

    const TailState& tail_state() const { return tail_; }

    bool IsGrowable() const { return std::holds_alternative<Growable>(tail_); }

    size_t LastLen() const {
        auto* growable = std::get_if<Growable>(&tail_);
        return growable ? growable->last_len : 0;
    }

   private:
    static constexpr size_t kMinGrowth = 16;

    std::optional<size_t> ResolveIndex(std::ptrdiff_t index) const {
        std::ptrdiff_t candidate = index;
        if (candidate < 0)
            candidate += static_cast<std::ptrdiff_t>(length_);
        if (candidate < 0 || static_cast<size_t>(candidate) >= length_)
            return std::nullopt;
        return static_cast<size_t>(candidate);
    }

    static size_t ClampValidLength(size_t source_size, std::optional<std::ptrdiff_t> valid_length) {
        if (!valid_length)
            return source_size;
        if (*valid_length <= 0)
            return 0;
        return std::min(static_cast<size_t>(*valid_length), source_size);
    }

    size_t LogicalChunkSize(size_t chunk_index) const {
        if (chunk_index + 1 == chunks_.size()) {
            if (auto* growable = std::get_if<Growable>(&tail_))
                return growable->last_len;
        }
        return chunks_[chunk_index].size();
    }

    // Room left in a sealed tail. Zero when there is no tail.
    size_t TailRoom() const {
        if (chunks_.empty())
            return 0;
        return chunk_capacity_ - LogicalChunkSize(chunks_.size() - 1);
    }

    void ReconcileTail() {
        if (IsGrowable())
            TrimLastChunk();
    }

    // Doubles stored size, never beyond chunk_capacity_.
    void Grow(Chunk& chunk, size_t required) {
        size_t target = std::max(chunk.size() * 2, kMinGrowth);
        target = std::min(target, chunk_capacity_);
        chunk.resize(std::max(target, required));
    }

    void AppendCopies(const T* data, size_t count) {
        size_t offset = 0;

        size_t room = TailRoom();
        if (room > 0) {
            size_t take = std::min(room, count);
            Chunk& tail = chunks_.back();
            tail.insert(tail.end(), data, data + take);
            length_ += take;
            offset += take;
            CountForYield(take);
        }

        while (offset < count) {
            size_t take = std::min(chunk_capacity_, count - offset);
            if (take == 0)
                break;
            chunks_.emplace_back(data + offset, data + offset + take);
            length_ += take;
            offset += take;
            tail_ = Sealed{};
            CountForYield(take);
        }
        tail_ = Sealed{};
    }

    void CountForYield(size_t appended) {
        since_yield_ += appended;
        if (since_yield_ < yield_interval_)
            return;
        since_yield_ = 0;
        if (yielder_)
            yielder_();
    }

    std::vector<Chunk> chunks_;
    size_t chunk_capacity_ = 1;
    size_t yield_interval_ = 1;
    size_t length_ = 0;
    size_t since_yield_ = 0;
    TailState tail_ = Sealed{};
    std::function<void()> yielder_;
};

}  // namespace pcimport

#endif
