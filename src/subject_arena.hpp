#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

// Append-only byte arena holding the subject list of one location group.
// Entries are packed as [u32 length][bytes] into fixed-size blocks; an entry
// larger than a block gets a block of its own. capacity_bytes bounds the
// packed bytes (0 = unbounded) and append() throws arena_exhausted past it.
class SubjectArena {
public:
    static constexpr size_t DEFAULT_BLOCK_BYTES = 64 * 1024;

    explicit SubjectArena(size_t capacity_bytes = 0, size_t block_bytes = DEFAULT_BLOCK_BYTES);

    SubjectArena(SubjectArena&&) = default;
    SubjectArena& operator=(SubjectArena&&) = default;
    SubjectArena(const SubjectArena&) = delete;
    SubjectArena& operator=(const SubjectArena&) = delete;

    void append(std::string_view subject);

    // visits entries in insertion order
    void for_each(const std::function<void(std::string_view)> &fn) const;

    size_t count() const noexcept { return count_; }
    size_t bytes_used() const noexcept { return used_; }
    size_t capacity() const noexcept { return capacity_; }
    size_t blocks() const noexcept { return blocks_.size(); }

    void clear() noexcept;

private:
    struct Block {
        std::unique_ptr<char[]> data;
        size_t size;
        size_t fill;
    };

    char *reserve(size_t n);

    size_t capacity_;
    size_t block_bytes_;
    size_t used_;
    size_t count_;
    std::vector<Block> blocks_;
};
