#include "subject_arena.hpp"
#include "errors.hpp"
#include <cstring>
#include <limits>

SubjectArena::SubjectArena(size_t capacity_bytes, size_t block_bytes)
    : capacity_(capacity_bytes),
      block_bytes_(block_bytes < 64 ? 64 : block_bytes),
      used_(0),
      count_(0)
{
}

char *SubjectArena::reserve(size_t n) {
    if (blocks_.empty() || blocks_.back().size - blocks_.back().fill < n) {
        size_t sz = n > block_bytes_ ? n : block_bytes_;
        blocks_.push_back(Block{std::unique_ptr<char[]>(new char[sz]), sz, 0});
    }
    Block &b = blocks_.back();
    char *p = b.data.get() + b.fill;
    b.fill += n;
    return p;
}

void SubjectArena::append(std::string_view subject) {
    if (subject.size() > std::numeric_limits<uint32_t>::max()) {
        throw arena_exhausted("subject too long for arena entry");
    }
    const size_t need = sizeof(uint32_t) + subject.size();
    if (capacity_ != 0 && used_ + need > capacity_) {
        throw arena_exhausted("subject arena exhausted: " + std::to_string(used_) + " of "
                              + std::to_string(capacity_) + " bytes used, entry needs "
                              + std::to_string(need));
    }
    char *p = reserve(need);
    uint32_t len = static_cast<uint32_t>(subject.size());
    std::memcpy(p, &len, sizeof(len));
    if (len) std::memcpy(p + sizeof(len), subject.data(), len);
    used_ += need;
    ++count_;
}

void SubjectArena::for_each(const std::function<void(std::string_view)> &fn) const {
    for (const auto &b : blocks_) {
        size_t off = 0;
        while (off < b.fill) {
            uint32_t len;
            std::memcpy(&len, b.data.get() + off, sizeof(len));
            off += sizeof(len);
            fn(std::string_view(b.data.get() + off, len));
            off += len;
        }
    }
}

void SubjectArena::clear() noexcept {
    blocks_.clear();
    used_ = 0;
    count_ = 0;
}
