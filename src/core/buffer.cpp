#include "ubj/core/buffer.hpp"

#include <algorithm>
#include <cstring>
#include <limits>

namespace ubj::core {

FixedBuffer::FixedBuffer(std::size_t initial_capacity, std::size_t max_capacity)
    : max_capacity_(max_capacity),
      capacity_(std::min(initial_capacity, max_capacity)) {
    if (capacity_ > inline_.size()) {
        heap_ = std::make_unique<byte[]>(capacity_);
    }
}

void FixedBuffer::clear() noexcept {
    read_pos_ = 0;
    write_pos_ = 0;
}

void FixedBuffer::compact() noexcept {
    const auto readable = size();
    if (readable == 0) {
        clear();
        return;
    }
    if (read_pos_ == 0) {
        return;
    }
    std::memmove(base(), base() + read_pos_, readable);
    read_pos_ = 0;
    write_pos_ = readable;
}

bytes_view FixedBuffer::readable_bytes() const noexcept {
    return bytes_view{base() + read_pos_, size()};
}

std::error_code FixedBuffer::prepare(std::size_t n, mutable_bytes_view &out) noexcept {
    if (capacity_ - write_pos_ < n) {
        compact();
    }
    if (capacity_ - write_pos_ < n) {
        const auto readable = size();
        if (n > max_capacity_ || readable > max_capacity_ - n) {
            return make_error_code(errc::buffer_overflow);
        }
        auto ec = grow(readable + n);
        if (ec) {
            return ec;
        }
    }
    out = mutable_bytes_view{base() + write_pos_, capacity_ - write_pos_};
    return {};
}

std::error_code FixedBuffer::commit(std::size_t n) noexcept {
    if (n > capacity_ - write_pos_) {
        return make_error_code(errc::invalid_argument);
    }
    write_pos_ += n;
    return {};
}

std::error_code FixedBuffer::append(bytes_view data) noexcept {
    if (data.empty()) {
        return {};
    }
    mutable_bytes_view dst{};
    auto ec = prepare(data.size(), dst);
    if (ec) {
        return ec;
    }
    std::memcpy(dst.data(), data.data(), data.size());
    write_pos_ += data.size();
    return {};
}

std::error_code FixedBuffer::consume(std::size_t n) noexcept {
    if (n > size()) {
        return make_error_code(errc::invalid_argument);
    }
    read_pos_ += n;
    if (read_pos_ == write_pos_) {
        clear();
    }
    return {};
}

std::size_t FixedBuffer::take(mutable_bytes_view out) noexcept {
    const auto n = std::min(out.size(), size());
    if (n != 0) {
        std::memcpy(out.data(), base() + read_pos_, n);
        read_pos_ += n;
        if (read_pos_ == write_pos_) {
            clear();
        }
    }
    return n;
}

std::error_code FixedBuffer::grow(std::size_t min_capacity) noexcept {
    if (min_capacity <= capacity_) {
        return {};
    }
    if (!heap_ && min_capacity <= inline_.size()) {
        // 仍可容纳在 inline_ 中：只放宽可用容量，不做堆分配。
        capacity_ = min_capacity;
        return {};
    }

    std::size_t new_capacity = std::max<std::size_t>(capacity_, 1);
    while (new_capacity < min_capacity) {
        if (new_capacity > (std::numeric_limits<std::size_t>::max() / 2)) {
            return make_error_code(errc::buffer_overflow);
        }
        new_capacity = std::min(new_capacity * 2, max_capacity_);
    }

    const auto readable = size();
    auto fresh = std::make_unique<byte[]>(new_capacity);
    if (readable != 0) {
        std::memcpy(fresh.get(), base() + read_pos_, readable);
    }
    heap_ = std::move(fresh);
    capacity_ = new_capacity;
    read_pos_ = 0;
    write_pos_ = readable;
    return {};
}

} // namespace ubj::core
