#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>
#include <type_traits>

namespace fastxls {
namespace core {

// C++17兼容的轻量级只读视图，记录负载与流缓冲区都以它传递
template<typename T>
class span {
public:
    using element_type = T;
    using size_type = std::size_t;
    using iterator = T*;

    constexpr span() noexcept : data_(nullptr), size_(0) {}
    constexpr span(T* data, size_type size) noexcept : data_(data), size_(size) {}

    template<typename U, typename = std::enable_if_t<std::is_const_v<T> && std::is_same_v<std::remove_const_t<T>, U>>>
    span(const std::vector<U>& vec) noexcept : data_(vec.data()), size_(vec.size()) {}

    template<typename U, typename = std::enable_if_t<std::is_same_v<T, U>>>
    span(std::vector<U>& vec) noexcept : data_(vec.data()), size_(vec.size()) {}

    constexpr iterator begin() const noexcept { return data_; }
    constexpr iterator end() const noexcept { return data_ + size_; }

    constexpr T* data() const noexcept { return data_; }
    constexpr size_type size() const noexcept { return size_; }
    constexpr bool empty() const noexcept { return size_ == 0; }

    constexpr T& operator[](size_type idx) const { return data_[idx]; }

    /**
     * @brief 截取子视图，越界部分自动裁剪
     */
    constexpr span subspan(size_type offset, size_type count = static_cast<size_type>(-1)) const noexcept {
        if (offset >= size_) {
            return span();
        }
        const size_type remaining = size_ - offset;
        return span(data_ + offset, count < remaining ? count : remaining);
    }

private:
    T* data_;
    size_type size_;
};

using ByteView = span<const uint8_t>;

}} // namespace fastxls::core
