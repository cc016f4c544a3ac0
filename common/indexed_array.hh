#pragma once

#include <array>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <type_traits>
#include <utility>

#include "wise_enum.h"

namespace keyrelay {

template <typename T>
concept ZeroIndexedEnum = wise_enum::is_wise_enum_v<T> && requires {
    wise_enum::size<T>;
};

template <ZeroIndexedEnum EnumT>
constexpr bool is_contiguous_and_zero_indexed() {
    int expected_idx = 0;
    for (const auto &value_and_name : wise_enum::range<EnumT>) {
        if (static_cast<std::underlying_type_t<EnumT>>(value_and_name.value) != expected_idx) {
            return false;
        }
        expected_idx++;
    }
    return true;
}

// A fixed size array indexed by the values of a wise_enum
template <typename T, ZeroIndexedEnum EnumT>
class IndexedArray {
    static_assert(is_contiguous_and_zero_indexed<EnumT>(),
                  "IndexedArray requires enum values 0, 1, ..., N-1");

   public:
    static constexpr int SIZE = wise_enum::size<EnumT>;
    using container_type = std::array<T, SIZE>;

    constexpr IndexedArray() = default;
    constexpr explicit IndexedArray(const T &value) { data_.fill(value); }
    constexpr IndexedArray(const std::initializer_list<std::pair<EnumT, T>> &init) {
        for (const auto &[idx, value] : init) {
            (*this)[idx] = value;
        }
    }

    constexpr const T &operator[](const EnumT &index) const {
        return data_[static_cast<int>(index)];
    }
    constexpr T &operator[](const EnumT &index) { return data_[static_cast<int>(index)]; }

    constexpr int size() const { return SIZE; }

    bool operator==(const IndexedArray &other) const = default;

    // Yields (enum value, element reference) pairs in enum order
    template <typename Ref>
    struct IteratorT {
        using iterator_category = std::forward_iterator_tag;
        using value_type = std::pair<EnumT, Ref>;
        using reference = value_type;
        using difference_type = std::ptrdiff_t;

        bool operator!=(const IteratorT &other) const { return idx_ != other.idx_; }
        IteratorT &operator++() {
            idx_++;
            return *this;
        }
        value_type operator*() const {
            return {wise_enum::range<EnumT>[idx_].value, (*data_)[idx_]};
        }

        std::conditional_t<std::is_const_v<std::remove_reference_t<Ref>>, const container_type,
                           container_type> *data_;
        int idx_;
    };

    constexpr IteratorT<const T &> begin() const { return {&data_, 0}; }
    constexpr IteratorT<const T &> end() const { return {&data_, SIZE}; }
    constexpr IteratorT<T &> begin() { return {&data_, 0}; }
    constexpr IteratorT<T &> end() { return {&data_, SIZE}; }

   private:
    container_type data_{};
};
}  // namespace keyrelay
