#pragma once

#include <algorithm>
#include <string_view>

#include <stddef.h>
#include <stdint.h>

namespace tk {
    namespace detail {
        template<size_t N>
        struct StringSizeType;

        template<size_t N> requires (N <= 0xFF)
        struct StringSizeType<N> {
            using type = uint8_t;
        };

        template<size_t N> requires (N <= 0xFFFF && N > 0xFF)
        struct StringSizeType<N> {
            using type = uint16_t;
        };

        template<size_t N> requires (N > 0xFFFF)
        struct StringSizeType<N> {
            using type = uint32_t;
        };

        template<size_t N>
        using StringSize = typename StringSizeType<N>::type;
    }

    /// @brief Fixed capacity string, writes past the capacity are truncated.
    template<size_t N>
    class StaticString {
        detail::StringSize<N> mSize;
        char mStorage[N];

    public:
        constexpr StaticString()
            : mSize(0)
            , mStorage()
        { }

        template<size_t S> requires (S <= N + 1)
        constexpr StaticString(const char (&str)[S])
            : StaticString(std::string_view(str, S - 1))
        { }

        constexpr StaticString(std::string_view view)
            : StaticString()
        {
            add(view);
        }

        constexpr size_t count() const { return mSize; }
        constexpr size_t capacity() const { return N; }

        constexpr bool isEmpty() const { return mSize == 0; }
        constexpr bool isFull() const { return mSize == N; }

        constexpr char *begin() { return mStorage; }
        constexpr char *end() { return mStorage + mSize; }

        constexpr const char *begin() const { return mStorage; }
        constexpr const char *end() const { return mStorage + mSize; }

        constexpr void clear() {
            mSize = 0;
        }

        constexpr void add(char c) {
            if (mSize < N) {
                mStorage[mSize++] = c;
            }
        }

        constexpr void add(std::string_view view) {
            size_t size = std::min(view.size(), N - mSize);
            std::copy_n(view.data(), size, mStorage + mSize);
            mSize += size;
        }

        constexpr std::string_view view() const {
            return std::string_view(mStorage, mSize);
        }

        constexpr operator std::string_view() const {
            return view();
        }

        constexpr char& operator[](size_t index) {
            return mStorage[index];
        }

        constexpr const char& operator[](size_t index) const {
            return mStorage[index];
        }

        constexpr bool operator==(std::string_view other) const {
            return view() == other;
        }

        template<size_t M>
        constexpr bool operator==(const StaticString<M>& other) const {
            return view() == other.view();
        }
    };
}
