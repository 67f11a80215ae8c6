#pragma once

#include "timekeeper/static_string.hpp"
#include "timekeeper/status.hpp"

#include <concepts>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>

namespace tk {
    template<typename T>
    struct Format;

    template<typename T>
    concept IsFormatSize = requires {
        { Format<T>::kStringSize } -> std::convertible_to<size_t>;
    };

    template<typename T>
    concept IsFormat = IsFormatSize<T> && requires(T it) {
        { Format<T>::toString(std::declval<char*>(), it) } -> std::same_as<std::string_view>;
    };

    template<typename T>
    concept IsFormatEx = requires(T it) {
        { Format<T>::toString(it) } -> std::convertible_to<std::string_view>;
    };

    template<typename T>
    concept IsStreamFormat = requires(T it) {
        { Format<T>::format(std::declval<class IOutStream&>(), it) };
    };

    class IOutStream {
    public:
        virtual ~IOutStream() = default;

        virtual void write(std::string_view message) = 0;
        virtual void write(char c) {
            write(std::string_view(&c, 1));
        }

        template<typename T> requires (!std::convertible_to<T, std::string_view>)
        void write(const T& value);

        template<typename... T>
        void format(T&&... args) {
            (write(std::forward<T>(args)), ...);
        }
    };

    template<std::integral T>
    struct MaxDigits {
        static constexpr size_t kBase10 = sizeof(T) * 3 + 1;
        static constexpr size_t kBase16 = sizeof(T) * 2;
    };

    template<std::integral T>
    struct Int {
        T value;
        int width = 0;
        char fill = '\0';

        constexpr Int(T value) noexcept : value(value) {}

        constexpr Int pad(int width, char fill = '0') const {
            Int copy = *this;
            copy.width = width;
            copy.fill = fill;
            return copy;
        }
    };

    template<std::integral T>
    struct Hex {
        T value;
        int width = 0;
        char fill = '\0';

        constexpr Hex(T value) noexcept : value(value) {}

        constexpr Hex pad(int width, char fill = '0') const {
            Hex copy = *this;
            copy.width = width;
            copy.fill = fill;
            return copy;
        }
    };

    /// @brief Format an integer right aligned into the end of @p buffer.
    ///
    /// @p width includes the sign of negative values, padding is inserted
    /// between the sign and the digits.
    template<std::integral T>
    constexpr std::string_view FormatInt(std::span<char> buffer, T input, int base, int width = 0, char fill = '\0') {
        constexpr char kDigits[] = "0123456789ABCDEF";
        using UnsignedT = std::make_unsigned_t<T>;

        bool negative = input < 0;
        UnsignedT value = negative ? UnsignedT(0) - UnsignedT(input) : UnsignedT(input);

        char *end = buffer.data() + buffer.size();
        char *ptr = end - 1;
        if (value != 0) {
            while (value != 0) {
                *ptr-- = kDigits[value % base];
                value /= base;
            }
        } else {
            *ptr-- = '0';
        }

        if (fill != '\0') {
            if (negative) {
                width--;
            }

            int remaining = width - int(end - ptr) + 1;
            while (remaining-- > 0) {
                *ptr-- = fill;
            }
        }

        if (negative) {
            *ptr-- = '-';
        }

        return std::string_view(ptr + 1, end);
    }

    template<std::integral T>
    struct Format<T> {
        static constexpr size_t kStringSize = MaxDigits<T>::kBase10;
        static constexpr std::string_view toString(char *buffer, T value) {
            return FormatInt(std::span(buffer, kStringSize), value, 10);
        }
    };

    template<>
    struct Format<char> {
        static constexpr size_t kStringSize = 1;
        static constexpr std::string_view toString(char *buffer, char value) {
            buffer[0] = value;
            return std::string_view(buffer, 1);
        }
    };

    template<>
    struct Format<bool> {
        static constexpr std::string_view toString(bool value) {
            return value ? "True" : "False";
        }
    };

    template<std::integral T>
    struct Format<Int<T>> {
        // widest padding used by the library is 9 digits of nanoseconds
        static constexpr size_t kStringSize = MaxDigits<T>::kBase10 + 9;
        static constexpr std::string_view toString(char *buffer, Int<T> value) {
            return FormatInt(std::span(buffer, kStringSize), value.value, 10, value.width, value.fill);
        }
    };

    template<std::integral T>
    struct Format<Hex<T>> {
        static constexpr size_t kStringSize = MaxDigits<T>::kBase16 + 2;
        static constexpr std::string_view toString(char *buffer, Hex<T> value) {
            char temp[MaxDigits<T>::kBase16 + 1];
            std::string_view digits = FormatInt(std::span(temp), value.value, 16, value.width, value.fill);

            buffer[0] = '0';
            buffer[1] = 'x';
            std::copy(digits.begin(), digits.end(), buffer + 2);
            return std::string_view(buffer, digits.size() + 2);
        }
    };

    template<>
    struct Format<TkStatusId> {
        static constexpr size_t kStringSize = Format<Hex<TkStatus>>::kStringSize + 24;

        static void format(IOutStream& out, TkStatusId value);
    };

    template<IsFormatSize T>
    inline constexpr size_t kFormatSize = Format<T>::kStringSize;

    template<IsFormat T>
    inline constexpr std::string_view format(char *buffer, T value) {
        return Format<T>::toString(buffer, value);
    }

    template<IsFormat T>
    inline constexpr StaticString<kFormatSize<T>> format(T value) {
        char buffer[kFormatSize<T>];
        return StaticString<kFormatSize<T>>(format(buffer, value));
    }

    template<IsFormatEx T>
    inline constexpr auto format(T value) {
        return Format<T>::toString(value);
    }

    template<IsStreamFormat T>
    inline void format(IOutStream& out, const T& value) {
        Format<T>::format(out, value);
    }

    inline void format(IOutStream& out, std::string_view value) {
        out.write(value);
    }

    template<size_t N, IsStreamFormat T>
    inline StaticString<N> toStaticString(const T& value) {
        struct OutStream final : public IOutStream {
            StaticString<N> result;

            void write(std::string_view message) override {
                result.add(message);
            }
        };

        OutStream out;
        out.format(value);

        return out.result;
    }

    template<size_t N, typename... T>
    inline StaticString<N> concat(T&&... args) {
        struct OutStream final : public IOutStream {
            StaticString<N> result;

            void write(std::string_view message) override {
                result.add(message);
            }
        };

        OutStream out;
        (out.format(args), ...);

        return out.result;
    }

    template<typename T> requires (IsStreamFormat<T> && IsFormatSize<T> && !IsFormat<T>)
    inline auto format(T value) {
        return toStaticString<kFormatSize<T>>(value);
    }

    template<IsFormatEx T> requires (!IsStreamFormat<T>)
    inline void format(IOutStream& out, const T& value) {
        out.write(Format<T>::toString(value));
    }

    template<IsFormat T> requires (!IsStreamFormat<T>)
    inline void format(IOutStream& out, const T& value) {
        char buffer[kFormatSize<T>];
        out.write(Format<T>::toString(buffer, value));
    }

    template<typename T> requires (!std::convertible_to<T, std::string_view>)
    void IOutStream::write(const T& value) {
        tk::format(*this, value);
    }
}
