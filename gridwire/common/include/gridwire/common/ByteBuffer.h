#pragma once
#include <cstdint>
#include <vector>
#include <span>
#include <stdexcept>
#include <cstring>
#include <bit>

namespace gridwire::common
{
    /**
     * @brief Byte order of multi-byte values written to or read from a ByteBuffer.
     */
    enum class ByteOrder : uint8_t
    {
        BigEndian,
        LittleEndian,
    };

    /**
     * @brief Byte buffer with position-based read/write operations and a fixed byte order.
     *
     * ByteBuffer provides a Java NIO ByteBuffer-like API. The byte order is chosen at
     * construction and applies to every multi-byte read and write; it never changes
     * afterwards. Supports owning (vector-backed, append-only writes) and non-owning
     * (read-only span-backed) modes.
     *
     * Key differences from std::vector:
     * - Maintains internal position cursor (like Java ByteBuffer)
     * - Integer and floating point operations honour the configured byte order
     * - Supports zero-copy views over foreign memory
     *
     * Thread safety: Not thread-safe. Caller must synchronize access.
     *
     * Example usage:
     * @code
     * ByteBuffer buf(64, ByteOrder::BigEndian);
     * buf.put_i32(42);
     * buf.put_f64(0.5);
     *
     * auto in = ByteBuffer::wrap(buf.span(), ByteOrder::BigEndian);
     * int32_t val = in.get_i32();
     * @endcode
     */
    class ByteBuffer
    {
    public:
        /**
         * @brief Construct an empty owning buffer.
         */
        explicit ByteBuffer(const ByteOrder order = ByteOrder::BigEndian) noexcept
            : order_(order)
        {
        }

        /**
         * @brief Construct an owning buffer with initial capacity.
         * @param capacity Initial capacity in bytes.
         * @param order Byte order of multi-byte values.
         */
        ByteBuffer(const size_t capacity, const ByteOrder order)
            : order_(order)
        {
            data_.reserve(capacity);
        }

        /**
         * @brief Wrap existing memory (non-owning, read-only view).
         * @param data Memory span to wrap.
         * @param order Byte order of multi-byte values.
         * @return ByteBuffer with non-owning view.
         */
        static ByteBuffer wrap(const std::span<const uint8_t> data, const ByteOrder order)
        {
            ByteBuffer buf(order);
            buf.view_ = data;
            buf.is_view_ = true;
            return buf;
        }

        // ========================================
        // Position and Size
        // ========================================

        [[nodiscard]]
        size_t position() const noexcept
        {
            return pos_;
        }

        /**
         * @brief Set position.
         * @throws std::out_of_range if pos > size().
         * @throws std::logic_error if the buffer is an owning (append-only) buffer.
         */
        void position(const size_t pos)
        {
            if (!is_view_)
            {
                throw std::logic_error("Cannot reposition an append-only buffer");
            }
            if (pos > size())
            {
                throw std::out_of_range("Position out of range");
            }
            pos_ = pos;
        }

        [[nodiscard]]
        size_t size() const noexcept
        {
            return is_view_ ? view_.size() : data_.size();
        }

        [[nodiscard]]
        size_t remaining() const noexcept
        {
            return size() - pos_;
        }

        [[nodiscard]]
        ByteOrder order() const noexcept
        {
            return order_;
        }

        // ========================================
        // Write Operations (append)
        // ========================================

        void put_i8(const int8_t value)
        {
            put_u8(static_cast<uint8_t>(value));
        }

        void put_u8(const uint8_t value)
        {
            ensure_writable();
            data_.push_back(value);
            pos_++;
        }

        void put_i16(const int16_t value)
        {
            put_u16(static_cast<uint16_t>(value));
        }

        void put_u16(const uint16_t value)
        {
            uint8_t bytes[2];
            store(bytes, value, order_);
            put_bytes({bytes, 2});
        }

        void put_i32(const int32_t value)
        {
            put_raw(static_cast<uint32_t>(value));
        }

        void put_i64(const int64_t value)
        {
            put_raw(static_cast<uint64_t>(value));
        }

        void put_f32(const float value)
        {
            put_raw(std::bit_cast<uint32_t>(value));
        }

        void put_f64(const double value)
        {
            put_raw(std::bit_cast<uint64_t>(value));
        }

        /**
         * @brief Append raw bytes and advance.
         */
        void put_bytes(std::span<const uint8_t> bytes)
        {
            ensure_writable();
            data_.insert(data_.end(), bytes.begin(), bytes.end());
            pos_ += bytes.size();
        }

        // ========================================
        // Read Operations
        // ========================================

        [[nodiscard]]
        int8_t get_i8()
        {
            return static_cast<int8_t>(get_u8());
        }

        [[nodiscard]]
        uint8_t get_u8()
        {
            ensure_readable(1);
            return data_ptr()[pos_++];
        }

        [[nodiscard]]
        int16_t get_i16()
        {
            return static_cast<int16_t>(get_u16());
        }

        [[nodiscard]]
        uint16_t get_u16()
        {
            ensure_readable(2);
            const auto value = load<uint16_t>(data_ptr() + pos_, order_);
            pos_ += 2;
            return value;
        }

        [[nodiscard]]
        int32_t get_i32()
        {
            return static_cast<int32_t>(get_raw<uint32_t>());
        }

        [[nodiscard]]
        int64_t get_i64()
        {
            return static_cast<int64_t>(get_raw<uint64_t>());
        }

        [[nodiscard]]
        float get_f32()
        {
            return std::bit_cast<float>(get_raw<uint32_t>());
        }

        [[nodiscard]]
        double get_f64()
        {
            return std::bit_cast<double>(get_raw<uint64_t>());
        }

        /**
         * @brief Read bytes as vector and advance.
         */
        [[nodiscard]]
        std::vector<uint8_t> get_bytes(const size_t length)
        {
            ensure_readable(length);
            std::vector<uint8_t> result(data_ptr() + pos_, data_ptr() + pos_ + length);
            pos_ += length;
            return result;
        }

        // ========================================
        // Absolute Read/Write (without moving position)
        // ========================================

        /**
         * @brief Overwrite an already written uint32_t at absolute offset.
         */
        void put_u32_at(const size_t offset, const uint32_t value)
        {
            ensure_writable();
            if (offset + 4 > size())
            {
                throw std::out_of_range("Write past end");
            }
            store(data_.data() + offset, value, order_);
        }

        // ========================================
        // Direct Access
        // ========================================

        [[nodiscard]]
        std::span<const uint8_t> span() const noexcept
        {
            return {data_ptr(), size()};
        }

        /**
         * @brief Move the owned storage out; the buffer is left empty.
         */
        [[nodiscard]]
        std::vector<uint8_t> take()
        {
            ensure_writable();
            pos_ = 0;
            return std::move(data_);
        }

        // ========================================
        // Byte order helpers
        // ========================================

        template <typename T>
        static void store(uint8_t* p, const T v, const ByteOrder order) noexcept
        {
            if (order == ByteOrder::LittleEndian)
            {
                if constexpr (std::endian::native == std::endian::little)
                {
                    std::memcpy(p, &v, sizeof(T));
                }
                else
                {
                    for (size_t i = 0; i < sizeof(T); ++i)
                    {
                        p[i] = static_cast<uint8_t>((v >> (i * 8)) & 0xFF);
                    }
                }
            }
            else
            {
                for (size_t i = 0; i < sizeof(T); ++i)
                {
                    p[i] = static_cast<uint8_t>((v >> ((sizeof(T) - 1 - i) * 8)) & 0xFF);
                }
            }
        }

        template <typename T>
        [[nodiscard]]
        static T load(const uint8_t* p, const ByteOrder order) noexcept
        {
            T v = 0;
            if (order == ByteOrder::LittleEndian)
            {
                if constexpr (std::endian::native == std::endian::little)
                {
                    std::memcpy(&v, p, sizeof(T));
                }
                else
                {
                    for (size_t i = 0; i < sizeof(T); ++i)
                    {
                        v |= static_cast<T>(static_cast<T>(p[i]) << (i * 8));
                    }
                }
            }
            else
            {
                for (size_t i = 0; i < sizeof(T); ++i)
                {
                    v = static_cast<T>((v << 8) | p[i]);
                }
            }
            return v;
        }

    private:
        std::vector<uint8_t> data_; // Owning storage
        std::span<const uint8_t> view_; // Non-owning const view
        size_t pos_ = 0;
        ByteOrder order_;
        bool is_view_ = false;

        [[nodiscard]]
        const uint8_t* data_ptr() const noexcept
        {
            return is_view_ ? view_.data() : data_.data();
        }

        template <typename T>
        void put_raw(const T value)
        {
            uint8_t bytes[sizeof(T)];
            store(bytes, value, order_);
            put_bytes({bytes, sizeof(T)});
        }

        template <typename T>
        [[nodiscard]]
        T get_raw()
        {
            ensure_readable(sizeof(T));
            const auto value = load<T>(data_ptr() + pos_, order_);
            pos_ += sizeof(T);
            return value;
        }

        void ensure_readable(const size_t n) const
        {
            if (pos_ + n > size())
            {
                throw std::out_of_range("Read past end");
            }
        }

        void ensure_writable() const
        {
            if (is_view_)
            {
                throw std::logic_error("Cannot write to const view");
            }
        }
    };
}
