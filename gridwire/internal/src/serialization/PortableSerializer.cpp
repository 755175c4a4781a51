/*
 * GridWire
 * Copyright (C) 2025 Swift Storm Studio
 *
 * This file is part of GridWire.
 *
 * GridWire is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * GridWire is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with GridWire.  If not, see <https://www.gnu.org/licenses/>.
 */

// gridwire/internal/src/serialization/PortableSerializer.cpp
#include "serialization/PortableSerializer.hpp"

#include <set>
#include <string>
#include <unordered_map>

namespace gridwire::serialization {
    using portable::FieldType;
    using portable::Portable;

    namespace {
        const char* field_type_name(FieldType type) noexcept {
            switch (type) {
                case FieldType::Portable: return "portable";
                case FieldType::Byte: return "byte";
                case FieldType::Boolean: return "boolean";
                case FieldType::Char: return "char";
                case FieldType::Short: return "short";
                case FieldType::Int: return "int";
                case FieldType::Long: return "long";
                case FieldType::Float: return "float";
                case FieldType::Double: return "double";
                case FieldType::Utf: return "utf";
                case FieldType::ByteArray: return "byteArray";
                case FieldType::IntArray: return "intArray";
                case FieldType::LongArray: return "longArray";
                case FieldType::UtfArray: return "utfArray";
            }
            return "unknown";
        }

        /**
         * Writes fields straight into the payload and counts them.
         */
        class DefaultPortableWriter final : public portable::PortableWriter {
        public:
            DefaultPortableWriter(const PortableSerializer& serializer, ObjectDataOutput& out)
                : serializer_{serializer}, out_{out} {}

            void write_byte(std::string_view name, int8_t value) override {
                header(name, FieldType::Byte);
                out_.write_byte(value);
            }

            void write_boolean(std::string_view name, bool value) override {
                header(name, FieldType::Boolean);
                out_.write_boolean(value);
            }

            void write_char(std::string_view name, char16_t value) override {
                header(name, FieldType::Char);
                out_.write_char(value);
            }

            void write_short(std::string_view name, int16_t value) override {
                header(name, FieldType::Short);
                out_.write_short(value);
            }

            void write_int(std::string_view name, int32_t value) override {
                header(name, FieldType::Int);
                out_.write_int(value);
            }

            void write_long(std::string_view name, int64_t value) override {
                header(name, FieldType::Long);
                out_.write_long(value);
            }

            void write_float(std::string_view name, float value) override {
                header(name, FieldType::Float);
                out_.write_float(value);
            }

            void write_double(std::string_view name, double value) override {
                header(name, FieldType::Double);
                out_.write_double(value);
            }

            void write_utf(std::string_view name, std::string_view value) override {
                header(name, FieldType::Utf);
                out_.write_string(value);
            }

            void write_byte_array(std::string_view name, const std::vector<uint8_t>& value) override {
                header(name, FieldType::ByteArray);
                out_.write_byte_array(value);
            }

            void write_int_array(std::string_view name, const std::vector<int32_t>& value) override {
                header(name, FieldType::IntArray);
                out_.write_int_array(value);
            }

            void write_long_array(std::string_view name, const std::vector<int64_t>& value) override {
                header(name, FieldType::LongArray);
                out_.write_long_array(value);
            }

            void write_utf_array(std::string_view name, const std::vector<std::string>& value) override {
                header(name, FieldType::UtfArray);
                out_.write_string_array(value);
            }

            void write_portable(std::string_view name, const std::shared_ptr<const Portable>& value) override {
                header(name, FieldType::Portable);
                out_.write_boolean(value == nullptr);
                if (value) { serializer_.write_portable(out_, *value); }
            }

            [[nodiscard]] int32_t field_count() const noexcept { return static_cast<int32_t>(names_.size()); }

        private:
            void header(std::string_view name, FieldType type) {
                if (!names_.emplace(name).second) { throw SerializationException("Duplicate portable field '" + std::string{name} + "'"); }
                out_.write_string(name);
                out_.write_byte(static_cast<int8_t>(type));
            }

            const PortableSerializer& serializer_;
            ObjectDataOutput& out_;
            std::set<std::string, std::less<>> names_;
        };

        /**
         * Reads every field up front so they can be looked up by name.
         */
        class DefaultPortableReader final : public portable::PortableReader {
        public:
            DefaultPortableReader(const PortableSerializer& serializer, ObjectDataInput& in, int32_t version, int32_t field_count)
                : version_{version} {
                for (int32_t i = 0; i < field_count; ++i) {
                    auto name = in.read_string();
                    const auto raw_type = in.read_byte();
                    Field field{static_cast<FieldType>(raw_type), Value{}, nullptr};
                    switch (field.type) {
                        case FieldType::Portable:
                            if (!in.read_boolean()) { field.nested = serializer.read_portable(in); }
                            break;
                        case FieldType::Byte: field.value = Value::int8(in.read_byte()); break;
                        case FieldType::Boolean: field.value = Value::boolean(in.read_boolean()); break;
                        case FieldType::Char: field.value = Value::character(in.read_char()); break;
                        case FieldType::Short: field.value = Value::int16(in.read_short()); break;
                        case FieldType::Int: field.value = Value::int32(in.read_int()); break;
                        case FieldType::Long: field.value = Value::int64(in.read_long()); break;
                        case FieldType::Float: field.value = Value::float32(in.read_float()); break;
                        case FieldType::Double: field.value = Value::float64(in.read_double()); break;
                        case FieldType::Utf: field.value = Value::string(in.read_string()); break;
                        case FieldType::ByteArray: field.value = Value::buffer(in.read_byte_array()); break;
                        case FieldType::IntArray: field.ints = in.read_int_array(); break;
                        case FieldType::LongArray: field.longs = in.read_long_array(); break;
                        case FieldType::UtfArray: field.strings = in.read_string_array(); break;
                        default:
                            throw SerializationException("Unknown portable field type " + std::to_string(raw_type) + " for field '" + name + "'");
                    }
                    fields_.insert_or_assign(std::move(name), std::move(field));
                }
            }

            [[nodiscard]] int32_t version() const noexcept override { return version_; }

            [[nodiscard]] bool has_field(std::string_view name) const override { return fields_.find(std::string{name}) != fields_.end(); }

            int8_t read_byte(std::string_view name) override { return lookup(name, FieldType::Byte).value.get<int8_t>(); }
            bool read_boolean(std::string_view name) override { return lookup(name, FieldType::Boolean).value.get<bool>(); }
            char16_t read_char(std::string_view name) override { return lookup(name, FieldType::Char).value.get<char16_t>(); }
            int16_t read_short(std::string_view name) override { return lookup(name, FieldType::Short).value.get<int16_t>(); }
            int32_t read_int(std::string_view name) override { return lookup(name, FieldType::Int).value.get<int32_t>(); }
            int64_t read_long(std::string_view name) override { return lookup(name, FieldType::Long).value.get<int64_t>(); }
            float read_float(std::string_view name) override { return lookup(name, FieldType::Float).value.get<float>(); }
            double read_double(std::string_view name) override { return lookup(name, FieldType::Double).value.get<double>(); }
            std::string read_utf(std::string_view name) override { return lookup(name, FieldType::Utf).value.get<std::string>(); }
            std::vector<uint8_t> read_byte_array(std::string_view name) override { return lookup(name, FieldType::ByteArray).value.get<Bytes>(); }
            std::vector<int32_t> read_int_array(std::string_view name) override { return lookup(name, FieldType::IntArray).ints; }
            std::vector<int64_t> read_long_array(std::string_view name) override { return lookup(name, FieldType::LongArray).longs; }
            std::vector<std::string> read_utf_array(std::string_view name) override { return lookup(name, FieldType::UtfArray).strings; }
            std::shared_ptr<Portable> read_portable(std::string_view name) override { return lookup(name, FieldType::Portable).nested; }

        private:
            struct Field {
                FieldType type;
                Value value;
                std::shared_ptr<Portable> nested;
                std::vector<int32_t> ints;
                std::vector<int64_t> longs;
                std::vector<std::string> strings;
            };

            const Field& lookup(std::string_view name, FieldType expected) const {
                const auto it = fields_.find(std::string{name});
                if (it == fields_.end()) { throw SerializationException("Unknown portable field '" + std::string{name} + "'"); }
                if (it->second.type != expected) {
                    throw SerializationException(
                        "Portable field '" + std::string{name} + "' is " + field_type_name(it->second.type) + ", not " + field_type_name(expected)
                    );
                }
                return it->second;
            }

            int32_t version_;
            std::unordered_map<std::string, Field> fields_;
        };
    }

    PortableSerializer::PortableSerializer(std::map<int32_t, portable::PortableFactory> factories, int32_t version)
        : factories_{std::move(factories)}, version_{version} {}

    void PortableSerializer::write(ObjectDataOutput& out, const Value& value) const {
        const auto* ptr = value.get_if<UserObjectPtr>();
        const auto* object = ptr ? dynamic_cast<const Portable*>(ptr->get()) : nullptr;
        if (object == nullptr) { throw SerializationException(std::string{"Expected a Portable but got "} + kind_name(value.kind())); }
        write_portable(out, *object);
    }

    Value PortableSerializer::read(ObjectDataInput& in) const { return Value::user(read_portable(in)); }

    void PortableSerializer::write_portable(ObjectDataOutput& out, const Portable& object) const {
        out.write_int(object.factory_id());
        out.write_int(object.class_id());
        out.write_int(version_);

        const auto count_pos = out.position();
        out.write_int(0);

        DefaultPortableWriter writer{*this, out};
        object.write_portable(writer);
        out.write_int_at(count_pos, writer.field_count());
    }

    std::shared_ptr<Portable> PortableSerializer::read_portable(ObjectDataInput& in) const {
        const auto scope = in.enter_nested();
        const auto factory_id = in.read_int();
        const auto class_id = in.read_int();
        const auto version = in.read_int();
        const auto field_count = in.read_int();
        if (field_count < 0) { throw SerializationException("Negative portable field count " + std::to_string(field_count)); }

        const auto it = factories_.find(factory_id);
        if (it == factories_.end()) { throw SerializationException("There is no suitable portable factory for id " + std::to_string(factory_id)); }
        auto object = it->second(class_id);
        if (!object) {
            throw SerializationException(
                "Portable factory " + std::to_string(factory_id) + " cannot create an instance of class id " + std::to_string(class_id)
            );
        }

        DefaultPortableReader reader{*this, in, version, field_count};
        object->read_portable(reader);
        return object;
    }
} // namespace gridwire::serialization
