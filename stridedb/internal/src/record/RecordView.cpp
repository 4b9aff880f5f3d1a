/*
 * StrideDB
 * Copyright (C) 2026 Swift Storm Studio
 *
 * This file is part of StrideDB.
 *
 * StrideDB is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * StrideDB is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with StrideDB.  If not, see <https://www.gnu.org/licenses/>.
 */

// internal/src/record/RecordView.cpp
#include "record/RecordView.hpp"
#include "core/Logging.hpp"

#include <stdexcept>
#include <utility>

namespace stridedb::record {
    using schema::FieldLayout;
    using schema::FieldType;

    namespace {
        constexpr bool is_trimmed(char c) noexcept { return static_cast<unsigned char>(c) <= 0x20; }

        std::string trim(std::string_view s) {
            size_t begin = 0;
            size_t end = s.size();
            while (begin < end && is_trimmed(s[begin])) { ++begin; }
            while (end > begin && is_trimmed(s[end - 1])) { --end; }
            return std::string{s.substr(begin, end - begin)};
        }

        /**
         * The value a read returns after writing s: non-ASCII replaced, trimmed.
         */
        std::string decoded_form(std::string_view s) {
            std::string ascii{s};
            for (auto& c : ascii) { if (static_cast<unsigned char>(c) > 127) { c = '?'; } }
            return trim(ascii);
        }

        std::string type_mismatch(const FieldLayout& field, FieldType given) {
            return "RecordView: field '" + field.name + "' is " + std::string{schema::field_type_name(field.type)} + ", not " +
                std::string{schema::field_type_name(given)};
        }
    } // anonymous namespace

    RecordView::RecordView(std::shared_ptr<const schema::Layout> layout, IndexSink* index_sink)
        : layout_{std::move(layout)}, index_sink_{index_sink} {
        if (!layout_) { throw std::invalid_argument("RecordView: layout is null"); }
    }

    // ==================== Binding ====================

    void RecordView::bind(core::BufferView buffer, size_t offset) {
        const size_t stride = layout_->stride();
        if (offset > buffer.size() || buffer.size() - offset < stride) {
            throw std::out_of_range("RecordView::bind: offset " + std::to_string(offset) + " + stride " + std::to_string(stride) +
                " exceeds buffer size " + std::to_string(buffer.size()));
        }

        // A view that reports to an index owner stays on the owner's buffer
        if (index_sink_ != nullptr && bound_ && (buffer.data() != buffer_.data() || buffer.size() != buffer_.size())) {
            throw std::logic_error("RecordView::bind: view reports to an index owner and cannot move to another buffer");
        }

        buffer_ = buffer;
        offset_ = offset;
        bound_ = true;
        key_locked_ = false;
        transaction_pending_ = false;
    }

    void RecordView::bind_and_write_header(core::BufferView buffer, size_t offset) {
        bind(buffer, offset);
        write_header();
    }

    // ==================== Header ====================

    void RecordView::write_header() const {
        require_bound("write_header");
        require_mutable("write_header");
        layout_->header().write_to(buffer_, offset_);
    }

    bool RecordView::validate_header() const noexcept {
        if (!bound_) { return false; }

        const auto expected = layout_->header();
        return static_cast<int16_t>(buffer_.read_u16_le(offset_ + core::RecordHeader::TYPE_ID_OFFSET)) == expected.type_id &&
            static_cast<int16_t>(buffer_.read_u16_le(offset_ + core::RecordHeader::GROUP_ID_OFFSET)) == expected.group_id &&
            static_cast<int32_t>(buffer_.read_u32_le(offset_ + core::RecordHeader::BODY_LENGTH_OFFSET)) == expected.body_length;
    }

    core::RecordHeader RecordView::read_header() const {
        require_bound("read_header");
        return core::RecordHeader::read_from(buffer_, offset_);
    }

    // ==================== Reads ====================

    FieldValue RecordView::read(size_t field_id) const {
        require_bound("read");
        const auto& field = layout_->field(field_id);
        const size_t at = offset_ + field.offset;

        switch (field.type) {
            case FieldType::Int32: return static_cast<int32_t>(buffer_.read_u32_le(at));
            case FieldType::Int64: return static_cast<int64_t>(buffer_.read_u64_le(at));
            case FieldType::Int16: return static_cast<int16_t>(buffer_.read_u16_le(at));
            case FieldType::Bool: return buffer_.read_u8(at) != 0;
            case FieldType::Char16: return static_cast<char16_t>(buffer_.read_u16_le(at));
            case FieldType::FixedString: return trim(buffer_.as_string_view(at, field.length));
            case FieldType::VarString: break;
        }
        throw std::logic_error("RecordView::read: unsupported field type");
    }

    int32_t RecordView::read_i32(size_t field_id) const {
        (void)typed_field(field_id, FieldType::Int32);
        return std::get<int32_t>(read(field_id));
    }

    int64_t RecordView::read_i64(size_t field_id) const {
        (void)typed_field(field_id, FieldType::Int64);
        return std::get<int64_t>(read(field_id));
    }

    int16_t RecordView::read_i16(size_t field_id) const {
        (void)typed_field(field_id, FieldType::Int16);
        return std::get<int16_t>(read(field_id));
    }

    bool RecordView::read_bool(size_t field_id) const {
        (void)typed_field(field_id, FieldType::Bool);
        return std::get<bool>(read(field_id));
    }

    char16_t RecordView::read_char16(size_t field_id) const {
        (void)typed_field(field_id, FieldType::Char16);
        return std::get<char16_t>(read(field_id));
    }

    std::string RecordView::read_string(size_t field_id) const {
        (void)typed_field(field_id, FieldType::FixedString);
        return std::get<std::string>(read(field_id));
    }

    // ==================== Writes ====================

    bool RecordView::write(size_t field_id, const FieldValue& value) {
        require_bound("write");
        const auto& field = layout_->field(field_id);

        if (type_of(value) != field.type) { throw std::invalid_argument(type_mismatch(field, type_of(value))); }
        if (field.attrs.sequence) {
            throw std::logic_error("RecordView::write: '" + field.name + "' is a sequence field, use initialize() or next_sequence()");
        }

        require_mutable("write");

        if (const auto* s = std::get_if<std::string>(&value); s && s->size() > field.length) {
            throw std::length_error("RecordView::write: value of " + std::to_string(s->size()) + " bytes exceeds '" + field.name +
                "' max length " + std::to_string(field.length));
        }

        if (field.attrs.key && key_locked_) { throw std::logic_error("RecordView::write: key field '" + field.name + "' is locked"); }

        if (!field.attrs.indexed || index_sink_ == nullptr) {
            encode(field, value);
            return true;
        }

        // Index entries hold exactly what a later read returns
        const FieldValue indexed = std::holds_alternative<std::string>(value)
                                       ? FieldValue{decoded_form(std::get<std::string>(value))}
                                       : value;

        if (field.attrs.unique && !index_sink_->is_unique_value(field_id, indexed)) {
            STRIDEDB_LOG_DEBUG("record", "unique violation on '", field.name, "' value ", to_string(indexed), " at offset ", offset_);
            return false;
        }

        encode(field, value);
        index_sink_->on_indexed_field_updated(field_id, offset_, indexed);
        return true;
    }

    bool RecordView::write_string_padded(size_t field_id, std::string_view value) {
        const auto& field = typed_field(field_id, FieldType::FixedString);
        if (value.size() > field.length) {
            throw std::length_error("RecordView::write_string_padded: value of " + std::to_string(value.size()) + " bytes exceeds '" +
                field.name + "' max length " + std::to_string(field.length));
        }

        std::string padded{value};
        padded.resize(field.length, ' ');
        return write(field_id, FieldValue{std::move(padded)});
    }

    // ==================== Sequences ====================

    void RecordView::initialize(size_t field_id, int64_t value) {
        require_bound("initialize");
        const auto& field = layout_->field(field_id);
        if (!field.attrs.sequence) { throw std::invalid_argument("RecordView::initialize: '" + field.name + "' is not a sequence field"); }
        require_mutable("initialize");
        if (field.attrs.key && key_locked_) { throw std::logic_error("RecordView::initialize: key field '" + field.name + "' is locked"); }

        switch (field.type) {
            case FieldType::Int32: encode(field, FieldValue{static_cast<int32_t>(value)}); break;
            case FieldType::Int64: encode(field, FieldValue{value}); break;
            case FieldType::Int16: encode(field, FieldValue{static_cast<int16_t>(value)}); break;
            default: throw std::logic_error("RecordView::initialize: sequence field is not an integer");
        }
    }

    int64_t RecordView::next_sequence(size_t field_id) {
        require_bound("next_sequence");
        const auto& field = layout_->field(field_id);
        if (!field.attrs.sequence) { throw std::invalid_argument("RecordView::next_sequence: '" + field.name + "' is not a sequence field"); }
        require_mutable("next_sequence");
        if (field.attrs.key && key_locked_) { throw std::logic_error("RecordView::next_sequence: key field '" + field.name + "' is locked"); }

        const size_t at = offset_ + field.offset;
        if (buffer_.can_fetch_add(at, field.length)) {
            switch (field.type) {
                case FieldType::Int32: return static_cast<int32_t>(buffer_.fetch_add_u32(at, 1) + 1u);
                case FieldType::Int64: return static_cast<int64_t>(buffer_.fetch_add_u64(at, 1) + 1u);
                case FieldType::Int16: return static_cast<int16_t>(static_cast<uint16_t>(buffer_.fetch_add_u16(at, 1) + 1u));
                default: break;
            }
        }

        // Unsigned arithmetic so the counter wraps like the atomic path
        switch (field.type) {
            case FieldType::Int32: buffer_.write_u32_le(at, buffer_.read_u32_le(at) + 1u); break;
            case FieldType::Int64: buffer_.write_u64_le(at, buffer_.read_u64_le(at) + 1u); break;
            case FieldType::Int16: buffer_.write_u16_le(at, static_cast<uint16_t>(buffer_.read_u16_le(at) + 1u)); break;
            default: throw std::logic_error("RecordView::next_sequence: sequence field is not an integer");
        }
        return read_integer(field);
    }

    // ==================== Record Transactions ====================

    void RecordView::begin_transaction() {
        if (!layout_->transactional()) {
            throw std::logic_error("RecordView::begin_transaction: layout '" + layout_->name() + "' is not transactional");
        }
        require_bound("begin_transaction");

        const size_t stride = layout_->stride();
        if (transaction_copy_.size() != stride) { transaction_copy_ = core::OwnedBuffer::allocate(stride); }

        transaction_copy_.view().copy_from(0, buffer_, offset_, stride);
        transaction_pending_ = true;
    }

    bool RecordView::rollback() {
        if (!transaction_pending_) { return false; }
        require_mutable("rollback");

        buffer_.copy_from(offset_, transaction_copy_.view(), 0, layout_->stride());
        transaction_pending_ = false;
        return true;
    }

    // ==================== Internals ====================

    void RecordView::require_bound(const char* op) const {
        if (!bound_) { throw std::logic_error(std::string{"RecordView::"} + op + ": view is not bound"); }
    }

    void RecordView::require_mutable(const char* op) const {
        if (!buffer_.is_mutable()) { throw std::logic_error(std::string{"RecordView::"} + op + ": buffer is read-only"); }
    }

    const FieldLayout& RecordView::typed_field(size_t field_id, FieldType type) const {
        const auto& field = layout_->field(field_id);
        if (field.type != type) { throw std::invalid_argument(type_mismatch(field, type)); }
        return field;
    }

    int64_t RecordView::read_integer(const FieldLayout& field) const {
        const size_t at = offset_ + field.offset;
        switch (field.type) {
            case FieldType::Int32: return static_cast<int32_t>(buffer_.read_u32_le(at));
            case FieldType::Int64: return static_cast<int64_t>(buffer_.read_u64_le(at));
            case FieldType::Int16: return static_cast<int16_t>(buffer_.read_u16_le(at));
            default: throw std::logic_error("RecordView: field '" + field.name + "' is not an integer");
        }
    }

    void RecordView::encode(const FieldLayout& field, const FieldValue& value) const {
        const size_t at = offset_ + field.offset;

        std::visit([&]<typename T>(const T& v) {
            if constexpr (std::is_same_v<T, int32_t>) { buffer_.write_u32_le(at, static_cast<uint32_t>(v)); }
            else if constexpr (std::is_same_v<T, int64_t>) { buffer_.write_u64_le(at, static_cast<uint64_t>(v)); }
            else if constexpr (std::is_same_v<T, int16_t>) { buffer_.write_u16_le(at, static_cast<uint16_t>(v)); }
            else if constexpr (std::is_same_v<T, bool>) { buffer_.write_u8(at, v ? 1 : 0); }
            else if constexpr (std::is_same_v<T, char16_t>) { buffer_.write_u16_le(at, static_cast<uint16_t>(v)); }
            else {
                buffer_.write_ascii(at, v);
                if (v.size() < field.length) { buffer_.fill(at + v.size(), field.length - v.size(), std::byte{0}); }
            }
        }, value);
    }
} // namespace stridedb::record
