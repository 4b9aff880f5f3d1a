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

// internal/src/repository/Repository.cpp
#include "repository/Repository.hpp"
#include "repository/SecondaryIndex.hpp"
#include "core/Logging.hpp"
#include "core/buffer/OwnedBuffer.hpp"

#include <cstring>
#include <limits>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace stridedb::repository {
    using schema::FieldType;

    // ==================== Repository::Impl ====================

    class Repository::Impl final : public record::IndexSink {
        public:
            /**
             * Everything a repository transaction snapshots besides the buffer bytes.
             */
            struct State {
                std::unordered_map<int64_t, size_t> offset_by_key;
                std::unordered_set<size_t> valid_offsets;
                size_t current_count{0};
                size_t next_free_offset{0};
                std::vector<SecondaryIndex> indexes;
            };

            Impl(std::shared_ptr<const schema::Layout> layout, size_t capacity, const Options& options)
                : layout_{std::move(layout)}
                  , capacity_{capacity}
                  , options_{options}
                  , slot_stride_{layout_->stride() + options.slot_padding}
                  , key_field_{*layout_->key_field()}
                  , index_slot_(layout_->field_count())
                  , cursor_{layout_, this} {
                if (capacity_ > std::numeric_limits<size_t>::max() / slot_stride_) {
                    throw std::invalid_argument("Repository: capacity " + std::to_string(capacity_) + " overflows buffer size");
                }

                buffer_ = core::OwnedBuffer::allocate(capacity_ * slot_stride_, options_.buffer_alignment);
                buffer_.zero_fill();

                for (const size_t id : layout_->indexed_fields()) {
                    index_slot_[id] = state_.indexes.size();
                    state_.indexes.emplace_back(id, layout_->field(id).attrs.unique);
                }
            }

            // ---- IndexSink ----

            [[nodiscard]] bool is_unique_value(size_t field_id, const record::FieldValue& value) const override {
                const auto* index = find_index(field_id);
                return index == nullptr || index->is_unique(value);
            }

            void on_indexed_field_updated(size_t field_id, size_t offset, const record::FieldValue& value) override {
                if (auto* index = find_index(field_id)) { index->update(offset, value); }
            }

            // ---- Helpers ----

            [[nodiscard]] const SecondaryIndex* find_index(size_t field_id) const noexcept {
                if (field_id >= index_slot_.size() || !index_slot_[field_id]) { return nullptr; }
                return &state_.indexes[*index_slot_[field_id]];
            }

            [[nodiscard]] SecondaryIndex* find_index(size_t field_id) noexcept {
                return const_cast<SecondaryIndex*>(std::as_const(*this).find_index(field_id));
            }

            /**
             * Decodes the key of the record at source[offset].
             */
            [[nodiscard]] int64_t read_key(core::BufferView source, size_t offset) const {
                const auto& field = layout_->field(key_field_);
                const size_t at = offset + field.offset;
                switch (field.type) {
                    case FieldType::Int32: return static_cast<int32_t>(source.read_u32_le(at));
                    case FieldType::Int64: return static_cast<int64_t>(source.read_u64_le(at));
                    case FieldType::Int16: return static_cast<int16_t>(source.read_u16_le(at));
                    default: throw std::logic_error("Repository: key field is not an integer");
                }
            }

            /**
             * Narrows key to the key field's type.
             *
             * @throws std::out_of_range if key does not fit
             */
            [[nodiscard]] record::FieldValue key_value(int64_t key) const {
                const auto& field = layout_->field(key_field_);
                switch (field.type) {
                    case FieldType::Int64: return key;
                    case FieldType::Int32:
                        if (key < std::numeric_limits<int32_t>::min() || key > std::numeric_limits<int32_t>::max()) { break; }
                        return static_cast<int32_t>(key);
                    case FieldType::Int16:
                        if (key < std::numeric_limits<int16_t>::min() || key > std::numeric_limits<int16_t>::max()) { break; }
                        return static_cast<int16_t>(key);
                    default: throw std::logic_error("Repository: key field is not an integer");
                }
                throw std::out_of_range("Repository: key " + std::to_string(key) + " does not fit " +
                    std::string{schema::field_type_name(field.type)} + " field '" + field.name + "'");
            }

            void register_slot(int64_t key, size_t offset) {
                state_.offset_by_key.emplace(key, offset);
                state_.valid_offsets.insert(offset);
                ++state_.current_count;
                state_.next_free_offset += slot_stride_;
            }

            record::RecordView* bind_cursor(size_t offset) {
                cursor_.bind(buffer_.view(), offset);
                cursor_.lock_key();
                return &cursor_;
            }

            std::shared_ptr<const schema::Layout> layout_;
            size_t capacity_;
            Options options_;
            size_t slot_stride_;
            size_t key_field_;
            std::vector<std::optional<size_t>> index_slot_; ///< field id -> position in State::indexes
            record::RecordView cursor_;
            core::OwnedBuffer buffer_;
            State state_;

            core::OwnedBuffer shadow_buffer_;
            State shadow_state_;
            bool transaction_pending_{false};
    };

    // ==================== Factory ====================

    std::unique_ptr<Repository> Repository::create_with_capacity(std::shared_ptr<const schema::Layout> layout, size_t capacity) {
        return create_with_capacity(std::move(layout), capacity, Options{});
    }

    std::unique_ptr<Repository> Repository::create_with_capacity(std::shared_ptr<const schema::Layout> layout, size_t capacity,
                                                                 const Options& options) {
        if (!layout) { throw std::invalid_argument("Repository: layout is null"); }
        if (!layout->key_field()) { throw std::invalid_argument("Repository: layout '" + layout->name() + "' has no key field"); }
        if (!schema::is_integer_type(layout->field(*layout->key_field()).type)) {
            throw std::invalid_argument("Repository: layout '" + layout->name() + "' key field is not an integer");
        }
        if (capacity == 0) { throw std::invalid_argument("Repository: capacity must be positive"); }
        if (options.buffer_alignment == 0 || (options.buffer_alignment & (options.buffer_alignment - 1)) != 0) {
            throw std::invalid_argument("Repository: buffer_alignment must be a power of 2");
        }

        return std::unique_ptr<Repository>(new Repository(std::move(layout), capacity, options));
    }

    Repository::Repository(std::shared_ptr<const schema::Layout> layout, size_t capacity, const Options& options)
        : impl_{std::make_unique<Impl>(std::move(layout), capacity, options)}
          , iterator_{new Iterator{*impl_}} {
        STRIDEDB_LOG_INFO("repository", "created '", impl_->layout_->name(), "' capacity=", impl_->capacity_, " stride=",
                          impl_->layout_->stride(), " slot_padding=", impl_->options_.slot_padding, " indexes=",
                          impl_->state_.indexes.size());
    }

    Repository::~Repository() = default;

    // ==================== Append ====================

    record::RecordView* Repository::append_with_key(int64_t key) {
        auto& state = impl_->state_;
        if (state.current_count >= impl_->capacity_) {
            STRIDEDB_LOG_DEBUG("repository", "append rejected: full (capacity ", impl_->capacity_, ")");
            return nullptr;
        }
        if (state.offset_by_key.contains(key)) {
            STRIDEDB_LOG_DEBUG("repository", "append rejected: duplicate key ", key);
            return nullptr;
        }

        const auto value = impl_->key_value(key);
        const size_t offset = state.next_free_offset;
        auto& cursor = impl_->cursor_;
        cursor.bind_and_write_header(impl_->buffer_.view(), offset);

        if (impl_->layout_->field(impl_->key_field_).attrs.sequence) { cursor.initialize(impl_->key_field_, key); }
        else if (!cursor.write(impl_->key_field_, value)) {
            STRIDEDB_LOG_DEBUG("repository", "append rejected: key ", key, " already claimed on unique key index");
            impl_->buffer_.view().fill(offset, impl_->layout_->stride(), std::byte{0});
            return nullptr;
        }
        cursor.lock_key();

        impl_->register_slot(key, offset);
        return &cursor;
    }

    record::RecordView* Repository::append_by_copy_from_buffer(core::BufferView source, size_t offset) {
        auto& state = impl_->state_;
        if (state.current_count >= impl_->capacity_) {
            STRIDEDB_LOG_DEBUG("repository", "append by copy rejected: full (capacity ", impl_->capacity_, ")");
            return nullptr;
        }

        const int64_t key = impl_->read_key(source, offset);
        if (state.offset_by_key.contains(key)) {
            STRIDEDB_LOG_DEBUG("repository", "append by copy rejected: duplicate key ", key);
            return nullptr;
        }

        const size_t target = state.next_free_offset;
        impl_->buffer_.view().copy_from(target, source, offset, impl_->layout_->stride());

        auto* cursor = impl_->bind_cursor(target);
        impl_->register_slot(key, target);

        for (auto& index : state.indexes) { index.update(target, cursor->read(index.field_id())); }
        return cursor;
    }

    // ==================== Lookup ====================

    bool Repository::contains_key(int64_t key) const { return impl_->state_.offset_by_key.contains(key); }

    size_t Repository::current_count() const noexcept { return impl_->state_.current_count; }

    size_t Repository::capacity() const noexcept { return impl_->capacity_; }

    record::RecordView* Repository::get_by_key(int64_t key) {
        const auto it = impl_->state_.offset_by_key.find(key);
        if (it == impl_->state_.offset_by_key.end()) { return nullptr; }
        return impl_->bind_cursor(it->second);
    }

    record::RecordView* Repository::get_by_buffer_index(size_t index) {
        const auto offset = get_offset_by_buffer_index(index);
        if (!offset) { return nullptr; }
        return impl_->bind_cursor(*offset);
    }

    std::optional<size_t> Repository::get_offset_by_buffer_index(size_t index) const noexcept {
        if (index >= impl_->state_.current_count) { return std::nullopt; }
        return index * impl_->slot_stride_;
    }

    record::RecordView* Repository::get_by_buffer_offset(size_t offset) {
        if (!impl_->state_.valid_offsets.contains(offset)) { return nullptr; }
        return impl_->bind_cursor(offset);
    }

    std::vector<size_t> Repository::get_all_with_index_value(size_t field_id, const record::FieldValue& value) const {
        const auto* index = impl_->find_index(field_id);
        if (index == nullptr) {
            throw std::invalid_argument("Repository::get_all_with_index_value: field " + std::to_string(field_id) + " is not indexed");
        }
        return index->offsets_with_value(value);
    }

    Repository::Iterator& Repository::all_items() noexcept { return *iterator_; }

    // ==================== Buffer ====================

    core::BufferView Repository::underlying_buffer() const noexcept { return impl_->buffer_.view(); }

    uint32_t Repository::crc32() const noexcept { return impl_->buffer_.view().crc32(); }

    std::vector<std::byte> Repository::dump_buffer() const {
        const auto view = impl_->buffer_.view();
        std::vector<std::byte> copy(view.size());
        if (!copy.empty()) { std::memcpy(copy.data(), view.data(), view.size()); }
        return copy;
    }

    const schema::Layout& Repository::layout() const noexcept { return *impl_->layout_; }

    size_t Repository::slot_stride() const noexcept { return impl_->slot_stride_; }

    // ==================== Transactions ====================

    bool Repository::supports_transactions() const noexcept { return impl_->layout_->transactional(); }

    void Repository::begin_transaction() {
        if (!supports_transactions()) {
            throw std::logic_error("Repository::begin_transaction: layout '" + impl_->layout_->name() + "' is not transactional");
        }

        const auto live = impl_->buffer_.view();
        if (impl_->shadow_buffer_.size() != live.size()) {
            impl_->shadow_buffer_ = core::OwnedBuffer::allocate(live.size(), impl_->options_.buffer_alignment);
        }

        impl_->shadow_buffer_.view().copy_from(0, live, 0, live.size());
        impl_->shadow_state_ = impl_->state_;
        impl_->transaction_pending_ = true;
    }

    void Repository::commit() noexcept { impl_->transaction_pending_ = false; }

    bool Repository::rollback() {
        if (!impl_->transaction_pending_) { return false; }

        const auto live = impl_->buffer_.view();
        live.copy_from(0, impl_->shadow_buffer_.view(), 0, live.size());
        impl_->state_ = impl_->shadow_state_;
        impl_->transaction_pending_ = false;

        STRIDEDB_LOG_INFO("repository", "rolled back '", impl_->layout_->name(), "' to ", impl_->state_.current_count, " records");
        return true;
    }

    bool Repository::transaction_pending() const noexcept { return impl_->transaction_pending_; }

    // ==================== Iterator ====================

    Repository::Iterator::Iterator(Repository::Impl& repo) : repo_{&repo}, view_{repo.layout_, &repo} {}

    bool Repository::Iterator::has_next() const noexcept {
        const auto& state = repo_->state_;
        return state.current_count != 0 && current_offset_ + repo_->slot_stride_ <= state.next_free_offset;
    }

    record::RecordView& Repository::Iterator::next() {
        if (!has_next()) { throw std::out_of_range("Repository::Iterator::next: no more records"); }

        view_.bind(repo_->buffer_.view(), current_offset_);
        view_.lock_key();
        current_offset_ += repo_->slot_stride_;
        return view_;
    }

    Repository::Iterator& Repository::Iterator::reset() noexcept {
        current_offset_ = 0;
        return *this;
    }
} // namespace stridedb::repository
