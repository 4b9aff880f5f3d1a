// tests/test_record_view.cpp
#include "record/OwnedRecord.hpp"
#include "record/RecordView.hpp"
#include "core/buffer/OwnedBuffer.hpp"
#include "schema/Layout.hpp"

#include <gtest/gtest.h>
#include <limits>
#include <set>
#include <utility>
#include <stdexcept>
#include <vector>

using namespace stridedb;
using record::FieldValue;
using record::RecordView;
using schema::FieldType;

namespace {
    std::shared_ptr<const schema::Layout> trade_layout(bool transactional = false) {
        schema::Schema schema{"Trade", 11, 2};
        schema.add("id", FieldType::Int32, {.key = true})
              .add("qty", FieldType::Int64)
              .add("venue", FieldType::Int16)
              .add("live", FieldType::Bool)
              .add("side", FieldType::Char16)
              .add_fixed_string("symbol", 6)
              .add("seq", FieldType::Int32, {.sequence = true});
        schema.set_transactional(transactional);
        return schema::LayoutBuilder::build(schema);
    }

    /**
     * Records every sink call; rejects values listed in taken.
     */
    class RecordingSink final : public record::IndexSink {
        public:
            [[nodiscard]] bool is_unique_value(size_t field_id, const FieldValue& value) const override {
                ++uniqueness_checks;
                return !taken.contains({field_id, value});
            }

            void on_indexed_field_updated(size_t field_id, size_t offset, const FieldValue& value) override {
                updates.push_back({field_id, offset, value});
            }

            struct Update {
                size_t field_id;
                size_t offset;
                FieldValue value;
            };

            std::set<std::pair<size_t, FieldValue>> taken;
            std::vector<Update> updates;
            mutable int uniqueness_checks = 0;
    };

    struct Fixture {
        explicit Fixture(bool transactional = false, size_t slots = 2)
            : layout{trade_layout(transactional)}
              , buffer{core::OwnedBuffer::allocate(layout->stride() * slots)}
              , view{layout} { buffer.zero_fill(); }

        std::shared_ptr<const schema::Layout> layout;
        core::OwnedBuffer buffer;
        RecordView view;
    };
} // anonymous namespace

TEST(RecordView, RoundTripsEveryType) {
    Fixture fx;
    fx.view.bind_and_write_header(fx.buffer.view(), 0);
    const auto& l = *fx.layout;

    EXPECT_TRUE(fx.view.write_i32(l.require_field("id"), std::numeric_limits<int32_t>::min()));
    EXPECT_TRUE(fx.view.write_i64(l.require_field("qty"), std::numeric_limits<int64_t>::max()));
    EXPECT_TRUE(fx.view.write_i16(l.require_field("venue"), -7));
    EXPECT_TRUE(fx.view.write_bool(l.require_field("live"), true));
    EXPECT_TRUE(fx.view.write_char16(l.require_field("side"), u'\u00e9'));
    EXPECT_TRUE(fx.view.write_string(l.require_field("symbol"), "ACME"));

    EXPECT_EQ(fx.view.read_i32(l.require_field("id")), std::numeric_limits<int32_t>::min());
    EXPECT_EQ(fx.view.read_i64(l.require_field("qty")), std::numeric_limits<int64_t>::max());
    EXPECT_EQ(fx.view.read_i16(l.require_field("venue")), -7);
    EXPECT_TRUE(fx.view.read_bool(l.require_field("live")));
    EXPECT_EQ(fx.view.read_char16(l.require_field("side")), u'\u00e9');
    EXPECT_EQ(fx.view.read_string(l.require_field("symbol")), "ACME");

    EXPECT_EQ(fx.view.read(l.require_field("venue")), FieldValue{int16_t{-7}});
}

TEST(RecordView, EncodesLittleEndianAtLayoutOffsets) {
    Fixture fx;
    fx.view.bind_and_write_header(fx.buffer.view(), 0);
    const auto id = fx.layout->require_field("id");
    ASSERT_TRUE(fx.view.write_i32(id, 0x01020304));

    const size_t at = fx.layout->field(id).offset;
    EXPECT_EQ(fx.buffer.view().read_u8(at), 0x04);
    EXPECT_EQ(fx.buffer.view().read_u8(at + 3), 0x01);
}

TEST(RecordView, ShorterOverwriteLeavesNoStaleCharacters) {
    Fixture fx;
    fx.view.bind(fx.buffer.view(), 0);
    const auto symbol = fx.layout->require_field("symbol");

    ASSERT_TRUE(fx.view.write_string(symbol, "ABCDEF"));
    ASSERT_TRUE(fx.view.write_string(symbol, "XY"));
    EXPECT_EQ(fx.view.read_string(symbol), "XY");
}

TEST(RecordView, PaddedWritePadsWithTrailingSpaces) {
    Fixture fx;
    fx.view.bind(fx.buffer.view(), 0);
    const auto symbol = fx.layout->require_field("symbol");

    ASSERT_TRUE(fx.view.write_string_padded(symbol, "IBM"));
    EXPECT_EQ(fx.buffer.view().as_string_view(fx.layout->field(symbol).offset, 6), "IBM   ");
    EXPECT_EQ(fx.view.read_string(symbol), "IBM");
}

TEST(RecordView, ReadTrimsBothEnds) {
    Fixture fx;
    fx.view.bind(fx.buffer.view(), 0);
    const auto symbol = fx.layout->require_field("symbol");

    ASSERT_TRUE(fx.view.write_string(symbol, "  ab "));
    EXPECT_EQ(fx.view.read_string(symbol), "ab");
}

TEST(RecordView, TooLongStringThrows) {
    Fixture fx;
    fx.view.bind(fx.buffer.view(), 0);
    const auto symbol = fx.layout->require_field("symbol");

    EXPECT_THROW(fx.view.write_string(symbol, "TOOLONG"), std::length_error);
    EXPECT_THROW(fx.view.write_string_padded(symbol, "TOOLONG"), std::length_error);
}

TEST(RecordView, KeyLockBlocksKeyWritesUntilRebind) {
    Fixture fx;
    fx.view.bind(fx.buffer.view(), 0);
    const auto id = fx.layout->require_field("id");

    ASSERT_TRUE(fx.view.write_i32(id, 1));
    fx.view.lock_key();
    fx.view.lock_key();
    EXPECT_TRUE(fx.view.key_locked());
    EXPECT_THROW(fx.view.write_i32(id, 2), std::logic_error);
    EXPECT_EQ(fx.view.read_i32(id), 1);

    // Other fields stay writable
    EXPECT_TRUE(fx.view.write_i64(fx.layout->require_field("qty"), 5));

    fx.view.bind(fx.buffer.view(), fx.layout->stride());
    EXPECT_FALSE(fx.view.key_locked());
    EXPECT_TRUE(fx.view.write_i32(id, 2));
}

TEST(RecordView, MisuseErrors) {
    Fixture fx;
    const auto id = fx.layout->require_field("id");

    EXPECT_THROW((void)fx.view.read_i32(id), std::logic_error);
    EXPECT_THROW(fx.view.write_i32(id, 1), std::logic_error);
    EXPECT_FALSE(fx.view.validate_header());

    EXPECT_THROW(fx.view.bind(fx.buffer.view(), fx.layout->stride() + 1), std::out_of_range);

    fx.view.bind(fx.buffer.view(), 0);
    EXPECT_THROW((void)fx.view.read_i64(id), std::invalid_argument);
    EXPECT_THROW(fx.view.write_i64(id, 1), std::invalid_argument);
    EXPECT_THROW(fx.view.write(id, FieldValue{std::string{"x"}}), std::invalid_argument);
    EXPECT_THROW(fx.view.write_i32(fx.layout->require_field("seq"), 3), std::logic_error);
}

TEST(RecordView, ReadOnlyBufferRejectsWrites) {
    Fixture fx;
    fx.view.bind_and_write_header(fx.buffer.view(), 0);
    ASSERT_TRUE(fx.view.write_i32(fx.layout->require_field("id"), 9));

    RecordView reader{fx.layout};
    reader.bind(fx.buffer.view().as_read_only(), 0);
    EXPECT_FALSE(reader.is_mutable());
    EXPECT_EQ(reader.read_i32(fx.layout->require_field("id")), 9);
    EXPECT_TRUE(reader.validate_header());
    EXPECT_THROW(reader.write_i64(fx.layout->require_field("qty"), 1), std::logic_error);
    EXPECT_THROW(reader.write_header(), std::logic_error);
}

TEST(RecordView, HeaderValidation) {
    Fixture fx;
    fx.view.bind(fx.buffer.view(), 0);
    EXPECT_FALSE(fx.view.validate_header());

    fx.view.write_header();
    EXPECT_TRUE(fx.view.validate_header());

    const auto header = fx.view.read_header();
    EXPECT_EQ(header.type_id, 11);
    EXPECT_EQ(header.group_id, 2);
    EXPECT_EQ(header.body_length, static_cast<int32_t>(fx.layout->stride()));
    EXPECT_EQ(fx.view.type_id(), 11);
    EXPECT_EQ(fx.view.group_id(), 2);

    fx.buffer.view().write_u16_le(0, 12);
    EXPECT_FALSE(fx.view.validate_header());
}

TEST(RecordView, InstanceStartsSequencesAtOne) {
    auto record = record::OwnedRecord::instance(trade_layout());
    const auto seq = record->layout().require_field("seq");

    EXPECT_TRUE(record->validate_header());
    EXPECT_EQ(record->read_i32(seq), 1);
    EXPECT_EQ(record->next_sequence(seq), 2);
    EXPECT_EQ(record->next_sequence(seq), 3);
    EXPECT_EQ(record->read_i32(seq), 3);

    record->initialize(seq, 100);
    EXPECT_EQ(record->next_sequence(seq), 101);
}

TEST(RecordView, SequenceIncrementsWithoutAtomicCapability) {
    Fixture fx;
    const core::BufferView plain{fx.buffer.data(), fx.buffer.size()};
    fx.view.bind(plain, 1); // misaligned and not atomic-capable
    const auto seq = fx.layout->require_field("seq");

    fx.view.initialize(seq, std::numeric_limits<int32_t>::max());
    EXPECT_EQ(fx.view.next_sequence(seq), std::numeric_limits<int32_t>::min());
    EXPECT_EQ(fx.view.next_sequence(seq), std::numeric_limits<int32_t>::min() + 1);

    EXPECT_THROW(fx.view.initialize(fx.layout->require_field("qty"), 1), std::invalid_argument);
    EXPECT_THROW((void)fx.view.next_sequence(fx.layout->require_field("qty")), std::invalid_argument);
}

TEST(RecordView, IndexSinkOrderAndUniqueness) {
    schema::Schema schema{"Indexed"};
    schema.add("id", FieldType::Int32, {.key = true})
          .add("score", FieldType::Int32, {.indexed = true, .unique = true})
          .add_fixed_string("tag", 4, {.indexed = true});
    const auto layout = schema::LayoutBuilder::build(schema);
    auto buffer = core::OwnedBuffer::allocate(layout->stride());
    buffer.zero_fill();

    RecordingSink sink;
    sink.taken.insert({1, FieldValue{int32_t{10}}});

    RecordView view{layout, &sink};
    view.bind(buffer.view(), 0);

    // Rejected: no bytes, no notification
    EXPECT_FALSE(view.write_i32(1, 10));
    EXPECT_EQ(view.read_i32(1), 0);
    EXPECT_TRUE(sink.updates.empty());

    EXPECT_TRUE(view.write_i32(1, 11));
    ASSERT_EQ(sink.updates.size(), 1u);
    EXPECT_EQ(sink.updates[0].field_id, 1u);
    EXPECT_EQ(sink.updates[0].value, FieldValue{int32_t{11}});

    // Non-unique indexed field: notified, never asked, value stored trimmed
    const int checks = sink.uniqueness_checks;
    EXPECT_TRUE(view.write_string_padded(2, "ab"));
    EXPECT_EQ(sink.uniqueness_checks, checks);
    ASSERT_EQ(sink.updates.size(), 2u);
    EXPECT_EQ(sink.updates[1].value, FieldValue{std::string{"ab"}});

    // Unindexed field never reaches the sink
    EXPECT_TRUE(view.write_i32(0, 5));
    EXPECT_EQ(sink.updates.size(), 2u);
}

TEST(RecordView, RecordTransactionRestoresBytes) {
    Fixture fx{true};
    fx.view.bind_and_write_header(fx.buffer.view(), 0);
    const auto qty = fx.layout->require_field("qty");
    const auto symbol = fx.layout->require_field("symbol");
    ASSERT_TRUE(fx.view.supports_transactions());

    ASSERT_TRUE(fx.view.write_i64(qty, 10));
    ASSERT_TRUE(fx.view.write_string(symbol, "OLD"));

    fx.view.begin_transaction();
    EXPECT_TRUE(fx.view.transaction_pending());
    ASSERT_TRUE(fx.view.write_i64(qty, 99));
    ASSERT_TRUE(fx.view.write_string(symbol, "NEW"));

    EXPECT_TRUE(fx.view.rollback());
    EXPECT_EQ(fx.view.read_i64(qty), 10);
    EXPECT_EQ(fx.view.read_string(symbol), "OLD");
    EXPECT_FALSE(fx.view.rollback());
}

TEST(RecordView, RecordCommitDropsSnapshot) {
    Fixture fx{true};
    fx.view.bind(fx.buffer.view(), 0);
    const auto qty = fx.layout->require_field("qty");

    fx.view.begin_transaction();
    ASSERT_TRUE(fx.view.write_i64(qty, 7));
    fx.view.commit();
    EXPECT_FALSE(fx.view.rollback());
    EXPECT_EQ(fx.view.read_i64(qty), 7);

    // Rebinding drops a pending snapshot
    fx.view.begin_transaction();
    fx.view.bind(fx.buffer.view(), fx.layout->stride());
    EXPECT_FALSE(fx.view.rollback());
}

TEST(RecordView, RecordTransactionRequiresTransactionalLayout) {
    Fixture fx{false};
    fx.view.bind(fx.buffer.view(), 0);
    EXPECT_FALSE(fx.view.supports_transactions());
    EXPECT_THROW(fx.view.begin_transaction(), std::logic_error);
}

TEST(RecordView, SequenceUsesAtomicPathWhenAligned) {
    schema::Schema schema{"Counter"};
    schema.add("ticks", FieldType::Int64, {.sequence = true});
    auto record = record::OwnedRecord::instance(schema::LayoutBuilder::build(schema));

    ASSERT_TRUE(record->is_atomic());
    ASSERT_TRUE(record->buffer().can_fetch_add(record->layout().field(0).offset, 8));

    for (int i = 0; i < 10; ++i) { (void)record->next_sequence(0); }
    EXPECT_EQ(record->read_i64(0), 11);
    EXPECT_EQ(record->next_sequence(0), 12);
}
