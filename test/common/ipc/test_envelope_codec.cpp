//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "ipc/envelope_codec.hpp"

#include "ipc/ipc_types.hpp"
#include "sdk/sdk_gtest_helpers.hpp"
#include "tracking_memory_resource.hpp"

#include "remoting/sdk/invocation.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <cstdint>
#include <string>
#include <vector>

namespace
{

using namespace remoting::common::ipc;  // NOLINT This our main concern here in the unit tests.
using namespace remoting::sdk;          // NOLINT

using testing::_;
using testing::Eq;
using testing::SizeIs;
using testing::IsEmpty;
using testing::Optional;
using testing::VariantWith;
using testing::ElementsAre;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestEnvelopeCodec : public testing::Test
{
protected:
    void TearDown() override
    {
        EXPECT_THAT(mr_.allocations, IsEmpty());
        EXPECT_THAT(mr_.total_allocated_bytes, mr_.total_deallocated_bytes);
    }

    std::vector<std::uint8_t> encode(const Sequence sequence, const InvocationEnvelope& envelope, int& out_err)
    {
        std::vector<std::uint8_t> bytes;
        out_err = codec_.encode(sequence, envelope, [&bytes](const auto payload) {
            //
            bytes.assign(payload.begin(), payload.end());
            return 0;
        });
        return bytes;
    }

    EnvelopeCodec::Decode::Success roundTrip(const Sequence sequence, const InvocationEnvelope& envelope)
    {
        int        err   = -1;
        const auto bytes = encode(sequence, envelope, err);
        EXPECT_THAT(err, 0);

        auto result = codec_.decode({bytes.data(), bytes.size()});
        EXPECT_THAT(result, VariantWith<EnvelopeCodec::Decode::Success>(_));
        return cetl::get<EnvelopeCodec::Decode::Success>(std::move(result));
    }

    // MARK: Data members:

    // NOLINTBEGIN
    remoting::TrackingMemoryResource mr_;
    EnvelopeCodec                    codec_{mr_};
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestEnvelopeCodec, call)
{
    const InvocationEnvelope envelope{ProtocolVersion::V1,
                                      InvocationEnvelope::Call{42, Operation::make("send"), {0x01, 0x02}}};

    int        err   = -1;
    const auto bytes = encode(7, envelope, err);
    EXPECT_THAT(err, 0);
    ASSERT_THAT(bytes, testing::Not(IsEmpty()));
    EXPECT_THAT(bytes.front(), 1);  // version goes first

    auto decoded = codec_.decode({bytes.data(), bytes.size()});
    ASSERT_THAT(decoded, VariantWith<EnvelopeCodec::Decode::Success>(_));
    const auto& success = cetl::get<EnvelopeCodec::Decode::Success>(decoded);
    EXPECT_THAT(success.sequence, 7U);
    EXPECT_THAT(success.envelope, EnvelopeCallTo(ProtocolVersion::V1, 42, "send"));

    const auto& call = cetl::get<InvocationEnvelope::Call>(success.envelope.payload());
    EXPECT_THAT(call.arguments, ElementsAre(0x01, 0x02));
}

TEST_F(TestEnvelopeCodec, reply)
{
    const auto with_value = roundTrip(3, InvocationEnvelope{ProtocolVersion::V2, InvocationEnvelope::Reply{Bytes{9}}});
    EXPECT_THAT(with_value.envelope.version(), ProtocolVersion::V2);
    EXPECT_THAT(with_value.envelope.payload(),
                VariantWith<InvocationEnvelope::Reply>(
                    testing::Field(&InvocationEnvelope::Reply::value, Optional(ElementsAre(9)))));

    // Empty value differs from no value.
    const auto empty = roundTrip(4, InvocationEnvelope{ProtocolVersion::V2, InvocationEnvelope::Reply{Bytes{}}});
    EXPECT_THAT(empty.envelope.payload(),
                VariantWith<InvocationEnvelope::Reply>(
                    testing::Field(&InvocationEnvelope::Reply::value, Optional(IsEmpty()))));

    const auto none = roundTrip(5, InvocationEnvelope{ProtocolVersion::V2, InvocationEnvelope::Reply{}});
    EXPECT_THAT(none.envelope.payload(),
                VariantWith<InvocationEnvelope::Reply>(
                    testing::Field(&InvocationEnvelope::Reply::value, Eq(cetl::nullopt))));
}

TEST_F(TestEnvelopeCodec, fault_message_is_truncated)
{
    const std::string long_message(300, 'x');

    const auto decoded =
        roundTrip(1, InvocationEnvelope{ProtocolVersion::V2, InvocationEnvelope::Fault{EBADF, long_message}});

    const auto* const fault = cetl::get_if<InvocationEnvelope::Fault>(&decoded.envelope.payload());
    ASSERT_THAT(fault, testing::NotNull());
    EXPECT_THAT(fault->code, EBADF);
    EXPECT_THAT(fault->message, SizeIs(EnvelopeCodec::MaxMessageSize));
}

TEST_F(TestEnvelopeCodec, encode_too_long)
{
    int err = 0;

    const std::string long_name(EnvelopeCodec::MaxOperationNameSize + 1, 'n');
    encode(1,
           InvocationEnvelope{ProtocolVersion::V2, InvocationEnvelope::Call{1, Operation::make(long_name), {}}},
           err);
    EXPECT_THAT(err, EINVAL);

    const Bytes long_arguments(EnvelopeCodec::MaxArgumentsSize + 1, 0);
    encode(1,
           InvocationEnvelope{ProtocolVersion::V2, InvocationEnvelope::Call{1, Operation::make("a"), long_arguments}},
           err);
    EXPECT_THAT(err, EINVAL);
}

TEST_F(TestEnvelopeCodec, decode_failures)
{
    EXPECT_THAT(codec_.decode({}), VariantWith<EnvelopeCodec::Decode::Failure>(EINVAL));

    // Version is checked before anything else.
    const std::vector<std::uint8_t> unknown_version{9, 0, 0, 0, 0, 0, 0, 0, 0, 0};
    EXPECT_THAT(codec_.decode({unknown_version.data(), unknown_version.size()}),
                VariantWith<EnvelopeCodec::Decode::Failure>(EPROTONOSUPPORT));

    // Union tag out of range.
    const std::vector<std::uint8_t> bad_tag{2, 0, 0, 0, 0, 0, 0, 0, 0, 7};
    EXPECT_THAT(codec_.decode({bad_tag.data(), bad_tag.size()}), VariantWith<EnvelopeCodec::Decode::Failure>(EINVAL));
}

TEST_F(TestEnvelopeCodec, peekSequence)
{
    int        err   = -1;
    const auto bytes = encode(0x0102030405060708ULL,  //
                              InvocationEnvelope{ProtocolVersion::V2, InvocationEnvelope::Reply{}},
                              err);
    EXPECT_THAT(err, 0);
    EXPECT_THAT(EnvelopeCodec::peekSequence({bytes.data(), bytes.size()}), Optional(0x0102030405060708ULL));

    // Works for versions which can't be decoded.
    const std::vector<std::uint8_t> unknown_version{9, 0x2A, 0, 0, 0, 0, 0, 0, 0, 1};
    EXPECT_THAT(EnvelopeCodec::peekSequence({unknown_version.data(), unknown_version.size()}), Optional(42U));

    const std::vector<std::uint8_t> too_short{9, 0x2A, 0, 0};
    EXPECT_THAT(EnvelopeCodec::peekSequence({too_short.data(), too_short.size()}), Eq(cetl::nullopt));
    EXPECT_THAT(EnvelopeCodec::peekSequence({}), Eq(cetl::nullopt));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
