//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "remoting/sdk/delegate.hpp"

#include "sdk_gtest_helpers.hpp"
#include "tracking_memory_resource.hpp"
#include "transport_mock.hpp"

#include "remoting/sdk/consumer_delegate.hpp"
#include "remoting/sdk/dispatch_pipeline.hpp"
#include "remoting/sdk/endpoint_state.hpp"
#include "remoting/sdk/errors.hpp"
#include "remoting/sdk/failover_gate.hpp"
#include "remoting/sdk/invocation.hpp"
#include "remoting/sdk/operation_table.hpp"
#include "remoting/sdk/producer_delegate.hpp"
#include "remoting/sdk/session_delegate.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <memory>
#include <type_traits>

namespace
{

using namespace remoting::sdk;  // NOLINT This our main concern here in the unit tests.

using testing::_;
using testing::AllOf;
using testing::Eq;
using testing::IsTrue;
using testing::Return;
using testing::IsEmpty;
using testing::IsFalse;
using testing::NotNull;
using testing::Optional;
using testing::StrictMock;
using testing::VariantWith;
using testing::ElementsAre;
using testing::Field;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestDelegate : public testing::Test
{
protected:
    void SetUp() override
    {
        cetl::pmr::set_default_resource(&mr_);
    }

    void TearDown() override
    {
        EXPECT_THAT(mr_.allocations, IsEmpty());
        EXPECT_THAT(mr_.total_allocated_bytes, mr_.total_deallocated_bytes);
    }

    EndpointState::Ptr makeEndpointState(TransportMock&        transport_mock,
                                         const ProtocolVersion version = ProtocolVersion::V2)
    {
        return EndpointState::make(TransportMock::wrap(transport_mock), version, gate_);
    }

    DelegateHandle::Ptr makeAttachedHandle(const DelegateId id, EndpointState::Ptr endpoint_state)
    {
        auto handle = DelegateHandle::make(operations_, id);
        EXPECT_THAT(handle->attach(DispatchPipeline::make()), Eq(cetl::nullopt));
        handle->setEndpointState(std::move(endpoint_state));
        return handle;
    }

    // MARK: Data members:

    // NOLINTBEGIN
    remoting::TrackingMemoryResource mr_;
    OperationTable::Ptr              operations_{OperationTable::makeDefault()};
    FailoverGate::Ptr gate_{FailoverGate::make({FailoverPolicy::FailFast, std::chrono::milliseconds{0}})};
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestDelegate, make)
{
    // Handles are made by their factories only, so they are always owned by `std::shared_ptr`.
    static_assert(!std::is_constructible<DelegateHandle, OperationTable::Ptr, DelegateId>::value, "");
    static_assert(!std::is_constructible<ProducerDelegate,
                                         cetl::pmr::memory_resource&,
                                         OperationTable::Ptr,
                                         DelegateId>::value,
                  "");
    static_assert(!std::is_constructible<ConsumerDelegate,
                                         cetl::pmr::memory_resource&,
                                         OperationTable::Ptr,
                                         DelegateId>::value,
                  "");
    static_assert(!std::is_constructible<SessionDelegate,
                                         cetl::pmr::memory_resource&,
                                         OperationTable::Ptr,
                                         DelegateId>::value,
                  "");

    const auto handle = DelegateHandle::make(operations_);
    ASSERT_THAT(handle, NotNull());
    EXPECT_THAT(handle->id(), DelegateHandle::InvalidId);
    EXPECT_THAT(handle->isClosed(), IsFalse());
    EXPECT_THAT(handle->isAttached(), IsFalse());
    EXPECT_THAT(handle->endpointState(), testing::IsNull());
    EXPECT_THAT(handle->name(), Eq(cetl::string_view{"delegate"}));

    const auto handle_with_id = DelegateHandle::make(operations_, 42);
    EXPECT_THAT(handle_with_id->id(), 42);
}

TEST_F(TestDelegate, invoke_before_attach)
{
    StrictMock<TransportMock> transport_mock;

    const auto handle = DelegateHandle::make(operations_, 42);
    handle->setEndpointState(makeEndpointState(transport_mock));

    // Neither one-way nor request/response operations reach the transport.
    //
    auto one_way = makeInvocation("changeRate");
    EXPECT_THAT(handle->invoke(one_way), VariantWith<Invocation::Failure>(VariantWith<Error::InvalidState>(_)));

    auto request = makeInvocation("send");
    EXPECT_THAT(handle->invoke(request), VariantWith<Invocation::Failure>(VariantWith<Error::InvalidState>(_)));
    EXPECT_THAT(handle->call(request), VariantWith<Invocation::Failure>(VariantWith<Error::InvalidState>(_)));

    EXPECT_CALL(transport_mock, deinit()).Times(1);
}

TEST_F(TestDelegate, invoke_without_endpoint_state)
{
    const auto handle = DelegateHandle::make(operations_, 42);
    EXPECT_THAT(handle->attach(DispatchPipeline::make()), Eq(cetl::nullopt));

    auto invocation = makeInvocation("send");
    EXPECT_THAT(handle->invoke(invocation), VariantWith<Invocation::Failure>(VariantWith<Error::InvalidState>(_)));
}

TEST_F(TestDelegate, attach)
{
    const auto handle   = DelegateHandle::make(operations_, 42);
    const auto pipeline = DispatchPipeline::make();

    EXPECT_THAT(handle->attach(pipeline), Eq(cetl::nullopt));
    EXPECT_THAT(handle->isAttached(), IsTrue());
    EXPECT_THAT(pipeline->hasTerminal(), IsTrue());

    // Repeated attach to the same pipeline is a no-op.
    EXPECT_THAT(handle->attach(pipeline), Eq(cetl::nullopt));

    // But not to a different one.
    const auto other_pipeline = DispatchPipeline::make();
    EXPECT_THAT(handle->attach(other_pipeline), Optional(VariantWith<Error::InvalidState>(_)));
    EXPECT_THAT(other_pipeline->hasTerminal(), IsFalse());

    // And a pipeline does not accept a second terminal.
    const auto other_handle = DelegateHandle::make(operations_, 7);
    EXPECT_THAT(other_handle->attach(pipeline), Optional(VariantWith<Error::InvalidState>(_)));
    EXPECT_THAT(other_handle->isAttached(), IsFalse());
}

TEST_F(TestDelegate, invoke_one_way)
{
    StrictMock<TransportMock> transport_mock;

    const auto handle = makeAttachedHandle(42, makeEndpointState(transport_mock, ProtocolVersion::V2));

    // `sendRequest` is never expected (strict mock), so any use of the request path fails the test.
    //
    EXPECT_CALL(transport_mock, sendOneWay(EnvelopeCallTo(ProtocolVersion::V2, 42, "changeRate")))  //
        .WillOnce(Return(0));
    auto invocation = makeInvocation("changeRate", {0x01, 0x02});
    EXPECT_THAT(handle->invoke(invocation), VariantWith<Invocation::Success>(Eq(cetl::nullopt)));

    // Failure of a one-way send is still reported (as is, without retries).
    //
    EXPECT_CALL(transport_mock, sendOneWay(_)).WillOnce(Return(ESHUTDOWN));
    EXPECT_THAT(handle->invoke(invocation),
                VariantWith<Invocation::Failure>(
                    VariantWith<Error::TransportFailure>(Field(&Error::TransportFailure::code, ESHUTDOWN))));

    EXPECT_CALL(transport_mock, deinit()).Times(1);
}

TEST_F(TestDelegate, invoke_request_value)
{
    StrictMock<TransportMock> transport_mock;

    const auto handle = makeAttachedHandle(42, makeEndpointState(transport_mock));

    EXPECT_CALL(transport_mock, sendRequest(EnvelopeCallTo(ProtocolVersion::V2, 42, "receive")))  //
        .WillOnce(Return(replyWith(ProtocolVersion::V2, Bytes{0x0A, 0x0B})));
    auto invocation = makeInvocation("receive");
    EXPECT_THAT(handle->invoke(invocation), VariantWith<Invocation::Success>(Optional(ElementsAre(0x0A, 0x0B))));

    // "void" reply
    EXPECT_CALL(transport_mock, sendRequest(_)).WillOnce(Return(replyWith(ProtocolVersion::V2)));
    EXPECT_THAT(handle->invoke(invocation), VariantWith<Invocation::Success>(Eq(cetl::nullopt)));

    EXPECT_CALL(transport_mock, deinit()).Times(1);
}

TEST_F(TestDelegate, invoke_request_server_fault)
{
    StrictMock<TransportMock> transport_mock;

    const auto handle = makeAttachedHandle(42, makeEndpointState(transport_mock));

    EXPECT_CALL(transport_mock, sendRequest(_))  //
        .WillOnce(Return(faultWith(ProtocolVersion::V2, EACCES, "not allowed")));
    auto invocation = makeInvocation("send");
    EXPECT_THAT(handle->invoke(invocation),
                VariantWith<Invocation::Failure>(VariantWith<Error::ServerFault>(
                    AllOf(Field(&Error::ServerFault::code, EACCES),
                          Field(&Error::ServerFault::message, "not allowed")))));
    EXPECT_THAT(handle->isClosed(), IsFalse());

    // A call in place of a reply is a protocol violation.
    //
    EXPECT_CALL(transport_mock, sendRequest(_))  //
        .WillOnce(Return(InvocationEnvelope{ProtocolVersion::V2,
                                            InvocationEnvelope::Call{42, Operation::make("send"), {}}}));
    EXPECT_THAT(handle->invoke(invocation),
                VariantWith<Invocation::Failure>(
                    VariantWith<Error::ServerFault>(Field(&Error::ServerFault::code, EPROTO))));

    EXPECT_CALL(transport_mock, deinit()).Times(1);
}

TEST_F(TestDelegate, invoke_request_transport_failure)
{
    StrictMock<TransportMock> transport_mock;

    const auto handle = makeAttachedHandle(42, makeEndpointState(transport_mock));

    EXPECT_CALL(transport_mock, sendRequest(_)).WillOnce(Return(ETIMEDOUT));
    auto invocation = makeInvocation("send");
    EXPECT_THAT(handle->invoke(invocation),
                VariantWith<Invocation::Failure>(
                    VariantWith<Error::TransportFailure>(Field(&Error::TransportFailure::code, ETIMEDOUT))));

    EXPECT_CALL(transport_mock, deinit()).Times(1);
}

TEST_F(TestDelegate, invoke_request_reply_version_mismatch)
{
    StrictMock<TransportMock> transport_mock;

    const auto handle = makeAttachedHandle(42, makeEndpointState(transport_mock, ProtocolVersion::V2));

    EXPECT_CALL(transport_mock, sendRequest(EnvelopeCallTo(ProtocolVersion::V2, 42, "send")))  //
        .WillOnce(Return(replyWith(ProtocolVersion::V1, Bytes{0x01})));
    auto invocation = makeInvocation("send");
    EXPECT_THAT(handle->invoke(invocation),
                VariantWith<Invocation::Failure>(
                    VariantWith<Error::ProtocolVersion>(Field(&Error::ProtocolVersion::version, 1))));

    // Reply of unsupported version is rejected by the transport itself. Still a non-retryable version error.
    //
    EXPECT_CALL(transport_mock, sendRequest(_)).WillOnce(Return(EPROTONOSUPPORT));
    const auto result = handle->invoke(invocation);
    EXPECT_THAT(result, VariantWith<Invocation::Failure>(VariantWith<Error::ProtocolVersion>(_)));
    EXPECT_THAT(isRetryable(cetl::get<Invocation::Failure>(result)), IsFalse());

    EXPECT_CALL(transport_mock, deinit()).Times(1);
}

TEST_F(TestDelegate, object_closed_fault_closes_handle)
{
    StrictMock<TransportMock> transport_mock;

    const auto handle = makeAttachedHandle(42, makeEndpointState(transport_mock));

    EXPECT_CALL(transport_mock, sendRequest(_))  //
        .WillOnce(Return(faultWith(ProtocolVersion::V2, static_cast<std::int32_t>(ErrorCode::ObjectClosed))));
    auto invocation = makeInvocation("send");
    EXPECT_THAT(handle->invoke(invocation),
                VariantWith<Invocation::Failure>(
                    VariantWith<Error::ResourceClosed>(Field(&Error::ResourceClosed::id, 42))));
    EXPECT_THAT(handle->isClosed(), IsTrue());

    // From now on the failure is local - no round trip (strict mock has no more expectations).
    //
    EXPECT_THAT(handle->invoke(invocation),
                VariantWith<Invocation::Failure>(VariantWith<Error::ResourceClosed>(_)));
    auto one_way = makeInvocation("changeRate");
    EXPECT_THAT(handle->invoke(one_way), VariantWith<Invocation::Failure>(VariantWith<Error::ResourceClosed>(_)));

    EXPECT_CALL(transport_mock, deinit()).Times(1);
}

TEST_F(TestDelegate, synchronizeWith)
{
    StrictMock<TransportMock> transport_mock;

    const auto state  = makeEndpointState(transport_mock);
    const auto handle = makeAttachedHandle(42, state);

    // The source is a bare handle: not attached, no endpoint state, another operation table.
    //
    const auto source = DelegateHandle::make(OperationTable::make({}), 7);
    EXPECT_THAT(handle->synchronizeWith(*source), Eq(cetl::nullopt));
    EXPECT_THAT(handle->id(), 7);
    EXPECT_THAT(handle->endpointState(), Eq(state));
    EXPECT_THAT(handle->isAttached(), IsTrue());
    EXPECT_THAT(handle->isClosed(), IsFalse());
    EXPECT_THAT(handle->operations().isOneWay(Operation::make("changeRate")), IsTrue());
    EXPECT_THAT(source->id(), 7);
    EXPECT_THAT(source->isAttached(), IsFalse());

    // Idempotent.
    EXPECT_THAT(handle->synchronizeWith(*source), Eq(cetl::nullopt));
    EXPECT_THAT(handle->id(), 7);

    // Invalid source is rejected, and the id stays as is.
    const auto invalid_source = DelegateHandle::make(operations_);
    EXPECT_THAT(handle->synchronizeWith(*invalid_source), Optional(VariantWith<Error::InvalidState>(_)));
    EXPECT_THAT(handle->id(), 7);

    // The next call goes out with the new id.
    EXPECT_CALL(transport_mock, sendRequest(EnvelopeCallTo(ProtocolVersion::V2, 7, "send")))  //
        .WillOnce(Return(replyWith(ProtocolVersion::V2)));
    auto invocation = makeInvocation("send");
    EXPECT_THAT(handle->invoke(invocation), VariantWith<Invocation::Success>(_));

    EXPECT_CALL(transport_mock, deinit()).Times(1);
}

TEST_F(TestDelegate, setEndpointState)
{
    StrictMock<TransportMock> transport_mock_v2;
    StrictMock<TransportMock> transport_mock_v1;

    const auto handle = makeAttachedHandle(42, makeEndpointState(transport_mock_v2, ProtocolVersion::V2));

    EXPECT_CALL(transport_mock_v2, sendOneWay(EnvelopeCallTo(ProtocolVersion::V2, 42, "changeRate")))
        .WillOnce(Return(0));
    auto invocation = makeInvocation("changeRate");
    EXPECT_THAT(handle->invoke(invocation), VariantWith<Invocation::Success>(_));

    // The old endpoint state (and its transport) is released by the swap.
    //
    EXPECT_CALL(transport_mock_v2, deinit()).Times(1);
    handle->setEndpointState(makeEndpointState(transport_mock_v1, ProtocolVersion::V1));
    testing::Mock::VerifyAndClearExpectations(&transport_mock_v2);

    EXPECT_CALL(transport_mock_v1, sendOneWay(EnvelopeCallTo(ProtocolVersion::V1, 42, "changeRate")))
        .WillOnce(Return(0));
    EXPECT_THAT(handle->invoke(invocation), VariantWith<Invocation::Success>(_));

    EXPECT_CALL(transport_mock_v1, deinit()).Times(1);
}

TEST_F(TestDelegate, invoke_while_failing_over)
{
    StrictMock<TransportMock> transport_mock;

    const auto handle = makeAttachedHandle(42, makeEndpointState(transport_mock));

    EXPECT_THAT(gate_->enterFailingOver(), IsTrue());
    auto invocation = makeInvocation("send");
    const auto result = handle->invoke(invocation);
    EXPECT_THAT(result, VariantWith<Invocation::Failure>(VariantWith<Error::FailingOver>(_)));
    EXPECT_THAT(isRetryable(cetl::get<Invocation::Failure>(result)), IsTrue());

    EXPECT_THAT(gate_->leaveFailingOver(), IsTrue());
    EXPECT_CALL(transport_mock, sendRequest(_)).WillOnce(Return(replyWith(ProtocolVersion::V2)));
    EXPECT_THAT(handle->invoke(invocation), VariantWith<Invocation::Success>(_));

    EXPECT_CALL(transport_mock, deinit()).Times(1);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
