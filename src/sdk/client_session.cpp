//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "remoting/sdk/client_session.hpp"

#include "logging.hpp"

#include "remoting/sdk/client_pipe.hpp"
#include "remoting/sdk/config.hpp"
#include "remoting/sdk/consumer_delegate.hpp"
#include "remoting/sdk/delegate.hpp"
#include "remoting/sdk/dispatch_pipeline.hpp"
#include "remoting/sdk/endpoint_state.hpp"
#include "remoting/sdk/errors.hpp"
#include "remoting/sdk/failover_gate.hpp"
#include "remoting/sdk/invocation.hpp"
#include "remoting/sdk/operation_table.hpp"
#include "remoting/sdk/pipe_transport.hpp"
#include "remoting/sdk/producer_delegate.hpp"
#include "remoting/sdk/session_delegate.hpp"
#include "remoting/sdk/transport.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace remoting
{
namespace sdk
{
namespace
{

class ClientSessionImpl final : public ClientSession, public std::enable_shared_from_this<ClientSessionImpl>
{
public:
    ClientSessionImpl(cetl::pmr::memory_resource& memory, Transport::Ptr transport, Options options)
        : memory_{memory}
        , options_{std::move(options)}
        , operations_{OperationTable::makeDefault(options_.one_way_operations)}
        , gate_{FailoverGate::make(options_.failover)}
        , endpoint_state_{EndpointState::make(std::move(transport), options_.protocol_version, gate_)}
        , logger_{common::getLogger("sdk")}
    {
        logger_->debug("Client session is created (ver={}, one_way_ops={}).",
                       options_.protocol_version,
                       operations_->oneWayCount());
    }

    // MARK: ClientSession

    const OperationTable::Ptr& operations() const noexcept override
    {
        return operations_;
    }

    EndpointState::Ptr endpointState() const override
    {
        return std::atomic_load(&endpoint_state_);
    }

    bool isFailingOver() const noexcept override
    {
        return gate_->state() == FailoverGate::State::FailingOver;
    }

    OptError adopt(const DelegateHandle::Ptr& delegate) override
    {
        CETL_DEBUG_ASSERT(delegate, "");

        if (!delegate->isAttached())
        {
            if (auto error = delegate->attach(DispatchPipeline::make(options_.interceptors)))
            {
                return error;
            }
        }

        // Endpoint state and tracking are updated under the same lock as the failover installs a new state,
        // so a delegate adopted during failover can't miss the new endpoint state.
        //
        const std::lock_guard<std::mutex> lock{delegates_mutex_};
        delegate->setEndpointState(endpointState());
        pruneExpiredDelegates();
        const auto is_tracked = std::any_of(delegates_.cbegin(), delegates_.cend(), [&delegate](const auto& tracked) {
            //
            return tracked.lock() == delegate;
        });
        if (!is_tracked)
        {
            delegates_.push_back(delegate);
        }

        logger_->trace("Delegate is adopted (id={}).", delegate->id());
        return cetl::nullopt;
    }

    std::size_t trackedDelegates() const override
    {
        const std::lock_guard<std::mutex> lock{delegates_mutex_};
        return delegates_.size();
    }

    Create<SessionDelegate>::Result openSession(const DelegateId session_id) override
    {
        return makeAndAdopt(SessionDelegate::make(memory_, operations_, session_id));
    }

    Create<ProducerDelegate>::Result createProducer(SessionDelegate&        session,
                                                    const cetl::string_view address) override
    {
        auto id_result = session.createProducer(address);
        if (auto* const error = cetl::get_if<Error::Var>(&id_result))
        {
            return std::move(*error);
        }
        return makeAndAdopt(ProducerDelegate::make(memory_, operations_, cetl::get<DelegateId>(id_result)));
    }

    Create<ConsumerDelegate>::Result createConsumer(SessionDelegate&        session,
                                                    const cetl::string_view address) override
    {
        auto id_result = session.createConsumer(address);
        if (auto* const error = cetl::get_if<Error::Var>(&id_result))
        {
            return std::move(*error);
        }
        return makeAndAdopt(ConsumerDelegate::make(memory_, operations_, cetl::get<DelegateId>(id_result)));
    }

    void onTransportDisconnected() override
    {
        if (gate_->enterFailingOver())
        {
            logger_->warn("Transport is disconnected - failing over (policy={}).",
                          (options_.failover.policy == FailoverPolicy::Block) ? "block" : "fail_fast");
        }
    }

    Failover::Result failover(Transport::Ptr        new_transport,
                              const ProtocolVersion new_version,
                              const Resolver&       resolver) override
    {
        if (!new_transport || !resolver)
        {
            return Error::Var{Error::InvalidState{"failover needs a transport and a resolver"}};
        }

        // Failover might be initiated directly, without prior disconnect notification.
        (void) gate_->enterFailingOver();

        const auto new_state = EndpointState::make(std::move(new_transport), new_version, gate_);

        // The resolver runs without the lock (it may talk to the new server for a while).
        //
        std::vector<DelegateHandle::Ptr> live_delegates;
        {
            const std::lock_guard<std::mutex> lock{delegates_mutex_};
            pruneExpiredDelegates();
            for (const auto& weak_delegate : delegates_)
            {
                if (auto delegate = weak_delegate.lock())
                {
                    live_delegates.push_back(std::move(delegate));
                }
            }
        }
        std::size_t synchronized = 0;
        for (const auto& delegate : live_delegates)
        {
            if (resynchronize(*delegate, resolver))
            {
                ++synchronized;
            }
        }

        // Install the new endpoint state - a single pointer swap per delegate.
        // Delegates adopted in the meantime are also covered here.
        //
        {
            const std::lock_guard<std::mutex> lock{delegates_mutex_};
            for (const auto& weak_delegate : delegates_)
            {
                if (const auto delegate = weak_delegate.lock())
                {
                    delegate->setEndpointState(new_state);
                }
            }
            std::atomic_store(&endpoint_state_, new_state);
        }

        (void) gate_->leaveFailingOver();

        logger_->info("Failover is completed (ver={}, synchronized={}).", new_version, synchronized);
        return synchronized;
    }

    Failover::Result failover(ClientPipe::Ptr       new_pipe,
                              const ProtocolVersion new_version,
                              const Resolver&       resolver) override
    {
        if (!new_pipe || !resolver)
        {
            return Error::Var{Error::InvalidState{"failover needs a pipe and a resolver"}};
        }

        const auto transport = PipeTransport::make(memory_, std::move(new_pipe), options_.request_timeout);
        if (const int err = startWatched(*transport))
        {
            return Error::Var{Error::TransportFailure{err}};
        }
        return failover(transport, new_version, resolver);
    }

    Invocation::Result resubmit(DelegateHandle& delegate, Invocation& invocation) override
    {
        auto result = delegate.call(invocation);

        const auto* const error = cetl::get_if<Invocation::Failure>(&result);
        if ((error == nullptr) || !isRetryable(*error))
        {
            return result;
        }

        logger_->debug("Resubmitting (id={}, op='{}', error='{}').", delegate.id(), invocation.operation.name, *error);
        if (!gate_->awaitStable(options_.failover.timeout))
        {
            return result;
        }
        return delegate.call(invocation);
    }

    /// Hooks disconnection of the transport to this session, and starts the transport.
    ///
    CETL_NODISCARD int startWatched(PipeTransport& transport)
    {
        const std::weak_ptr<ClientSessionImpl> weak_self = shared_from_this();
        const Transport* const                 watched   = &transport;
        transport.setDisconnectHandler([weak_self, watched] {
            //
            if (const auto self = weak_self.lock())
            {
                self->onTransportDisconnected(*watched);
            }
        });

        if (const int err = transport.start())
        {
            logger_->error("Failed to start pipe transport (err={}).", err);
            return err;
        }
        return 0;
    }

private:
    void onTransportDisconnected(const Transport& transport)
    {
        // Transports replaced by a failover may still report their disconnection.
        if (endpointState()->transportPtr().get() != &transport)
        {
            logger_->debug("Ignoring disconnection of a replaced transport.");
            return;
        }
        onTransportDisconnected();
    }

    template <typename Delegate>
    typename Create<Delegate>::Result makeAndAdopt(std::shared_ptr<Delegate> delegate)
    {
        if (auto error = adopt(delegate))
        {
            return std::move(*error);
        }
        return delegate;
    }

    bool resynchronize(DelegateHandle& delegate, const Resolver& resolver) const
    {
        if (delegate.isClosed())
        {
            return false;
        }

        const auto replacement = resolver(delegate);
        if (!replacement)
        {
            logger_->warn("Delegate is not recovered by failover (id={}).", delegate.id());
            return false;
        }
        if (auto error = delegate.synchronizeWith(*replacement))
        {
            logger_->warn("Delegate is not synchronized (id={}, error='{}').", delegate.id(), *error);
            return false;
        }
        return true;
    }

    void pruneExpiredDelegates()
    {
        delegates_.erase(std::remove_if(delegates_.begin(),
                                        delegates_.end(),
                                        [](const auto& weak_delegate) { return weak_delegate.expired(); }),
                         delegates_.end());
    }

    cetl::pmr::memory_resource&                memory_;
    const Options                              options_;
    const OperationTable::Ptr                  operations_;
    const FailoverGate::Ptr                    gate_;
    EndpointState::Ptr                         endpoint_state_;  // accessed with `std::atomic_load/store` only
    mutable std::mutex                         delegates_mutex_;
    std::vector<std::weak_ptr<DelegateHandle>> delegates_;
    common::LoggerPtr                          logger_;

};  // ClientSessionImpl

}  // namespace

ClientSession::Ptr ClientSession::make(cetl::pmr::memory_resource& memory, Transport::Ptr transport, Options options)
{
    CETL_DEBUG_ASSERT(transport, "");
    return std::make_shared<ClientSessionImpl>(memory, std::move(transport), std::move(options));
}

ClientSession::Ptr ClientSession::make(cetl::pmr::memory_resource& memory,
                                       ClientPipe::Ptr             client_pipe,
                                       Options                     options)
{
    CETL_DEBUG_ASSERT(client_pipe, "");

    const auto request_timeout = options.request_timeout;
    const auto transport       = PipeTransport::make(memory, std::move(client_pipe), request_timeout);
    auto       session         = std::make_shared<ClientSessionImpl>(memory, transport, std::move(options));
    if (0 != session->startWatched(*transport))
    {
        return nullptr;
    }

    return session;
}

ClientSession::Options ClientSession::Options::fromConfig(const Config& config)
{
    Options options;

    options.one_way_operations = config.getDispatchOneWayOperations();

    if (const auto raw_version = config.getDispatchProtocolVersion())
    {
        const auto value = raw_version.value();
        if ((value >= 0) && (value <= std::numeric_limits<std::uint8_t>::max()) &&
            isSupportedVersion(static_cast<std::uint8_t>(value)))
        {
            options.protocol_version = static_cast<ProtocolVersion>(value);
        }
        else
        {
            common::getLogger("sdk")->warn("Ignoring unsupported protocol version (ver={}).", value);
        }
    }

    if (const auto policy = config.getFailoverPolicy())
    {
        if (policy.value() == "fail_fast")
        {
            options.failover.policy = FailoverPolicy::FailFast;
        }
        else if (policy.value() == "block")
        {
            options.failover.policy = FailoverPolicy::Block;
        }
        else
        {
            common::getLogger("sdk")->warn("Ignoring unknown failover policy (policy='{}').", policy.value());
        }
    }
    if (const auto timeout_ms = config.getFailoverTimeoutMs())
    {
        options.failover.timeout = std::chrono::milliseconds{std::max<std::int64_t>(0, timeout_ms.value())};
    }

    if (const auto timeout_ms = config.getTransportRequestTimeoutMs())
    {
        options.request_timeout = std::chrono::milliseconds{std::max<std::int64_t>(0, timeout_ms.value())};
    }

    return options;
}

}  // namespace sdk
}  // namespace remoting
