//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "remoting/sdk/pipe_transport.hpp"

#include "ipc/envelope_codec.hpp"
#include "ipc/ipc_types.hpp"
#include "logging.hpp"

#include "remoting/sdk/client_pipe.hpp"
#include "remoting/sdk/invocation.hpp"
#include "remoting/sdk/transport.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace remoting
{
namespace sdk
{
namespace
{

class PipeTransportImpl final : public PipeTransport
{
public:
    PipeTransportImpl(cetl::pmr::memory_resource&     memory,
                      ClientPipe::Ptr                 client_pipe,
                      const std::chrono::milliseconds request_timeout)
        : codec_{memory}
        , client_pipe_{std::move(client_pipe)}
        , request_timeout_{request_timeout}
        , logger_{common::getLogger("ipc")}
        , is_connected_{false}
        , next_sequence_{common::ipc::OneWaySequence + 1}
    {
        CETL_DEBUG_ASSERT(client_pipe_, "");
    }

    // MARK: PipeTransport

    int start() override
    {
        return client_pipe_->start([this](const auto& event) {
            //
            return cetl::visit([this](const auto& concrete_event) { return handlePipeEvent(concrete_event); },
                               event);
        });
    }

    bool isConnected() const override
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        return is_connected_;
    }

    void setDisconnectHandler(DisconnectHandler handler) override
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        disconnect_handler_ = std::move(handler);
    }

    // MARK: Transport

    int sendOneWay(const InvocationEnvelope& envelope) override
    {
        if (!isConnected())
        {
            return ENOTCONN;
        }
        return sendEnvelope(common::ipc::OneWaySequence, envelope);
    }

    Request::Result sendRequest(const InvocationEnvelope& envelope) override
    {
        const auto sequence = next_sequence_.fetch_add(1);
        {
            const std::lock_guard<std::mutex> lock{mutex_};
            if (!is_connected_)
            {
                return ENOTCONN;
            }
            pending_.emplace(sequence, cetl::nullopt);
        }

        if (const int err = sendEnvelope(sequence, envelope))
        {
            const std::lock_guard<std::mutex> lock{mutex_};
            pending_.erase(sequence);
            return err;
        }

        std::unique_lock<std::mutex> lock{mutex_};
        const bool                   completed = reply_cv_.wait_for(lock, request_timeout_, [this, sequence] {
            //
            const auto it = pending_.find(sequence);
            return (it == pending_.end()) || it->second.has_value();
        });

        const auto it = pending_.find(sequence);
        if (!completed || (it == pending_.end()))
        {
            logger_->debug("Request timed out (seq={}).", sequence);
            if (it != pending_.end())
            {
                pending_.erase(it);
            }
            return ETIMEDOUT;
        }

        auto result = std::move(it->second.value());
        pending_.erase(it);
        return result;
    }

private:
    using Sequence = common::ipc::Sequence;
    using Pending  = std::unordered_map<Sequence, cetl::optional<Request::Result>>;

    CETL_NODISCARD int sendEnvelope(const Sequence sequence, const InvocationEnvelope& envelope)
    {
        return codec_.encode(sequence, envelope, [this](const auto payload) {
            //
            const std::lock_guard<std::mutex> lock{send_mutex_};
            return client_pipe_->send({{payload}});
        });
    }

    CETL_NODISCARD int handlePipeEvent(const ClientPipe::Event::Connected)
    {
        logger_->debug("Pipe is connected.");

        const std::lock_guard<std::mutex> lock{mutex_};
        is_connected_ = true;
        return 0;
    }

    CETL_NODISCARD int handlePipeEvent(const ClientPipe::Event::Disconnected)
    {
        logger_->debug("Pipe is disconnected.");

        DisconnectHandler handler;
        {
            const std::lock_guard<std::mutex> lock{mutex_};
            if (!is_connected_)
            {
                // It's fine to be already disconnected.
                return 0;
            }
            is_connected_ = false;

            // Nothing will reply to the pending requests anymore.
            for (auto& seq_to_result : pending_)
            {
                if (!seq_to_result.second)
                {
                    seq_to_result.second.emplace(ESHUTDOWN);
                }
            }
            handler = disconnect_handler_;
        }
        reply_cv_.notify_all();

        if (handler)
        {
            handler();
        }
        return 0;
    }

    CETL_NODISCARD int handlePipeEvent(const ClientPipe::Event::Message& message)
    {
        using EnvelopeCodec = common::ipc::EnvelopeCodec;

        auto decode_result = codec_.decode(message.payload);
        if (const auto* const err = cetl::get_if<EnvelopeCodec::Decode::Failure>(&decode_result))
        {
            if (*err != EPROTONOSUPPORT)
            {
                logger_->error("Dropping malformed envelope (size={}, err={}).", message.payload.size(), *err);
                return *err;
            }

            logger_->error("Dropping envelope of unsupported version (ver={}).",
                           static_cast<int>(message.payload.front()));

            // Whoever waits for this reply should fail now rather than time out.
            //
            if (const auto sequence = EnvelopeCodec::peekSequence(message.payload))
            {
                complete(sequence.value(), *err);
            }
            return *err;
        }
        auto& decoded = cetl::get<EnvelopeCodec::Decode::Success>(decode_result);

        complete(decoded.sequence, std::move(decoded.envelope));
        return 0;
    }

    void complete(const Sequence sequence, Request::Result&& result)
    {
        {
            const std::lock_guard<std::mutex> lock{mutex_};
            const auto                        it = pending_.find(sequence);
            if ((it == pending_.end()) || it->second.has_value())
            {
                // Nothing to do here with unsolicited (or late) replies - just trace and ignore them.
                logger_->debug("Unsolicited envelope (seq={}).", sequence);
                return;
            }
            it->second.emplace(std::move(result));
        }
        reply_cv_.notify_all();
    }

    common::ipc::EnvelopeCodec      codec_;
    const ClientPipe::Ptr           client_pipe_;
    const std::chrono::milliseconds request_timeout_;
    common::LoggerPtr               logger_;
    mutable std::mutex              mutex_;
    std::mutex                      send_mutex_;
    std::condition_variable         reply_cv_;
    bool                            is_connected_;
    std::atomic<Sequence>           next_sequence_;
    Pending                         pending_;
    DisconnectHandler               disconnect_handler_;

};  // PipeTransportImpl

}  // namespace

PipeTransport::Ptr PipeTransport::make(cetl::pmr::memory_resource&     memory,
                                       ClientPipe::Ptr                 client_pipe,
                                       const std::chrono::milliseconds request_timeout)
{
    return std::make_shared<PipeTransportImpl>(memory, std::move(client_pipe), request_timeout);
}

}  // namespace sdk
}  // namespace remoting
