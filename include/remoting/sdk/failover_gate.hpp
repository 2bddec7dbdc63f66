//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REMOTING_SDK_FAILOVER_GATE_HPP_INCLUDED
#define REMOTING_SDK_FAILOVER_GATE_HPP_INCLUDED

#include "errors.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>

namespace remoting
{
namespace sdk
{

/// Defines what invocations do while their session is failing over.
///
enum class FailoverPolicy : std::uint8_t
{
    /// Block the calling thread until the session is stable again (or the failover timeout expires).
    Block,

    /// Fail immediately with the retryable `Error::FailingOver`.
    FailFast,

};  // FailoverPolicy

/// Connection-level state machine which gates invocations of all delegates of a session.
///
/// Two states: `Stable` (bound to one transport/version pair), and transient `FailingOver`
/// (entered on transport disconnect, left when a replacement endpoint state is installed).
///
class FailoverGate final
{
public:
    using Ptr = std::shared_ptr<FailoverGate>;

    enum class State : std::uint8_t
    {
        Stable,
        FailingOver,
    };

    struct Options final
    {
        FailoverPolicy            policy{FailoverPolicy::Block};
        std::chrono::milliseconds timeout{std::chrono::seconds{5}};  // NOLINT(*-magic-numbers)
    };

    CETL_NODISCARD static Ptr make(const Options& options);

    explicit FailoverGate(const Options& options)
        : options_{options}
        , state_{State::Stable}
    {
    }

    FailoverGate(FailoverGate&&)                 = delete;
    FailoverGate(const FailoverGate&)            = delete;
    FailoverGate& operator=(FailoverGate&&)      = delete;
    FailoverGate& operator=(const FailoverGate&) = delete;

    ~FailoverGate() = default;

    CETL_NODISCARD State state() const noexcept
    {
        return state_.load();
    }

    CETL_NODISCARD const Options& options() const noexcept
    {
        return options_;
    }

    /// Transitions `Stable` -> `FailingOver`.
    ///
    /// @return `true` if transition happened, `false` if already failing over.
    ///
    bool enterFailingOver();

    /// Transitions `FailingOver` -> `Stable`, and wakes up all blocked invocations.
    ///
    /// @return `true` if transition happened, `false` if already stable.
    ///
    bool leaveFailingOver();

    /// Lets an invocation through according to the policy.
    ///
    /// Returns immediately when stable. Otherwise either blocks (`Block` policy) or fails (`FailFast`).
    ///
    /// @return Empty optional if the invocation may proceed, `Error::FailingOver` otherwise.
    ///
    CETL_NODISCARD OptError pass() const;

    /// Blocks until the gate is stable, or the given timeout expires.
    ///
    /// @return `true` if the gate is stable.
    ///
    CETL_NODISCARD bool awaitStable(const std::chrono::milliseconds timeout) const;

private:
    const Options                   options_;
    std::atomic<State>              state_;
    mutable std::mutex              mutex_;
    mutable std::condition_variable stable_cv_;

};  // FailoverGate

}  // namespace sdk
}  // namespace remoting

#endif  // REMOTING_SDK_FAILOVER_GATE_HPP_INCLUDED
