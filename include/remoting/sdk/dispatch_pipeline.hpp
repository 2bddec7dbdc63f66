//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REMOTING_SDK_DISPATCH_PIPELINE_HPP_INCLUDED
#define REMOTING_SDK_DISPATCH_PIPELINE_HPP_INCLUDED

#include "errors.hpp"
#include "invocation.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace remoting
{
namespace sdk
{

/// Defines a step of a dispatch pipeline.
///
/// A step may inspect or modify the invocation, and then either forward it to the `next` step,
/// or complete it on its own (f.e. with a cached result or a failure).
///
class Interceptor
{
public:
    using Ptr  = std::shared_ptr<Interceptor>;
    using Next = std::function<Invocation::Result(Invocation&)>;

    Interceptor(Interceptor&&)                 = delete;
    Interceptor(const Interceptor&)            = delete;
    Interceptor& operator=(Interceptor&&)      = delete;
    Interceptor& operator=(const Interceptor&) = delete;

    virtual ~Interceptor() = default;

    CETL_NODISCARD virtual cetl::string_view name() const noexcept = 0;

    /// Handles the invocation.
    ///
    /// The terminal step of a pipeline receives an empty `next` function.
    ///
    virtual Invocation::Result intercept(Invocation& invocation, const Next& next) = 0;

protected:
    Interceptor() = default;

};  // Interceptor

/// Ordered chain of interceptors which ends with a terminal step (the delegate itself).
///
/// The pipeline does not own its terminal step; an expired terminal is treated as not attached.
/// Thread-safe: invocations may run concurrently with each other, and with attaching.
///
class DispatchPipeline final
{
public:
    using Ptr = std::shared_ptr<DispatchPipeline>;

    CETL_NODISCARD static Ptr make(std::vector<Interceptor::Ptr> interceptors = {});

    explicit DispatchPipeline(std::vector<Interceptor::Ptr> interceptors)
        : interceptors_{std::move(interceptors)}
    {
    }

    DispatchPipeline(DispatchPipeline&&)                 = delete;
    DispatchPipeline(const DispatchPipeline&)            = delete;
    DispatchPipeline& operator=(DispatchPipeline&&)      = delete;
    DispatchPipeline& operator=(const DispatchPipeline&) = delete;

    ~DispatchPipeline() = default;

    /// Appends an interceptor in front of the terminal step.
    ///
    void addInterceptor(Interceptor::Ptr interceptor);

    /// Installs the terminal step of the pipeline.
    ///
    /// Installing the same terminal again is a no-op.
    ///
    /// @return `Error::InvalidState` if there is already another (alive) terminal step.
    ///
    CETL_NODISCARD OptError attachTerminal(const std::shared_ptr<Interceptor>& terminal);

    CETL_NODISCARD bool hasTerminal() const;

    /// Passes the invocation through all interceptors (in order of their addition), and then the terminal step.
    ///
    /// @return `Error::InvalidState` if there is no terminal step attached.
    ///
    CETL_NODISCARD Invocation::Result invoke(Invocation& invocation) const;

private:
    mutable std::mutex            mutex_;
    std::vector<Interceptor::Ptr> interceptors_;
    std::weak_ptr<Interceptor>    terminal_;

};  // DispatchPipeline

}  // namespace sdk
}  // namespace remoting

#endif  // REMOTING_SDK_DISPATCH_PIPELINE_HPP_INCLUDED
