//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/ProgramSlot.hpp
// Purpose: Atomically replaceable handle to the attached program in service.
// Key invariants: A snapshot stays valid after a later publish(); readers never
//                 observe a partially replaced program.
// Ownership/Lifetime: The slot shares ownership of the current attachment with
//                     every snapshot taken from it.
// Links: vm/HostBindings.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "vm/HostBindings.hpp"

#include <atomic>
#include <memory>

namespace sieve::vm
{

/// @brief Holder for hot reload of compiled policies.
/// @details Invocations take a snapshot and run against it. A reload
///          publishes a new attachment; runs in flight keep the old one.
class ProgramSlot
{
  public:
    ProgramSlot() = default;
    explicit ProgramSlot(std::shared_ptr<const Attachment> initial);

    ProgramSlot(const ProgramSlot &) = delete;
    ProgramSlot &operator=(const ProgramSlot &) = delete;

    /// @brief Replace the current attachment; a null @p next is ignored.
    /// @return True when @p next was installed.
    bool publish(std::shared_ptr<const Attachment> next);

    /// @brief Current attachment, or null before the first publish.
    std::shared_ptr<const Attachment> snapshot() const;

    /// @brief Number of successful publishes.
    uint64_t generation() const
    {
        return generation_.load(std::memory_order_acquire);
    }

  private:
    std::atomic<std::shared_ptr<const Attachment>> current_;
    std::atomic<uint64_t> generation_{0};
};

} // namespace sieve::vm
