//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/ProgramSlot.cpp
// Purpose: Publish/snapshot operations of ProgramSlot.
// Key invariants: See ProgramSlot.hpp.
// Ownership/Lifetime: See ProgramSlot.hpp.
// Links: vm/ProgramSlot.hpp
//
//===----------------------------------------------------------------------===//

#include "vm/ProgramSlot.hpp"

namespace sieve::vm
{

ProgramSlot::ProgramSlot(std::shared_ptr<const Attachment> initial)
{
    publish(std::move(initial));
}

bool ProgramSlot::publish(std::shared_ptr<const Attachment> next)
{
    if (!next)
        return false;
    current_.store(std::move(next), std::memory_order_release);
    generation_.fetch_add(1, std::memory_order_acq_rel);
    return true;
}

std::shared_ptr<const Attachment> ProgramSlot::snapshot() const
{
    return current_.load(std::memory_order_acquire);
}

} // namespace sieve::vm
