//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/BytecodeVM.hpp
// Purpose: Stack-based interpreter for attached Sieve programs.
// Key invariants: Every run() starts from empty frames and an empty operand
//                 stack. Step count never exceeds RunConfig::maxSteps and call
//                 depth never exceeds RunConfig::maxCallDepth.
// Ownership/Lifetime: The VM borrows the Attachment during run() only; it owns
//                     its value stack, call stack and trace sink.
// Links: bytecode/Bytecode.hpp, vm/HostBindings.hpp, vm/Trace.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bytecode/Bytecode.hpp"
#include "bytecode/BytecodeModule.hpp"
#include "runtime/Value.hpp"
#include "vm/HostBindings.hpp"
#include "vm/Trace.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sieve::vm
{

/// @brief Execution limits and tracing for one VM.
struct RunConfig
{
    uint64_t maxSteps = 1'000'000; ///< Instruction budget per run.
    uint32_t maxCallDepth = 64;    ///< Maximum nested frames, entry included.
    TraceConfig trace;
};

/// @brief Named inputs of an invocation, matched to entry parameters by name.
class RuntimeContext
{
  public:
    void set(const std::string &name, runtime::Value value);

    /// @brief Input @p name, or nullptr.
    const runtime::Value *find(std::string_view name) const;

  private:
    std::map<std::string, runtime::Value, std::less<>> inputs_;
};

/// @brief How an invocation finished.
enum class Termination
{
    Accept,
    Reject,
    Return,
};

const char *terminationName(Termination t);

struct RunResult
{
    Termination termination = Termination::Return;
    runtime::Value value; ///< Unit for bare accept and reject.
};

enum class FaultKind
{
    UserTermination,   ///< `abort "message"` in the policy.
    ResourceExhausted, ///< Instruction budget or call depth exceeded.
    ExternalCallError, ///< A host callable returned an error or threw.
    InvalidState,      ///< Bad entry point, inputs or internal inconsistency.
};

const char *faultKindName(FaultKind kind);

struct Fault
{
    FaultKind kind = FaultKind::InvalidState;
    std::string message;
    std::string function; ///< Function executing when the fault was raised.
    uint32_t offset = 0;  ///< Code offset of the faulting instruction.

    /// @brief Spelling such as "UserTermination in 'f' at 12: bogon".
    std::string toString() const;
};

/// @brief Result or fault of one run() call; exactly one is present.
struct RunOutcome
{
    std::optional<RunResult> result;
    std::optional<Fault> fault;

    bool ok() const
    {
        return result.has_value();
    }
};

/// @brief One activation record.
struct BCFrame
{
    const bytecode::BytecodeFunction *func = nullptr;
    uint32_t pc = 0;
    size_t locals = 0;    ///< Index of local 0 in the value stack.
    size_t stackBase = 0; ///< Index of the first operand slot.
};

/// @brief Interpreter for attached programs.
class BytecodeVM
{
  public:
    explicit BytecodeVM(RunConfig config = {});

    /// @brief Execute @p entry of @p attachment with inputs from @p context.
    /// @details Each parameter of @p entry is read from @p context by name and
    ///          must conform to the declared parameter type.
    RunOutcome run(const Attachment &attachment, std::string_view entry,
                   const RuntimeContext &context);

    /// @brief Instructions executed by the last run.
    uint64_t instrCount() const
    {
        return instrCount_;
    }

    /// @brief Largest operand stack depth any frame reached in the last run.
    uint32_t peakStackDepth() const
    {
        return peakStackDepth_;
    }

    const RunConfig &config() const
    {
        return config_;
    }

  private:
    enum class VMState
    {
        Running,
        Halted,
        Trapped,
    };

    void execute();
    void call(const bytecode::BytecodeFunction *func);
    void doReturn(bytecode::ReturnKind kind);
    void callExternal(uint16_t index);
    void callBuiltin(uint16_t id);
    void trap(FaultKind kind, std::string message);

    /// @name Operand stack
    /// @{
    void push(runtime::Value v);
    runtime::Value pop();
    runtime::Value &local(uint32_t index);
    /// @}

    /// @name Checked operand access
    /// @details Each helper traps with InvalidState and returns false when
    ///          the value has the wrong kind.
    /// @{
    bool popInt(int64_t &out);
    bool popBool(bool &out);
    /// @}

    void binaryInt(bytecode::BCOpcode op);
    void compare(bytecode::BCOpcode op);
    void membership(uint8_t flavour);

    RunConfig config_;
    TraceSink tracer_;

    const Attachment *attachment_ = nullptr;
    const bytecode::Program *program_ = nullptr;

    VMState state_ = VMState::Halted;
    std::vector<runtime::Value> values_;
    size_t sp_ = 0;
    std::vector<BCFrame> callStack_;

    std::optional<RunResult> result_;
    std::optional<Fault> fault_;
    uint64_t instrCount_ = 0;
    uint32_t peakStackDepth_ = 0;
    uint32_t currentPc_ = 0;
};

/// @brief Whether @p value is a well-formed value of type @p type.
bool conformsTo(const runtime::Value &value, const types::TypeRef &type);

} // namespace sieve::vm
