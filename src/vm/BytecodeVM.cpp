//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/BytecodeVM.cpp
// Purpose: Dispatch loop, frames, host calls and fault reporting for the
//          bytecode VM.
// Key invariants: Values only move through the operand stack and frame
//                 locals; a fault stops the run at the faulting instruction.
// Ownership/Lifetime: See BytecodeVM.hpp.
// Links: vm/BytecodeVM.hpp, bytecode/Bytecode.hpp
//
//===----------------------------------------------------------------------===//
//
// Integer arithmetic wraps in two's complement. Division and remainder by
// zero yield 0, and INT64_MIN / -1 wraps to INT64_MIN.

#include "vm/BytecodeVM.hpp"
#include "runtime/Builtins.hpp"

#include <exception>
#include <limits>

namespace sieve::vm
{

using bytecode::BCOpcode;
using runtime::Value;
using runtime::ValueKind;

//===----------------------------------------------------------------------===//
// Result types
//===----------------------------------------------------------------------===//

const char *terminationName(Termination t)
{
    switch (t)
    {
        case Termination::Accept:
            return "accept";
        case Termination::Reject:
            return "reject";
        case Termination::Return:
            return "return";
    }
    return "?";
}

const char *faultKindName(FaultKind kind)
{
    switch (kind)
    {
        case FaultKind::UserTermination:
            return "UserTermination";
        case FaultKind::ResourceExhausted:
            return "ResourceExhausted";
        case FaultKind::ExternalCallError:
            return "ExternalCallError";
        case FaultKind::InvalidState:
            return "InvalidState";
    }
    return "?";
}

std::string Fault::toString() const
{
    return std::string(faultKindName(kind)) + " in '" + function + "' at " +
           std::to_string(offset) + ": " + message;
}

void RuntimeContext::set(const std::string &name, Value value)
{
    inputs_[name] = std::move(value);
}

const Value *RuntimeContext::find(std::string_view name) const
{
    auto it = inputs_.find(name);
    return it == inputs_.end() ? nullptr : &it->second;
}

bool conformsTo(const Value &value, const types::TypeRef &type)
{
    using types::TypeKind;
    if (!type)
        return false;
    switch (type->kind)
    {
        case TypeKind::Unit:
            return value.kind() == ValueKind::Unit;
        case TypeKind::Bool:
            return value.kind() == ValueKind::Bool;
        case TypeKind::Int:
            return value.kind() == ValueKind::Int;
        case TypeKind::String:
            return value.kind() == ValueKind::String;
        case TypeKind::Bytes:
            return value.kind() == ValueKind::Bytes;
        case TypeKind::Prefix:
            return value.kind() == ValueKind::Prefix;
        case TypeKind::IpAddr:
            return value.kind() == ValueKind::IpAddr;
        case TypeKind::Asn:
            return value.kind() == ValueKind::Asn;
        case TypeKind::Community:
            return value.kind() == ValueKind::Community;
        case TypeKind::AsPath:
            return value.kind() == ValueKind::AsPath;
        case TypeKind::List:
            if (value.kind() != ValueKind::List)
                return false;
            for (const auto &item : value.asList())
            {
                if (!conformsTo(item, type->element))
                    return false;
            }
            return true;
        case TypeKind::Record:
        {
            if (value.kind() != ValueKind::Record)
                return false;
            const auto &fields = value.recordFields();
            if (fields.size() != type->fields.size())
                return false;
            for (size_t i = 0; i < fields.size(); ++i)
            {
                if (!conformsTo(fields[i], type->fields[i].type))
                    return false;
            }
            return true;
        }
        case TypeKind::Enum:
        {
            if (value.kind() != ValueKind::Variant || value.variantTag() >= type->variants.size())
                return false;
            const types::TypeRef &payloadType = type->variants[value.variantTag()].payload;
            const Value *payload = value.variantPayload();
            if (!payloadType || !payload)
                return !payloadType && !payload;
            return conformsTo(*payload, payloadType);
        }
        case TypeKind::External:
            return value.kind() == ValueKind::External && value.asExternal() &&
                   value.asExternal()->typeName() == type->name;
        case TypeKind::Function:
        case TypeKind::Error:
            break;
    }
    return false;
}

//===----------------------------------------------------------------------===//
// Entry
//===----------------------------------------------------------------------===//

BytecodeVM::BytecodeVM(RunConfig config) : config_(config), tracer_(config.trace) {}

RunOutcome BytecodeVM::run(const Attachment &attachment, std::string_view entry,
                           const RuntimeContext &context)
{
    values_.clear();
    callStack_.clear();
    sp_ = 0;
    result_.reset();
    fault_.reset();
    instrCount_ = 0;
    peakStackDepth_ = 0;
    currentPc_ = 0;
    state_ = VMState::Running;
    attachment_ = &attachment;
    program_ = attachment.program().get();

    const bytecode::BytecodeFunction *fn = program_ ? program_->findFunction(entry) : nullptr;
    if (!fn)
    {
        trap(FaultKind::InvalidState, "unknown entry point '" + std::string(entry) + "'");
    }
    else
    {
        for (const auto &param : fn->params)
        {
            const Value *input = context.find(param.name);
            if (!input)
            {
                trap(FaultKind::InvalidState, "missing input '" + param.name + "'");
                break;
            }
            if (!conformsTo(*input, param.type))
            {
                trap(FaultKind::InvalidState, "input '" + param.name +
                                                  "' is not a value of type '" +
                                                  types::typeName(param.type) + "'");
                break;
            }
            push(*input);
        }
    }

    if (state_ == VMState::Running)
    {
        call(fn);
        if (state_ == VMState::Running)
            execute();
    }
    else if (fault_ && fn)
    {
        fault_->function = fn->name;
    }

    RunOutcome out;
    out.result = std::move(result_);
    out.fault = std::move(fault_);
    attachment_ = nullptr;
    program_ = nullptr;
    return out;
}

//===----------------------------------------------------------------------===//
// Dispatch
//===----------------------------------------------------------------------===//

void BytecodeVM::execute()
{
    while (state_ == VMState::Running)
    {
        if (instrCount_ >= config_.maxSteps)
        {
            trap(FaultKind::ResourceExhausted,
                 "instruction budget of " + std::to_string(config_.maxSteps) + " steps exhausted");
            break;
        }

        BCFrame &fr = callStack_.back();
        const std::vector<uint32_t> &code = fr.func->code;
        uint32_t pc = fr.pc;
        currentPc_ = pc;
        uint32_t instr = code[fr.pc++];
        BCOpcode op = bytecode::decodeOpcode(instr);
        ++instrCount_;

        if (config_.trace.enabled())
            tracer_.onStep(*program_, *fr.func, pc, static_cast<uint32_t>(sp_ - fr.stackBase));

        switch (op)
        {
            //==================================================================
            // Stack and Local Operations
            //==================================================================
            case BCOpcode::NOP:
                break;

            case BCOpcode::POP:
                pop();
                break;

            case BCOpcode::LOAD_LOCAL:
                push(local(bytecode::decodeArg16(instr)));
                break;

            case BCOpcode::STORE_LOCAL:
            {
                Value v = pop();
                local(bytecode::decodeArg16(instr)) = std::move(v);
                break;
            }

            //==================================================================
            // Constants
            //==================================================================
            case BCOpcode::LOAD_CONST:
                push(program_->constants[bytecode::decodeArg16(instr)]);
                break;

            case BCOpcode::LOAD_I16:
                push(Value::integer(bytecode::decodeArgI16(instr)));
                break;

            case BCOpcode::LOAD_TRUE:
                push(Value::boolean(true));
                break;

            case BCOpcode::LOAD_FALSE:
                push(Value::boolean(false));
                break;

            case BCOpcode::LOAD_UNIT:
                push(Value::unit());
                break;

            //==================================================================
            // Arithmetic and Logic
            //==================================================================
            case BCOpcode::ADD:
            case BCOpcode::SUB:
            case BCOpcode::MUL:
            case BCOpcode::DIV:
            case BCOpcode::REM:
                binaryInt(op);
                break;

            case BCOpcode::NEG:
            {
                int64_t a = 0;
                if (popInt(a))
                    push(Value::integer(static_cast<int64_t>(0 - static_cast<uint64_t>(a))));
                break;
            }

            case BCOpcode::NOT:
            {
                bool b = false;
                if (popBool(b))
                    push(Value::boolean(!b));
                break;
            }

            //==================================================================
            // Comparisons
            //==================================================================
            case BCOpcode::EQ:
            case BCOpcode::NE:
            {
                Value rhs = pop();
                Value lhs = pop();
                bool equal = lhs == rhs;
                push(Value::boolean(op == BCOpcode::EQ ? equal : !equal));
                break;
            }

            case BCOpcode::LT:
            case BCOpcode::LE:
            case BCOpcode::GT:
            case BCOpcode::GE:
                compare(op);
                break;

            case BCOpcode::IN:
                membership(bytecode::decodeArg8_0(instr));
                break;

            //==================================================================
            // Aggregates
            //==================================================================
            case BCOpcode::MAKE_RECORD:
            case BCOpcode::MAKE_LIST:
            {
                uint16_t count = bytecode::decodeArg16(instr);
                std::vector<Value> items(values_.begin() + static_cast<std::ptrdiff_t>(sp_ - count),
                                         values_.begin() + static_cast<std::ptrdiff_t>(sp_));
                sp_ -= count;
                push(op == BCOpcode::MAKE_RECORD ? Value::record(std::move(items))
                                                 : Value::list(std::move(items)));
                break;
            }

            case BCOpcode::GET_FIELD:
            {
                Value record = pop();
                uint16_t index = bytecode::decodeArg16(instr);
                if (record.kind() != ValueKind::Record || index >= record.recordFields().size())
                {
                    trap(FaultKind::InvalidState, "field access on a value that is not a record");
                    break;
                }
                push(record.recordFields()[index]);
                break;
            }

            case BCOpcode::MAKE_VARIANT:
            {
                uint16_t tag = bytecode::decodeArg16_1(instr);
                if (bytecode::decodeArg8_0(instr))
                {
                    Value payload = pop();
                    push(Value::variant(tag, &payload));
                }
                else
                {
                    push(Value::variant(tag));
                }
                break;
            }

            case BCOpcode::VARIANT_TAG:
            case BCOpcode::VARIANT_PAYLOAD:
            {
                Value variant = pop();
                if (variant.kind() != ValueKind::Variant)
                {
                    trap(FaultKind::InvalidState, "match on a value that is not an enum");
                    break;
                }
                if (op == BCOpcode::VARIANT_TAG)
                {
                    push(Value::integer(variant.variantTag()));
                    break;
                }
                const Value *payload = variant.variantPayload();
                if (!payload)
                {
                    trap(FaultKind::InvalidState, "variant carries no payload");
                    break;
                }
                push(*payload);
                break;
            }

            //==================================================================
            // Calls
            //==================================================================
            case BCOpcode::CALL:
                call(&program_->functions[bytecode::decodeArg16(instr)]);
                break;

            case BCOpcode::CALL_EXTERN:
                callExternal(bytecode::decodeArg16(instr));
                break;

            case BCOpcode::CALL_BUILTIN:
                callBuiltin(bytecode::decodeArg16(instr));
                break;

            //==================================================================
            // Control Flow
            //==================================================================
            case BCOpcode::JUMP:
                fr.pc = pc + bytecode::decodeArg16(instr);
                break;

            case BCOpcode::JUMP_IF_FALSE:
            case BCOpcode::JUMP_IF_TRUE:
            {
                bool cond = false;
                if (!popBool(cond))
                    break;
                if (cond == (op == BCOpcode::JUMP_IF_TRUE))
                    fr.pc = pc + bytecode::decodeArg16(instr);
                break;
            }

            case BCOpcode::ITER_NEXT:
            {
                uint16_t listSlot = bytecode::decodeArg16(instr);
                uint32_t extra = code[pc + 1];
                const Value &list = local(listSlot);
                const Value &cursor = local(listSlot + 1u);
                if (list.kind() != ValueKind::List || cursor.kind() != ValueKind::Int)
                {
                    trap(FaultKind::InvalidState, "loop state is corrupt");
                    break;
                }
                int64_t i = cursor.asInt();
                const auto &items = list.asList();
                if (i >= 0 && static_cast<size_t>(i) < items.size())
                {
                    Value element = items[static_cast<size_t>(i)];
                    local(listSlot + 1u) = Value::integer(i + 1);
                    local(bytecode::decodeIterElemSlot(extra)) = std::move(element);
                    fr.pc = pc + 2;
                }
                else
                {
                    fr.pc = pc + bytecode::decodeIterExitOffset(extra);
                }
                break;
            }

            case BCOpcode::LOOP:
                fr.pc = pc - bytecode::decodeArg16(instr);
                break;

            case BCOpcode::RETURN:
                doReturn(static_cast<bytecode::ReturnKind>(bytecode::decodeArg8_0(instr)));
                break;

            case BCOpcode::ABORT:
            {
                Value message = pop();
                trap(FaultKind::UserTermination, message.kind() == ValueKind::String
                                                     ? message.asString()
                                                     : message.toString());
                break;
            }

            default:
                trap(FaultKind::InvalidState,
                     "invalid opcode " + std::to_string(static_cast<unsigned>(op)));
                break;
        }
    }
}

//===----------------------------------------------------------------------===//
// Frames
//===----------------------------------------------------------------------===//

void BytecodeVM::call(const bytecode::BytecodeFunction *func)
{
    if (callStack_.size() >= config_.maxCallDepth)
    {
        trap(FaultKind::ResourceExhausted,
             "call depth limit of " + std::to_string(config_.maxCallDepth) + " exceeded");
        return;
    }

    // Arguments are already on the stack; they become the first locals.
    BCFrame frame;
    frame.func = func;
    frame.pc = 0;
    frame.locals = sp_ - func->numParams;
    frame.stackBase = frame.locals + func->numLocals;

    size_t needed = frame.stackBase + func->maxStack;
    if (values_.size() < needed)
        values_.resize(needed);
    for (size_t i = frame.locals + func->numParams; i < frame.stackBase; ++i)
        values_[i] = Value::unit();

    sp_ = frame.stackBase;
    callStack_.push_back(frame);
    tracer_.onCall(*func, callStack_.size());
}

void BytecodeVM::doReturn(bytecode::ReturnKind kind)
{
    Value value = pop();
    BCFrame frame = callStack_.back();
    callStack_.pop_back();

    if (callStack_.empty())
    {
        RunResult result;
        switch (kind)
        {
            case bytecode::ReturnKind::Accept:
                result.termination = Termination::Accept;
                break;
            case bytecode::ReturnKind::Reject:
                result.termination = Termination::Reject;
                break;
            case bytecode::ReturnKind::Return:
                result.termination = Termination::Return;
                break;
        }
        result.value = std::move(value);
        result_ = std::move(result);
        state_ = VMState::Halted;
        return;
    }

    sp_ = frame.locals;
    push(std::move(value));
}

void BytecodeVM::callExternal(uint16_t index)
{
    const bytecode::ExternRef &ext = program_->externs[index];
    size_t argc = ext.signature.params.size();
    std::vector<Value> args(values_.begin() + static_cast<std::ptrdiff_t>(sp_ - argc),
                            values_.begin() + static_cast<std::ptrdiff_t>(sp_));
    sp_ -= argc;

    std::optional<support::Result<Value>> outcome;
    try
    {
        outcome.emplace(attachment_->binding(index)(args));
    }
    catch (const std::exception &e)
    {
        trap(FaultKind::ExternalCallError, "external '" + ext.symbol + "' threw: " + e.what());
        return;
    }

    if (!outcome->isOk())
    {
        trap(FaultKind::ExternalCallError,
             "external '" + ext.symbol + "' failed: " + outcome->error());
        return;
    }
    if (!conformsTo(outcome->value(), ext.signature.result))
    {
        trap(FaultKind::ExternalCallError, "external '" + ext.symbol +
                                               "' returned a value that is not '" +
                                               types::typeName(ext.signature.result) + "'");
        return;
    }
    push(std::move(outcome->value()));
}

void BytecodeVM::callBuiltin(uint16_t id)
{
    auto builtin = static_cast<runtime::BuiltinId>(id);
    unsigned argc = runtime::builtinArity(builtin);
    Value out;
    if (!runtime::invokeBuiltin(builtin, &values_[sp_ - argc], out))
    {
        trap(FaultKind::InvalidState,
             std::string("built-in '") + runtime::builtinName(builtin) + "' rejected its operands");
        return;
    }
    sp_ -= argc;
    push(std::move(out));
}

void BytecodeVM::trap(FaultKind kind, std::string message)
{
    Fault fault;
    fault.kind = kind;
    fault.message = std::move(message);
    if (!callStack_.empty())
        fault.function = callStack_.back().func->name;
    fault.offset = currentPc_;
    fault_ = std::move(fault);
    state_ = VMState::Trapped;
}

//===----------------------------------------------------------------------===//
// Operand stack
//===----------------------------------------------------------------------===//

void BytecodeVM::push(Value v)
{
    if (sp_ == values_.size())
        values_.push_back(std::move(v));
    else
        values_[sp_] = std::move(v);
    ++sp_;

    size_t base = callStack_.empty() ? 0 : callStack_.back().stackBase;
    auto depth = static_cast<uint32_t>(sp_ - base);
    if (!callStack_.empty() && depth > peakStackDepth_)
        peakStackDepth_ = depth;
}

Value BytecodeVM::pop()
{
    return std::move(values_[--sp_]);
}

Value &BytecodeVM::local(uint32_t index)
{
    return values_[callStack_.back().locals + index];
}

bool BytecodeVM::popInt(int64_t &out)
{
    Value v = pop();
    if (v.kind() != ValueKind::Int)
    {
        trap(FaultKind::InvalidState,
             std::string("expected an Int operand, found ") + runtime::valueKindName(v.kind()));
        return false;
    }
    out = v.asInt();
    return true;
}

bool BytecodeVM::popBool(bool &out)
{
    Value v = pop();
    if (v.kind() != ValueKind::Bool)
    {
        trap(FaultKind::InvalidState,
             std::string("expected a Bool operand, found ") + runtime::valueKindName(v.kind()));
        return false;
    }
    out = v.asBool();
    return true;
}

//===----------------------------------------------------------------------===//
// Operators
//===----------------------------------------------------------------------===//

void BytecodeVM::binaryInt(BCOpcode op)
{
    int64_t b = 0;
    int64_t a = 0;
    if (!popInt(b) || !popInt(a))
        return;

    auto ua = static_cast<uint64_t>(a);
    auto ub = static_cast<uint64_t>(b);
    int64_t r = 0;
    switch (op)
    {
        case BCOpcode::ADD:
            r = static_cast<int64_t>(ua + ub);
            break;
        case BCOpcode::SUB:
            r = static_cast<int64_t>(ua - ub);
            break;
        case BCOpcode::MUL:
            r = static_cast<int64_t>(ua * ub);
            break;
        case BCOpcode::DIV:
            if (b == 0)
                r = 0;
            else if (a == std::numeric_limits<int64_t>::min() && b == -1)
                r = a;
            else
                r = a / b;
            break;
        case BCOpcode::REM:
            if (b == 0 || b == -1)
                r = 0;
            else
                r = a % b;
            break;
        default:
            break;
    }
    push(Value::integer(r));
}

void BytecodeVM::compare(BCOpcode op)
{
    Value rhs = pop();
    Value lhs = pop();

    int64_t a = 0;
    int64_t b = 0;
    if (lhs.kind() == ValueKind::Int && rhs.kind() == ValueKind::Int)
    {
        a = lhs.asInt();
        b = rhs.asInt();
    }
    else if (lhs.kind() == ValueKind::Asn && rhs.kind() == ValueKind::Asn)
    {
        a = lhs.asAsn().value;
        b = rhs.asAsn().value;
    }
    else
    {
        trap(FaultKind::InvalidState, std::string("cannot order ") +
                                          runtime::valueKindName(lhs.kind()) + " and " +
                                          runtime::valueKindName(rhs.kind()));
        return;
    }

    bool r = false;
    switch (op)
    {
        case BCOpcode::LT:
            r = a < b;
            break;
        case BCOpcode::LE:
            r = a <= b;
            break;
        case BCOpcode::GT:
            r = a > b;
            break;
        case BCOpcode::GE:
            r = a >= b;
            break;
        default:
            break;
    }
    push(Value::boolean(r));
}

void BytecodeVM::membership(uint8_t flavour)
{
    Value rhs = pop();
    Value lhs = pop();
    switch (flavour)
    {
        case 0:
            if (rhs.kind() == ValueKind::List)
            {
                bool found = false;
                for (const auto &item : rhs.asList())
                {
                    if (item == lhs)
                    {
                        found = true;
                        break;
                    }
                }
                push(Value::boolean(found));
                return;
            }
            break;
        case 1:
            if (lhs.kind() == ValueKind::IpAddr && rhs.kind() == ValueKind::Prefix)
            {
                push(Value::boolean(rhs.asPrefix().contains(lhs.asIpAddr())));
                return;
            }
            break;
        case 2:
            if (lhs.kind() == ValueKind::Prefix && rhs.kind() == ValueKind::Prefix)
            {
                push(Value::boolean(rhs.asPrefix().covers(lhs.asPrefix())));
                return;
            }
            break;
        default:
            break;
    }
    trap(FaultKind::InvalidState, "membership test on unsupported operands");
}

} // namespace sieve::vm
