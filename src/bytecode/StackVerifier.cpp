//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: bytecode/StackVerifier.cpp
// Purpose: Worklist simulation of operand stack depth over bytecode.
// Key invariants: Each pc is visited with one depth; a second, different
//                 depth is a merge error.
// Ownership/Lifetime: Borrows the module for the duration of a call.
// Links: bytecode/StackVerifier.hpp
//
//===----------------------------------------------------------------------===//

#include "bytecode/StackVerifier.hpp"
#include "runtime/Builtins.hpp"

#include <string>
#include <vector>

namespace sieve::bytecode
{

std::optional<StackEffect> stackEffect(uint32_t word, const BytecodeModule &module)
{
    switch (decodeOpcode(word))
    {
        case BCOpcode::NOP:
        case BCOpcode::JUMP:
        case BCOpcode::ITER_NEXT:
        case BCOpcode::LOOP:
            return StackEffect{0, 0};
        case BCOpcode::POP:
        case BCOpcode::STORE_LOCAL:
        case BCOpcode::JUMP_IF_FALSE:
        case BCOpcode::JUMP_IF_TRUE:
        case BCOpcode::RETURN:
        case BCOpcode::ABORT:
            return StackEffect{1, 0};
        case BCOpcode::LOAD_LOCAL:
        case BCOpcode::LOAD_CONST:
        case BCOpcode::LOAD_I16:
        case BCOpcode::LOAD_TRUE:
        case BCOpcode::LOAD_FALSE:
        case BCOpcode::LOAD_UNIT:
            return StackEffect{0, 1};
        case BCOpcode::NEG:
        case BCOpcode::NOT:
        case BCOpcode::GET_FIELD:
        case BCOpcode::VARIANT_TAG:
        case BCOpcode::VARIANT_PAYLOAD:
            return StackEffect{1, 1};
        case BCOpcode::ADD:
        case BCOpcode::SUB:
        case BCOpcode::MUL:
        case BCOpcode::DIV:
        case BCOpcode::REM:
        case BCOpcode::EQ:
        case BCOpcode::NE:
        case BCOpcode::LT:
        case BCOpcode::LE:
        case BCOpcode::GT:
        case BCOpcode::GE:
        case BCOpcode::IN:
            return StackEffect{2, 1};
        case BCOpcode::MAKE_RECORD:
        case BCOpcode::MAKE_LIST:
            return StackEffect{decodeArg16(word), 1};
        case BCOpcode::MAKE_VARIANT:
            return StackEffect{decodeArg8_0(word) ? 1u : 0u, 1};
        case BCOpcode::CALL:
        {
            uint16_t idx = decodeArg16(word);
            if (idx >= module.functions.size())
                return std::nullopt;
            return StackEffect{module.functions[idx].numParams, 1};
        }
        case BCOpcode::CALL_EXTERN:
        {
            uint16_t idx = decodeArg16(word);
            if (idx >= module.externs.size())
                return std::nullopt;
            return StackEffect{static_cast<uint32_t>(module.externs[idx].signature.params.size()),
                               1};
        }
        case BCOpcode::CALL_BUILTIN:
        {
            uint16_t id = decodeArg16(word);
            if (id >= runtime::kBuiltinCount)
                return std::nullopt;
            return StackEffect{runtime::builtinArity(static_cast<runtime::BuiltinId>(id)), 1};
        }
    }
    return std::nullopt;
}

namespace
{

std::string at(uint32_t pc)
{
    return " at pc " + std::to_string(pc);
}

/// Operand range checks that do not depend on the stack.
std::optional<std::string> checkOperands(uint32_t pc, uint32_t word, const BytecodeFunction &fn,
                                         const BytecodeModule &module)
{
    switch (decodeOpcode(word))
    {
        case BCOpcode::LOAD_LOCAL:
        case BCOpcode::STORE_LOCAL:
            if (decodeArg16(word) >= fn.numLocals)
                return "local " + std::to_string(decodeArg16(word)) + " out of range" + at(pc);
            break;
        case BCOpcode::LOAD_CONST:
            if (decodeArg16(word) >= module.constants.size())
                return "constant " + std::to_string(decodeArg16(word)) + " out of range" + at(pc);
            break;
        case BCOpcode::IN:
            if (decodeArg8_0(word) > 2)
                return "unknown membership flavour" + at(pc);
            break;
        case BCOpcode::RETURN:
            if (decodeArg8_0(word) > 2)
                return "unknown termination kind" + at(pc);
            break;
        case BCOpcode::ITER_NEXT:
        {
            if (pc + 1 >= fn.code.size())
                return "truncated ITER_NEXT" + at(pc);
            uint32_t list = decodeArg16(word);
            uint32_t elem = decodeIterElemSlot(fn.code[pc + 1]);
            if (list + 1 >= fn.numLocals || elem >= fn.numLocals)
                return "loop slots out of range" + at(pc);
            break;
        }
        default:
            break;
    }
    return std::nullopt;
}

} // namespace

support::Result<uint32_t> verifyFunction(const BytecodeFunction &fn, const BytecodeModule &module)
{
    using R = support::Result<uint32_t>;
    const auto &code = fn.code;
    const auto size = static_cast<uint32_t>(code.size());

    if (fn.numParams > fn.numLocals)
        return R::error("more parameters than locals");
    if (code.empty())
        return R::error("empty function body");

    // Instruction boundaries; the second ITER_NEXT word is not one.
    std::vector<bool> boundary(size, false);
    for (uint32_t pc = 0; pc < size;)
    {
        boundary[pc] = true;
        pc += instrWords(decodeOpcode(code[pc]));
    }

    std::vector<int64_t> depthAt(size, -1);
    std::vector<uint32_t> worklist{0};
    depthAt[0] = 0;
    int64_t maxDepth = 0;

    auto reach = [&](uint32_t from, int64_t target, int64_t depth) -> std::optional<std::string>
    {
        if (target < 0 || target >= size || !boundary[static_cast<size_t>(target)])
            return "jump" + at(from) + " does not land on an instruction";
        auto t = static_cast<uint32_t>(target);
        if (depthAt[t] < 0)
        {
            depthAt[t] = depth;
            worklist.push_back(t);
        }
        else if (depthAt[t] != depth)
        {
            return "inconsistent stack depth at pc " + std::to_string(t) + " (" +
                   std::to_string(depthAt[t]) + " vs " + std::to_string(depth) + ")";
        }
        return std::nullopt;
    };

    while (!worklist.empty())
    {
        uint32_t pc = worklist.back();
        worklist.pop_back();
        uint32_t word = code[pc];
        BCOpcode op = decodeOpcode(word);
        int64_t depth = depthAt[pc];

        auto effect = stackEffect(word, module);
        if (!effect)
            return R::error("invalid instruction " + std::to_string(static_cast<unsigned>(op)) +
                            at(pc));
        if (auto problem = checkOperands(pc, word, fn, module))
            return R::error(*problem);
        if (depth < effect->pops)
            return R::error(std::string("stack underflow in ") + opcodeName(op) + at(pc));
        if ((op == BCOpcode::RETURN || op == BCOpcode::ABORT) && depth != 1)
            return R::error(std::string(opcodeName(op)) + " with stack depth " +
                            std::to_string(depth) + at(pc));

        int64_t after = depth - effect->pops + effect->pushes;
        if (after > maxDepth)
            maxDepth = after;

        if (isTerminator(op) && after != 0 && op != BCOpcode::RETURN && op != BCOpcode::ABORT)
            return R::error("stack not empty at block end" + at(pc));

        std::optional<std::string> problem;
        switch (op)
        {
            case BCOpcode::JUMP:
            case BCOpcode::JUMP_IF_FALSE:
            case BCOpcode::JUMP_IF_TRUE:
            {
                uint16_t offset = decodeArg16(word);
                if (offset == 0)
                    return R::error("jump" + at(pc) + " does not move forward");
                problem = reach(pc, int64_t{pc} + offset, after);
                if (!problem && op != BCOpcode::JUMP)
                    problem = reach(pc, int64_t{pc} + 1, after);
                break;
            }
            case BCOpcode::ITER_NEXT:
            {
                uint16_t exit = decodeIterExitOffset(code[pc + 1]);
                if (exit <= 1)
                    return R::error("loop exit" + at(pc) + " does not move forward");
                problem = reach(pc, int64_t{pc} + 2, after);
                if (!problem)
                    problem = reach(pc, int64_t{pc} + exit, after);
                break;
            }
            case BCOpcode::LOOP:
            {
                int64_t target = int64_t{pc} - decodeArg16(word);
                if (decodeArg16(word) == 0 || target < 0 ||
                    decodeOpcode(code[static_cast<size_t>(target)]) != BCOpcode::ITER_NEXT)
                    return R::error("LOOP" + at(pc) + " does not target ITER_NEXT");
                problem = reach(pc, target, after);
                break;
            }
            case BCOpcode::RETURN:
            case BCOpcode::ABORT:
                break;
            default:
                if (pc + 1 >= size)
                    return R::error("control falls off the end of the function");
                problem = reach(pc, int64_t{pc} + 1, after);
                break;
        }
        if (problem)
            return R::error(*problem);
    }

    if (maxDepth != fn.maxStack)
        return R::error("verified maximum stack depth " + std::to_string(maxDepth) +
                        " differs from recorded maxStack " + std::to_string(fn.maxStack));
    return static_cast<uint32_t>(maxDepth);
}

bool verifyProgram(const BytecodeModule &module, support::DiagnosticEngine &diag)
{
    bool ok = true;
    for (const auto &fn : module.functions)
    {
        auto result = verifyFunction(fn, module);
        if (result.isOk())
            continue;
        ok = false;
        diag.report(support::makeError(support::DiagKind::InternalError,
                                       "bytecode verification failed for '" + fn.name +
                                           "': " + result.error(),
                                       support::SourceSpan{}));
    }
    return ok;
}

} // namespace sieve::bytecode
