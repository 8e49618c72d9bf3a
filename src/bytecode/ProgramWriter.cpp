//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "bytecode/ProgramWriter.hpp"

#include <string>

namespace sieve::bytecode
{

namespace
{

class ByteSink
{
  public:
    void u8(uint8_t v)
    {
        bytes_.push_back(v);
    }

    void u32(uint32_t v)
    {
        for (int shift = 0; shift < 32; shift += 8)
            bytes_.push_back(static_cast<uint8_t>((v >> shift) & 0xFF));
    }

    void str(const std::string &s)
    {
        u32(static_cast<uint32_t>(s.size()));
        bytes_.insert(bytes_.end(), s.begin(), s.end());
    }

    std::vector<uint8_t> take()
    {
        return std::move(bytes_);
    }

  private:
    std::vector<uint8_t> bytes_;
};

} // namespace

std::vector<uint8_t> writeProgram(const BytecodeModule &program)
{
    ByteSink out;
    out.u32(program.magic);
    out.u32(program.version);

    out.u32(static_cast<uint32_t>(program.constants.size()));
    for (const auto &value : program.constants)
    {
        out.u8(static_cast<uint8_t>(value.kind()));
        out.str(value.toString());
    }

    out.u32(static_cast<uint32_t>(program.functions.size()));
    for (const auto &fn : program.functions)
    {
        out.str(fn.name);
        out.u8(static_cast<uint8_t>(fn.kind));
        out.u32(fn.numParams);
        for (const auto &param : fn.params)
        {
            out.str(param.name);
            out.str(types::typeName(param.type));
        }
        out.str(types::typeName(fn.result));
        out.u32(fn.numLocals);
        out.u32(fn.maxStack);
        out.u32(static_cast<uint32_t>(fn.code.size()));
        for (uint32_t word : fn.code)
            out.u32(word);
    }

    out.u32(static_cast<uint32_t>(program.externs.size()));
    for (const auto &ext : program.externs)
    {
        out.str(ext.symbol);
        out.str(ext.signature.toString());
    }
    return out.take();
}

} // namespace sieve::bytecode
