#include "tp/ProgramAssembler.h"

#include <iterator>

namespace tp
{

ProgramAssembler::ProgramAssembler(const PrinterProfile& profile)
{
    if (const auto* heated = std::get_if<ThermoplasticParams>(&profile.process))
    {
        m_heated = *heated;
    }
}

Program ProgramAssembler::header() const
{
    Program out;
    out.push_back(Instruction::comment("FOAM G-code Generator"));
    out.push_back(Instruction::command("G28", "Home all axes"));
    if (m_heated)
    {
        out.push_back(Instruction::command("M104", "set nozzle temp").with('S', m_heated->nozzleTemp_C));
        out.push_back(Instruction::command("M140", "set bed temp").with('S', m_heated->bedTemp_C));
    }
    out.push_back(Instruction::command("G92", "Reset extrusion").with('E', 0.0));
    return out;
}

Program ProgramAssembler::footer() const
{
    Program out;
    out.push_back(Instruction::comment("End of FOAM print"));
    if (m_heated)
    {
        out.push_back(Instruction::command("M104", "turn off hotend").with('S', 0.0));
        out.push_back(Instruction::command("M140", "turn off bed").with('S', 0.0));
    }
    out.push_back(Instruction::command("M107", "fans off"));
    out.push_back(Instruction::command("G28", "home X").with('X', 0.0));
    out.push_back(Instruction::command("M84", "disable motors"));
    return out;
}

Program ProgramAssembler::assemble(Program body, const HeaderOverride& headerOverride) const
{
    Program program;
    if (headerOverride && !headerOverride->empty())
    {
        program.reserve(headerOverride->size() + body.size());
        for (const std::string& line : *headerOverride)
        {
            program.push_back(Instruction::verbatim(line));
        }
    }
    else
    {
        program = header();
    }

    program.insert(program.end(), std::make_move_iterator(body.begin()), std::make_move_iterator(body.end()));

    Program tail = footer();
    program.insert(program.end(), std::make_move_iterator(tail.begin()), std::make_move_iterator(tail.end()));
    return program;
}

} // namespace tp
