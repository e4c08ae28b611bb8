#include "tp/Instruction.h"

#include "common/Enforce.h"

#include <iomanip>
#include <locale>
#include <sstream>
#include <utility>

namespace tp
{

namespace
{
constexpr const char* kCommentPrefix = "; ";
constexpr int kMaxDecimals = 9;
}

Instruction Instruction::command(std::string code, std::string note)
{
    Instruction instruction;
    instruction.kind = Kind::Command;
    instruction.code = std::move(code);
    instruction.text = std::move(note);
    return instruction;
}

Instruction Instruction::comment(std::string text)
{
    Instruction instruction;
    instruction.kind = Kind::Comment;
    instruction.text = std::move(text);
    return instruction;
}

Instruction Instruction::verbatim(std::string line)
{
    Instruction instruction;
    instruction.kind = Kind::Verbatim;
    instruction.text = std::move(line);
    return instruction;
}

Instruction& Instruction::with(char letter, double value)
{
    ENFORCE(kind == Kind::Command, "fields belong to commands");
    fields.push_back({letter, value, 3, false});
    return *this;
}

Instruction& Instruction::withFixed(char letter, double value, int decimals)
{
    ENFORCE(kind == Kind::Command, "fields belong to commands");
    fields.push_back({letter, value, decimals, true});
    return *this;
}

bool Instruction::hasField(char letter) const noexcept
{
    return field(letter).has_value();
}

std::optional<double> Instruction::field(char letter) const noexcept
{
    for (const Field& entry : fields)
    {
        if (entry.letter == letter)
        {
            return entry.value;
        }
    }
    return std::nullopt;
}

bool Instruction::isMove() const noexcept
{
    return kind == Kind::Command && (code == "G0" || code == "G1");
}

std::string formatNumber(double value, int decimals, bool fixed)
{
    ENFORCE(decimals >= 0 && decimals <= kMaxDecimals, "decimal count out of range");

    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss.setf(std::ios::fixed);
    oss << std::setprecision(decimals) << value;
    std::string text = oss.str();

    if (!fixed && text.find('.') != std::string::npos)
    {
        while (text.back() == '0')
        {
            text.pop_back();
        }
        if (text.back() == '.')
        {
            text.pop_back();
        }
    }

    if (text == "-0")
    {
        text = "0";
    }
    return text;
}

std::string toText(const Instruction& instruction)
{
    switch (instruction.kind)
    {
    case Instruction::Kind::Comment:
        return kCommentPrefix + instruction.text;
    case Instruction::Kind::Verbatim:
        return instruction.text;
    case Instruction::Kind::Command:
        break;
    }

    std::string line = instruction.code;
    for (const Field& field : instruction.fields)
    {
        line += ' ';
        line += field.letter;
        line += formatNumber(field.value, field.decimals, field.fixed);
    }
    if (!instruction.text.empty())
    {
        line += " ";
        line += kCommentPrefix;
        line += instruction.text;
    }
    return line;
}

std::vector<std::string> toText(const Program& program)
{
    std::vector<std::string> lines;
    lines.reserve(program.size());
    for (const Instruction& instruction : program)
    {
        lines.push_back(toText(instruction));
    }
    return lines;
}

} // namespace tp
