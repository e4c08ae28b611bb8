#pragma once

#include <optional>
#include <string>
#include <vector>

namespace tp
{

struct Field
{
    char letter{'X'};
    double value{0.0};
    int decimals{3};
    // Fixed fields always print every decimal; others drop trailing zeros.
    bool fixed{false};
};

/**
 * One line of the motion program, kept structured until it is written out.
 * Commands carry a code ("G1", "M104"), their fields and an optional trailing
 * note; comments carry only text; verbatim lines are passed through untouched.
 */
struct Instruction
{
    enum class Kind
    {
        Command,
        Comment,
        Verbatim
    };

    Kind kind{Kind::Command};
    std::string code;
    std::vector<Field> fields;
    std::string text;

    static Instruction command(std::string code, std::string note = {});
    static Instruction comment(std::string text);
    static Instruction verbatim(std::string line);

    Instruction& with(char letter, double value);
    Instruction& withFixed(char letter, double value, int decimals);

    [[nodiscard]] bool hasField(char letter) const noexcept;
    [[nodiscard]] std::optional<double> field(char letter) const noexcept;
    [[nodiscard]] bool isMove() const noexcept;
};

using Program = std::vector<Instruction>;

[[nodiscard]] std::string formatNumber(double value, int decimals = 3, bool fixed = false);
[[nodiscard]] std::string toText(const Instruction& instruction);
[[nodiscard]] std::vector<std::string> toText(const Program& program);

} // namespace tp
