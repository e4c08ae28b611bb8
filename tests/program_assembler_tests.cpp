#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "tp/ProgramAssembler.h"

#include "foam_test_helpers.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

using foam_tests::makeProfile;

namespace
{

bool mentionsTemperature(const std::vector<std::string>& lines)
{
    return std::any_of(lines.begin(), lines.end(), [](const std::string& line) {
        return line.rfind("M104", 0) == 0 || line.rfind("M140", 0) == 0;
    });
}

} // namespace

TEST_CASE("thermoplastic header and footer manage temperatures")
{
    tp::ThermoplasticParams params;
    params.nozzleTemp_C = 215.0;
    params.bedTemp_C = 60.0;
    const tp::ProgramAssembler assembler(makeProfile(params));

    const std::vector<std::string> header = tp::toText(assembler.header());
    const std::vector<std::string> expectedHeader = {
        "; FOAM G-code Generator",
        "G28 ; Home all axes",
        "M104 S215 ; set nozzle temp",
        "M140 S60 ; set bed temp",
        "G92 E0 ; Reset extrusion",
    };
    CHECK(header == expectedHeader);

    const std::vector<std::string> footer = tp::toText(assembler.footer());
    const std::vector<std::string> expectedFooter = {
        "; End of FOAM print",
        "M104 S0 ; turn off hotend",
        "M140 S0 ; turn off bed",
        "M107 ; fans off",
        "G28 X0 ; home X",
        "M84 ; disable motors",
    };
    CHECK(footer == expectedFooter);
}

TEST_CASE("unheated modes skip temperature lines")
{
    for (const tp::PrinterProfile& profile : {makeProfile(tp::PasteParams{}), makeProfile(tp::MotionOnlyParams{})})
    {
        const tp::ProgramAssembler assembler(profile);
        const std::vector<std::string> header = tp::toText(assembler.header());
        const std::vector<std::string> footer = tp::toText(assembler.footer());

        CHECK_FALSE(mentionsTemperature(header));
        CHECK_FALSE(mentionsTemperature(footer));
        CHECK(header == std::vector<std::string>{"; FOAM G-code Generator", "G28 ; Home all axes", "G92 E0 ; Reset extrusion"});
        CHECK(footer.size() == 4);
        CHECK(footer.back() == "M84 ; disable motors");
    }
}

TEST_CASE("body sits between header and footer")
{
    const tp::ProgramAssembler assembler(foam_tests::hotProfile());
    tp::Program body;
    body.push_back(tp::Instruction::comment("body"));

    const std::vector<std::string> lines = tp::toText(assembler.assemble(body));
    REQUIRE(lines.size() == 5 + 1 + 6);
    CHECK(lines[5] == "; body");
    CHECK(lines.front() == "; FOAM G-code Generator");
    CHECK(lines.back() == "M84 ; disable motors");
}

TEST_CASE("a header override replaces the header but keeps the footer")
{
    const tp::ProgramAssembler assembler(foam_tests::hotProfile());
    const tp::HeaderOverride custom = std::vector<std::string>{"; custom start", "G28 W ; mesh-free home", "M82"};

    const std::vector<std::string> lines = tp::toText(assembler.assemble({}, custom));
    REQUIRE(lines.size() == 3 + 6);
    CHECK(lines[0] == "; custom start");
    CHECK(lines[1] == "G28 W ; mesh-free home");
    CHECK(lines[2] == "M82");
    CHECK(lines[3] == "; End of FOAM print");
    CHECK(lines[4] == "M104 S0 ; turn off hotend");
}

TEST_CASE("an empty header override falls back to the generated header")
{
    const tp::ProgramAssembler assembler(makeProfile(tp::MotionOnlyParams{}));
    const std::vector<std::string> lines = tp::toText(assembler.assemble({}, std::vector<std::string>{}));
    REQUIRE_FALSE(lines.empty());
    CHECK(lines.front() == "; FOAM G-code Generator");
}

#if !defined(NDEBUG)
TEST_CASE("fields on non-command lines violate an invariant")
{
    tp::Instruction note = tp::Instruction::comment("Start path");
    CHECK_THROWS_AS(note.with('X', 1.0), std::runtime_error);
    CHECK_THROWS_AS(tp::Instruction::verbatim("G28").withFixed('E', 1.0, 4), std::runtime_error);
    CHECK_NOTHROW(tp::Instruction::command("G1").with('X', 1.0));
}
#endif
